#pragma once
#include <cmath>

#include "constants.hpp"

namespace af {
namespace acsf {

// Half-cosine cutoff: 0.5*(cos(pi*r/rc) + 1) inside the sphere, exactly 0 at and beyond rc.
inline double cutoff_function(double r, double rc) noexcept {
    if (r >= rc)
        return 0.0;
    return 0.5 * (std::cos(PI * r / rc) + 1.0);
}

}  // namespace acsf
}  // namespace af
