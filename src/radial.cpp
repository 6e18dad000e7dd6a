// Own header
#include "radial.hpp"

// C++ standard library
#include <cmath>

// Project headers
#include "cutoff.hpp"

namespace af {
namespace acsf {

void RadialFunctionSet::compute(const Structure &structure, const std::vector<std::size_t> &slots,
                                std::size_t i, double *out) const {
    const std::size_t natoms = structure.natoms();
    const double rcut = config_.cutoff();
    const std::size_t n_g2 = size();
    const std::vector<RadialParam> &gauss = config_.radial_params();
    const std::vector<double> &cosine = config_.radial_cos_params();
    const std::size_t cos_offset = 1 + gauss.size();

    for (std::size_t j = 0; j < natoms; ++j) {
        if (j == i)
            continue;
        const double rij = structure.distance(i, j);
        if (rij >= rcut)
            continue;

        const double fc = cutoff_function(rij, rcut);
        double *dst = out + slots[j] * n_g2;

        dst[0] += fc;
        for (std::size_t k = 0; k < gauss.size(); ++k) {
            const double dr = rij - gauss[k].rs;
            dst[1 + k] += std::exp(-gauss[k].eta * dr * dr) * fc;
        }
        for (std::size_t k = 0; k < cosine.size(); ++k)
            dst[cos_offset + k] += std::cos(cosine[k] * rij) * fc;
    }
}

}  // namespace acsf
}  // namespace af
