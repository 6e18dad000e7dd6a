#pragma once
#include <cstddef>
#include <vector>

#include "acsf_config.hpp"
#include "structure.hpp"

namespace af {
namespace acsf {

// Three-body (G3) symmetry functions, one block of n_g3 values per symmetric type pair.
// For each unordered neighbor pair {j, k} of atom i, counted once:
//   (1 + lambda*cos(theta_ijk))^zeta * exp(-eta*(rij^2 + rik^2 + rjk^2)) * fc(rij)*fc(rik)*fc(rjk)
// with cos(theta_ijk) from the law of cosines on the distance matrix.
class AngularFunctionSet {
  public:
    explicit AngularFunctionSet(const DescriptorConfig &config) : config_(config) {}

    // Values per pair slot
    std::size_t size() const noexcept { return config_.n_g3(); }

    // Throws UnknownType if any triplet compute() would evaluate has a zero-length edge
    // at its vertex. No-op when G3 is disabled.
    void validate(const Structure &structure) const;

    // Accumulate all pair blocks of atom i into out (nsym_types * n_g3 values, pair-major).
    // Throws UnknownType on a coincident neighbor; callers running this in parallel
    // call validate() first.
    void compute(const Structure &structure, const std::vector<std::size_t> &slots,
                 std::size_t i, double *out) const;

  private:
    const DescriptorConfig &config_;
};

}  // namespace acsf
}  // namespace af
