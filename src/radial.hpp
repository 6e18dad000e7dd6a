#pragma once
#include <cstddef>
#include <vector>

#include "acsf_config.hpp"
#include "structure.hpp"

namespace af {
namespace acsf {

// Two-body (G2) symmetry functions. Per neighbor type slot t the block holds n_g2 values:
//   [0]                     sum_j fc(rij)
//   [1 .. nrad]             sum_j exp(-eta*(rij - Rs)^2) * fc(rij)
//   [1+nrad .. n_g2)        sum_j cos(eta*rij) * fc(rij)
class RadialFunctionSet {
  public:
    explicit RadialFunctionSet(const DescriptorConfig &config) : config_(config) {}

    // Values per type slot
    std::size_t size() const noexcept { return config_.n_g2(); }

    // Accumulate all type blocks of atom i into out (ntypes * n_g2 values, slot-major).
    // slots[j] is the type slot of atom j. Neighbors are visited in index order.
    void compute(const Structure &structure, const std::vector<std::size_t> &slots,
                 std::size_t i, double *out) const;

  private:
    const DescriptorConfig &config_;
};

}  // namespace acsf
}  // namespace af
