#pragma once
#include <climits>
#include <cstddef>
#include <vector>

#include "constants.hpp"
#include "type_index.hpp"

namespace af {
namespace acsf {

// G2 Gaussian term: exp(-eta*(r - rs)^2) * fc(r)
struct RadialParam {
    double eta;
    double rs;
};

// G3 term: (1 + lambda*cos(theta))^zeta * exp(-eta*(rij^2 + rik^2 + rjk^2)) * fc*fc*fc
// zeta is a positive integer no larger than MAX_ZETA, lambda is +1 or -1.
struct AngularParam {
    double eta;
    double zeta;
    double lambda;
};

constexpr int MAX_ZETA = INT_MAX;

// Immutable ACSF configuration. Every field is set by the constructor and validated
// there; there are no mutators, so a config can be shared read-only between threads.
class DescriptorConfig {
  public:
    /**
     * @param max_atoms    capacity: number of rows in every output buffer, must be > 0 and
     *                     small enough that max_atoms * width() doubles are addressable
     * @param types        declared atomic numbers; deduplicated and sorted, must be non-empty
     *                     and non-negative
     * @param radial       (eta, Rs) pairs, empty disables the Gaussian G2 family
     * @param radial_cos   eta values, empty disables the cosine G2 family
     * @param angular      (eta, zeta, lambda) triples, empty disables G3
     * @param cutoff       cutoff radius, must be finite and > 0
     *
     * Throws InvalidConfig on any malformed argument.
     */
    DescriptorConfig(long long max_atoms, const std::vector<int> &types,
                     const std::vector<RadialParam> &radial = {},
                     const std::vector<double> &radial_cos = {},
                     const std::vector<AngularParam> &angular = {},
                     double cutoff = DEFAULT_CUTOFF);

    std::size_t max_atoms() const noexcept { return max_atoms_; }
    double cutoff() const noexcept { return cutoff_; }
    const std::vector<int> &types() const noexcept { return index_.types(); }
    const TypeIndex &type_index() const noexcept { return index_; }
    const std::vector<RadialParam> &radial_params() const noexcept { return radial_; }
    const std::vector<double> &radial_cos_params() const noexcept { return radial_cos_; }
    const std::vector<AngularParam> &angular_params() const noexcept { return angular_; }
    // zeta of each angular term as validated integers
    const std::vector<int> &angular_zeta() const noexcept { return zeta_; }

    std::size_t ntypes() const noexcept { return index_.ntypes(); }
    std::size_t nsym_types() const noexcept { return index_.nsym_types(); }

    // 1 bare cutoff sum + one per Gaussian + one per cosine term
    std::size_t n_g2() const noexcept { return 1 + radial_.size() + radial_cos_.size(); }
    std::size_t n_g3() const noexcept { return angular_.size(); }

    // Features per atom
    std::size_t width() const noexcept;

  private:
    std::size_t max_atoms_;
    double cutoff_;
    TypeIndex index_;
    std::vector<RadialParam> radial_;
    std::vector<double> radial_cos_;
    std::vector<AngularParam> angular_;
    std::vector<int> zeta_;
};

// Features per atom for a given layout
std::size_t compute_rep_size(std::size_t ntypes, std::size_t n_g2, std::size_t n_g3);

// Deduplicate and sort; throws InvalidConfig if empty or any entry is negative
std::vector<int> normalize_types(const std::vector<int> &types);

}  // namespace acsf
}  // namespace af
