// Own header
#include "acsf_config.hpp"

// C++ standard library
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <string>

// Project headers
#include "acsf_errors.hpp"

namespace af {
namespace acsf {

std::size_t compute_rep_size(std::size_t ntypes, std::size_t n_g2, std::size_t n_g3) {
    const std::size_t two_body = ntypes * n_g2;
    const std::size_t n_pairs_symmetric = ntypes * (ntypes + 1) / 2;  // unordered pairs
    const std::size_t three_body = n_pairs_symmetric * n_g3;
    return two_body + three_body;
}

std::vector<int> normalize_types(const std::vector<int> &types) {
    if (types.empty())
        throw InvalidConfig("atomic types cannot be empty");
    std::vector<int> out(types);
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    if (out.front() < 0)
        throw InvalidConfig("atomic types must be non-negative, got " + std::to_string(out.front()));
    return out;
}

static void check_finite(double v, const char *what) {
    if (!std::isfinite(v))
        throw InvalidConfig(std::string(what) + " must be finite");
}

static void validate_radial(const std::vector<RadialParam> &radial) {
    for (const RadialParam &p : radial) {
        check_finite(p.eta, "radial eta");
        check_finite(p.rs, "radial Rs");
    }
}

static void validate_radial_cos(const std::vector<double> &radial_cos) {
    for (double eta : radial_cos)
        check_finite(eta, "cosine radial eta");
}

static void validate_angular(const std::vector<AngularParam> &angular) {
    for (const AngularParam &p : angular) {
        check_finite(p.eta, "angular eta");
        check_finite(p.zeta, "angular zeta");
        if (p.zeta < 1.0 || std::floor(p.zeta) != p.zeta)
            throw InvalidConfig("angular zeta must be a positive integer, got " +
                                std::to_string(p.zeta));
        if (p.zeta > static_cast<double>(MAX_ZETA))
            throw InvalidConfig("angular zeta must not exceed " + std::to_string(MAX_ZETA) +
                                ", got " + std::to_string(p.zeta));
        if (p.lambda != 1.0 && p.lambda != -1.0)
            throw InvalidConfig("angular lambda must be +1 or -1, got " +
                                std::to_string(p.lambda));
    }
}

static void print_config(const DescriptorConfig &cfg) {
    printf("Setting types to: [");
    for (std::size_t t = 0; t < cfg.types().size(); ++t)
        printf(t == 0 ? "%d" : " %d", cfg.types()[t]);
    printf("]\n");
    printf("max_atoms=%zu  cutoff=%g\n", cfg.max_atoms(), cfg.cutoff());
    if (cfg.radial_params().empty())
        printf("Disabling 2-body ACSFs...\n");
    else
        printf("Setting 2-body ACSFs... (%zu)\n", cfg.radial_params().size());
    if (cfg.radial_cos_params().empty())
        printf("Disabling 2-body COS-type ACSFs...\n");
    else
        printf("Setting 2-body COS-type ACSFs... (%zu)\n", cfg.radial_cos_params().size());
    if (cfg.angular_params().empty())
        printf("Disabling 3-body ACSFs...\n");
    else
        printf("Setting 3-body ACSFs... (%zu)\n", cfg.angular_params().size());
    printf("nG2=%zu  nG3=%zu  features/atom=%zu\n", cfg.n_g2(), cfg.n_g3(), cfg.width());
}

static std::size_t checked_max_atoms(long long max_atoms) {
    if (max_atoms <= 0)
        throw InvalidConfig("maximum number of atoms max_atoms should be positive");
    return static_cast<std::size_t>(max_atoms);
}

static double checked_cutoff(double cutoff) {
    if (!std::isfinite(cutoff) || cutoff <= 0.0)
        throw InvalidConfig("cutoff radius must be finite and > 0");
    return cutoff;
}

DescriptorConfig::DescriptorConfig(long long max_atoms, const std::vector<int> &types,
                                   const std::vector<RadialParam> &radial,
                                   const std::vector<double> &radial_cos,
                                   const std::vector<AngularParam> &angular, double cutoff)
    : max_atoms_(checked_max_atoms(max_atoms)),
      cutoff_(checked_cutoff(cutoff)),
      index_(normalize_types(types)),
      radial_(radial),
      radial_cos_(radial_cos),
      angular_(angular) {
    validate_radial(radial_);
    validate_radial_cos(radial_cos_);
    validate_angular(angular_);

    zeta_.reserve(angular_.size());
    for (const AngularParam &p : angular_)
        zeta_.push_back(static_cast<int>(p.zeta));

    // Every buffer holds max_atoms * width doubles
    const std::size_t w = width();
    if (w != 0 && max_atoms_ > std::numeric_limits<std::size_t>::max() / sizeof(double) / w)
        throw InvalidConfig("max_atoms=" + std::to_string(max_atoms_) + " with " +
                            std::to_string(w) + " features per atom overflows the buffer size");

    const char *verbose_env = std::getenv("ACSFORGE_VERBOSE");
    if (verbose_env && std::atoi(verbose_env) != 0)
        print_config(*this);
}

std::size_t DescriptorConfig::width() const noexcept {
    return compute_rep_size(ntypes(), n_g2(), n_g3());
}

}  // namespace acsf
}  // namespace af
