// Own header
#include "acsf_engine.hpp"

// C++ standard library
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// Third-party libraries
#include <omp.h>

// Project headers
#include "acsf_errors.hpp"
#include "angular.hpp"
#include "radial.hpp"

namespace af {
namespace acsf {

DescriptorEngine::DescriptorEngine(DescriptorConfig config, bool flatten)
    : config_(std::move(config)), flatten_(flatten) {}

std::size_t DescriptorEngine::radial_offset(std::size_t type_slot) const {
    if (type_slot >= config_.ntypes())
        throw std::out_of_range("type slot out of range");
    return type_slot * config_.n_g2();
}

std::size_t DescriptorEngine::angular_offset(std::size_t pair_slot) const {
    if (pair_slot >= config_.nsym_types())
        throw std::out_of_range("pair slot out of range");
    return config_.ntypes() * config_.n_g2() + pair_slot * config_.n_g3();
}

std::vector<std::size_t> DescriptorEngine::shape() const {
    if (flatten_)
        return {number_of_features()};
    return {config_.max_atoms(), width()};
}

std::vector<double> DescriptorEngine::describe_values(const Structure &structure) const {
    DescriptorBuffer out;
    describe(structure, out);
    return out.flattened();
}

DescriptorBuffer DescriptorEngine::describe(const Structure &structure) const {
    DescriptorBuffer out;
    describe(structure, out);
    return out;
}

void DescriptorEngine::describe(const Structure &structure, DescriptorBuffer &out) const {
    double t_start = omp_get_wtime();

    const std::size_t natoms = structure.natoms();
    const std::size_t max_atoms = config_.max_atoms();
    if (natoms > max_atoms)
        throw TooManyAtoms("the system has " + std::to_string(natoms) +
                           " atoms, more than max_atoms=" + std::to_string(max_atoms));

    // Type slot per atom
    const std::vector<std::size_t> slots = config_.type_index().slots_of(structure.atomic_numbers());

    const RadialFunctionSet radial(config_);
    const AngularFunctionSet angular(config_);

    // Nothing below may throw inside the parallel region
    angular.validate(structure);

    double t_validate = omp_get_wtime() - t_start;

    const std::size_t rep_size = width();
    const std::size_t three_offset = config_.ntypes() * config_.n_g2();
    out.reset(max_atoms, rep_size);

    double t_compute_start = omp_get_wtime();

    // Each atom owns its row; neighbors are visited in index order, so results are
    // identical for any thread count
#pragma omp parallel for schedule(dynamic)
    for (long long ii = 0; ii < static_cast<long long>(natoms); ++ii) {
        const std::size_t i = static_cast<std::size_t>(ii);
        double *row = out.row(i);
        radial.compute(structure, slots, i, row);
        angular.compute(structure, slots, i, row + three_offset);
    }

    const char *profile_env = std::getenv("ACSFORGE_PROFILE");
    if (profile_env && std::atoi(profile_env) != 0) {
        double t_compute = omp_get_wtime() - t_compute_start;
        double t_total = omp_get_wtime() - t_start;
        printf("\n=== acsf describe profiling ===\n");
        printf("Problem size: natoms=%zu, max_atoms=%zu, ntypes=%zu, nG2=%zu, nG3=%zu\n", natoms,
               max_atoms, config_.ntypes(), config_.n_g2(), config_.n_g3());
        printf("Output size: %zu x %zu (threads=%d)\n", max_atoms, rep_size, omp_get_max_threads());
        printf("Validation:                        %8.4f ms\n", t_validate * 1000);
        printf("Radial + angular terms:            %8.4f ms\n", t_compute * 1000);
        printf("TOTAL:                             %8.4f ms\n", t_total * 1000);
        printf("===============================\n\n");
    }
}

}  // namespace acsf
}  // namespace af
