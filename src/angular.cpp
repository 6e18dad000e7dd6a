// Own header
#include "angular.hpp"

// C++ standard library
#include <algorithm>
#include <cmath>
#include <string>

// Project headers
#include "acsf_errors.hpp"
#include "constants.hpp"
#include "cutoff.hpp"

namespace af {
namespace acsf {

// x^n for n >= 0 by repeated squaring; the multiplication sequence depends only on n
static inline double ipow(double x, int n) {
    double r = 1.0;
    while (n > 0) {
        if (n & 1)
            r *= x;
        x *= x;
        n >>= 1;
    }
    return r;
}

// Visit every unordered neighbor pair {j, k} (j < k, both != i) whose three edges lie
// inside the cutoff, in index order. A zero-length edge at the vertex has no angle.
template <typename Fn>
static void for_each_triplet(const Structure &structure, std::size_t i, double rcut, Fn &&fn) {
    const std::size_t natoms = structure.natoms();
    for (std::size_t j = 0; j + 1 < natoms; ++j) {
        if (j == i)
            continue;
        const double rij = structure.distance(i, j);
        if (rij >= rcut)
            continue;
        for (std::size_t k = j + 1; k < natoms; ++k) {
            if (k == i)
                continue;
            const double rik = structure.distance(i, k);
            if (rik >= rcut)
                continue;
            const double rjk = structure.distance(j, k);
            if (rjk >= rcut)
                continue;
            if (rij <= af::EPS || rik <= af::EPS) {
                const std::size_t other = (rij <= af::EPS) ? j : k;
                throw UnknownType("atoms " + std::to_string(i) + " and " + std::to_string(other) +
                                  " coincide, angle is undefined");
            }
            fn(j, k, rij, rik, rjk);
        }
    }
}

void AngularFunctionSet::validate(const Structure &structure) const {
    if (size() == 0)
        return;
    const double rcut = config_.cutoff();
    for (std::size_t i = 0; i < structure.natoms(); ++i)
        for_each_triplet(structure, i, rcut,
                         [](std::size_t, std::size_t, double, double, double) {});
}

void AngularFunctionSet::compute(const Structure &structure, const std::vector<std::size_t> &slots,
                                 std::size_t i, double *out) const {
    const std::size_t n_g3 = size();
    if (n_g3 == 0)
        return;

    const double rcut = config_.cutoff();
    const std::vector<AngularParam> &params = config_.angular_params();
    const std::vector<int> &zeta = config_.angular_zeta();
    const TypeIndex &index = config_.type_index();

    for_each_triplet(structure, i, rcut,
                     [&](std::size_t j, std::size_t k, double rij, double rik, double rjk) {
        const double rij2 = rij * rij;
        const double rik2 = rik * rik;
        const double rjk2 = rjk * rjk;

        // Law of cosines at vertex i
        double cos_i = (rij2 + rik2 - rjk2) / (2.0 * rij * rik);
        cos_i = std::max(-1.0, std::min(1.0, cos_i));

        const double fc3 = cutoff_function(rij, rcut) * cutoff_function(rik, rcut) *
                           cutoff_function(rjk, rcut);
        const double rsum2 = rij2 + rik2 + rjk2;

        double *dst = out + index.pair_slot_of(slots[j], slots[k]) * n_g3;
        for (std::size_t m = 0; m < n_g3; ++m) {
            const double ang = ipow(1.0 + params[m].lambda * cos_i, zeta[m]);
            dst[m] += ang * std::exp(-params[m].eta * rsum2) * fc3;
        }
    });
}

}  // namespace acsf
}  // namespace af
