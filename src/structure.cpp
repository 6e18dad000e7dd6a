// Own header
#include "structure.hpp"

// C++ standard library
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

// Project headers
#include "constants.hpp"

namespace af {
namespace acsf {

// Flat 2D indexing: (i, j) -> i*ncols + j
static inline std::size_t idx2(std::size_t i, std::size_t j, std::size_t ncols) {
    return i * ncols + j;
}

std::vector<double> pairwise_distances(const std::vector<double> &coords, std::size_t natoms) {
    if (coords.size() != natoms * 3)
        throw std::invalid_argument("coords.size() must equal natoms*3");
    std::vector<double> D(natoms * natoms, 0.0);
    for (std::size_t i = 0; i < natoms; ++i) {
        const double *ri = &coords[3 * i];
        for (std::size_t j = i + 1; j < natoms; ++j) {
            const double *rj = &coords[3 * j];
            double dx = rj[0] - ri[0];
            double dy = rj[1] - ri[1];
            double dz = rj[2] - ri[2];
            double d = std::sqrt(dx * dx + dy * dy + dz * dz);
            D[idx2(i, j, natoms)] = d;
            D[idx2(j, i, natoms)] = d;
        }
    }
    return D;
}

static void check_distance_matrix(const std::vector<double> &D, std::size_t natoms) {
    if (D.size() != natoms * natoms)
        throw std::invalid_argument("distance matrix must have shape (natoms, natoms)");
    for (std::size_t i = 0; i < natoms; ++i) {
        if (std::abs(D[idx2(i, i, natoms)]) > af::DIST_TOL)
            throw std::invalid_argument("distance matrix must have a zero diagonal");
        for (std::size_t j = i + 1; j < natoms; ++j) {
            const double dij = D[idx2(i, j, natoms)];
            const double dji = D[idx2(j, i, natoms)];
            if (!std::isfinite(dij) || dij < 0.0)
                throw std::invalid_argument("distances must be finite and non-negative");
            if (std::abs(dij - dji) > af::DIST_TOL * std::max(1.0, std::abs(dij)))
                throw std::invalid_argument("distance matrix must be symmetric");
        }
    }
}

Structure::Structure(std::vector<int> nuclear_z, std::vector<double> coords,
                     std::vector<double> distances)
    : nuclear_z_(std::move(nuclear_z)), coords_(std::move(coords)), distances_(std::move(distances)) {
    const std::size_t n = nuclear_z_.size();
    if (!coords_.empty() && coords_.size() != n * 3)
        throw std::invalid_argument("coords size must be natoms*3");

    if (distances_.empty()) {
        if (n > 0 && coords_.empty())
            throw std::invalid_argument("structure needs positions or a distance matrix");
        distances_ = pairwise_distances(coords_, n);
    } else {
        check_distance_matrix(distances_, n);
    }
}

Structure Structure::from_positions(std::vector<int> nuclear_z, std::vector<double> coords) {
    return Structure(std::move(nuclear_z), std::move(coords), {});
}

Structure Structure::from_distances(std::vector<int> nuclear_z, std::vector<double> distances) {
    return Structure(std::move(nuclear_z), {}, std::move(distances));
}

}  // namespace acsf
}  // namespace af
