#pragma once
#include <cstddef>
#include <vector>

namespace af {
namespace acsf {

// Atomic numbers plus the geometry needed to describe them. Holds either Cartesian
// positions, a precomputed distance matrix, or both (the matrix is then used as given).
//
// coords:    length natoms*3 (x,y,z per atom)
// distances: length natoms*natoms, row-major, symmetric, zero diagonal
class Structure {
  public:
    Structure() = default;

    // Throws std::invalid_argument on any size mismatch, or if atoms are present but
    // neither coords nor distances are.
    Structure(std::vector<int> nuclear_z, std::vector<double> coords, std::vector<double> distances);

    static Structure from_positions(std::vector<int> nuclear_z, std::vector<double> coords);
    static Structure from_distances(std::vector<int> nuclear_z, std::vector<double> distances);

    std::size_t natoms() const noexcept { return nuclear_z_.size(); }
    const std::vector<int> &atomic_numbers() const noexcept { return nuclear_z_; }
    const std::vector<double> &positions() const noexcept { return coords_; }
    const std::vector<double> &distance_matrix() const noexcept { return distances_; }

    double distance(std::size_t i, std::size_t j) const noexcept {
        return distances_[i * natoms() + j];
    }

  private:
    std::vector<int> nuclear_z_;
    std::vector<double> coords_;
    std::vector<double> distances_;
};

// Full pairwise distance matrix (natoms x natoms, row-major)
std::vector<double> pairwise_distances(const std::vector<double> &coords, std::size_t natoms);

}  // namespace acsf
}  // namespace af
