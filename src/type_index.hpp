#pragma once
#include <cstddef>
#include <unordered_map>
#include <vector>

namespace af {
namespace acsf {

// Maps declared atomic numbers to compact type slots [0, ntypes) and unordered
// slot pairs to symmetric pair slots [0, ntypes*(ntypes+1)/2).
//
// Pairs are enumerated in ascending (min, max) lexicographic order:
//   (0,0) (0,1) ... (0,n-1) (1,1) (1,2) ... (n-1,n-1)
class TypeIndex {
  public:
    // types must be non-empty, distinct and sorted ascending
    explicit TypeIndex(const std::vector<int> &types);

    std::size_t ntypes() const noexcept { return types_.size(); }
    std::size_t nsym_types() const noexcept { return ntypes() * (ntypes() + 1) / 2; }
    const std::vector<int> &types() const noexcept { return types_; }

    bool contains(int z) const noexcept { return z2idx_.count(z) != 0; }

    // Throws UnknownType if z was not declared
    std::size_t slot_of(int z) const;

    // Symmetric: pair_slot_of(a, b) == pair_slot_of(b, a)
    std::size_t pair_slot_of(std::size_t a, std::size_t b) const;

    // Slot per atom, throwing UnknownType on the first undeclared number
    std::vector<std::size_t> slots_of(const std::vector<int> &nuclear_z) const;

  private:
    std::vector<int> types_;
    std::unordered_map<int, std::size_t> z2idx_;
    std::vector<std::size_t> pair_table_;  // ntypes x ntypes, row-major
};

}  // namespace acsf
}  // namespace af
