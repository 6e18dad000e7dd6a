// Own header
#include "type_index.hpp"

// C++ standard library
#include <stdexcept>
#include <string>
#include <utility>

// Project headers
#include "acsf_errors.hpp"

namespace af {
namespace acsf {

// Closed form of the (min, max) lexicographic enumeration
static inline std::size_t pair_index(std::size_t ntypes, std::size_t p, std::size_t q) {
    if (p > q)
        std::swap(p, q);
    return p * ntypes - p * (p + 1) / 2 + q;
}

TypeIndex::TypeIndex(const std::vector<int> &types) : types_(types) {
    if (types_.empty())
        throw InvalidConfig("types must not be empty");
    for (std::size_t t = 1; t < types_.size(); ++t) {
        if (types_[t] <= types_[t - 1])
            throw InvalidConfig("types must be distinct and sorted ascending");
    }

    const std::size_t n = types_.size();
    z2idx_.reserve(n * 2);
    for (std::size_t t = 0; t < n; ++t)
        z2idx_[types_[t]] = t;

    // Same table as pair_index(), kept dense so lookups in the hot loop are a load
    pair_table_.assign(n * n, 0);
    for (std::size_t a = 0; a < n; ++a)
        for (std::size_t b = a; b < n; ++b)
            pair_table_[a * n + b] = pair_table_[b * n + a] = pair_index(n, a, b);
}

std::size_t TypeIndex::slot_of(int z) const {
    auto it = z2idx_.find(z);
    if (it == z2idx_.end())
        throw UnknownType("atomic number " + std::to_string(z) + " is not a declared type");
    return it->second;
}

std::size_t TypeIndex::pair_slot_of(std::size_t a, std::size_t b) const {
    const std::size_t n = ntypes();
    if (a >= n || b >= n)
        throw std::out_of_range("type slot out of range");
    return pair_table_[a * n + b];
}

std::vector<std::size_t> TypeIndex::slots_of(const std::vector<int> &nuclear_z) const {
    std::vector<std::size_t> out(nuclear_z.size());
    for (std::size_t i = 0; i < nuclear_z.size(); ++i)
        out[i] = slot_of(nuclear_z[i]);
    return out;
}

}  // namespace acsf
}  // namespace af
