#pragma once
#include <cstddef>
#include <vector>

#include "acsf_config.hpp"
#include "descriptor_buffer.hpp"
#include "structure.hpp"

namespace af {
namespace acsf {

// Computes ACSF descriptors for structures against one immutable configuration.
//
// Row layout (width() values per atom):
//   for each type slot t:       n_g2 radial values   at radial_offset(t)
//   for each pair slot p:       n_g3 angular values  at angular_offset(p)
//
// The engine holds no per-call state; describe() may be called concurrently as long
// as each call writes its own buffer.
class DescriptorEngine {
  public:
    explicit DescriptorEngine(DescriptorConfig config, bool flatten = true);

    const DescriptorConfig &config() const noexcept { return config_; }

    // Whether describe_values() results are 1D or (max_atoms, width)
    bool flatten() const noexcept { return flatten_; }

    // {number_of_features()} when flattening, {max_atoms, width()} otherwise
    std::vector<std::size_t> shape() const;

    std::size_t width() const noexcept { return config_.width(); }
    std::size_t radial_offset(std::size_t type_slot) const;
    std::size_t angular_offset(std::size_t pair_slot) const;

    // width() * max_atoms, independent of any structure
    std::size_t number_of_features() const noexcept { return width() * config_.max_atoms(); }

    /**
     * Describe a structure into a fresh (max_atoms, width) buffer. Rows past
     * structure.natoms() are zero.
     *
     * Throws TooManyAtoms if the structure exceeds max_atoms, UnknownType if it contains
     * an undeclared atomic number or a coincident atom pair inside an angular triplet.
     */
    DescriptorBuffer describe(const Structure &structure) const;

    // Same, reusing the caller's buffer. out is left untouched if validation fails.
    void describe(const Structure &structure, DescriptorBuffer &out) const;

    // Row-major values of describe(), to be read with shape(). Same errors as describe().
    std::vector<double> describe_values(const Structure &structure) const;

  private:
    DescriptorConfig config_;
    bool flatten_;
};

}  // namespace acsf
}  // namespace af
