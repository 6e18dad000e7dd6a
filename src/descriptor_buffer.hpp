#pragma once
#include <cstddef>
#include <vector>

namespace af {
namespace acsf {

// Dense row-major feature array of shape (rows, width). Rows past the described atom
// count stay zero.
class DescriptorBuffer {
  public:
    DescriptorBuffer() = default;
    DescriptorBuffer(std::size_t rows, std::size_t width) : rows_(rows), width_(width), data_(rows * width, 0.0) {}

    std::size_t rows() const noexcept { return rows_; }
    std::size_t width() const noexcept { return width_; }
    std::size_t size() const noexcept { return data_.size(); }

    // Reshape and zero-fill
    void reset(std::size_t rows, std::size_t width);

    double *row(std::size_t i) noexcept { return data_.data() + i * width_; }
    const double *row(std::size_t i) const noexcept { return data_.data() + i * width_; }

    // Bounds-checked element access, throws std::out_of_range
    double at(std::size_t i, std::size_t col) const;

    const std::vector<double> &data() const noexcept { return data_; }

    // Row-major 1D copy, length rows*width
    std::vector<double> flattened() const { return data_; }

  private:
    std::size_t rows_ = 0;
    std::size_t width_ = 0;
    std::vector<double> data_;
};

}  // namespace acsf
}  // namespace af
