// Own header
#include "descriptor_buffer.hpp"

// C++ standard library
#include <stdexcept>
#include <string>

namespace af {
namespace acsf {

void DescriptorBuffer::reset(std::size_t rows, std::size_t width) {
    rows_ = rows;
    width_ = width;
    data_.assign(rows * width, 0.0);
}

double DescriptorBuffer::at(std::size_t i, std::size_t col) const {
    if (i >= rows_ || col >= width_)
        throw std::out_of_range("descriptor index (" + std::to_string(i) + ", " +
                                std::to_string(col) + ") out of range");
    return data_[i * width_ + col];
}

}  // namespace acsf
}  // namespace af
