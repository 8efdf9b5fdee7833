/**
 * @file signal_matrix.cpp
 * @brief SignalMatrix conversion and growth.
 */

#include <biofile/signal_matrix.hpp>

namespace biofile {

double SignalMatrix::as_double(std::size_t row, std::size_t col) const noexcept {
    if (row >= rows_ || col >= cols_) {
        return 0.0;
    }

    std::size_t index = row * cols_ + col;
    switch (type_) {
    case ElementType::Bool:
        return load<bool>(index) ? 1.0 : 0.0;
    case ElementType::Int8:
        return static_cast<double>(load<std::int8_t>(index));
    case ElementType::UInt8:
        return static_cast<double>(load<std::uint8_t>(index));
    case ElementType::Int16:
        return static_cast<double>(load<std::int16_t>(index));
    case ElementType::UInt16:
        return static_cast<double>(load<std::uint16_t>(index));
    case ElementType::Int32:
        return static_cast<double>(load<std::int32_t>(index));
    case ElementType::UInt32:
        return static_cast<double>(load<std::uint32_t>(index));
    case ElementType::Int64:
        return static_cast<double>(load<std::int64_t>(index));
    case ElementType::UInt64:
        return static_cast<double>(load<std::uint64_t>(index));
    case ElementType::Float32:
        return static_cast<double>(load<float>(index));
    case ElementType::Float64:
        return load<double>(index);
    }
    return 0.0;
}

Error SignalMatrix::append_rows(const SignalMatrix& other) {
    // Shapeless matrix takes the first block as is
    if (cols_ == 0 && rows_ == 0) {
        type_ = other.type_;
        cols_ = other.cols_;
    }

    if (other.type_ != type_ || other.cols_ != cols_) {
        return Error::InvalidSignal;
    }

    bytes_.insert(bytes_.end(), other.bytes_.begin(), other.bytes_.end());
    rows_ += other.rows_;
    return Error::Ok;
}

} // namespace biofile
