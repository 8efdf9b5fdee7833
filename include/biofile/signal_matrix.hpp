/**
 * @file signal_matrix.hpp
 * @brief Two-dimensional sample storage for one signal.
 *
 * A SignalMatrix holds rows x cols elements of a single ElementType in
 * row-major order: one row is one time sample across all channels.
 * Elements are kept as native raw bytes, so every bit pattern read from
 * a file (NaN payloads, boolean bytes other than 0 and 1) is written back
 * unchanged.
 */

#ifndef BIOFILE_SIGNAL_MATRIX_HPP
#define BIOFILE_SIGNAL_MATRIX_HPP

#include "config.hpp"
#include "element_type.hpp"
#include "error.hpp"

#include <cstring>
#include <limits>
#include <type_traits>
#include <utility>
#include <vector>

namespace biofile {

/**
 * @brief Row-major typed sample matrix.
 */
class SignalMatrix {
public:
    /**
     * @brief Empty float32 matrix with no rows and no columns.
     */
    SignalMatrix() noexcept : type_(ElementType::Float32), rows_(0), cols_(0) {}

    /**
     * @brief Zero-initialized matrix.
     *
     * A shape whose byte size does not fit in size_t gives an empty
     * matrix with no rows and no columns, which encode() rejects.
     *
     * @param type Element type
     * @param rows Number of samples
     * @param cols Number of channels
     */
    SignalMatrix(ElementType type, std::size_t rows, std::size_t cols)
        : type_(type), rows_(fits(type, rows, cols) ? rows : 0),
          cols_(fits(type, rows, cols) ? cols : 0),
          bytes_(rows_ * cols_ * element_width(type), 0) {}

    /**
     * @brief Check that rows x cols elements of a type can be addressed.
     */
    [[nodiscard]] static constexpr bool fits(ElementType type, std::size_t rows,
                                             std::size_t cols) noexcept {
        constexpr std::size_t max = std::numeric_limits<std::size_t>::max();
        return cols == 0 || rows <= max / cols / element_width(type);
    }

    /**
     * @brief Build a single-column matrix from values.
     *
     * @tparam T One of the eleven storage types
     */
    template <typename T> static SignalMatrix column(const std::vector<T>& values) {
        SignalMatrix matrix(element_type_of<T>, values.size(), 1);
        for (std::size_t i = 0; i < values.size(); ++i) {
            matrix.store(i, values[i]);
        }
        return matrix;
    }

    /**
     * @brief Build a matrix from row-major values.
     *
     * @tparam T One of the eleven storage types
     * @param rows Number of samples
     * @param cols Number of channels
     * @param values rows * cols values, row-major
     * @param[out] out Resulting matrix (untouched on failure)
     * @return Error::Ok, or Error::InvalidSignal if values has the wrong size
     */
    template <typename T>
    static Error from_row_major(std::size_t rows, std::size_t cols, const std::vector<T>& values,
                                SignalMatrix& out) {
        if (!fits(element_type_of<T>, rows, cols) || values.size() != rows * cols) {
            return Error::InvalidSignal;
        }
        SignalMatrix matrix(element_type_of<T>, rows, cols);
        for (std::size_t i = 0; i < values.size(); ++i) {
            matrix.store(i, values[i]);
        }
        out = std::move(matrix);
        return Error::Ok;
    }

    [[nodiscard]] ElementType type() const noexcept {
        return type_;
    }

    [[nodiscard]] std::size_t rows() const noexcept {
        return rows_;
    }

    [[nodiscard]] std::size_t cols() const noexcept {
        return cols_;
    }

    /**
     * @brief Element count (rows * cols).
     */
    [[nodiscard]] std::size_t size() const noexcept {
        return rows_ * cols_;
    }

    [[nodiscard]] bool empty() const noexcept {
        return size() == 0;
    }

    /**
     * @brief Raw element bytes, native byte order, row-major.
     */
    [[nodiscard]] const std::uint8_t* data() const noexcept {
        return bytes_.data();
    }

    [[nodiscard]] std::uint8_t* data() noexcept {
        return bytes_.data();
    }

    [[nodiscard]] std::size_t size_bytes() const noexcept {
        return bytes_.size();
    }

    /**
     * @brief Read one element.
     *
     * @tparam T Storage type; must match type()
     * @param row Sample index
     * @param col Channel index
     * @param[out] value Element value
     * @return Error::Ok, or Error::InvalidSignal on type mismatch or out of range
     */
    template <typename T> Error get(std::size_t row, std::size_t col, T& value) const noexcept {
        if (element_type_of<T> != type_ || row >= rows_ || col >= cols_) {
            return Error::InvalidSignal;
        }
        value = load<T>(row * cols_ + col);
        return Error::Ok;
    }

    /**
     * @brief Write one element.
     *
     * @tparam T Storage type; must match type()
     * @return Error::Ok, or Error::InvalidSignal on type mismatch or out of range
     */
    template <typename T> Error set(std::size_t row, std::size_t col, T value) noexcept {
        if (element_type_of<T> != type_ || row >= rows_ || col >= cols_) {
            return Error::InvalidSignal;
        }
        store(row * cols_ + col, value);
        return Error::Ok;
    }

    /**
     * @brief Element converted to double, whatever its type.
     *
     * 64-bit integers above 2^53 lose precision. Out-of-range indices give 0.
     */
    [[nodiscard]] double as_double(std::size_t row, std::size_t col) const noexcept;

    /**
     * @brief Copy one column into a typed vector.
     *
     * @return Error::Ok, or Error::InvalidSignal on type mismatch or out of range
     */
    template <typename T> Error column_values(std::size_t col, std::vector<T>& values) const {
        if (element_type_of<T> != type_ || col >= cols_) {
            return Error::InvalidSignal;
        }
        values.resize(rows_);
        for (std::size_t r = 0; r < rows_; ++r) {
            values[r] = load<T>(r * cols_ + col);
        }
        return Error::Ok;
    }

    /**
     * @brief Append the rows of another matrix.
     *
     * An empty matrix with no columns adopts the shape of the first
     * appended block.
     *
     * @return Error::Ok, or Error::InvalidSignal if type or column count differ
     */
    Error append_rows(const SignalMatrix& other);

    /**
     * @brief Drop all rows, keeping type and column count.
     */
    void clear_rows() noexcept {
        rows_ = 0;
        bytes_.clear();
    }

    /**
     * @brief Bit-exact comparison of type, shape and element bytes.
     */
    bool operator==(const SignalMatrix& other) const noexcept {
        return type_ == other.type_ && rows_ == other.rows_ && cols_ == other.cols_ &&
               bytes_ == other.bytes_;
    }

    bool operator!=(const SignalMatrix& other) const noexcept {
        return !(*this == other);
    }

private:
    template <typename T> T load(std::size_t index) const noexcept {
        const std::uint8_t* src = bytes_.data() + index * sizeof(T);
        if constexpr (std::is_same_v<T, bool>) {
            return *src != 0;
        } else {
            T value;
            std::memcpy(&value, src, sizeof(T));
            return value;
        }
    }

    template <typename T> void store(std::size_t index, T value) noexcept {
        std::uint8_t* dst = bytes_.data() + index * sizeof(T);
        if constexpr (std::is_same_v<T, bool>) {
            *dst = value ? 1U : 0U;
        } else {
            std::memcpy(dst, &value, sizeof(T));
        }
    }

    ElementType type_;
    std::size_t rows_;
    std::size_t cols_;
    std::vector<std::uint8_t> bytes_;
};

} // namespace biofile

#endif // BIOFILE_SIGNAL_MATRIX_HPP
