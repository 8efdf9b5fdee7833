/**
 * @file byte_writer.hpp
 * @brief Sequential little-endian writing to a byte stream.
 */

#ifndef BIOFILE_BYTE_WRITER_HPP
#define BIOFILE_BYTE_WRITER_HPP

#include "config.hpp"
#include "error.hpp"

#include <cstring>
#include <iosfwd>

namespace biofile {

namespace detail {

/**
 * @brief Store the low width bytes of value in little-endian order.
 */
inline void store_le(std::uint64_t value, std::uint8_t* bytes, std::size_t width) noexcept {
    for (std::size_t i = 0; i < width; ++i) {
        bytes[i] = static_cast<std::uint8_t>((value >> (8U * i)) & 0xFFU);
    }
}

/**
 * @brief Convert one native element to little-endian bytes.
 *
 * @param src Native source (width bytes, any alignment)
 * @param dst Little-endian destination
 * @param width Element width: 1, 2, 4 or 8
 */
inline void native_to_le(const std::uint8_t* src, std::uint8_t* dst, std::size_t width) noexcept {
    std::uint64_t value = 0;
    switch (width) {
    case 1: {
        value = src[0];
        break;
    }
    case 2: {
        std::uint16_t v;
        std::memcpy(&v, src, sizeof(v));
        value = v;
        break;
    }
    case 4: {
        std::uint32_t v;
        std::memcpy(&v, src, sizeof(v));
        value = v;
        break;
    }
    default: {
        std::memcpy(&value, src, sizeof(value));
        break;
    }
    }
    store_le(value, dst, width);
}

} // namespace detail

/**
 * @brief Little-endian writer over a std::ostream.
 *
 * Counts the bytes handed to the stream. Any stream failure is reported
 * as Error::IoError.
 */
class ByteWriter {
public:
    explicit ByteWriter(std::ostream& stream) noexcept : stream_(&stream), bytes_written_(0) {}

    /**
     * @brief Write count raw bytes.
     *
     * @param src Source buffer
     * @param count Number of bytes
     * @return Error::Ok, or Error::IoError if the stream failed
     */
    Error write_bytes(const std::uint8_t* src, std::size_t count);

    Error write_u8(std::uint8_t value);
    Error write_u32(std::uint32_t value);
    Error write_f32(float value);
    Error write_f64(double value);

    /**
     * @brief Number of bytes written so far.
     */
    [[nodiscard]] std::uint64_t bytes_written() const noexcept {
        return bytes_written_;
    }

private:
    std::ostream* stream_;
    std::uint64_t bytes_written_;
};

} // namespace biofile

#endif // BIOFILE_BYTE_WRITER_HPP
