/**
 * @file byte_reader.hpp
 * @brief Sequential little-endian reading from a byte stream.
 *
 * The reader only moves forward. It works on any std::istream, including
 * pipes and sockets wrapped in a stream buffer, and never asks the stream
 * for its length.
 *
 * @par Byte Order
 * All multi-byte values are little-endian on disk. Values are assembled
 * byte by byte, so the result does not depend on the host byte order.
 */

#ifndef BIOFILE_BYTE_READER_HPP
#define BIOFILE_BYTE_READER_HPP

#include "config.hpp"
#include "error.hpp"

#include <cstring>
#include <iosfwd>

namespace biofile {

namespace detail {

/**
 * @brief Assemble a little-endian unsigned value of 1 to 8 bytes.
 */
inline std::uint64_t load_le(const std::uint8_t* bytes, std::size_t width) noexcept {
    std::uint64_t value = 0;
    for (std::size_t i = 0; i < width; ++i) {
        value |= static_cast<std::uint64_t>(bytes[i]) << (8U * i);
    }
    return value;
}

/**
 * @brief Convert one little-endian element to its native representation.
 *
 * @param src Little-endian source bytes
 * @param dst Native destination (width bytes, any alignment)
 * @param width Element width: 1, 2, 4 or 8
 */
inline void le_to_native(const std::uint8_t* src, std::uint8_t* dst, std::size_t width) noexcept {
    std::uint64_t value = load_le(src, width);
    switch (width) {
    case 1: {
        dst[0] = static_cast<std::uint8_t>(value);
        break;
    }
    case 2: {
        auto v = static_cast<std::uint16_t>(value);
        std::memcpy(dst, &v, sizeof(v));
        break;
    }
    case 4: {
        auto v = static_cast<std::uint32_t>(value);
        std::memcpy(dst, &v, sizeof(v));
        break;
    }
    default: {
        std::memcpy(dst, &value, sizeof(value));
        break;
    }
    }
}

} // namespace detail

/**
 * @brief Forward-only little-endian reader over a std::istream.
 *
 * Reads either complete or fail with Error::Underflow; callers translate
 * Underflow into MalformedHeader or TruncatedPayload depending on which
 * section they are in.
 */
class ByteReader {
public:
    /**
     * @brief Construct a reader.
     *
     * @param stream Source stream, positioned at the first byte to read
     */
    explicit ByteReader(std::istream& stream) noexcept : stream_(&stream), position_(0) {}

    /**
     * @brief Read exactly count raw bytes.
     *
     * @param dst Destination buffer
     * @param count Number of bytes
     * @return Error::Ok, or Error::Underflow if the stream ended first
     */
    Error read_bytes(std::uint8_t* dst, std::size_t count);

    Error read_u8(std::uint8_t& value);
    Error read_u32(std::uint32_t& value);
    Error read_f32(float& value);
    Error read_f64(double& value);

    /**
     * @brief Number of bytes consumed so far.
     */
    [[nodiscard]] std::uint64_t position() const noexcept {
        return position_;
    }

private:
    std::istream* stream_;
    std::uint64_t position_;
};

} // namespace biofile

#endif // BIOFILE_BYTE_READER_HPP
