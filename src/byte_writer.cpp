/**
 * @file byte_writer.cpp
 * @brief ByteWriter stream access.
 */

#include <biofile/byte_writer.hpp>

#include <ostream>

namespace biofile {

Error ByteWriter::write_bytes(const std::uint8_t* src, std::size_t count) {
    if (count == 0) {
        return Error::Ok;
    }

    stream_->write(reinterpret_cast<const char*>(src), static_cast<std::streamsize>(count));
    if (!stream_->good()) [[unlikely]] {
        return Error::IoError;
    }

    bytes_written_ += count;
    return Error::Ok;
}

Error ByteWriter::write_u8(std::uint8_t value) {
    return write_bytes(&value, 1);
}

Error ByteWriter::write_u32(std::uint32_t value) {
    std::uint8_t bytes[4];
    detail::store_le(value, bytes, sizeof(bytes));
    return write_bytes(bytes, sizeof(bytes));
}

Error ByteWriter::write_f32(float value) {
    std::uint32_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    return write_u32(bits);
}

Error ByteWriter::write_f64(double value) {
    std::uint64_t bits;
    std::memcpy(&bits, &value, sizeof(bits));

    std::uint8_t bytes[8];
    detail::store_le(bits, bytes, sizeof(bytes));
    return write_bytes(bytes, sizeof(bytes));
}

} // namespace biofile
