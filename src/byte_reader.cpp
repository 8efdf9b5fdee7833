/**
 * @file byte_reader.cpp
 * @brief ByteReader stream access.
 */

#include <biofile/byte_reader.hpp>

#include <istream>

namespace biofile {

Error ByteReader::read_bytes(std::uint8_t* dst, std::size_t count) {
    if (count == 0) {
        return Error::Ok;
    }

    stream_->read(reinterpret_cast<char*>(dst), static_cast<std::streamsize>(count));
    auto got = static_cast<std::size_t>(stream_->gcount());
    position_ += got;

    if (got != count) [[unlikely]] {
        return Error::Underflow;
    }
    return Error::Ok;
}

Error ByteReader::read_u8(std::uint8_t& value) {
    return read_bytes(&value, 1);
}

Error ByteReader::read_u32(std::uint32_t& value) {
    std::uint8_t bytes[4];
    auto result = read_bytes(bytes, sizeof(bytes));
    if (result != Error::Ok) {
        return result;
    }
    value = static_cast<std::uint32_t>(detail::load_le(bytes, sizeof(bytes)));
    return Error::Ok;
}

Error ByteReader::read_f32(float& value) {
    std::uint32_t bits = 0;
    auto result = read_u32(bits);
    if (result != Error::Ok) {
        return result;
    }
    std::memcpy(&value, &bits, sizeof(value));
    return Error::Ok;
}

Error ByteReader::read_f64(double& value) {
    std::uint8_t bytes[8];
    auto result = read_bytes(bytes, sizeof(bytes));
    if (result != Error::Ok) {
        return result;
    }
    std::uint64_t bits = detail::load_le(bytes, sizeof(bytes));
    std::memcpy(&value, &bits, sizeof(value));
    return Error::Ok;
}

} // namespace biofile
