/**
 * @file decoder.cpp
 * @brief Payload reader and decode().
 */

#include <biofile/decoder.hpp>

#include <algorithm>
#include <istream>
#include <utility>
#include <vector>

namespace biofile {

namespace {

Error payload_error(Error error) noexcept {
    return error == Error::Underflow ? Error::TruncatedPayload : error;
}

// Reads in bounded chunks so a lying header cannot force a huge allocation
Error read_chunked(ByteReader& reader, std::uint64_t total, std::vector<std::uint8_t>& bytes) {
    bytes.clear();
    std::uint64_t done = 0;
    while (done < total) {
        auto chunk = static_cast<std::size_t>(
            std::min<std::uint64_t>(total - done, static_cast<std::uint64_t>(READ_CHUNK_BYTES)));
        bytes.resize(static_cast<std::size_t>(done) + chunk);

        auto result = reader.read_bytes(bytes.data() + static_cast<std::size_t>(done), chunk);
        if (result != Error::Ok) {
            return payload_error(result);
        }
        done += chunk;
    }
    return Error::Ok;
}

} // namespace

Error read_block(ByteReader& reader, ElementType type, std::uint32_t sample_count,
                 std::uint32_t channel_count, SignalMatrix& matrix) {
    const std::size_t width = element_width(type);
    if (!SignalMatrix::fits(type, sample_count, channel_count)) {
        return Error::MalformedHeader;
    }
    const std::uint64_t total = static_cast<std::uint64_t>(sample_count) * channel_count * width;

    // Nothing on disk; skip the transpose so a huge channel count costs nothing
    if (total == 0) {
        matrix = SignalMatrix(type, sample_count, channel_count);
        return Error::Ok;
    }

    std::vector<std::uint8_t> disk;
    auto result = read_chunked(reader, total, disk);
    if (result != Error::Ok) {
        return result;
    }

    // Disk: [channel][sample], memory: [sample][channel]
    SignalMatrix decoded(type, sample_count, channel_count);
    std::uint8_t* out = decoded.data();
    for (std::size_t c = 0; c < channel_count; ++c) {
        const std::uint8_t* src = disk.data() + c * sample_count * width;
        for (std::size_t s = 0; s < sample_count; ++s) {
            detail::le_to_native(src + s * width, out + (s * channel_count + c) * width, width);
        }
    }

    matrix = std::move(decoded);
    return Error::Ok;
}

Error read_payload(ByteReader& reader, const Header& header, Container& container) {
    Container decoded;

    SignalMatrix timestamp;
    auto result =
        read_block(reader, ElementType::Float64, header.base_sample_count, 1, timestamp);
    if (result != Error::Ok) {
        return result;
    }
    decoded.set_timestamp(header.base_sampling_rate, std::move(timestamp));

    for (const auto& descriptor : header.signals) {
        SignalMatrix data;
        result = read_block(reader, descriptor.type, descriptor.sample_count,
                            descriptor.channel_count, data);
        if (result != Error::Ok) {
            return result;
        }
        decoded.add_signal(descriptor.name, descriptor.sampling_rate, std::move(data));
    }

    if (header.has_trigger) {
        SignalMatrix trigger;
        result = read_block(reader, ElementType::UInt32, header.base_sample_count, 1, trigger);
        if (result != Error::Ok) {
            return result;
        }
        decoded.set_trigger(std::move(trigger));
    }

    container = std::move(decoded);
    return Error::Ok;
}

Error decode(std::istream& stream, Container& container) {
    ByteReader reader(stream);

    Header header;
    auto result = read_header(reader, header);
    if (result != Error::Ok) {
        return result;
    }

    return read_payload(reader, header, container);
}

} // namespace biofile
