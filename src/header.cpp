/**
 * @file header.cpp
 * @brief Header parsing, serialization and validation.
 */

#include <biofile/header.hpp>

#include <cmath>
#include <limits>
#include <unordered_set>

namespace biofile {

namespace {

constexpr std::uint64_t U32_MAX = std::numeric_limits<std::uint32_t>::max();

bool valid_rate(float rate) noexcept {
    return std::isfinite(rate) && rate > 0.0F;
}

// Underflow inside the header means the file stops before the payload
Error header_error(Error error) noexcept {
    return error == Error::Underflow ? Error::MalformedHeader : error;
}

Error read_descriptor(ByteReader& reader, SignalDescriptor& descriptor) {
    std::uint32_t name_length = 0;
    auto result = reader.read_u32(name_length);
    if (result != Error::Ok) {
        return header_error(result);
    }
    if (name_length == 0 || name_length > MAX_NAME_LENGTH) {
        return Error::MalformedHeader;
    }

    descriptor.name.assign(name_length, '\0');
    result = reader.read_bytes(reinterpret_cast<std::uint8_t*>(descriptor.name.data()),
                               name_length);
    if (result != Error::Ok) {
        return header_error(result);
    }

    result = reader.read_f32(descriptor.sampling_rate);
    if (result == Error::Ok) {
        result = reader.read_u32(descriptor.sample_count);
    }
    if (result == Error::Ok) {
        result = reader.read_u32(descriptor.channel_count);
    }
    std::uint8_t tag = 0;
    if (result == Error::Ok) {
        result = reader.read_u8(tag);
    }
    if (result != Error::Ok) {
        return header_error(result);
    }

    result = resolve_type(static_cast<char>(tag), descriptor.type);
    if (result != Error::Ok) {
        return result;
    }

    if (!valid_rate(descriptor.sampling_rate) || descriptor.channel_count == 0) {
        return Error::MalformedHeader;
    }
    return Error::Ok;
}

Error check_signal(const Signal& signal) {
    if (signal.name.empty() || signal.name.size() > MAX_NAME_LENGTH ||
        is_reserved_name(signal.name)) {
        return Error::InvalidSignal;
    }
    if (!valid_rate(signal.sampling_rate)) {
        return Error::InvalidSignal;
    }
    if (signal.data.cols() == 0 || signal.data.cols() > U32_MAX ||
        signal.data.rows() > U32_MAX) {
        return Error::InvalidSignal;
    }
    // rows * cols * width may wrap; compare by division
    const std::size_t width = element_width(signal.data.type());
    if (!SignalMatrix::fits(signal.data.type(), signal.data.rows(), signal.data.cols()) ||
        signal.data.size_bytes() % width != 0 ||
        signal.data.size_bytes() / width != signal.data.size()) {
        return Error::InvalidSignal;
    }
    return Error::Ok;
}

// Timestamp and trigger: one column of a fixed type
bool is_base_column(const Signal& entry, ElementType type) noexcept {
    return entry.data.type() == type && entry.data.cols() == 1;
}

} // namespace

std::uint64_t Header::header_size() const noexcept {
    std::uint64_t size = GLOBAL_HEADER_BYTES + 1;
    for (const auto& descriptor : signals) {
        size += DESCRIPTOR_FIXED_BYTES + descriptor.name.size();
    }
    return size;
}

std::uint64_t Header::payload_size() const noexcept {
    std::uint64_t size = static_cast<std::uint64_t>(base_sample_count) * sizeof(double);
    for (const auto& descriptor : signals) {
        size += descriptor.block_size();
    }
    if (has_trigger) {
        size += static_cast<std::uint64_t>(base_sample_count) * sizeof(std::uint32_t);
    }
    return size;
}

Error read_header(ByteReader& reader, Header& header) {
    Header parsed;

    std::uint32_t signal_count = 0;
    auto result = reader.read_u32(signal_count);
    if (result == Error::Ok) {
        result = reader.read_f32(parsed.base_sampling_rate);
    }
    if (result == Error::Ok) {
        result = reader.read_u32(parsed.base_sample_count);
    }
    if (result != Error::Ok) {
        return header_error(result);
    }
    if (!valid_rate(parsed.base_sampling_rate)) {
        return Error::MalformedHeader;
    }

    // Grow as descriptors arrive; signal_count itself is untrusted
    std::unordered_set<std::string> seen;
    for (std::uint32_t i = 0; i < signal_count; ++i) {
        SignalDescriptor descriptor;
        result = read_descriptor(reader, descriptor);
        if (result != Error::Ok) {
            return result;
        }

        if (is_reserved_name(descriptor.name) || !seen.insert(descriptor.name).second) {
            return Error::MalformedHeader;
        }
        parsed.signals.push_back(std::move(descriptor));
    }

    std::uint8_t flag = 0;
    result = reader.read_u8(flag);
    if (result != Error::Ok) {
        return header_error(result);
    }
    parsed.has_trigger = (flag & TRIGGER_FLAG_MASK) != 0;

    header = std::move(parsed);
    return Error::Ok;
}

Error write_header(ByteWriter& writer, const Header& header) {
    auto result = writer.write_u32(static_cast<std::uint32_t>(header.signals.size()));
    if (result == Error::Ok) {
        result = writer.write_f32(header.base_sampling_rate);
    }
    if (result == Error::Ok) {
        result = writer.write_u32(header.base_sample_count);
    }

    for (const auto& descriptor : header.signals) {
        if (result != Error::Ok) {
            return result;
        }

        result = writer.write_u32(static_cast<std::uint32_t>(descriptor.name.size()));
        if (result == Error::Ok) {
            result = writer.write_bytes(
                reinterpret_cast<const std::uint8_t*>(descriptor.name.data()),
                descriptor.name.size());
        }
        if (result == Error::Ok) {
            result = writer.write_f32(descriptor.sampling_rate);
        }
        if (result == Error::Ok) {
            result = writer.write_u32(descriptor.sample_count);
        }
        if (result == Error::Ok) {
            result = writer.write_u32(descriptor.channel_count);
        }
        if (result == Error::Ok) {
            result = writer.write_u8(static_cast<std::uint8_t>(type_tag(descriptor.type)));
        }
    }

    if (result == Error::Ok) {
        result = writer.write_u8(header.has_trigger ? TRIGGER_FLAG_MASK : 0U);
    }
    return result;
}

Error describe(const Container& container, Header& header) {
    const Signal& timestamp = container.timestamp();
    if (!valid_rate(timestamp.sampling_rate) || !is_base_column(timestamp, ElementType::Float64) ||
        timestamp.data.rows() > U32_MAX) {
        return Error::InvalidSignal;
    }

    const Signal* trigger = container.trigger();
    if (trigger != nullptr) {
        if (!is_base_column(*trigger, ElementType::UInt32) ||
            trigger->data.rows() != timestamp.data.rows()) {
            return Error::InvalidSignal;
        }
    }

    if (container.signals().size() > U32_MAX) {
        return Error::InvalidSignal;
    }

    Header described;
    described.base_sampling_rate = timestamp.sampling_rate;
    described.base_sample_count = static_cast<std::uint32_t>(timestamp.data.rows());
    described.has_trigger = trigger != nullptr;

    std::unordered_set<std::string> seen;
    for (const auto& signal : container.signals()) {
        auto result = check_signal(signal);
        if (result != Error::Ok) {
            return result;
        }
        if (!seen.insert(signal.name).second) {
            return Error::InvalidSignal;
        }

        SignalDescriptor descriptor;
        descriptor.name = signal.name;
        descriptor.sampling_rate = signal.sampling_rate;
        descriptor.sample_count = static_cast<std::uint32_t>(signal.data.rows());
        descriptor.channel_count = static_cast<std::uint32_t>(signal.data.cols());
        descriptor.type = signal.data.type();
        described.signals.push_back(std::move(descriptor));
    }

    header = std::move(described);
    return Error::Ok;
}

} // namespace biofile
