/**
 * @file session_writer.cpp
 * @brief SessionWriter accumulation and flushing.
 */

#include <biofile/session_writer.hpp>

#include <biofile/biofile.hpp>

#include <cmath>
#include <filesystem>
#include <system_error>
#include <unordered_set>

namespace biofile {

SessionWriter::SessionWriter(std::string path, float base_rate, std::vector<SignalInfo> layout,
                             bool with_trigger)
    : path_(std::move(path)), base_rate_(base_rate), layout_(std::move(layout)),
      with_trigger_(with_trigger), open_(false), trigger_value_(0),
      timestamps_(ElementType::Float64, 0, 1), triggers_(ElementType::UInt32, 0, 1) {}

Error SessionWriter::check_layout() const {
    if (!std::isfinite(base_rate_) || base_rate_ <= 0.0F) {
        return Error::InvalidSignal;
    }

    std::unordered_set<std::string> seen;
    for (const auto& info : layout_) {
        if (info.name.empty() || info.name.size() > MAX_NAME_LENGTH ||
            is_reserved_name(info.name) || !seen.insert(info.name).second) {
            return Error::InvalidSignal;
        }
        if (!std::isfinite(info.sampling_rate) || info.sampling_rate <= 0.0F ||
            info.channel_count == 0) {
            return Error::InvalidSignal;
        }
    }
    return Error::Ok;
}

Error SessionWriter::open() {
    if (open_) {
        return Error::InvalidSignal;
    }

    auto result = check_layout();
    if (result != Error::Ok) {
        return result;
    }

    Container container;
    for (const auto& info : layout_) {
        container.add_signal(info.name, info.sampling_rate,
                             SignalMatrix(info.type, 0, info.channel_count));
    }
    container_ = std::move(container);
    timestamps_.clear_rows();
    triggers_.clear_rows();

    open_ = true;
    result = flush();
    if (result != Error::Ok) {
        open_ = false;
    }
    return result;
}

Error SessionWriter::append(std::string_view name, const SignalMatrix& packet) {
    if (!open_) {
        return Error::InvalidSignal;
    }

    Signal* signal = container_.find_signal(name);
    if (signal == nullptr) {
        return Error::InvalidSignal;
    }
    return signal->data.append_rows(packet);
}

Error SessionWriter::append_timestamps(const std::vector<double>& values) {
    if (!open_) {
        return Error::InvalidSignal;
    }

    auto result = timestamps_.append_rows(SignalMatrix::column(values));
    if (result == Error::Ok && with_trigger_) {
        std::vector<std::uint32_t> labels(values.size(), trigger_value_);
        result = triggers_.append_rows(SignalMatrix::column(labels));
    }
    return result;
}

Error SessionWriter::flush() {
    if (!open_) {
        return Error::InvalidSignal;
    }

    container_.set_timestamp(base_rate_, timestamps_);
    if (with_trigger_) {
        container_.set_trigger(triggers_);
    }

    const std::string part_path = path_ + ".part";
    std::error_code ec;
    auto result = write_file(part_path, container_);
    if (result != Error::Ok) {
        std::filesystem::remove(part_path, ec);
        return result;
    }

    std::filesystem::rename(part_path, path_, ec);
    if (ec) {
        std::filesystem::remove(part_path, ec);
        return Error::IoError;
    }
    return Error::Ok;
}

Error SessionWriter::close() {
    if (!open_) {
        return Error::InvalidSignal;
    }

    auto result = flush();
    open_ = false;
    return result;
}

} // namespace biofile
