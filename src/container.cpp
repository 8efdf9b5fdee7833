/**
 * @file container.cpp
 * @brief Container table operations.
 */

#include <biofile/container.hpp>

#include <cstring>
#include <utility>

namespace biofile {

namespace {

// Rates compare by bit pattern, matching the file representation
bool same_rate(float a, float b) noexcept {
    return std::memcmp(&a, &b, sizeof(float)) == 0;
}

} // namespace

bool Signal::operator==(const Signal& other) const noexcept {
    return name == other.name && same_rate(sampling_rate, other.sampling_rate) &&
           data == other.data;
}

bool is_reserved_name(std::string_view name) noexcept {
    return name == TIMESTAMP_NAME || name == TRIGGER_NAME;
}

Container::Container() {
    timestamp_.name = TIMESTAMP_NAME;
    timestamp_.data = SignalMatrix(ElementType::Float64, 0, 1);
}

void Container::set_timestamp(float base_rate, const std::vector<double>& values) {
    set_timestamp(base_rate, SignalMatrix::column(values));
}

void Container::set_timestamp(float base_rate, SignalMatrix values) {
    timestamp_.sampling_rate = base_rate;
    timestamp_.data = std::move(values);

    // Trigger follows the base rate
    if (trigger_) {
        trigger_->sampling_rate = base_rate;
    }
}

void Container::set_trigger(const std::vector<std::uint32_t>& values) {
    set_trigger(SignalMatrix::column(values));
}

void Container::set_trigger(SignalMatrix values) {
    Signal trigger;
    trigger.name = TRIGGER_NAME;
    trigger.sampling_rate = timestamp_.sampling_rate;
    trigger.data = std::move(values);
    trigger_ = std::move(trigger);
}

void Container::add_signal(std::string name, float sampling_rate, SignalMatrix data) {
    Signal signal;
    signal.name = std::move(name);
    signal.sampling_rate = sampling_rate;
    signal.data = std::move(data);
    signals_.push_back(std::move(signal));
}

Signal* Container::find_signal(std::string_view name) noexcept {
    for (auto& signal : signals_) {
        if (signal.name == name) {
            return &signal;
        }
    }
    return nullptr;
}

const Signal* Container::find(std::string_view name) const noexcept {
    if (name == TIMESTAMP_NAME) {
        return &timestamp_;
    }
    if (name == TRIGGER_NAME) {
        return trigger();
    }
    for (const auto& signal : signals_) {
        if (signal.name == name) {
            return &signal;
        }
    }
    return nullptr;
}

std::vector<const Signal*> Container::entries() const {
    std::vector<const Signal*> result;
    result.reserve(size());

    result.push_back(&timestamp_);
    for (const auto& signal : signals_) {
        result.push_back(&signal);
    }
    if (trigger_) {
        result.push_back(&*trigger_);
    }
    return result;
}

std::vector<std::string> Container::names() const {
    std::vector<std::string> result;
    result.reserve(size());
    for (const Signal* entry : entries()) {
        result.push_back(entry->name);
    }
    return result;
}

bool Container::operator==(const Container& other) const noexcept {
    return timestamp_ == other.timestamp_ && signals_ == other.signals_ &&
           trigger_ == other.trigger_;
}

} // namespace biofile
