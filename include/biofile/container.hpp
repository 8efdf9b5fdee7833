/**
 * @file container.hpp
 * @brief In-memory content of one .bio file.
 *
 * A Container is an ordered table of named entries, each carrying a
 * sampling rate and a SignalMatrix. Three kinds of entry exist:
 *
 * - `timestamp`: always present, float64, one column, at the base rate
 * - user signals: any element type and shape, in file order
 * - `trigger`: optional, uint32, one column, at the base rate
 *
 * Iteration always yields `timestamp` first and `trigger` last.
 */

#ifndef BIOFILE_CONTAINER_HPP
#define BIOFILE_CONTAINER_HPP

#include "config.hpp"
#include "signal_matrix.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace biofile {

/**
 * @brief One named entry: sampling rate and sample matrix.
 */
struct Signal {
    std::string name;
    float sampling_rate = 0.0F;
    SignalMatrix data;

    bool operator==(const Signal& other) const noexcept;
    bool operator!=(const Signal& other) const noexcept {
        return !(*this == other);
    }
};

/**
 * @brief Check whether a name is reserved for the base-rate entries.
 */
bool is_reserved_name(std::string_view name) noexcept;

/**
 * @brief Ordered signal table.
 *
 * The mutation functions do not validate; encode() rejects containers
 * that cannot be written.
 */
class Container {
public:
    /**
     * @brief Empty container: base rate 0, no timestamps, no trigger.
     */
    Container();

    /**
     * @brief Set the base rate and the timestamp column.
     */
    void set_timestamp(float base_rate, const std::vector<double>& values);

    /**
     * @brief Set the timestamp entry from an existing matrix.
     *
     * Used by the decoder; the matrix is expected to be float64 with one column.
     */
    void set_timestamp(float base_rate, SignalMatrix values);

    /**
     * @brief Enable the trigger entry with the given values.
     */
    void set_trigger(const std::vector<std::uint32_t>& values);

    /**
     * @brief Enable the trigger entry from an existing matrix.
     */
    void set_trigger(SignalMatrix values);

    /**
     * @brief Remove the trigger entry.
     */
    void clear_trigger() noexcept {
        trigger_.reset();
    }

    /**
     * @brief Append a user signal after the existing ones.
     */
    void add_signal(std::string name, float sampling_rate, SignalMatrix data);

    /**
     * @brief Base sampling rate (timestamp and trigger).
     */
    [[nodiscard]] float base_rate() const noexcept {
        return timestamp_.sampling_rate;
    }

    /**
     * @brief Number of timestamp samples.
     */
    [[nodiscard]] std::size_t base_sample_count() const noexcept {
        return timestamp_.data.rows();
    }

    [[nodiscard]] const Signal& timestamp() const noexcept {
        return timestamp_;
    }

    [[nodiscard]] bool has_trigger() const noexcept {
        return trigger_.has_value();
    }

    /**
     * @brief Trigger entry, or nullptr when absent.
     */
    [[nodiscard]] const Signal* trigger() const noexcept {
        return trigger_ ? &*trigger_ : nullptr;
    }

    /**
     * @brief User signals in insertion order.
     */
    [[nodiscard]] const std::vector<Signal>& signals() const noexcept {
        return signals_;
    }

    /**
     * @brief Mutable access to a user signal, or nullptr.
     */
    Signal* find_signal(std::string_view name) noexcept;

    /**
     * @brief Any entry by name, including `timestamp` and `trigger`.
     *
     * @return Entry, or nullptr if the name is unknown
     */
    [[nodiscard]] const Signal* find(std::string_view name) const noexcept;

    /**
     * @brief Entries in iteration order: timestamp, user signals, trigger.
     */
    [[nodiscard]] std::vector<const Signal*> entries() const;

    /**
     * @brief Entry names in iteration order.
     */
    [[nodiscard]] std::vector<std::string> names() const;

    /**
     * @brief Number of entries, timestamp and trigger included.
     */
    [[nodiscard]] std::size_t size() const noexcept {
        return 1 + signals_.size() + (trigger_ ? 1 : 0);
    }

    bool operator==(const Container& other) const noexcept;
    bool operator!=(const Container& other) const noexcept {
        return !(*this == other);
    }

private:
    Signal timestamp_;
    std::vector<Signal> signals_;
    std::optional<Signal> trigger_;
};

} // namespace biofile

#endif // BIOFILE_CONTAINER_HPP
