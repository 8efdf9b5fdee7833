/**
 * @file session_writer.hpp
 * @brief .bio output for a live acquisition session.
 *
 * Acquisition front ends receive decoded packets from a data source and
 * need a readable file on disk at all times. SessionWriter accumulates
 * the packets of every signal in the source's layout, tags each base
 * sample with the current trigger value, and rewrites the file on every
 * flush().
 *
 * @par Crash safety
 * flush() encodes to `<path>.part` and renames it over `<path>`, so the
 * file on disk is always the last complete flush.
 *
 * Not thread-safe: callers serialize access.
 */

#ifndef BIOFILE_SESSION_WRITER_HPP
#define BIOFILE_SESSION_WRITER_HPP

#include "config.hpp"
#include "container.hpp"
#include "element_type.hpp"
#include "error.hpp"
#include "signal_matrix.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace biofile {

/**
 * @brief Layout entry of one signal produced by a data source.
 */
struct SignalInfo {
    std::string name;
    float sampling_rate = 0.0F;
    std::uint32_t channel_count = 0;
    ElementType type = ElementType::Float32;
};

/**
 * @brief Incremental writer for one acquisition session.
 */
class SessionWriter {
public:
    /**
     * @brief Configure a session; nothing is written until open().
     *
     * @param path Output file path
     * @param base_rate Sampling rate of timestamps and trigger
     * @param layout Signals the data source produces, in file order
     * @param with_trigger Whether a trigger channel is recorded
     */
    SessionWriter(std::string path, float base_rate, std::vector<SignalInfo> layout,
                  bool with_trigger);

    /**
     * @brief Validate the layout and write an empty, valid file.
     *
     * @return Error::Ok, Error::InvalidSignal or Error::IoError
     */
    Error open();

    /**
     * @brief Append decoded rows to one signal.
     *
     * @param name Signal name from the layout
     * @param packet Rows to append; type and column count must match the layout
     * @return Error::Ok or Error::InvalidSignal
     */
    Error append(std::string_view name, const SignalMatrix& packet);

    /**
     * @brief Append base-rate timestamps.
     *
     * With the trigger enabled, every timestamp is paired with the current
     * trigger value.
     *
     * @return Error::Ok or Error::InvalidSignal if the session is not open
     */
    Error append_timestamps(const std::vector<double>& values);

    /**
     * @brief Trigger value for the following timestamps.
     */
    void set_trigger(std::uint32_t value) noexcept {
        trigger_value_ = value;
    }

    [[nodiscard]] std::uint32_t trigger() const noexcept {
        return trigger_value_;
    }

    /**
     * @brief Rewrite the file with everything received so far.
     *
     * @return Error::Ok, Error::InvalidSignal or Error::IoError
     */
    Error flush();

    /**
     * @brief Flush and end the session.
     *
     * Data appended after the last flush() is lost if close() is never called.
     */
    Error close();

    [[nodiscard]] bool is_open() const noexcept {
        return open_;
    }

    [[nodiscard]] const std::string& path() const noexcept {
        return path_;
    }

    /**
     * @brief Accumulated container.
     *
     * User signals are current; timestamp and trigger entries are
     * refreshed by flush().
     */
    [[nodiscard]] const Container& snapshot() const noexcept {
        return container_;
    }

private:
    Error check_layout() const;

    std::string path_;
    float base_rate_;
    std::vector<SignalInfo> layout_;
    bool with_trigger_;
    bool open_;
    std::uint32_t trigger_value_;

    Container container_;
    SignalMatrix timestamps_;
    SignalMatrix triggers_;
};

} // namespace biofile

#endif // BIOFILE_SESSION_WRITER_HPP
