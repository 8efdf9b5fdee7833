/**
 * @file header.hpp
 * @brief Schema header of a .bio file.
 *
 * The header is self-describing: it lists every user signal with its
 * shape and element type, followed by the trigger flag. All counts the
 * payload reader needs come from here.
 *
 * @par Layout (little-endian)
 * @code
 * [u32 signalCount]
 * [f32 baseSamplingRate][u32 baseSampleCount]
 * repeat signalCount times:
 *   [u32 nameLength][nameLength bytes name]
 *   [f32 fs][u32 sampleCount][u32 channelCount][u8 typeTag]
 * [u8 triggerFlagByte]
 * @endcode
 */

#ifndef BIOFILE_HEADER_HPP
#define BIOFILE_HEADER_HPP

#include "byte_reader.hpp"
#include "byte_writer.hpp"
#include "config.hpp"
#include "container.hpp"
#include "element_type.hpp"
#include "error.hpp"

#include <string>
#include <vector>

namespace biofile {

/**
 * @brief Header record of one user signal.
 */
struct SignalDescriptor {
    std::string name;
    float sampling_rate = 0.0F;
    std::uint32_t sample_count = 0;
    std::uint32_t channel_count = 0;
    ElementType type = ElementType::Float32;

    /**
     * @brief Size of this signal's payload block in bytes.
     */
    [[nodiscard]] std::uint64_t block_size() const noexcept {
        return static_cast<std::uint64_t>(sample_count) * channel_count * element_width(type);
    }
};

/**
 * @brief Parsed file header.
 */
struct Header {
    float base_sampling_rate = 0.0F;
    std::uint32_t base_sample_count = 0;
    std::vector<SignalDescriptor> signals;
    bool has_trigger = false;

    /**
     * @brief Encoded header size in bytes, trigger flag included.
     */
    [[nodiscard]] std::uint64_t header_size() const noexcept;

    /**
     * @brief Payload size in bytes promised by this header.
     */
    [[nodiscard]] std::uint64_t payload_size() const noexcept;

    /**
     * @brief Complete file size: header_size() + payload_size().
     */
    [[nodiscard]] std::uint64_t file_size() const noexcept {
        return header_size() + payload_size();
    }
};

/**
 * @brief Parse a header.
 *
 * Consumes exactly the header bytes and nothing of the payload.
 *
 * @param reader Reader positioned at offset 0
 * @param[out] header Parsed header (untouched on failure)
 * @return Error::Ok, Error::MalformedHeader or Error::UnknownType
 */
Error read_header(ByteReader& reader, Header& header);

/**
 * @brief Serialize a header.
 *
 * The header is written as given; use describe() to build a valid one.
 *
 * @return Error::Ok or Error::IoError
 */
Error write_header(ByteWriter& writer, const Header& header);

/**
 * @brief Build the header of a container, checking that it can be written.
 *
 * @param container Source container
 * @param[out] header Resulting header (untouched on failure)
 * @return Error::Ok or Error::InvalidSignal
 */
Error describe(const Container& container, Header& header);

} // namespace biofile

#endif // BIOFILE_HEADER_HPP
