/**
 * @file decoder.hpp
 * @brief Payload reading and .bio decoding.
 *
 * The payload follows the header in a fixed order:
 *
 * 1. baseSampleCount float64 timestamps
 * 2. one block per descriptor, in header order
 * 3. baseSampleCount uint32 trigger values, iff the trigger flag is set
 *
 * @par Block layout
 * Blocks are stored channel-major: all samples of channel 0, then all
 * samples of channel 1, and so on. read_block() transposes them into the
 * sample-major SignalMatrix. Reading a block with the axes swapped still
 * "succeeds" with scrambled data, so the transpose is covered by tests.
 */

#ifndef BIOFILE_DECODER_HPP
#define BIOFILE_DECODER_HPP

#include "byte_reader.hpp"
#include "config.hpp"
#include "container.hpp"
#include "error.hpp"
#include "header.hpp"
#include "signal_matrix.hpp"

#include <iosfwd>

namespace biofile {

/**
 * @brief Read one channel-major block into a sample-major matrix.
 *
 * @param reader Reader positioned at the block
 * @param type Element type
 * @param sample_count Rows of the resulting matrix
 * @param channel_count Columns of the resulting matrix
 * @param[out] matrix Decoded matrix (untouched on failure)
 * @return Error::Ok, Error::TruncatedPayload if the stream ends early,
 *         Error::MalformedHeader if the block cannot be addressed in memory
 */
Error read_block(ByteReader& reader, ElementType type, std::uint32_t sample_count,
                 std::uint32_t channel_count, SignalMatrix& matrix);

/**
 * @brief Read the payload described by a header.
 *
 * Reads exactly header.payload_size() bytes; anything after is left
 * in the stream.
 *
 * @param reader Reader positioned right after the header
 * @param header Parsed header
 * @param[out] container Decoded container (untouched on failure)
 * @return Error::Ok or Error::TruncatedPayload
 */
Error read_payload(ByteReader& reader, const Header& header, Container& container);

/**
 * @brief Decode a complete .bio stream.
 *
 * All or nothing: container is assigned only when the whole file decoded.
 *
 * @param stream Input stream positioned at offset 0
 * @param[out] container Decoded container
 * @return Error::Ok, Error::MalformedHeader, Error::UnknownType or
 *         Error::TruncatedPayload
 */
Error decode(std::istream& stream, Container& container);

} // namespace biofile

#endif // BIOFILE_DECODER_HPP
