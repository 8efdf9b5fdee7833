/**
 * @file encoder.hpp
 * @brief .bio encoding.
 *
 * The encoder is the inverse of the decoder: decode(encode(c)) == c for
 * every container that describe() accepts. Validation happens before the
 * first byte is written, so a rejected container never leaves a partial
 * file behind.
 */

#ifndef BIOFILE_ENCODER_HPP
#define BIOFILE_ENCODER_HPP

#include "byte_writer.hpp"
#include "config.hpp"
#include "container.hpp"
#include "error.hpp"
#include "header.hpp"
#include "signal_matrix.hpp"

#include <iosfwd>

namespace biofile {

/**
 * @brief Write a sample-major matrix as a channel-major block.
 *
 * @return Error::Ok or Error::IoError
 */
Error write_block(ByteWriter& writer, const SignalMatrix& matrix);

/**
 * @brief Check that a container can be encoded.
 *
 * @return Error::Ok or Error::InvalidSignal
 */
Error validate(const Container& container);

/**
 * @brief Encode a container.
 *
 * @param container Container to write
 * @param stream Output stream
 * @return Error::Ok, Error::InvalidSignal (nothing written) or Error::IoError
 */
Error encode(const Container& container, std::ostream& stream);

} // namespace biofile

#endif // BIOFILE_ENCODER_HPP
