/**
 * @file biofile.hpp
 * @brief High-level .bio file API.
 *
 * Path-based read and write on top of decode() and encode(). The
 * error-code functions are always available; load() and save() throw the
 * exception matching the error code and are compiled out with
 * BIOFILE_NO_EXCEPTIONS=1.
 */

#ifndef BIOFILE_HPP
#define BIOFILE_HPP

#include "byte_reader.hpp"
#include "byte_writer.hpp"
#include "config.hpp"
#include "container.hpp"
#include "decoder.hpp"
#include "element_type.hpp"
#include "encoder.hpp"
#include "error.hpp"
#include "header.hpp"
#include "signal_matrix.hpp"

#include <string>

namespace biofile {

/**
 * @brief Decode a .bio file.
 *
 * @param path File path
 * @param[out] container Decoded container (untouched on failure)
 * @return Error::Ok, Error::IoError if the file cannot be opened, or a
 *         decode error
 */
Error read_file(const std::string& path, Container& container);

/**
 * @brief Encode a container to a .bio file.
 *
 * The container is validated before the file is created or truncated.
 *
 * @return Error::Ok, Error::InvalidSignal or Error::IoError
 */
Error write_file(const std::string& path, const Container& container);

/**
 * @brief Read only the header of a .bio file.
 *
 * @param path File path
 * @param[out] header Parsed header
 * @param[out] file_size Actual size of the file in bytes
 * @return Error::Ok, Error::IoError, Error::MalformedHeader or Error::UnknownType
 */
Error read_file_header(const std::string& path, Header& header, std::uint64_t& file_size);

#if !BIOFILE_NO_EXCEPTIONS

/**
 * @brief Decode a .bio file, throwing on failure.
 *
 * @throws BioFileException subclass matching the error
 */
Container load(const std::string& path);

/**
 * @brief Encode a container to a .bio file, throwing on failure.
 *
 * @throws BioFileException subclass matching the error
 */
void save(const std::string& path, const Container& container);

#endif // !BIOFILE_NO_EXCEPTIONS

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "1.0.0";
}

} // namespace biofile

#endif // BIOFILE_HPP
