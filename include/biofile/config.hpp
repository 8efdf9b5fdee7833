/**
 * @file config.hpp
 * @brief biofile compile-time configuration.
 *
 * Format constants for the .bio signal container and the switches that
 * can be overridden from the build (-DBIOFILE_...).
 */

#ifndef BIOFILE_CONFIG_HPP
#define BIOFILE_CONFIG_HPP

#include <cstdint>
#include <cstddef>

namespace biofile {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup config Configuration Constants
 * @{
 */

/// Longest signal name accepted when reading or writing a header
#ifndef BIOFILE_MAX_NAME_LENGTH
#define BIOFILE_MAX_NAME_LENGTH 4096U
#endif

/// Payload blocks are read in chunks of at most this many bytes
#ifndef BIOFILE_READ_CHUNK_BYTES
#define BIOFILE_READ_CHUNK_BYTES 65536U
#endif

inline constexpr std::size_t MAX_NAME_LENGTH = BIOFILE_MAX_NAME_LENGTH;
inline constexpr std::size_t READ_CHUNK_BYTES = BIOFILE_READ_CHUNK_BYTES;

/// Reserved entry names
inline constexpr const char* TIMESTAMP_NAME = "timestamp";
inline constexpr const char* TRIGGER_NAME = "trigger";

/// Only bit 0 of the trigger flag byte is meaningful
inline constexpr std::uint8_t TRIGGER_FLAG_MASK = 0x01U;

/// Fixed part of the global header: signalCount, baseSamplingRate, baseSampleCount
inline constexpr std::size_t GLOBAL_HEADER_BYTES = 12U;

/// Fixed part of one descriptor (without the name bytes)
inline constexpr std::size_t DESCRIPTOR_FIXED_BYTES = 17U;

/** @} */

/**
 * @defgroup exceptions Exception Configuration
 *
 * Define BIOFILE_NO_EXCEPTIONS=1 to drop the throwing API (load/save).
 * @{
 */
#ifndef BIOFILE_NO_EXCEPTIONS
#define BIOFILE_NO_EXCEPTIONS 0
#endif
/** @} */

} // namespace biofile

#endif // BIOFILE_CONFIG_HPP
