/**
 * @file error.hpp
 * @brief biofile error handling.
 *
 * Every codec operation reports an Error code. The exception classes
 * below back the throwing convenience API and are compiled out with
 * BIOFILE_NO_EXCEPTIONS=1.
 */

#ifndef BIOFILE_ERROR_HPP
#define BIOFILE_ERROR_HPP

#include "config.hpp"

#if !BIOFILE_NO_EXCEPTIONS
#include <stdexcept>
#include <string>
#endif

namespace biofile {

/**
 * @brief Error codes returned by the codec.
 */
enum class Error {
    Ok = 0,                ///< Success
    Underflow = -1,        ///< Byte source exhausted
    MalformedHeader = -2,  ///< Header truncated or inconsistent
    UnknownType = -3,      ///< Element type tag not in the enumeration
    TruncatedPayload = -4, ///< Fewer payload elements than the header declares
    InvalidSignal = -5,    ///< Container violates the encoder contract
    IoError = -6           ///< File could not be opened, written or renamed
};

/**
 * @brief Get error message for error code.
 * @param error Error code
 * @return Human-readable error message
 */
inline const char* error_string(Error error) noexcept {
    switch (error) {
    case Error::Ok:
        return "Success";
    case Error::Underflow:
        return "Unexpected end of data";
    case Error::MalformedHeader:
        return "Malformed header";
    case Error::UnknownType:
        return "Unknown element type tag";
    case Error::TruncatedPayload:
        return "Truncated payload";
    case Error::InvalidSignal:
        return "Invalid signal";
    case Error::IoError:
        return "I/O error";
    default:
        return "Unknown error";
    }
}

#if !BIOFILE_NO_EXCEPTIONS

/**
 * @brief Base exception for biofile errors.
 */
class BioFileException : public std::runtime_error {
public:
    explicit BioFileException(const std::string& message, Error code = Error::IoError)
        : std::runtime_error(message), error_code_(code) {}

    Error code() const noexcept {
        return error_code_;
    }

private:
    Error error_code_;
};

/**
 * @brief Exception for truncated or inconsistent headers.
 */
class MalformedHeaderException : public BioFileException {
public:
    explicit MalformedHeaderException(const std::string& message)
        : BioFileException(message, Error::MalformedHeader) {}
};

/**
 * @brief Exception for unknown element type tags.
 */
class UnknownTypeException : public BioFileException {
public:
    explicit UnknownTypeException(const std::string& message)
        : BioFileException(message, Error::UnknownType) {}
};

/**
 * @brief Exception for payloads shorter than declared.
 */
class TruncatedPayloadException : public BioFileException {
public:
    explicit TruncatedPayloadException(const std::string& message)
        : BioFileException(message, Error::TruncatedPayload) {}
};

/**
 * @brief Exception for containers rejected by the encoder.
 */
class InvalidSignalException : public BioFileException {
public:
    explicit InvalidSignalException(const std::string& message)
        : BioFileException(message, Error::InvalidSignal) {}
};

/**
 * @brief Exception for file access failures.
 */
class IoException : public BioFileException {
public:
    explicit IoException(const std::string& message)
        : BioFileException(message, Error::IoError) {}
};

/**
 * @brief Throw the exception matching an error code.
 *
 * @param error Error code (must not be Error::Ok)
 * @param context Prefix for the exception message, typically a file path
 */
[[noreturn]] void throw_error(Error error, const std::string& context);

#endif // !BIOFILE_NO_EXCEPTIONS

} // namespace biofile

#endif // BIOFILE_ERROR_HPP
