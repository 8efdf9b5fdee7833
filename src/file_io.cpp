/**
 * @file file_io.cpp
 * @brief Path-based read/write and the throwing API.
 */

#include <biofile/biofile.hpp>

#include <fstream>

namespace biofile {

Error read_file(const std::string& path, Container& container) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Error::IoError;
    }
    return decode(file, container);
}

Error write_file(const std::string& path, const Container& container) {
    // Reject before touching an existing file
    auto result = validate(container);
    if (result != Error::Ok) {
        return result;
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return Error::IoError;
    }

    result = encode(container, file);
    if (result != Error::Ok) {
        return result;
    }

    file.close();
    return file.fail() ? Error::IoError : Error::Ok;
}

Error read_file_header(const std::string& path, Header& header, std::uint64_t& file_size) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return Error::IoError;
    }

    std::streamoff size = file.tellg();
    if (size < 0) {
        return Error::IoError;
    }
    file.seekg(0, std::ios::beg);

    ByteReader reader(file);
    auto result = read_header(reader, header);
    if (result != Error::Ok) {
        return result;
    }

    file_size = static_cast<std::uint64_t>(size);
    return Error::Ok;
}

#if !BIOFILE_NO_EXCEPTIONS

void throw_error(Error error, const std::string& context) {
    std::string message = context + ": " + error_string(error);
    switch (error) {
    case Error::MalformedHeader:
    case Error::Underflow:
        throw MalformedHeaderException(message);
    case Error::UnknownType:
        throw UnknownTypeException(message);
    case Error::TruncatedPayload:
        throw TruncatedPayloadException(message);
    case Error::InvalidSignal:
        throw InvalidSignalException(message);
    case Error::IoError:
        throw IoException(message);
    default:
        throw BioFileException(message, error);
    }
}

Container load(const std::string& path) {
    Container container;
    auto result = read_file(path, container);
    if (result != Error::Ok) {
        throw_error(result, path);
    }
    return container;
}

void save(const std::string& path, const Container& container) {
    auto result = write_file(path, container);
    if (result != Error::Ok) {
        throw_error(result, path);
    }
}

#endif // !BIOFILE_NO_EXCEPTIONS

} // namespace biofile
