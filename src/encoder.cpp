/**
 * @file encoder.cpp
 * @brief Payload writer and encode().
 */

#include <biofile/encoder.hpp>

#include <algorithm>
#include <ostream>
#include <vector>

namespace biofile {

Error write_block(ByteWriter& writer, const SignalMatrix& matrix) {
    const std::size_t width = element_width(matrix.type());
    const std::size_t rows = matrix.rows();
    const std::size_t cols = matrix.cols();
    const std::uint8_t* in = matrix.data();

    // One channel at a time, at most READ_CHUNK_BYTES per write
    const std::size_t chunk_elems = std::max<std::size_t>(1, READ_CHUNK_BYTES / width);
    std::vector<std::uint8_t> buffer(std::min(rows, chunk_elems) * width);

    for (std::size_t c = 0; c < cols; ++c) {
        std::size_t s = 0;
        while (s < rows) {
            std::size_t count = std::min(rows - s, chunk_elems);
            for (std::size_t i = 0; i < count; ++i) {
                detail::native_to_le(in + ((s + i) * cols + c) * width, buffer.data() + i * width,
                                     width);
            }

            auto result = writer.write_bytes(buffer.data(), count * width);
            if (result != Error::Ok) {
                return result;
            }
            s += count;
        }
    }
    return Error::Ok;
}

Error validate(const Container& container) {
    Header header;
    return describe(container, header);
}

Error encode(const Container& container, std::ostream& stream) {
    Header header;
    auto result = describe(container, header);
    if (result != Error::Ok) {
        return result;
    }

    ByteWriter writer(stream);
    result = write_header(writer, header);
    if (result != Error::Ok) {
        return result;
    }

    result = write_block(writer, container.timestamp().data);
    for (const auto& signal : container.signals()) {
        if (result != Error::Ok) {
            return result;
        }
        result = write_block(writer, signal.data);
    }

    const Signal* trigger = container.trigger();
    if (result == Error::Ok && trigger != nullptr) {
        result = write_block(writer, trigger->data);
    }
    if (result != Error::Ok) {
        return result;
    }

    stream.flush();
    return stream.good() ? Error::Ok : Error::IoError;
}

} // namespace biofile
