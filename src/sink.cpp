/**
 * @file sink.cpp
 * @brief Sink implementations.
 */

#include <ubjson/sink.hpp>

namespace ubjson {

Error VectorSink::write(const std::uint8_t* data, std::size_t size) {
    output_.insert(output_.end(), data, data + size);
    return Error::Ok;
}

Error OStreamSink::write(const std::uint8_t* data, std::size_t size) {
    stream_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
    return stream_.good() ? Error::Ok : Error::SinkWrite;
}

Error FileSink::write(const std::uint8_t* data, std::size_t size) {
    if (file_ == nullptr) {
        return Error::SinkWrite;
    }
    std::size_t written = std::fwrite(data, 1, size, file_);
    return written == size ? Error::Ok : Error::SinkWrite;
}

Error CallbackSink::write(const std::uint8_t* data, std::size_t size) {
    if (!callback_) {
        return Error::SinkWrite;
    }
    return callback_(data, size);
}

} // namespace ubjson
