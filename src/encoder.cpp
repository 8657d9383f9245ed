/**
 * @file encoder.cpp
 * @brief Public encoder implementation.
 */

#include <ubjson/encoder.hpp>

#include <utility>

namespace ubjson {

Encoder::Encoder() : registry_(std::make_shared<const HandlerRegistry>()) {}

Encoder::Encoder(EncoderOptions options)
    : registry_(std::make_shared<const HandlerRegistry>(std::move(options.default_handler),
                                                        std::move(options.handlers),
                                                        std::move(options.capabilities))) {}

ChunkStream Encoder::iterencode(const Value& value) const {
    return ChunkStream(registry_, value);
}

ChunkStream Encoder::iterencode(Value&& value) const {
    return ChunkStream(registry_, std::move(value));
}

Error Encoder::encode(const Value& value, std::vector<std::uint8_t>& output,
                      std::string* detail) const {
    VectorSink sink(output);
    return encode(value, sink, detail);
}

Error Encoder::encode(const Value& value, Sink& sink, std::string* detail) const {
    ChunkStream stream(registry_, value);
    Chunk chunk;

    while (stream.next(chunk)) {
        auto result = sink.write(chunk.data(), chunk.size());
        if (result != Error::Ok) {
            if (detail != nullptr) {
                *detail = std::string(error_string(result)) + " after " +
                          std::to_string(stream.bytes_produced() - chunk.size()) + " bytes";
            }
            return result;
        }
    }

    if (stream.error() != Error::Ok && detail != nullptr) {
        *detail = stream.error_detail();
    }
    return stream.error();
}

#if !UBJSON_NO_EXCEPTIONS

std::vector<std::uint8_t> Encoder::encode(const Value& value) const {
    std::vector<std::uint8_t> output;
    VectorSink sink(output);
    encode_to(value, sink);
    return output;
}

void Encoder::encode_to(const Value& value, Sink& sink) const {
    std::string detail;
    auto result = encode(value, sink, &detail);
    if (result != Error::Ok) {
        throw_error(result, detail);
    }
}

#endif // !UBJSON_NO_EXCEPTIONS

} // namespace ubjson
