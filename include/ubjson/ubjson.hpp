/**
 * @file ubjson.hpp
 * @brief High-level UBJSON encoding API.
 *
 * Single include for the whole library plus free encode() helpers that use
 * a shared encoder with native handlers only.
 */

#ifndef UBJSON_HPP
#define UBJSON_HPP

#include "bytebuffer.hpp"
#include "config.hpp"
#include "encoder.hpp"
#include "error.hpp"
#include "primitives.hpp"
#include "registry.hpp"
#include "sink.hpp"
#include "stream.hpp"
#include "value.hpp"

namespace ubjson {

/**
 * @brief Shared encoder with native handlers only.
 */
inline const Encoder& default_encoder() {
    static const Encoder encoder;
    return encoder;
}

/**
 * @brief Encode a value with the default encoder.
 *
 * @param value Value to encode
 * @param[out] output Encoded bytes are appended here
 * @return Error::Ok on success
 */
inline Error encode(const Value& value, std::vector<std::uint8_t>& output) {
    return default_encoder().encode(value, output);
}

/**
 * @brief Stream a value into a sink with the default encoder.
 * @return Error::Ok on success, or the first sink error
 */
inline Error encode(const Value& value, Sink& sink) {
    return default_encoder().encode(value, sink);
}

#if !UBJSON_NO_EXCEPTIONS
/**
 * @brief Encode a value with the default encoder.
 * @throws EncodeException subclass matching the failure
 */
inline std::vector<std::uint8_t> encode(const Value& value) {
    return default_encoder().encode(value);
}
#endif

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "1.0.0";
}

} // namespace ubjson

#endif // UBJSON_HPP
