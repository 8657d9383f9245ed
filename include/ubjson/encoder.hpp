/**
 * @file encoder.hpp
 * @brief Public UBJSON encoder: buffer, sink and chunk-stream output.
 *
 * | Value alternative | UBJSON type                         |
 * |-------------------|-------------------------------------|
 * | Noop              | noop (N)                            |
 * | Null              | null (Z)                            |
 * | bool              | false / true (F / T)                |
 * | Integer           | B / i / I / L, or huge beyond int64 |
 * | double            | d / D, Z for infinity, else huge    |
 * | HugeNumber        | huge (h / H)                        |
 * | std::string, char | string (s / S)                      |
 * | Array             | sized array (a / A)                 |
 * | UnsizedArray      | unsized array (a 0xFF ... E)        |
 * | Object            | sized object (o / O)                |
 * | UnsizedObject     | unsized object (o 0xFF ... E)       |
 * | Opaque            | whatever its handler adapts it to   |
 *
 * An Encoder is immutable after construction and can be reused for any
 * number of sequential encodes.
 */

#ifndef UBJSON_ENCODER_HPP
#define UBJSON_ENCODER_HPP

#include "config.hpp"
#include "error.hpp"
#include "registry.hpp"
#include "sink.hpp"
#include "stream.hpp"
#include "value.hpp"

#include <memory>
#include <string>
#include <vector>

namespace ubjson {

/**
 * @brief Construction-time encoder extensions.
 */
struct EncoderOptions {
    Handler default_handler;               ///< Fallback for otherwise unsupported values
    TypeHandlers handlers;                 ///< Exact type overrides
    std::vector<Capability> capabilities;  ///< Category handlers, first match wins
};

/**
 * @brief Value to UBJSON encoder.
 */
class Encoder {
public:
    /**
     * @brief Encoder with native handlers only.
     */
    Encoder();

    /**
     * @brief Encoder with caller extensions merged into its registry.
     */
    explicit Encoder(EncoderOptions options);

    /**
     * @brief Lazy chunk sequence for a caller-owned value.
     *
     * The value must outlive the returned stream.
     */
    [[nodiscard]] ChunkStream iterencode(const Value& value) const;

    /**
     * @brief Lazy chunk sequence owning its value.
     */
    [[nodiscard]] ChunkStream iterencode(Value&& value) const;

    /**
     * @brief Encode to a byte vector.
     *
     * @param value Value to encode
     * @param[out] output Encoded bytes are appended here
     * @param[out] detail Optional failure description
     * @return Error::Ok on success
     */
    Error encode(const Value& value, std::vector<std::uint8_t>& output,
                 std::string* detail = nullptr) const;

    /**
     * @brief Encode chunk by chunk into a sink.
     *
     * The first sink error aborts encoding and is returned unchanged.
     *
     * @param value Value to encode
     * @param sink Destination
     * @param[out] detail Optional failure description
     * @return Error::Ok on success
     */
    Error encode(const Value& value, Sink& sink, std::string* detail = nullptr) const;

#if !UBJSON_NO_EXCEPTIONS
    /**
     * @brief Encode to a new byte vector.
     * @throws EncodeException subclass matching the failure
     */
    [[nodiscard]] std::vector<std::uint8_t> encode(const Value& value) const;

    /**
     * @brief Encode into a sink.
     * @throws EncodeException subclass matching the failure
     */
    void encode_to(const Value& value, Sink& sink) const;
#endif

    [[nodiscard]] const HandlerRegistry& registry() const noexcept { return *registry_; }

private:
    std::shared_ptr<const HandlerRegistry> registry_;
};

} // namespace ubjson

#endif // UBJSON_ENCODER_HPP
