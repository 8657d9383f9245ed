/**
 * @file primitives.hpp
 * @brief Scalar encoders: marker selection plus fixed payload.
 *
 * Marker selection rules:
 * - Integer: narrowest of B (int8), i (int16), I (int32), L (int64);
 *   anything wider becomes a huge number
 * - Float: d when 1.18e-38 <= |v| <= 3.4e38, D when 2.23e-308 <= |v| < 1.8e308,
 *   Z for +/-infinity, huge number otherwise (zero, subnormals, NaN)
 * - String / huge number: short form (s / h, 1-byte length) below 255 bytes,
 *   long form (S / H, 4-byte length) from 255 bytes on
 *
 * Infinity collapsing onto the null marker loses its sign and its
 * distinctness from null; it is kept for wire compatibility.
 */

#ifndef UBJSON_PRIMITIVES_HPP
#define UBJSON_PRIMITIVES_HPP

#include "bytebuffer.hpp"
#include "config.hpp"
#include "error.hpp"
#include "value.hpp"

#include <cmath>
#include <string_view>

namespace ubjson {

/**
 * @defgroup ranges Range Classification
 * @{
 */
constexpr bool is_int8(std::int64_t value) noexcept {
    return value >= INT8_LOW && value <= INT8_HIGH;
}

constexpr bool is_int16(std::int64_t value) noexcept {
    return value >= INT16_LOW && value <= INT16_HIGH;
}

constexpr bool is_int32(std::int64_t value) noexcept {
    return value >= INT32_LOW && value <= INT32_HIGH;
}

inline bool is_float32(double value) noexcept {
    double magnitude = std::fabs(value);
    return magnitude >= FLOAT32_MIN_MAGNITUDE && magnitude <= FLOAT32_MAX_MAGNITUDE;
}

inline bool is_float64(double value) noexcept {
    double magnitude = std::fabs(value);
    return magnitude >= FLOAT64_MIN_MAGNITUDE && magnitude < FLOAT64_MAX_MAGNITUDE;
}

inline bool is_infinity(double value) noexcept {
    return std::isinf(value);
}
/** @} */

/**
 * @brief Write a marker followed by a short (u8) or long (u32) length.
 *
 * @param output Destination buffer
 * @param short_marker Marker used when length < SHORT_LENGTH_LIMIT
 * @param long_marker Marker used otherwise
 * @param length Byte length or element count
 * @return Error::Ok on success, Error::InvalidArg if length exceeds 32 bits
 */
Error encode_length(ByteBuffer& output, std::uint8_t short_marker, std::uint8_t long_marker,
                    std::uint64_t length);

/// Null marker 'Z'
void encode_null(ByteBuffer& output);

/// No-op marker 'N'
void encode_noop(ByteBuffer& output);

/// 'T' or 'F'
void encode_bool(ByteBuffer& output, bool value);

/**
 * @brief Encode a fixed-width integer with the narrowest marker.
 */
void encode_int64(ByteBuffer& output, std::int64_t value);

/**
 * @brief Encode an arbitrary-precision integer.
 *
 * Values outside int64 range are written as huge numbers.
 *
 * @return Error::Ok on success
 */
Error encode_integer(ByteBuffer& output, const Integer& value);

/**
 * @brief Encode a double by magnitude class.
 * @return Error::Ok on success
 */
Error encode_float(ByteBuffer& output, double value);

/**
 * @brief Encode UTF-8 text with 's' / 'S'.
 * @return Error::Ok on success, Error::InvalidArg if longer than 2^32-1 bytes
 */
Error encode_string(ByteBuffer& output, std::string_view text);

/**
 * @brief Encode decimal text with 'h' / 'H'.
 * @return Error::Ok on success, Error::InvalidArg if longer than 2^32-1 bytes
 */
Error encode_huge(ByteBuffer& output, std::string_view decimal_text);

} // namespace ubjson

#endif // UBJSON_PRIMITIVES_HPP
