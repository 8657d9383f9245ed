/**
 * @file primitives.cpp
 * @brief Scalar encoder implementations.
 */

#include <ubjson/primitives.hpp>

namespace ubjson {

Error encode_length(ByteBuffer& output, std::uint8_t short_marker, std::uint8_t long_marker,
                    std::uint64_t length) {
    if (length < SHORT_LENGTH_LIMIT) {
        output.append_byte(short_marker);
        output.append_byte(static_cast<std::uint8_t>(length));
        return Error::Ok;
    }

    if (length > MAX_LONG_LENGTH) [[unlikely]] {
        return Error::InvalidArg;
    }

    output.append_byte(long_marker);
    output.append_be(static_cast<std::uint32_t>(length));
    return Error::Ok;
}

void encode_null(ByteBuffer& output) {
    output.append_byte(marker::NULL_);
}

void encode_noop(ByteBuffer& output) {
    output.append_byte(marker::NOOP);
}

void encode_bool(ByteBuffer& output, bool value) {
    output.append_byte(value ? marker::TRUE_ : marker::FALSE_);
}

void encode_int64(ByteBuffer& output, std::int64_t value) {
    if (is_int8(value)) {
        output.append_byte(marker::INT8);
        output.append_be(static_cast<std::int8_t>(value));
    } else if (is_int16(value)) {
        output.append_byte(marker::INT16);
        output.append_be(static_cast<std::int16_t>(value));
    } else if (is_int32(value)) {
        output.append_byte(marker::INT32);
        output.append_be(static_cast<std::int32_t>(value));
    } else {
        output.append_byte(marker::INT64);
        output.append_be(value);
    }
}

Error encode_integer(ByteBuffer& output, const Integer& value) {
    if (value.fits_int64()) [[likely]] {
        encode_int64(output, value.as_int64());
        return Error::Ok;
    }
    return encode_huge(output, value.to_string());
}

Error encode_float(ByteBuffer& output, double value) {
    if (is_float32(value)) {
        output.append_byte(marker::FLOAT32);
        output.append_float32(static_cast<float>(value));
        return Error::Ok;
    }
    if (is_float64(value)) {
        output.append_byte(marker::FLOAT64);
        output.append_float64(value);
        return Error::Ok;
    }
    if (is_infinity(value)) {
        encode_null(output);
        return Error::Ok;
    }
    return encode_huge(output, HugeNumber::from_double(value).text);
}

Error encode_string(ByteBuffer& output, std::string_view text) {
    auto result = encode_length(output, marker::STRING_SHORT, marker::STRING_LONG, text.size());
    if (result != Error::Ok) {
        return result;
    }
    output.append_text(text);
    return Error::Ok;
}

Error encode_huge(ByteBuffer& output, std::string_view decimal_text) {
    auto result =
        encode_length(output, marker::HUGE_SHORT, marker::HUGE_LONG, decimal_text.size());
    if (result != Error::Ok) {
        return result;
    }
    output.append_text(decimal_text);
    return Error::Ok;
}

} // namespace ubjson
