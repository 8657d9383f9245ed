/**
 * @file test_primitives.cpp
 * @brief Unit tests for scalar encoders.
 */

#include <ubjson/bytebuffer.hpp>
#include <ubjson/primitives.hpp>

#include <catch2/catch.hpp>

#include "test_helpers.hpp"

#include <cmath>
#include <limits>
#include <string>

using namespace ubjson;
using test::bytes;
using test::concat;
using test::text;

namespace {
test::Bytes int_bytes(std::int64_t value) {
    ByteBuffer bb;
    encode_int64(bb, value);
    return bb.bytes();
}

test::Bytes float_bytes(double value) {
    ByteBuffer bb;
    REQUIRE(encode_float(bb, value) == Error::Ok);
    return bb.bytes();
}
} // namespace

TEST_CASE("Null, noop and bool markers", "[primitives]") {
    ByteBuffer bb;

    SECTION("null") {
        encode_null(bb);
        REQUIRE(bb.bytes() == text("Z"));
    }

    SECTION("noop") {
        encode_noop(bb);
        REQUIRE(bb.bytes() == text("N"));
    }

    SECTION("false and true") {
        encode_bool(bb, false);
        encode_bool(bb, true);
        REQUIRE(bb.bytes() == text("FT"));
    }
}

TEST_CASE("Integer range classification", "[primitives][integer]") {
    REQUIRE(is_int8(127));
    REQUIRE(is_int8(-128));
    REQUIRE_FALSE(is_int8(128));
    REQUIRE_FALSE(is_int8(-129));

    REQUIRE(is_int16(32767));
    REQUIRE(is_int16(-32768));
    REQUIRE_FALSE(is_int16(32768));

    REQUIRE(is_int32(2147483647));
    REQUIRE(is_int32(-2147483648LL));
    REQUIRE_FALSE(is_int32(2147483648LL));
    REQUIRE_FALSE(is_int32(-2147483649LL));
}

TEST_CASE("Integer picks the narrowest marker", "[primitives][integer]") {
    SECTION("int8") {
        REQUIRE(int_bytes(5) == bytes({'B', 0x05}));
        REQUIRE(int_bytes(127) == bytes({'B', 0x7F}));
        REQUIRE(int_bytes(-128) == bytes({'B', 0x80}));
        REQUIRE(int_bytes(0) == bytes({'B', 0x00}));
    }

    SECTION("int16") {
        REQUIRE(int_bytes(128) == bytes({'i', 0x00, 0x80}));
        REQUIRE(int_bytes(-129) == bytes({'i', 0xFF, 0x7F}));
        REQUIRE(int_bytes(30000) == bytes({'i', 0x75, 0x30}));
        REQUIRE(int_bytes(32767) == bytes({'i', 0x7F, 0xFF}));
    }

    SECTION("int32") {
        REQUIRE(int_bytes(32768) == bytes({'I', 0x00, 0x00, 0x80, 0x00}));
        REQUIRE(int_bytes(-32769) == bytes({'I', 0xFF, 0xFF, 0x7F, 0xFF}));
        REQUIRE(int_bytes(2147483647) == bytes({'I', 0x7F, 0xFF, 0xFF, 0xFF}));
    }

    SECTION("int64") {
        REQUIRE(int_bytes(2147483648LL) ==
                bytes({'L', 0x00, 0x00, 0x00, 0x00, 0x80, 0x00, 0x00, 0x00}));
        REQUIRE(int_bytes(std::numeric_limits<std::int64_t>::min()) ==
                bytes({'L', 0x80, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}));
        REQUIRE(int_bytes(std::numeric_limits<std::int64_t>::max()) ==
                bytes({'L', 0x7F, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF}));
    }
}

TEST_CASE("Integer beyond int64 becomes a huge number", "[primitives][integer]") {
    ByteBuffer bb;

    SECTION("just above INT64_MAX") {
        REQUIRE(encode_integer(bb, *Integer::parse("9223372036854775808")) == Error::Ok);
        REQUIRE(bb.bytes() == concat({bytes({'h', 19}), text("9223372036854775808")}));
    }

    SECTION("just below INT64_MIN") {
        REQUIRE(encode_integer(bb, *Integer::parse("-9223372036854775809")) == Error::Ok);
        REQUIRE(bb.bytes() == concat({bytes({'h', 20}), text("-9223372036854775809")}));
    }

    SECTION("uint64 max") {
        REQUIRE(encode_integer(bb, Integer(std::numeric_limits<std::uint64_t>::max())) ==
                Error::Ok);
        REQUIRE(bb.bytes() == concat({bytes({'h', 20}), text("18446744073709551615")}));
    }

    SECTION("fitting values use fixed width") {
        REQUIRE(encode_integer(bb, Integer(-1)) == Error::Ok);
        REQUIRE(bb.bytes() == bytes({'B', 0xFF}));
    }
}

TEST_CASE("Float magnitude classes", "[primitives][float]") {
    SECTION("float32 range") {
        REQUIRE(float_bytes(1.5) == concat({text("d"), test::float32_be(1.5F)}));
        REQUIRE(float_bytes(-1.5) == concat({text("d"), test::float32_be(-1.5F)}));
        REQUIRE(float_bytes(3.4e38) ==
                concat({text("d"), test::float32_be(static_cast<float>(3.4e38))}));
        REQUIRE(float_bytes(1.18e-38) ==
                concat({text("d"), test::float32_be(static_cast<float>(1.18e-38))}));
    }

    SECTION("float64 range") {
        REQUIRE(float_bytes(3.5e38) == concat({text("D"), test::float64_be(3.5e38)}));
        REQUIRE(float_bytes(1e-38) == concat({text("D"), test::float64_be(1e-38)}));
        REQUIRE(float_bytes(1e300) == concat({text("D"), test::float64_be(1e300)}));
        REQUIRE(float_bytes(-1e-300) == concat({text("D"), test::float64_be(-1e-300)}));
        double largest = std::numeric_limits<double>::max();
        REQUIRE(float_bytes(largest) == concat({text("D"), test::float64_be(largest)}));
    }

    SECTION("infinity encodes as null") {
        REQUIRE(float_bytes(std::numeric_limits<double>::infinity()) == text("Z"));
        REQUIRE(float_bytes(-std::numeric_limits<double>::infinity()) == text("Z"));
    }

    SECTION("zero, subnormal and NaN fall through to huge") {
        REQUIRE(float_bytes(0.0) == concat({bytes({'h', 3}), text("0.0")}));
        REQUIRE(float_bytes(1e-320) == concat({bytes({'h', 6}), text("1e-320")}));
        REQUIRE(float_bytes(std::nan("")) == concat({bytes({'h', 3}), text("nan")}));
    }

    SECTION("classification predicates") {
        REQUIRE(is_float32(1.0));
        REQUIRE_FALSE(is_float32(0.0));
        REQUIRE_FALSE(is_float32(3.5e38));
        REQUIRE(is_float64(3.5e38));
        REQUIRE_FALSE(is_float64(std::numeric_limits<double>::infinity()));
        REQUIRE_FALSE(is_float64(1e-320));
        REQUIRE(is_infinity(-std::numeric_limits<double>::infinity()));
    }
}

TEST_CASE("String short and long forms", "[primitives][string]") {
    ByteBuffer bb;

    SECTION("short string") {
        REQUIRE(encode_string(bb, "hi") == Error::Ok);
        REQUIRE(bb.bytes() == concat({bytes({'s', 0x02}), text("hi")}));
    }

    SECTION("empty string") {
        REQUIRE(encode_string(bb, "") == Error::Ok);
        REQUIRE(bb.bytes() == bytes({'s', 0x00}));
    }

    SECTION("254 bytes is still short") {
        std::string s(254, 'x');
        REQUIRE(encode_string(bb, s) == Error::Ok);
        REQUIRE(bb.size() == 2 + 254);
        REQUIRE(bb.data()[0] == 's');
        REQUIRE(bb.data()[1] == 254);
    }

    SECTION("255 bytes switches to long") {
        std::string s(255, 'x');
        REQUIRE(encode_string(bb, s) == Error::Ok);
        REQUIRE(bb.size() == 5 + 255);
        REQUIRE(test::Bytes(bb.bytes().begin(), bb.bytes().begin() + 5) ==
                bytes({'S', 0x00, 0x00, 0x00, 0xFF}));
    }

    SECTION("length counts UTF-8 bytes, not characters") {
        REQUIRE(encode_string(bb, "\xC3\xA9") == Error::Ok);
        REQUIRE(bb.bytes() == bytes({'s', 0x02, 0xC3, 0xA9}));
    }
}

TEST_CASE("Huge number short and long forms", "[primitives][huge]") {
    ByteBuffer bb;

    SECTION("short") {
        REQUIRE(encode_huge(bb, "12345") == Error::Ok);
        REQUIRE(bb.bytes() == concat({bytes({'h', 0x05}), text("12345")}));
    }

    SECTION("long") {
        std::string digits(300, '9');
        REQUIRE(encode_huge(bb, digits) == Error::Ok);
        REQUIRE(test::Bytes(bb.bytes().begin(), bb.bytes().begin() + 5) ==
                bytes({'H', 0x00, 0x00, 0x01, 0x2C}));
        REQUIRE(bb.size() == 5 + 300);
    }
}

TEST_CASE("Length header", "[primitives][length]") {
    ByteBuffer bb;

    SECTION("short threshold") {
        REQUIRE(encode_length(bb, 'a', 'A', 254) == Error::Ok);
        REQUIRE(bb.bytes() == bytes({'a', 0xFE}));
    }

    SECTION("long threshold") {
        REQUIRE(encode_length(bb, 'a', 'A', 255) == Error::Ok);
        REQUIRE(bb.bytes() == bytes({'A', 0x00, 0x00, 0x00, 0xFF}));
    }

    SECTION("largest long length") {
        REQUIRE(encode_length(bb, 'o', 'O', 0xFFFFFFFFULL) == Error::Ok);
        REQUIRE(bb.bytes() == bytes({'O', 0xFF, 0xFF, 0xFF, 0xFF}));
    }

    SECTION("beyond 32 bits is rejected without output") {
        REQUIRE(encode_length(bb, 'a', 'A', 0x100000000ULL) == Error::InvalidArg);
        REQUIRE(bb.empty());
    }
}
