/**
 * @file test_edge_cases.cpp
 * @brief Edge case tests: boundaries, quirks and unusual handler results.
 */

#include "test_helpers.hpp"

#include <catch2/catch.hpp>

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

using namespace ubjson;
using test::bytes;
using test::Bytes;
using test::concat;
using test::text;

namespace {
struct Token {};

/// Expected header for a container of n elements
Bytes header(std::uint8_t short_marker, std::uint8_t long_marker, std::size_t n) {
    if (n < 255) {
        return bytes({short_marker, static_cast<int>(n)});
    }
    return bytes({long_marker, static_cast<int>((n >> 24) & 0xFF), static_cast<int>((n >> 16) & 0xFF),
                  static_cast<int>((n >> 8) & 0xFF), static_cast<int>(n & 0xFF)});
}
} // namespace

TEST_CASE("Deep nesting", "[edge]") {
    constexpr int depth = 10000;

    Value value(1);
    for (int i = 0; i < depth; ++i) {
        Array wrapper;
        wrapper.push_back(std::move(value));
        value = Value(std::move(wrapper));
    }

    Bytes output = test::encoded(value);
    REQUIRE(output.size() == 2 * depth + 2);
    REQUIRE(output[0] == 'a');
    REQUIRE(output[1] == 0x01);
    REQUIRE(output[output.size() - 2] == 'B');
    REQUIRE(output.back() == 0x01);
}

TEST_CASE("Infinity collapses to null", "[edge][float]") {
    double inf = std::numeric_limits<double>::infinity();

    REQUIRE(test::encoded(Value(inf)) == test::encoded(Value()));
    REQUIRE(test::encoded(Value(-inf)) == bytes({'Z'}));
    REQUIRE(test::encoded(make_array({inf, nullptr})) == bytes({'a', 0x02, 'Z', 'Z'}));
}

TEST_CASE("Noop inside containers", "[edge]") {
    SECTION("counts as an element") {
        REQUIRE(test::encoded(make_array({1, NOOP, 2})) ==
                bytes({'a', 0x03, 'B', 0x01, 'N', 'B', 0x02}));
    }

    SECTION("as an object value") {
        REQUIRE(test::encoded(make_object({{"k", NOOP}})) ==
                bytes({'o', 0x01, 's', 0x01, 'k', 'N'}));
    }

    SECTION("as an object key it is rejected") {
        Bytes output;
        REQUIRE(default_encoder().encode(make_object({{NOOP, 1}}), output) == Error::InvalidKey);
    }
}

TEST_CASE("Huge integer inside an object", "[edge][integer]") {
    Value value = make_object({{"big", std::numeric_limits<std::uint64_t>::max()}});
    REQUIRE(test::encoded(value) ==
            concat({bytes({'o', 0x01, 's', 0x03}), text("big"), bytes({'h', 20}),
                    text("18446744073709551615")}));
}

TEST_CASE("Integer boundaries pick the narrowest width", "[edge][integer]") {
    REQUIRE(test::encoded(Value(-128)) == bytes({'B', 0x80}));
    REQUIRE(test::encoded(Value(-129)) == bytes({'i', 0xFF, 0x7F}));
    REQUIRE(test::encoded(Value(32768)) == bytes({'I', 0x00, 0x00, 0x80, 0x00}));
    REQUIRE(test::encoded(Value(std::numeric_limits<std::int64_t>::min())) ==
            bytes({'L', 0x80, 0, 0, 0, 0, 0, 0, 0}));
}

TEST_CASE("Keys are not dispatched through handlers", "[edge][handlers]") {
    EncoderOptions options;
    options.handlers[typeid(std::string)] = [](const Value&) { return Value(0); };
    options.default_handler = [](const Value&) { return Value("fallback"); };
    Encoder encoder(options);

    SECTION("string key encodes as a plain string") {
        Bytes output;
        REQUIRE(encoder.encode(make_object({{"k", "v"}}), output) == Error::Ok);
        REQUIRE(output == bytes({'o', 0x01, 's', 0x01, 'k', 'B', 0x00}));
    }

    SECTION("non-string key is not adapted") {
        Bytes output;
        REQUIRE(encoder.encode(make_object({{Value(Opaque(Token{})), 1}}), output) ==
                Error::InvalidKey);
    }
}

TEST_CASE("Unusual handler results", "[edge][handlers]") {
    SECTION("opaque result is unsupported") {
        EncoderOptions options;
        options.handlers[typeid(Token)] = [](const Value& value) { return value; };
        Encoder encoder(options);

        Bytes output;
        std::string detail;
        REQUIRE(encoder.encode(Value(Opaque(Token{})), output, &detail) ==
                Error::UnsupportedType);
        REQUIRE(detail.rfind("Unable to encode opaque ", 0) == 0);
    }

    SECTION("noop result") {
        EncoderOptions options;
        options.handlers[typeid(Token)] = [](const Value&) { return Value(NOOP); };
        Encoder encoder(options);

        Bytes output;
        REQUIRE(encoder.encode(make_array({Value(Opaque(Token{}))}), output) == Error::Ok);
        REQUIRE(output == bytes({'a', 0x01, 'N'}));
    }

    SECTION("handler result is not re-dispatched") {
        EncoderOptions options;
        options.handlers[typeid(Token)] = [](const Value&) { return Value(true); };
        options.handlers[typeid(bool)] = [](const Value&) { return Value("bool"); };
        Encoder encoder(options);

        Bytes output;
        REQUIRE(encoder.encode(Value(Opaque(Token{})), output) == Error::Ok);
        REQUIRE(output == bytes({'T'}));
    }

    SECTION("handler returning a lazy array") {
        EncoderOptions options;
        options.handlers[typeid(Token)] = [](const Value&) {
            return Value(UnsizedArray::range(0, 3));
        };
        Encoder encoder(options);

        Bytes output;
        REQUIRE(encoder.encode(Value(Opaque(Token{})), output) == Error::Ok);
        REQUIRE(output == bytes({'a', 0xFF, 'B', 0x00, 'B', 0x01, 'B', 0x02, 'E'}));
    }
}

TEST_CASE("Container header matches element count", "[edge][length]") {
    for (std::size_t n : {0U, 1U, 254U, 255U, 256U}) {
        Array items(n, Value(true));
        Bytes array_bytes = test::encoded(Value(std::move(items)));
        REQUIRE(array_bytes == concat({header('a', 'A', n), Bytes(n, 'T')}));

        Object members;
        for (std::size_t i = 0; i < n; ++i) {
            members.emplace_back(Value(std::string(1, 'k')), Value(nullptr));
        }
        Bytes object_bytes = test::encoded(Value(std::move(members)));
        Bytes body;
        for (std::size_t i = 0; i < n; ++i) {
            body.insert(body.end(), {'s', 0x01, 'k', 'Z'});
        }
        REQUIRE(object_bytes == concat({header('o', 'O', n), body}));
    }
}

TEST_CASE("String length boundary", "[edge][string]") {
    std::string s254(254, 'x');
    std::string s255(255, 'x');

    REQUIRE(test::encoded(Value(s254)) == concat({bytes({'s', 254}), text(s254)}));
    REQUIRE(test::encoded(Value(s255)) ==
            concat({bytes({'S', 0x00, 0x00, 0x00, 0xFF}), text(s255)}));
    REQUIRE(test::encoded(Value("")) == bytes({'s', 0x00}));
    REQUIRE(test::encoded(Value('x')) == bytes({'s', 0x01, 'x'}));
    REQUIRE(test::encoded(make_array({'a', std::int8_t{'a'}})) ==
            bytes({'a', 0x02, 's', 0x01, 'a', 'B', 'a'}));
}

TEST_CASE("Failed encode keeps earlier output", "[edge][error]") {
    Bytes output{'x'};
    Value value = make_array({1, Value(Opaque(Token{}))});

    REQUIRE(default_encoder().encode(value, output) == Error::UnsupportedType);
    REQUIRE(output == bytes({'x', 'a', 0x02, 'B', 0x01}));
}
