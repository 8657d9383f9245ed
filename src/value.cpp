/**
 * @file value.cpp
 * @brief Value model implementation.
 */

#include <ubjson/value.hpp>

#include <charconv>
#include <cmath>
#include <system_error>

namespace ubjson {

std::optional<Integer> Integer::parse(std::string_view text) {
    bool negative = false;
    if (!text.empty() && (text.front() == '-' || text.front() == '+')) {
        negative = text.front() == '-';
        text.remove_prefix(1);
    }
    if (text.empty()) {
        return std::nullopt;
    }
    for (char c : text) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
    }

    // Canonical form: no leading zeros, no "-0"
    std::size_t first_nonzero = text.find_first_not_of('0');
    if (first_nonzero == std::string_view::npos) {
        return Integer(0);
    }
    std::string canonical;
    canonical.reserve(text.size() - first_nonzero + 1);
    if (negative) {
        canonical.push_back('-');
    }
    canonical.append(text.substr(first_nonzero));

    std::int64_t small = 0;
    auto [ptr, ec] = std::from_chars(canonical.data(), canonical.data() + canonical.size(), small);
    if (ec == std::errc{} && ptr == canonical.data() + canonical.size()) {
        return Integer(small);
    }

    Integer out;
    out.big_ = std::move(canonical);
    return out;
}

std::string Integer::to_string() const {
    if (big_.empty()) {
        return std::to_string(small_);
    }
    return big_;
}

HugeNumber HugeNumber::from_double(double value) {
    if (std::isnan(value)) {
        return HugeNumber("nan");
    }

    char buffer[64];
    auto [ptr, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
    std::string text(buffer, ec == std::errc{} ? ptr : buffer);

    if (text.find_first_of(".eEn") == std::string::npos) {
        text += ".0";
    }
    return HugeNumber(std::move(text));
}

UnsizedArray::UnsizedArray(Producer producer)
    : producer_(std::make_shared<Producer>(std::move(producer))) {}

UnsizedArray UnsizedArray::range(std::int64_t start, std::int64_t stop, std::int64_t step) {
    return UnsizedArray([current = start, stop, step]() mutable -> std::optional<Value> {
        bool more = step > 0 ? current < stop : (step < 0 && current > stop);
        if (!more) {
            return std::nullopt;
        }
        Value item(current);
        // Stop instead of wrapping when the next step would overflow
        if (__builtin_add_overflow(current, step, &current)) {
            current = stop;
        }
        return item;
    });
}

std::optional<Value> UnsizedArray::next() const {
    if (!producer_ || !*producer_) {
        return std::nullopt;
    }
    return (*producer_)();
}

UnsizedObject::UnsizedObject(Producer producer)
    : producer_(std::make_shared<Producer>(std::move(producer))) {}

std::optional<Member> UnsizedObject::next() const {
    if (!producer_ || !*producer_) {
        return std::nullopt;
    }
    return (*producer_)();
}

const char* type_name(Type type) noexcept {
    switch (type) {
    case Type::Noop:
        return "noop";
    case Type::Null:
        return "null";
    case Type::Bool:
        return "bool";
    case Type::Integer:
        return "integer";
    case Type::Float:
        return "float";
    case Type::HugeNumber:
        return "huge number";
    case Type::String:
        return "string";
    case Type::Array:
        return "array";
    case Type::UnsizedArray:
        return "unsized array";
    case Type::Object:
        return "object";
    case Type::UnsizedObject:
        return "unsized object";
    case Type::Opaque:
        return "opaque";
    default:
        return "unknown";
    }
}

std::type_index Value::type_key() const noexcept {
    if (const auto* opaque = std::get_if<Opaque>(&storage_)) {
        return opaque->type();
    }
    return std::visit([](const auto& held) { return std::type_index(typeid(held)); }, storage_);
}

std::string Value::describe() const {
    switch (type()) {
    case Type::Noop:
        return "noop";
    case Type::Null:
        return "null";
    case Type::Bool:
        return std::get<bool>(storage_) ? "true" : "false";
    case Type::Integer:
        return std::get<Integer>(storage_).to_string();
    case Type::Float:
        return HugeNumber::from_double(std::get<double>(storage_)).text;
    case Type::HugeNumber:
        return std::get<HugeNumber>(storage_).text;
    case Type::String: {
        const auto& text = std::get<std::string>(storage_);
        if (text.size() > 32) {
            return "\"" + text.substr(0, 32) + "...\"";
        }
        return "\"" + text + "\"";
    }
    case Type::Array:
        return "array of " + std::to_string(std::get<Array>(storage_).size());
    case Type::Object:
        return "object of " + std::to_string(std::get<Object>(storage_).size());
    case Type::Opaque:
        return std::string("opaque ") + std::get<Opaque>(storage_).type_name();
    default:
        return type_name(type());
    }
}

} // namespace ubjson
