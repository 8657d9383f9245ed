/**
 * @file value.hpp
 * @brief Dynamically-typed value graph accepted by the encoder.
 *
 * Value is a closed tagged union. Every alternative except Opaque maps
 * directly onto a wire type; Opaque carries a foreign host object that the
 * handler registry must adapt before it can be encoded.
 *
 * @par Lazy containers
 * UnsizedArray and UnsizedObject wrap producers that are pulled one item at
 * a time while encoding. A producer signals exhaustion by returning
 * std::nullopt and may never do so. Copies of a lazy container share the
 * producer and therefore its position.
 */

#ifndef UBJSON_VALUE_HPP
#define UBJSON_VALUE_HPP

#include "config.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <variant>
#include <vector>

namespace ubjson {

class Value;

/// Sentinel emitting the no-op marker
struct Noop {};

/// JSON null
struct Null {};

inline constexpr Noop NOOP{};
inline constexpr Null NULL_VALUE{};

/**
 * @brief Integer of arbitrary precision.
 *
 * Stores an int64_t when the value fits, otherwise its canonical decimal
 * text (no leading zeros, '-' only for negatives).
 */
class Integer {
public:
    Integer() noexcept : small_(0) {}

    template <typename T,
              std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
    Integer(T value) : small_(0) {
        if constexpr (std::is_signed_v<T> || sizeof(T) < sizeof(std::int64_t)) {
            small_ = static_cast<std::int64_t>(value);
        } else {
            if (value <= static_cast<T>(std::numeric_limits<std::int64_t>::max())) {
                small_ = static_cast<std::int64_t>(value);
            } else {
                big_ = std::to_string(value);
            }
        }
    }

    /**
     * @brief Parse decimal text.
     *
     * Accepts an optional sign followed by one or more ASCII digits.
     *
     * @param text Decimal text
     * @return Parsed integer, or std::nullopt if text is not an integer
     */
    static std::optional<Integer> parse(std::string_view text);

    /// True when the value lies in [-2^63, 2^63 - 1]
    [[nodiscard]] bool fits_int64() const noexcept { return big_.empty(); }

    /// Value as int64_t (only meaningful when fits_int64())
    [[nodiscard]] std::int64_t as_int64() const noexcept { return small_; }

    /// Canonical decimal text
    [[nodiscard]] std::string to_string() const;

private:
    std::int64_t small_;
    std::string big_;
};

/**
 * @brief Number carried as exact decimal text.
 *
 * Used for magnitudes or precisions no fixed-width wire type can hold.
 */
struct HugeNumber {
    std::string text;

    HugeNumber() = default;
    explicit HugeNumber(std::string decimal_text) : text(std::move(decimal_text)) {}

    /**
     * @brief Shortest round-trip decimal text of a double.
     *
     * Integral renderings get a ".0" suffix ("0.0", "-5.0"); NaN renders
     * as "nan".
     */
    static HugeNumber from_double(double value);
};

/**
 * @brief Foreign host value awaiting adaptation.
 *
 * The held object is immutable and shared between copies.
 */
class Opaque {
public:
    template <typename T, std::enable_if_t<!std::is_same_v<std::decay_t<T>, Opaque>, int> = 0>
    explicit Opaque(T value)
        : type_(typeid(T)), holder_(std::make_shared<const T>(std::move(value))) {}

    [[nodiscard]] std::type_index type() const noexcept { return type_; }
    [[nodiscard]] const char* type_name() const noexcept { return type_.name(); }

    /**
     * @brief Access the held object when its type is exactly T.
     * @return Pointer to the object, or nullptr on type mismatch
     */
    template <typename T>
    [[nodiscard]] const T* get_if() const noexcept {
        if (type_ != std::type_index(typeid(T))) {
            return nullptr;
        }
        return static_cast<const T*>(holder_.get());
    }

private:
    std::type_index type_;
    std::shared_ptr<const void> holder_;
};

using Array = std::vector<Value>;
using Member = std::pair<Value, Value>;
using Object = std::vector<Member>;

/**
 * @brief Lazy sequence of values with unknown length.
 */
class UnsizedArray {
public:
    using Producer = std::function<std::optional<Value>()>;

    explicit UnsizedArray(Producer producer);

    /// Wrap a producer returning std::nullopt when exhausted
    static UnsizedArray generate(Producer producer) { return UnsizedArray(std::move(producer)); }

    /**
     * @brief Lazily walk an iterator range.
     *
     * The range must stay valid until encoding finishes.
     */
    template <typename It>
    static UnsizedArray over(It first, It last);

    /**
     * @brief Lazily walk an iterator range through a projection.
     *
     * e.g. project a map's entries onto their keys or values.
     */
    template <typename It, typename Projection>
    static UnsizedArray over(It first, It last, Projection project);

    /**
     * @brief Integers start, start+step, ... stopping before stop.
     *
     * A zero step yields nothing.
     */
    static UnsizedArray range(std::int64_t start, std::int64_t stop, std::int64_t step = 1);

    /// Pull the next element
    std::optional<Value> next() const;

private:
    std::shared_ptr<Producer> producer_;
};

/**
 * @brief Lazy sequence of key/value pairs with unknown length.
 */
class UnsizedObject {
public:
    using Producer = std::function<std::optional<Member>()>;

    explicit UnsizedObject(Producer producer);

    static UnsizedObject generate(Producer producer) { return UnsizedObject(std::move(producer)); }

    /**
     * @brief Lazily walk a range of pair-like entries (e.g. a std::map).
     */
    template <typename It>
    static UnsizedObject over(It first, It last);

    /// Pull the next entry
    std::optional<Member> next() const;

private:
    std::shared_ptr<Producer> producer_;
};

/**
 * @brief Alternative held by a Value, in variant order.
 */
enum class Type {
    Noop,
    Null,
    Bool,
    Integer,
    Float,
    HugeNumber,
    String,
    Array,
    UnsizedArray,
    Object,
    UnsizedObject,
    Opaque
};

/**
 * @brief Get a short name for a value type.
 */
const char* type_name(Type type) noexcept;

/**
 * @brief Dynamically-typed value.
 */
class Value {
public:
    using Storage = std::variant<Noop, Null, bool, Integer, double, HugeNumber, std::string, Array,
                                 UnsizedArray, Object, UnsizedObject, Opaque>;

    Value() noexcept : storage_(std::in_place_type<Null>) {}
    Value(Noop) noexcept : storage_(std::in_place_type<Noop>) {}
    Value(Null) noexcept : storage_(std::in_place_type<Null>) {}
    Value(std::nullptr_t) noexcept : storage_(std::in_place_type<Null>) {}
    Value(bool value) noexcept : storage_(std::in_place_type<bool>, value) {}

    template <typename T,
              std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool> &&
                                   !std::is_same_v<T, char> && !std::is_same_v<T, char8_t>,
                               int> = 0>
    Value(T value) : storage_(std::in_place_type<Integer>, value) {}

    /// A character is a one-character string; use signed/unsigned char for bytes
    Value(char value) : storage_(std::in_place_type<std::string>, std::size_t{1}, value) {}
    Value(char8_t value)
        : storage_(std::in_place_type<std::string>, std::size_t{1}, static_cast<char>(value)) {}

    Value(Integer value) : storage_(std::in_place_type<Integer>, std::move(value)) {}
    Value(float value) noexcept : storage_(std::in_place_type<double>, value) {}
    Value(double value) noexcept : storage_(std::in_place_type<double>, value) {}
    Value(HugeNumber value) : storage_(std::in_place_type<HugeNumber>, std::move(value)) {}
    Value(const char* value) : storage_(std::in_place_type<std::string>, value) {}
    Value(std::string value) : storage_(std::in_place_type<std::string>, std::move(value)) {}
    Value(std::string_view value) : storage_(std::in_place_type<std::string>, value) {}
    Value(Array value) : storage_(std::in_place_type<Array>, std::move(value)) {}
    Value(UnsizedArray value)
        : storage_(std::in_place_type<UnsizedArray>, std::move(value)) {}
    Value(Object value) : storage_(std::in_place_type<Object>, std::move(value)) {}
    Value(UnsizedObject value)
        : storage_(std::in_place_type<UnsizedObject>, std::move(value)) {}
    Value(Opaque value) : storage_(std::in_place_type<Opaque>, std::move(value)) {}

    [[nodiscard]] Type type() const noexcept { return static_cast<Type>(storage_.index()); }

    [[nodiscard]] bool is_noop() const noexcept { return type() == Type::Noop; }
    [[nodiscard]] bool is_string() const noexcept { return type() == Type::String; }

    /**
     * @brief Type identifier used for exact registry lookup.
     *
     * The held alternative's type, or the host type for Opaque values.
     */
    [[nodiscard]] std::type_index type_key() const noexcept;

    template <typename T>
    [[nodiscard]] const T* get_if() const noexcept {
        return std::get_if<T>(&storage_);
    }

    [[nodiscard]] const Storage& storage() const noexcept { return storage_; }

    /**
     * @brief Short human-readable rendering for diagnostics.
     *
     * Scalars render their value, containers their kind and size.
     */
    [[nodiscard]] std::string describe() const;

private:
    Storage storage_;
};

/**
 * @brief Build a sized array from a brace list.
 */
inline Value make_array(std::initializer_list<Value> items) {
    return Value(Array(items));
}

/**
 * @brief Build a sized array from any iterable container.
 */
template <typename Container>
Value make_array(const Container& items) {
    Array out;
    out.reserve(static_cast<std::size_t>(std::distance(std::begin(items), std::end(items))));
    for (const auto& item : items) {
        out.emplace_back(item);
    }
    return Value(std::move(out));
}

/**
 * @brief Build a sized object from a brace list of key/value pairs.
 */
inline Value make_object(std::initializer_list<Member> members) {
    return Value(Object(members));
}

/**
 * @brief Build a sized object from any map-like container.
 *
 * Keys are converted as-is; a non-string key is rejected at encode time.
 */
template <typename Map>
Value make_object(const Map& members) {
    Object out;
    out.reserve(static_cast<std::size_t>(std::distance(std::begin(members), std::end(members))));
    for (const auto& [key, value] : members) {
        out.emplace_back(Value(key), Value(value));
    }
    return Value(std::move(out));
}

template <typename It>
UnsizedArray UnsizedArray::over(It first, It last) {
    return UnsizedArray([first, last]() mutable -> std::optional<Value> {
        if (first == last) {
            return std::nullopt;
        }
        Value item(*first);
        ++first;
        return item;
    });
}

template <typename It, typename Projection>
UnsizedArray UnsizedArray::over(It first, It last, Projection project) {
    return UnsizedArray([first, last, project]() mutable -> std::optional<Value> {
        if (first == last) {
            return std::nullopt;
        }
        Value item(project(*first));
        ++first;
        return item;
    });
}

template <typename It>
UnsizedObject UnsizedObject::over(It first, It last) {
    return UnsizedObject([first, last]() mutable -> std::optional<Member> {
        if (first == last) {
            return std::nullopt;
        }
        Member entry(Value(first->first), Value(first->second));
        ++first;
        return entry;
    });
}

} // namespace ubjson

#endif // UBJSON_VALUE_HPP
