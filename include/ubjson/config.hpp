/**
 * @file config.hpp
 * @brief UBJSON encoder compile-time configuration and wire constants.
 *
 * All thresholds used to pick a marker are named here once so that
 * encoders never re-derive them per call.
 */

#ifndef UBJSON_CONFIG_HPP
#define UBJSON_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <limits>

namespace ubjson {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup markers Wire Markers
 * @{
 */
namespace marker {
inline constexpr std::uint8_t NULL_ = 'Z';
inline constexpr std::uint8_t NOOP = 'N';
inline constexpr std::uint8_t FALSE_ = 'F';
inline constexpr std::uint8_t TRUE_ = 'T';
inline constexpr std::uint8_t INT8 = 'B';
inline constexpr std::uint8_t INT16 = 'i';
inline constexpr std::uint8_t INT32 = 'I';
inline constexpr std::uint8_t INT64 = 'L';
inline constexpr std::uint8_t FLOAT32 = 'd';
inline constexpr std::uint8_t FLOAT64 = 'D';
inline constexpr std::uint8_t HUGE_SHORT = 'h';
inline constexpr std::uint8_t HUGE_LONG = 'H';
inline constexpr std::uint8_t STRING_SHORT = 's';
inline constexpr std::uint8_t STRING_LONG = 'S';
inline constexpr std::uint8_t ARRAY_SHORT = 'a';
inline constexpr std::uint8_t ARRAY_LONG = 'A';
inline constexpr std::uint8_t OBJECT_SHORT = 'o';
inline constexpr std::uint8_t OBJECT_LONG = 'O';
inline constexpr std::uint8_t END = 'E';

/// Placeholder written instead of a count for unsized containers
inline constexpr std::uint8_t UNKNOWN_LENGTH = 0xFFU;
} // namespace marker
/** @} */

/**
 * @defgroup config Configuration Constants
 * @{
 */

/// Lengths and counts below this use the short (1-byte) form
inline constexpr std::size_t SHORT_LENGTH_LIMIT = 255U;

/// Largest length representable by the long (4-byte) form
inline constexpr std::uint64_t MAX_LONG_LENGTH = std::numeric_limits<std::uint32_t>::max();

inline constexpr std::int64_t INT8_LOW = -(1LL << 7);
inline constexpr std::int64_t INT8_HIGH = (1LL << 7) - 1;
inline constexpr std::int64_t INT16_LOW = -(1LL << 15);
inline constexpr std::int64_t INT16_HIGH = (1LL << 15) - 1;
inline constexpr std::int64_t INT32_LOW = -(1LL << 31);
inline constexpr std::int64_t INT32_HIGH = (1LL << 31) - 1;

/// float32 magnitude range (inclusive both ends)
inline constexpr double FLOAT32_MIN_MAGNITUDE = 1.18e-38;
inline constexpr double FLOAT32_MAX_MAGNITUDE = 3.4e38;

/// float64 magnitude range (upper bound exclusive: 1.8e308 rounds to infinity)
inline constexpr double FLOAT64_MIN_MAGNITUDE = 2.23e-308;
inline constexpr double FLOAT64_MAX_MAGNITUDE = std::numeric_limits<double>::infinity();

/** @} */

/**
 * @defgroup exceptions Exception Configuration
 *
 * Define UBJSON_NO_EXCEPTIONS=1 to build without the throwing API.
 * @{
 */
#ifndef UBJSON_NO_EXCEPTIONS
#define UBJSON_NO_EXCEPTIONS 0
#endif
/** @} */

} // namespace ubjson

#endif // UBJSON_CONFIG_HPP
