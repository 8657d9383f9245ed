/**
 * @file error.hpp
 * @brief UBJSON encoder error handling.
 *
 * Provides both error-code-based and exception-based error handling.
 * The library internals only return codes; the throwing API in encoder.hpp
 * maps codes onto the exceptions below.
 */

#ifndef UBJSON_ERROR_HPP
#define UBJSON_ERROR_HPP

#include "config.hpp"

#if !UBJSON_NO_EXCEPTIONS
#include <stdexcept>
#include <string>
#endif

namespace ubjson {

/**
 * @brief Error codes for error-code-based error handling.
 */
enum class Error {
    Ok = 0,               ///< Success
    InvalidArg = -1,      ///< Invalid argument (e.g. length beyond 32 bits)
    UnsupportedType = -2, ///< No handler resolves the value
    InvalidKey = -3,      ///< Object key is not a string
    SinkWrite = -4        ///< Destination rejected a chunk
};

/**
 * @brief Get error message for error code.
 * @param error Error code
 * @return Human-readable error message
 */
inline const char* error_string(Error error) noexcept {
    switch (error) {
    case Error::Ok:
        return "Success";
    case Error::InvalidArg:
        return "Invalid argument";
    case Error::UnsupportedType:
        return "Unsupported type";
    case Error::InvalidKey:
        return "Object key should be a string";
    case Error::SinkWrite:
        return "Sink write failed";
    default:
        return "Unknown error";
    }
}

#if !UBJSON_NO_EXCEPTIONS

/**
 * @brief Base exception for UBJSON encoding errors.
 */
class EncodeException : public std::runtime_error {
public:
    explicit EncodeException(const std::string& message, Error code = Error::InvalidArg)
        : std::runtime_error(message), error_code_(code) {}

    Error code() const noexcept {
        return error_code_;
    }

private:
    Error error_code_;
};

/**
 * @brief Exception for invalid arguments.
 */
class InvalidArgumentException : public EncodeException {
public:
    explicit InvalidArgumentException(const std::string& message)
        : EncodeException(message, Error::InvalidArg) {}
};

/**
 * @brief Exception for values no handler can encode.
 */
class UnsupportedTypeException : public EncodeException {
public:
    explicit UnsupportedTypeException(const std::string& message)
        : EncodeException(message, Error::UnsupportedType) {}
};

/**
 * @brief Exception for non-string object keys.
 */
class InvalidKeyException : public EncodeException {
public:
    explicit InvalidKeyException(const std::string& message)
        : EncodeException(message, Error::InvalidKey) {}
};

/**
 * @brief Exception for failed sink writes.
 */
class SinkWriteException : public EncodeException {
public:
    explicit SinkWriteException(const std::string& message)
        : EncodeException(message, Error::SinkWrite) {}
};

/**
 * @brief Throw the exception matching an error code.
 *
 * @param error Error code (must not be Error::Ok)
 * @param detail Message carried by the exception
 */
[[noreturn]] inline void throw_error(Error error, const std::string& detail) {
    std::string message = detail.empty() ? std::string(error_string(error)) : detail;
    switch (error) {
    case Error::UnsupportedType:
        throw UnsupportedTypeException(message);
    case Error::InvalidKey:
        throw InvalidKeyException(message);
    case Error::SinkWrite:
        throw SinkWriteException(message);
    case Error::InvalidArg:
        throw InvalidArgumentException(message);
    default:
        throw EncodeException(message, error);
    }
}

#endif // !UBJSON_NO_EXCEPTIONS

} // namespace ubjson

#endif // UBJSON_ERROR_HPP
