/**
 * @file bytebuffer.hpp
 * @brief Growable byte buffer for building encoded chunks.
 *
 * Multi-byte values are appended big-endian (network order) as the wire
 * format requires:
 * - First byte appended is the most significant byte
 * - Signed values are written as their two's complement bit pattern
 */

#ifndef UBJSON_BYTEBUFFER_HPP
#define UBJSON_BYTEBUFFER_HPP

#include "config.hpp"

#include <cstring>
#include <string_view>
#include <type_traits>
#include <vector>

namespace ubjson {

/**
 * @brief Append-only byte buffer with heap storage.
 */
class ByteBuffer {
public:
    ByteBuffer() = default;

    /**
     * @brief Construct with reserved capacity.
     * @param capacity Bytes to reserve up front
     */
    explicit ByteBuffer(std::size_t capacity) { data_.reserve(capacity); }

    /**
     * @brief Clear buffer to empty state (keeps capacity).
     */
    void clear() noexcept { data_.clear(); }

    [[nodiscard]] std::size_t size() const noexcept { return data_.size(); }
    [[nodiscard]] bool empty() const noexcept { return data_.empty(); }
    [[nodiscard]] const std::uint8_t* data() const noexcept { return data_.data(); }

    /**
     * @brief Append a single byte.
     * @param byte Byte value
     */
    void append_byte(std::uint8_t byte) { data_.push_back(byte); }

    /**
     * @brief Append raw bytes.
     *
     * @param bytes Source bytes
     * @param count Number of bytes to append
     */
    void append_bytes(const std::uint8_t* bytes, std::size_t count) {
        if (count == 0) {
            return;
        }
        data_.insert(data_.end(), bytes, bytes + count);
    }

    /**
     * @brief Append the bytes of a text view unchanged.
     * @param text Source text (already UTF-8)
     */
    void append_text(std::string_view text) {
        append_bytes(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
    }

    /**
     * @brief Append an integer in big-endian order.
     *
     * @tparam T Integral type; sizeof(T) bytes are written
     * @param value Value to append
     */
    template <typename T>
    void append_be(T value) {
        static_assert(std::is_integral_v<T>, "append_be requires an integral type");
        using U = std::make_unsigned_t<T>;
        U bits = static_cast<U>(value);
        for (std::size_t shift = sizeof(T); shift > 0; --shift) {
            data_.push_back(static_cast<std::uint8_t>(bits >> ((shift - 1) * 8U)));
        }
    }

    /**
     * @brief Append an IEEE-754 single precision value in big-endian order.
     * @param value Value to append
     */
    void append_float32(float value) {
        std::uint32_t bits;
        std::memcpy(&bits, &value, sizeof(bits));
        append_be(bits);
    }

    /**
     * @brief Append an IEEE-754 double precision value in big-endian order.
     * @param value Value to append
     */
    void append_float64(double value) {
        std::uint64_t bits;
        std::memcpy(&bits, &value, sizeof(bits));
        append_be(bits);
    }

    /**
     * @brief Copy buffer contents to a byte array.
     *
     * @param bytes Destination byte array
     * @param max_bytes Maximum bytes to write
     * @return Number of bytes written
     */
    std::size_t to_bytes(std::uint8_t* bytes, std::size_t max_bytes) const noexcept {
        std::size_t num_bytes = data_.size() < max_bytes ? data_.size() : max_bytes;
        if (num_bytes > 0) {
            std::memcpy(bytes, data_.data(), num_bytes);
        }
        return num_bytes;
    }

    /**
     * @brief Move the contents out, leaving the buffer empty.
     * @return Buffered bytes
     */
    std::vector<std::uint8_t> release() noexcept {
        std::vector<std::uint8_t> out;
        out.swap(data_);
        return out;
    }

    /**
     * @brief Exchange storage with a byte vector.
     * @param other Vector receiving the buffered bytes
     */
    void swap(std::vector<std::uint8_t>& other) noexcept { data_.swap(other); }

    [[nodiscard]] const std::vector<std::uint8_t>& bytes() const noexcept { return data_; }

private:
    std::vector<std::uint8_t> data_;
};

} // namespace ubjson

#endif // UBJSON_BYTEBUFFER_HPP
