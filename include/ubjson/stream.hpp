/**
 * @file stream.hpp
 * @brief Pull-based chunk stream driving value and container encoding.
 *
 * ChunkStream walks the value graph with an explicit frame stack instead
 * of recursion. Every call to next() resumes where the previous call
 * stopped and yields exactly one chunk:
 * - a scalar encoding (marker + payload)
 * - a container header ('a'/'A'/'o'/'O' + count, or 'a'/'o' + 0xFF)
 * - an object key
 * - the end marker 'E' closing an unsized container
 *
 * Unsized producers are pulled only when the stream needs their next
 * element, so an infinite producer yields an infinite stream.
 */

#ifndef UBJSON_STREAM_HPP
#define UBJSON_STREAM_HPP

#include "bytebuffer.hpp"
#include "error.hpp"
#include "registry.hpp"
#include "value.hpp"

#include <cstddef>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

namespace ubjson {

/// One unit of encoded output
using Chunk = std::vector<std::uint8_t>;

/**
 * @brief Lazy sequence of encoded chunks for one value.
 *
 * The stream owns everything it creates while encoding (produced elements,
 * handler results). A root passed by const reference must outlive it.
 */
class ChunkStream {
public:
    /**
     * @brief Stream over a caller-owned value.
     */
    ChunkStream(std::shared_ptr<const HandlerRegistry> registry, const Value& root);

    /**
     * @brief Stream over a value it takes ownership of.
     */
    ChunkStream(std::shared_ptr<const HandlerRegistry> registry, Value&& root);

    /**
     * @brief Produce the next chunk.
     *
     * An exception thrown by a handler or producer propagates unchanged and
     * leaves the stream done with error() == Error::InvalidArg.
     *
     * @param[out] chunk Receives the chunk bytes (previous contents discarded)
     * @return true if a chunk was produced, false when finished or failed
     */
    bool next(Chunk& chunk);

    /// True once the stream is exhausted or has failed
    [[nodiscard]] bool done() const noexcept { return frames_.empty(); }

    /// Error::Ok unless encoding failed
    [[nodiscard]] Error error() const noexcept { return error_; }

    /// Description of the failure, naming the offending value
    [[nodiscard]] const std::string& error_detail() const noexcept { return error_detail_; }

    /// Total bytes yielded so far
    [[nodiscard]] std::size_t bytes_produced() const noexcept { return bytes_produced_; }

    /**
     * @brief Single-pass input iterator over chunks.
     *
     * Iteration stops at the end of the stream or at the first error;
     * check error() afterwards.
     */
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Chunk;
        using difference_type = std::ptrdiff_t;
        using pointer = const Chunk*;
        using reference = const Chunk&;

        iterator() noexcept = default;
        explicit iterator(ChunkStream* stream) : stream_(stream) { advance(); }

        reference operator*() const noexcept { return chunk_; }
        pointer operator->() const noexcept { return &chunk_; }

        iterator& operator++() {
            advance();
            return *this;
        }

        bool operator==(const iterator& other) const noexcept { return stream_ == other.stream_; }
        bool operator!=(const iterator& other) const noexcept { return stream_ != other.stream_; }

    private:
        void advance() {
            if (stream_ != nullptr && !stream_->next(chunk_)) {
                stream_ = nullptr;
            }
        }

        ChunkStream* stream_ = nullptr;
        Chunk chunk_;
    };

    iterator begin() { return iterator(this); }
    iterator end() noexcept { return iterator(); }

private:
    /// Value reference plus whatever keeps it alive
    struct ValueRef {
        const Value* value = nullptr;
        std::shared_ptr<const void> owner;
    };

    enum class FrameKind { Pending, SizedArray, UnsizedArray, SizedObject, UnsizedObject };

    struct Frame {
        FrameKind kind;
        ValueRef ref;
        std::size_t index = 0;                ///< Next element of a sized container
        bool expect_value = false;            ///< Object key written, value pending
        std::shared_ptr<const Member> entry;  ///< Current unsized object entry
    };

    Error step();
    Error start_value(ValueRef ref);
    Error encode_native(ValueRef ref);
    Error step_sized_array(Frame& frame);
    Error step_unsized_array(Frame& frame);
    Error step_sized_object(Frame& frame);
    Error step_unsized_object(Frame& frame);
    Error encode_key(const Value& key);
    Error fail(Error error, std::string detail);

    std::shared_ptr<const HandlerRegistry> registry_;
    std::vector<Frame> frames_;
    ByteBuffer buffer_;
    Error error_ = Error::Ok;
    std::string error_detail_;
    std::size_t bytes_produced_ = 0;
};

} // namespace ubjson

#endif // UBJSON_STREAM_HPP
