/**
 * @file sink.hpp
 * @brief Destinations for streamed chunks.
 *
 * A sink receives each chunk as soon as it is produced. The caller owns
 * the underlying destination and is responsible for flushing or closing
 * it. Nothing already written is rolled back when encoding fails later.
 */

#ifndef UBJSON_SINK_HPP
#define UBJSON_SINK_HPP

#include "error.hpp"

#include <cstdio>
#include <functional>
#include <ostream>
#include <utility>
#include <vector>

namespace ubjson {

/**
 * @brief Abstract chunk destination.
 */
class Sink {
public:
    virtual ~Sink() = default;

    /**
     * @brief Write one chunk.
     *
     * @param data Chunk bytes
     * @param size Number of bytes
     * @return Error::Ok on success, Error::SinkWrite if the destination failed
     */
    virtual Error write(const std::uint8_t* data, std::size_t size) = 0;
};

/**
 * @brief Appends chunks to a byte vector.
 */
class VectorSink final : public Sink {
public:
    explicit VectorSink(std::vector<std::uint8_t>& output) noexcept : output_(output) {}

    Error write(const std::uint8_t* data, std::size_t size) override;

private:
    std::vector<std::uint8_t>& output_;
};

/**
 * @brief Writes chunks to a std::ostream (open in binary mode).
 */
class OStreamSink final : public Sink {
public:
    explicit OStreamSink(std::ostream& stream) noexcept : stream_(stream) {}

    Error write(const std::uint8_t* data, std::size_t size) override;

private:
    std::ostream& stream_;
};

/**
 * @brief Writes chunks to a C stdio stream.
 */
class FileSink final : public Sink {
public:
    explicit FileSink(std::FILE* file) noexcept : file_(file) {}

    Error write(const std::uint8_t* data, std::size_t size) override;

private:
    std::FILE* file_;
};

/**
 * @brief Forwards chunks to a caller-supplied function.
 */
class CallbackSink final : public Sink {
public:
    using Callback = std::function<Error(const std::uint8_t*, std::size_t)>;

    explicit CallbackSink(Callback callback) : callback_(std::move(callback)) {}

    Error write(const std::uint8_t* data, std::size_t size) override;

private:
    Callback callback_;
};

} // namespace ubjson

#endif // UBJSON_SINK_HPP
