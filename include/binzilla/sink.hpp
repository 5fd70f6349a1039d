/**
 *  @brief  Byte sinks, the destinations a `binary_writer` serializes into.
 *  @file   sink.hpp
 *
 *  A sink accepts raw bytes at its current position and tracks that position with 64 bits,
 *  regardless of the platform's pointer width. Failures are reported with exceptions, which the
 *  writer never intercepts. Implementations:
 *
 *  - `memory_sink` - a growable in-memory byte array, like a memory stream.
 *  - `span_sink` - a fixed caller-provided buffer, failing with `std::ios_base::failure` when full.
 *  - `stream_sink` - forwards to a borrowed `std::ostream`.
 *  - `counting_sink` - discards the bytes and only moves the position.
 */
#ifndef BINZILLA_SINK_HPP_
#define BINZILLA_SINK_HPP_

#include "types.hpp"

#include <cstring>   // `std::memcpy`
#include <ios>       // `std::ios_base::failure`
#include <limits>    // `std::numeric_limits`
#include <ostream>   // `std::ostream`
#include <stdexcept> // `std::out_of_range`
#include <vector>    // `std::vector`

namespace binzilla {

/**
 *  @brief  Abstract destination for serialized bytes.
 *          Writes land at the current `position`, overwriting existing content and extending the sink as needed.
 */
class sink {
  public:
    virtual ~sink() = default;

    /** @brief Appends @p length bytes at the current position and advances it. */
    virtual void write(void const *data, size_t length) = 0;

    /** @brief Current write position, in bytes from the start. */
    virtual u64_t position() const = 0;

    /** @brief Moves the write position. */
    virtual void seek(u64_t position) = 0;

    /** @brief Pushes buffered bytes further down. A no-op for unbuffered sinks. */
    virtual void flush() {}
};

/**
 *  @brief  Growable in-memory sink. Seeking past the end is allowed, the gap is zero-filled on the next write.
 */
class memory_sink : public sink {
    std::vector<byte_t> bytes_;
    u64_t position_ = 0;

  public:
    memory_sink() = default;

    void write(void const *data, size_t length) override {
        if (!length) return;
        if (position_ > std::numeric_limits<size_t>::max() - length)
            throw std::length_error("memory_sink can't address that many bytes");
        size_t const offset = static_cast<size_t>(position_);
        if (bytes_.size() < offset + length) bytes_.resize(offset + length);
        std::memcpy(bytes_.data() + offset, data, length);
        position_ += length;
    }

    u64_t position() const override { return position_; }
    void seek(u64_t position) override { position_ = position; }

    std::vector<byte_t> const &bytes() const noexcept { return bytes_; }
    size_t size() const noexcept { return bytes_.size(); }

    /** @brief Drops the content and rewinds to the start, keeping the allocated capacity. */
    void clear() noexcept { bytes_.clear(), position_ = 0; }
};

/**
 *  @brief  Sink over a caller-provided fixed-size buffer.
 *          A write that doesn't fit is rejected as a whole, without touching the buffer.
 */
class span_sink : public sink {
    byte_t *data_ = nullptr;
    size_t capacity_ = 0;
    size_t position_ = 0;
    size_t length_ = 0;

  public:
    span_sink(void *data, size_t capacity) noexcept : data_(static_cast<byte_t *>(data)), capacity_(capacity) {}

    void write(void const *data, size_t length) override {
        if (length > capacity_ - position_) throw std::ios_base::failure("span_sink is out of space");
        if (length) std::memcpy(data_ + position_, data, length);
        position_ += length;
        if (position_ > length_) length_ = position_;
    }

    u64_t position() const override { return position_; }

    void seek(u64_t position) override {
        if (position > capacity_) throw std::out_of_range("span_sink::seek");
        position_ = static_cast<size_t>(position);
    }

    /** @brief Furthest position ever written to. */
    size_t length() const noexcept { return length_; }
    size_t capacity() const noexcept { return capacity_; }
};

/**
 *  @brief  Forwards to a borrowed output stream, that must outlive the sink.
 *          Stream failures are reported as `std::ios_base::failure`.
 */
class stream_sink : public sink {
    std::ostream *stream_ = nullptr;

    void check(char const *what) const {
        if (!*stream_) throw std::ios_base::failure(what);
    }

  public:
    explicit stream_sink(std::ostream &stream) noexcept : stream_(&stream) {}

    void write(void const *data, size_t length) override {
        // Streams take signed sizes, so large buffers are passed in pieces.
        constexpr size_t max_piece = static_cast<size_t>(std::numeric_limits<std::streamsize>::max());
        char const *bytes = static_cast<char const *>(data);
        while (length) {
            size_t const piece = length < max_piece ? length : max_piece;
            stream_->write(bytes, static_cast<std::streamsize>(piece));
            check("stream_sink::write");
            bytes += piece, length -= piece;
        }
    }

    u64_t position() const override {
        std::streamoff const offset = stream_->tellp();
        if (offset < 0) throw std::ios_base::failure("stream_sink::position");
        return static_cast<u64_t>(offset);
    }

    void seek(u64_t position) override {
        stream_->seekp(static_cast<std::streamoff>(position));
        check("stream_sink::seek");
    }

    void flush() override {
        stream_->flush();
        check("stream_sink::flush");
    }
};

/**
 *  @brief  Discards everything, only tracking the position and the furthest byte written.
 *          Useful to measure serialized sizes, or to benchmark the encoders without memory traffic.
 */
class counting_sink : public sink {
    u64_t position_ = 0;
    u64_t length_ = 0;
    u64_t writes_ = 0;

  public:
    void write(void const *, size_t length) override {
        position_ += length, ++writes_;
        if (position_ > length_) length_ = position_;
    }

    u64_t position() const override { return position_; }
    void seek(u64_t position) override { position_ = position; }

    u64_t length() const noexcept { return length_; }
    /** @brief Number of `write` calls received, including empty ones. */
    u64_t writes() const noexcept { return writes_; }
};

} // namespace binzilla

#endif // BINZILLA_SINK_HPP_
