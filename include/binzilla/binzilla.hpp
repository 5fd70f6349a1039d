/**
 *  @brief  BinZilla C++ interface: an encoding-aware binary writer.
 *  @file   binzilla.hpp
 *
 *  The `binary_writer` serializes primitives and UTF-16 text into a `sink`. Text goes through one of two paths,
 *  chosen once at construction by `encoding::is_fast_utf8`:
 *
 *  - the @b fast path transcodes UTF-16 to UTF-8 directly, with an AVX2 backend where available;
 *  - the @b generic path runs the resumable `bz_encoder_t` of the configured codec.
 *
 *  Every text write picks one of three buffer strategies, by the worst-case output size of the call:
 *
 *  - @b inline - an automatic-storage buffer of `BZ_INLINE_CAPACITY` bytes;
 *  - @b pooled - one `pooled_buffer` of up to `BZ_POOLED_CAPACITY` bytes;
 *  - @b chunked - a single pooled chunk, refilled in a loop, for inputs of any length.
 *
 *  All three produce the same bytes. Sizes are computed with overflow checks in `size_t` and positions are
 *  reported in 64 bits, so writes longer than 2 GB are accounted exactly.
 *
 *  @code{.cpp}
 *      #include <binzilla/binzilla.hpp>
 *      namespace bz = binzilla;
 *
 *      auto output = std::make_unique<bz::memory_sink>();
 *      bz::memory_sink &bytes = *output;
 *      bz::binary_writer writer(std::move(output));
 *      writer.write(u"héllo"); // 06 68 C3 A9 6C 6C 6F
 *      writer.write(bz::i32_t(42));
 *  @endcode
 */
#ifndef BINZILLA_HPP_
#define BINZILLA_HPP_

#include "types.hpp"
#include "varint.h"
#include "utf16.h"
#include "encoding.h"
#include "pool.hpp"
#include "sink.hpp"

#include <cstring>     // `std::memcpy`
#include <memory>      // `std::unique_ptr`
#include <stdexcept>   // `std::invalid_argument`
#include <string>      // `std::u16string`
#include <string_view> // `std::u16string_view`
#include <utility>     // `std::move`

namespace binzilla {

/** @sa bz_codec_t */
enum class codec_t : int {
    utf8_k = bz_codec_utf8_k,
    utf16le_k = bz_codec_utf16le_k,
    utf16be_k = bz_codec_utf16be_k,
    ascii_k = bz_codec_ascii_k,
    latin1_k = bz_codec_latin1_k,
};

/** @sa bz_fallback_t */
enum class fallback_t : int {
    replace_k = bz_fallback_replace_k,
    throw_k = bz_fallback_throw_k,
};

/**
 *  @brief  Owning counterpart of `bz_encoding_t`: a codec, the code page it reports, and a fallback policy.
 *          Construction validates the replacement, so a usable `encoding` can't hold an unencodable one.
 */
class encoding {
    codec_t codec_ = codec_t::utf8_k;
    u32_t code_page_ = BZ_CODE_PAGE_UTF8;
    fallback_t fallback_ = fallback_t::replace_k;
    std::u16string replacement_;

  public:
    /**
     *  @param  replacement Substituted for every unencodable unit, ignored when the @p fallback is `throw_k`.
     *  @throw  `std::invalid_argument` if the codec can't encode the replacement itself.
     */
    encoding(codec_t codec, fallback_t fallback, std::u16string replacement = u"\uFFFD") noexcept(false)
        : codec_(codec), fallback_(fallback) {
        if (fallback == fallback_t::replace_k) replacement_ = std::move(replacement);
        bz_encoding_t descriptor;
        bz_encoding_init(&descriptor, static_cast<bz_codec_t>(codec), static_cast<bz_fallback_t>(fallback),
                         reinterpret_cast<unit_t const *>(replacement_.data()), replacement_.size());
        code_page_ = descriptor.code_page;
        raise(bz_encoding_validate(&descriptor));
    }

    /** @brief UTF-8, substituting U+FFFD for lone surrogates. */
    static encoding utf8() { return encoding(codec_t::utf8_k, fallback_t::replace_k); }
    /** @brief UTF-8, raising `encoding_error` on lone surrogates. */
    static encoding utf8_strict() { return encoding(codec_t::utf8_k, fallback_t::throw_k); }
    static encoding utf16le() { return encoding(codec_t::utf16le_k, fallback_t::replace_k); }
    static encoding utf16be() { return encoding(codec_t::utf16be_k, fallback_t::replace_k); }
    static encoding ascii() { return encoding(codec_t::ascii_k, fallback_t::replace_k, u"?"); }
    static encoding latin1() { return encoding(codec_t::latin1_k, fallback_t::replace_k, u"?"); }

    /**
     *  @brief  Same transform, reporting a different code page.
     *          Only the reported code page decides fast-path eligibility, not the codec.
     */
    encoding with_code_page(u32_t code_page) const {
        encoding result = *this;
        result.code_page_ = code_page;
        return result;
    }

    /** @brief Same codec and code page, substituting @p replacement for unencodable units. */
    encoding with_replacement(std::u16string replacement) const noexcept(false) {
        encoding result(codec_, fallback_t::replace_k, std::move(replacement));
        result.code_page_ = code_page_;
        return result;
    }

    /** @brief Same codec and code page, failing on unencodable units. */
    encoding with_throw() const {
        encoding result(codec_, fallback_t::throw_k);
        result.code_page_ = code_page_;
        return result;
    }

    codec_t codec() const noexcept { return codec_; }
    u32_t code_page() const noexcept { return code_page_; }
    fallback_t fallback() const noexcept { return fallback_; }
    std::u16string const &replacement() const noexcept { return replacement_; }

    /** @brief Non-owning C descriptor, valid while this object is alive and unmodified. */
    bz_encoding_t c_encoding() const & noexcept {
        bz_encoding_t descriptor;
        bz_encoding_init(&descriptor, static_cast<bz_codec_t>(codec_), static_cast<bz_fallback_t>(fallback_),
                         reinterpret_cast<unit_t const *>(replacement_.data()), replacement_.size());
        descriptor.code_page = code_page_;
        return descriptor;
    }

    /** @brief A descriptor of a temporary would point into its destroyed replacement. */
    bz_encoding_t c_encoding() const && = delete;

    /** @sa bz_encoding_is_fast_utf8 */
    bool is_fast_utf8() const noexcept {
        bz_encoding_t const descriptor = c_encoding();
        return bz_encoding_is_fast_utf8(&descriptor) == bz_true_k;
    }

    /**
     *  @brief  Worst-case number of bytes one UTF-16 unit can produce, replacements included.
     *          Any descriptor reporting the UTF-8 code page is transcoded as UTF-8, whatever its codec.
     */
    size_t max_bytes_per_unit() const noexcept {
        bz_encoding_t const descriptor = c_encoding();
        if (bz_encoding_is_fast_utf8(&descriptor)) return BZ_UTF8_MAX_BYTES_PER_UNIT;
        return bz_encoding_max_bytes_per_unit(&descriptor);
    }
};

/**
 *  @brief  Serializes primitives and length-prefixed text into an owned `sink`.
 *
 *  Multi-byte primitives are written in little-endian order. Strings are preceded by the 7-bit encoded
 *  count of their @b bytes in the target encoding, character buffers are written without a prefix.
 *
 *  A writer isn't thread-safe. After any exception the tail of the sink is unspecified, and the writer
 *  shouldn't be used further without seeking back to a known position.
 */
class binary_writer {

    std::unique_ptr<sink> output_;
    encoding encoding_;
    buffer_pool *pool_ = nullptr;
    bool fast_utf8_ = false;
    bz_utf8_fallback_t utf8_fallback_ = {};

  public:
    /** @brief Longest character buffer encoded through the inline buffer on the fast path. */
    static constexpr size_t inline_units_k = BZ_INLINE_CAPACITY / BZ_UTF8_MAX_BYTES_PER_UNIT;
    /** @brief Longest character buffer encoded through a single pooled buffer on the fast path. */
    static constexpr size_t pooled_units_k = BZ_POOLED_CAPACITY / BZ_UTF8_MAX_BYTES_PER_UNIT;

    /**
     *  @param  output Destination, owned by the writer until `release`.
     *  @param  text_encoding Encoding for characters and strings, classified once here.
     *  @param  pool Source of scratch buffers, must outlive the writer.
     *  @throw  `std::invalid_argument` if the @p output is null.
     */
    explicit binary_writer(std::unique_ptr<sink> output, encoding text_encoding = encoding::utf8(),
                           buffer_pool &pool = buffer_pool::shared()) noexcept(false)
        : output_(std::move(output)), encoding_(std::move(text_encoding)), pool_(&pool) {
        if (!output_) throw std::invalid_argument("binary_writer needs a sink");
        bz_encoding_t const descriptor = encoding_.c_encoding();
        fast_utf8_ = bz_encoding_is_fast_utf8(&descriptor) == bz_true_k;
        if (fast_utf8_) bz_encoding_utf8_fallback(&descriptor, &utf8_fallback_);
    }

    binary_writer(binary_writer &&) noexcept = default;
    binary_writer &operator=(binary_writer &&) noexcept = default;
    binary_writer(binary_writer const &) = delete;
    binary_writer &operator=(binary_writer const &) = delete;

    /** @brief Whether text is transcoded by the UTF-8 fast path. */
    bool uses_fast_utf8() const noexcept { return fast_utf8_; }
    encoding const &text_encoding() const noexcept { return encoding_; }

    /** @brief The current sink. Undefined after `release`. */
    sink &output() const noexcept { return *output_; }

    /** @brief Flushes and hands the sink back. The writer can't be used afterwards. */
    std::unique_ptr<sink> release() {
        output_->flush();
        return std::move(output_);
    }

    void flush() { output_->flush(); }
    u64_t position() const { return output_->position(); }
    void seek(u64_t position) { output_->seek(position); }

#pragma region Primitives

    void write(bool value) { write_byte_(value ? 1 : 0); }
    void write(u8_t value) { write_byte_(value); }
    void write(i8_t value) { write_byte_(static_cast<u8_t>(value)); }
    void write(u16_t value) { write_little_endian_(value); }
    void write(i16_t value) { write_little_endian_(static_cast<u16_t>(value)); }
    void write(u32_t value) { write_little_endian_(value); }
    void write(i32_t value) { write_little_endian_(static_cast<u32_t>(value)); }
    void write(u64_t value) { write_little_endian_(value); }
    void write(i64_t value) { write_little_endian_(static_cast<u64_t>(value)); }

    /** @brief IEEE-754 binary32, little-endian. */
    void write(f32_t value) {
        u32_t bits;
        std::memcpy(&bits, &value, sizeof(bits));
        write_little_endian_(bits);
    }

    /** @brief IEEE-754 binary64, little-endian. */
    void write(f64_t value) {
        u64_t bits;
        std::memcpy(&bits, &value, sizeof(bits));
        write_little_endian_(bits);
    }

    /** @brief Raw bytes, without a prefix. */
    void write_bytes(void const *data, size_t length) {
        if (!data && length) throw std::invalid_argument("binary_writer::write_bytes");
        if (length) output_->write(data, length);
    }

    /** @brief The 7-bit encoded form of @p value, from 1 to 5 bytes. */
    void write_7bit_encoded(u32_t value) { write_7bit_encoded64(value); }

    /** @brief The 7-bit encoded form of @p value, from 1 to 10 bytes. */
    void write_7bit_encoded64(u64_t value) {
        u8_t buffer[BZ_VARINT_MAX_LENGTH];
        size_t const length = bz_varint_encode(value, buffer);
        output_->write(buffer, length);
    }

#pragma endregion // Primitives

#pragma region Text

    /**
     *  @brief  Encodes a single UTF-16 unit, without a prefix.
     *          On the fast path a lone surrogate is handled by the fallback of the encoding.
     *  @throw  `encoding_error` if the unit is unencodable and the fallback is to fail.
     */
    void write(char16_t character) {
        unit_t const unit = static_cast<unit_t>(character);
        if (fast_utf8_) {
            u8_t buffer[BZ_UTF8_MAX_BYTES_PER_UNIT];
            size_t written;
            raise(bz_utf16_to_utf8(&unit, 1, &utf8_fallback_, buffer, &written));
            if (written) output_->write(buffer, written);
            return;
        }
        write_generic_(&unit, 1);
    }

    /**
     *  @brief  Encodes a buffer of UTF-16 units, without a prefix.
     *          The output is identical to encoding the whole buffer at once, whichever buffer strategy is used.
     *  @throw  `encoding_error`, `std::bad_alloc`, `std::length_error`, or whatever the sink throws.
     */
    void write_chars(char16_t const *characters, size_t count) {
        if (!count) return;
        if (!characters) throw std::invalid_argument("binary_writer::write_chars");
        unit_t const *units = reinterpret_cast<unit_t const *>(characters);
        if (!fast_utf8_) return write_generic_(units, count);

        if (count <= inline_units_k) {
            u8_t buffer[BZ_INLINE_CAPACITY];
            size_t written;
            raise(bz_utf16_to_utf8(units, count, &utf8_fallback_, buffer, &written));
            if (written) output_->write(buffer, written);
        }
        else if (count <= pooled_units_k) {
            pooled_buffer buffer = pool_->checkout(count * BZ_UTF8_MAX_BYTES_PER_UNIT);
            size_t written;
            raise(bz_utf16_to_utf8(units, count, &utf8_fallback_, buffer.data(), &written));
            if (written) output_->write(buffer.data(), written);
        }
        else { write_chunked_(units, count); }
    }

    void write_chars(std::u16string_view characters) { write_chars(characters.data(), characters.size()); }

    /**
     *  @brief  Writes the 7-bit encoded byte length of @p text, followed by the encoded bytes.
     *          An encoding failure is always detected before the prefix is written.
     *  @throw  `encoding_error`, `std::bad_alloc`, `std::length_error`, or whatever the sink throws.
     */
    void write(std::u16string_view text) {
        unit_t const *units = reinterpret_cast<unit_t const *>(text.data());
        size_t const count = text.size();

        // Short and medium strings are encoded first, and the prefix is placed right before the body,
        // so that both leave in a single sink write.
        if (fast_utf8_ && count <= inline_units_k) {
            u8_t buffer[BZ_VARINT_MAX_LENGTH + BZ_INLINE_CAPACITY];
            write_prefixed_utf8_(units, count, buffer);
            return;
        }
        if (fast_utf8_ && count <= pooled_units_k) {
            pooled_buffer buffer = pool_->checkout(BZ_VARINT_MAX_LENGTH + count * BZ_UTF8_MAX_BYTES_PER_UNIT);
            write_prefixed_utf8_(units, count, buffer.data());
            return;
        }

        // Longer strings are measured exactly, which also surfaces encoding failures, then streamed.
        size_t length;
        if (fast_utf8_) { raise(bz_utf16_to_utf8_length(units, count, &utf8_fallback_, &length)); }
        else {
            bz_encoding_t const descriptor = encoding_.c_encoding();
            raise(bz_encoding_measure(&descriptor, units, count, &length));
        }
        write_7bit_encoded64(length);
        if (!count) return;
        if (fast_utf8_) { write_chunked_(units, count); }
        else { write_generic_(units, count); }
    }

    /** @brief Null-terminated overload, preferred over the `bool` conversion of a pointer. */
    void write(char16_t const *text) {
        if (!text) throw std::invalid_argument("binary_writer::write");
        write(std::u16string_view(text));
    }

    void write(std::u16string const &text) { write(std::u16string_view(text)); }

#pragma endregion // Text

  private:
    void write_byte_(u8_t value) { output_->write(&value, 1); }

    template <typename unsigned_type_>
    void write_little_endian_(unsigned_type_ value) {
        u8_t bytes[sizeof(unsigned_type_)];
        for (size_t i = 0; i != sizeof(unsigned_type_); ++i) bytes[i] = static_cast<u8_t>(value >> (i * 8));
        output_->write(bytes, sizeof(bytes));
    }

    /**
     *  @brief  Transcodes into @p buffer after a reserved head of `BZ_VARINT_MAX_LENGTH` bytes,
     *          then places the prefix right before the body.
     */
    void write_prefixed_utf8_(unit_t const *units, size_t count, u8_t *buffer) {
        u8_t *const body = buffer + BZ_VARINT_MAX_LENGTH;
        size_t written;
        raise(bz_utf16_to_utf8(units, count, &utf8_fallback_, body, &written));
        u8_t prefix[BZ_VARINT_MAX_LENGTH];
        size_t const prefix_length = bz_varint_encode(written, prefix);
        u8_t *const start = body - prefix_length;
        std::memcpy(start, prefix, prefix_length);
        output_->write(start, prefix_length + written);
    }

    /** @brief Generic path of character-buffer writes, picking the strategy by the worst-case size. */
    void write_generic_(unit_t const *units, size_t count) {
        bz_encoding_t const descriptor = encoding_.c_encoding();
        size_t worst;
        bz_status_t const sizing = bz_encoding_max_length(&descriptor, count, &worst);
        if (sizing == bz_success_k && worst <= BZ_INLINE_CAPACITY) {
            u8_t buffer[BZ_INLINE_CAPACITY];
            encode_whole_(descriptor, units, count, buffer, sizeof(buffer));
        }
        else if (sizing == bz_success_k && worst <= BZ_POOLED_CAPACITY) {
            pooled_buffer buffer = pool_->checkout(worst);
            encode_whole_(descriptor, units, count, buffer.data(), buffer.size());
        }
        else { write_chunked_(units, count); }
    }

    void encode_whole_(bz_encoding_t const &descriptor, unit_t const *units, size_t count, u8_t *buffer,
                       size_t capacity) {
        bz_encoder_t encoder;
        bz_encoder_init(&encoder, &descriptor);
        size_t written;
        raise(bz_encoder_convert(&encoder, units, count, buffer, capacity, bz_true_k, &written));
        if (written) output_->write(buffer, written);
    }

    /**
     *  @brief  Streams an arbitrarily long buffer through one pooled chunk.
     *          Every slice is sized so that its worst case, plus a unit of carried state, fits the chunk.
     */
    void write_chunked_(unit_t const *units, size_t count) {
        bz_encoding_t const descriptor = encoding_.c_encoding();
        size_t const per_unit = fast_utf8_ ? BZ_UTF8_MAX_BYTES_PER_UNIT : bz_encoding_max_bytes_per_unit(&descriptor);
        size_t chunk_size = BZ_POOLED_CAPACITY;
        if (chunk_size < per_unit * 2) chunk_size = per_unit * 2;
        size_t const slice_units = chunk_size / per_unit - 1;
        pooled_buffer chunk = pool_->checkout(chunk_size);

        bz_encoder_t encoder;
        bz_encoder_init(&encoder, &descriptor);
        for (size_t offset = 0; offset != count;) {
            size_t end = count - offset > slice_units ? offset + slice_units : count;
            size_t written;
            if (fast_utf8_) {
                // The fast transcoder treats every slice as complete, so a pair must not be cut in two.
                // The extra unit still fits, as the slice leaves one spare unit of room.
                if (end != count && bz_unit_is_high_surrogate(units[end - 1]) && bz_unit_is_low_surrogate(units[end]))
                    ++end;
                raise(bz_utf16_to_utf8(units + offset, end - offset, &utf8_fallback_, chunk.data(), &written));
            }
            else {
                bz_bool_t const last = end == count ? bz_true_k : bz_false_k;
                raise(bz_encoder_convert(&encoder, units + offset, end - offset, chunk.data(), chunk.size(), last,
                                         &written));
            }
            if (written) output_->write(chunk.data(), written);
            offset = end;
        }
    }
};

} // namespace binzilla

#endif // BINZILLA_HPP_
