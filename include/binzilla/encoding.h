/**
 *  @brief  Text encoding descriptors, fast-path classification, and a resumable encoder.
 *  @file   encoding.h
 *
 *  An encoding is described by plain data, rather than a type hierarchy:
 *
 *  - `codec` - the byte transform actually applied: UTF-8, UTF-16LE, UTF-16BE, ASCII, or Latin-1.
 *  - `code_page` - the identifier the encoding @b reports, which decides fast-path eligibility.
 *  - `fallback` - what happens to code units the codec can't represent: fail or substitute.
 *
 *  Keeping `codec` and `code_page` apart lets callers describe encodings that transform like UTF-8,
 *  but identify as something else. Those never take the UTF-8 fast path, as eligibility is decided
 *  by the reported code page and the fallback width alone, see `bz_encoding_is_fast_utf8`.
 *
 *  Includes core APIs:
 *
 *  - `bz_encoding_init` and `bz_encoding_validate` - build and check descriptors.
 *  - `bz_encoding_is_fast_utf8` - the fast-path classifier.
 *  - `bz_encoding_max_length` - overflow-checked worst-case output size.
 *  - `bz_encoding_measure` - exact output size of a complete sequence.
 *  - `bz_encoder_convert` - chunk-by-chunk encoding that keeps a split surrogate pair intact.
 */
#ifndef BINZILLA_ENCODING_H_
#define BINZILLA_ENCODING_H_

#include "types.h"
#include "utf16.h"

#ifdef __cplusplus
extern "C" {
#endif

#define BZ_CODE_PAGE_UTF16LE (1200u)
#define BZ_CODE_PAGE_UTF16BE (1201u)
#define BZ_CODE_PAGE_ASCII (20127u)
#define BZ_CODE_PAGE_LATIN1 (28591u)
#define BZ_CODE_PAGE_UTF7 (65000u)
#define BZ_CODE_PAGE_UTF8 (65001u)

/**
 *  @brief  Byte transforms supported by the generic encoder.
 */
typedef enum bz_codec_t {
    bz_codec_utf8_k = 0,    //!< 1 to 4 bytes per rune.
    bz_codec_utf16le_k = 1, //!< 2 or 4 bytes per rune, little-endian units.
    bz_codec_utf16be_k = 2, //!< 2 or 4 bytes per rune, big-endian units.
    bz_codec_ascii_k = 3,   //!< 1 byte per rune, U+0000 to U+007F only.
    bz_codec_latin1_k = 4,  //!< 1 byte per rune, U+0000 to U+00FF only.
} bz_codec_t;

/**
 *  @brief  Policy for runes the codec can't represent, including lone surrogates.
 */
typedef enum bz_fallback_t {
    bz_fallback_replace_k = 0, //!< Substitute the `replacement` sequence, which may be empty.
    bz_fallback_throw_k = 1,   //!< Stop with `bz_unencodable_k`.
} bz_fallback_t;

/**
 *  @brief  Describes an encoding. The structure doesn't own the replacement units.
 *  @sa     bz_encoding_init
 */
typedef struct bz_encoding_t {
    bz_codec_t codec;
    bz_u32_t code_page;
    bz_fallback_t fallback;
    bz_unit_t const *replacement;
    bz_size_t replacement_length;
} bz_encoding_t;

/**
 *  @brief  State of an encoder, that consumes the input in chunks.
 *          A high surrogate at the end of a non-final chunk is kept until the next call.
 */
typedef struct bz_encoder_t {
    bz_encoding_t const *encoding;
    bz_unit_t pending;
    bz_bool_t has_pending;
} bz_encoder_t;

#pragma region Core API

/**
 *  @brief  Initializes an encoding descriptor, reporting the standard code page of the @p codec.
 *  @param[in] replacement UTF-16 units to substitute, ignored for `bz_fallback_throw_k`.
 */
BZ_PUBLIC void bz_encoding_init(bz_encoding_t *encoding, bz_codec_t codec, bz_fallback_t fallback,
                                bz_unit_t const *replacement, bz_size_t replacement_length);

/**
 *  @brief  Checks that the descriptor is usable: a known codec, and a replacement the codec can itself encode.
 *  @return `bz_success_k` or `bz_invalid_argument_k`.
 */
BZ_PUBLIC bz_status_t bz_encoding_validate(bz_encoding_t const *encoding);

/**
 *  @brief  Decides if the encoding may take the UTF-8 fast path.
 *
 *  The encoding qualifies if it @b reports the UTF-8 code page, and its fallback either fails,
 *  or substitutes at most one UTF-16 unit. A one-unit replacement encodes into at most 3 bytes,
 *  so the fast path keeps its bound of 3 output bytes per input unit.
 */
BZ_PUBLIC bz_bool_t bz_encoding_is_fast_utf8(bz_encoding_t const *encoding);

/**
 *  @brief  Prepares the pre-encoded lone-surrogate policy for the `bz_utf16_to_utf8` family.
 *  @pre    `bz_encoding_is_fast_utf8(encoding)` holds and the descriptor is valid.
 */
BZ_PUBLIC void bz_encoding_utf8_fallback(bz_encoding_t const *encoding, bz_utf8_fallback_t *fallback);

/** @brief Number of bytes the replacement sequence takes in the encoding's own codec. */
BZ_PUBLIC bz_size_t bz_encoding_replacement_bytes(bz_encoding_t const *encoding);

/** @brief Upper bound on the bytes a single input unit can produce, including fallback substitutions. */
BZ_PUBLIC bz_size_t bz_encoding_max_bytes_per_unit(bz_encoding_t const *encoding);

/**
 *  @brief  Upper bound on the output of `count` units, with one extra unit for a pending surrogate.
 *  @return `bz_success_k`, or `bz_overflow_risk_k` if the product doesn't fit into `bz_size_t`.
 */
BZ_PUBLIC bz_status_t bz_encoding_max_length(bz_encoding_t const *encoding, bz_size_t count, bz_size_t *length);

/**
 *  @brief  Computes the exact output length for a complete sequence.
 *  @return `bz_success_k`, `bz_unencodable_k`, or `bz_overflow_risk_k`.
 */
BZ_PUBLIC bz_status_t bz_encoding_measure(bz_encoding_t const *encoding, bz_unit_t const *units, bz_size_t count,
                                          bz_size_t *length);

/** @brief Starts a new encoder without a pending surrogate. */
BZ_PUBLIC void bz_encoder_init(bz_encoder_t *encoder, bz_encoding_t const *encoding);

/**
 *  @brief  Encodes the next chunk of a sequence.
 *
 *  @param[in] units Next chunk of UTF-16 units. Can be `NULL`, if the @p count is zero.
 *  @param[in] count Number of units in the chunk.
 *  @param[out] target Output buffer.
 *  @param[in] capacity Size of @p target, at least `bz_encoding_max_length(encoding, count)`.
 *  @param[in] flush Marks the last chunk: a trailing high surrogate is handed to the fallback.
 *  @param[out] written Number of bytes written, also on failure.
 *  @return `bz_success_k`, `bz_unencodable_k`, or `bz_output_exhausted_k` if the @p capacity is too small.
 */
BZ_PUBLIC bz_status_t bz_encoder_convert(bz_encoder_t *encoder, bz_unit_t const *units, bz_size_t count,
                                         bz_u8_t *target, bz_size_t capacity, bz_bool_t flush, bz_size_t *written);

#pragma endregion // Core API

#pragma region Serial Implementation

/** @brief Default code page reported by each codec. */
BZ_INTERNAL bz_u32_t bz_codec_code_page_(bz_codec_t codec) {
    switch (codec) {
    case bz_codec_utf8_k: return BZ_CODE_PAGE_UTF8;
    case bz_codec_utf16le_k: return BZ_CODE_PAGE_UTF16LE;
    case bz_codec_utf16be_k: return BZ_CODE_PAGE_UTF16BE;
    case bz_codec_ascii_k: return BZ_CODE_PAGE_ASCII;
    case bz_codec_latin1_k: return BZ_CODE_PAGE_LATIN1;
    default: return 0;
    }
}

/** @brief Longest output for one unit of valid input, ignoring the fallback. */
BZ_INTERNAL bz_size_t bz_codec_max_bytes_per_unit_(bz_codec_t codec) {
    switch (codec) {
    case bz_codec_utf8_k: return 3;
    case bz_codec_utf16le_k: return 2;
    case bz_codec_utf16be_k: return 2;
    default: return 1;
    }
}

/**
 *  @brief  Encodes a single valid (non-surrogate) rune with the given codec.
 *  @return Number of bytes written into the 4-byte @p target, or 0 if the codec can't represent the rune.
 */
BZ_INTERNAL bz_size_t bz_codec_export_(bz_codec_t codec, bz_rune_t rune, bz_u8_t *target) {
    switch (codec) {
    case bz_codec_utf8_k: return bz_rune_export(rune, target);
    case bz_codec_utf16le_k:
    case bz_codec_utf16be_k: {
        bz_unit_t units[2];
        bz_size_t count = 1;
        if (rune < 0x10000u) { units[0] = (bz_unit_t)rune; }
        else {
            units[0] = (bz_unit_t)(0xD800u + ((rune - 0x10000u) >> 10));
            units[1] = (bz_unit_t)(0xDC00u + ((rune - 0x10000u) & 0x3FFu));
            count = 2;
        }
        for (bz_size_t i = 0; i != count; ++i) {
            bz_u8_t const low = (bz_u8_t)(units[i] & 0xFFu), high = (bz_u8_t)(units[i] >> 8);
            target[i * 2 + 0] = codec == bz_codec_utf16le_k ? low : high;
            target[i * 2 + 1] = codec == bz_codec_utf16le_k ? high : low;
        }
        return count * 2;
    }
    case bz_codec_ascii_k:
        if (rune >= 0x80u) return 0;
        target[0] = (bz_u8_t)rune;
        return 1;
    case bz_codec_latin1_k:
        if (rune >= 0x100u) return 0;
        target[0] = (bz_u8_t)rune;
        return 1;
    default: return 0;
    }
}

/**
 *  @brief  Walks the replacement sequence, exporting every rune into @p target or just counting bytes.
 *  @param[out] target Output buffer, or `NULL` to only count.
 *  @return Number of bytes, or `BZ_SIZE_MAX` if the replacement holds something the codec can't represent.
 */
BZ_INTERNAL bz_size_t bz_encoding_export_replacement_(bz_encoding_t const *encoding, bz_u8_t *target) {
    bz_unit_t const *units = encoding->replacement;
    bz_size_t const count = encoding->replacement_length;
    bz_size_t bytes = 0;
    bz_u8_t scratch[4];
    for (bz_size_t i = 0; i < count;) {
        bz_unit_t const unit = units[i];
        bz_rune_t rune;
        if (!bz_unit_is_surrogate(unit)) { rune = unit, i += 1; }
        else if (bz_unit_is_high_surrogate(unit) && i + 1 < count && bz_unit_is_low_surrogate(units[i + 1])) {
            rune = bz_rune_from_surrogates(unit, units[i + 1]), i += 2;
        }
        else { return BZ_SIZE_MAX; }
        bz_size_t const rune_bytes = bz_codec_export_(encoding->codec, rune, target ? target + bytes : scratch);
        if (rune_bytes == 0) return BZ_SIZE_MAX;
        bytes += rune_bytes;
    }
    return bytes;
}

BZ_PUBLIC void bz_encoding_init(bz_encoding_t *encoding, bz_codec_t codec, bz_fallback_t fallback,
                                bz_unit_t const *replacement, bz_size_t replacement_length) {
    encoding->codec = codec;
    encoding->code_page = bz_codec_code_page_(codec);
    encoding->fallback = fallback;
    encoding->replacement = fallback == bz_fallback_replace_k ? replacement : (bz_unit_t const *)BZ_NULL;
    encoding->replacement_length = fallback == bz_fallback_replace_k ? replacement_length : 0;
}

BZ_PUBLIC bz_status_t bz_encoding_validate(bz_encoding_t const *encoding) {
    if (!encoding) return bz_invalid_argument_k;
    if (encoding->codec < bz_codec_utf8_k || encoding->codec > bz_codec_latin1_k) return bz_invalid_argument_k;
    if (encoding->fallback != bz_fallback_replace_k && encoding->fallback != bz_fallback_throw_k)
        return bz_invalid_argument_k;
    if (encoding->fallback == bz_fallback_throw_k) return bz_success_k;
    if (encoding->replacement_length != 0 && !encoding->replacement) return bz_invalid_argument_k;
    if (bz_encoding_export_replacement_(encoding, (bz_u8_t *)BZ_NULL) == BZ_SIZE_MAX) return bz_invalid_argument_k;
    return bz_success_k;
}

BZ_PUBLIC bz_bool_t bz_encoding_is_fast_utf8(bz_encoding_t const *encoding) {
    if (encoding->code_page != BZ_CODE_PAGE_UTF8) return bz_false_k;
    if (encoding->fallback == bz_fallback_throw_k) return bz_true_k;
    return (bz_bool_t)(encoding->replacement_length <= 1);
}

BZ_PUBLIC void bz_encoding_utf8_fallback(bz_encoding_t const *encoding, bz_utf8_fallback_t *fallback) {
    fallback->fail = (bz_bool_t)(encoding->fallback == bz_fallback_throw_k);
    fallback->length = 0;
    if (!fallback->fail && encoding->replacement_length == 1) {
        bz_assert_(!bz_unit_is_surrogate(encoding->replacement[0]));
        fallback->length = bz_rune_export(encoding->replacement[0], fallback->bytes);
    }
}

BZ_PUBLIC bz_size_t bz_encoding_replacement_bytes(bz_encoding_t const *encoding) {
    if (encoding->fallback == bz_fallback_throw_k) return 0;
    bz_size_t const bytes = bz_encoding_export_replacement_(encoding, (bz_u8_t *)BZ_NULL);
    bz_assert_(bytes != BZ_SIZE_MAX && "Validate the encoding before use");
    return bytes;
}

BZ_PUBLIC bz_size_t bz_encoding_max_bytes_per_unit(bz_encoding_t const *encoding) {
    bz_size_t const native = bz_codec_max_bytes_per_unit_(encoding->codec);
    bz_size_t const replacement = bz_encoding_replacement_bytes(encoding);
    return native > replacement ? native : replacement;
}

BZ_PUBLIC bz_status_t bz_encoding_max_length(bz_encoding_t const *encoding, bz_size_t count, bz_size_t *length) {
    bz_size_t units;
    if (!bz_size_add_(count, 1, &units)) return bz_overflow_risk_k;
    if (!bz_size_mul_(units, bz_encoding_max_bytes_per_unit(encoding), length)) return bz_overflow_risk_k;
    return bz_success_k;
}

BZ_PUBLIC void bz_encoder_init(bz_encoder_t *encoder, bz_encoding_t const *encoding) {
    encoder->encoding = encoding;
    encoder->pending = 0;
    encoder->has_pending = bz_false_k;
}

/**
 *  @brief  Shared loop of `bz_encoder_convert` and `bz_encoding_measure`.
 *          When @p target is `NULL`, nothing is written and the byte count is overflow-checked instead.
 */
BZ_INTERNAL bz_status_t bz_encoder_run_(bz_encoder_t *encoder, bz_unit_t const *units, bz_size_t count,
                                        bz_u8_t *target, bz_bool_t flush, bz_size_t *written) {
    bz_encoding_t const *const encoding = encoder->encoding;
    bz_size_t const replacement_bytes = bz_encoding_replacement_bytes(encoding);
    bz_size_t bytes = 0;
    bz_u8_t scratch[4];
    bz_size_t i = 0;

    // The pending high surrogate is logically the first unit of this chunk.
    bz_unit_t unit = 0;
    bz_bool_t from_pending = encoder->has_pending;
    if (from_pending && count == 0 && !flush) {
        *written = 0;
        return bz_success_k;
    }

    while (from_pending || i < count) {
        bz_rune_t rune = 0;
        bz_bool_t valid = bz_true_k;
        if (from_pending) { unit = encoder->pending; }
        else { unit = units[i++]; }

        if (!bz_unit_is_surrogate(unit)) { rune = unit; }
        else if (bz_unit_is_high_surrogate(unit)) {
            if (i < count && bz_unit_is_low_surrogate(units[i])) { rune = bz_rune_from_surrogates(unit, units[i++]); }
            else if (i == count && !flush) {
                // The partner may arrive with the next chunk.
                encoder->pending = unit;
                encoder->has_pending = bz_true_k;
                break;
            }
            else { valid = bz_false_k; }
        }
        else { valid = bz_false_k; }

        if (from_pending) from_pending = bz_false_k, encoder->has_pending = bz_false_k;

        bz_size_t rune_bytes = 0;
        if (valid) rune_bytes = bz_codec_export_(encoding->codec, rune, target ? target + bytes : scratch);
        if (rune_bytes == 0) {
            if (encoding->fallback == bz_fallback_throw_k) {
                *written = bytes;
                return bz_unencodable_k;
            }
            if (target) bz_encoding_export_replacement_(encoding, target + bytes);
            rune_bytes = replacement_bytes;
        }
        if (!bz_size_add_(bytes, rune_bytes, &bytes)) {
            *written = bytes;
            return bz_overflow_risk_k;
        }
    }

    *written = bytes;
    return bz_success_k;
}

BZ_PUBLIC bz_status_t bz_encoding_measure(bz_encoding_t const *encoding, bz_unit_t const *units, bz_size_t count,
                                          bz_size_t *length) {
    bz_encoder_t encoder;
    bz_encoder_init(&encoder, encoding);
    return bz_encoder_run_(&encoder, units, count, (bz_u8_t *)BZ_NULL, bz_true_k, length);
}

BZ_PUBLIC bz_status_t bz_encoder_convert(bz_encoder_t *encoder, bz_unit_t const *units, bz_size_t count,
                                         bz_u8_t *target, bz_size_t capacity, bz_bool_t flush, bz_size_t *written) {
    bz_size_t required;
    *written = 0;
    bz_status_t status = bz_encoding_max_length(encoder->encoding, count, &required);
    if (status != bz_success_k) return status;
    if (capacity < required) return bz_output_exhausted_k;
    return bz_encoder_run_(encoder, units, count, target, flush, written);
}

#pragma endregion // Serial Implementation

#ifdef __cplusplus
}
#endif

#endif // BINZILLA_ENCODING_H_
