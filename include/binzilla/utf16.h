/**
 *  @brief  UTF-16 to UTF-8 transcoding utilities, with serial and AVX2 backends.
 *  @file   utf16.h
 *
 *  Includes core APIs:
 *
 *  - `bz_rune_export` - encode one rune into 1-4 UTF-8 bytes
 *  - `bz_utf16_to_utf8_length` - exact UTF-8 length of a UTF-16 sequence
 *  - `bz_utf16_to_utf8` - transcode a UTF-16 sequence into a buffer of at least `3 * count` bytes
 *
 *  The input is a sequence of @b code-units, not code-points: a well-formed surrogate pair becomes one
 *  4-byte rune, while a surrogate half without its partner is handed to the fallback, that either
 *  fails with `bz_unencodable_k` or substitutes a pre-encoded replacement of at most 3 bytes.
 *  That keeps the worst case at 3 output bytes per input unit:
 *
 *  - U+0000 to U+007F - @b 1 byte per unit.
 *  - U+0080 to U+07FF - @b 2 bytes per unit.
 *  - U+0800 to U+FFFF, except surrogates - @b 3 bytes per unit.
 *  - surrogate pairs - @b 4 bytes per 2 units.
 *  - lone surrogates - the replacement length, @b 0 to 3 bytes per unit.
 */
#ifndef BINZILLA_UTF16_H_
#define BINZILLA_UTF16_H_

#include "types.h"

#ifdef __cplusplus
extern "C" {
#endif

/** @brief Worst-case number of UTF-8 bytes produced by a single UTF-16 unit. */
#define BZ_UTF8_MAX_BYTES_PER_UNIT (3)

/**
 *  @brief  Describes how the fast transcoder handles lone surrogates.
 *          Unlike the general `bz_encoding_t` fallback, the replacement here is already encoded into UTF-8.
 */
typedef struct bz_utf8_fallback_t {
    bz_bool_t fail;     //!< If set, lone surrogates result in `bz_unencodable_k`.
    bz_u8_t bytes[4];   //!< UTF-8 replacement bytes.
    bz_size_t length;   //!< Number of meaningful bytes in `bytes`, at most 3.
} bz_utf8_fallback_t;

#pragma region Core API

/** @brief Checks if @p unit is any half of a surrogate pair, U+D800 to U+DFFF. */
BZ_PUBLIC bz_bool_t bz_unit_is_surrogate(bz_unit_t unit) { return (bz_bool_t)((unit & 0xF800u) == 0xD800u); }

/** @brief Checks if @p unit is a leading (high) surrogate, U+D800 to U+DBFF. */
BZ_PUBLIC bz_bool_t bz_unit_is_high_surrogate(bz_unit_t unit) { return (bz_bool_t)((unit & 0xFC00u) == 0xD800u); }

/** @brief Checks if @p unit is a trailing (low) surrogate, U+DC00 to U+DFFF. */
BZ_PUBLIC bz_bool_t bz_unit_is_low_surrogate(bz_unit_t unit) { return (bz_bool_t)((unit & 0xFC00u) == 0xDC00u); }

/** @brief Combines a high and a low surrogate into a supplementary-plane rune. */
BZ_PUBLIC bz_rune_t bz_rune_from_surrogates(bz_unit_t high, bz_unit_t low) {
    return 0x10000u + (((bz_rune_t)(high - 0xD800u) << 10) | (bz_rune_t)(low - 0xDC00u));
}

/**
 *  @brief  Exports a single rune into its UTF-8 form.
 *  @param[in] rune Code point to encode, at most U+10FFFF.
 *  @param[out] utf8 Buffer of at least 4 bytes.
 *  @return Number of bytes written, from 1 to 4.
 *  @warning Surrogate code points are not rejected here, callers must filter them.
 */
BZ_PUBLIC bz_size_t bz_rune_export(bz_rune_t rune, bz_u8_t *utf8) {
    if (rune < 0x80u) {
        // Single-byte rune (0xxxxxxx)
        utf8[0] = (bz_u8_t)rune;
        return 1;
    }
    else if (rune < 0x800u) {
        // Two-byte rune (110xxxxx 10xxxxxx)
        utf8[0] = (bz_u8_t)(0xC0u | (rune >> 6));
        utf8[1] = (bz_u8_t)(0x80u | (rune & 0x3Fu));
        return 2;
    }
    else if (rune < 0x10000u) {
        // Three-byte rune (1110xxxx 10xxxxxx 10xxxxxx)
        utf8[0] = (bz_u8_t)(0xE0u | (rune >> 12));
        utf8[1] = (bz_u8_t)(0x80u | ((rune >> 6) & 0x3Fu));
        utf8[2] = (bz_u8_t)(0x80u | (rune & 0x3Fu));
        return 3;
    }
    else {
        // Four-byte rune (11110xxx 10xxxxxx 10xxxxxx 10xxxxxx)
        utf8[0] = (bz_u8_t)(0xF0u | (rune >> 18));
        utf8[1] = (bz_u8_t)(0x80u | ((rune >> 12) & 0x3Fu));
        utf8[2] = (bz_u8_t)(0x80u | ((rune >> 6) & 0x3Fu));
        utf8[3] = (bz_u8_t)(0x80u | (rune & 0x3Fu));
        return 4;
    }
}

/** @brief Number of UTF-8 bytes needed for a rune, without encoding it. */
BZ_PUBLIC bz_size_t bz_rune_utf8_length(bz_rune_t rune) {
    return rune < 0x80u ? 1 : rune < 0x800u ? 2 : rune < 0x10000u ? 3 : 4;
}

/**
 *  @brief  Computes the exact number of bytes `bz_utf16_to_utf8` would produce.
 *
 *  @param[in] units UTF-16 code units. Can be `NULL`, if the @p count is zero.
 *  @param[in] count Number of code units.
 *  @param[in] fallback Lone surrogate policy.
 *  @param[out] length Number of UTF-8 bytes.
 *  @return `bz_success_k`, `bz_unencodable_k` for a lone surrogate under a failing fallback,
 *          or `bz_overflow_risk_k` if the result may not fit into `bz_size_t`.
 *
 *  @note   Selects the fastest implementation available at compile time.
 *  @sa     bz_utf16_to_utf8_length_serial, bz_utf16_to_utf8_length_haswell
 */
BZ_DYNAMIC bz_status_t bz_utf16_to_utf8_length(bz_unit_t const *units, bz_size_t count,
                                               bz_utf8_fallback_t const *fallback, bz_size_t *length);

/**
 *  @brief  Transcodes a UTF-16 sequence into UTF-8, treating the input as complete.
 *          A high surrogate in the last position is a lone surrogate.
 *
 *  @param[in] units UTF-16 code units. Can be `NULL`, if the @p count is zero.
 *  @param[in] count Number of code units.
 *  @param[in] fallback Lone surrogate policy.
 *  @param[out] target Output buffer of at least `count * BZ_UTF8_MAX_BYTES_PER_UNIT` bytes.
 *  @param[out] written Number of bytes written, also on failure.
 *  @return `bz_success_k` or `bz_unencodable_k`.
 *
 *  Example usage:
 *
 *  @code{.c}
 *      #include <binzilla/utf16.h>
 *      int main() {
 *          bz_unit_t const text[2] = {0x0078, 0x00E9}; // "xé"
 *          bz_utf8_fallback_t fallback = {bz_true_k, {0}, 0};
 *          bz_u8_t output[6];
 *          bz_size_t written;
 *          bz_utf16_to_utf8(text, 2, &fallback, output, &written);
 *          return written == 3 && output[1] == 0xC3 && output[2] == 0xA9 ? 0 : 1;
 *      }
 *  @endcode
 *
 *  @note   Selects the fastest implementation available at compile time.
 *  @sa     bz_utf16_to_utf8_serial, bz_utf16_to_utf8_haswell
 */
BZ_DYNAMIC bz_status_t bz_utf16_to_utf8(bz_unit_t const *units, bz_size_t count, bz_utf8_fallback_t const *fallback,
                                        bz_u8_t *target, bz_size_t *written);

/** @copydoc bz_utf16_to_utf8_length */
BZ_PUBLIC bz_status_t bz_utf16_to_utf8_length_serial(bz_unit_t const *units, bz_size_t count,
                                                     bz_utf8_fallback_t const *fallback, bz_size_t *length);

/** @copydoc bz_utf16_to_utf8 */
BZ_PUBLIC bz_status_t bz_utf16_to_utf8_serial(bz_unit_t const *units, bz_size_t count,
                                              bz_utf8_fallback_t const *fallback, bz_u8_t *target,
                                              bz_size_t *written);

#if BZ_USE_HASWELL
/** @copydoc bz_utf16_to_utf8_length */
BZ_PUBLIC bz_status_t bz_utf16_to_utf8_length_haswell(bz_unit_t const *units, bz_size_t count,
                                                      bz_utf8_fallback_t const *fallback, bz_size_t *length);

/** @copydoc bz_utf16_to_utf8 */
BZ_PUBLIC bz_status_t bz_utf16_to_utf8_haswell(bz_unit_t const *units, bz_size_t count,
                                               bz_utf8_fallback_t const *fallback, bz_u8_t *target,
                                               bz_size_t *written);
#endif

#pragma endregion // Core API

#pragma region Serial Implementation

/**
 *  @brief  Measures the units in `[*cursor, stop)`, reading up to @p end to complete a surrogate pair.
 *          The @p cursor is advanced past the last consumed unit, which can be `stop + 1` if a pair
 *          straddles the boundary.
 *  @return `bz_false_k` if a lone surrogate hit a failing fallback.
 */
BZ_INTERNAL bz_bool_t bz_utf16_to_utf8_length_upto_(bz_unit_t const **cursor, bz_unit_t const *stop,
                                                    bz_unit_t const *end, bz_utf8_fallback_t const *fallback,
                                                    bz_size_t *length) {
    bz_unit_t const *units = *cursor;
    bz_size_t bytes = 0;
    while (units < stop) {
        bz_unit_t const unit = *units;
        if (unit < 0x80u) { bytes += 1, units += 1; }
        else if (unit < 0x800u) { bytes += 2, units += 1; }
        else if (!bz_unit_is_surrogate(unit)) { bytes += 3, units += 1; }
        else if (bz_unit_is_high_surrogate(unit) && units + 1 < end && bz_unit_is_low_surrogate(units[1])) {
            bytes += 4, units += 2;
        }
        else if (fallback->fail) {
            *cursor = units;
            return bz_false_k;
        }
        else { bytes += fallback->length, units += 1; }
    }
    *length += bytes;
    *cursor = units;
    return bz_true_k;
}

/**
 *  @brief  Transcodes the units in `[*cursor, stop)`, reading up to @p end to complete a surrogate pair.
 *          Both the @p cursor and the @p target are advanced, also on failure.
 *  @return `bz_false_k` if a lone surrogate hit a failing fallback.
 */
BZ_INTERNAL bz_bool_t bz_utf16_to_utf8_upto_(bz_unit_t const **cursor, bz_unit_t const *stop,
                                             bz_unit_t const *end, bz_utf8_fallback_t const *fallback,
                                             bz_u8_t **target) {
    bz_unit_t const *units = *cursor;
    bz_u8_t *output = *target;
    while (units < stop) {
        bz_unit_t const unit = *units;
        if (unit < 0x80u) {
            *output++ = (bz_u8_t)unit;
            units += 1;
        }
        else if (unit < 0x800u) {
            output[0] = (bz_u8_t)(0xC0u | (unit >> 6));
            output[1] = (bz_u8_t)(0x80u | (unit & 0x3Fu));
            output += 2, units += 1;
        }
        else if (!bz_unit_is_surrogate(unit)) {
            output[0] = (bz_u8_t)(0xE0u | (unit >> 12));
            output[1] = (bz_u8_t)(0x80u | ((unit >> 6) & 0x3Fu));
            output[2] = (bz_u8_t)(0x80u | (unit & 0x3Fu));
            output += 3, units += 1;
        }
        else if (bz_unit_is_high_surrogate(unit) && units + 1 < end && bz_unit_is_low_surrogate(units[1])) {
            output += bz_rune_export(bz_rune_from_surrogates(unit, units[1]), output);
            units += 2;
        }
        else if (fallback->fail) {
            *cursor = units, *target = output;
            return bz_false_k;
        }
        else {
            for (bz_size_t i = 0; i != fallback->length; ++i) *output++ = fallback->bytes[i];
            units += 1;
        }
    }
    *cursor = units, *target = output;
    return bz_true_k;
}

BZ_PUBLIC bz_status_t bz_utf16_to_utf8_length_serial(bz_unit_t const *units, bz_size_t count,
                                                     bz_utf8_fallback_t const *fallback, bz_size_t *length) {
    bz_size_t bound;
    if (!bz_size_mul_(count, BZ_UTF8_MAX_BYTES_PER_UNIT, &bound)) return bz_overflow_risk_k;
    *length = 0;
    if (!count) return bz_success_k;
    bz_unit_t const *const end = units + count;
    return bz_utf16_to_utf8_length_upto_(&units, end, end, fallback, length) ? bz_success_k : bz_unencodable_k;
}

BZ_PUBLIC bz_status_t bz_utf16_to_utf8_serial(bz_unit_t const *units, bz_size_t count,
                                              bz_utf8_fallback_t const *fallback, bz_u8_t *target,
                                              bz_size_t *written) {
    *written = 0;
    if (!count) return bz_success_k;
    bz_unit_t const *const end = units + count;
    bz_u8_t *output = target;
    bz_bool_t const encoded = bz_utf16_to_utf8_upto_(&units, end, end, fallback, &output);
    *written = (bz_size_t)(output - target);
    return encoded ? bz_success_k : bz_unencodable_k;
}

#pragma endregion // Serial Implementation

#pragma region Haswell Implementation
#if BZ_USE_HASWELL
#if defined(__clang__)
#pragma clang attribute push(__attribute__((target("avx2,popcnt"))), apply_to = function)
#elif defined(__GNUC__)
#pragma GCC push_options
#pragma GCC target("avx2,popcnt")
#endif

BZ_PUBLIC bz_status_t bz_utf16_to_utf8_length_haswell(bz_unit_t const *units, bz_size_t count,
                                                      bz_utf8_fallback_t const *fallback, bz_size_t *length) {
    bz_size_t bound;
    if (!bz_size_mul_(count, BZ_UTF8_MAX_BYTES_PER_UNIT, &bound)) return bz_overflow_risk_k;
    *length = 0;
    if (!count) return bz_success_k;

    bz_unit_t const *const end = units + count;
    __m256i const not_ascii_mask = _mm256_set1_epi16((short)0xFF80);
    __m256i const not_2byte_mask = _mm256_set1_epi16((short)0xF800);
    __m256i const surrogate_tag = _mm256_set1_epi16((short)0xD800);
    __m256i const zeros = _mm256_setzero_si256();
    bz_size_t bytes = 0;

    // Blocks of 16 units without surrogates have a closed-form length:
    // one byte per unit, plus one for every unit above U+007F, plus one more for every unit above U+07FF.
    while (end - units >= 16) {
        __m256i const block = _mm256_loadu_si256((__m256i const *)units);
        __m256i const top_bits = _mm256_and_si256(block, not_2byte_mask);
        __m256i const surrogates = _mm256_cmpeq_epi16(top_bits, surrogate_tag);
        if (_mm256_movemask_epi8(surrogates) != 0) {
            if (!bz_utf16_to_utf8_length_upto_(&units, units + 16, end, fallback, &bytes)) return bz_unencodable_k;
            continue;
        }
        __m256i const ascii = _mm256_cmpeq_epi16(_mm256_and_si256(block, not_ascii_mask), zeros);
        __m256i const below_3byte = _mm256_cmpeq_epi16(top_bits, zeros);
        bz_size_t const ascii_count = (bz_size_t)bz_u32_popcount((bz_u32_t)_mm256_movemask_epi8(ascii)) / 2;
        bz_size_t const below_3byte_count =
            (bz_size_t)bz_u32_popcount((bz_u32_t)_mm256_movemask_epi8(below_3byte)) / 2;
        bytes += 16 + (16 - ascii_count) + (16 - below_3byte_count);
        units += 16;
    }

    if (!bz_utf16_to_utf8_length_upto_(&units, end, end, fallback, &bytes)) return bz_unencodable_k;
    *length = bytes;
    return bz_success_k;
}

BZ_PUBLIC bz_status_t bz_utf16_to_utf8_haswell(bz_unit_t const *units, bz_size_t count,
                                               bz_utf8_fallback_t const *fallback, bz_u8_t *target,
                                               bz_size_t *written) {
    *written = 0;
    if (!count) return bz_success_k;

    bz_unit_t const *const end = units + count;
    __m256i const not_ascii_mask = _mm256_set1_epi16((short)0xFF80);
    bz_u8_t *output = target;

    while (end - units >= 16) {
        __m256i const block = _mm256_loadu_si256((__m256i const *)units);
        if (!_mm256_testz_si256(block, not_ascii_mask)) {
            if (!bz_utf16_to_utf8_upto_(&units, units + 16, end, fallback, &output)) {
                *written = (bz_size_t)(output - target);
                return bz_unencodable_k;
            }
            continue;
        }
        // Saturating pack works within 128-bit lanes, so the 64-bit quarters must be reordered after it.
        __m256i const packed = _mm256_packus_epi16(block, block);
        __m256i const ordered = _mm256_permute4x64_epi64(packed, 0xD8);
        _mm_storeu_si128((__m128i *)output, _mm256_castsi256_si128(ordered));
        output += 16, units += 16;
    }

    bz_bool_t const encoded = bz_utf16_to_utf8_upto_(&units, end, end, fallback, &output);
    *written = (bz_size_t)(output - target);
    return encoded ? bz_success_k : bz_unencodable_k;
}

#if defined(__clang__)
#pragma clang attribute pop
#elif defined(__GNUC__)
#pragma GCC pop_options
#endif
#endif            // BZ_USE_HASWELL
#pragma endregion // Haswell Implementation

#pragma region Dynamic Dispatch

BZ_DYNAMIC bz_status_t bz_utf16_to_utf8_length(bz_unit_t const *units, bz_size_t count,
                                               bz_utf8_fallback_t const *fallback, bz_size_t *length) {
#if BZ_USE_HASWELL
    return bz_utf16_to_utf8_length_haswell(units, count, fallback, length);
#else
    return bz_utf16_to_utf8_length_serial(units, count, fallback, length);
#endif
}

BZ_DYNAMIC bz_status_t bz_utf16_to_utf8(bz_unit_t const *units, bz_size_t count, bz_utf8_fallback_t const *fallback,
                                        bz_u8_t *target, bz_size_t *written) {
#if BZ_USE_HASWELL
    return bz_utf16_to_utf8_haswell(units, count, fallback, target, written);
#else
    return bz_utf16_to_utf8_serial(units, count, fallback, target, written);
#endif
}

#pragma endregion // Dynamic Dispatch

#ifdef __cplusplus
}
#endif

#endif // BINZILLA_UTF16_H_
