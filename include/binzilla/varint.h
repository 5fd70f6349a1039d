/**
 *  @brief  7-bit encoded variable-length integers, as used for string length prefixes.
 *  @file   varint.h
 *
 *  Each byte carries 7 payload bits in its low bits, and the high bit signals that another byte follows.
 *  Groups are emitted least-significant first, using the minimal number of bytes for the value:
 *
 *  - 0 .. 127 - @b 1 byte, e.g. 0 is `00`, 127 is `7F`.
 *  - 128 .. 16'383 - @b 2 bytes, e.g. 128 is `80 01`, 300 is `AC 02`.
 *  - a 32-bit value takes at most @b 5 bytes, a 64-bit value at most @b 10.
 *
 *  Includes core APIs:
 *
 *  - `bz_varint_length` - number of bytes needed to encode a value.
 *  - `bz_varint_encode` - encodes a value into a buffer of at least `BZ_VARINT_MAX_LENGTH` bytes.
 *  - `bz_varint_decode` - decodes a value, rejecting truncated or oversized sequences.
 */
#ifndef BINZILLA_VARINT_H_
#define BINZILLA_VARINT_H_

#include "types.h"

#ifdef __cplusplus
extern "C" {
#endif

/** @brief Longest possible encoding of a 64-bit value, in bytes. */
#define BZ_VARINT_MAX_LENGTH (10)

/** @brief Longest possible encoding of a 32-bit value, in bytes. */
#define BZ_VARINT32_MAX_LENGTH (5)

#pragma region Core API

/**
 *  @brief  Computes the number of bytes the 7-bit encoding of @p value occupies.
 *  @return A number in [1, 10].
 */
BZ_PUBLIC bz_size_t bz_varint_length(bz_u64_t value);

/**
 *  @brief  Encodes @p value into @p target using the minimal number of bytes.
 *  @param[out] target Buffer of at least `BZ_VARINT_MAX_LENGTH` bytes.
 *  @return Number of bytes written, same as `bz_varint_length(value)`.
 *
 *  Example usage:
 *
 *  @code{.c}
 *      #include <binzilla/varint.h>
 *      int main() {
 *          bz_u8_t buffer[BZ_VARINT_MAX_LENGTH];
 *          bz_size_t length = bz_varint_encode(300, buffer);
 *          return length == 2 && buffer[0] == 0xAC && buffer[1] == 0x02 ? 0 : 1;
 *      }
 *  @endcode
 */
BZ_PUBLIC bz_size_t bz_varint_encode(bz_u64_t value, bz_u8_t *target);

/**
 *  @brief  Decodes a 7-bit encoded value of at most @p max_length bytes.
 *  @param[in] source Encoded bytes.
 *  @param[in] length Number of readable bytes in @p source.
 *  @param[in] max_length Upper bound on the encoding, `BZ_VARINT32_MAX_LENGTH` or `BZ_VARINT_MAX_LENGTH`.
 *  @param[out] value Decoded value.
 *  @param[out] consumed Number of bytes consumed.
 *  @return `bz_success_k`, or `bz_invalid_argument_k` on truncated, oversized or overflowing input.
 */
BZ_PUBLIC bz_status_t bz_varint_decode(bz_u8_t const *source, bz_size_t length, bz_size_t max_length,
                                       bz_u64_t *value, bz_size_t *consumed);

#pragma endregion

#pragma region Serial Implementation

BZ_PUBLIC bz_size_t bz_varint_length(bz_u64_t value) {
    bz_size_t length = 1;
    while (value >= 0x80u) value >>= 7, ++length;
    return length;
}

BZ_PUBLIC bz_size_t bz_varint_encode(bz_u64_t value, bz_u8_t *target) {
    bz_u8_t *const start = target;
    while (value >= 0x80u) {
        *target++ = (bz_u8_t)(value | 0x80u);
        value >>= 7;
    }
    *target++ = (bz_u8_t)value;
    return (bz_size_t)(target - start);
}

BZ_PUBLIC bz_status_t bz_varint_decode(bz_u8_t const *source, bz_size_t length, bz_size_t max_length,
                                       bz_u64_t *value, bz_size_t *consumed) {
    if (max_length > BZ_VARINT_MAX_LENGTH) max_length = BZ_VARINT_MAX_LENGTH;
    bz_u64_t result = 0;
    bz_size_t const width = max_length <= BZ_VARINT32_MAX_LENGTH ? 32 : 64;
    for (bz_size_t i = 0; i != length && i != max_length; ++i) {
        bz_u64_t const group = source[i] & 0x7Fu;
        bz_size_t const shift = i * 7;
        // The last allowed byte may only carry the bits that still fit into the target width.
        if (shift + 7 > width && (group >> (width - shift)) != 0) return bz_invalid_argument_k;
        result |= group << shift;
        if ((source[i] & 0x80u) == 0) {
            *value = result;
            *consumed = i + 1;
            return bz_success_k;
        }
    }
    return bz_invalid_argument_k;
}

#pragma endregion

#ifdef __cplusplus
}
#endif

#endif // BINZILLA_VARINT_H_
