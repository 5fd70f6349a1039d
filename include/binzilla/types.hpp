/**
 *  @brief  Shared definitions for the BinZilla C++ library.
 *  @file   types.hpp
 *
 *  The goal for this header is to provide the minimal set of types shared by the buffer pool, the sinks,
 *  and the writer, on top of the @b "types.h" C header:
 *
 *  - `u8_t`, `u16_t`, `u32_t`, `u64_t`, `i8_t`, `i16_t`, `i32_t`, `i64_t` - sized integers.
 *  - `size_t`, `byte_t` - address-related types.
 *  - `status_t`, `unit_t` - for logic.
 *
 *  And the error-reporting helpers:
 *
 *  - `encoding_error` - thrown when the input holds a code unit the encoding refuses to represent.
 *  - `raise(status_t)` - maps a C-level status to a C++ exception.
 */
#ifndef BINZILLA_TYPES_HPP_
#define BINZILLA_TYPES_HPP_

#include "types.h"

#include <new>       // `std::bad_alloc`
#include <stdexcept> // `std::invalid_argument`, `std::range_error`

namespace binzilla {

using i8_t = bz_i8_t;
using u8_t = bz_u8_t;
using i16_t = bz_i16_t;
using u16_t = bz_u16_t;
using i32_t = bz_i32_t;
using u32_t = bz_u32_t;
using u64_t = bz_u64_t;
using i64_t = bz_i64_t;
using size_t = bz_size_t;
using byte_t = bz_byte_t;

using f32_t = float;
using f64_t = double;

using unit_t = bz_unit_t;

/** @sa bz_status_t */
enum class status_t : int {
    success_k = bz_success_k,
    bad_alloc_k = bz_bad_alloc_k,
    invalid_argument_k = bz_invalid_argument_k,
    unencodable_k = bz_unencodable_k,
    output_exhausted_k = bz_output_exhausted_k,
    overflow_risk_k = bz_overflow_risk_k,
    unknown_k = bz_status_unknown_k,
};

/**
 *  @brief  Reports a code unit the configured encoding can't represent, when its fallback is to fail.
 *          Most often a lone surrogate, or a character outside of the ASCII or Latin-1 range.
 */
class encoding_error : public std::range_error {
  public:
    using std::range_error::range_error;
};

/**
 *  @brief  Converts a failing status into an exception, and does nothing on success.
 *  @throw  `std::bad_alloc`, `std::invalid_argument`, `encoding_error`, `std::length_error`, or `std::logic_error`.
 */
inline void raise(status_t status) noexcept(false) {
    switch (status) {
    case status_t::success_k: break;
    case status_t::bad_alloc_k: throw std::bad_alloc();
    case status_t::invalid_argument_k: throw std::invalid_argument("Malformed argument or encoding descriptor");
    case status_t::unencodable_k: throw encoding_error("Input can't be represented in the target encoding");
    case status_t::output_exhausted_k: throw std::logic_error("Output buffer is smaller than the worst case");
    case status_t::overflow_risk_k: throw std::length_error("Output size doesn't fit into the address space");
    default: throw std::runtime_error("Unknown BinZilla failure");
    }
}

/** @brief Shortcut for the C-level statuses. */
inline void raise(bz_status_t status) noexcept(false) { raise(static_cast<status_t>(status)); }

} // namespace binzilla

#endif // BINZILLA_TYPES_HPP_
