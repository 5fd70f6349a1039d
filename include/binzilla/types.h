/**
 *  @brief  Shared definitions for the BinZilla library.
 *  @file   types.h
 *
 *  Includes the following types:
 *
 *  - `bz_u8_t`, `bz_u16_t`, `bz_u32_t`, `bz_u64_t` - unsigned integers of 8, 16, 32, and 64 bits.
 *  - `bz_i8_t`, `bz_i16_t`, `bz_i32_t`, `bz_i64_t` - signed integers of 8, 16, 32, and 64 bits.
 *  - `bz_size_t` - unsigned integer of the same size as a pointer.
 *  - `bz_bool_t` - boolean type, `bz_true_k` and `bz_false_k` constants.
 *  - `bz_status_t` - result of every fallible C-level operation.
 *  - @b `bz_rune_t` - for 32-bit Unicode code points ~ @b runes.
 *  - @b `bz_unit_t` - for 16-bit UTF-16 code units.
 *
 *  The library also defines the following higher-level structures:
 *
 *  - `bz_memory_allocator_t` - a wrapper for memory-management functions.
 */
#if !defined(BINZILLA_TYPES_H_)
#define BINZILLA_TYPES_H_

/*
 *  Debugging and testing.
 */
#if !defined(BZ_DEBUG)
#if defined(DEBUG) || defined(_DEBUG)
#define BZ_DEBUG (1)
#else
#define BZ_DEBUG (0)
#endif
#endif

/**
 *  @brief  Capacity of the automatic-storage buffer used for short writes, in bytes.
 *          Strings of up to `BZ_INLINE_CAPACITY / 3` UTF-16 units are encoded into it without
 *          touching the buffer pool.
 */
#if !defined(BZ_INLINE_CAPACITY)
#define BZ_INLINE_CAPACITY (127u)
#endif

/**
 *  @brief  Largest text body, in bytes, encoded through a single pooled buffer.
 *          Anything larger is streamed through a reusable chunk buffer of the same size.
 */
#if !defined(BZ_POOLED_CAPACITY)
#define BZ_POOLED_CAPACITY (65536u)
#endif

/**
 *  @brief  Number of idle buffers the pool keeps per power-of-two size class.
 */
#if !defined(BZ_POOL_BUCKET_DEPTH)
#define BZ_POOL_BUCKET_DEPTH (8u)
#endif

#if BZ_INLINE_CAPACITY < 8 || BZ_INLINE_CAPACITY >= BZ_POOLED_CAPACITY
#error "The inline buffer must hold at least 8 bytes and be smaller than the pooled capacity."
#endif

/*  Compile-time hardware features detection.
 *  All of those can be controlled by the user.
 */
#if !defined(BZ_USE_HASWELL)
#ifdef __AVX2__
#define BZ_USE_HASWELL (1)
#else
#define BZ_USE_HASWELL (0)
#endif
#endif

/*  Annotation for the public API symbols:
 *
 *  - `BZ_PUBLIC` is used for functions that are part of the public API.
 *  - `BZ_INTERNAL` is used for internal helper functions with unstable APIs.
 *  - `BZ_DYNAMIC` is used for public functions that pick the best backend available at compile time.
 */
#define BZ_DYNAMIC inline static
#define BZ_PUBLIC inline static
#define BZ_INTERNAL inline static

#include <stddef.h> // `size_t`
#include <stdint.h> // `uint8_t`
#include <stdlib.h> // `malloc`, `EXIT_FAILURE`

/*  The headers needed for the `bz_assert_failure_` function. */
#if BZ_DEBUG
#include <stdio.h> // `fprintf`, `stderr`
#endif

#if BZ_USE_HASWELL
#include <immintrin.h>
#endif

#ifdef __cplusplus
extern "C" {
#endif

typedef int8_t bz_i8_t;
typedef uint8_t bz_u8_t;
typedef int16_t bz_i16_t;
typedef uint16_t bz_u16_t;
typedef int32_t bz_i32_t;
typedef uint32_t bz_u32_t;
typedef int64_t bz_i64_t;
typedef uint64_t bz_u64_t;
typedef size_t bz_size_t; // Pointer-sized, all buffer arithmetic is overflow-checked in it

/**
 *  @brief  Compile-time assert macro similar to `static_assert` in C++.
 */
#define bz_static_assert(condition, name) typedef char bz_static_assert_##name[(condition) ? 1 : -1]

bz_static_assert(sizeof(bz_size_t) == sizeof(void *), bz_size_t_must_be_pointer_size);
bz_static_assert(sizeof(bz_u64_t) == 8, bz_u64_t_must_be_8_bytes);

typedef unsigned char bz_byte_t; // Raw storage of pooled buffers

/**
 *  @brief Simple boolean type, until `_Bool` in C 99 and `true` and `false` in C 23.
 */
typedef enum { bz_false_k = 0, bz_true_k = 1 } bz_bool_t;

/**
 *  @brief A simple signed integer type describing the status of a faulty operation.
 *  @sa bz_success_k, bz_bad_alloc_k, bz_unencodable_k, bz_overflow_risk_k
 */
typedef enum bz_status_t {
    /** For algorithms that return a status, this status indicates that the operation was successful. */
    bz_success_k = 0,
    /** For algorithms that require memory allocation, this status indicates that the allocation failed. */
    bz_bad_alloc_k = -10,
    /** A required argument is missing or the descriptor is malformed. */
    bz_invalid_argument_k = -11,
    /** The input holds a code unit the encoding can't represent, and its fallback policy is to fail. */
    bz_unencodable_k = -12,
    /** The output buffer can't hold the next encoded character. */
    bz_output_exhausted_k = -13,
    /** For algorithms dealing with large inputs, this error reports that the size arithmetic would wrap. */
    bz_overflow_risk_k = -14,
    /** A sink-hole status for unknown errors. */
    bz_status_unknown_k = -1,
} bz_status_t;

/**
 *  @brief Stores a single Unicode @b rune / character / codepoint in @b UTF-32.
 *  @see https://en.wikipedia.org/wiki/UTF-32
 */
typedef bz_u32_t bz_rune_t;

/**
 *  @brief Stores a single @b UTF-16 code unit. A rune above U+FFFF takes two of those.
 *  @see https://en.wikipedia.org/wiki/UTF-16
 */
typedef bz_u16_t bz_unit_t;

#pragma region Memory Management

typedef void *(*bz_memory_allocate_t)(bz_size_t, void *);
typedef void (*bz_memory_free_t)(void *, bz_size_t, void *);

/**
 *  @brief  The buffer pool never calls `malloc` directly.
 *          This structure is used to pass the memory allocator to it, so that tests can inject failures.
 *  @sa     bz_memory_allocator_init_default
 */
typedef struct bz_memory_allocator_t {
    bz_memory_allocate_t allocate;
    bz_memory_free_t free;
    void *handle;
} bz_memory_allocator_t;

/**
 *  @brief Initializes a memory allocator to use the system default `malloc` and `free`.
 *  @param[in] alloc Memory allocator to initialize.
 */
BZ_PUBLIC void bz_memory_allocator_init_default(bz_memory_allocator_t *alloc);

#pragma endregion

/*  Implementation details, not part of the public API. */

/** @brief Helper-macro to mark potentially unused variables. */
#define bz_unused_(x) ((void)(x))

/**
 *  @brief  Defines `BZ_NULL`, analogous to `NULL`.
 */
#ifdef __GNUG__
#define BZ_NULL __null
#else
#define BZ_NULL ((void *)0)
#endif

#define BZ_SIZE_MAX ((bz_size_t)(-1))

/**
 *  @brief  Checks internal invariants in `BZ_DEBUG` builds, printing the failed condition and exiting.
 *          Compiles to nothing otherwise.
 */
#if BZ_DEBUG
BZ_PUBLIC void bz_assert_failure_(char const *condition, char const *file, int line) {
    fprintf(stderr, "Assertion failed: %s, in file %s, line %d\n", condition, file, line);
    exit(EXIT_FAILURE);
}
#define bz_assert_(condition)                                                     \
    do {                                                                          \
        if (!(condition)) { bz_assert_failure_(#condition, __FILE__, __LINE__); } \
    } while (0)
#else
#define bz_assert_(condition) ((void)(condition))
#endif

/*  Intrinsics aliases for MSVC, GCC, and Clang.
 */
#if defined(_MSC_VER) && !defined(__clang__)
#include <intrin.h>
BZ_INTERNAL int bz_u32_popcount(bz_u32_t x) { return (int)__popcnt(x); }
#else
BZ_INTERNAL int bz_u32_popcount(bz_u32_t x) { return __builtin_popcount(x); }
#endif

/**
 *  @brief  Multiplies two sizes, reporting whether the product would wrap around `bz_size_t`.
 *          All worst-case buffer computations go through this helper before any narrowing.
 */
BZ_INTERNAL bz_bool_t bz_size_mul_(bz_size_t a, bz_size_t b, bz_size_t *product) {
    if (a != 0 && b > BZ_SIZE_MAX / a) return bz_false_k;
    *product = a * b;
    return bz_true_k;
}

/** @brief Adds two sizes, reporting whether the sum would wrap around `bz_size_t`. */
BZ_INTERNAL bz_bool_t bz_size_add_(bz_size_t a, bz_size_t b, bz_size_t *sum) {
    if (b > BZ_SIZE_MAX - a) return bz_false_k;
    *sum = a + b;
    return bz_true_k;
}

#pragma region Serial Implementation

BZ_PUBLIC void *bz_memory_allocate_default_(bz_size_t length, void *handle) {
    bz_unused_(handle);
    if (length == 0) return BZ_NULL;
    return malloc(length);
}
BZ_PUBLIC void bz_memory_free_default_(void *start, bz_size_t length, void *handle) {
    bz_unused_(handle && length);
    free(start);
}

BZ_PUBLIC void bz_memory_allocator_init_default(bz_memory_allocator_t *alloc) {
    alloc->allocate = (bz_memory_allocate_t)bz_memory_allocate_default_;
    alloc->free = (bz_memory_free_t)bz_memory_free_default_;
    alloc->handle = BZ_NULL;
}

#pragma endregion

#ifdef __cplusplus
}
#endif // __cplusplus

#endif // BINZILLA_TYPES_H_
