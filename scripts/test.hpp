/**
 *  @brief  Helper structures and functions for C++ unit- and stress-tests.
 *  @file   test.hpp
 */
#pragma once
#include <cstdio>           // `std::printf`
#include <cstdlib>          // `std::getenv`, `std::strtoul`
#include <cstring>          // `std::strcmp`
#include <initializer_list> // `std::initializer_list`
#include <memory>           // `std::make_unique`
#include <random>           // `std::mt19937`
#include <string>           // `std::u16string`
#include <string_view>      // `std::u16string_view`
#include <vector>           // `std::vector`

#include <binzilla/binzilla.hpp>

namespace binzilla {
namespace scripts {

/**
 *  @brief  Returns the seed used for the global random number generator.
 *
 *  If `BZ_TESTS_SEED` is set, returns its value. Otherwise, generates a random seed
 *  using `std::random_device`. The seed is cached after the first call.
 */
inline std::mt19937::result_type global_random_seed() noexcept {
    static std::mt19937::result_type seed = []() {
        char const *seed_env = std::getenv("BZ_TESTS_SEED");
        if (seed_env && seed_env[0] != '\0') {
            auto parsed = static_cast<std::mt19937::result_type>(std::strtoul(seed_env, nullptr, 10));
            std::printf("BZ_TESTS_SEED=%u (from environment)\n", static_cast<unsigned>(parsed));
            return parsed;
        }
        std::random_device seed_source;
        auto generated = static_cast<std::mt19937::result_type>(seed_source());
        std::printf("BZ_TESTS_SEED=%u (randomly generated)\n", static_cast<unsigned>(generated));
        return generated;
    }();
    return seed;
}

/** @brief Global generator, seeded once with `global_random_seed()`. */
inline std::mt19937 &global_random_generator() noexcept {
    static std::mt19937 generator(global_random_seed());
    return generator;
}

/**
 *  @brief  Returns the multiplier for stress-test iteration counts, from `BZ_TESTS_MULTIPLIER`. Defaults to 1.0.
 */
inline double get_iterations_multiplier() noexcept {
    static double multiplier = []() {
        char const *env = std::getenv("BZ_TESTS_MULTIPLIER");
        if (env && env[0] != '\0') {
            double parsed = std::strtod(env, nullptr);
            if (parsed > 0.0) {
                std::printf("BZ_TESTS_MULTIPLIER=%.2f (from environment)\n", parsed);
                return parsed;
            }
        }
        return 1.0;
    }();
    return multiplier;
}

/** @brief Scales a baseline iteration count by the global multiplier, returning at least 1. */
inline std::size_t scale_iterations(std::size_t baseline) noexcept {
    double scaled = baseline * get_iterations_multiplier();
    return scaled < 1.0 ? 1 : static_cast<std::size_t>(scaled);
}

/**
 *  @brief  Checks if the long-running tests, that allocate gigabytes, are enabled with `BZ_TESTS_OUTERLOOP=1`.
 */
inline bool outer_loop_enabled() noexcept {
    char const *env = std::getenv("BZ_TESTS_OUTERLOOP");
    return env && std::strcmp(env, "1") == 0;
}

inline std::vector<u8_t> bytes_of(std::initializer_list<unsigned> values) {
    std::vector<u8_t> result;
    for (unsigned value : values) result.push_back(static_cast<u8_t>(value));
    return result;
}

inline std::vector<u8_t> bytes_of(char const *ascii) {
    std::vector<u8_t> result;
    for (; *ascii; ++ascii) result.push_back(static_cast<u8_t>(*ascii));
    return result;
}

/** @brief Concatenates @p count copies of @p pattern. */
inline std::u16string repeat(std::u16string_view pattern, std::size_t count) {
    std::u16string result;
    result.reserve(pattern.size() * count);
    for (std::size_t i = 0; i != count; ++i) result.append(pattern.data(), pattern.size());
    return result;
}

/** @brief Sweeps the BMP above Latin-1, producing a mix of 2- and 3-byte UTF-8 characters, but no surrogates. */
inline std::u16string generated_string(std::size_t count) {
    std::u16string result(count, u'\0');
    for (std::size_t i = 0; i != count; ++i) result[i] = static_cast<char16_t>((i % 0xF00) + 0x100);
    return result;
}

/**
 *  @brief  Random UTF-16 text drawing from every UTF-8 length class, with well-formed surrogate pairs.
 *  @param  lone_surrogates Also mix in unpaired surrogate halves.
 */
inline std::u16string random_utf16(std::size_t count, bool lone_surrogates = false) {
    std::mt19937 &generator = global_random_generator();
    std::uniform_int_distribution<int> kind(0, lone_surrogates ? 5 : 4);
    std::uniform_int_distribution<unsigned> ascii(0x20, 0x7E), two_bytes(0x80, 0x7FF), three_bytes(0x800, 0xD7FF),
        high(0xD800, 0xDBFF), low(0xDC00, 0xDFFF);
    std::u16string result;
    result.reserve(count);
    while (result.size() < count) {
        switch (kind(generator)) {
        case 0:
        case 1: result.push_back(static_cast<char16_t>(ascii(generator))); break;
        case 2: result.push_back(static_cast<char16_t>(two_bytes(generator))); break;
        case 3: result.push_back(static_cast<char16_t>(three_bytes(generator))); break;
        case 4:
            if (result.size() + 2 > count) break;
            result.push_back(static_cast<char16_t>(high(generator)));
            result.push_back(static_cast<char16_t>(low(generator)));
            break;
        default: result.push_back(static_cast<char16_t>(generator() % 2 ? high(generator) : low(generator))); break;
        }
    }
    return result;
}

/**
 *  @brief  Straightforward per-rune encoder, used as the ground truth for all buffer strategies.
 *  @throw  `encoding_error` for unencodable input under a failing fallback.
 */
inline std::vector<u8_t> reference_encode(std::u16string_view text, codec_t codec, fallback_t fallback,
                                          std::u16string_view replacement) noexcept(false) {
    std::vector<u8_t> output;
    auto export_rune = [&](char32_t rune) -> bool {
        switch (codec) {
        case codec_t::utf8_k:
            if (rune < 0x80) { output.push_back(static_cast<u8_t>(rune)); }
            else if (rune < 0x800) {
                output.push_back(static_cast<u8_t>(0xC0 | (rune >> 6)));
                output.push_back(static_cast<u8_t>(0x80 | (rune & 0x3F)));
            }
            else if (rune < 0x10000) {
                output.push_back(static_cast<u8_t>(0xE0 | (rune >> 12)));
                output.push_back(static_cast<u8_t>(0x80 | ((rune >> 6) & 0x3F)));
                output.push_back(static_cast<u8_t>(0x80 | (rune & 0x3F)));
            }
            else {
                output.push_back(static_cast<u8_t>(0xF0 | (rune >> 18)));
                output.push_back(static_cast<u8_t>(0x80 | ((rune >> 12) & 0x3F)));
                output.push_back(static_cast<u8_t>(0x80 | ((rune >> 6) & 0x3F)));
                output.push_back(static_cast<u8_t>(0x80 | (rune & 0x3F)));
            }
            return true;
        case codec_t::utf16le_k:
        case codec_t::utf16be_k: {
            std::u16string units;
            if (rune < 0x10000) { units.push_back(static_cast<char16_t>(rune)); }
            else {
                units.push_back(static_cast<char16_t>(0xD800 + ((rune - 0x10000) >> 10)));
                units.push_back(static_cast<char16_t>(0xDC00 + ((rune - 0x10000) & 0x3FF)));
            }
            for (char16_t unit : units) {
                u8_t const low = static_cast<u8_t>(unit & 0xFF), high = static_cast<u8_t>(unit >> 8);
                output.push_back(codec == codec_t::utf16le_k ? low : high);
                output.push_back(codec == codec_t::utf16le_k ? high : low);
            }
            return true;
        }
        case codec_t::ascii_k:
            if (rune > 0x7F) return false;
            output.push_back(static_cast<u8_t>(rune));
            return true;
        case codec_t::latin1_k:
            if (rune > 0xFF) return false;
            output.push_back(static_cast<u8_t>(rune));
            return true;
        }
        return false;
    };

    for (std::size_t i = 0; i < text.size();) {
        char32_t const unit = text[i];
        bool const is_high = unit >= 0xD800 && unit <= 0xDBFF;
        bool const is_low = unit >= 0xDC00 && unit <= 0xDFFF;
        bool encoded = false;
        if (!is_high && !is_low) { encoded = export_rune(unit), i += 1; }
        else if (is_high && i + 1 < text.size() && text[i + 1] >= 0xDC00 && text[i + 1] <= 0xDFFF) {
            encoded = export_rune(0x10000 + ((unit - 0xD800) << 10) + (text[i + 1] - 0xDC00)), i += 2;
        }
        else { i += 1; }
        if (encoded) continue;
        if (fallback == fallback_t::throw_k) throw encoding_error("Reference encoder met an unencodable unit");
        std::vector<u8_t> const substitute = reference_encode(replacement, codec, fallback_t::throw_k, {});
        output.insert(output.end(), substitute.begin(), substitute.end());
    }
    return output;
}

inline std::vector<u8_t> reference_encode(std::u16string_view text, encoding const &text_encoding) noexcept(false) {
    return reference_encode(text, text_encoding.codec(), text_encoding.fallback(), text_encoding.replacement());
}

/** @brief The 7-bit encoded byte count of the reference encoding, followed by the encoding itself. */
inline std::vector<u8_t> reference_prefixed(std::u16string_view text, encoding const &text_encoding) noexcept(false) {
    std::vector<u8_t> const body = reference_encode(text, text_encoding);
    std::vector<u8_t> output;
    std::uint64_t length = body.size();
    while (length >= 0x80) output.push_back(static_cast<u8_t>(length | 0x80)), length >>= 7;
    output.push_back(static_cast<u8_t>(length));
    output.insert(output.end(), body.begin(), body.end());
    return output;
}

/**
 *  @brief  A writer over a fresh `memory_sink`, keeping a non-owning pointer to inspect the output.
 */
struct captured_writer {
    memory_sink *sink = nullptr;
    binary_writer writer;

    explicit captured_writer(encoding text_encoding = encoding::utf8(), buffer_pool &pool = buffer_pool::shared())
        : writer(make(sink), std::move(text_encoding), pool) {}

    std::vector<u8_t> const &bytes() const noexcept { return sink->bytes(); }

  private:
    static std::unique_ptr<memory_sink> make(memory_sink *&observer) {
        auto output = std::make_unique<memory_sink>();
        observer = output.get();
        return output;
    }
};

/**
 *  @brief  Allocator that fails once a budget of successful allocations is exhausted.
 *          Plug it into a `buffer_pool` with `failing_allocator::make`.
 */
struct failing_allocator {
    std::size_t budget = 0;
    std::size_t allocations = 0;
    std::size_t frees = 0;

    static void *allocate(bz_size_t length, void *handle) {
        failing_allocator &self = *static_cast<failing_allocator *>(handle);
        if (self.allocations == self.budget) return nullptr;
        ++self.allocations;
        return bz_memory_allocate_default_(length, nullptr);
    }

    static void free(void *start, bz_size_t length, void *handle) {
        failing_allocator &self = *static_cast<failing_allocator *>(handle);
        ++self.frees;
        bz_memory_free_default_(start, length, nullptr);
    }

    bz_memory_allocator_t make() noexcept {
        bz_memory_allocator_t allocator;
        allocator.allocate = &failing_allocator::allocate;
        allocator.free = &failing_allocator::free;
        allocator.handle = this;
        return allocator;
    }
};

} // namespace scripts
} // namespace binzilla
