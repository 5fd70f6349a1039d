/**
 *  @file   bench_writer.cpp
 *  @brief  Benchmarks the `binary_writer` text paths against each other.
 *
 *  Benchmarks include:
 *  - Prefixed strings on the UTF-8 fast path, across the inline, pooled and chunked lengths.
 *  - Character buffers on the fast path against the generic encoder with the same bytes on output.
 *  - Primitives and 7-bit encoded integers, as the baseline cost of a sink call.
 *
 *  Output goes to a `counting_sink`, so only encoding and buffering are measured.
 *
 *  @code{.sh}
 *  cmake -D CMAKE_BUILD_TYPE=Release -B build_release
 *  cmake --build build_release --config Release --target binzilla_bench_writer
 *  build_release/binzilla_bench_writer --benchmark_filter=fast
 *  @endcode
 */
#include <cstdint>
#include <memory>
#include <random>
#include <string>

#include <benchmark/benchmark.h>

#include <binzilla/binzilla.hpp>

namespace bm = benchmark;
namespace bz = binzilla;

constexpr double default_secs_k = 1;

/** @brief Mixes ASCII, two- and three-byte characters, and surrogate pairs in a 6:2:1:1 ratio. */
static std::u16string mixed_text(std::size_t count) {
    std::mt19937 generator(42);
    std::uniform_int_distribution<int> kind(0, 9);
    std::u16string text;
    text.reserve(count + 1);
    while (text.size() < count) {
        int const roll = kind(generator);
        if (roll < 6) text.push_back(static_cast<char16_t>('a' + roll));
        else if (roll < 8) text.push_back(static_cast<char16_t>(0x00E0 + roll));
        else if (roll < 9) text.push_back(static_cast<char16_t>(0x4E00 + roll));
        else if (text.size() + 2 <= count) text.append(u"\U0001F600");
        else text.push_back(u'z');
    }
    return text;
}

static bz::binary_writer counting_writer(bz::encoding text_encoding) {
    return bz::binary_writer(std::make_unique<bz::counting_sink>(), std::move(text_encoding));
}

static void report_bytes(bm::State &state, bz::binary_writer const &writer) {
    state.counters["bytes/s"] = bm::Counter(static_cast<double>(writer.position()), bm::Counter::kIsRate);
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations()));
}

static void strings_fast(bm::State &state) {
    std::u16string const text = mixed_text(static_cast<std::size_t>(state.range(0)));
    bz::binary_writer writer = counting_writer(bz::encoding::utf8());
    for (auto _ : state) writer.write(text);
    report_bytes(state, writer);
}

static void strings_generic(bm::State &state) {
    std::u16string const text = mixed_text(static_cast<std::size_t>(state.range(0)));
    bz::binary_writer writer = counting_writer(bz::encoding::utf16le());
    for (auto _ : state) writer.write(text);
    report_bytes(state, writer);
}

template <bool fast_ak>
static void chars(bm::State &state) {
    std::u16string const text = mixed_text(static_cast<std::size_t>(state.range(0)));
    // A multi-unit replacement keeps the same bytes on output but disables the fast path.
    bz::encoding const text_encoding =
        fast_ak ? bz::encoding::utf8() : bz::encoding::utf8().with_replacement(u"\uFFFD\uFFFD");
    bz::binary_writer writer = counting_writer(text_encoding);
    for (auto _ : state) writer.write_chars(text);
    report_bytes(state, writer);
}

static void primitives(bm::State &state) {
    bz::binary_writer writer = counting_writer(bz::encoding::utf8());
    std::uint32_t value = 1;
    for (auto _ : state) {
        writer.write(value);
        writer.write(static_cast<bz::f64_t>(value));
        writer.write_7bit_encoded(value);
        value = value * 1664525u + 1013904223u;
    }
    report_bytes(state, writer);
}

int main(int argc, char **argv) {

    // Lengths straddle the inline, pooled and chunked strategies.
    bm::RegisterBenchmark("strings_fast", strings_fast)
        ->MinTime(default_secs_k)
        ->Arg(16)
        ->Arg(static_cast<std::int64_t>(bz::binary_writer::inline_units_k))
        ->Arg(1024)
        ->Arg(static_cast<std::int64_t>(bz::binary_writer::pooled_units_k))
        ->Arg(1 << 20);
    bm::RegisterBenchmark("strings_generic", strings_generic)
        ->MinTime(default_secs_k)
        ->Arg(16)
        ->Arg(1024)
        ->Arg(1 << 20);

    // Same bytes, different paths
    bm::RegisterBenchmark("chars_fast", chars<true>)->MinTime(default_secs_k)->Arg(16)->Arg(1024)->Arg(1 << 20);
    bm::RegisterBenchmark("chars_generic", chars<false>)->MinTime(default_secs_k)->Arg(16)->Arg(1024)->Arg(1 << 20);

    bm::RegisterBenchmark("primitives", primitives)->MinTime(default_secs_k);

    bm::Initialize(&argc, argv);
    bm::RunSpecifiedBenchmarks();
    return 0;
}
