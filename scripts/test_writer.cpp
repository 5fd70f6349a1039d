#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <memory>
#include <new>
#include <string>
#include <utility>
#include <vector>

#include "test.hpp"

namespace bz = binzilla;
using bz::scripts::bytes_of;
using bz::scripts::captured_writer;
using bz::scripts::reference_encode;
using bz::scripts::reference_prefixed;

using bytes_t = std::vector<bz::u8_t>;

/** @brief Encodings that share the UTF-8 transform, but not the path through the writer. */
static std::vector<bz::encoding> utf8_flavors() {
    return {
        bz::encoding::utf8(),                                    // fast, default replacement
        bz::encoding::utf8_strict(),                             // fast, failing
        bz::encoding::utf8().with_replacement(u"x"),             // fast, one-unit replacement
        bz::encoding::utf8().with_replacement(u"xx"),            // generic, wide replacement
        bz::encoding::utf8().with_code_page(BZ_CODE_PAGE_UTF7),  // generic, foreign code page
    };
}

/** @brief Encodings for the generic path only. */
static std::vector<bz::encoding> other_encodings() {
    return {
        bz::encoding::utf16le(),
        bz::encoding::utf16be(),
        bz::encoding::ascii(),
        bz::encoding::latin1(),
        bz::encoding::ascii().with_replacement(std::u16string(100, u'v')),
    };
}

/** @brief Lengths around every strategy boundary of both paths, and one order of magnitude beyond. */
static std::vector<std::size_t> boundary_lengths() {
    std::size_t const inline_units = bz::binary_writer::inline_units_k;
    std::size_t const pooled_units = bz::binary_writer::pooled_units_k;
    return {
        0, 1, 24, inline_units - 1, inline_units, inline_units + 1, 1000, 8 * 1024,
        pooled_units - 1, pooled_units, pooled_units + 1, 32 * 1024, 48 * 1024, 256 * 1024,
    };
}

TEST(BinaryWriter, classifies_encoding_once) {
    EXPECT_TRUE(captured_writer(bz::encoding::utf8()).writer.uses_fast_utf8());
    EXPECT_TRUE(captured_writer(bz::encoding::utf8_strict()).writer.uses_fast_utf8());
    EXPECT_TRUE(captured_writer(bz::encoding::utf8().with_replacement(u"x")).writer.uses_fast_utf8());
    EXPECT_FALSE(captured_writer(bz::encoding::utf8().with_replacement(u"xx")).writer.uses_fast_utf8());
    EXPECT_FALSE(captured_writer(bz::encoding::utf8().with_code_page(BZ_CODE_PAGE_UTF7)).writer.uses_fast_utf8());
    EXPECT_FALSE(captured_writer(bz::encoding::utf16le()).writer.uses_fast_utf8());
    EXPECT_FALSE(captured_writer(bz::encoding::ascii()).writer.uses_fast_utf8());

    // The default writer is UTF-8 with U+FFFD substitution.
    captured_writer defaulted;
    EXPECT_TRUE(defaulted.writer.uses_fast_utf8());
    EXPECT_EQ(defaulted.writer.text_encoding().code_page(), BZ_CODE_PAGE_UTF8);
}

TEST(BinaryWriter, single_characters) {
    std::u16string const characters = {u'x', u'\u00E9', u'\u2130', u'\u0000', u'\u007F', u'\u0080', u'\u07FF',
                                       u'\u0800', u'\uFFFF', char16_t(0xD800), char16_t(0xDFFF)};
    std::vector<bz::encoding> encodings = utf8_flavors();
    for (bz::encoding const &other : other_encodings()) encodings.push_back(other);

    for (bz::encoding const &text_encoding : encodings) {
        for (char16_t character : characters) {
            std::u16string const text(1, character);
            captured_writer captured(text_encoding);
            bytes_t expected;
            bool unencodable = false;
            try {
                expected = reference_encode(text, text_encoding);
            }
            catch (bz::encoding_error const &) {
                unencodable = true;
            }
            if (unencodable) {
                EXPECT_THROW(captured.writer.write(character), bz::encoding_error);
                continue;
            }
            captured.writer.write(character);
            EXPECT_EQ(captured.bytes(), expected) << "U+" << std::hex << unsigned(character);
            EXPECT_EQ(captured.writer.position(), expected.size());
        }
    }

    captured_writer captured;
    captured.writer.write(u'x');
    captured.writer.write(u'\u00E9');
    captured.writer.write(u'\u2130');
    EXPECT_EQ(captured.bytes(), bytes_of({0x78, 0xC3, 0xA9, 0xE2, 0x84, 0xB0}));
}

TEST(BinaryWriter, single_character_with_wide_replacement) {
    // One unencodable character expands to 10'000 bytes, which needs a pooled buffer.
    bz::buffer_pool pool;
    bz::encoding const wide = bz::encoding::ascii().with_replacement(std::u16string(10000, u'v'));
    captured_writer captured(wide, pool);
    EXPECT_FALSE(captured.writer.uses_fast_utf8());

    captured.writer.write(u'\u00E9');
    EXPECT_EQ(captured.bytes(), bytes_t(10000, 'v'));
    EXPECT_EQ(pool.checkouts(), 1u);
    EXPECT_EQ(pool.outstanding(), 0u);

    // The worst case decides, so an encodable character takes a pooled buffer as well.
    captured.writer.write(u'a');
    EXPECT_EQ(captured.writer.position(), 10001u);
    EXPECT_EQ(pool.checkouts(), 2u);
    EXPECT_EQ(pool.outstanding(), 0u);
}

TEST(BinaryWriter, lone_surrogates_on_fast_path) {
    std::u16string const lone(1, char16_t(0xD800));

    captured_writer replacing;
    replacing.writer.write(char16_t(0xDC00));
    replacing.writer.write_chars(u"a" + lone + u"b");
    EXPECT_EQ(replacing.bytes(), bytes_of({0xEF, 0xBF, 0xBD, 0x61, 0xEF, 0xBF, 0xBD, 0x62}));

    captured_writer substituting(bz::encoding::utf8().with_replacement(u"?"));
    substituting.writer.write_chars(lone + u"\U0001F600");
    EXPECT_EQ(substituting.bytes(), bytes_of({0x3F, 0xF0, 0x9F, 0x98, 0x80}));

    captured_writer strict(bz::encoding::utf8_strict());
    EXPECT_THROW(strict.writer.write(char16_t(0xD800)), bz::encoding_error);
    EXPECT_THROW(strict.writer.write_chars(u"abc" + lone), bz::encoding_error);
    EXPECT_THROW(strict.writer.write(u"abc" + lone), bz::encoding_error);
}

TEST(BinaryWriter, character_buffers_match_reference) {
    std::vector<bz::encoding> encodings = utf8_flavors();
    for (bz::encoding const &other : other_encodings()) encodings.push_back(other);

    for (std::size_t length : boundary_lengths()) {
        std::u16string const generated = bz::scripts::generated_string(length);
        std::u16string const random = bz::scripts::random_utf16(length, false);
        for (bz::encoding const &text_encoding : encodings) {
            bz::buffer_pool pool;
            captured_writer captured(text_encoding, pool);
            bool const strict = text_encoding.fallback() == bz::fallback_t::throw_k;
            bool const lossy = text_encoding.codec() == bz::codec_t::ascii_k ||
                               text_encoding.codec() == bz::codec_t::latin1_k;
            if (strict && lossy) continue;

            captured.writer.write_chars(generated);
            bytes_t expected = reference_encode(generated, text_encoding);
            ASSERT_EQ(captured.bytes(), expected) << "length " << length << ", code page "
                                                   << text_encoding.code_page();

            captured.sink->clear();
            captured.writer.write_chars(random.data(), random.size());
            expected = reference_encode(random, text_encoding);
            ASSERT_EQ(captured.bytes(), expected) << "length " << length << ", code page "
                                                   << text_encoding.code_page();
            EXPECT_EQ(pool.outstanding(), 0u);
        }
    }
}

TEST(BinaryWriter, character_buffer_strategies) {
    bz::buffer_pool pool;
    captured_writer captured(bz::encoding::utf8(), pool);

    // Inline: no checkouts.
    captured.writer.write_chars(std::u16string(bz::binary_writer::inline_units_k, u'\u2023'));
    EXPECT_EQ(pool.checkouts(), 0u);
    EXPECT_EQ(captured.writer.position(), bz::binary_writer::inline_units_k * 3);

    // Pooled: a single checkout.
    captured.writer.write_chars(std::u16string(bz::binary_writer::inline_units_k + 1, u'\u2023'));
    EXPECT_EQ(pool.checkouts(), 1u);
    captured.writer.write_chars(std::u16string(bz::binary_writer::pooled_units_k, u'\u2023'));
    EXPECT_EQ(pool.checkouts(), 2u);

    // Chunked: a single checkout, however long the input.
    captured.writer.write_chars(std::u16string(bz::binary_writer::pooled_units_k * 10, u'\u2023'));
    EXPECT_EQ(pool.checkouts(), 3u);
    EXPECT_EQ(pool.outstanding(), 0u);
    EXPECT_EQ(captured.writer.position(), (bz::binary_writer::inline_units_k * 2 + 1 +
                                           bz::binary_writer::pooled_units_k * 11) * 3);

    // Empty buffers write nothing and touch nothing.
    captured.writer.write_chars(nullptr, 0);
    captured.writer.write_chars(std::u16string_view());
    EXPECT_EQ(pool.checkouts(), 3u);
    EXPECT_THROW(captured.writer.write_chars(nullptr, 1), std::invalid_argument);
}

TEST(BinaryWriter, surrogate_pairs_across_chunk_boundaries) {
    // Place a pair right around the end of the first chunk for every chunk geometry.
    std::vector<bz::encoding> const encodings = {
        bz::encoding::utf8(),
        bz::encoding::utf8_strict(),
        bz::encoding::utf8().with_code_page(BZ_CODE_PAGE_UTF7),
        bz::encoding::utf16le(),
        bz::encoding::utf16be(),
        bz::encoding::ascii(),
    };
    for (bz::encoding const &text_encoding : encodings) {
        std::size_t const per_unit = text_encoding.max_bytes_per_unit();
        std::size_t const slice = BZ_POOLED_CAPACITY / per_unit - 1;
        for (std::size_t position = slice - 3; position != slice + 3; ++position) {
            std::u16string text = bz::scripts::generated_string(slice * 2 + 7);
            text[position] = char16_t(0xD83D);
            text[position + 1] = char16_t(0xDE00);

            captured_writer characters(text_encoding);
            characters.writer.write_chars(text);
            ASSERT_EQ(characters.bytes(), reference_encode(text, text_encoding))
                << "pair at " << position << ", code page " << text_encoding.code_page();

            captured_writer prefixed(text_encoding);
            prefixed.writer.write(text);
            ASSERT_EQ(prefixed.bytes(), reference_prefixed(text, text_encoding))
                << "pair at " << position << ", code page " << text_encoding.code_page();
        }
    }
}

TEST(BinaryWriter, prefixed_strings_match_reference) {
    std::vector<bz::encoding> encodings = utf8_flavors();
    for (bz::encoding const &other : other_encodings()) encodings.push_back(other);

    for (std::size_t length : boundary_lengths()) {
        std::u16string const text = bz::scripts::random_utf16(length, false);
        for (bz::encoding const &text_encoding : encodings) {
            if (text_encoding.fallback() == bz::fallback_t::throw_k) continue;
            bz::buffer_pool pool;
            captured_writer captured(text_encoding, pool);
            captured.writer.write(text);
            ASSERT_EQ(captured.bytes(), reference_prefixed(text, text_encoding))
                << "length " << length << ", code page " << text_encoding.code_page();
            EXPECT_EQ(pool.outstanding(), 0u);

            // The prefix decodes to the exact body length.
            bz::u64_t body_length = 0;
            bz::size_t prefix_length = 0;
            ASSERT_EQ(bz_varint_decode(captured.bytes().data(), captured.bytes().size(), BZ_VARINT_MAX_LENGTH,
                                       &body_length, &prefix_length),
                      bz_success_k);
            EXPECT_EQ(prefix_length + body_length, captured.bytes().size());
        }
    }
}

TEST(BinaryWriter, prefixed_strings_at_inline_boundary) {
    // 42 characters of U+2023 take 126 bytes and a 1-byte prefix, 43 take 129 bytes and a 2-byte prefix.
    std::size_t const inline_units = bz::binary_writer::inline_units_k;
    for (std::size_t length : {inline_units, inline_units + 1}) {
        bz::buffer_pool pool;
        captured_writer captured(bz::encoding::utf8(), pool);
        std::u16string const text(length, u'\u2023');
        captured.writer.write(text);

        bytes_t expected;
        bz::u8_t prefix[BZ_VARINT_MAX_LENGTH];
        expected.assign(prefix, prefix + bz_varint_encode(length * 3, prefix));
        for (std::size_t i = 0; i != length; ++i) expected.insert(expected.end(), {0xE2, 0x80, 0xA3});
        EXPECT_EQ(captured.bytes(), expected);
        EXPECT_EQ(pool.checkouts(), length == inline_units ? 0u : 1u);
    }
}

TEST(BinaryWriter, prefixed_strings_known_bytes) {
    captured_writer captured;
    captured.writer.write(u"");
    EXPECT_EQ(captured.bytes(), bytes_of({0x00}));

    captured.sink->clear();
    captured.writer.write(std::u16string_view());
    EXPECT_EQ(captured.bytes(), bytes_of({0x00}));

    captured_writer strict(bz::encoding::utf8_strict());
    strict.writer.write(std::u16string_view());
    strict.writer.write_chars(std::u16string_view());
    EXPECT_EQ(strict.bytes(), bytes_of({0x00}));

    captured.sink->clear();
    captured.writer.write(u"h\u00E9llo");
    EXPECT_EQ(captured.bytes(), bytes_of({0x06, 0x68, 0xC3, 0xA9, 0x6C, 0x6C, 0x6F}));

    captured.sink->clear();
    captured.writer.write(std::u16string(200, u'a'));
    ASSERT_EQ(captured.bytes().size(), 202u);
    EXPECT_EQ(captured.bytes()[0], 0xC8);
    EXPECT_EQ(captured.bytes()[1], 0x01);

    captured_writer utf16(bz::encoding::utf16le());
    utf16.writer.write(u"A\u20AC");
    EXPECT_EQ(utf16.bytes(), bytes_of({0x04, 0x41, 0x00, 0xAC, 0x20}));

    captured_writer empty_generic(bz::encoding::latin1());
    empty_generic.writer.write(u"");
    EXPECT_EQ(empty_generic.bytes(), bytes_of({0x00}));

    EXPECT_THROW(captured.writer.write(static_cast<char16_t const *>(nullptr)), std::invalid_argument);
}

TEST(BinaryWriter, encoding_errors_precede_the_prefix) {
    std::u16string const lone(1, char16_t(0xDFFF));
    for (std::size_t length : {std::size_t(10), std::size_t(1000), std::size_t(100000)}) {
        for (bz::encoding const &strict : {bz::encoding::utf8_strict(), bz::encoding::ascii().with_throw(),
                                           bz::encoding::utf8_strict().with_code_page(BZ_CODE_PAGE_UTF7)}) {
            bz::buffer_pool pool;
            captured_writer captured(strict, pool);
            std::u16string text(length, u'a');
            text.back() = strict.codec() == bz::codec_t::ascii_k ? u'\u00E9' : lone[0];
            EXPECT_THROW(captured.writer.write(text), bz::encoding_error);
            EXPECT_EQ(captured.bytes().size(), 0u) << "length " << length;
            EXPECT_EQ(pool.outstanding(), 0u);
        }
    }
}

TEST(BinaryWriter, pooled_buffers_survive_failures) {
    // An encoding error in the middle of a chunked write.
    {
        bz::buffer_pool pool;
        captured_writer captured(bz::encoding::utf8_strict(), pool);
        std::u16string text = bz::scripts::generated_string(bz::binary_writer::pooled_units_k * 4);
        text[text.size() / 2] = char16_t(0xDC00);
        EXPECT_THROW(captured.writer.write_chars(text), bz::encoding_error);
        EXPECT_GT(captured.writer.position(), 0u);
        EXPECT_EQ(pool.outstanding(), 0u);
        EXPECT_EQ(pool.checkouts(), 1u);
    }
    // An encoding error in the middle of a generic chunked write.
    {
        bz::buffer_pool pool;
        captured_writer captured(bz::encoding::latin1().with_throw(), pool);
        std::u16string text(200000, u'\u00E9');
        text[150000] = u'\u20AC';
        EXPECT_THROW(captured.writer.write_chars(text), bz::encoding_error);
        EXPECT_GT(captured.writer.position(), 0u);
        EXPECT_EQ(pool.outstanding(), 0u);
    }
    // An encoding error from a pooled write.
    {
        bz::buffer_pool pool;
        captured_writer captured(bz::encoding::utf8_strict(), pool);
        std::u16string text(1000, u'a');
        text[500] = char16_t(0xD800);
        EXPECT_THROW(captured.writer.write_chars(text), bz::encoding_error);
        EXPECT_EQ(pool.checkouts(), 1u);
        EXPECT_EQ(pool.outstanding(), 0u);
    }
    // An allocation failure: nothing is written and nothing leaks.
    {
        bz::scripts::failing_allocator allocator;
        bz::buffer_pool pool(allocator.make());
        captured_writer captured(bz::encoding::utf8(), pool);
        EXPECT_THROW(captured.writer.write(std::u16string(1000, u'a')), std::bad_alloc);
        EXPECT_THROW(captured.writer.write_chars(std::u16string(100000, u'a')), std::bad_alloc);
        EXPECT_EQ(captured.bytes().size(), 0u);
        EXPECT_EQ(pool.outstanding(), 0u);

        // Short strings never need the pool.
        captured.writer.write(u"fine");
        EXPECT_EQ(captured.bytes(), bytes_of({0x04, 'f', 'i', 'n', 'e'}));
    }
}

TEST(BinaryWriter, primitives_are_little_endian) {
    captured_writer captured;
    bz::binary_writer &writer = captured.writer;
    writer.write(true);
    writer.write(false);
    writer.write(bz::u8_t(0xAB));
    writer.write(bz::i8_t(-2));
    writer.write(bz::u16_t(0x1234));
    writer.write(bz::i16_t(-2));
    writer.write(bz::u32_t(0x12345678));
    writer.write(bz::i32_t(-1));
    writer.write(bz::u64_t(0x0102030405060708ull));
    writer.write(bz::i64_t(std::numeric_limits<std::int64_t>::min()));
    writer.write(bz::f32_t(1.0f));
    writer.write(bz::f64_t(-2.0));
    bz::u8_t const raw[3] = {0xDE, 0xAD, 0x00};
    writer.write_bytes(raw, sizeof(raw));
    writer.write_bytes(nullptr, 0);

    EXPECT_EQ(captured.bytes(), bytes_of({
                                    0x01, 0x00,                                     // booleans
                                    0xAB, 0xFE,                                     // bytes
                                    0x34, 0x12, 0xFE, 0xFF,                         // 16-bit
                                    0x78, 0x56, 0x34, 0x12, 0xFF, 0xFF, 0xFF, 0xFF, // 32-bit
                                    0x08, 0x07, 0x06, 0x05, 0x04, 0x03, 0x02, 0x01, // unsigned 64-bit
                                    0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x80, // signed 64-bit
                                    0x00, 0x00, 0x80, 0x3F,                         // binary32
                                    0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0xC0, // binary64
                                    0xDE, 0xAD, 0x00,                               // raw
                                }));
    EXPECT_THROW(writer.write_bytes(nullptr, 1), std::invalid_argument);
}

/**
 *  @brief  Checks a repeating byte pattern on the fly, so that gigabytes can be verified without storing them.
 *          The first @p head_length bytes are kept aside, for the length prefix.
 */
class pattern_sink : public bz::sink {
    bytes_t pattern_;
    bz::size_t head_length_ = 0;
    bytes_t head_;
    bz::u64_t position_ = 0;
    bz::u64_t mismatches_ = 0;

  public:
    pattern_sink(bytes_t pattern, bz::size_t head_length) : pattern_(std::move(pattern)), head_length_(head_length) {}

    void write(void const *data, bz::size_t length) override {
        bz::u8_t const *bytes = static_cast<bz::u8_t const *>(data);
        for (bz::size_t i = 0; i != length; ++i, ++position_) {
            if (position_ < head_length_) { head_.push_back(bytes[i]); }
            else if (bytes[i] != pattern_[(position_ - head_length_) % pattern_.size()]) { ++mismatches_; }
        }
    }
    bz::u64_t position() const override { return position_; }
    void seek(bz::u64_t position) override { position_ = position; }

    bytes_t const &head() const noexcept { return head_; }
    bz::u64_t mismatches() const noexcept { return mismatches_; }
};

TEST(BinaryWriterOuterLoop, lengths_past_2gb) {
    if (!bz::scripts::outer_loop_enabled()) GTEST_SKIP() << "Set BZ_TESTS_OUTERLOOP=1 to run";
    if (sizeof(bz::size_t) < 8) GTEST_SKIP() << "Needs a 64-bit address space";

    // U+0224 takes 2 bytes, so the body is 3 bytes longer than the largest signed 32-bit integer.
    bz::u64_t const body_length = bz::u64_t(std::numeric_limits<std::int32_t>::max()) + 3;
    bz::size_t const count = static_cast<bz::size_t>(body_length / 2);
    std::u16string text;
    try {
        text.assign(count, u'\u0224');
    }
    catch (std::bad_alloc const &) {
        GTEST_SKIP() << "Not enough memory for a " << count << " character string";
    }

    {
        auto output = std::make_unique<pattern_sink>(bytes_of({0xC8, 0xA4}), 0);
        pattern_sink &observer = *output;
        bz::binary_writer writer(std::move(output));
        writer.write_chars(text);
        EXPECT_EQ(writer.position(), body_length);
        EXPECT_EQ(observer.mismatches(), 0u);
    }
    {
        auto output = std::make_unique<pattern_sink>(bytes_of({0xC8, 0xA4}), 5);
        pattern_sink &observer = *output;
        bz::binary_writer writer(std::move(output));
        writer.write(text);
        EXPECT_EQ(writer.position(), body_length + 5);
        EXPECT_EQ(observer.head(), bytes_of({0x82, 0x80, 0x80, 0x80, 0x08}));
        EXPECT_EQ(observer.mismatches(), 0u);
    }
}
