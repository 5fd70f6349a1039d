#include <gtest/gtest.h>

#include <ios>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "test.hpp"

namespace bz = binzilla;
using bz::scripts::bytes_of;

TEST(Sink, memory_sink_overwrites_and_extends) {
    bz::memory_sink sink;
    sink.write("abcdef", 6);
    EXPECT_EQ(sink.position(), 6u);
    sink.seek(2);
    sink.write("XY", 2);
    EXPECT_EQ(sink.position(), 4u);
    EXPECT_EQ(sink.bytes(), bytes_of("abXYef"));

    // Seeking past the end leaves a zero-filled gap.
    sink.seek(8);
    sink.write("!", 1);
    EXPECT_EQ(sink.bytes(), bytes_of({'a', 'b', 'X', 'Y', 'e', 'f', 0, 0, '!'}));

    sink.write(nullptr, 0);
    EXPECT_EQ(sink.size(), 9u);
    sink.clear();
    EXPECT_EQ(sink.size(), 0u);
    EXPECT_EQ(sink.position(), 0u);
}

TEST(Sink, span_sink_rejects_overflowing_writes) {
    char buffer[8] = {'-', '-', '-', '-', '-', '-', '-', '-'};
    bz::span_sink sink(buffer, sizeof(buffer));
    sink.write("hello", 5);
    EXPECT_EQ(sink.position(), 5u);
    EXPECT_THROW(sink.write("world", 5), std::ios_base::failure);
    EXPECT_EQ(std::string(buffer, 8), "hello---");
    EXPECT_EQ(sink.position(), 5u);

    sink.write("!!!", 3);
    EXPECT_EQ(sink.length(), 8u);
    sink.seek(0);
    sink.write("J", 1);
    EXPECT_EQ(std::string(buffer, 8), "Jello!!!");
    EXPECT_EQ(sink.length(), 8u);
    EXPECT_THROW(sink.seek(9), std::out_of_range);
}

TEST(Sink, stream_sink_forwards) {
    std::ostringstream stream;
    bz::stream_sink sink(stream);
    sink.write("abc", 3);
    EXPECT_EQ(sink.position(), 3u);
    sink.seek(1);
    sink.write("Z", 1);
    sink.flush();
    EXPECT_EQ(stream.str(), "aZc");

    std::ostringstream broken;
    broken.setstate(std::ios_base::badbit);
    bz::stream_sink failing(broken);
    EXPECT_THROW(failing.write("abc", 3), std::ios_base::failure);
    EXPECT_THROW(failing.position(), std::ios_base::failure);
}

TEST(Sink, counting_sink_tracks_positions) {
    bz::counting_sink sink;
    sink.write(nullptr, 100);
    sink.write(nullptr, 0);
    EXPECT_EQ(sink.position(), 100u);
    EXPECT_EQ(sink.writes(), 2u);
    sink.seek(10);
    sink.write(nullptr, 5);
    EXPECT_EQ(sink.position(), 15u);
    EXPECT_EQ(sink.length(), 100u);
}

TEST(Sink, writer_forwards_sink_controls) {
    auto output = std::make_unique<bz::memory_sink>();
    bz::memory_sink *observer = output.get();
    bz::binary_writer writer(std::move(output));
    writer.write(bz::u32_t(0x01020304));
    EXPECT_EQ(writer.position(), 4u);
    writer.seek(1);
    writer.write(bz::u8_t(0xFF));
    writer.flush();
    EXPECT_EQ(observer->bytes(), bytes_of({0x04, 0xFF, 0x02, 0x01}));
    EXPECT_EQ(&writer.output(), observer);

    std::unique_ptr<bz::sink> released = writer.release();
    EXPECT_EQ(released.get(), observer);
}

TEST(Sink, writer_rejects_null_sink) {
    EXPECT_THROW((void)bz::binary_writer(nullptr), std::invalid_argument);
}

TEST(Sink, writer_propagates_sink_failures) {
    bz::buffer_pool pool;
    std::vector<char> storage(1000);
    bz::binary_writer writer(std::make_unique<bz::span_sink>(storage.data(), storage.size()), bz::encoding::utf8(),
                             pool);

    // Fits
    writer.write(std::u16string(500, u'a'));
    EXPECT_EQ(writer.position(), 502u);

    // Doesn't fit, thrown from a pooled write, with the buffer returned.
    EXPECT_THROW(writer.write(std::u16string(1000, u'b')), std::ios_base::failure);
    EXPECT_EQ(pool.outstanding(), 0u);

    // Doesn't fit, thrown from a chunked write.
    writer.seek(0);
    EXPECT_THROW(writer.write_chars(std::u16string(100000, u'c')), std::ios_base::failure);
    EXPECT_EQ(pool.outstanding(), 0u);
}
