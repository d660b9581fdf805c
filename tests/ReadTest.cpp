#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>

#include <unistd.h>

#include "edn/Edn.h"

using ednkit::common::IoErr;
using ednkit::common::IoResult;
using ednkit::edn::Deserializer;
using ednkit::edn::ErrorCode;
using ednkit::edn::FdReader;
using ednkit::edn::FileReader;
using ednkit::edn::IoRead;
using ednkit::edn::Reader;
using ednkit::edn::SliceRead;
using ednkit::edn::StrRead;
using ednkit::edn::Value;
using ednkit::edn::from_reader;
using ednkit::edn::from_slice;
using ednkit::edn::from_str;

namespace {

// Hands out at most `chunk` bytes per read so tokens straddle buffer refills.
class ChunkedReader final : public Reader {
public:
    ChunkedReader(std::string data, std::size_t chunk) : data_(std::move(data)), chunk_(chunk) {}

    [[nodiscard]] IoResult<std::size_t> read(char *buf, std::size_t len) override {
        std::size_t n = std::min({len, chunk_, data_.size() - pos_});
        std::copy_n(data_.data() + pos_, n, buf);
        pos_ += n;
        return n;
    }

private:
    std::string data_;
    std::size_t chunk_;
    std::size_t pos_ = 0;
};

class BrokenReader final : public Reader {
public:
    [[nodiscard]] IoResult<std::size_t> read(char *, std::size_t) override {
        return std::unexpected(IoErr::BrokenPipe);
    }
};

Value from_bytes(std::string_view text) {
    auto value = from_slice(reinterpret_cast<const std::uint8_t *>(text.data()), text.size());
    EXPECT_TRUE(value.has_value()) << text;
    return value ? *value : Value();
}

Value from_chunks(std::string_view text, std::size_t chunk) {
    ChunkedReader reader{std::string(text), chunk};
    auto value = from_reader(reader);
    EXPECT_TRUE(value.has_value()) << text << ": " << (value ? "" : value.error().to_string());
    return value ? *value : Value();
}

} // namespace

TEST(ReadTest, SourcesAgree) {
    const char *docs[] = {
            "(println :foo \"foo\" 42 42.3 true)",
            "{:a [1 2 #{3}] \"k\" \\newline nil -9}",
            "\"esc \\\"quoted\\\" \\u00e9 \\ud83d\\ude00\"",
            "[trueX tru nilly false ##-Inf]",
            "(println(println[[:foo [(true 1 42.0)]]\"hi\"]))",
    };
    for (const char *doc : docs) {
        auto expected = from_str(doc);
        ASSERT_TRUE(expected.has_value()) << doc;
        EXPECT_EQ(from_bytes(doc), *expected) << doc;
        EXPECT_EQ(from_chunks(doc, 1), *expected) << doc;
        EXPECT_EQ(from_chunks(doc, 3), *expected) << doc;
        EXPECT_EQ(from_chunks(doc, 4096), *expected) << doc;
    }
}

TEST(ReadTest, SourcesReportSamePosition) {
    const char *doc = "[1\n  2\n  {:a}]";
    auto from_text = from_str(doc);
    ChunkedReader reader{doc, 2};
    auto from_io = from_reader(reader);
    ASSERT_FALSE(from_text.has_value());
    ASSERT_FALSE(from_io.has_value());
    EXPECT_EQ(from_text.error().code(), ErrorCode::ExpectedMapValue);
    EXPECT_EQ(from_io.error().code(), ErrorCode::ExpectedMapValue);
    EXPECT_EQ(from_text.error().line(), from_io.error().line());
    EXPECT_EQ(from_text.error().column(), from_io.error().column());
}

TEST(ReadTest, SliceBorrowsPlainText) {
    std::string scratch;
    SliceRead read("plain\" rest");
    auto text = read.parse_str(scratch);
    ASSERT_TRUE(text.has_value());
    EXPECT_TRUE(text->is_borrowed());
    EXPECT_EQ(text->view(), "plain");
}

TEST(ReadTest, SliceCopiesEscapedText) {
    std::string scratch;
    SliceRead read("a\\nb\"");
    auto text = read.parse_str(scratch);
    ASSERT_TRUE(text.has_value());
    EXPECT_FALSE(text->is_borrowed());
    EXPECT_EQ(text->view(), "a\nb");
}

TEST(ReadTest, IoReadAlwaysCopies) {
    ChunkedReader reader{"plain\"", 64};
    IoRead read(reader);
    std::string scratch;
    auto text = read.parse_str(scratch);
    ASSERT_TRUE(text.has_value());
    EXPECT_FALSE(text->is_borrowed());
    EXPECT_EQ(text->view(), "plain");
}

TEST(ReadTest, SliceRejectsInvalidUtf8) {
    const std::uint8_t bytes[] = {'"', 0xC3, 0x28, '"'};
    auto value = from_slice(bytes, sizeof(bytes));
    ASSERT_FALSE(value.has_value());
    EXPECT_EQ(value.error().code(), ErrorCode::InvalidUnicodeCodePoint);
}

TEST(ReadTest, PeekAndPositions) {
    SliceRead read("a\nb");
    EXPECT_EQ(**read.peek(), 'a');
    EXPECT_EQ(read.byte_offset(), 0u);
    EXPECT_EQ(**read.next(), 'a');
    EXPECT_EQ(**read.next(), '\n');
    EXPECT_EQ(read.position().line, 2u);
    EXPECT_EQ(read.position().column, 0u);
    EXPECT_EQ(**read.next(), 'b');
    EXPECT_FALSE(read.next()->has_value());
    EXPECT_EQ(read.byte_offset(), 3u);
}

TEST(ReadTest, ReaderFailureSurfacesAsIoError) {
    BrokenReader reader;
    auto value = from_reader(reader);
    ASSERT_FALSE(value.has_value());
    EXPECT_TRUE(value.error().is_io());
    EXPECT_EQ(value.error().io_error(), IoErr::BrokenPipe);
}

TEST(ReadTest, FileReader) {
    std::FILE *file = std::tmpfile();
    ASSERT_NE(file, nullptr);
    const char doc[] = "{:port 8080 :hosts [\"a\" \"b\"]}";
    ASSERT_EQ(std::fwrite(doc, 1, sizeof(doc) - 1, file), sizeof(doc) - 1);
    std::rewind(file);

    FileReader reader(file);
    auto value = from_reader(reader);
    std::fclose(file);
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, *from_str(doc));
}

TEST(ReadTest, FdReader) {
    int fds[2];
    ASSERT_EQ(::pipe(fds), 0);
    const char doc[] = "(1 2 3)";
    ASSERT_EQ(::write(fds[1], doc, sizeof(doc) - 1), static_cast<ssize_t>(sizeof(doc) - 1));
    ::close(fds[1]);

    FdReader reader(fds[0]);
    auto value = from_reader(reader);
    ::close(fds[0]);
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, Value::list({Value(1), Value(2), Value(3)}));
}

TEST(ReadTest, StrReadDeserializerOffset) {
    Deserializer<StrRead> de{StrRead("  42  ")};
    auto value = de.parse_value();
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(de.byte_offset(), 4u);
    EXPECT_TRUE(de.end().has_value());
}
