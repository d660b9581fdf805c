#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>

#include <unistd.h>

#include "edn/EdnEncode.h"

using ednkit::common::IoErr;
using ednkit::common::IoResult;
using ednkit::edn::ErrorCode;
using ednkit::edn::FdSink;
using ednkit::edn::Generator;
using ednkit::edn::Number;
using ednkit::edn::OutputSink;
using ednkit::edn::StringSink;
using ednkit::edn::generator_result;

namespace {
class FailingSink final : public OutputSink {
public:
    explicit FailingSink(std::size_t capacity) : capacity_(capacity) {}

    [[nodiscard]] IoResult<void> write(const char *data, std::size_t len) override {
        if (len > capacity_) {
            return std::unexpected(IoErr::NoSpace);
        }
        capacity_ -= len;
        output.append(data, len);
        return {};
    }

    std::string output;

private:
    std::size_t capacity_;
};
} // namespace

TEST(GeneratorTest, MapWithValues) {
    StringSink sink;
    Generator gen(sink);
    EXPECT_EQ(gen.map_open(), Generator::Result::OK);
    EXPECT_EQ(gen.keyword("name"), Generator::Result::OK);
    EXPECT_EQ(gen.string("ednkit"), Generator::Result::OK);
    EXPECT_EQ(gen.keyword("port"), Generator::Result::OK);
    EXPECT_EQ(gen.integer(8080), Generator::Result::OK);
    EXPECT_EQ(gen.map_close(), Generator::Result::OK);

    EXPECT_EQ(sink.str(), "{:name \"ednkit\" :port 8080}");
}

TEST(GeneratorTest, SequenceKinds) {
    StringSink sink;
    Generator gen(sink);
    EXPECT_EQ(gen.list_open(), Generator::Result::OK);
    EXPECT_EQ(gen.symbol("println"), Generator::Result::OK);
    EXPECT_EQ(gen.vector_open(), Generator::Result::OK);
    EXPECT_EQ(gen.integer(1), Generator::Result::OK);
    EXPECT_EQ(gen.bool_value(true), Generator::Result::OK);
    EXPECT_EQ(gen.nil_value(), Generator::Result::OK);
    EXPECT_EQ(gen.vector_close(), Generator::Result::OK);
    EXPECT_EQ(gen.set_open(), Generator::Result::OK);
    EXPECT_EQ(gen.keyword("a"), Generator::Result::OK);
    EXPECT_EQ(gen.set_close(), Generator::Result::OK);
    EXPECT_EQ(gen.list_close(), Generator::Result::OK);

    EXPECT_EQ(sink.str(), "(println [1 true nil] #{:a})");
}

TEST(GeneratorTest, BeautifyIndent) {
    StringSink sink;
    Generator gen(sink);
    gen.set_option(Generator::Option::Beauty, true);
    gen.set_indent_string("  ");

    EXPECT_EQ(gen.map_open(), Generator::Result::OK);
    EXPECT_EQ(gen.keyword("a"), Generator::Result::OK);
    EXPECT_EQ(gen.integer(1), Generator::Result::OK);
    EXPECT_EQ(gen.keyword("b"), Generator::Result::OK);
    EXPECT_EQ(gen.vector_open(), Generator::Result::OK);
    EXPECT_EQ(gen.string("x"), Generator::Result::OK);
    EXPECT_EQ(gen.vector_close(), Generator::Result::OK);
    EXPECT_EQ(gen.keyword("c"), Generator::Result::OK);
    EXPECT_EQ(gen.list_open(), Generator::Result::OK);
    EXPECT_EQ(gen.list_close(), Generator::Result::OK);
    EXPECT_EQ(gen.map_close(), Generator::Result::OK);

    EXPECT_EQ(sink.str(), "{\n  :a 1\n  :b [\n    \"x\"\n  ]\n  :c ()\n}");
}

TEST(GeneratorTest, AnyValueMayBeAKey) {
    StringSink sink;
    Generator gen(sink);
    EXPECT_EQ(gen.map_open(), Generator::Result::OK);
    EXPECT_EQ(gen.vector_open(), Generator::Result::OK);
    EXPECT_EQ(gen.integer(1), Generator::Result::OK);
    EXPECT_EQ(gen.vector_close(), Generator::Result::OK);
    EXPECT_EQ(gen.nil_value(), Generator::Result::OK);
    EXPECT_EQ(gen.integer(2), Generator::Result::OK);
    EXPECT_EQ(gen.keyword("v"), Generator::Result::OK);
    EXPECT_EQ(gen.map_close(), Generator::Result::OK);

    EXPECT_EQ(sink.str(), "{[1] nil 2 :v}");
}

TEST(GeneratorTest, MapCloseWithoutValue) {
    StringSink sink;
    Generator gen(sink);
    EXPECT_EQ(gen.map_open(), Generator::Result::OK);
    EXPECT_EQ(gen.keyword("a"), Generator::Result::OK);
    EXPECT_EQ(gen.map_close(), Generator::Result::ErrorState);
    EXPECT_EQ(gen.integer(1), Generator::Result::ErrorState);
}

TEST(GeneratorTest, MismatchedClose) {
    StringSink sink;
    Generator gen(sink);
    EXPECT_EQ(gen.vector_open(), Generator::Result::OK);
    EXPECT_EQ(gen.list_close(), Generator::Result::ErrorState);
}

TEST(GeneratorTest, SetCloseIsNotMapClose) {
    StringSink sink;
    Generator gen(sink);
    EXPECT_EQ(gen.set_open(), Generator::Result::OK);
    EXPECT_EQ(gen.map_close(), Generator::Result::ErrorState);
}

TEST(GeneratorTest, GenerateComplete) {
    StringSink sink;
    Generator gen(sink);
    EXPECT_EQ(gen.integer(1), Generator::Result::OK);
    EXPECT_EQ(gen.integer(2), Generator::Result::GenerateComplete);
    EXPECT_EQ(sink.str(), "1");

    gen.clear();
    sink.clear();
    EXPECT_EQ(gen.keyword("again"), Generator::Result::OK);
    EXPECT_EQ(sink.str(), ":again");
}

TEST(GeneratorTest, StringEscapes) {
    StringSink sink;
    Generator gen(sink);
    EXPECT_EQ(gen.string("a\"b\\c\n\t\x01"), Generator::Result::OK);
    EXPECT_EQ(sink.str(), "\"a\\\"b\\\\c\\n\\t\\u0001\"");
}

TEST(GeneratorTest, Characters) {
    StringSink sink;
    Generator gen(sink);
    EXPECT_EQ(gen.vector_open(), Generator::Result::OK);
    EXPECT_EQ(gen.character(U'a'), Generator::Result::OK);
    EXPECT_EQ(gen.character(U'\n'), Generator::Result::OK);
    EXPECT_EQ(gen.character(U' '), Generator::Result::OK);
    EXPECT_EQ(gen.character(U'\t'), Generator::Result::OK);
    EXPECT_EQ(gen.character(U'\r'), Generator::Result::OK);
    EXPECT_EQ(gen.character(U'\x01'), Generator::Result::OK);
    EXPECT_EQ(gen.character(U'\u00e9'), Generator::Result::OK);
    EXPECT_EQ(gen.vector_close(), Generator::Result::OK);

    EXPECT_EQ(sink.str(), "[\\a \\newline \\space \\tab \\return \\u0001 \\\xc3\xa9]");
}

TEST(GeneratorTest, Numbers) {
    StringSink sink;
    Generator gen(sink);
    EXPECT_EQ(gen.vector_open(), Generator::Result::OK);
    EXPECT_EQ(gen.integer(-42), Generator::Result::OK);
    EXPECT_EQ(gen.unsigned_integer(std::numeric_limits<std::uint64_t>::max()), Generator::Result::OK);
    EXPECT_EQ(gen.double_value(42.0), Generator::Result::OK);
    EXPECT_EQ(gen.double_value(0.5), Generator::Result::OK);
    EXPECT_EQ(gen.double_value(std::numeric_limits<double>::infinity()), Generator::Result::OK);
    EXPECT_EQ(gen.double_value(-std::numeric_limits<double>::infinity()), Generator::Result::OK);
    EXPECT_EQ(gen.double_value(std::nan("")), Generator::Result::OK);
    EXPECT_EQ(gen.number(Number::from_i64(7)), Generator::Result::OK);
    EXPECT_EQ(gen.vector_close(), Generator::Result::OK);

    EXPECT_EQ(sink.str(), "[-42 18446744073709551615 42.0 0.5 ##Inf ##-Inf ##NaN 7]");
}

TEST(GeneratorTest, SinkFailureIsReported) {
    FailingSink sink(4);
    Generator gen(sink);
    EXPECT_EQ(gen.vector_open(), Generator::Result::OK);
    EXPECT_EQ(gen.string("too long"), Generator::Result::IoError);
    EXPECT_EQ(gen.io_error(), IoErr::NoSpace);

    auto mapped = generator_result(gen, Generator::Result::IoError);
    ASSERT_FALSE(mapped.has_value());
    EXPECT_EQ(mapped.error().code(), ErrorCode::Io);
    EXPECT_EQ(mapped.error().io_error(), IoErr::NoSpace);
}

TEST(GeneratorTest, StateTracking) {
    StringSink sink;
    Generator gen(sink);
    EXPECT_EQ(gen.get_state(), Generator::State::Start);
    EXPECT_EQ(gen.map_open(), Generator::Result::OK);
    EXPECT_EQ(gen.get_state(), Generator::State::MapStart);
    EXPECT_EQ(gen.keyword("k"), Generator::Result::OK);
    EXPECT_EQ(gen.get_state(), Generator::State::MapValue);
    EXPECT_EQ(gen.vector_open(), Generator::Result::OK);
    EXPECT_EQ(gen.get_state(), Generator::State::SeqStart);
    EXPECT_EQ(gen.nil_value(), Generator::Result::OK);
    EXPECT_EQ(gen.get_state(), Generator::State::InSeq);
    EXPECT_EQ(gen.vector_close(), Generator::Result::OK);
    EXPECT_EQ(gen.get_state(), Generator::State::MapKey);
    EXPECT_EQ(gen.map_close(), Generator::Result::OK);
    EXPECT_EQ(gen.get_state(), Generator::State::Complete);
    EXPECT_EQ(sink.str(), "{:k [nil]}");
}

TEST(GeneratorTest, TokensThatDoNotReadBack) {
    StringSink sink;
    Generator gen(sink);
    EXPECT_EQ(gen.symbol("true"), Generator::Result::InvalidToken);
    EXPECT_EQ(gen.get_state(), Generator::State::Error);
    EXPECT_EQ(gen.integer(1), Generator::Result::ErrorState);

    const char *symbols[] = {"", "nil", "false", "12", "-3x", "ns/name", "a b"};
    for (const char *name : symbols) {
        gen.clear();
        EXPECT_EQ(gen.symbol(name), Generator::Result::InvalidToken) << name;
    }
    gen.clear();
    EXPECT_EQ(gen.keyword(""), Generator::Result::InvalidToken);
    gen.clear();
    EXPECT_EQ(gen.keyword("a:b"), Generator::Result::InvalidToken);
    gen.clear();
    EXPECT_EQ(gen.character(static_cast<char32_t>(0xD800)), Generator::Result::InvalidToken);
    gen.clear();
    EXPECT_EQ(gen.character(static_cast<char32_t>(0x110000)), Generator::Result::InvalidToken);
    EXPECT_EQ(sink.str(), "");

    auto mapped = generator_result(gen, Generator::Result::InvalidToken);
    ASSERT_FALSE(mapped.has_value());
    EXPECT_TRUE(mapped.error().is_data());

    gen.clear();
    EXPECT_EQ(gen.symbol("-"), Generator::Result::OK);
    EXPECT_EQ(sink.str(), "-");
}

TEST(GeneratorTest, FdSinkWritesToPipe) {
    int fds[2];
    ASSERT_EQ(::pipe(fds), 0);
    {
        FdSink sink(fds[1]);
        Generator gen(sink);
        EXPECT_EQ(gen.list_open(), Generator::Result::OK);
        EXPECT_EQ(gen.keyword("ok"), Generator::Result::OK);
        EXPECT_EQ(gen.list_close(), Generator::Result::OK);
    }
    ::close(fds[1]);

    char buf[32] = {};
    ssize_t n = ::read(fds[0], buf, sizeof(buf));
    ::close(fds[0]);
    ASSERT_EQ(n, 5);
    EXPECT_EQ(std::string(buf, 5), "(:ok)");
}

TEST(GeneratorTest, FdSinkReportsBadDescriptor) {
    FdSink sink(-1);
    Generator gen(sink);
    EXPECT_EQ(gen.integer(1), Generator::Result::IoError);
    EXPECT_EQ(gen.io_error(), IoErr::BadFd);
}
