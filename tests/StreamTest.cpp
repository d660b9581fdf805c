#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "edn/Edn.h"

using ednkit::edn::ErrorCode;
using ednkit::edn::IoRead;
using ednkit::edn::Reader;
using ednkit::edn::StrRead;
using ednkit::edn::StreamDeserializer;
using ednkit::edn::Value;

namespace {

class OneByteReader final : public Reader {
public:
    explicit OneByteReader(std::string data) : data_(std::move(data)) {}

    [[nodiscard]] ednkit::common::IoResult<std::size_t> read(char *buf, std::size_t len) override {
        if (len == 0 || pos_ == data_.size()) {
            return 0;
        }
        buf[0] = data_[pos_++];
        return 1;
    }

private:
    std::string data_;
    std::size_t pos_ = 0;
};

template <typename R>
std::vector<Value> drain(StreamDeserializer<R> &stream) {
    std::vector<Value> out;
    while (true) {
        auto next = stream.next();
        EXPECT_TRUE(next.has_value());
        if (!next || !*next) {
            return out;
        }
        out.push_back(std::move(**next));
    }
}

} // namespace

TEST(StreamTest, ConsecutiveValues) {
    StreamDeserializer<StrRead> stream{StrRead("1 [2] {:a 3}\n:k \"s\"")};
    std::vector<Value> values = drain(stream);
    ASSERT_EQ(values.size(), 5u);
    EXPECT_EQ(values[0], Value(1));
    EXPECT_EQ(values[1], Value::vector({Value(2)}));
    EXPECT_TRUE(values[2].is_object());
    EXPECT_EQ(values[3], Value::keyword("k"));
    EXPECT_EQ(values[4], Value("s"));
}

TEST(StreamTest, ValuesWithoutSeparators) {
    StreamDeserializer<StrRead> stream{StrRead("[1][2](3)\"x\"")};
    EXPECT_EQ(drain(stream).size(), 4u);
}

TEST(StreamTest, EmptyInput) {
    StreamDeserializer<StrRead> stream{StrRead("  \n ,")};
    auto next = stream.next();
    ASSERT_TRUE(next.has_value());
    EXPECT_FALSE(next->has_value());
}

TEST(StreamTest, ByteOffsetTracksConsumption) {
    StreamDeserializer<StrRead> stream{StrRead("12 345")};
    ASSERT_TRUE(stream.next().has_value());
    EXPECT_EQ(stream.byte_offset(), 2u);
    ASSERT_TRUE(stream.next().has_value());
    EXPECT_EQ(stream.byte_offset(), 6u);
}

TEST(StreamTest, ErrorStopsTheStream) {
    StreamDeserializer<StrRead> stream{StrRead("1 ) 2")};
    auto first = stream.next();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(**first, Value(1));

    auto second = stream.next();
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error().code(), ErrorCode::ExpectedSomeValue);

    auto third = stream.next();
    ASSERT_TRUE(third.has_value());
    EXPECT_FALSE(third->has_value());
}

TEST(StreamTest, ReaderSource) {
    OneByteReader reader("(a b) #{:c} nil");
    StreamDeserializer<IoRead> stream{IoRead(reader)};
    std::vector<Value> values = drain(stream);
    ASSERT_EQ(values.size(), 3u);
    EXPECT_EQ(values[0], Value::list({Value::symbol("a"), Value::symbol("b")}));
    EXPECT_EQ(values[1], Value::set({Value::keyword("c")}));
    EXPECT_TRUE(values[2].is_nil());
}
