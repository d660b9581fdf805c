#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <vector>

#include "edn/Edn.h"

using ednkit::edn::ErrorCode;
using ednkit::edn::Keyword;
using ednkit::edn::Reader;
using ednkit::edn::StringSink;
using ednkit::edn::Symbol;
using ednkit::edn::Value;
using ednkit::edn::field;

namespace edn = ednkit::edn;

namespace {

struct Server {
    std::string host;
    std::uint16_t port = 0;
    std::optional<std::string> tag;
    std::vector<Keyword> roles;

    static constexpr auto edn_fields() {
        return std::make_tuple(field("host", &Server::host), field("port", &Server::port),
                               field("tag", &Server::tag), field("roles", &Server::roles));
    }

    bool operator==(const Server &) const = default;
};

struct Cluster {
    std::string name;
    std::vector<Server> servers;
    std::map<std::string, double> weights;
    Value extra;

    static constexpr auto edn_fields() {
        return std::make_tuple(field("name", &Cluster::name), field("servers", &Cluster::servers),
                               field("weights", &Cluster::weights), field("extra", &Cluster::extra));
    }

    bool operator==(const Cluster &) const = default;
};

class StringReader final : public Reader {
public:
    explicit StringReader(std::string data) : data_(std::move(data)) {}

    [[nodiscard]] ednkit::common::IoResult<std::size_t> read(char *buf, std::size_t len) override {
        std::size_t n = std::min(len, data_.size() - pos_);
        data_.copy(buf, n, pos_);
        pos_ += n;
        return n;
    }

private:
    std::string data_;
    std::size_t pos_ = 0;
};

Server sample_server() {
    Server server;
    server.host = "db.local";
    server.port = 5432;
    server.roles = {Keyword{"primary"}, Keyword{"backup"}};
    return server;
}

} // namespace

TEST(BridgeTest, Scalars) {
    EXPECT_EQ(*edn::from_str<bool>("true"), true);
    EXPECT_EQ(*edn::from_str<int>("-12"), -12);
    EXPECT_EQ(*edn::from_str<std::uint64_t>("18446744073709551615"), UINT64_MAX);
    EXPECT_DOUBLE_EQ(*edn::from_str<double>("2.5"), 2.5);
    EXPECT_DOUBLE_EQ(*edn::from_str<double>("3"), 3.0);
    EXPECT_EQ(*edn::from_str<std::string>("\"text\""), "text");
    EXPECT_EQ(*edn::from_str<char32_t>("\\space"), U' ');
    EXPECT_EQ(*edn::from_str<Keyword>(":k"), Keyword{"k"});
    EXPECT_EQ(*edn::from_str<Symbol>("sym"), Symbol{"sym"});
    EXPECT_EQ(*edn::from_str<Value>("[1 2]"), Value::vector({Value(1), Value(2)}));
}

TEST(BridgeTest, IntegerRangeChecks) {
    auto narrow = edn::from_str<std::uint8_t>("300");
    ASSERT_FALSE(narrow.has_value());
    EXPECT_EQ(narrow.error().to_string(), "invalid value: integer `300`, expected u8 at line 1 column 1");

    auto negative = edn::from_str<std::uint32_t>("-1");
    ASSERT_FALSE(negative.has_value());
    EXPECT_EQ(negative.error().message(), "invalid value: integer `-1`, expected u32");

    auto fractional = edn::from_str<int>("1.5");
    ASSERT_FALSE(fractional.has_value());
    EXPECT_EQ(fractional.error().message(), "invalid type: floating point `1.5`, expected i32");

    EXPECT_EQ(*edn::from_str<std::int8_t>("-128"), -128);
}

TEST(BridgeTest, TypeMismatch) {
    auto value = edn::from_str<bool>("nil");
    ASSERT_FALSE(value.has_value());
    EXPECT_EQ(value.error().message(), "invalid type: nil, expected a boolean");
    EXPECT_TRUE(value.error().is_data());
}

TEST(BridgeTest, TrailingCharacters) {
    auto value = edn::from_str<int>("1 2");
    ASSERT_FALSE(value.has_value());
    EXPECT_EQ(value.error().code(), ErrorCode::TrailingCharacters);
}

TEST(BridgeTest, Optionals) {
    EXPECT_FALSE(edn::from_str<std::optional<int>>("nil")->has_value());
    EXPECT_EQ(**edn::from_str<std::optional<int>>("4"), 4);
    auto symbol = edn::from_str<std::optional<Symbol>>("nope");
    ASSERT_TRUE(symbol.has_value());
    ASSERT_TRUE(symbol->has_value());
    EXPECT_EQ((*symbol)->name, "nope");
    EXPECT_EQ(*edn::to_string(std::optional<int>()), "nil");
}

TEST(BridgeTest, Sequences) {
    EXPECT_EQ(*edn::from_str<std::vector<int>>("[1 2 3]"), (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(*edn::from_str<std::vector<int>>("(1 2)"), (std::vector<int>{1, 2}));
    EXPECT_EQ(*edn::from_str<std::set<int>>("#{3 1 2}"), (std::set<int>{1, 2, 3}));
    EXPECT_EQ(*edn::to_string(std::vector<int>{1, 2}), "[1 2]");
    EXPECT_EQ(*edn::to_string(std::set<int>{2, 1}), "#{1 2}");
    EXPECT_TRUE(edn::from_str<std::vector<int>>("[]")->empty());

    auto bad = edn::from_str<std::vector<int>>("{:a 1}");
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().message(), "invalid type: map, expected a sequence");
}

TEST(BridgeTest, Maps) {
    auto weights = edn::from_str<std::map<std::string, int>>("{\"a\" 1 \"b\" 2 \"a\" 3}");
    ASSERT_TRUE(weights.has_value());
    EXPECT_EQ(*weights, (std::map<std::string, int>{{"a", 3}, {"b", 2}}));
    EXPECT_EQ(*edn::to_string(std::map<std::string, int>{{"x", 1}}), "{\"x\" 1}");

    auto missing = edn::from_str<std::map<std::string, int>>("{\"a\"}");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code(), ErrorCode::ExpectedMapValue);
}

TEST(BridgeTest, RecordFromText) {
    auto server = edn::from_str<Server>("{:host \"db.local\" :port 5432 :roles [:primary :backup]}");
    ASSERT_TRUE(server.has_value()) << server.error().to_string();
    EXPECT_EQ(*server, sample_server());
}

TEST(BridgeTest, RecordAcceptsStringAndSymbolKeys) {
    auto server = edn::from_str<Server>("{\"host\" \"db.local\" port 5432 :roles [:primary :backup] :tag nil}");
    ASSERT_TRUE(server.has_value()) << server.error().to_string();
    EXPECT_EQ(*server, sample_server());
}

TEST(BridgeTest, RecordSkipsUnknownKeys) {
    auto server = edn::from_str<Server>(
            "{:host \"db.local\" :extra {:deep [1 #{2} \"x\"]} :port 5432 nested (a b) :roles [:primary :backup]}");
    ASSERT_TRUE(server.has_value()) << server.error().to_string();
    EXPECT_EQ(*server, sample_server());
}

TEST(BridgeTest, RecordMissingField) {
    auto server = edn::from_str<Server>("{:host \"db.local\" :roles []}");
    ASSERT_FALSE(server.has_value());
    EXPECT_EQ(server.error().message(), "missing field `port`");
    EXPECT_NE(server.error().line(), 0u);
}

TEST(BridgeTest, RecordFieldTypeError) {
    auto server = edn::from_str<Server>("{:host \"db.local\"\n :port \"x\" :roles []}");
    ASSERT_FALSE(server.has_value());
    EXPECT_EQ(server.error().to_string(), "invalid type: string \"x\", expected a number at line 2 column 8");
}

TEST(BridgeTest, RecordToText) {
    EXPECT_EQ(*edn::to_string(sample_server()),
              "{:host \"db.local\" :port 5432 :tag nil :roles [:primary :backup]}");
    EXPECT_EQ(*edn::to_string_pretty(sample_server()),
              "{\n  :host \"db.local\"\n  :port 5432\n  :tag nil\n  :roles [\n    :primary\n    :backup\n  ]\n}");
}

TEST(BridgeTest, NestedRecordRoundTrip) {
    Cluster cluster;
    cluster.name = "main";
    cluster.servers = {sample_server(), sample_server()};
    cluster.servers[1].tag = "spare";
    cluster.weights = {{"db.local", 0.75}};
    cluster.extra = Value::set({Value::symbol("x"), Value::character(U'y')});

    auto text = edn::to_string(cluster);
    ASSERT_TRUE(text.has_value());
    auto back = edn::from_str<Cluster>(*text);
    ASSERT_TRUE(back.has_value()) << back.error().to_string();
    EXPECT_EQ(*back, cluster);
}

TEST(BridgeTest, ValueConversions) {
    auto value = edn::to_value(sample_server());
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, *edn::from_str("{:host \"db.local\" :port 5432 :tag nil :roles [:primary :backup]}"));

    auto server = edn::from_value<Server>(*value);
    ASSERT_TRUE(server.has_value()) << server.error().to_string();
    EXPECT_EQ(*server, sample_server());

    auto wrong = edn::from_value<Server>(Value::vector({}));
    ASSERT_FALSE(wrong.has_value());
    EXPECT_EQ(wrong.error().message(), "invalid type: vector, expected a map");
}

TEST(BridgeTest, FromValueSkipsUnknownKeys) {
    auto value = edn::from_str("{:port 1 :junk [1 2] :host \"h\" :roles ()}");
    ASSERT_TRUE(value.has_value());
    auto server = edn::from_value<Server>(*value);
    ASSERT_TRUE(server.has_value()) << server.error().to_string();
    EXPECT_EQ(server->port, 1);
    EXPECT_EQ(server->host, "h");
}

TEST(BridgeTest, FromSliceAndReader) {
    std::string text = "{:host \"db.local\" :port 5432 :roles [:primary :backup]}";
    auto from_slice = edn::from_slice<Server>(reinterpret_cast<const std::uint8_t *>(text.data()), text.size());
    ASSERT_TRUE(from_slice.has_value());
    EXPECT_EQ(*from_slice, sample_server());

    StringReader reader(text);
    auto from_reader = edn::from_reader<Server>(reader);
    ASSERT_TRUE(from_reader.has_value());
    EXPECT_EQ(*from_reader, sample_server());
}

TEST(BridgeTest, ToWriter) {
    StringSink sink;
    ASSERT_TRUE(edn::to_writer(sink, std::vector<std::string>{"a", "b"}).has_value());
    EXPECT_EQ(sink.str(), "[\"a\" \"b\"]");

    StringSink pretty;
    ASSERT_TRUE(edn::to_writer_pretty(pretty, std::vector<int>{1}).has_value());
    EXPECT_EQ(pretty.str(), "[\n  1\n]");
}

TEST(BridgeTest, UnwritableNamesAreDataErrors) {
    auto text = edn::to_string(Symbol{"12"});
    ASSERT_FALSE(text.has_value());
    EXPECT_TRUE(text.error().is_data());
    EXPECT_EQ(text.error().message(), "keyword, symbol or character cannot be written as EDN");

    auto value = edn::to_value(std::vector<Keyword>{Keyword{"ok"}, Keyword{""}});
    ASSERT_FALSE(value.has_value());
    EXPECT_EQ(value.error().message(), "invalid keyword name ``");

    auto character = edn::to_value(static_cast<char32_t>(0xDC00));
    ASSERT_FALSE(character.has_value());
    EXPECT_EQ(character.error().message(), "character is not a Unicode scalar value");
}
