#include <gtest/gtest.h>

#include <cmath>
#include <string>

#include "edn/Edn.h"
#include "edn/ValueEncode.h"

using ednkit::edn::Map;
using ednkit::edn::StringSink;
using ednkit::edn::Value;
using ednkit::edn::from_str;
using ednkit::edn::write_value;

namespace {

Value parse(const std::string &text) {
    auto value = from_str(text);
    EXPECT_TRUE(value.has_value()) << text;
    return value ? *value : Value();
}

void expect_round_trip(const std::string &text) {
    Value value = parse(text);
    EXPECT_EQ(value.to_string(), text);
    EXPECT_EQ(parse(value.to_string()), value) << text;
    EXPECT_EQ(parse(value.to_string_pretty()), value) << text;
}

} // namespace

TEST(ValueEncodeTest, EncodeMapOrderAndOverwrite) {
    Map map;
    map.insert(Value::keyword("a"), Value(1));
    map.insert(Value::keyword("b"), Value(2));
    map.insert(Value::keyword("a"), Value(3));
    EXPECT_EQ(Value(map).to_string(), "{:a 3 :b 2}");
}

TEST(ValueEncodeTest, CompactForms) {
    expect_round_trip("()");
    expect_round_trip("(println :foo \"foo\" 42 42.3 true)");
    expect_round_trip("((((()))))");
    expect_round_trip("(println [:foo (println)])");
    expect_round_trip("#{}");
    expect_round_trip("#{println #{:foo (println)}}");
    expect_round_trip("(println (println [[:foo [(true 1 42.0)]] \"hi\"]))");
    expect_round_trip("{[1 2] {:a nil} #{\\a} -7}");
    expect_round_trip("[\\newline \\space \\tab \\return \\x]");
    expect_round_trip("[##Inf ##-Inf 1.5e+300 -0.25]");
}

TEST(ValueEncodeTest, FloatsKeepTheirKind) {
    EXPECT_EQ(Value(42.0).to_string(), "42.0");
    EXPECT_TRUE(parse(Value(42.0).to_string()).is_f64());
    EXPECT_TRUE(parse(Value(1e300).to_string()).is_f64());
}

TEST(ValueEncodeTest, NanRoundTrip) {
    Value nan = parse(Value(std::nan("")).to_string());
    ASSERT_TRUE(nan.is_f64());
    EXPECT_TRUE(std::isnan(*nan.as_f64()));
}

TEST(ValueEncodeTest, StringEscapesRoundTrip) {
    Value value("line\nquote\"back\\slash\ttab\x01");
    EXPECT_EQ(value.to_string(), "\"line\\nquote\\\"back\\\\slash\\ttab\\u0001\"");
    EXPECT_EQ(parse(value.to_string()), value);
}

TEST(ValueEncodeTest, Pretty) {
    Value value = parse("{:name \"ednkit\" :tags [:a :b] :empty []}");
    EXPECT_EQ(value.to_string_pretty(), "{\n  :name \"ednkit\"\n  :tags [\n    :a\n    :b\n  ]\n  :empty []\n}");
}

TEST(ValueEncodeTest, WriteValueToSink) {
    StringSink sink;
    ASSERT_TRUE(write_value(sink, parse("(1 2)"), false).has_value());
    EXPECT_EQ(sink.str(), "(1 2)");
}

TEST(ValueEncodeTest, SymbolsAndKeywordsWithPunctuation) {
    expect_round_trip("[my.ns.sym :my.ns.kw + - <=> a?b! *x* $y%]");
}

TEST(ValueEncodeTest, CharacterNames) {
    EXPECT_EQ(Value::character(U'\n').to_string(), "\\newline");
    EXPECT_EQ(Value::character(U'n').to_string(), "\\n");
    EXPECT_EQ(parse(Value::character(U'n').to_string()), Value::character(U'n'));
    EXPECT_EQ(parse(Value::character(U'\n').to_string()), Value::character(U'\n'));
    EXPECT_EQ(Value::character(U'\x7f').to_string(), "\\u007F");
    EXPECT_EQ(parse(Value::character(U'\x7f').to_string()), Value::character(U'\x7f'));
}
