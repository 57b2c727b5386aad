// ZPROOF - JSON Value Tests
// Copyright (c) 2024 ZPROOF Developers
// MIT License

#include <gtest/gtest.h>
#include <zproof/http/json.h>

#include <limits>
#include <string>

using namespace zproof;
using namespace zproof::http;

// ============================================================================
// JSONValue Tests
// ============================================================================

class JSONValueTest : public ::testing::Test {};

TEST_F(JSONValueTest, NullValue) {
    JSONValue null;
    EXPECT_TRUE(null.IsNull());
    EXPECT_FALSE(null.IsObject());
    EXPECT_EQ(null.ToJSON(), "null");
}

TEST_F(JSONValueTest, IntegerKinds) {
    JSONValue small(uint64_t(5));
    EXPECT_TRUE(small.IsInt());
    EXPECT_EQ(small.GetUInt(), 5u);
    
    JSONValue big(std::numeric_limits<uint64_t>::max());
    EXPECT_TRUE(big.IsUInt());
    EXPECT_EQ(big.GetUInt(), std::numeric_limits<uint64_t>::max());
    EXPECT_EQ(big.ToJSON(), "18446744073709551615");
    
    JSONValue negative(-3);
    EXPECT_EQ(negative.GetUInt(99), 99u);
    EXPECT_EQ(negative.GetInt(), -3);
}

TEST_F(JSONValueTest, ObjectBuilding) {
    JSONValue obj;
    obj["b"] = "x";
    obj["a"] = 1;
    EXPECT_TRUE(obj.IsObject());
    EXPECT_TRUE(obj.HasKey("a"));
    EXPECT_FALSE(obj.HasKey("c"));
    EXPECT_TRUE(obj["c"].IsNull());
    EXPECT_EQ(obj.ToJSON(), "{\"a\":1,\"b\":\"x\"}");
}

TEST_F(JSONValueTest, ConstAccessOnWrongTypeIsNull) {
    const JSONValue str("text");
    EXPECT_TRUE(str["key"].IsNull());
    EXPECT_TRUE(str[size_t(0)].IsNull());
}

TEST_F(JSONValueTest, ArrayPush) {
    JSONValue arr;
    arr.Push(1);
    arr.Push("two");
    arr.Push(JSONValue());
    EXPECT_TRUE(arr.IsArray());
    EXPECT_EQ(arr.Size(), 3u);
    EXPECT_EQ(arr.ToJSON(), "[1,\"two\",null]");
}

TEST_F(JSONValueTest, StringEscaping) {
    JSONValue s(std::string("a\"b\\c\n\x01"));
    EXPECT_EQ(s.ToJSON(), "\"a\\\"b\\\\c\\n\\u0001\"");
}

TEST_F(JSONValueTest, Equality) {
    EXPECT_EQ(JSONValue::Parse("{\"a\":[1,2]}"), JSONValue::Parse("{ \"a\" : [ 1 , 2 ] }"));
    EXPECT_NE(JSONValue("1"), JSONValue(1));
}

// ============================================================================
// Parser Tests
// ============================================================================

class JSONParseTest : public ::testing::Test {};

TEST_F(JSONParseTest, ProofRequestBody) {
    auto value = JSONValue::TryParse(
        R"({"type":"spend","params":{"spendingKey":"secret-extended-key-main1q","amount":"100000"}})");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ((*value)["type"].GetString(), "spend");
    EXPECT_EQ((*value)["params"]["amount"].GetString(), "100000");
}

TEST_F(JSONParseTest, Numbers) {
    EXPECT_TRUE(JSONValue::Parse("1000").IsInt());
    EXPECT_TRUE(JSONValue::Parse("-1").IsInt());
    EXPECT_TRUE(JSONValue::Parse("18446744073709551615").IsUInt());
    EXPECT_TRUE(JSONValue::Parse("18446744073709551616").IsDouble());
    EXPECT_TRUE(JSONValue::Parse("1.5").IsDouble());
    EXPECT_TRUE(JSONValue::Parse("1e3").IsDouble());
    EXPECT_DOUBLE_EQ(JSONValue::Parse("-2.5e-1").GetDouble(), -0.25);
}

TEST_F(JSONParseTest, UnicodeEscapes) {
    EXPECT_EQ(JSONValue::Parse("\"\\u00e9\"").GetString(), "\xc3\xa9");
    EXPECT_EQ(JSONValue::Parse("\"\\ud83d\\ude00\"").GetString(), "\xf0\x9f\x98\x80");
}

TEST_F(JSONParseTest, RejectsMalformed) {
    EXPECT_FALSE(JSONValue::TryParse("").has_value());
    EXPECT_FALSE(JSONValue::TryParse("{").has_value());
    EXPECT_FALSE(JSONValue::TryParse("{\"a\":}").has_value());
    EXPECT_FALSE(JSONValue::TryParse("[1,]").has_value());
    EXPECT_FALSE(JSONValue::TryParse("01").has_value());
    EXPECT_FALSE(JSONValue::TryParse("1.").has_value());
    EXPECT_FALSE(JSONValue::TryParse("\"tab\there\"").has_value());
    EXPECT_FALSE(JSONValue::TryParse("nul").has_value());
    EXPECT_FALSE(JSONValue::TryParse("{} extra").has_value());
    EXPECT_FALSE(JSONValue::TryParse("1e999").has_value());
    EXPECT_THROW(JSONValue::Parse("{bad}"), std::runtime_error);
}

TEST_F(JSONParseTest, DepthLimit) {
    std::string deep(100, '[');
    deep += std::string(100, ']');
    EXPECT_FALSE(JSONValue::TryParse(deep).has_value());
    
    std::string shallow(10, '[');
    shallow += std::string(10, ']');
    EXPECT_TRUE(JSONValue::TryParse(shallow).has_value());
}
