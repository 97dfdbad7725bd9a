// DOGEPROV - JSON Value Tests
// Copyright (c) 2024 DOGEPROV Developers
// MIT License

#include <gtest/gtest.h>
#include "dogeprov/rpc/json.h"

namespace dogeprov {
namespace rpc {
namespace test {

// ============================================================================
// Construction and Access
// ============================================================================

TEST(JSONValueTest, Types) {
    EXPECT_TRUE(JSONValue().IsNull());
    EXPECT_TRUE(JSONValue(true).IsBool());
    EXPECT_TRUE(JSONValue(42).IsInt());
    EXPECT_TRUE(JSONValue(static_cast<int64_t>(1) << 40).IsInt());
    EXPECT_TRUE(JSONValue(1.5).IsDouble());
    EXPECT_TRUE(JSONValue(1.5).IsNumber());
    EXPECT_TRUE(JSONValue("wow").IsString());
    EXPECT_TRUE(JSONValue::MakeArray().IsArray());
    EXPECT_TRUE(JSONValue::MakeObject().IsObject());
}

TEST(JSONValueTest, AccessorsFallBackToDefaults) {
    JSONValue str("text");
    EXPECT_EQ(str.GetInt(7), 7);
    EXPECT_FALSE(str.GetBool());
    EXPECT_TRUE(JSONValue().GetString().empty());
    EXPECT_TRUE(JSONValue(3).GetArray().empty());
    EXPECT_EQ(JSONValue(2.9).GetInt(), 2);
}

TEST(JSONValueTest, ObjectIndexing) {
    JSONValue obj;
    obj["recipientAddress"] = "DAddr";
    obj["amount"] = static_cast<int64_t>(100000000);

    EXPECT_TRUE(obj.IsObject());
    EXPECT_TRUE(obj.HasKey("amount"));
    EXPECT_EQ(obj["amount"].GetInt(), 100000000);

    const JSONValue& view = obj;
    EXPECT_TRUE(view["missing"].IsNull());
    EXPECT_FALSE(obj.HasKey("missing"));
}

TEST(JSONValueTest, ConstIndexOnNonObjectIsNull) {
    const JSONValue number(5);
    EXPECT_TRUE(number["key"].IsNull());
}

TEST(JSONValueTest, ArrayPushAndIndex) {
    JSONValue arr = JSONValue::MakeArray();
    arr.Push("a");
    arr.Push(2);
    ASSERT_EQ(arr.Size(), 2u);
    EXPECT_EQ(arr[static_cast<size_t>(0)].GetString(), "a");
    EXPECT_EQ(arr[static_cast<size_t>(1)].GetInt(), 2);
    EXPECT_TRUE(arr[static_cast<size_t>(5)].IsNull());
}

// ============================================================================
// Serialization
// ============================================================================

TEST(JSONValueTest, ToJSONObjectKeysSorted) {
    JSONValue obj = JSONValue::MakeObject();
    obj["txId"] = "abc";
    obj["approved"] = true;
    obj["balance"] = 5;
    EXPECT_EQ(obj.ToJSON(), "{\"approved\":true,\"balance\":5,\"txId\":\"abc\"}");
}

TEST(JSONValueTest, ToJSONEscapes) {
    JSONValue s("line\n\"quoted\"\\\x01");
    EXPECT_EQ(s.ToJSON(), "\"line\\n\\\"quoted\\\"\\\\\\u0001\"");
}

TEST(JSONValueTest, ToJSONNested) {
    JSONValue list = JSONValue::MakeArray();
    list.Push(JSONValue());
    list.Push(JSONValue::MakeArray());
    JSONValue obj;
    obj["list"] = list;
    EXPECT_EQ(obj.ToJSON(), "{\"list\":[null,[]]}");
}

// ============================================================================
// Parsing
// ============================================================================

TEST(JSONParseTest, RequestEnvelope) {
    auto parsed = JSONValue::TryParse(
        R"({"method":"sendTransaction","params":{"recipientAddress":"DAddr","dogeAmount":"1.5"}})");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ((*parsed)["method"].GetString(), "sendTransaction");
    EXPECT_EQ((*parsed)["params"]["dogeAmount"].GetString(), "1.5");
}

TEST(JSONParseTest, Numbers) {
    auto parsed = JSONValue::TryParse("[0, -12, 3.25, 1e3, 9007199254740993]");
    ASSERT_TRUE(parsed.has_value());
    const auto& arr = parsed->GetArray();
    ASSERT_EQ(arr.size(), 5u);
    EXPECT_TRUE(arr[0].IsInt());
    EXPECT_EQ(arr[1].GetInt(), -12);
    EXPECT_TRUE(arr[2].IsDouble());
    EXPECT_DOUBLE_EQ(arr[2].GetDouble(), 3.25);
    EXPECT_DOUBLE_EQ(arr[3].GetDouble(), 1000.0);
    EXPECT_EQ(arr[4].GetInt(), 9007199254740993LL);
}

TEST(JSONParseTest, UnicodeEscape) {
    auto parsed = JSONValue::TryParse("\"\\u00C9A\"");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->GetString(), "\xC3\x89" "A");
}

TEST(JSONParseTest, RejectsMalformed) {
    EXPECT_FALSE(JSONValue::TryParse("").has_value());
    EXPECT_FALSE(JSONValue::TryParse("{").has_value());
    EXPECT_FALSE(JSONValue::TryParse("[1,]").has_value());
    EXPECT_FALSE(JSONValue::TryParse("{\"a\" 1}").has_value());
    EXPECT_FALSE(JSONValue::TryParse("tru").has_value());
    EXPECT_FALSE(JSONValue::TryParse("\"unterminated").has_value());
    EXPECT_FALSE(JSONValue::TryParse("1 2").has_value());
}

TEST(JSONParseTest, RejectsExcessiveNesting) {
    std::string deep(100, '[');
    deep += std::string(100, ']');
    EXPECT_FALSE(JSONValue::TryParse(deep).has_value());

    std::string shallow(10, '[');
    shallow += std::string(10, ']');
    EXPECT_TRUE(JSONValue::TryParse(shallow).has_value());
}

TEST(JSONParseTest, ReparsesOwnOutput) {
    JSONValue obj;
    obj["chain"] = "dogecoin:mainnet";
    obj["list"] = JSONValue::MakeArray();
    obj["total"] = 0;

    auto parsed = JSONValue::TryParse(obj.ToJSON());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, obj);
}

} // namespace test
} // namespace rpc
} // namespace dogeprov
