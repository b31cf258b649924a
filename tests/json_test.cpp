#include <sfera/core/json.hpp>
#include <gtest/gtest.h>
#include <limits>

using sfera::Json;

TEST(JsonTest, ParsesNestedDocument) {
    Json doc = Json::parse(
        "{\"name\": \"sfera\", \"limits\": {\"rpm\": 10, \"ratio\": 0.5},"
        " \"tags\": [\"a\", \"b\"], \"on\": true, \"none\": null}");
    
    ASSERT_TRUE(doc.is_object());
    EXPECT_EQ("sfera", doc.get_string("name"));
    EXPECT_EQ(10, doc["limits"].get_int("rpm"));
    EXPECT_DOUBLE_EQ(0.5, doc["limits"].get_double("ratio"));
    EXPECT_EQ(2u, doc["tags"].size());
    EXPECT_EQ("b", doc["tags"][1].as_string());
    EXPECT_TRUE(doc.get_bool("on"));
    EXPECT_TRUE(doc["none"].is_null());
}

TEST(JsonTest, MissingKeysFallBackToDefaults) {
    Json doc = Json::parse("{\"count\": \"not a number\"}");
    
    EXPECT_EQ(7, doc.get_int("count", 7));
    EXPECT_EQ("fallback", doc.get_string("absent", "fallback"));
    EXPECT_TRUE(doc["absent"]["deeper"].is_null());
    EXPECT_FALSE(doc.has("absent"));
}

TEST(JsonTest, DecodesUnicodeEscapesAsUtf8) {
    Json s = Json::parse("\"\\u041f\\u0440\\u0438 \\ud83d\\ude00\"");
    EXPECT_EQ("\xD0\x9F\xD1\x80\xD0\xB8 \xF0\x9F\x98\x80", s.as_string());
}

TEST(JsonTest, RejectsMalformedInput) {
    EXPECT_THROW(Json::parse(""), std::runtime_error);
    EXPECT_THROW(Json::parse("{\"a\": 1"), std::runtime_error);
    EXPECT_THROW(Json::parse("\"unterminated"), std::runtime_error);
    EXPECT_THROW(Json::parse("{\"a\": 1} trailing"), std::runtime_error);
    EXPECT_THROW(Json::parse("[1, 2,"), std::runtime_error);
    EXPECT_THROW(Json::parse("{a: 1}"), std::runtime_error);
    EXPECT_THROW(Json::parse("tru"), std::runtime_error);
}

TEST(JsonTest, DumpEscapesAndSortsKeys) {
    Json obj = Json::object();
    obj.set("role", "user");
    obj.set("content", "line1\n\"quoted\"");
    obj.set("n", 3);
    
    EXPECT_EQ("{\"content\":\"line1\\n\\\"quoted\\\"\",\"n\":3,\"role\":\"user\"}", obj.dump());
    EXPECT_EQ(obj.dump(), Json::parse(obj.dump()).dump());
}

TEST(JsonTest, PushTurnsValueIntoArray) {
    Json arr;
    arr.push(1);
    arr.push("two");
    
    EXPECT_TRUE(arr.is_array());
    EXPECT_EQ("[1,\"two\"]", arr.dump());
}

TEST(JsonTest, UnpairedSurrogateBecomesReplacementChar) {
    EXPECT_EQ("\xEF\xBF\xBDx", Json::parse("\"\\ud800x\"").as_string());
    EXPECT_EQ("\xEF\xBF\xBD", Json::parse("\"\\udc00\"").as_string());
}

TEST(JsonTest, LargeAndNonFiniteNumbers) {
    EXPECT_EQ("null", Json(std::numeric_limits<double>::infinity()).dump());
    EXPECT_EQ("9007199254740991", Json(9007199254740991.0).dump());
    
    Json huge = Json::parse(Json(1e300).dump());
    EXPECT_DOUBLE_EQ(1e300, huge.as_number());
    EXPECT_EQ(std::numeric_limits<int64_t>::max(), huge.as_int());
    
    Json doc = Json::parse("{\"ttl\": -1e300}");
    EXPECT_EQ(std::numeric_limits<int64_t>::min(), doc.get_int("ttl"));
}
