//! # JSON Library Tests
//!
//! ## Test Coverage
//!
//! - Value construction and type queries
//! - Parser tests (numbers, strings, containers, errors with locations)
//! - Serializer tests (compact, escapes, floats)
//! - Clone and equality

#include "common.hpp"

#include "json/json.hpp"
#include <cmath>
#include <gtest/gtest.h>
#include <limits>
#include <string>

using namespace todo;
using namespace todo::json;

namespace {

JsonValue parse_ok(std::string_view text) {
    auto result = parse_json(text);
    EXPECT_TRUE(is_ok(result)) << "unexpected parse error for: " << text;
    if (is_err(result)) {
        return JsonValue();
    }
    return std::move(unwrap(result));
}

JsonError parse_err(std::string_view text) {
    auto result = parse_json(text);
    EXPECT_TRUE(is_err(result)) << "expected a parse error for: " << text;
    if (is_ok(result)) {
        return JsonError::make("");
    }
    return unwrap_err(result);
}

} // namespace

// ============================================================================
// JsonValue Construction Tests
// ============================================================================

TEST(JsonValueTest, DefaultIsNull) {
    JsonValue v;
    EXPECT_TRUE(v.is_null());
    EXPECT_FALSE(v.is_bool());
    EXPECT_EQ(v.size(), 0u);
}

TEST(JsonValueTest, ScalarFactories) {
    EXPECT_TRUE(json_bool(true).as_bool());
    EXPECT_EQ(json_int(-12).as_i64(), -12);
    EXPECT_TRUE(json_int(3).is_integer());
    EXPECT_FALSE(json_float(3.0).is_integer());
    EXPECT_DOUBLE_EQ(json_float(2.5).as_f64(), 2.5);
    EXPECT_EQ(json_string("hi").as_string(), "hi");
}

TEST(JsonValueTest, FloatAsI64Throws) {
    EXPECT_THROW((void)json_float(1.5).as_i64(), std::runtime_error);
    EXPECT_FALSE(json_float(1.5).try_as_i64().has_value());
}

TEST(JsonValueTest, ObjectSetGetContains) {
    auto obj = json_object();
    obj.set("id", json_int(7));
    obj.set("text", json_string("Walk the dog"));

    EXPECT_EQ(obj.size(), 2u);
    EXPECT_TRUE(obj.contains("id"));
    EXPECT_FALSE(obj.contains("done"));
    ASSERT_NE(obj.get("id"), nullptr);
    EXPECT_EQ(obj.get("id")->as_i64(), 7);
    EXPECT_EQ(obj.get("missing"), nullptr);

    // get() on a non-object is not an error
    EXPECT_EQ(json_int(1).get("id"), nullptr);
}

TEST(JsonValueTest, ArrayPushAndIndex) {
    auto arr = json_array();
    arr.push(json_int(1));
    arr.push(json_string("two"));

    ASSERT_EQ(arr.size(), 2u);
    EXPECT_EQ(arr[0].as_i64(), 1);
    EXPECT_EQ(arr[1].as_string(), "two");
}

TEST(JsonNumberTest, I32Range) {
    EXPECT_EQ(JsonNumber(int64_t{2147483647}).try_as_i32(), 2147483647);
    EXPECT_FALSE(JsonNumber(int64_t{2147483648}).try_as_i32().has_value());
    EXPECT_FALSE(JsonNumber(int64_t{-2147483649}).try_as_i32().has_value());
    EXPECT_FALSE(JsonNumber(1.0).try_as_i32().has_value());
}

// ============================================================================
// Parser Tests
// ============================================================================

TEST(JsonParserTest, Literals) {
    EXPECT_TRUE(parse_ok("null").is_null());
    EXPECT_TRUE(parse_ok("true").as_bool());
    EXPECT_FALSE(parse_ok(" false ").as_bool());
}

TEST(JsonParserTest, Integers) {
    auto v = parse_ok("42");
    EXPECT_TRUE(v.is_integer());
    EXPECT_EQ(v.as_i64(), 42);

    EXPECT_EQ(parse_ok("-7").as_i64(), -7);
    EXPECT_EQ(parse_ok("1709284500").as_i64(), 1709284500);
}

TEST(JsonParserTest, FloatsAndOverflow) {
    auto exp = parse_ok("1e3");
    EXPECT_FALSE(exp.is_integer());
    EXPECT_DOUBLE_EQ(exp.as_f64(), 1000.0);

    EXPECT_DOUBLE_EQ(parse_ok("-0.25").as_f64(), -0.25);

    auto big = parse_ok("99999999999999999999");
    EXPECT_TRUE(big.is_number());
    EXPECT_FALSE(big.is_integer());
}

TEST(JsonParserTest, StringEscapes) {
    EXPECT_EQ(parse_ok(R"("a\nb\t\"q\"\\/")").as_string(), "a\nb\t\"q\"\\/");
    EXPECT_EQ(parse_ok(R"("caf\u00e9")").as_string(), "caf\xC3\xA9");
    EXPECT_EQ(parse_ok(R"("\u20AC")").as_string(), "\xE2\x82\xAC");
}

TEST(JsonParserTest, SurrogatePair) {
    EXPECT_EQ(parse_ok(R"("\ud83d\ude00")").as_string(), "\xF0\x9F\x98\x80");
}

TEST(JsonParserTest, RawUtf8PassesThrough) {
    EXPECT_EQ(parse_ok("\"Stra\xC3\x9F" "e\"").as_string(), "Stra\xC3\x9F" "e");
}

TEST(JsonParserTest, NestedContainers) {
    auto v = parse_ok(R"([{"id": 1, "tags": ["a", "b"]}, {}, []])");
    ASSERT_TRUE(v.is_array());
    ASSERT_EQ(v.size(), 3u);

    const auto& first = v[0];
    ASSERT_TRUE(first.is_object());
    EXPECT_EQ(first.get("id")->as_i64(), 1);
    EXPECT_EQ(first.get("tags")->size(), 2u);
    EXPECT_TRUE(v[1].is_object());
    EXPECT_TRUE(v[2].is_array());
}

TEST(JsonParserTest, DuplicateKeyKeepsLast) {
    auto v = parse_ok(R"({"a": 1, "a": 2})");
    EXPECT_EQ(v.size(), 1u);
    EXPECT_EQ(v.get("a")->as_i64(), 2);
}

// ============================================================================
// Parser Error Tests
// ============================================================================

TEST(JsonParserErrorTest, EmptyInput) {
    EXPECT_EQ(parse_err("").message, "Unexpected end of input");
    EXPECT_EQ(parse_err("   ").message, "Unexpected end of input");
}

TEST(JsonParserErrorTest, TrailingContent) {
    EXPECT_EQ(parse_err("1 2").message, "Unexpected content after JSON value");
}

TEST(JsonParserErrorTest, TrailingCommas) {
    EXPECT_EQ(parse_err("[1,]").message, "Trailing comma in array");
    EXPECT_EQ(parse_err(R"({"a":1,})").message, "Trailing comma in object");
}

TEST(JsonParserErrorTest, UnterminatedContainers) {
    EXPECT_EQ(parse_err("[1").message, "Expected ',' or ']' in array");
    EXPECT_EQ(parse_err(R"({"a":1)").message, "Expected ',' or '}' in object");
    EXPECT_EQ(parse_err(R"({"a" 1})").message, "Expected ':' after object key");
    EXPECT_EQ(parse_err("{1:2}").message, "Expected string key in object");
}

TEST(JsonParserErrorTest, BadStrings) {
    auto err = parse_err(R"(["abc)");
    EXPECT_EQ(err.message, "Unterminated string");
    EXPECT_EQ(err.line, 1u);
    EXPECT_EQ(err.column, 2u);

    EXPECT_EQ(parse_err("\"a\nb\"").message, "Control character in string");
    EXPECT_EQ(parse_err(R"("\x")").message, "Invalid escape sequence: \\x");
    EXPECT_EQ(parse_err(R"("\u12")").message, "Incomplete unicode escape sequence");
    EXPECT_EQ(parse_err(R"("\uzzzz")").message, "Invalid unicode escape sequence");
}

TEST(JsonParserErrorTest, BadLiteralsAndNumbers) {
    EXPECT_EQ(parse_err("tru").message, "Unknown literal");
    EXPECT_EQ(parse_err("1.").message, "Expected digit after decimal point");
    EXPECT_EQ(parse_err("1e").message, "Expected digit in exponent");
    EXPECT_EQ(parse_err("-").message, "Invalid number");
    EXPECT_EQ(parse_err("@").message, "Unexpected character: @");
}

TEST(JsonParserErrorTest, ReportsLineAndColumn) {
    auto err = parse_err("[\n  1,\n  ]");
    EXPECT_EQ(err.message, "Trailing comma in array");
    EXPECT_EQ(err.line, 3u);
    EXPECT_EQ(err.column, 3u);
    EXPECT_EQ(err.to_string(), "line 3, column 3: Trailing comma in array");
}

TEST(JsonParserErrorTest, DepthLimit) {
    std::string deep(JsonParser::MAX_DEPTH + 1, '[');
    EXPECT_EQ(parse_err(deep).message, "Maximum nesting depth exceeded");

    std::string ok(JsonParser::MAX_DEPTH, '[');
    ok += std::string(JsonParser::MAX_DEPTH, ']');
    EXPECT_TRUE(is_ok(parse_json(ok)));
}

TEST(JsonErrorTest, ToStringWithoutLocation) {
    EXPECT_EQ(JsonError::make("boom").to_string(), "boom");
    EXPECT_EQ(JsonError::make("boom", 4, 0).to_string(), "line 4: boom");
}

// ============================================================================
// Serializer Tests
// ============================================================================

TEST(JsonSerializerTest, CompactObjectKeysSorted) {
    auto obj = json_object();
    obj.set("b", json_int(1));
    auto arr = json_array();
    arr.push(json_bool(true));
    arr.push(json_null());
    obj.set("a", std::move(arr));

    EXPECT_EQ(obj.to_string(), R"({"a":[true,null],"b":1})");
}

TEST(JsonSerializerTest, EscapesStrings) {
    EXPECT_EQ(json_string("a\"b\\c\nd").to_string(), R"("a\"b\\c\nd")");
    EXPECT_EQ(json_string(std::string("\x01", 1)).to_string(), R"("\u0001")");
    // Non-ASCII bytes are copied unchanged
    EXPECT_EQ(json_string("caf\xC3\xA9").to_string(), "\"caf\xC3\xA9\"");
}

TEST(JsonSerializerTest, Numbers) {
    EXPECT_EQ(json_int(-5).to_string(), "-5");
    EXPECT_EQ(json_float(1.0).to_string(), "1.0");
    EXPECT_EQ(json_float(0.5).to_string(), "0.5");
    EXPECT_EQ(json_float(std::numeric_limits<double>::quiet_NaN()).to_string(), "null");
    EXPECT_EQ(json_float(std::numeric_limits<double>::infinity()).to_string(), "null");
}

TEST(JsonSerializerTest, ReparsesToEqualValue) {
    const char* text = R"([{"completed_date":null,"created_date":1709284500,"done":false,"id":1,"text":"Walk \"the\" dog"}])";
    auto value = parse_ok(text);
    EXPECT_EQ(value.to_string(), text);
    EXPECT_TRUE(parse_ok(value.to_string()) == value);
}

// ============================================================================
// Equality Tests
// ============================================================================

TEST(JsonValueTest, EqualityByType) {
    EXPECT_TRUE(json_null() == JsonValue());
    EXPECT_FALSE(json_null() == json_bool(false));
    EXPECT_FALSE(json_string("1") == json_int(1));
    EXPECT_TRUE(json_int(2) == json_float(2.0));
}
