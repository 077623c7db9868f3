#include "codec/value.hpp"
#include "common/errors.hpp"

#include <cstdint>
#include <limits>
#include <sstream>
#include <string>
#include <variant>

#include <gtest/gtest.h>

namespace pdict {

// ── Construction / kinds ──────────────────────────────────────────────────────

TEST(ValueTest, DefaultIsNull) {
    Value v;
    EXPECT_TRUE(v.is_null());
    EXPECT_EQ(v.type(), Value::Type::Null);
    EXPECT_EQ(v, Value(nullptr));
}

TEST(ValueTest, ScalarConstructorsPickExpectedKind) {
    EXPECT_TRUE(Value(true).is_bool());
    EXPECT_TRUE(Value(42).is_int());
    EXPECT_TRUE(Value(42u).is_int());
    EXPECT_TRUE(Value(int64_t{-7}).is_int());
    EXPECT_TRUE(Value(1.5).is_double());
    EXPECT_TRUE(Value(1.5f).is_double());
    EXPECT_TRUE(Value("text").is_string());
    EXPECT_TRUE(Value(std::string("text")).is_string());
    EXPECT_TRUE(Value(std::string_view("text")).is_string());
    EXPECT_TRUE(Value(Value::Bytes{0x00, 0xff}).is_bytes());
    EXPECT_TRUE(Value::array().is_array());
    EXPECT_TRUE(Value::object().is_object());
}

TEST(ValueTest, UnsignedAboveInt64MaxIsRejected) {
    constexpr uint64_t max_signed = std::numeric_limits<int64_t>::max();
    EXPECT_EQ(Value(max_signed).as_int(), std::numeric_limits<int64_t>::max());
    EXPECT_THROW((void)Value(max_signed + 1), SerializationError);
    EXPECT_THROW((void)Value(std::numeric_limits<uint64_t>::max()), SerializationError);
    EXPECT_EQ(Value(std::numeric_limits<uint32_t>::max()).as_int(), 4'294'967'295);
}

TEST(ValueTest, AccessorsReturnStoredData) {
    EXPECT_EQ(Value(42).as_int(), 42);
    EXPECT_DOUBLE_EQ(Value(2.25).as_double(), 2.25);
    EXPECT_EQ(Value("abc").as_string(), "abc");
    EXPECT_TRUE(Value(true).as_bool());
}

TEST(ValueTest, AccessorThrowsOnKindMismatch) {
    EXPECT_THROW((void)Value(1).as_string(), std::bad_variant_access);
    EXPECT_THROW((void)Value("1").as_int(), std::bad_variant_access);
}

TEST(ValueTest, TypeNames) {
    EXPECT_EQ(Value().type_name(), "null");
    EXPECT_EQ(Value(1).type_name(), "int");
    EXPECT_EQ(Value::object().type_name(), "object");
}

// ── Equality ──────────────────────────────────────────────────────────────────

TEST(ValueTest, EqualityDistinguishesKinds) {
    EXPECT_NE(Value(1), Value(1.0));
    EXPECT_NE(Value("ab"), Value(Value::Bytes{'a', 'b'}));
    EXPECT_NE(Value(false), Value(0));
    EXPECT_NE(Value(), Value::object());
}

TEST(ValueTest, EqualityIsDeepForContainers) {
    Value a(Value::Object{{"k", Value(Value::Array{1, "two", 3.0})}});
    Value b(Value::Object{{"k", Value(Value::Array{1, "two", 3.0})}});
    Value c(Value::Object{{"k", Value(Value::Array{1, "two", 4.0})}});
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}

// ── find() ────────────────────────────────────────────────────────────────────

TEST(ValueTest, FindLooksUpObjectMembers) {
    Value v(Value::Object{{"tag", "html"}});
    ASSERT_NE(v.find("tag"), nullptr);
    EXPECT_EQ(*v.find("tag"), Value("html"));
    EXPECT_EQ(v.find("missing"), nullptr);
}

TEST(ValueTest, FindOnNonObjectReturnsNull) {
    EXPECT_EQ(Value(1).find("x"), nullptr);
    EXPECT_EQ(Value::array().find("x"), nullptr);
}

// ── depth() ───────────────────────────────────────────────────────────────────

TEST(ValueTest, DepthCountsNestingLevels) {
    EXPECT_EQ(Value(1).depth(), 1u);
    EXPECT_EQ(Value::array().depth(), 1u);
    EXPECT_EQ(Value(Value::Array{1, 2}).depth(), 2u);

    Value nested(Value::Array{Value(Value::Object{{"a", Value(Value::Array{1})}})});
    EXPECT_EQ(nested.depth(), 4u);
}

// ── to_string() ───────────────────────────────────────────────────────────────

TEST(ValueTest, ToStringRendersJsonLike) {
    Value v(Value::Object{
        {"b", Value(Value::Array{1, true, nullptr})},
        {"a", "x\"y"},
    });
    EXPECT_EQ(to_string(v), R"({"a": "x\"y", "b": [1, true, null]})");
    EXPECT_EQ(to_string(Value(Value::Bytes{0x0a, 0xff})), "b'0aff'");
}

TEST(ValueTest, StreamOperatorMatchesToString) {
    Value v(Value::Array{1, "s"});
    std::ostringstream oss;
    oss << v;
    EXPECT_EQ(oss.str(), to_string(v));
}

} // namespace pdict
