// ==============================================================================
// test_value_gtest.cpp - Тесты модели Value (GoogleTest)
// ==============================================================================

#include "warden/value.hpp"

#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>

#include <stdexcept>
#include <string>

namespace warden::test {

// ==============================================================================
// JSON
// ==============================================================================

TEST(ValueTest, ParseJson_Object_ReadsFields) {
    Value v = parse_json(R"({"name":"warden","count":3,"ratio":0.5,"tags":["a","b"],"none":null})");

    ASSERT_TRUE(v.is_object());
    ASSERT_NE(v.get("name"), nullptr);
    EXPECT_EQ(v.get("name")->as_string(), "warden");
    EXPECT_TRUE(v.get("count")->is_number());
    EXPECT_DOUBLE_EQ(v.get("count")->to_double(), 3.0);
    EXPECT_DOUBLE_EQ(v.get("ratio")->as_double(), 0.5);
    EXPECT_EQ(v.get("tags")->array_size(), 2u);
    EXPECT_TRUE(v.get("none")->is_null());
    EXPECT_EQ(v.get("missing"), nullptr);
}

TEST(ValueTest, ParseJson_Malformed_Throws) {
    EXPECT_THROW(parse_json("{\"a\": "), std::runtime_error);
}

TEST(ValueTest, CanonicalJson_SortsKeys) {
    Value v = Value::make_object();
    v.set("zeta", Value::make_int(1));
    v.set("alpha", Value("x"));
    Value nested = Value::make_object();
    nested.set("b", Value(true));
    nested.set("a", Value());
    v.set("mid", nested);

    EXPECT_EQ(to_canonical_json(v), R"({"alpha":"x","mid":{"a":null,"b":true},"zeta":1})");
}

TEST(ValueTest, CanonicalJson_SameContentDifferentInsertOrder_Equal) {
    Value a = Value::make_object();
    a.set("one", Value::make_int(1));
    a.set("two", Value::make_int(2));
    Value b = Value::make_object();
    b.set("two", Value::make_int(2));
    b.set("one", Value::make_int(1));

    EXPECT_EQ(to_canonical_json(a), to_canonical_json(b));
}

// ==============================================================================
// Сравнение и истинность
// ==============================================================================

TEST(ValueTest, Equality_NumbersCompareByValue) {
    EXPECT_EQ(Value::make_int(7), Value::make_uint(7));
    EXPECT_EQ(Value::make_int(7), Value(7.0));
    EXPECT_NE(Value::make_int(-1), Value::make_uint(1));
    EXPECT_NE(Value("7"), Value::make_int(7));
}

TEST(ValueTest, Equality_ArraysAndObjects_Structural) {
    Value a = Value::make_string_array({"x", "y"});
    Value b = Value::make_string_array({"x", "y"});
    Value c = Value::make_string_array({"y", "x"});
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}

TEST(ValueTest, IsTruthy_FollowsJsonSemantics) {
    EXPECT_FALSE(Value().is_truthy());
    EXPECT_FALSE(Value(false).is_truthy());
    EXPECT_FALSE(Value::make_int(0).is_truthy());
    EXPECT_FALSE(Value("").is_truthy());
    EXPECT_TRUE(Value("no").is_truthy());
    EXPECT_TRUE(Value::make_array().is_truthy());
}

// ==============================================================================
// YAML
// ==============================================================================

TEST(ValueTest, FromYaml_Scalars_Typed) {
    YAML::Node node = YAML::Load("count: 12\nenabled: true\nname: 'quoted'\nratio: 1.5\nempty: ~\n");
    Value v = from_yaml(node);

    ASSERT_TRUE(v.is_object());
    EXPECT_TRUE(v.get("count")->is_number());
    EXPECT_DOUBLE_EQ(v.get("count")->to_double(), 12.0);
    EXPECT_TRUE(v.get("enabled")->is_bool());
    EXPECT_TRUE(v.get("name")->is_string());
    EXPECT_EQ(v.get("name")->as_string(), "quoted");
    EXPECT_TRUE(v.get("ratio")->is_double());
    EXPECT_TRUE(v.get("empty")->is_null());
}

TEST(ValueTest, FromYaml_Sequence_BecomesArray) {
    Value v = from_yaml(YAML::Load("[a, b, c]"));
    ASSERT_TRUE(v.is_array());
    EXPECT_EQ(v.array_size(), 3u);
    EXPECT_EQ(v.as_array()[2].as_string(), "c");
}

}  // namespace warden::test
