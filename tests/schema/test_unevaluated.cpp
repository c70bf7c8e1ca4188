#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "jsv/schema/validator.hpp"

using namespace jsv::schema;
using ::testing::HasSubstr;

class UnevaluatedTest : public ::testing::Test {
protected:
    static auto validator(const char* text,
                          std::shared_ptr<const Dialect> dialect = draft202012())
        -> Validator {
        return Validator(json::parse(text), std::move(dialect));
    }
};

TEST_F(UnevaluatedTest, PropertiesFalseReportsOnce) {
    auto v = validator(R"({
        "properties": {"a": true},
        "unevaluatedProperties": false
    })");
    EXPECT_TRUE(v.isValid(json::parse(R"({"a": 1})")));
    auto errors = v.errors(json::parse(R"({"a": 1, "b": 2, "c": 3})"));
    ASSERT_EQ(errors.size(), 1U);
    EXPECT_EQ(errors[0].message,
              R"(Unevaluated properties are not allowed ("b", "c" were unexpected))");
    EXPECT_EQ(errors[0].keyword, "unevaluatedProperties");
}

TEST_F(UnevaluatedTest, PropertiesSchemaAppliesToEachLeftover) {
    auto v = validator(R"({
        "properties": {"a": true},
        "unevaluatedProperties": {"type": "string"}
    })");
    EXPECT_TRUE(v.isValid(json::parse(R"({"a": 1, "b": "x"})")));
    auto errors = v.errors(json::parse(R"({"a": 1, "b": 2})"));
    ASSERT_EQ(errors.size(), 1U);
    EXPECT_EQ(toPointer(errors[0].path), "/b");
    EXPECT_EQ(toPointer(errors[0].schemaPath), "/unevaluatedProperties/type");
}

TEST_F(UnevaluatedTest, SeesThroughAllOf) {
    auto v = validator(R"({
        "allOf": [{"properties": {"a": true}}],
        "properties": {"b": true},
        "unevaluatedProperties": false
    })");
    EXPECT_TRUE(v.isValid(json::parse(R"({"a": 1, "b": 2})")));
    EXPECT_FALSE(v.isValid(json::parse(R"({"a": 1, "c": 2})")));
}

TEST_F(UnevaluatedTest, OnlyMatchingAnyOfBranchesCount) {
    auto v = validator(R"({
        "anyOf": [
            {"properties": {"a": {"type": "integer"}}, "required": ["a"]},
            {"properties": {"b": {"type": "integer"}}, "required": ["b"]}
        ],
        "unevaluatedProperties": false
    })");
    EXPECT_TRUE(v.isValid(json::parse(R"({"a": 1})")));
    EXPECT_TRUE(v.isValid(json::parse(R"({"a": 1, "b": 2})")));
    auto errors = v.errors(json::parse(R"({"a": 1, "b": "x"})"));
    ASSERT_EQ(errors.size(), 1U);
    EXPECT_THAT(errors[0].message, HasSubstr("\"b\""));
}

TEST_F(UnevaluatedTest, FollowsIfThenElse) {
    auto v = validator(R"({
        "if": {"properties": {"kind": {"const": "a"}}, "required": ["kind"]},
        "then": {"properties": {"x": true}},
        "else": {"properties": {"y": true}},
        "unevaluatedProperties": false
    })");
    EXPECT_TRUE(v.isValid(json::parse(R"({"kind": "a", "x": 1})")));
    EXPECT_FALSE(v.isValid(json::parse(R"({"kind": "a", "y": 1})")));
    EXPECT_TRUE(v.isValid(json::parse(R"({"y": 1})")));
    // A failed "if" contributes nothing, so "kind" stays unevaluated.
    EXPECT_FALSE(v.isValid(json::parse(R"({"kind": "b", "y": 1})")));
}

TEST_F(UnevaluatedTest, FollowsReferences) {
    auto v = validator(R"({
        "$ref": "#/$defs/base",
        "properties": {"extra": true},
        "unevaluatedProperties": false,
        "$defs": {"base": {"properties": {"id": {"type": "integer"}}}}
    })");
    EXPECT_TRUE(v.isValid(json::parse(R"({"id": 1, "extra": 2})")));
    EXPECT_FALSE(v.isValid(json::parse(R"({"id": 1, "other": 2})")));
}

TEST_F(UnevaluatedTest, NestedSchemasDoNotLeak) {
    auto v = validator(R"({
        "properties": {"child": {"properties": {"a": true}}},
        "unevaluatedProperties": false
    })");
    EXPECT_FALSE(v.isValid(json::parse(R"({"child": {}, "a": 1})")));
}

TEST_F(UnevaluatedTest, NotNeverContributes) {
    auto v = validator(R"({
        "not": {"not": {"properties": {"a": true}}},
        "unevaluatedProperties": false
    })");
    EXPECT_TRUE(v.isValid(json::parse("{}")));
    auto errors = v.errors(json::parse(R"({"a": 1})"));
    ASSERT_EQ(errors.size(), 1U);
    EXPECT_EQ(errors[0].keyword, "unevaluatedProperties");
}

TEST_F(UnevaluatedTest, OnlyPassingOneOfBranchCounts) {
    auto v = validator(R"({
        "oneOf": [
            {"properties": {"a": {"type": "string"}}, "required": ["a"]},
            {"properties": {"b": {"type": "string"}}, "required": ["b"]}
        ],
        "unevaluatedProperties": false
    })");
    EXPECT_TRUE(v.isValid(json::parse(R"({"a": "x"})")));
    EXPECT_TRUE(v.isValid(json::parse(R"({"b": "x"})")));
    // The failing branch still mentions "b" in its properties.
    auto errors = v.errors(json::parse(R"({"a": "x", "b": 1})"));
    ASSERT_EQ(errors.size(), 1U);
    EXPECT_EQ(errors[0].message,
              R"(Unevaluated properties are not allowed ("b" was unexpected))");
}

TEST_F(UnevaluatedTest, FollowsDependentSchemas) {
    auto v = validator(R"({
        "properties": {"kind": true},
        "dependentSchemas": {"kind": {"properties": {"size": true}}},
        "unevaluatedProperties": false
    })");
    EXPECT_TRUE(v.isValid(json::parse(R"({"kind": 1, "size": 2})")));
    EXPECT_FALSE(v.isValid(json::parse(R"({"size": 2})")));
    EXPECT_FALSE(v.isValid(json::parse(R"({"kind": 1, "color": 2})")));
}

TEST_F(UnevaluatedTest, ItemsAfterPrefixItems) {
    auto v = validator(R"({
        "prefixItems": [{"type": "integer"}],
        "unevaluatedItems": false
    })");
    EXPECT_TRUE(v.isValid(json::parse("[1]")));
    auto errors = v.errors(json::parse(R"([1, "a", null])"));
    ASSERT_EQ(errors.size(), 1U);
    EXPECT_EQ(errors[0].message,
              R"(Unevaluated items are not allowed ("a", null were unexpected))");
}

TEST_F(UnevaluatedTest, ItemsClaimedByContains) {
    auto v = validator(R"({
        "contains": {"type": "string"},
        "unevaluatedItems": {"type": "integer"}
    })");
    EXPECT_TRUE(v.isValid(json::parse(R"(["a", 1, "b"])")));
    EXPECT_FALSE(v.isValid(json::parse(R"(["a", 1.5])")));
}

TEST_F(UnevaluatedTest, ContainsDoesNotClaimItemsIn201909) {
    auto v = validator(R"({
        "contains": {"type": "string"},
        "unevaluatedItems": false
    })", draft201909());
    EXPECT_FALSE(v.isValid(json::parse(R"(["a"])")));
}

TEST_F(UnevaluatedTest, LegacyItemsIn201909) {
    auto v = validator(R"({
        "items": [{"type": "integer"}],
        "additionalItems": {"type": "string"},
        "unevaluatedItems": false
    })", draft201909());
    EXPECT_TRUE(v.isValid(json::parse(R"([1, "a", "b"])")));
    auto errors = v.errors(json::parse(R"([1, 2])"));
    ASSERT_EQ(errors.size(), 1U);
    EXPECT_EQ(toPointer(errors[0].path), "/1");
    EXPECT_EQ(errors[0].keyword, "type");
}
