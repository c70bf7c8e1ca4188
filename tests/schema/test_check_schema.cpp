#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <string>

#include "jsv/schema/exceptions.hpp"
#include "jsv/schema/validator.hpp"

using namespace jsv::schema;
using ::testing::HasSubstr;

class CheckSchemaTest : public ::testing::Test {};

TEST_F(CheckSchemaTest, NegativeLengthUnderDraft7) {
    json schema = json::parse(R"({"minLength": -1})");
    try {
        checkSchema(schema, draft7());
        FAIL() << "expected SchemaError";
    } catch (const SchemaError& e) {
        EXPECT_EQ(e.error().message, "-1 is less than the minimum of 0");
        EXPECT_EQ(toPointer(e.error().path), "/minLength");
        EXPECT_FALSE(e.errors().empty());
    }
}

TEST_F(CheckSchemaTest, BadTypeUnder202012) {
    json schema = json::parse(R"({"type": 12})");
    EXPECT_THROW(checkSchema(schema, draft202012()), SchemaError);
}

TEST_F(CheckSchemaTest, NestedSchemasAreChecked) {
    json schema = json::parse(
        R"({"properties": {"a": {"$defs": {"b": {"minItems": "x"}}}}})");
    try {
        checkSchema(schema, draft202012());
        FAIL() << "expected SchemaError";
    } catch (const SchemaError& e) {
        EXPECT_EQ(toPointer(e.error().path), "/properties/a/$defs/b/minItems");
    }
}

TEST_F(CheckSchemaTest, ValidSchemasPass) {
    json modern = json::parse(R"({
        "$id": "https://example.com/person",
        "type": "object",
        "properties": {
            "name": {"type": "string", "minLength": 1},
            "tags": {"type": "array", "items": {"type": "string"}, "uniqueItems": true}
        },
        "required": ["name"],
        "$defs": {"positive": {"type": "number", "exclusiveMinimum": 0}}
    })");
    EXPECT_NO_THROW(checkSchema(modern, draft202012()));
    EXPECT_NO_THROW(checkSchema(modern, draft201909()));
    EXPECT_NO_THROW(checkSchema(json(true), draft202012()));

    json legacy = json::parse(R"({
        "type": "object",
        "properties": {"a": {"type": "integer", "minimum": 0, "exclusiveMinimum": true}}
    })");
    EXPECT_NO_THROW(checkSchema(legacy, draft4()));
    EXPECT_NO_THROW(checkSchema(json::parse(R"({"type": ["string", {"type": "integer"}]})"),
                                draft3()));
}

TEST_F(CheckSchemaTest, CompileInfersDialect) {
    auto validator = compile(json::parse(
        R"({"$schema": "http://json-schema.org/draft-04/schema#", "type": "integer"})"));
    EXPECT_EQ(validator.dialect()->name, "draft4");
    EXPECT_FALSE(validator.isValid(json::parse("1.0")));

    auto modern = compile(json::parse(R"({"type": "integer"})"));
    EXPECT_EQ(modern.dialect()->name, "draft2020-12");
}

TEST_F(CheckSchemaTest, CompileRejectsInvalidSchema) {
    EXPECT_THROW((void)compile(json::parse(R"({"minLength": -1})")),
                 SchemaError);
}

TEST_F(CheckSchemaTest, CompileWithUnknownDialect) {
    json schema = json::parse(
        R"({"$schema": "https://example.com/unknown", "minimum": 1})");
    EXPECT_THROW((void)compile(schema), UnknownDialect);

    CompileOptions options;
    options.defaultDialect = draft7();
    auto validator = compile(schema, options);
    EXPECT_EQ(validator.dialect()->name, "draft7");
    EXPECT_FALSE(validator.isValid(json(0)));
}

TEST_F(CheckSchemaTest, CompileCanSkipCheck) {
    CompileOptions options;
    options.checkSchema = false;
    EXPECT_NO_THROW((void)compile(json::parse(R"({"minLength": -1})"), options));
}

TEST_F(CheckSchemaTest, CompileBindsFormatChecker) {
    auto checker = std::make_shared<FormatChecker>();
    checker->registerFormat("lower", [](const json& instance) {
        if (!instance.is_string()) {
            return true;
        }
        const auto& text = instance.get_ref<const std::string&>();
        return std::none_of(text.begin(), text.end(),
                            [](char c) { return c >= 'A' && c <= 'Z'; });
    });
    CompileOptions options;
    options.formatChecker = checker;
    auto validator = compile(json::parse(R"({"format": "lower"})"), options);
    EXPECT_TRUE(validator.isValid(json("abc")));
    auto error = validator.firstError(json("aBc"));
    ASSERT_TRUE(error.has_value());
    EXPECT_THAT(error->message, HasSubstr("is not a \"lower\""));
}

TEST_F(CheckSchemaTest, DialectWithoutMetaSchema) {
    auto bare = DialectBuilder(*draft7())
                    .name("bare")
                    .metaSchema("https://example.com/bare", nullptr)
                    .build();
    EXPECT_THROW(checkSchema(json::object(), bare), UnknownDialect);
}
