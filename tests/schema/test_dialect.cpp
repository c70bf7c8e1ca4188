#include <gtest/gtest.h>

#include <string>

#include "jsv/schema/dialect.hpp"
#include "jsv/schema/exceptions.hpp"
#include "jsv/schema/validator.hpp"

using namespace jsv::schema;

namespace {
auto evenKeyword(Evaluator& ev, const json& value, const json& instance,
                 const json& /*schema*/) -> ErrorStream {
    if (!value.is_boolean() || !value.get<bool>() ||
        !ev.isType(instance, "integer")) {
        co_return;
    }
    if (instance.get<long long>() % 2 != 0) {
        co_yield ValidationError(instance.dump() + " is not even");
    }
}
}  // namespace

class DialectTest : public ::testing::Test {};

TEST_F(DialectTest, BuiltinCatalogFindsEveryDraft) {
    const auto& catalog = DialectCatalog::builtin();
    EXPECT_EQ(catalog.dialects().size(), 6U);
    EXPECT_EQ(catalog.find("http://json-schema.org/draft-03/schema#")->name,
              "draft3");
    EXPECT_EQ(catalog.find("http://json-schema.org/draft-04/schema")->name,
              "draft4");
    EXPECT_EQ(catalog.find("http://json-schema.org/draft-06/schema#")->name,
              "draft6");
    EXPECT_EQ(catalog.find("http://json-schema.org/draft-07/schema#")->name,
              "draft7");
    EXPECT_EQ(catalog.find("https://json-schema.org/draft/2019-09/schema")->name,
              "draft2019-09");
    EXPECT_EQ(catalog.find("https://json-schema.org/draft/2020-12/schema")->name,
              "draft2020-12");
    EXPECT_EQ(catalog.find("https://example.com/custom"), nullptr);
}

TEST_F(DialectTest, DialectForReadsSchemaKeyword) {
    const auto& catalog = DialectCatalog::builtin();
    json draft4Schema = json::parse(
        R"({"$schema": "http://json-schema.org/draft-04/schema#"})");
    EXPECT_EQ(catalog.dialectFor(draft4Schema), draft4());
    EXPECT_EQ(catalog.dialectFor(json::object()), draft202012());
    EXPECT_EQ(catalog.dialectFor(json::object(), draft7()), draft7());
    EXPECT_EQ(catalog.dialectFor(json(true)), draft202012());
}

TEST_F(DialectTest, UnknownSchemaKeyword) {
    const auto& catalog = DialectCatalog::builtin();
    json schema = json::parse(R"({"$schema": "https://example.com/custom"})");
    EXPECT_THROW((void)catalog.dialectFor(schema), UnknownDialect);
    EXPECT_EQ(catalog.dialectFor(schema, draft6()), draft6());
}

TEST_F(DialectTest, CatalogCanBeExtended) {
    auto custom = DialectBuilder(*draft202012())
                      .name("custom")
                      .metaSchema("https://example.com/custom", nullptr)
                      .build();
    auto catalog = DialectCatalog::builtin().withDialect(custom);
    EXPECT_EQ(catalog.find("https://example.com/custom#"), custom);
    EXPECT_EQ(DialectCatalog::builtin().find("https://example.com/custom"),
              nullptr);
}

TEST_F(DialectTest, IdentifierKeywordPerDraft) {
    json legacy = json::parse(R"({"id": "http://a/", "$id": "http://b/"})");
    EXPECT_EQ(draft4()->idOf(legacy), "http://a/");
    EXPECT_EQ(draft6()->idOf(legacy), "http://b/");
    EXPECT_EQ(draft202012()->idOf(json(true)), "");
}

TEST_F(DialectTest, RefHidesIdentifierUpToDraft7) {
    json schema = json::parse(R"({"$id": "http://b/", "$ref": "#/x"})");
    EXPECT_EQ(draft7()->idOf(schema), "");
    EXPECT_EQ(draft201909()->idOf(schema), "http://b/");
}

TEST_F(DialectTest, KeywordTablesFollowEachDraft) {
    EXPECT_NE(draft3()->keyword("disallow"), nullptr);
    EXPECT_NE(draft3()->keyword("extends"), nullptr);
    EXPECT_EQ(draft3()->keyword("allOf"), nullptr);

    EXPECT_NE(draft4()->keyword("allOf"), nullptr);
    EXPECT_EQ(draft4()->keyword("const"), nullptr);

    EXPECT_NE(draft6()->keyword("propertyNames"), nullptr);
    EXPECT_EQ(draft6()->keyword("if"), nullptr);
    EXPECT_NE(draft7()->keyword("if"), nullptr);

    EXPECT_NE(draft201909()->keyword("$recursiveRef"), nullptr);
    EXPECT_NE(draft201909()->keyword("additionalItems"), nullptr);
    EXPECT_EQ(draft201909()->keyword("dependencies"), nullptr);
    EXPECT_TRUE(draft201909()->isDeferred("unevaluatedProperties"));

    EXPECT_NE(draft202012()->keyword("prefixItems"), nullptr);
    EXPECT_NE(draft202012()->keyword("$dynamicRef"), nullptr);
    EXPECT_EQ(draft202012()->keyword("$recursiveRef"), nullptr);
    EXPECT_EQ(draft202012()->keyword("additionalItems"), nullptr);
    EXPECT_TRUE(draft202012()->isDeferred("unevaluatedItems"));
    EXPECT_FALSE(draft202012()->isDeferred("items"));
}

TEST_F(DialectTest, BuiltinDialectsCarryMetaSchemas) {
    for (const auto& dialect : DialectCatalog::builtin().dialects()) {
        ASSERT_NE(dialect->metaSchema, nullptr) << dialect->name;
        EXPECT_TRUE(dialect->metaSchema->is_object()) << dialect->name;
    }
}

TEST_F(DialectTest, BuilderAddsKeyword) {
    auto strict = DialectBuilder(*draft202012())
                      .name("strict")
                      .keyword("x-even", evenKeyword)
                      .build();
    EXPECT_EQ(strict->name, "strict");
    EXPECT_EQ(draft202012()->keyword("x-even"), nullptr);

    Validator validator(json::parse(R"({"x-even": true})"), strict);
    EXPECT_TRUE(validator.isValid(json(4)));
    EXPECT_TRUE(validator.isValid(json("odd")));
    auto errors = validator.errors(json(3));
    ASSERT_EQ(errors.size(), 1U);
    EXPECT_EQ(errors[0].message, "3 is not even");
    EXPECT_EQ(errors[0].keyword, "x-even");
}

TEST_F(DialectTest, BuilderRemovesKeyword) {
    auto lenient =
        DialectBuilder(*draft7()).name("lenient").removeKeyword("minimum").build();
    Validator validator(json::parse(R"({"minimum": 5})"), lenient);
    EXPECT_TRUE(validator.isValid(json(1)));
}

TEST_F(DialectTest, BuilderRejectsEmptyFunction) {
    DialectBuilder builder(*draft7());
    EXPECT_THROW(builder.keyword("x-none", KeywordFn{}),
                 jsv::error::InvalidArgument);
}

TEST_F(DialectTest, DeferredKeywordsRunLast) {
    auto dialect = DialectBuilder(*draft202012())
                       .name("deferred")
                       .keyword("a-even", evenKeyword)
                       .defer("a-even")
                       .build();
    Validator validator(json::parse(R"({"a-even": true, "maximum": 0})"),
                        dialect);
    auto errors = validator.errors(json(3));
    ASSERT_EQ(errors.size(), 2U);
    EXPECT_EQ(errors[0].keyword, "maximum");
    EXPECT_EQ(errors[1].keyword, "a-even");
}
