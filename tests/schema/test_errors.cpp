#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <utility>
#include <vector>

#include "jsv/schema/errors.hpp"

using namespace jsv::schema;
using ::testing::HasSubstr;

class ValidationErrorTest : public ::testing::Test {
protected:
    static auto nested() -> ValidationError {
        ValidationError inner("1 is not of type \"string\"");
        inner.path = {std::size_t{1}};
        inner.schemaPath = {std::size_t{0}, std::string("type")};
        inner.setDetails("type", "string", 1, json{{"type", "string"}});

        std::vector<ValidationError> context;
        context.push_back(std::move(inner));
        ValidationError outer("[\"a\",1] is not valid under any of the given schemas",
                              std::move(context));
        outer.path = {std::string("items")};
        outer.schemaPath = {std::string("properties"), std::string("items"),
                            std::string("anyOf")};
        return outer;
    }
};

TEST_F(ValidationErrorTest, PointerEscapesSpecialCharacters) {
    Path path{std::string("a/b"), std::string("m~n"), std::size_t{3}};
    EXPECT_EQ(toPointer(path), "/a~1b/m~0n/3");
    EXPECT_EQ(toPointer(Path{}), "");
}

TEST_F(ValidationErrorTest, JsonPathQuotesNonIdentifiers) {
    ValidationError error("boom");
    error.path = {std::string("a"), std::size_t{1}, std::string("x y"),
                  std::string("_ok")};
    EXPECT_EQ(error.jsonPath(), "$.a[1][\"x y\"]._ok");

    ValidationError root("boom");
    EXPECT_EQ(root.jsonPath(), "$");
}

TEST_F(ValidationErrorTest, SetDetailsKeepsFirstKeyword) {
    ValidationError error("too small");
    EXPECT_FALSE(error.hasDetails());
    error.setDetails("minimum", 3, 1, json{{"minimum", 3}});
    error.setDetails("allOf", json::array(), 1, json::object());
    EXPECT_TRUE(error.hasDetails());
    EXPECT_EQ(error.keyword, "minimum");
    EXPECT_EQ(error.keywordValue, json(3));
    EXPECT_EQ(error.instance, json(1));
}

TEST_F(ValidationErrorTest, ToStringWithoutDetailsIsTheMessage) {
    ValidationError error("plain");
    EXPECT_EQ(error.toString(), "plain");
}

TEST_F(ValidationErrorTest, ToStringShowsSchemaAndInstance) {
    ValidationError error("1 is less than the minimum of 3");
    error.schemaPath = {std::string("minimum")};
    error.setDetails("minimum", 3, 1, json{{"minimum", 3}});
    EXPECT_EQ(error.toString(),
              "1 is less than the minimum of 3\n\n"
              "Failed validating \"minimum\" in schema:\n"
              "    {\n"
              "        \"minimum\": 3\n"
              "    }\n\n"
              "On instance:\n"
              "    1");
}

TEST_F(ValidationErrorTest, ContextPathsAreRelativeToParent) {
    ValidationError outer = nested();
    ASSERT_EQ(outer.context().size(), 1U);
    const ValidationError& inner = outer.context().front();
    EXPECT_EQ(inner.parent(), &outer);
    EXPECT_EQ(toPointer(inner.path), "/1");
    EXPECT_EQ(toPointer(inner.absolutePath()), "/items/1");
    EXPECT_EQ(toPointer(inner.absoluteSchemaPath()),
              "/properties/items/anyOf/0/type");
    EXPECT_EQ(inner.jsonPath(), "$.items[1]");
}

TEST_F(ValidationErrorTest, ParentLinksSurviveCopyAndMove) {
    ValidationError original = nested();
    ValidationError copy(original);
    EXPECT_EQ(copy.parent(), nullptr);
    EXPECT_EQ(copy.context().front().parent(), &copy);

    ValidationError moved(std::move(copy));
    EXPECT_EQ(moved.context().front().parent(), &moved);

    ValidationError assigned;
    assigned = moved;
    EXPECT_EQ(assigned.context().front().parent(), &assigned);

    std::vector<ValidationError> errors;
    for (int i = 0; i < 8; ++i) {
        errors.push_back(nested());
    }
    for (const auto& error : errors) {
        EXPECT_EQ(error.context().front().parent(), &error);
    }
}

TEST_F(ValidationErrorTest, ToJsonNestsContext) {
    ValidationError outer = nested();
    json rendered = outer.toJson();
    EXPECT_EQ(rendered["instanceLocation"], "/items");
    EXPECT_EQ(rendered["keywordLocation"], "/properties/items/anyOf");
    ASSERT_TRUE(rendered.contains("context"));
    ASSERT_EQ(rendered["context"].size(), 1U);
    const json& child = rendered["context"][0];
    EXPECT_EQ(child["keyword"], "type");
    EXPECT_EQ(child["instanceLocation"], "/items/1");
    EXPECT_EQ(child["keywordLocation"], "/properties/items/anyOf/0/type");
    EXPECT_THAT(child["message"].get<std::string>(), HasSubstr("string"));
}
