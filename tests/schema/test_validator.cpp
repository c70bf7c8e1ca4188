#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "jsv/schema/error_tree.hpp"
#include "jsv/schema/exceptions.hpp"
#include "jsv/schema/validator.hpp"

using namespace jsv::schema;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

class ValidatorTest : public ::testing::Test {
protected:
    static auto validator(const char* text,
                          std::shared_ptr<const Dialect> dialect = draft202012())
        -> Validator {
        return Validator(json::parse(text), std::move(dialect));
    }

    static auto messages(const Validator& v, const json& instance)
        -> std::vector<std::string> {
        std::vector<std::string> result;
        for (const auto& error : v.errors(instance)) {
            result.push_back(error.message);
        }
        return result;
    }
};

TEST_F(ValidatorTest, BooleanSchemas) {
    Validator accept(json(true), draft202012());
    Validator reject(json(false), draft202012());
    EXPECT_TRUE(accept.isValid(json::parse(R"({"any": [1, 2]})")));
    EXPECT_THAT(messages(reject, json(1)),
                ElementsAre("False schema does not allow 1"));
}

TEST_F(ValidatorTest, FalseSubschema) {
    auto v = validator(R"({"properties": {"a": false}})");
    auto errors = v.errors(json::parse(R"({"a": 1})"));
    ASSERT_EQ(errors.size(), 1U);
    EXPECT_EQ(errors[0].message, "False schema does not allow 1");
    EXPECT_EQ(toPointer(errors[0].path), "/a");
    EXPECT_EQ(toPointer(errors[0].schemaPath), "/properties/a");
}

TEST_F(ValidatorTest, ConstDistinguishesBooleansFromNumbers) {
    auto v = validator(R"({"const": 0})");
    EXPECT_TRUE(v.isValid(json(0)));
    EXPECT_TRUE(v.isValid(json(0.0)));
    EXPECT_THAT(messages(v, json(false)), ElementsAre("0 was expected"));
}

TEST_F(ValidatorTest, EnumAndLengthErrorsInKeywordOrder) {
    auto v = validator(R"({"items": {"enum": [1, 2, 3]}, "maxItems": 2})");
    auto errors = v.errors(json::parse("[2, 3, 4]"));
    ASSERT_EQ(errors.size(), 2U);
    EXPECT_EQ(errors[0].message, "4 is not one of [1,2,3]");
    EXPECT_EQ(toPointer(errors[0].path), "/2");
    EXPECT_EQ(errors[0].keyword, "enum");
    EXPECT_EQ(errors[1].message, "[2,3,4] is too long");
    EXPECT_TRUE(errors[1].path.empty());
    EXPECT_EQ(errors[1].keyword, "maxItems");
}

TEST_F(ValidatorTest, DecimalMultipleOf) {
    auto v = validator(R"({"multipleOf": 0.01})");
    EXPECT_TRUE(v.isValid(json::parse("19.99")));
    EXPECT_FALSE(v.isValid(json::parse("19.995")));
    auto integral = validator(R"({"multipleOf": 3})");
    EXPECT_THAT(messages(integral, json(7)),
                ElementsAre("7 is not a multiple of 3"));
}

TEST_F(ValidatorTest, PathsAndSchemaPaths) {
    auto v = validator(
        R"({"properties": {"a": {"items": {"type": "string"}}}})");
    auto errors = v.errors(json::parse(R"({"a": ["x", 1]})"));
    ASSERT_EQ(errors.size(), 1U);
    const auto& error = errors[0];
    EXPECT_EQ(error.message, R"(1 is not of type "string")");
    EXPECT_EQ(toPointer(error.path), "/a/1");
    EXPECT_EQ(toPointer(error.schemaPath), "/properties/a/items/type");
    EXPECT_EQ(error.jsonPath(), "$.a[1]");
    EXPECT_EQ(error.instance, json(1));
    EXPECT_EQ(error.keywordValue, json("string"));
    EXPECT_EQ(error.schema, json::parse(R"({"type": "string"})"));
}

TEST_F(ValidatorTest, AnyOfCollectsContext) {
    auto v = validator(R"({"anyOf": [{"type": "string"}, {"minimum": 5}]})");
    auto errors = v.errors(json(1));
    ASSERT_EQ(errors.size(), 1U);
    EXPECT_EQ(errors[0].message, "1 is not valid under any of the given schemas");
    ASSERT_EQ(errors[0].context().size(), 2U);
    const auto& second = errors[0].context()[1];
    EXPECT_EQ(second.message, "1 is less than the minimum of 5");
    EXPECT_EQ(toPointer(second.schemaPath), "/1/minimum");
    EXPECT_EQ(toPointer(second.absoluteSchemaPath()), "/anyOf/1/minimum");
    EXPECT_TRUE(v.isValid(json("s")));
    EXPECT_TRUE(v.isValid(json(7)));
}

TEST_F(ValidatorTest, OneOfRejectsAmbiguousMatches) {
    auto v = validator(R"({"oneOf": [{"type": "string"}, {"minLength": 2}]})");
    EXPECT_TRUE(v.isValid(json("a")));
    auto errors = v.errors(json("ab"));
    ASSERT_EQ(errors.size(), 1U);
    EXPECT_EQ(errors[0].message,
              R"("ab" is valid under each of {"type":"string"}, {"minLength":2})");
    auto none = validator(R"({"oneOf": [{"type": "string"}, {"type": "null"}]})");
    EXPECT_THAT(messages(none, json(1)),
                ElementsAre("1 is not valid under any of the given schemas"));
}

TEST_F(ValidatorTest, Not) {
    auto v = validator(R"({"not": {"type": "integer"}})");
    EXPECT_TRUE(v.isValid(json("x")));
    EXPECT_THAT(messages(v, json(1)),
                ElementsAre(R"({"type":"integer"} is not allowed for 1)"));
}

TEST_F(ValidatorTest, IfThenElse) {
    auto v = validator(R"({
        "if": {"type": "integer"},
        "then": {"minimum": 0},
        "else": {"type": "string"}
    })");
    EXPECT_TRUE(v.isValid(json(3)));
    EXPECT_TRUE(v.isValid(json("x")));
    auto errors = v.errors(json(-1));
    ASSERT_EQ(errors.size(), 1U);
    EXPECT_EQ(toPointer(errors[0].schemaPath), "/if/then/minimum");
    auto otherwise = v.errors(json(1.5));
    ASSERT_EQ(otherwise.size(), 1U);
    EXPECT_EQ(toPointer(otherwise[0].schemaPath), "/if/else/type");
}

TEST_F(ValidatorTest, ObjectKeywords) {
    auto v = validator(R"({
        "required": ["id"],
        "dependentRequired": {"a": ["b"]},
        "propertyNames": {"maxLength": 2},
        "minProperties": 2
    })");
    EXPECT_TRUE(v.isValid(json::parse(R"({"id": 1, "a": 1, "b": 2})")));
    EXPECT_THAT(messages(v, json::parse(R"({"a": 1})")),
                ElementsAre(R"("b" is a dependency of "a")",
                            R"({"a":1} does not have enough properties)",
                            R"("id" is a required property)"));
    EXPECT_THAT(messages(v, json::parse(R"({"id": 1, "abc": 2})")),
                ElementsAre(R"("abc" is too long)"));
}

TEST_F(ValidatorTest, AdditionalProperties) {
    auto plain = validator(
        R"({"properties": {"a": true}, "additionalProperties": false})");
    EXPECT_THAT(
        messages(plain, json::parse(R"({"a": 1, "b": 2})")),
        ElementsAre(R"(Additional properties are not allowed ("b" was unexpected))"));

    auto patterned = validator(
        R"({"patternProperties": {"^x": true}, "additionalProperties": false})");
    EXPECT_TRUE(patterned.isValid(json::parse(R"({"xa": 1})")));
    EXPECT_THAT(messages(patterned, json::parse(R"({"y": 1, "z": 2})")),
                ElementsAre(R"("y", "z" do not match any of the regexes: "^x")"));

    auto typed = validator(R"({"additionalProperties": {"type": "integer"}})");
    auto errors = typed.errors(json::parse(R"({"a": "x"})"));
    ASSERT_EQ(errors.size(), 1U);
    EXPECT_EQ(toPointer(errors[0].path), "/a");
}

TEST_F(ValidatorTest, ArrayKeywords) {
    auto v = validator(R"({"prefixItems": [{"type": "integer"}], "items": false})");
    EXPECT_TRUE(v.isValid(json::parse("[1]")));
    EXPECT_THAT(messages(v, json::parse(R"([1, "a", 2])")),
                ElementsAre(R"(Expected at most 1 items but found 2 extra: "a", 2)"));

    auto unique = validator(R"({"uniqueItems": true})");
    EXPECT_TRUE(unique.isValid(json::parse("[1, true, \"1\"]")));
    EXPECT_THAT(messages(unique, json::parse("[1, 1.0]")),
                ElementsAre("[1,1.0] has non-unique elements"));
}

TEST_F(ValidatorTest, ContainsBounds) {
    auto v = validator(R"({
        "contains": {"type": "integer"},
        "minContains": 2,
        "maxContains": 3
    })");
    EXPECT_TRUE(v.isValid(json::parse(R"([1, "a", 2])")));
    EXPECT_THAT(messages(v, json::parse(R"([1, "a"])")),
                ElementsAre("Too few items match the given schema (expected at "
                            "least 2 but only 1 matched)"));
    EXPECT_THAT(messages(v, json::parse("[1, 2, 3, 4]")),
                ElementsAre("Too many items match the given schema (expected at "
                            "most 3)"));
    EXPECT_THAT(messages(v, json::parse(R"(["a"])")),
                ElementsAre(R"(None of ["a"] are valid under the given schema)"));

    auto zero = validator(R"({"contains": {"type": "integer"}, "minContains": 0})");
    EXPECT_TRUE(zero.isValid(json::parse(R"(["a"])")));
}

TEST_F(ValidatorTest, ContainsBoundsBeyondIntegerRange) {
    auto many = validator(R"({"contains": {}, "maxContains": 1e300})");
    EXPECT_TRUE(many.isValid(json::parse("[1]")));
    EXPECT_TRUE(many.isValid(json::parse("[1, 2, 3]")));

    auto huge = validator(R"({"contains": {}, "minContains": 1e300})");
    EXPECT_THAT(messages(huge, json::parse("[1, 2]")),
                ElementsAre("Too few items match the given schema (expected at "
                            "least 1e+300 but only 2 matched)"));

    auto exact = validator(R"({"contains": {}, "maxContains": 2.0})");
    EXPECT_TRUE(exact.isValid(json::parse("[1, 2]")));
    EXPECT_FALSE(exact.isValid(json::parse("[1, 2, 3]")));
}

TEST_F(ValidatorTest, Pattern) {
    auto v = validator(R"({"pattern": "^a+$"})");
    EXPECT_TRUE(v.isValid(json("aaa")));
    EXPECT_TRUE(v.isValid(json(12)));
    EXPECT_THAT(messages(v, json("ab")), ElementsAre(R"("ab" does not match "^a+$")"));

    auto broken = validator(R"({"pattern": "(unclosed"})");
    auto errors = broken.errors(json("x"));
    ASSERT_EQ(errors.size(), 1U);
    EXPECT_EQ(errors[0].message, R"("(unclosed" is not a valid regular expression)");
    EXPECT_NE(errors[0].cause, nullptr);
}

TEST_F(ValidatorTest, Draft4ExclusiveMaximumIsBoolean) {
    auto v = validator(R"({"maximum": 3, "exclusiveMaximum": true})", draft4());
    EXPECT_TRUE(v.isValid(json(2)));
    EXPECT_THAT(messages(v, json(3)),
                ElementsAre("3 is greater than or equal to the maximum of 3"));

    auto modern = validator(R"({"exclusiveMaximum": 3})", draft6());
    EXPECT_THAT(messages(modern, json(3)),
                ElementsAre("3 is greater than or equal to the maximum of 3"));
}

TEST_F(ValidatorTest, IntegerWithZeroFraction) {
    const char* schema = R"({"type": "integer"})";
    const json one = json::parse("1.0");
    EXPECT_FALSE(validator(schema, draft3()).isValid(one));
    EXPECT_FALSE(validator(schema, draft4()).isValid(one));
    EXPECT_TRUE(validator(schema, draft6()).isValid(one));
    EXPECT_TRUE(validator(schema, draft202012()).isValid(one));
}

TEST_F(ValidatorTest, Draft3Keywords) {
    auto v = validator(R"({
        "properties": {"a": {"required": true}, "b": {"type": "integer"}},
        "disallow": "array",
        "extends": {"minProperties": 0}
    })", draft3());
    EXPECT_TRUE(v.isValid(json::parse(R"({"a": 1})")));
    auto errors = v.errors(json::parse(R"({"b": 1})"));
    ASSERT_EQ(errors.size(), 1U);
    EXPECT_EQ(errors[0].message, R"("a" is a required property)");
    EXPECT_EQ(toPointer(errors[0].schemaPath), "/properties/a/required");

    EXPECT_THAT(messages(v, json::parse("[]")),
                ElementsAre(R"([] is disallowed for "array")"));

    auto typed = validator(R"({"type": ["string", {"minimum": 5}]})", draft3());
    EXPECT_TRUE(typed.isValid(json("x")));
    EXPECT_TRUE(typed.isValid(json(6)));
    auto failed = typed.errors(json(1));
    ASSERT_EQ(failed.size(), 1U);
    EXPECT_EQ(failed[0].message, R"(1 is not of type "string", {"minimum":5})");
    EXPECT_EQ(failed[0].context().size(), 1U);
}

TEST_F(ValidatorTest, FormatOnlyAssertsWithChecker) {
    auto checker = std::make_shared<FormatChecker>();
    checker->registerFormat("even", [](const json& instance) {
        return !instance.is_number_integer() ||
               instance.get<long long>() % 2 == 0;
    });
    json schema = json::parse(R"({"format": "even"})");

    Validator advisory(schema, draft202012());
    EXPECT_TRUE(advisory.isValid(json(3)));

    Validator asserting(schema, draft202012(), {}, checker);
    EXPECT_TRUE(asserting.isValid(json(4)));
    EXPECT_THAT(messages(asserting, json(3)), ElementsAre(R"(3 is not a "even")"));

    auto unknown = asserting.evolve(json::parse(R"({"format": "whatever"})"));
    EXPECT_TRUE(unknown.isValid(json(3)));
}

TEST_F(ValidatorTest, ThrowingFormatBecomesCause) {
    auto checker = std::make_shared<FormatChecker>();
    checker->registerFormat("strict", [](const json& instance) -> bool {
        if (!instance.is_string()) {
            throw std::runtime_error("not a string");
        }
        return true;
    });
    Validator v(json::parse(R"({"format": "strict"})"), draft202012(), {},
                checker);
    auto errors = v.errors(json(1));
    ASSERT_EQ(errors.size(), 1U);
    ASSERT_NE(errors[0].cause, nullptr);
    EXPECT_THROW(std::rethrow_exception(errors[0].cause), std::runtime_error);
}

TEST_F(ValidatorTest, ValidateThrowsFirstError) {
    auto v = validator(R"({"minimum": 2, "type": "string"})");
    EXPECT_NO_THROW(v.validate(json("x")));
    try {
        v.validate(json(1));
        FAIL() << "expected ValidationException";
    } catch (const ValidationException& e) {
        EXPECT_EQ(e.error().message, "1 is less than the minimum of 2");
        EXPECT_EQ(e.error().keyword, "minimum");
    }
}

TEST_F(ValidatorTest, FirstErrorStopsEarly) {
    auto v = validator(R"({"items": {"type": "integer"}})");
    auto first = v.firstError(json::parse(R"(["a", "b", "c"])"));
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(toPointer(first->path), "/0");
    EXPECT_FALSE(v.firstError(json::parse("[1]")).has_value());
}

TEST_F(ValidatorTest, LazyStreamCanBeAbandoned) {
    auto v = validator(R"({"items": {"type": "integer"}})");
    const json instance = json::parse(R"(["a", "b", "c"])");
    std::size_t seen = 0;
    for (auto& error : v.iterErrors(instance)) {
        EXPECT_THAT(error.message, HasSubstr("is not of type"));
        if (++seen == 2) {
            break;
        }
    }
    EXPECT_EQ(seen, 2U);
}

TEST_F(ValidatorTest, EvolveKeepsBindings) {
    Validator v(json::parse(R"({"minimum": 1})"), draft7());
    auto next = v.evolve(json::parse(R"({"maximum": 1})"));
    EXPECT_EQ(next.dialect(), draft7());
    EXPECT_TRUE(next.isValid(json(0)));
    EXPECT_FALSE(next.isValid(json(2)));
}

TEST_F(ValidatorTest, DepthLimit) {
    ValidatorOptions options;
    options.maxDepth = 3;
    Validator v(json::parse(R"({"properties": {"a": {"$ref": "#"}}})"),
                draft202012(), {}, nullptr, options);
    EXPECT_TRUE(v.isValid(json::parse(R"({"a": {}})")));
    EXPECT_THROW((void)v.isValid(json::parse(R"({"a": {"a": {"a": {}}}})")),
                 RecursionError);
}

TEST_F(ValidatorTest, UnknownTypeThrows) {
    auto v = validator(R"({"type": "decimal"})");
    try {
        (void)v.errors(json(1));
        FAIL() << "expected UnknownType";
    } catch (const UnknownType& e) {
        EXPECT_EQ(e.type(), "decimal");
        EXPECT_EQ(e.instance(), json(1));
    }
}

TEST_F(ValidatorTest, ErrorsAreDeterministic) {
    auto v = validator(R"({
        "properties": {"b": {"type": "string"}, "a": {"minimum": 3}},
        "required": ["c"],
        "anyOf": [{"maxProperties": 1}, {"required": ["d"]}]
    })");
    const json instance = json::parse(R"({"a": 1, "b": 2})");
    auto first = messages(v, instance);
    auto second = messages(v, instance);
    EXPECT_EQ(first.size(), 4U);
    EXPECT_EQ(first, second);
}

TEST_F(ValidatorTest, BestMatchOfValidatorErrors) {
    auto v = validator(R"({
        "properties": {"name": {"type": "string"}},
        "anyOf": [{"required": ["x"]}, {"required": ["y"]}]
    })");
    auto errors = v.errors(json::parse(R"({"name": 1, "x": 1})"));
    auto best = bestMatch(errors);
    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(best->message, R"(1 is not of type "string")");
    ErrorTree tree(errors);
    EXPECT_TRUE(tree.contains(std::string("name")));
    EXPECT_TRUE(tree[std::string("name")].errors().contains("type"));
}
