#include <gtest/gtest.h>

#include "jsv/schema/utils.hpp"

using namespace jsv::schema;
using json = nlohmann::json;

class UtilsTest : public ::testing::Test {};

TEST_F(UtilsTest, EqualKeepsBooleansApartFromNumbers) {
    EXPECT_FALSE(utils::equal(json(false), json(0)));
    EXPECT_FALSE(utils::equal(json(1), json(true)));
    EXPECT_TRUE(utils::equal(json(true), json(true)));
}

TEST_F(UtilsTest, EqualComparesNumbersByValue) {
    EXPECT_TRUE(utils::equal(json(1), json(1.0)));
    EXPECT_TRUE(utils::equal(json(1U), json(1)));
    EXPECT_FALSE(utils::equal(json(1), json(1.5)));
}

TEST_F(UtilsTest, EqualIsDeep) {
    EXPECT_TRUE(utils::equal(json::parse(R"({"a": [1, {"b": 2.0}]})"),
                             json::parse(R"({"a": [1.0, {"b": 2}]})")));
    EXPECT_FALSE(utils::equal(json::parse("[1, 2]"), json::parse("[2, 1]")));
    EXPECT_FALSE(utils::equal(json::parse(R"({"a": 1})"),
                              json::parse(R"({"a": 1, "b": 2})")));
    EXPECT_FALSE(utils::equal(json::parse("[false]"), json::parse("[0]")));
}

TEST_F(UtilsTest, Uniq) {
    EXPECT_TRUE(utils::uniq(json::parse("[1, 2, 3]")));
    EXPECT_FALSE(utils::uniq(json::parse("[1, 2, 1.0]")));
    EXPECT_TRUE(utils::uniq(json::parse("[1, true, \"1\", null]")));
    EXPECT_TRUE(utils::uniq(json::parse("[0, false]")));
    EXPECT_FALSE(utils::uniq(json::parse(R"([{"a": 1}, {"a": 1.0}])")));
    EXPECT_TRUE(utils::uniq(json::parse(R"([[1], [true]])")));
    EXPECT_TRUE(utils::uniq(json::array()));
}

TEST_F(UtilsTest, CompareNumbersIsExact) {
    EXPECT_EQ(utils::compareNumbers(json(9007199254740993LL),
                                    json(9007199254740992LL)),
              1);
    EXPECT_EQ(utils::compareNumbers(json(-1), json(18446744073709551615ULL)),
              -1);
    EXPECT_EQ(utils::compareNumbers(json(2.5), json(2)), 1);
    EXPECT_EQ(utils::compareNumbers(json(3U), json(3.0)), 0);
}

TEST_F(UtilsTest, IsIntegral) {
    EXPECT_TRUE(utils::isIntegral(json(3)));
    EXPECT_TRUE(utils::isIntegral(json(3.0)));
    EXPECT_FALSE(utils::isIntegral(json(3.25)));
    EXPECT_FALSE(utils::isIntegral(json("3")));
}

TEST_F(UtilsTest, MultipleOfIntegers) {
    EXPECT_TRUE(utils::isMultipleOf(json(10), json(5)));
    EXPECT_FALSE(utils::isMultipleOf(json(7), json(2)));
    EXPECT_TRUE(utils::isMultipleOf(json(-9), json(3)));
    EXPECT_FALSE(utils::isMultipleOf(json(1), json(0)));
}

TEST_F(UtilsTest, MultipleOfDecimals) {
    EXPECT_TRUE(utils::isMultipleOf(json(19.99), json(0.01)));
    EXPECT_TRUE(utils::isMultipleOf(json(0.3), json(0.1)));
    EXPECT_FALSE(utils::isMultipleOf(json(0.075), json(0.02)));
    EXPECT_TRUE(utils::isMultipleOf(json(4.5), json(1.5)));
    EXPECT_FALSE(utils::isMultipleOf(json(35), json(1.5)));
    EXPECT_TRUE(utils::isMultipleOf(json(1e308), json(1e-8)));
}

TEST_F(UtilsTest, Utf8LengthCountsCodePoints) {
    EXPECT_EQ(utils::utf8Length("abc"), 3U);
    EXPECT_EQ(utils::utf8Length("\xF0\x9F\x92\xA9\xF0\x9F\x92\xA9"), 2U);
    EXPECT_EQ(utils::utf8Length("h\xC3\xA9"), 2U);
}

TEST_F(UtilsTest, ReprIsCompactJson) {
    EXPECT_EQ(utils::repr(json("a")), "\"a\"");
    EXPECT_EQ(utils::repr(json::parse("[1, 2, 3]")), "[1,2,3]");
    EXPECT_EQ(utils::repr(json::parse(R"({"a": null})")), R"({"a":null})");
}

TEST_F(UtilsTest, ExtrasMessage) {
    EXPECT_EQ(utils::extrasMessage({json("a")}), "\"a\" was");
    EXPECT_EQ(utils::extrasMessage({json("a"), json(2)}), "\"a\", 2 were");
}
