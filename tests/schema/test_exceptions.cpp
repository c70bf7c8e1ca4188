#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

#include "jsv/error/exception.hpp"
#include "jsv/schema/exceptions.hpp"

using namespace jsv::schema;
using ::testing::EndsWith;
using ::testing::HasSubstr;
using ::testing::StartsWith;

namespace {
void throwInvalidArgument() { THROW_INVALID_ARGUMENT("bad value ", 42); }
}  // namespace

TEST(ExceptionTest, RecordsThrowSite) {
    try {
        throwInvalidArgument();
        FAIL() << "InvalidArgument expected";
    } catch (const jsv::error::InvalidArgument& e) {
        EXPECT_EQ(e.getMessage(), "bad value 42");
        EXPECT_EQ(e.getFunction(), "throwInvalidArgument");
        EXPECT_THAT(e.getFile(), EndsWith("test_exceptions.cpp"));
        EXPECT_GT(e.getLine(), 0);
        EXPECT_EQ(e.getThreadId(), std::this_thread::get_id());
    }
}

TEST(ExceptionTest, WhatIsOneLine) {
    try {
        throwInvalidArgument();
        FAIL() << "InvalidArgument expected";
    } catch (const std::exception& e) {
        std::string what = e.what();
        EXPECT_THAT(what, StartsWith("bad value 42 [throwInvalidArgument() at "));
        EXPECT_THAT(what, HasSubstr("test_exceptions.cpp:"));
        EXPECT_THAT(what, EndsWith("]"));
        EXPECT_EQ(what.find('\n'), std::string::npos);
    }
}

TEST(ExceptionTest, UnresolvableReferenceMessage) {
    try {
        THROW_UNRESOLVABLE_REFERENCE("urn:missing", "no such resource");
    } catch (const UnresolvableReference& e) {
        EXPECT_EQ(e.reference(), "urn:missing");
        EXPECT_EQ(e.getMessage(),
                  "Unresolvable reference 'urn:missing': no such resource");
    }
}

TEST(ExceptionTest, SchemaErrorKeepsBestMatch) {
    ValidationError shallow("shallow");
    ValidationError deep("deep");
    deep.path.emplace_back(std::string("a"));
    try {
        THROW_SCHEMA_ERROR((std::vector<ValidationError>{shallow, deep}));
    } catch (const SchemaError& e) {
        EXPECT_EQ(e.getMessage(), "deep");
        EXPECT_EQ(e.error().message, "deep");
        EXPECT_EQ(e.errors().size(), 2U);
    }
}
