#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "jsv/schema/dialect.hpp"
#include "jsv/schema/exceptions.hpp"
#include "jsv/schema/registry.hpp"

using namespace jsv::schema;

class RegistryTest : public ::testing::Test {
protected:
    const json document_ = json::parse(R"({
        "$id": "http://example.com/root.json",
        "$defs": {
            "child": {"$id": "child.json", "type": "integer"},
            "named": {"$anchor": "thing", "type": "string"},
            "dynamic": {"$dynamicAnchor": "node"}
        }
    })");
};

TEST_F(RegistryTest, EmptyRegistry) {
    Registry registry;
    EXPECT_EQ(registry.size(), 0U);
    EXPECT_EQ(registry.find("http://example.com/x"), nullptr);
    EXPECT_FALSE(registry.canRetrieve());
}

TEST_F(RegistryTest, WithContentsRegistersEmbeddedResources) {
    auto registry = Registry().withContents("http://example.com/root.json",
                                            document_);
    ASSERT_TRUE(registry.contains("http://example.com/root.json"));
    const Resource* child = registry.find("http://example.com/child.json");
    ASSERT_NE(child, nullptr);
    EXPECT_EQ(child->contents()["type"], "integer");
    EXPECT_EQ(child->dialect()->name, "draft2020-12");
}

TEST_F(RegistryTest, EmptyFragmentIsIgnored) {
    auto registry = Registry().withContents("http://example.com/a#",
                                            json::object());
    EXPECT_TRUE(registry.contains("http://example.com/a"));
    EXPECT_TRUE(registry.contains("http://example.com/a#"));
}

TEST_F(RegistryTest, AnchorsAreScopedToTheirResource) {
    auto registry = Registry().withContents("http://example.com/root.json",
                                            document_);
    const Anchor* anchor =
        registry.anchor("http://example.com/root.json", "thing");
    ASSERT_NE(anchor, nullptr);
    EXPECT_FALSE(anchor->dynamic);
    EXPECT_EQ(anchor->resource.contents()["type"], "string");

    const Anchor* dynamic =
        registry.anchor("http://example.com/root.json", "node");
    ASSERT_NE(dynamic, nullptr);
    EXPECT_TRUE(dynamic->dynamic);

    EXPECT_EQ(registry.anchor("http://example.com/child.json", "thing"),
              nullptr);
}

TEST_F(RegistryTest, LegacyAnchorsLiveInId) {
    json schema = json::parse(R"({
        "$schema": "http://json-schema.org/draft-07/schema#",
        "definitions": {"a": {"$id": "#frag", "minimum": 1}}
    })");
    auto registry = Registry().withContents("http://example.com/d7", schema);
    const Anchor* anchor = registry.anchor("http://example.com/d7", "frag");
    ASSERT_NE(anchor, nullptr);
    EXPECT_EQ(anchor->resource.contents()["minimum"], 1);
    EXPECT_EQ(anchor->resource.dialect()->name, "draft7");
}

TEST_F(RegistryTest, LaterAdditionsWin) {
    auto first = Registry().withContents("urn:x", json{{"minimum", 1}});
    auto second = first.withContents("urn:x", json{{"minimum", 2}});
    EXPECT_EQ(first.find("urn:x")->contents()["minimum"], 1);
    EXPECT_EQ(second.find("urn:x")->contents()["minimum"], 2);
}

TEST_F(RegistryTest, CombinePrefersOther) {
    auto left = Registry()
                    .withContents("urn:a", json{{"title", "left"}})
                    .withContents("urn:only-left", json::object());
    auto right = Registry().withContents("urn:a", json{{"title", "right"}});
    auto combined = left.combine(right);
    EXPECT_EQ(combined.size(), 2U);
    EXPECT_EQ(combined.find("urn:a")->contents()["title"], "right");
    EXPECT_TRUE(combined.contains("urn:only-left"));
}

TEST_F(RegistryTest, RetrieveWithoutRetrieverThrows) {
    Registry registry;
    EXPECT_THROW((void)registry.retrieve("http://example.com/remote"),
                 UnresolvableReference);
}

TEST_F(RegistryTest, RetrieveUsesRetriever) {
    int calls = 0;
    Registry registry([&calls](const std::string& uri) {
        ++calls;
        return Resource::fromContents(json{{"$comment", uri}});
    });
    EXPECT_TRUE(registry.canRetrieve());
    Resource resource = registry.retrieve("http://example.com/remote");
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(resource.contents()["$comment"], "http://example.com/remote");
}

TEST_F(RegistryTest, RetrieverFailureIsWrapped) {
    auto registry = Registry().withRetriever(
        [](const std::string&) -> Resource {
            throw std::runtime_error("connection refused");
        });
    try {
        (void)registry.retrieve("http://example.com/remote");
        FAIL() << "expected UnresolvableReference";
    } catch (const UnresolvableReference& e) {
        EXPECT_EQ(e.reference(), "http://example.com/remote");
    }
}

TEST_F(RegistryTest, EmptyResourceIsRejected) {
    EXPECT_THROW((void)Registry().withResource("urn:x", Resource()),
                 jsv::error::InvalidArgument);
}

TEST_F(RegistryTest, BuiltinRegistryHoldsMetaSchemas) {
    const Registry& registry = builtinRegistry();
    EXPECT_TRUE(registry.contains("http://json-schema.org/draft-03/schema#"));
    EXPECT_TRUE(registry.contains("http://json-schema.org/draft-04/schema#"));
    EXPECT_TRUE(registry.contains("http://json-schema.org/draft-06/schema#"));
    EXPECT_TRUE(registry.contains("http://json-schema.org/draft-07/schema#"));
    EXPECT_TRUE(
        registry.contains("https://json-schema.org/draft/2019-09/schema"));
    EXPECT_TRUE(
        registry.contains("https://json-schema.org/draft/2020-12/schema"));
    EXPECT_TRUE(registry.contains(
        "https://json-schema.org/draft/2020-12/meta/applicator"));
}
