/*
 * registry.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-15

Description: Copy-on-write store of schema resources keyed by URI

**************************************************/

#ifndef JSV_SCHEMA_REGISTRY_HPP
#define JSV_SCHEMA_REGISTRY_HPP

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace jsv::schema {

using json = nlohmann::json;

struct Dialect;

/**
 * @brief A schema node within a shared document, bound to a dialect.
 */
class Resource {
public:
    Resource() = default;
    Resource(std::shared_ptr<const json> document,
             std::shared_ptr<const Dialect> dialect);
    Resource(std::shared_ptr<const json> document, const json* contents,
             std::shared_ptr<const Dialect> dialect);

    /**
     * @brief Wraps a document, taking its dialect from "$schema".
     * @throws UnknownDialect if "$schema" is unknown and @p defaultDialect
     *         is null.
     */
    [[nodiscard]] static auto fromContents(
        json contents, std::shared_ptr<const Dialect> defaultDialect = nullptr)
        -> Resource;

    [[nodiscard]] auto contents() const -> const json&;
    [[nodiscard]] auto document() const -> const std::shared_ptr<const json>&;
    [[nodiscard]] auto dialect() const -> const std::shared_ptr<const Dialect>&;

    /// Another node of the same document.
    [[nodiscard]] auto at(const json& node) const -> Resource;

    [[nodiscard]] auto valid() const -> bool;

private:
    std::shared_ptr<const json> document_;
    const json* contents_{nullptr};
    std::shared_ptr<const Dialect> dialect_;
};

struct Anchor {
    std::string name;
    Resource resource;
    bool dynamic{false};
};

/**
 * @brief Immutable URI to resource mapping.
 *
 * Every with*() call returns a new registry sharing nothing mutable with
 * the receiver, so registries can be extended independently from one
 * common base. Adding a resource also registers the resources embedded in
 * it through "$id" and the anchors it declares. Later additions replace
 * earlier ones under the same URI.
 *
 * Resources missing from the registry are fetched through the retriever,
 * when one is configured. Without a retriever nothing is ever fetched.
 */
class Registry {
public:
    using Retriever = std::function<Resource(const std::string& uri)>;

    Registry();
    explicit Registry(Retriever retriever);

    [[nodiscard]] auto withResource(const std::string& uri,
                                    const Resource& resource) const
        -> Registry;

    [[nodiscard]] auto withResources(
        const std::vector<std::pair<std::string, Resource>>& resources) const
        -> Registry;

    [[nodiscard]] auto withContents(
        const std::string& uri, json contents,
        std::shared_ptr<const Dialect> defaultDialect = nullptr) const
        -> Registry;

    [[nodiscard]] auto withRetriever(Retriever retriever) const -> Registry;

    /// Union of both registries; entries of @p other win.
    [[nodiscard]] auto combine(const Registry& other) const -> Registry;

    [[nodiscard]] auto find(std::string_view uri) const -> const Resource*;

    [[nodiscard]] auto anchor(std::string_view uri,
                              std::string_view name) const -> const Anchor*;

    [[nodiscard]] auto contains(std::string_view uri) const -> bool;

    [[nodiscard]] auto size() const -> std::size_t;

    [[nodiscard]] auto canRetrieve() const -> bool;

    /**
     * @brief Fetches @p uri through the retriever.
     * @throws UnresolvableReference when there is no retriever or it fails.
     */
    [[nodiscard]] auto retrieve(const std::string& uri) const -> Resource;

private:
    struct State {
        std::map<std::string, Resource, std::less<>> resources;
        std::map<std::string, Anchor, std::less<>> anchors;
        Retriever retriever;
    };

    explicit Registry(std::shared_ptr<const State> state);

    static void add(State& state, const std::string& uri,
                    const Resource& resource);
    static void crawl(State& state, const Resource& resource,
                      std::string base);

    std::shared_ptr<const State> state_;
};

/// Every built-in meta-schema and vocabulary meta-schema.
[[nodiscard]] auto builtinRegistry() -> const Registry&;

}  // namespace jsv::schema

#endif  // JSV_SCHEMA_REGISTRY_HPP
