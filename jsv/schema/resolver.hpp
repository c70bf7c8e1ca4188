/*
 * resolver.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-16

Description: Per-evaluation reference resolution with a dynamic scope

**************************************************/

#ifndef JSV_SCHEMA_RESOLVER_HPP
#define JSV_SCHEMA_RESOLVER_HPP

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "jsv/schema/registry.hpp"

namespace jsv::schema {

/**
 * @brief Resolves references relative to a stack of base URIs.
 *
 * A resolver belongs to a single validation call. It owns a private copy
 * of the registry, which grows as remote resources are retrieved, and the
 * dynamic scope: the fragment-free URIs of the resources entered so far,
 * outermost first.
 */
class Resolver {
public:
    /// Target of a reference.
    struct Resolved {
        Resource resource;
        /// Base URI in effect at the target.
        std::string uri;

        [[nodiscard]] auto contents() const -> const json& {
            return resource.contents();
        }
    };

    /**
     * @brief Keeps a URI on the scope stack for its lifetime.
     */
    class ScopeGuard {
    public:
        ScopeGuard(Resolver& resolver, std::string uri);
        ~ScopeGuard();

        ScopeGuard(const ScopeGuard&) = delete;
        ScopeGuard& operator=(const ScopeGuard&) = delete;

    private:
        Resolver& resolver_;
    };

    Resolver(Registry registry, std::string baseUri);

    [[nodiscard]] auto resolutionScope() const -> const std::string&;

    [[nodiscard]] auto dynamicScope() const -> const std::vector<std::string>&;

    /// Enters the resource at @p uri, an absolute or already joined URI.
    void pushScope(std::string uri);
    void popScope();

    /**
     * @brief Resolves @p reference against the current resolution scope.
     * @throws UnresolvableReference for unknown resources, dangling
     *         pointers and unknown anchors.
     */
    [[nodiscard]] auto lookup(std::string_view reference) -> Resolved;

    /// "$dynamicRef" resolution.
    [[nodiscard]] auto lookupDynamic(std::string_view reference) -> Resolved;

    /// "$recursiveRef" resolution.
    [[nodiscard]] auto lookupRecursive(std::string_view reference) -> Resolved;

    [[nodiscard]] auto registry() const -> const Registry&;

private:
    auto resourceAt(const std::string& uri) -> Resource;
    auto resolveFragment(const Resource& resource, std::string uri,
                         const std::string& fragment,
                         std::string_view reference) -> Resolved;

    Registry registry_;
    std::vector<std::string> scopes_;
    std::unordered_map<std::string, Resolved> cache_;
};

}  // namespace jsv::schema

#endif  // JSV_SCHEMA_RESOLVER_HPP
