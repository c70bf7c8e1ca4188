/*
 * resolver.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-16

Description: Per-evaluation reference resolution with a dynamic scope

**************************************************/

#include "resolver.hpp"

#include <spdlog/spdlog.h>

#include "jsv/schema/dialect.hpp"
#include "jsv/schema/exceptions.hpp"
#include "jsv/schema/uri.hpp"

namespace jsv::schema {

Resolver::ScopeGuard::ScopeGuard(Resolver& resolver, std::string uri)
    : resolver_(resolver) {
    resolver_.pushScope(std::move(uri));
}

Resolver::ScopeGuard::~ScopeGuard() { resolver_.popScope(); }

Resolver::Resolver(Registry registry, std::string baseUri)
    : registry_(std::move(registry)) {
    scopes_.push_back(uri::defragment(baseUri).first);
}

auto Resolver::resolutionScope() const -> const std::string& {
    return scopes_.back();
}

auto Resolver::dynamicScope() const -> const std::vector<std::string>& {
    return scopes_;
}

void Resolver::pushScope(std::string uri) {
    scopes_.push_back(uri::defragment(uri).first);
}

void Resolver::popScope() {
    if (scopes_.size() > 1) {
        scopes_.pop_back();
    }
}

auto Resolver::registry() const -> const Registry& { return registry_; }

auto Resolver::resourceAt(const std::string& uri) -> Resource {
    if (const auto* resource = registry_.find(uri)) {
        return *resource;
    }
    Resource retrieved = registry_.retrieve(uri);
    registry_ = registry_.withResource(uri, retrieved);
    return retrieved;
}

auto Resolver::resolveFragment(const Resource& resource, std::string uri,
                               const std::string& fragment,
                               std::string_view reference) -> Resolved {
    if (fragment.empty()) {
        return {resource, std::move(uri)};
    }
    if (fragment.front() == '/') {
        std::vector<std::string> tokens;
        try {
            tokens = uri::splitPointer(fragment);
        } catch (const error::InvalidArgument& e) {
            THROW_UNRESOLVABLE_REFERENCE(std::string(reference),
                                         e.getMessage());
        }
        Resource current = resource;
        const json* node = &resource.contents();
        for (const auto& token : tokens) {
            node = uri::step(*node, token);
            if (node == nullptr) {
                THROW_UNRESOLVABLE_REFERENCE(
                    std::string(reference),
                    "pointer '" + fragment + "' does not exist");
            }
            current = current.at(*node);
            // Embedded resources on the way change the base URI.
            if (std::string id = current.dialect()->idOf(*node);
                !id.empty() && id.front() != '#') {
                uri = uri::defragment(uri::join(uri, id)).first;
            }
        }
        return {current, std::move(uri)};
    }
    const Anchor* anchor = registry_.anchor(uri, fragment);
    if (anchor == nullptr) {
        THROW_UNRESOLVABLE_REFERENCE(std::string(reference),
                                     "no anchor '" + fragment + "' in '" +
                                         uri + "'");
    }
    return {anchor->resource, std::move(uri)};
}

auto Resolver::lookup(std::string_view reference) -> Resolved {
    std::string key = resolutionScope() + '\n' + std::string(reference);
    if (auto it = cache_.find(key); it != cache_.end()) {
        return it->second;
    }
    std::string target = uri::join(resolutionScope(), reference);
    auto [base, fragment] = uri::defragment(target);
    Resource resource = resourceAt(base);
    Resolved resolved =
        resolveFragment(resource, base, uri::percentDecode(fragment), reference);
    spdlog::trace("Resolved '{}' to {}", reference, target);
    cache_.emplace(std::move(key), resolved);
    return resolved;
}

auto Resolver::lookupDynamic(std::string_view reference) -> Resolved {
    Resolved resolved = lookup(reference);
    std::string fragment =
        uri::percentDecode(uri::defragment(reference).second);
    if (fragment.empty() || fragment.front() == '/') {
        return resolved;
    }
    const json& target = resolved.contents();
    auto anchor = target.is_object() ? target.find("$dynamicAnchor")
                                     : target.end();
    if (!target.is_object() || anchor == target.end() ||
        !anchor->is_string() ||
        anchor->get_ref<const std::string&>() != fragment) {
        return resolved;
    }
    for (const auto& scope : scopes_) {
        if (const auto* candidate = registry_.anchor(scope, fragment);
            candidate != nullptr && candidate->dynamic) {
            spdlog::trace("Dynamic reference '{}' rebound to {}#{}",
                          reference, scope, fragment);
            return {candidate->resource, scope};
        }
    }
    return resolved;
}

auto Resolver::lookupRecursive(std::string_view reference) -> Resolved {
    auto hasRecursiveAnchor = [](const json& schema) {
        if (!schema.is_object()) {
            return false;
        }
        auto it = schema.find("$recursiveAnchor");
        return it != schema.end() && it->is_boolean() && it->get<bool>();
    };

    Resolved resolved = lookup(reference);
    if (!hasRecursiveAnchor(resolved.contents())) {
        return resolved;
    }
    for (auto it = scopes_.rbegin(); it != scopes_.rend(); ++it) {
        const Resource* resource = registry_.find(*it);
        if (resource == nullptr ||
            !hasRecursiveAnchor(resource->contents())) {
            break;
        }
        resolved = {*resource, *it};
    }
    return resolved;
}

}  // namespace jsv::schema
