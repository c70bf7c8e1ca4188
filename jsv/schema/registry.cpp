/*
 * registry.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-15

Description: Copy-on-write store of schema resources keyed by URI

**************************************************/

#include "registry.hpp"

#include <spdlog/spdlog.h>

#include "jsv/schema/dialect.hpp"
#include "jsv/schema/exceptions.hpp"
#include "jsv/schema/meta_schemas.hpp"
#include "jsv/schema/uri.hpp"

namespace jsv::schema {

Resource::Resource(std::shared_ptr<const json> document,
                   std::shared_ptr<const Dialect> dialect)
    : document_(std::move(document)),
      contents_(document_.get()),
      dialect_(std::move(dialect)) {}

Resource::Resource(std::shared_ptr<const json> document, const json* contents,
                   std::shared_ptr<const Dialect> dialect)
    : document_(std::move(document)),
      contents_(contents),
      dialect_(std::move(dialect)) {}

auto Resource::fromContents(json contents,
                            std::shared_ptr<const Dialect> defaultDialect)
    -> Resource {
    auto dialect = DialectCatalog::builtin().dialectFor(
        contents, std::move(defaultDialect));
    return Resource(std::make_shared<const json>(std::move(contents)),
                    std::move(dialect));
}

auto Resource::contents() const -> const json& { return *contents_; }

auto Resource::document() const -> const std::shared_ptr<const json>& {
    return document_;
}

auto Resource::dialect() const -> const std::shared_ptr<const Dialect>& {
    return dialect_;
}

auto Resource::at(const json& node) const -> Resource {
    return Resource(document_, &node, dialect_);
}

auto Resource::valid() const -> bool {
    return contents_ != nullptr && dialect_ != nullptr;
}

Registry::Registry() : state_(std::make_shared<const State>()) {}

Registry::Registry(Retriever retriever) {
    auto state = std::make_shared<State>();
    state->retriever = std::move(retriever);
    state_ = std::move(state);
}

Registry::Registry(std::shared_ptr<const State> state)
    : state_(std::move(state)) {}

void Registry::add(State& state, const std::string& uri,
                   const Resource& resource) {
    if (!resource.valid()) {
        THROW_INVALID_ARGUMENT("Cannot register an empty resource at '", uri,
                               "'");
    }
    std::string base = uri::normalize(uri);
    state.resources.insert_or_assign(base, resource);
    crawl(state, resource, std::move(base));
}

void Registry::crawl(State& state, const Resource& resource,
                     std::string base) {
    const json& node = resource.contents();
    if (!node.is_object()) {
        return;
    }
    const Dialect& dialect = *resource.dialect();

    if (std::string id = dialect.idOf(node); !id.empty()) {
        auto [target, fragment] = uri::defragment(uri::join(base, id));
        if (id.front() != '#') {
            base = target;
            state.resources.insert_or_assign(base, resource);
        }
        if (dialect.anchorInId && !fragment.empty() &&
            fragment.front() != '/') {
            state.anchors.insert_or_assign(base + "#" + fragment,
                                           Anchor{fragment, resource, false});
        }
    }
    if (dialect.anchorKeyword) {
        if (auto it = node.find("$anchor");
            it != node.end() && it->is_string()) {
            const auto& name = it->get_ref<const std::string&>();
            state.anchors.insert_or_assign(base + "#" + name,
                                           Anchor{name, resource, false});
        }
    }
    if (dialect.dynamicAnchorKeyword) {
        if (auto it = node.find("$dynamicAnchor");
            it != node.end() && it->is_string()) {
            const auto& name = it->get_ref<const std::string&>();
            state.anchors.insert_or_assign(base + "#" + name,
                                           Anchor{name, resource, true});
        }
    }

    auto visit = [&](const json& child) {
        if (!child.is_object()) {
            return;
        }
        auto childDialect = resource.dialect();
        if (auto it = child.find("$schema");
            it != child.end() && it->is_string()) {
            if (auto embedded = DialectCatalog::builtin().find(
                    it->get_ref<const std::string&>())) {
                childDialect = std::move(embedded);
            }
        }
        crawl(state, Resource(resource.document(), &child, childDialect),
              base);
    };

    for (auto it = node.begin(); it != node.end(); ++it) {
        const std::string& key = it.key();
        const json& value = it.value();
        if (dialect.subschemas.single.contains(key)) {
            if (value.is_array()) {
                for (const auto& item : value) {
                    visit(item);
                }
            } else {
                visit(value);
            }
        } else if (dialect.subschemas.arrays.contains(key)) {
            if (value.is_array()) {
                for (const auto& item : value) {
                    visit(item);
                }
            }
        } else if (dialect.subschemas.maps.contains(key)) {
            if (value.is_object()) {
                for (const auto& member : value) {
                    visit(member);
                }
            }
        }
    }
}

auto Registry::withResource(const std::string& uri,
                            const Resource& resource) const -> Registry {
    auto state = std::make_shared<State>(*state_);
    add(*state, uri, resource);
    return Registry(std::shared_ptr<const State>(std::move(state)));
}

auto Registry::withResources(
    const std::vector<std::pair<std::string, Resource>>& resources) const
    -> Registry {
    auto state = std::make_shared<State>(*state_);
    for (const auto& [uri, resource] : resources) {
        add(*state, uri, resource);
    }
    return Registry(std::shared_ptr<const State>(std::move(state)));
}

auto Registry::withContents(const std::string& uri, json contents,
                            std::shared_ptr<const Dialect> defaultDialect) const
    -> Registry {
    return withResource(uri, Resource::fromContents(std::move(contents),
                                                    std::move(defaultDialect)));
}

auto Registry::withRetriever(Retriever retriever) const -> Registry {
    auto state = std::make_shared<State>(*state_);
    state->retriever = std::move(retriever);
    return Registry(std::shared_ptr<const State>(std::move(state)));
}

auto Registry::combine(const Registry& other) const -> Registry {
    auto state = std::make_shared<State>(*state_);
    for (const auto& [uri, resource] : other.state_->resources) {
        state->resources.insert_or_assign(uri, resource);
    }
    for (const auto& [key, anchor] : other.state_->anchors) {
        state->anchors.insert_or_assign(key, anchor);
    }
    if (other.state_->retriever) {
        state->retriever = other.state_->retriever;
    }
    return Registry(std::shared_ptr<const State>(std::move(state)));
}

auto Registry::find(std::string_view uri) const -> const Resource* {
    auto it = state_->resources.find(uri::normalize(uri));
    return it == state_->resources.end() ? nullptr : &it->second;
}

auto Registry::anchor(std::string_view uri, std::string_view name) const
    -> const Anchor* {
    auto it = state_->anchors.find(uri::normalize(uri) + "#" +
                                   std::string(name));
    return it == state_->anchors.end() ? nullptr : &it->second;
}

auto Registry::contains(std::string_view uri) const -> bool {
    return find(uri) != nullptr;
}

auto Registry::size() const -> std::size_t {
    return state_->resources.size();
}

auto Registry::canRetrieve() const -> bool {
    return static_cast<bool>(state_->retriever);
}

auto Registry::retrieve(const std::string& uri) const -> Resource {
    if (!state_->retriever) {
        THROW_UNRESOLVABLE_REFERENCE(uri, "remote retrieval is disabled");
    }
    spdlog::debug("Retrieving schema resource {}", uri);
    Resource resource;
    try {
        resource = state_->retriever(uri);
    } catch (const UnresolvableReference& e) {
        spdlog::error("Failed to retrieve {}: {}", uri, e.getMessage());
        throw;
    } catch (const std::exception& e) {
        spdlog::error("Failed to retrieve {}: {}", uri, e.what());
        THROW_UNRESOLVABLE_REFERENCE(uri, e.what());
    }
    if (!resource.valid()) {
        THROW_UNRESOLVABLE_REFERENCE(uri, "retriever returned no resource");
    }
    return resource;
}

auto builtinRegistry() -> const Registry& {
    static const Registry kRegistry = [] {
        std::vector<std::pair<std::string, Resource>> resources;
        for (const auto& document : metaSchemaDocuments()) {
            auto dialect = DialectCatalog::builtin().dialectFor(*document);
            std::string id = dialect->idOf(*document);
            resources.emplace_back(id, Resource(document, dialect));
        }
        auto registry = Registry().withResources(resources);
        spdlog::debug("Built-in registry holds {} resources", registry.size());
        return registry;
    }();
    return kRegistry;
}

}  // namespace jsv::schema
