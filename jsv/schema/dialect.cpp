/*
 * dialect.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-15

Description: JSON Schema dialects: keyword tables, meta-schemas and
reference policy, plus the catalog used to pick one from "$schema"

**************************************************/

#include "dialect.hpp"

#include <utility>

#include <spdlog/spdlog.h>

#include "jsv/schema/exceptions.hpp"
#include "jsv/schema/keywords.hpp"
#include "jsv/schema/meta_schemas.hpp"
#include "jsv/schema/uri.hpp"

namespace jsv::schema {

auto Dialect::keyword(std::string_view name) const -> const KeywordFn* {
    auto it = keywords.find(name);
    return it == keywords.end() ? nullptr : &it->second;
}

auto Dialect::isDeferred(std::string_view name) const -> bool {
    return deferred.find(name) != deferred.end();
}

auto Dialect::idOf(const json& schema) const -> std::string {
    if (!schema.is_object()) {
        return {};
    }
    if (refOverridesSiblings && schema.contains("$ref")) {
        return {};
    }
    auto it = schema.find(idKeyword);
    if (it == schema.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

namespace {
namespace kw = keywords;

auto withMetaSchema(Dialect dialect, std::string name, std::string uri)
    -> std::shared_ptr<const Dialect> {
    dialect.name = std::move(name);
    dialect.metaSchema = metaSchema(uri);
    if (!dialect.metaSchema) {
        spdlog::warn("No bundled meta-schema for {}", uri);
    }
    dialect.metaSchemaUri = std::move(uri);
    return std::make_shared<const Dialect>(std::move(dialect));
}

auto makeDraft3() -> Dialect {
    Dialect dialect;
    dialect.keywords = {
        {"$ref", kw::ref},
        {"additionalItems", kw::additionalItems},
        {"additionalProperties", kw::additionalProperties},
        {"dependencies", kw::dependencies},
        {"disallow", kw::disallowDraft3},
        {"divisibleBy", kw::multipleOf},
        {"enum", kw::enumeration},
        {"extends", kw::extendsDraft3},
        {"format", kw::format},
        {"items", kw::itemsLegacy},
        {"maxItems", kw::maxItems},
        {"maxLength", kw::maxLength},
        {"maximum", kw::maximumDraft4},
        {"minItems", kw::minItems},
        {"minLength", kw::minLength},
        {"minimum", kw::minimumDraft4},
        {"pattern", kw::pattern},
        {"patternProperties", kw::patternProperties},
        {"properties", kw::propertiesDraft3},
        {"type", kw::typeDraft3},
        {"uniqueItems", kw::uniqueItems},
    };
    dialect.typeChecker = draft3TypeChecker();
    dialect.idKeyword = "id";
    dialect.refOverridesSiblings = true;
    dialect.anchorInId = true;
    dialect.subschemas.single = {"additionalItems", "additionalProperties",
                                 "extends", "items"};
    dialect.subschemas.arrays = {"disallow", "type"};
    dialect.subschemas.maps = {"dependencies", "patternProperties",
                               "properties"};
    return dialect;
}

auto makeDraft4() -> Dialect {
    Dialect dialect;
    dialect.keywords = {
        {"$ref", kw::ref},
        {"additionalItems", kw::additionalItems},
        {"additionalProperties", kw::additionalProperties},
        {"allOf", kw::allOf},
        {"anyOf", kw::anyOf},
        {"dependencies", kw::dependencies},
        {"enum", kw::enumeration},
        {"format", kw::format},
        {"items", kw::itemsLegacy},
        {"maxItems", kw::maxItems},
        {"maxLength", kw::maxLength},
        {"maxProperties", kw::maxProperties},
        {"maximum", kw::maximumDraft4},
        {"minItems", kw::minItems},
        {"minLength", kw::minLength},
        {"minProperties", kw::minProperties},
        {"minimum", kw::minimumDraft4},
        {"multipleOf", kw::multipleOf},
        {"not", kw::notKeyword},
        {"oneOf", kw::oneOf},
        {"pattern", kw::pattern},
        {"patternProperties", kw::patternProperties},
        {"properties", kw::properties},
        {"required", kw::required},
        {"type", kw::type},
        {"uniqueItems", kw::uniqueItems},
    };
    dialect.typeChecker = draft4TypeChecker();
    dialect.idKeyword = "id";
    dialect.refOverridesSiblings = true;
    dialect.anchorInId = true;
    dialect.subschemas.single = {"additionalItems", "additionalProperties",
                                 "items", "not"};
    dialect.subschemas.arrays = {"allOf", "anyOf", "oneOf"};
    dialect.subschemas.maps = {"definitions", "dependencies",
                               "patternProperties", "properties"};
    return dialect;
}

auto makeDraft6() -> Dialect {
    Dialect dialect = makeDraft4();
    dialect.keywords["maximum"] = kw::maximum;
    dialect.keywords["minimum"] = kw::minimum;
    dialect.keywords["exclusiveMaximum"] = kw::exclusiveMaximum;
    dialect.keywords["exclusiveMinimum"] = kw::exclusiveMinimum;
    dialect.keywords["const"] = kw::constant;
    dialect.keywords["contains"] = kw::containsDraft6;
    dialect.keywords["propertyNames"] = kw::propertyNames;
    dialect.typeChecker = draft6TypeChecker();
    dialect.idKeyword = "$id";
    dialect.subschemas.single.insert({"contains", "propertyNames"});
    return dialect;
}

auto makeDraft7() -> Dialect {
    Dialect dialect = makeDraft6();
    dialect.keywords["if"] = kw::ifThenElse;
    dialect.subschemas.single.insert({"if", "then", "else"});
    return dialect;
}

auto makeDraft201909() -> Dialect {
    Dialect dialect = makeDraft7();
    dialect.keywords.erase("dependencies");
    dialect.keywords["$recursiveRef"] = kw::recursiveRef;
    dialect.keywords["contains"] = kw::containsDraft201909;
    dialect.keywords["dependentRequired"] = kw::dependentRequired;
    dialect.keywords["dependentSchemas"] = kw::dependentSchemas;
    dialect.keywords["unevaluatedItems"] = kw::unevaluatedItems;
    dialect.keywords["unevaluatedProperties"] = kw::unevaluatedProperties;
    dialect.deferred = {"unevaluatedItems", "unevaluatedProperties"};
    dialect.refOverridesSiblings = false;
    dialect.anchorInId = false;
    dialect.anchorKeyword = true;
    dialect.recursiveAnchorKeyword = true;
    dialect.subschemas.single.insert(
        {"contentSchema", "unevaluatedItems", "unevaluatedProperties"});
    dialect.subschemas.maps.erase("dependencies");
    dialect.subschemas.maps.insert({"$defs", "dependentSchemas"});
    return dialect;
}

auto makeDraft202012() -> Dialect {
    Dialect dialect = makeDraft201909();
    dialect.keywords.erase("additionalItems");
    dialect.keywords.erase("$recursiveRef");
    dialect.keywords["$dynamicRef"] = kw::dynamicRef;
    dialect.keywords["contains"] = kw::contains;
    dialect.keywords["items"] = kw::items;
    dialect.keywords["prefixItems"] = kw::prefixItems;
    dialect.recursiveAnchorKeyword = false;
    dialect.dynamicAnchorKeyword = true;
    dialect.subschemas.single.erase("additionalItems");
    dialect.subschemas.arrays.insert("prefixItems");
    return dialect;
}
}  // namespace

auto draft3() -> std::shared_ptr<const Dialect> {
    static const auto kDialect = withMetaSchema(
        makeDraft3(), "draft3", "http://json-schema.org/draft-03/schema#");
    return kDialect;
}

auto draft4() -> std::shared_ptr<const Dialect> {
    static const auto kDialect = withMetaSchema(
        makeDraft4(), "draft4", "http://json-schema.org/draft-04/schema#");
    return kDialect;
}

auto draft6() -> std::shared_ptr<const Dialect> {
    static const auto kDialect = withMetaSchema(
        makeDraft6(), "draft6", "http://json-schema.org/draft-06/schema#");
    return kDialect;
}

auto draft7() -> std::shared_ptr<const Dialect> {
    static const auto kDialect = withMetaSchema(
        makeDraft7(), "draft7", "http://json-schema.org/draft-07/schema#");
    return kDialect;
}

auto draft201909() -> std::shared_ptr<const Dialect> {
    static const auto kDialect =
        withMetaSchema(makeDraft201909(), "draft2019-09",
                       "https://json-schema.org/draft/2019-09/schema");
    return kDialect;
}

auto draft202012() -> std::shared_ptr<const Dialect> {
    static const auto kDialect =
        withMetaSchema(makeDraft202012(), "draft2020-12",
                       "https://json-schema.org/draft/2020-12/schema");
    return kDialect;
}

DialectBuilder::DialectBuilder(const Dialect& base) : dialect_(base) {}

auto DialectBuilder::name(std::string name) -> DialectBuilder& {
    dialect_.name = std::move(name);
    return *this;
}

auto DialectBuilder::metaSchema(std::string uri,
                                std::shared_ptr<const json> document)
    -> DialectBuilder& {
    dialect_.metaSchemaUri = std::move(uri);
    dialect_.metaSchema = std::move(document);
    return *this;
}

auto DialectBuilder::keyword(std::string name, KeywordFn function)
    -> DialectBuilder& {
    if (!function) {
        THROW_INVALID_ARGUMENT("Keyword '", name, "' needs a function");
    }
    dialect_.keywords[std::move(name)] = std::move(function);
    return *this;
}

auto DialectBuilder::removeKeyword(std::string_view name) -> DialectBuilder& {
    if (auto it = dialect_.keywords.find(name); it != dialect_.keywords.end()) {
        dialect_.keywords.erase(it);
    }
    if (auto it = dialect_.deferred.find(name); it != dialect_.deferred.end()) {
        dialect_.deferred.erase(it);
    }
    return *this;
}

auto DialectBuilder::defer(std::string name) -> DialectBuilder& {
    dialect_.deferred.insert(std::move(name));
    return *this;
}

auto DialectBuilder::typeChecker(TypeChecker checker) -> DialectBuilder& {
    dialect_.typeChecker = std::move(checker);
    return *this;
}

auto DialectBuilder::build() const -> std::shared_ptr<const Dialect> {
    return std::make_shared<const Dialect>(dialect_);
}

auto DialectCatalog::builtin() -> const DialectCatalog& {
    static const DialectCatalog kCatalog = DialectCatalog()
                                               .withDialect(draft3())
                                               .withDialect(draft4())
                                               .withDialect(draft6())
                                               .withDialect(draft7())
                                               .withDialect(draft201909())
                                               .withDialect(draft202012());
    return kCatalog;
}

auto DialectCatalog::withDialect(std::shared_ptr<const Dialect> dialect) const
    -> DialectCatalog {
    if (!dialect) {
        THROW_INVALID_ARGUMENT("Cannot register a null dialect");
    }
    DialectCatalog result(*this);
    result.dialects_[uri::normalize(dialect->metaSchemaUri)] =
        std::move(dialect);
    return result;
}

auto DialectCatalog::find(std::string_view uri) const
    -> std::shared_ptr<const Dialect> {
    auto it = dialects_.find(uri::normalize(uri));
    return it == dialects_.end() ? nullptr : it->second;
}

auto DialectCatalog::dialectFor(const json& schema,
                                std::shared_ptr<const Dialect> fallback) const
    -> std::shared_ptr<const Dialect> {
    if (schema.is_object()) {
        if (auto it = schema.find("$schema");
            it != schema.end() && it->is_string()) {
            const auto& uri = it->get_ref<const std::string&>();
            if (auto dialect = find(uri)) {
                return dialect;
            }
            if (fallback) {
                spdlog::warn("Unknown $schema {}, using {}", uri,
                             fallback->name);
                return fallback;
            }
            THROW_UNKNOWN_DIALECT("Unknown $schema '", uri, "'");
        }
    }
    return fallback ? fallback : draft202012();
}

auto DialectCatalog::dialects() const
    -> std::vector<std::shared_ptr<const Dialect>> {
    std::vector<std::shared_ptr<const Dialect>> result;
    result.reserve(dialects_.size());
    for (const auto& [uri, dialect] : dialects_) {
        result.push_back(dialect);
    }
    return result;
}

}  // namespace jsv::schema
