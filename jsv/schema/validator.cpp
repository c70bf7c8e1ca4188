/*
 * validator.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-17

Description: Compiled validators and the recursive evaluation engine

**************************************************/

#include "validator.hpp"

#include <spdlog/spdlog.h>

#include "jsv/schema/exceptions.hpp"
#include "jsv/schema/uri.hpp"
#include "jsv/schema/utils.hpp"

namespace jsv::schema {

namespace {
class DepthGuard {
public:
    DepthGuard(std::size_t& depth, std::size_t limit) : depth_(depth) {
        if (depth_ >= limit) {
            spdlog::error("Schema evaluation exceeded {} nested levels",
                          limit);
            THROW_RECURSION_ERROR("Maximum evaluation depth of ", limit,
                                  " exceeded");
        }
        ++depth_;
    }
    ~DepthGuard() { --depth_; }

    DepthGuard(const DepthGuard&) = delete;
    DepthGuard& operator=(const DepthGuard&) = delete;

private:
    std::size_t& depth_;
};

template <typename T>
class StackGuard {
public:
    StackGuard(std::vector<T>& stack, T value) : stack_(stack) {
        stack_.push_back(std::move(value));
    }
    ~StackGuard() { stack_.pop_back(); }

    StackGuard(const StackGuard&) = delete;
    StackGuard& operator=(const StackGuard&) = delete;

private:
    std::vector<T>& stack_;
};

class ActiveReferenceGuard {
public:
    using Key = std::pair<const json*, const json*>;

    ActiveReferenceGuard(std::set<Key>& active, Key key)
        : active_(active), key_(key) {
        active_.insert(key_);
    }
    ~ActiveReferenceGuard() { active_.erase(key_); }

    ActiveReferenceGuard(const ActiveReferenceGuard&) = delete;
    ActiveReferenceGuard& operator=(const ActiveReferenceGuard&) = delete;

private:
    std::set<Key>& active_;
    Key key_;
};
}  // namespace

Validator::Validator(json schema, std::shared_ptr<const Dialect> dialect,
                     Registry registry,
                     std::shared_ptr<const FormatChecker> formatChecker,
                     ValidatorOptions options)
    : Validator(std::make_shared<const json>(std::move(schema)),
                std::move(dialect), std::move(registry),
                std::move(formatChecker), std::move(options)) {}

Validator::Validator(std::shared_ptr<const json> schema,
                     std::shared_ptr<const Dialect> dialect, Registry registry,
                     std::shared_ptr<const FormatChecker> formatChecker,
                     ValidatorOptions options)
    : schema_(std::move(schema)),
      dialect_(std::move(dialect)),
      formatChecker_(std::move(formatChecker)),
      options_(std::move(options)) {
    if (!schema_ || !dialect_) {
        THROW_INVALID_ARGUMENT("A validator needs a schema and a dialect");
    }
    baseUri_ = uri::defragment(
                   uri::join(options_.baseUri, dialect_->idOf(*schema_)))
                   .first;

    Registry combined = builtinRegistry().combine(registry);
    if (dialect_->metaSchema && !combined.contains(dialect_->metaSchemaUri)) {
        combined = combined.withResource(
            dialect_->metaSchemaUri, Resource(dialect_->metaSchema, dialect_));
    }
    registry_ =
        combined.withResource(options_.baseUri, Resource(schema_, dialect_));
}

auto Validator::iterErrors(const json& instance) const -> ErrorStream {
    Evaluator evaluator(*this);
    for (auto& error : evaluator.evaluate(instance)) {
        co_yield std::move(error);
    }
}

auto Validator::errors(const json& instance) const
    -> std::vector<ValidationError> {
    std::vector<ValidationError> result;
    for (auto& error : iterErrors(instance)) {
        result.push_back(std::move(error));
    }
    return result;
}

auto Validator::firstError(const json& instance) const
    -> std::optional<ValidationError> {
    auto stream = iterErrors(instance);
    auto it = stream.begin();
    if (it == stream.end()) {
        return std::nullopt;
    }
    return std::move(*it);
}

auto Validator::isValid(const json& instance) const -> bool {
    return !firstError(instance).has_value();
}

void Validator::validate(const json& instance) const {
    if (auto error = firstError(instance)) {
        THROW_VALIDATION_EXCEPTION(std::move(*error));
    }
}

auto Validator::evolve(json schema) const -> Validator {
    return Validator(std::move(schema), dialect_, registry_, formatChecker_,
                     options_);
}

auto Validator::schema() const -> const json& { return *schema_; }

auto Validator::dialect() const -> const std::shared_ptr<const Dialect>& {
    return dialect_;
}

auto Validator::registry() const -> const Registry& { return registry_; }

auto Validator::formatChecker() const -> const FormatChecker* {
    return formatChecker_.get();
}

auto Validator::options() const -> const ValidatorOptions& {
    return options_;
}

auto Validator::baseUri() const -> const std::string& { return baseUri_; }

Evaluator::Evaluator(const Validator& validator)
    : validator_(validator),
      resolver_(validator.registry(), validator.baseUri()),
      dialects_{validator.dialect()},
      scopedNode_(&validator.schema()) {}

auto Evaluator::evaluate(const json& instance) -> ErrorStream {
    return iterErrors(instance, validator_.schema(), nullptr);
}

auto Evaluator::iterErrors(const json& instance, const json& schema,
                           Annotations* sink) -> ErrorStream {
    if (schema.is_boolean()) {
        if (!schema.get<bool>()) {
            ValidationError error("False schema does not allow " +
                                  utils::repr(instance));
            error.setDetails("", schema, instance, schema);
            co_yield std::move(error);
        }
        co_return;
    }
    if (!schema.is_object()) {
        co_return;
    }

    DepthGuard depthGuard(depth_, validator_.options().maxDepth);
    const Dialect& dialect = *dialects_.back();
    Annotations local;
    StackGuard<Annotations*> annotationGuard(annotations_, &local);

    // The root and reference targets enter with their own "$id" already
    // in the resolution scope.
    const bool scoped = &schema == scopedNode_;
    scopedNode_ = nullptr;
    std::optional<Resolver::ScopeGuard> scope;
    if (std::string id = dialect.idOf(schema);
        !scoped && !id.empty() && id.front() != '#') {
        scope.emplace(resolver_, uri::join(resolver_.resolutionScope(), id));
    }

    const bool refOnly =
        dialect.refOverridesSiblings && schema.contains("$ref");
    std::vector<json::const_iterator> order;
    std::vector<json::const_iterator> deferred;
    for (auto it = schema.cbegin(); it != schema.cend(); ++it) {
        if (refOnly && it.key() != "$ref") {
            continue;
        }
        if (dialect.keyword(it.key()) == nullptr) {
            continue;
        }
        (dialect.isDeferred(it.key()) ? deferred : order).push_back(it);
    }
    order.insert(order.end(), deferred.begin(), deferred.end());

    std::size_t failures = 0;
    for (const auto& it : order) {
        const std::string& keyword = it.key();
        const KeywordFn& function = *dialect.keyword(keyword);
        for (auto& error : function(*this, it.value(), instance, schema)) {
            ++failures;
            error.setDetails(keyword, it.value(), instance, schema);
            error.schemaPath.push_front(keyword);
            co_yield std::move(error);
        }
    }
    if (failures == 0 && sink != nullptr) {
        sink->merge(local);
    }
}

auto Evaluator::descend(const json& instance, const json& schema,
                        std::optional<PathElement> path,
                        std::optional<PathElement> schemaPath,
                        Annotations* sink) -> ErrorStream {
    for (auto& error : iterErrors(instance, schema, sink)) {
        if (path) {
            error.path.push_front(*path);
        }
        if (schemaPath) {
            error.schemaPath.push_front(*schemaPath);
        }
        co_yield std::move(error);
    }
}

auto Evaluator::descendReference(const json& instance,
                                 Resolver::Resolved target,
                                 Annotations* sink) -> ErrorStream {
    const json& schema = target.contents();
    ActiveReferenceGuard::Key key{&schema, &instance};
    if (activeReferences_.contains(key)) {
        co_return;
    }
    ActiveReferenceGuard referenceGuard(activeReferences_, key);
    Resolver::ScopeGuard scope(resolver_, target.uri);
    StackGuard<std::shared_ptr<const Dialect>> dialectGuard(
        dialects_, target.resource.dialect());
    scopedNode_ = &schema;
    for (auto& error : iterErrors(instance, schema, sink)) {
        co_yield std::move(error);
    }
}

auto Evaluator::isValid(const json& instance, const json& schema,
                        Annotations* sink) -> bool {
    auto errors = iterErrors(instance, schema, sink);
    return errors.begin() == errors.end();
}

void Evaluator::annotate(const json& instance, const json& schema,
                         Annotations* sink) {
    if (!isValid(instance, schema, sink)) {
        spdlog::trace("Subschema failed; its annotations are dropped");
    }
}

auto Evaluator::isType(const json& instance, std::string_view type) const
    -> bool {
    return dialect().typeChecker.isType(instance, type);
}

auto Evaluator::dialect() const -> const Dialect& { return *dialects_.back(); }

auto Evaluator::tracksAnnotations() const -> bool {
    return !dialect().deferred.empty();
}

auto Evaluator::formatChecker() const -> const FormatChecker* {
    return validator_.formatChecker();
}

auto Evaluator::resolver() -> Resolver& { return resolver_; }

auto Evaluator::annotations() -> Annotations& { return *annotations_.back(); }

auto compile(json document, CompileOptions options) -> Validator {
    const DialectCatalog& catalog =
        options.catalog != nullptr ? *options.catalog
                                   : DialectCatalog::builtin();
    auto dialect = options.dialect != nullptr
                       ? options.dialect
                       : catalog.dialectFor(document, options.defaultDialect);
    if (options.checkSchema) {
        checkSchema(document, dialect);
    }
    Validator validator(std::move(document), std::move(dialect),
                        std::move(options.registry),
                        std::move(options.formatChecker),
                        std::move(options.validator));
    spdlog::debug("Compiled schema '{}' with dialect {}", validator.baseUri(),
                  validator.dialect()->name);
    return validator;
}

auto compile(json document, std::shared_ptr<const Dialect> dialect)
    -> Validator {
    CompileOptions options;
    options.dialect = std::move(dialect);
    return compile(std::move(document), std::move(options));
}

void checkSchema(const json& document,
                 const std::shared_ptr<const Dialect>& dialect) {
    std::shared_ptr<const json> metaSchema = dialect->metaSchema;
    if (!metaSchema) {
        const Resource* known =
            builtinRegistry().find(dialect->metaSchemaUri);
        if (known == nullptr) {
            THROW_UNKNOWN_DIALECT("No meta-schema available for dialect '",
                                  dialect->name, "'");
        }
        metaSchema = known->document();
    }
    auto metaDialect = DialectCatalog::builtin().dialectFor(*metaSchema, dialect);
    Validator meta(metaSchema, metaDialect);
    auto errors = meta.errors(document);
    if (!errors.empty()) {
        spdlog::debug("Schema failed {} meta-schema check with {} errors",
                      dialect->name, errors.size());
        THROW_SCHEMA_ERROR(std::move(errors));
    }
}

}  // namespace jsv::schema
