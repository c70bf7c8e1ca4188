/*
 * validator.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-17

Description: Compiled validators and the recursive evaluation engine

**************************************************/

#ifndef JSV_SCHEMA_VALIDATOR_HPP
#define JSV_SCHEMA_VALIDATOR_HPP

#include <cstddef>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "jsv/schema/annotations.hpp"
#include "jsv/schema/dialect.hpp"
#include "jsv/schema/errors.hpp"
#include "jsv/schema/format_checker.hpp"
#include "jsv/schema/registry.hpp"
#include "jsv/schema/resolver.hpp"

namespace jsv::schema {

using json = nlohmann::json;

/**
 * @brief Per-validator settings.
 */
struct ValidatorOptions {
    /// Nesting limit of schema evaluation; exceeding it throws
    /// RecursionError.
    std::size_t maxDepth{1024};
    /// URI of the root schema when it has no identifier of its own.
    std::string baseUri{};
};

/**
 * @brief Settings of compile().
 */
struct CompileOptions {
    /// Dialect to bind; inferred from "$schema" when null.
    std::shared_ptr<const Dialect> dialect{};
    /// Dialect used when "$schema" is absent or not in the catalog.
    std::shared_ptr<const Dialect> defaultDialect{};
    /// Dialects known to "$schema" inference; the built-in ones when null.
    const DialectCatalog* catalog{nullptr};
    Registry registry{};
    /// Enables "format" assertions.
    std::shared_ptr<const FormatChecker> formatChecker{};
    /// Validate the schema against its meta-schema first.
    bool checkSchema{true};
    ValidatorOptions validator{};
};

/**
 * @brief A schema bound to a dialect, a registry and a format checker.
 *
 * Validators are immutable and may be shared between threads. Each call
 * evaluates with its own resolver and annotation state. The instance and
 * the validator must outlive any stream returned by iterErrors().
 */
class Validator {
public:
    Validator(json schema, std::shared_ptr<const Dialect> dialect,
              Registry registry = {},
              std::shared_ptr<const FormatChecker> formatChecker = nullptr,
              ValidatorOptions options = {});

    Validator(std::shared_ptr<const json> schema,
              std::shared_ptr<const Dialect> dialect, Registry registry = {},
              std::shared_ptr<const FormatChecker> formatChecker = nullptr,
              ValidatorOptions options = {});

    /**
     * @brief Lazily yields every error of @p instance.
     *
     * Errors come depth first, keyword by keyword in schema order. Each
     * call starts a fresh evaluation.
     */
    [[nodiscard]] auto iterErrors(const json& instance) const -> ErrorStream;

    /// Every error of @p instance.
    [[nodiscard]] auto errors(const json& instance) const
        -> std::vector<ValidationError>;

    /// The first error only; evaluation stops as soon as it is found.
    [[nodiscard]] auto firstError(const json& instance) const
        -> std::optional<ValidationError>;

    [[nodiscard]] auto isValid(const json& instance) const -> bool;

    /**
     * @brief Throws ValidationException carrying the first error, if any.
     */
    void validate(const json& instance) const;

    /// A validator for another schema with the same bindings.
    [[nodiscard]] auto evolve(json schema) const -> Validator;

    [[nodiscard]] auto schema() const -> const json&;
    [[nodiscard]] auto dialect() const -> const std::shared_ptr<const Dialect>&;
    [[nodiscard]] auto registry() const -> const Registry&;
    [[nodiscard]] auto formatChecker() const -> const FormatChecker*;
    [[nodiscard]] auto options() const -> const ValidatorOptions&;

    /// Fragment-free URI of the root schema.
    [[nodiscard]] auto baseUri() const -> const std::string&;

private:
    std::shared_ptr<const json> schema_;
    std::shared_ptr<const Dialect> dialect_;
    Registry registry_;
    std::shared_ptr<const FormatChecker> formatChecker_;
    ValidatorOptions options_;
    std::string baseUri_;
};

/**
 * @brief State of one validation call, handed to keyword functions.
 */
class Evaluator {
public:
    explicit Evaluator(const Validator& validator);

    Evaluator(const Evaluator&) = delete;
    Evaluator& operator=(const Evaluator&) = delete;

    /// Evaluates the validator's root schema.
    [[nodiscard]] auto evaluate(const json& instance) -> ErrorStream;

    /**
     * @brief Evaluates a subschema, prefixing the produced paths.
     * @param path Instance path element to prepend, if any.
     * @param schemaPath Schema path element to prepend, if any.
     * @param sink Receives the subschema's annotations when it produced
     *        no error.
     */
    [[nodiscard]] auto descend(const json& instance, const json& schema,
                               std::optional<PathElement> path = std::nullopt,
                               std::optional<PathElement> schemaPath =
                                   std::nullopt,
                               Annotations* sink = nullptr) -> ErrorStream;

    /**
     * @brief Evaluates the target of a reference in its own scope.
     *
     * Re-entering a target for the same instance node while it is still
     * being evaluated yields nothing.
     */
    [[nodiscard]] auto descendReference(const json& instance,
                                        Resolver::Resolved target,
                                        Annotations* sink) -> ErrorStream;

    [[nodiscard]] auto isValid(const json& instance, const json& schema,
                               Annotations* sink = nullptr) -> bool;

    /// Evaluates @p schema only for the annotations it contributes.
    void annotate(const json& instance, const json& schema, Annotations* sink);

    [[nodiscard]] auto isType(const json& instance, std::string_view type) const
        -> bool;

    /// Dialect of the schema being evaluated.
    [[nodiscard]] auto dialect() const -> const Dialect&;

    /// Whether the dialect consumes annotations at all.
    [[nodiscard]] auto tracksAnnotations() const -> bool;

    [[nodiscard]] auto formatChecker() const -> const FormatChecker*;

    [[nodiscard]] auto resolver() -> Resolver&;

    /// Annotations of the schema object whose keyword is running.
    [[nodiscard]] auto annotations() -> Annotations&;

private:
    auto iterErrors(const json& instance, const json& schema,
                    Annotations* sink) -> ErrorStream;

    const Validator& validator_;
    Resolver resolver_;
    std::vector<Annotations*> annotations_;
    std::vector<std::shared_ptr<const Dialect>> dialects_;
    std::set<std::pair<const json*, const json*>> activeReferences_;
    std::size_t depth_{0};
    /// Schema about to be entered whose "$id" is already in scope.
    const json* scopedNode_{nullptr};
};

/**
 * @brief Binds @p document to a dialect and returns its validator.
 * @throws UnknownDialect if the dialect cannot be determined.
 * @throws SchemaError if schema checking is enabled and fails.
 */
[[nodiscard]] auto compile(json document, CompileOptions options = {})
    -> Validator;

[[nodiscard]] auto compile(json document,
                           std::shared_ptr<const Dialect> dialect)
    -> Validator;

/**
 * @brief Validates @p document against the meta-schema of @p dialect.
 * @throws SchemaError carrying every failure.
 */
void checkSchema(const json& document,
                 const std::shared_ptr<const Dialect>& dialect);

}  // namespace jsv::schema

#endif  // JSV_SCHEMA_VALIDATOR_HPP
