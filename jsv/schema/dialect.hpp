/*
 * dialect.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-15

Description: JSON Schema dialects: keyword tables, meta-schemas and
reference policy, plus the catalog used to pick one from "$schema"

**************************************************/

#ifndef JSV_SCHEMA_DIALECT_HPP
#define JSV_SCHEMA_DIALECT_HPP

#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "jsv/async/generator.hpp"
#include "jsv/schema/errors.hpp"
#include "jsv/schema/type_checker.hpp"

namespace jsv::schema {

class Evaluator;

using ErrorStream = async::Generator<ValidationError>;

/**
 * @brief Validation function of one keyword.
 *
 * Called with the evaluator, the keyword's value, the instance and the
 * schema object containing the keyword. Yields one error per violation.
 */
using KeywordFn = std::function<ErrorStream(Evaluator&, const json&,
                                            const json&, const json&)>;

/**
 * @brief Where a dialect nests subschemas.
 */
struct SubschemaLayout {
    /// Value is a schema, or an array of schemas ("items", "extends").
    std::set<std::string, std::less<>> single;
    /// Value is an array of schemas.
    std::set<std::string, std::less<>> arrays;
    /// Value is an object whose members are schemas.
    std::set<std::string, std::less<>> maps;
};

/**
 * @brief One JSON Schema specification version.
 */
struct Dialect {
    std::string name;
    std::string metaSchemaUri;
    std::shared_ptr<const json> metaSchema;
    std::map<std::string, KeywordFn, std::less<>> keywords;
    /// Keywords evaluated after all of their siblings.
    std::set<std::string, std::less<>> deferred;
    TypeChecker typeChecker;
    std::string idKeyword{"$id"};
    /// "$ref" suppresses every sibling keyword, "$id" included.
    bool refOverridesSiblings{false};
    /// Identifiers of the form "#name" declare plain-name anchors.
    bool anchorInId{false};
    bool anchorKeyword{false};
    bool dynamicAnchorKeyword{false};
    bool recursiveAnchorKeyword{false};
    SubschemaLayout subschemas;

    [[nodiscard]] auto keyword(std::string_view name) const
        -> const KeywordFn*;

    [[nodiscard]] auto isDeferred(std::string_view name) const -> bool;

    /// The schema's identifier, or an empty string when it has none.
    [[nodiscard]] auto idOf(const json& schema) const -> std::string;
};

[[nodiscard]] auto draft3() -> std::shared_ptr<const Dialect>;
[[nodiscard]] auto draft4() -> std::shared_ptr<const Dialect>;
[[nodiscard]] auto draft6() -> std::shared_ptr<const Dialect>;
[[nodiscard]] auto draft7() -> std::shared_ptr<const Dialect>;
[[nodiscard]] auto draft201909() -> std::shared_ptr<const Dialect>;
[[nodiscard]] auto draft202012() -> std::shared_ptr<const Dialect>;

/**
 * @brief Derives a new dialect from an existing one.
 *
 * @code
 * auto strict = DialectBuilder(*draft202012())
 *                   .name("strict")
 *                   .keyword("x-even", evenKeyword)
 *                   .build();
 * @endcode
 */
class DialectBuilder {
public:
    explicit DialectBuilder(const Dialect& base);

    auto name(std::string name) -> DialectBuilder&;

    /// Replaces the meta-schema; @p document may be null to reuse a
    /// meta-schema already known to the registry.
    auto metaSchema(std::string uri, std::shared_ptr<const json> document)
        -> DialectBuilder&;

    /// Adds or overrides a keyword.
    auto keyword(std::string name, KeywordFn function) -> DialectBuilder&;

    auto removeKeyword(std::string_view name) -> DialectBuilder&;

    /// Evaluates @p name after its sibling keywords.
    auto defer(std::string name) -> DialectBuilder&;

    auto typeChecker(TypeChecker checker) -> DialectBuilder&;

    [[nodiscard]] auto build() const -> std::shared_ptr<const Dialect>;

private:
    Dialect dialect_;
};

/**
 * @brief Immutable table of dialects keyed by meta-schema URI.
 */
class DialectCatalog {
public:
    DialectCatalog() = default;

    /// The six built-in dialects.
    [[nodiscard]] static auto builtin() -> const DialectCatalog&;

    [[nodiscard]] auto withDialect(std::shared_ptr<const Dialect> dialect) const
        -> DialectCatalog;

    /// Dialect whose meta-schema URI equals @p uri, ignoring an empty
    /// fragment; null when unknown.
    [[nodiscard]] auto find(std::string_view uri) const
        -> std::shared_ptr<const Dialect>;

    /**
     * @brief Picks the dialect of @p schema from its "$schema".
     *
     * A missing or non-string "$schema" selects @p fallback, or 2020-12
     * when no fallback is given.
     *
     * @throws UnknownDialect if "$schema" is not in the catalog and
     *         @p fallback is null.
     */
    [[nodiscard]] auto dialectFor(
        const json& schema,
        std::shared_ptr<const Dialect> fallback = nullptr) const
        -> std::shared_ptr<const Dialect>;

    [[nodiscard]] auto dialects() const
        -> std::vector<std::shared_ptr<const Dialect>>;

private:
    std::map<std::string, std::shared_ptr<const Dialect>, std::less<>>
        dialects_;
};

}  // namespace jsv::schema

#endif  // JSV_SCHEMA_DIALECT_HPP
