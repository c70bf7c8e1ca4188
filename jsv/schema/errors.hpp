/*
 * errors.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-12

Description: Validation error value produced by the evaluation engine

**************************************************/

#ifndef JSV_SCHEMA_ERRORS_HPP
#define JSV_SCHEMA_ERRORS_HPP

#include <cstddef>
#include <deque>
#include <exception>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace jsv::schema {

using json = nlohmann::json;

/// One step into an instance or schema: a property name or array index.
using PathElement = std::variant<std::string, std::size_t>;
using Path = std::deque<PathElement>;

[[nodiscard]] auto toString(const PathElement& element) -> std::string;

/// Renders a path as a JSON Pointer ("/a/0").
[[nodiscard]] auto toPointer(const Path& path) -> std::string;

/**
 * @brief One failed keyword application.
 *
 * Errors nested in @ref context() keep paths relative to their parent;
 * absolutePath() and absoluteSchemaPath() compose them. The parent link
 * is maintained across copies and moves.
 */
class ValidationError {
public:
    std::string message;
    std::string keyword;
    json keywordValue;
    json instance;
    json schema;
    Path path;
    Path schemaPath;
    std::exception_ptr cause;

    ValidationError() = default;
    explicit ValidationError(std::string message,
                             std::exception_ptr cause = nullptr);
    ValidationError(std::string message, std::vector<ValidationError> context);

    ValidationError(const ValidationError& other);
    ValidationError(ValidationError&& other) noexcept;
    auto operator=(const ValidationError& other) -> ValidationError&;
    auto operator=(ValidationError&& other) noexcept -> ValidationError&;
    ~ValidationError() = default;

    [[nodiscard]] auto context() const -> const std::vector<ValidationError>&;
    void setContext(std::vector<ValidationError> context);

    /// The error this one is nested under, if any.
    [[nodiscard]] auto parent() const -> const ValidationError*;

    [[nodiscard]] auto absolutePath() const -> Path;
    [[nodiscard]] auto absoluteSchemaPath() const -> Path;

    /// JSONPath rendering of the absolute instance path, e.g. "$.a[0]".
    [[nodiscard]] auto jsonPath() const -> std::string;

    [[nodiscard]] auto hasDetails() const -> bool;

    /**
     * @brief Records the failing keyword and the nodes it was applied to.
     *
     * Has no effect once details were recorded, so errors bubbling up from
     * nested schemas keep the innermost keyword.
     */
    void setDetails(std::string keyword, const json& keywordValue,
                    const json& instance, const json& schema);

    /// Message followed by the failing schema and instance.
    [[nodiscard]] auto toString() const -> std::string;

    [[nodiscard]] auto toJson() const -> json;

private:
    void adoptContext();

    std::vector<ValidationError> context_;
    const ValidationError* parent_{nullptr};
    bool detailed_{false};
};

}  // namespace jsv::schema

#endif  // JSV_SCHEMA_ERRORS_HPP
