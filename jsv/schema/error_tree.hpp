/*
 * error_tree.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-14

Description: Error aggregation by instance path and relevance ranking

**************************************************/

#ifndef JSV_SCHEMA_ERROR_TREE_HPP
#define JSV_SCHEMA_ERROR_TREE_HPP

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <vector>

#include "jsv/schema/errors.hpp"

namespace jsv::schema {

/**
 * @brief Index over a flat list of errors, keyed by instance path.
 *
 * Each node holds the errors whose absolute path ends there, keyed by the
 * failing keyword, and one child per path element below it.
 */
class ErrorTree {
public:
    ErrorTree() = default;
    explicit ErrorTree(const std::vector<ValidationError>& errors);

    /// Whether any error was recorded at or below @p element.
    [[nodiscard]] auto contains(const PathElement& element) const -> bool;

    /// Subtree for @p element, empty when no error lies beneath it.
    [[nodiscard]] auto operator[](const PathElement& element) const
        -> const ErrorTree&;

    [[nodiscard]] auto errors() const
        -> const std::map<std::string, ValidationError>&;

    [[nodiscard]] auto children() const
        -> const std::map<PathElement, ErrorTree>&;

    /// Number of errors in this node and every node beneath it.
    [[nodiscard]] auto totalErrors() const -> std::size_t;

    [[nodiscard]] auto empty() const -> bool;

private:
    std::map<std::string, ValidationError> errors_;
    std::map<PathElement, ErrorTree> children_;
};

/**
 * @brief Ranking used to pick the most relevant error.
 *
 * Errors rank by absolute instance path depth first (deeper wins), then by
 * whether their keyword is outside @ref weak, then by whether it is inside
 * @ref strong. Ties keep the earliest error.
 */
struct Relevance {
    std::set<std::string, std::less<>> weak{"anyOf", "oneOf"};
    std::set<std::string, std::less<>> strong{};

    [[nodiscard]] auto key(const ValidationError& error) const
        -> std::tuple<std::size_t, bool, bool>;
};

/**
 * @brief Picks the single most relevant error.
 *
 * Selects the highest ranked error, then repeatedly descends into the
 * highest ranked member of its context. The returned copy carries absolute
 * paths.
 *
 * @return std::nullopt when @p errors is empty.
 */
[[nodiscard]] auto bestMatch(const std::vector<ValidationError>& errors,
                             const Relevance& relevance = {})
    -> std::optional<ValidationError>;

}  // namespace jsv::schema

#endif  // JSV_SCHEMA_ERROR_TREE_HPP
