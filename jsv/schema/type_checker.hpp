/*
 * type_checker.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-13

Description: Immutable mapping from JSON Schema type names to predicates

**************************************************/

#ifndef JSV_SCHEMA_TYPE_CHECKER_HPP
#define JSV_SCHEMA_TYPE_CHECKER_HPP

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace jsv::schema {

using json = nlohmann::json;

/**
 * @brief Decides whether an instance is of a given JSON Schema type.
 *
 * A TypeChecker is an immutable value; redefine() and remove() return new
 * checkers and leave the receiver untouched.
 */
class TypeChecker {
public:
    using Predicate = std::function<bool(const TypeChecker&, const json&)>;
    using Checkers = std::map<std::string, Predicate, std::less<>>;

    TypeChecker();
    explicit TypeChecker(Checkers checkers);

    /**
     * @brief Checks @p instance against the named type.
     * @throws UndefinedTypeCheck if no predicate is registered for @p type.
     */
    [[nodiscard]] auto isType(const json& instance, std::string_view type) const
        -> bool;

    [[nodiscard]] auto isKnown(std::string_view type) const -> bool;

    [[nodiscard]] auto types() const -> std::vector<std::string>;

    [[nodiscard]] auto redefine(std::string type, Predicate predicate) const
        -> TypeChecker;

    [[nodiscard]] auto redefineMany(const Checkers& checkers) const
        -> TypeChecker;

    /**
     * @brief Returns a checker without @p type.
     * @throws UndefinedTypeCheck if @p type is not defined.
     */
    [[nodiscard]] auto remove(std::string_view type) const -> TypeChecker;

private:
    std::shared_ptr<const Checkers> checkers_;
};

/// Types of draft 3, including "any".
[[nodiscard]] auto draft3TypeChecker() -> const TypeChecker&;

/// Draft 4 types; "integer" rejects floats.
[[nodiscard]] auto draft4TypeChecker() -> const TypeChecker&;

/// Draft 6 onwards; "integer" accepts floats with an integral value.
[[nodiscard]] auto draft6TypeChecker() -> const TypeChecker&;

}  // namespace jsv::schema

#endif  // JSV_SCHEMA_TYPE_CHECKER_HPP
