/*
 * utils.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-13

Description: JSON value comparison and message helpers for keywords

**************************************************/

#ifndef JSV_SCHEMA_UTILS_HPP
#define JSV_SCHEMA_UTILS_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace jsv::schema::utils {

using json = nlohmann::json;

/**
 * @brief Structural equality with JSON Schema semantics.
 *
 * Booleans never equal numbers, numbers compare by value across integer
 * and floating representations, arrays compare in order and objects by
 * key set and values.
 */
[[nodiscard]] auto equal(const json& lhs, const json& rhs) -> bool;

/// Whether every element of @p array is distinct under equal().
[[nodiscard]] auto uniq(const json& array) -> bool;

/// Three-way numeric comparison; both arguments must be numbers.
[[nodiscard]] auto compareNumbers(const json& lhs, const json& rhs) -> int;

/// Whether a number has no fractional part.
[[nodiscard]] auto isIntegral(const json& number) -> bool;

/**
 * @brief Exact divisibility test for JSON numbers.
 *
 * Integers use integer arithmetic. Floating operands are checked against
 * their shortest decimal representation whenever the floating quotient is
 * integral or within rounding distance of an integer.
 */
[[nodiscard]] auto isMultipleOf(const json& value, const json& divisor)
    -> bool;

/// Length in Unicode code points of a UTF-8 string.
[[nodiscard]] auto utf8Length(std::string_view text) -> std::size_t;

/// Compact JSON rendering used inside error messages.
[[nodiscard]] auto repr(const json& value) -> std::string;

/// Renders `"a", "b" were` or `"a" was` for extra-item messages.
[[nodiscard]] auto extrasMessage(const std::vector<json>& extras)
    -> std::string;

}  // namespace jsv::schema::utils

#endif  // JSV_SCHEMA_UTILS_HPP
