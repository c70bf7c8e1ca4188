/*
 * uri.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-13

Description: RFC 3986 reference resolution and RFC 6901 JSON Pointers

**************************************************/

#ifndef JSV_SCHEMA_URI_HPP
#define JSV_SCHEMA_URI_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace jsv::schema::uri {

using json = nlohmann::json;

/**
 * @brief The five components of a URI reference.
 *
 * Undefined components are distinguished from empty ones, as reference
 * resolution requires.
 */
struct UriReference {
    std::optional<std::string> scheme;
    std::optional<std::string> authority;
    std::string path;
    std::optional<std::string> query;
    std::optional<std::string> fragment;

    [[nodiscard]] static auto parse(std::string_view text) -> UriReference;
    [[nodiscard]] auto toString() const -> std::string;
};

/// RFC 3986 section 5.2.4.
[[nodiscard]] auto removeDotSegments(std::string_view path) -> std::string;

/// Resolves @p reference against @p base (RFC 3986 section 5.2.2).
[[nodiscard]] auto join(std::string_view base, std::string_view reference)
    -> std::string;

/// Splits a URI into its fragment-free part and its fragment.
[[nodiscard]] auto defragment(std::string_view uri)
    -> std::pair<std::string, std::string>;

/// Drops an empty trailing fragment so "x#" and "x" compare equal.
[[nodiscard]] auto normalize(std::string_view uri) -> std::string;

[[nodiscard]] auto percentDecode(std::string_view text) -> std::string;

/**
 * @brief Splits a JSON Pointer into decoded reference tokens.
 *
 * @throws jsv::error::InvalidArgument if @p pointer is neither empty nor
 * starts with '/'.
 */
[[nodiscard]] auto splitPointer(std::string_view pointer)
    -> std::vector<std::string>;

/// Array index token: digits only, no leading zeros.
[[nodiscard]] auto parseIndex(std::string_view token)
    -> std::optional<std::size_t>;

/// Node one token below @p node, or nullptr.
[[nodiscard]] auto step(const json& node, const std::string& token)
    -> const json*;

/// Node at @p pointer within @p document, or nullptr when it does not exist.
[[nodiscard]] auto resolvePointer(const json& document,
                                  std::string_view pointer) -> const json*;

}  // namespace jsv::schema::uri

#endif  // JSV_SCHEMA_URI_HPP
