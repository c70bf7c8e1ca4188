/*
 * human_errors.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-22

Description: End-user wording for validation errors

**************************************************/

#ifndef JSV_SCHEMA_HUMAN_ERRORS_HPP
#define JSV_SCHEMA_HUMAN_ERRORS_HPP

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "jsv/async/generator.hpp"
#include "jsv/schema/errors.hpp"

namespace jsv::schema {

class Validator;

/**
 * @brief Turns a property name into words.
 *
 * "color" becomes "Color", "color_wheel" becomes "Color Wheel" and
 * "colorWheel" becomes "Color wheel". A JSONPath argument is reduced to
 * its last dotted segment first.
 */
[[nodiscard]] auto humanizePropertyName(std::string_view name) -> std::string;

/**
 * @brief Last named step of a JSONPath as rendered by
 *        ValidationError::jsonPath().
 *
 * An array index yields "item N". Returns an empty string for "$".
 */
[[nodiscard]] auto lastPropertyName(std::string_view jsonPath) -> std::string;

/**
 * @brief Per-keyword message formatters.
 *
 * Keywords without a formatter keep the engine's message.
 */
class HumanErrors {
public:
    using Formatter =
        std::function<std::string(const ValidationError&, const HumanErrors&)>;

    HumanErrors() = default;

    /// Formatters for every standard keyword.
    [[nodiscard]] static auto defaults() -> const HumanErrors&;

    /**
     * @brief Installs @p formatter for @p keyword, replacing any previous one.
     * @throws InvalidArgument if @p formatter is empty.
     */
    void registerFormatter(std::string keyword, Formatter formatter);

    [[nodiscard]] auto hasFormatter(std::string_view keyword) const -> bool;

    [[nodiscard]] auto keywords() const -> std::vector<std::string>;

    /**
     * @brief Formats @p error with its keyword's formatter.
     * @param includePath Appends " for <Property>" when the error sits
     *        below the instance root.
     */
    [[nodiscard]] auto format(const ValidationError& error,
                              bool includePath = true) const -> std::string;

    /// Like format(), but errors with a context are described by their
    /// best match.
    [[nodiscard]] auto humanize(const ValidationError& error) const
        -> std::string;

    /// Lazily yields the humanized message of every error of @p instance.
    [[nodiscard]] auto messages(const Validator& validator,
                                const json& instance) const
        -> async::Generator<std::string>;

private:
    std::map<std::string, Formatter, std::less<>> formatters_;
};

/// HumanErrors::defaults().humanize(error).
[[nodiscard]] auto humanizeError(const ValidationError& error) -> std::string;

}  // namespace jsv::schema

#endif  // JSV_SCHEMA_HUMAN_ERRORS_HPP
