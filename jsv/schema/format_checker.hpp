/*
 * format_checker.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-13

Description: Registry of pluggable "format" predicates

**************************************************/

#ifndef JSV_SCHEMA_FORMAT_CHECKER_HPP
#define JSV_SCHEMA_FORMAT_CHECKER_HPP

#include <exception>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace jsv::schema {

using json = nlohmann::json;

/**
 * @brief Maps format names to predicates.
 *
 * Formats without a registered predicate always conform. A checker is
 * populated up front and then handed to validators, which only read it.
 */
class FormatChecker {
public:
    using Predicate = std::function<bool(const json&)>;
    /// Selects the predicate exceptions that mean non-conformance.
    using Raises = std::function<bool(const std::exception&)>;

    FormatChecker() = default;

    /// Every std::exception counts as non-conformance.
    [[nodiscard]] static auto raisesAny() -> Raises;

    /// Only exceptions of the listed types (or derived from them) count.
    template <typename... Exceptions>
    [[nodiscard]] static auto raisesOf() -> Raises {
        return [](const std::exception& e) {
            return ((dynamic_cast<const Exceptions*>(&e) != nullptr) || ...);
        };
    }

    /**
     * @brief Installs a predicate for @p format, replacing any previous one.
     * @param raises Exceptions it accepts are treated as non-conformance and
     *        kept as the failure cause. Others, or all of them when
     *        @p raises is empty, propagate out of the validation call.
     */
    void registerFormat(std::string format, Predicate predicate,
                        Raises raises = raisesAny());

    [[nodiscard]] auto hasFormat(std::string_view format) const -> bool;

    [[nodiscard]] auto formats() const -> std::vector<std::string>;

    /**
     * @brief Checks @p instance against @p format.
     * @throws FormatError on non-conformance, carrying the predicate's
     *         exception as cause when there was one.
     */
    void check(const json& instance, std::string_view format) const;

    [[nodiscard]] auto conforms(const json& instance,
                                std::string_view format) const -> bool;

    /**
     * @brief Non-throwing form of check().
     * @param cause Receives the predicate's exception, if it raised.
     * @return Whether @p instance conforms.
     */
    [[nodiscard]] auto test(const json& instance, std::string_view format,
                            std::exception_ptr& cause) const -> bool;

private:
    struct Entry {
        Predicate predicate;
        Raises raises;
    };

    std::map<std::string, Entry, std::less<>> checkers_;
};

}  // namespace jsv::schema

#endif  // JSV_SCHEMA_FORMAT_CHECKER_HPP
