/*
 * human_errors.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-22

Description: End-user wording for validation errors

**************************************************/

#include "human_errors.hpp"

#include <cctype>
#include <regex>

#include <spdlog/spdlog.h>

#include "jsv/error/exception.hpp"
#include "jsv/schema/error_tree.hpp"
#include "jsv/schema/utils.hpp"
#include "jsv/schema/validator.hpp"

namespace jsv::schema {

namespace {
using utils::repr;

auto capitalize(std::string word) -> std::string {
    for (std::size_t i = 0; i < word.size(); ++i) {
        auto c = static_cast<unsigned char>(word[i]);
        word[i] = static_cast<char>(i == 0 ? std::toupper(c)
                                           : std::tolower(c));
    }
    return word;
}

auto isFalse(const json& value) -> bool {
    return value.is_boolean() && !value.get<bool>();
}

auto joinWords(const std::vector<std::string>& words,
               std::string_view separator) -> std::string {
    std::string out;
    for (std::size_t i = 0; i < words.size(); ++i) {
        if (i != 0) {
            out += separator;
        }
        out += words[i];
    }
    return out;
}

auto humanizeName(const json& name) -> std::string {
    return humanizePropertyName(name.is_string()
                                    ? name.get_ref<const std::string&>()
                                    : repr(name));
}

auto humanizeNames(const std::vector<json>& names) -> std::string {
    std::vector<std::string> words;
    words.reserve(names.size());
    for (const auto& name : names) {
        words.push_back(humanizeName(name));
    }
    return joinWords(words, ", ");
}

/// Members of @p required absent from @p instance.
auto missingFrom(const json& instance, const json& required)
    -> std::vector<json> {
    std::vector<json> missing;
    if (!instance.is_object()) {
        return missing;
    }
    if (required.is_string()) {
        if (!instance.contains(required.get_ref<const std::string&>())) {
            missing.push_back(required);
        }
        return missing;
    }
    if (!required.is_array()) {
        return missing;
    }
    for (const auto& name : required) {
        if (name.is_string() &&
            !instance.contains(name.get_ref<const std::string&>())) {
            missing.push_back(name);
        }
    }
    return missing;
}

auto constant(std::string message) -> HumanErrors::Formatter {
    return [message = std::move(message)](const ValidationError&,
                                          const HumanErrors&) {
        return message;
    };
}

auto bound(std::string prefix) -> HumanErrors::Formatter {
    return [prefix = std::move(prefix)](const ValidationError& error,
                                        const HumanErrors&) {
        return prefix + " " + repr(error.keywordValue) + ", but was " +
               repr(error.instance);
    };
}

auto formatType(const ValidationError& error, const HumanErrors&)
    -> std::string {
    static const std::map<std::string, std::string, std::less<>> kNames{
        {"string", "text"},
        {"integer", "whole number"},
        {"number", "number"},
        {"array", "list"},
        {"object", "object"},
        {"boolean", "true or false value"},
        {"null", "null"},
    };
    auto friendly = [](const json& type) -> std::string {
        if (!type.is_string()) {
            return repr(type);
        }
        const auto& name = type.get_ref<const std::string&>();
        auto it = kNames.find(name);
        return it == kNames.end() ? name : it->second;
    };
    std::string expected;
    if (error.keywordValue.is_array()) {
        std::vector<std::string> names;
        for (const auto& type : error.keywordValue) {
            names.push_back(friendly(type));
        }
        expected = joinWords(names, " or ");
    } else {
        expected = friendly(error.keywordValue);
    }
    return "Expected " + expected + ", but got " + repr(error.instance);
}

auto formatRequired(const ValidationError& error, const HumanErrors&)
    -> std::string {
    const json& required = error.keywordValue;
    if (required.is_array()) {
        auto missing = missingFrom(error.instance, required);
        if (missing.size() == 1) {
            return "Missing required field: " + humanizeName(missing.front());
        }
        if (!missing.empty()) {
            return "Missing required fields: " + humanizeNames(missing);
        }
        if (!required.empty()) {
            return "Missing required field: " + humanizeName(required.front());
        }
    }
    if (required.is_string()) {
        return "Missing required field: " + humanizeName(required);
    }
    // Draft 3 marks the property itself as required.
    if (!error.path.empty()) {
        return "Missing required field: " +
               humanizePropertyName(toString(error.path.back()));
    }
    return "Missing required field";
}

auto formatPattern(const ValidationError& error, const HumanErrors&)
    -> std::string {
    static const std::map<std::string, std::string, std::less<>> kKnown{
        {R"(^[a-zA-Z0-9]+$)", "only letters and numbers"},
        {R"(^[a-zA-Z]+$)", "only letters"},
        {R"(^[0-9]+$)", "only numbers"},
        {R"(^[a-zA-Z0-9_]+$)", "only letters, numbers, and underscores"},
        {R"(^[a-zA-Z0-9_-]+$)",
         "only letters, numbers, underscores, and hyphens"},
        {R"(^[a-zA-Z0-9._%+-]+@[a-zA-Z0-9.-]+\.[a-zA-Z]{2,}$)",
         "a valid email address"},
    };
    if (error.keywordValue.is_string()) {
        if (auto it = kKnown.find(
                error.keywordValue.get_ref<const std::string&>());
            it != kKnown.end()) {
            return "The value must contain " + it->second;
        }
    }
    return "The value " + repr(error.instance) +
           " doesn't match the required pattern";
}

/// Bound formatter with a dedicated message at the "empty" limit.
auto formatLength(int emptyLimit, std::string whenEmpty, std::string prefix,
                  std::string suffix) -> HumanErrors::Formatter {
    return [limit = json(emptyLimit), whenEmpty = std::move(whenEmpty),
            prefix = std::move(prefix), suffix = std::move(suffix)](
               const ValidationError& error, const HumanErrors&) {
        if (error.keywordValue == limit) {
            return whenEmpty;
        }
        return prefix + " " + repr(error.keywordValue) + " " + suffix;
    };
}

auto formatEnum(const ValidationError& error, const HumanErrors&)
    -> std::string {
    if (!error.keywordValue.is_array()) {
        return error.message;
    }
    if (error.keywordValue.size() == 1) {
        return "The value must be " + repr(error.keywordValue.front());
    }
    std::vector<std::string> values;
    for (const auto& value : error.keywordValue) {
        values.push_back(repr(value));
    }
    return "The value must be one of: " + joinWords(values, ", ");
}

auto formatFormat(const ValidationError& error, const HumanErrors&)
    -> std::string {
    static const std::map<std::string, std::string, std::less<>> kDescribed{
        {"date", "a date in YYYY-MM-DD format"},
        {"time", "a time in HH:MM:SS format"},
        {"date-time", "a date and time in ISO 8601 format"},
        {"email", "a valid email address"},
        {"hostname", "a valid hostname"},
        {"ipv4", "a valid IPv4 address"},
        {"ipv6", "a valid IPv6 address"},
        {"uri", "a valid URI"},
        {"uuid", "a valid UUID"},
    };
    std::string format = error.keywordValue.is_string()
                             ? error.keywordValue.get<std::string>()
                             : repr(error.keywordValue);
    auto it = kDescribed.find(format);
    return "The value must be " +
           (it == kDescribed.end() ? "in " + format + " format" : it->second);
}

auto formatAdditionalProperties(const ValidationError& error,
                                const HumanErrors&) -> std::string {
    if (!isFalse(error.keywordValue)) {
        return error.message;
    }
    if (!error.instance.is_object()) {
        return "Unknown field(s) detected";
    }
    const json empty = json::object();
    auto member = [&](const char* keyword) -> const json& {
        auto it = error.schema.find(keyword);
        return it != error.schema.end() && it->is_object() ? *it : empty;
    };
    const json& properties = member("properties");
    const json& patterns = member("patternProperties");

    std::vector<json> unexpected;
    for (auto it = error.instance.cbegin(); it != error.instance.cend(); ++it) {
        if (properties.contains(it.key())) {
            continue;
        }
        bool matched = false;
        for (auto pattern = patterns.cbegin(); pattern != patterns.cend();
             ++pattern) {
            try {
                std::regex re(pattern.key(), std::regex::ECMAScript);
                if (std::regex_search(it.key(), re,
                                      std::regex_constants::match_continuous)) {
                    matched = true;
                    break;
                }
            } catch (const std::regex_error& e) {
                spdlog::debug("Skipping invalid pattern '{}': {}",
                              pattern.key(), e.what());
            }
        }
        if (!matched) {
            unexpected.emplace_back(it.key());
        }
    }
    if (unexpected.size() == 1) {
        return "Unknown field: " + humanizeName(unexpected.front());
    }
    if (!unexpected.empty()) {
        return "Unknown fields: " + humanizeNames(unexpected);
    }
    return "Unknown field(s) detected";
}

auto formatOneOf(const ValidationError& error, const HumanErrors&)
    -> std::string {
    const json& branches = error.keywordValue;
    if (!branches.is_array() || branches.empty()) {
        return "The data must match exactly one of the required schemas";
    }
    // Each failed branch leaves at least one error in the context.
    if (error.context().size() < branches.size()) {
        return "The data matched more than one of the required schemas";
    }
    return "The data doesn't match any of the required schemas";
}

auto formatAllOf(const ValidationError& error, const HumanErrors& humanizer)
    -> std::string {
    if (auto best = bestMatch(error.context())) {
        return "The data doesn't satisfy all required conditions: " +
               humanizer.humanize(*best);
    }
    return "The data doesn't satisfy all required conditions";
}

auto formatDependencies(const ValidationError& error, const HumanErrors&)
    -> std::string {
    if (error.keywordValue.is_object() && error.instance.is_object()) {
        for (auto it = error.keywordValue.cbegin();
             it != error.keywordValue.cend(); ++it) {
            if (!error.instance.contains(it.key())) {
                continue;
            }
            auto missing = missingFrom(error.instance, it.value());
            if (!missing.empty()) {
                return "When " + humanizePropertyName(it.key()) +
                       " is present, " + humanizeNames(missing) +
                       " must also be present";
            }
        }
    }
    return "The data doesn't satisfy property dependencies";
}

auto formatPropertyNames(const ValidationError& error, const HumanErrors&)
    -> std::string {
    for (const auto& nested : error.context()) {
        if (nested.instance.is_string() &&
            !nested.instance.get_ref<const std::string&>().empty()) {
            return "Invalid property name: '" +
                   nested.instance.get<std::string>() + "'";
        }
    }
    if (error.instance.is_string() &&
        !error.instance.get_ref<const std::string&>().empty()) {
        return "Invalid property name: '" + error.instance.get<std::string>() +
               "'";
    }
    return "Some property names don't match the required format";
}

auto formatContainsBound(std::string prefix) -> HumanErrors::Formatter {
    return [prefix = std::move(prefix)](const ValidationError& error,
                                        const HumanErrors&) {
        return prefix + " " + repr(error.keywordValue) + " matching items";
    };
}

auto formatAdditionalItems(const ValidationError& error, const HumanErrors&)
    -> std::string {
    if (isFalse(error.keywordValue)) {
        return "Additional items are not allowed in this list";
    }
    return "Some items in the list don't match the required format";
}

auto makeDefaults() -> HumanErrors {
    HumanErrors humanizer;
    humanizer.registerFormatter("type", formatType);
    humanizer.registerFormatter("required", formatRequired);
    humanizer.registerFormatter("pattern", formatPattern);
    humanizer.registerFormatter("minimum", bound("The value must be at least"));
    humanizer.registerFormatter("maximum", bound("The value must be at most"));
    humanizer.registerFormatter("exclusiveMinimum",
                                bound("The value must be greater than"));
    humanizer.registerFormatter("exclusiveMaximum",
                                bound("The value must be less than"));
    humanizer.registerFormatter(
        "minLength", formatLength(1, "The value cannot be empty",
                                  "The value must be at least",
                                  "characters long"));
    humanizer.registerFormatter(
        "maxLength", formatLength(0, "The value must be empty",
                                  "The value must be at most",
                                  "characters long"));
    humanizer.registerFormatter(
        "minItems", formatLength(1, "The list cannot be empty",
                                 "The list must contain at least", "items"));
    humanizer.registerFormatter(
        "maxItems", formatLength(0, "The list must be empty",
                                 "The list must contain at most", "items"));
    humanizer.registerFormatter(
        "uniqueItems", constant("All items in the list must be unique"));
    humanizer.registerFormatter("enum", formatEnum);
    humanizer.registerFormatter("format", formatFormat);
    humanizer.registerFormatter(
        "multipleOf", [](const ValidationError& error, const HumanErrors&) {
            return "The value must be a multiple of " +
                   repr(error.keywordValue);
        });
    humanizer.registerFormatter(
        "const", [](const ValidationError& error, const HumanErrors&) {
            return "The value must be " + repr(error.keywordValue);
        });
    humanizer.registerFormatter("additionalProperties",
                                formatAdditionalProperties);
    humanizer.registerFormatter("oneOf", formatOneOf);
    humanizer.registerFormatter(
        "anyOf",
        constant("The data doesn't match any of the required schemas"));
    humanizer.registerFormatter("allOf", formatAllOf);
    humanizer.registerFormatter(
        "not", constant("The data should not match the specified schema"));
    humanizer.registerFormatter(
        "if", constant("The data doesn't meet the conditional requirements"));
    humanizer.registerFormatter(
        "then", constant("The data doesn't meet the required conditions"));
    humanizer.registerFormatter(
        "else", constant("The data doesn't meet the alternative conditions"));
    humanizer.registerFormatter("dependencies", formatDependencies);
    humanizer.registerFormatter("dependentRequired", formatDependencies);
    humanizer.registerFormatter(
        "dependentSchemas",
        constant(
            "The data doesn't satisfy the conditional schema requirements"));
    humanizer.registerFormatter("propertyNames", formatPropertyNames);
    humanizer.registerFormatter(
        "contains",
        constant(
            "The list doesn't contain any items matching the required "
            "format"));
    humanizer.registerFormatter(
        "minContains", formatContainsBound("The list must contain at least"));
    humanizer.registerFormatter(
        "maxContains", formatContainsBound("The list must contain at most"));
    humanizer.registerFormatter(
        "patternProperties",
        constant("Some properties don't match the required patterns"));
    humanizer.registerFormatter("additionalItems", formatAdditionalItems);
    humanizer.registerFormatter(
        "unevaluatedItems", constant("The list contains unexpected items"));
    humanizer.registerFormatter(
        "unevaluatedProperties",
        constant("The object contains unexpected properties"));
    return humanizer;
}
}  // namespace

auto humanizePropertyName(std::string_view name) -> std::string {
    if (!name.empty() && name.front() == '$') {
        if (auto dot = name.rfind('.'); dot != std::string_view::npos) {
            name.remove_prefix(dot + 1);
        }
    }
    constexpr std::string_view kTrimmed = "$.\"'[]";
    auto first = name.find_first_not_of(kTrimmed);
    if (first == std::string_view::npos) {
        return {};
    }
    name = name.substr(first, name.find_last_not_of(kTrimmed) - first + 1);

    if (name.find('_') != std::string_view::npos) {
        std::vector<std::string> words;
        std::size_t start = 0;
        while (true) {
            auto end = name.find('_', start);
            words.push_back(capitalize(std::string(name.substr(
                start,
                end == std::string_view::npos ? end : end - start))));
            if (end == std::string_view::npos) {
                break;
            }
            start = end + 1;
        }
        return joinWords(words, " ");
    }

    static const std::regex kCamel("([a-z])([A-Z])");
    std::string text(name);
    if (std::regex_search(text, kCamel)) {
        text = std::regex_replace(text, kCamel, "$1 $2");
    }
    return capitalize(std::move(text));
}

auto lastPropertyName(std::string_view jsonPath) -> std::string {
    static const std::regex kStep(
        R"(\.([^.\[\]]+)|\[(\d+)\]|\[("(?:[^"\\]|\\.)*")\])");
    std::string path(jsonPath);
    std::string last;
    for (auto it = std::sregex_iterator(path.begin(), path.end(), kStep);
         it != std::sregex_iterator(); ++it) {
        const auto& match = *it;
        if (match[1].matched) {
            last = match[1].str();
        } else if (match[2].matched) {
            last = "item " + match[2].str();
        } else {
            last = json::parse(match[3].str()).get<std::string>();
        }
    }
    return last;
}

auto HumanErrors::defaults() -> const HumanErrors& {
    static const HumanErrors kDefaults = makeDefaults();
    return kDefaults;
}

void HumanErrors::registerFormatter(std::string keyword,
                                    Formatter formatter) {
    if (!formatter) {
        THROW_INVALID_ARGUMENT("Empty formatter for keyword '", keyword, "'");
    }
    formatters_.insert_or_assign(std::move(keyword), std::move(formatter));
}

auto HumanErrors::hasFormatter(std::string_view keyword) const -> bool {
    return formatters_.find(keyword) != formatters_.end();
}

auto HumanErrors::keywords() const -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(formatters_.size());
    for (const auto& [name, formatter] : formatters_) {
        names.push_back(name);
    }
    return names;
}

auto HumanErrors::format(const ValidationError& error,
                         bool includePath) const -> std::string {
    std::string message = error.message;
    if (auto it = formatters_.find(error.keyword); it != formatters_.end()) {
        message = it->second(error, *this);
    }
    if (includePath && !error.absolutePath().empty()) {
        if (std::string name = lastPropertyName(error.jsonPath());
            !name.empty()) {
            message += " for " + humanizePropertyName(name);
        }
    }
    return message;
}

auto HumanErrors::humanize(const ValidationError& error) const
    -> std::string {
    if (auto best = bestMatch(error.context())) {
        return format(*best);
    }
    return format(error);
}

auto HumanErrors::messages(const Validator& validator,
                           const json& instance) const
    -> async::Generator<std::string> {
    for (auto& error : validator.iterErrors(instance)) {
        co_yield humanize(error);
    }
}

auto humanizeError(const ValidationError& error) -> std::string {
    return HumanErrors::defaults().humanize(error);
}

}  // namespace jsv::schema
