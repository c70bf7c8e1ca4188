/*
 * keywords.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-18

Description: Keyword validation functions installed by the dialects

**************************************************/

#include "keywords.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "jsv/schema/exceptions.hpp"
#include "jsv/schema/utils.hpp"
#include "jsv/schema/validator.hpp"

namespace jsv::schema::keywords {

using utils::repr;

namespace {
/**
 * @brief Process-wide cache of compiled "pattern" and "patternProperties"
 * expressions.
 */
class RegexCache {
public:
    static auto instance() -> RegexCache& {
        static RegexCache cache;
        return cache;
    }

    /// @throws std::regex_error for invalid patterns.
    auto get(const std::string& pattern) -> std::shared_ptr<const std::regex> {
        {
            std::shared_lock lock(mutex_);
            if (auto it = cache_.find(pattern); it != cache_.end()) {
                return it->second;
            }
        }
        auto compiled =
            std::make_shared<const std::regex>(pattern, std::regex::ECMAScript);
        std::unique_lock lock(mutex_);
        return cache_.try_emplace(pattern, std::move(compiled)).first->second;
    }

private:
    std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<const std::regex>> cache_;
};

auto compileRegex(const std::string& pattern, std::exception_ptr& failure)
    -> std::shared_ptr<const std::regex> {
    try {
        return RegexCache::instance().get(pattern);
    } catch (const std::regex_error& e) {
        spdlog::warn("Invalid regular expression {}: {}", pattern, e.what());
        failure = std::current_exception();
        return nullptr;
    }
}

auto invalidPattern(const std::string& pattern, std::exception_ptr cause)
    -> ValidationError {
    return ValidationError(
        repr(json(pattern)) + " is not a valid regular expression",
        std::move(cause));
}

auto collect(ErrorStream stream) -> std::vector<ValidationError> {
    std::vector<ValidationError> result;
    for (auto& error : stream) {
        result.push_back(std::move(error));
    }
    return result;
}

auto joinReprs(const json& values, std::size_t first = 0) -> std::string {
    std::string result;
    for (std::size_t i = first; i < values.size(); ++i) {
        if (!result.empty()) {
            result += ", ";
        }
        result += repr(values[i]);
    }
    return result;
}

auto lessThan(std::size_t count, const json& limit) -> bool {
    return limit.is_number() && utils::compareNumbers(json(count), limit) < 0;
}

auto greaterThan(std::size_t count, const json& limit) -> bool {
    return limit.is_number() && utils::compareNumbers(json(count), limit) > 0;
}

auto containsImpl(Evaluator& ev, Annotations& ann, const json& contains,
                  const json& instance, const json& schema, bool annotate)
    -> ErrorStream {
    json minContains = 1;
    std::optional<json> maxContains;
    if (auto it = schema.find("minContains");
        it != schema.end() && it->is_number() && utils::isIntegral(*it) &&
        utils::compareNumbers(*it, json(0)) >= 0) {
        minContains = *it;
    }
    if (auto it = schema.find("maxContains");
        it != schema.end() && it->is_number() && utils::isIntegral(*it) &&
        utils::compareNumbers(*it, json(0)) >= 0) {
        maxContains = *it;
    }

    std::size_t matches = 0;
    for (std::size_t index = 0; index < instance.size(); ++index) {
        if (ev.isValid(instance[index], contains)) {
            ++matches;
            if (annotate) {
                ann.items.insert(index);
            }
        }
    }

    if (matches == 0 && lessThan(0, minContains)) {
        co_yield ValidationError("None of " + repr(instance) +
                                 " are valid under the given schema");
    } else if (lessThan(matches, minContains)) {
        co_yield ValidationError(
            "Too few items match the given schema (expected at least " +
            repr(minContains) + " but only " + std::to_string(matches) +
            " matched)");
    }
    if (maxContains && greaterThan(matches, *maxContains)) {
        co_yield ValidationError(
            "Too many items match the given schema (expected at most " +
            repr(*maxContains) + ")");
    }
}

auto isFalse(const json& schema) -> bool {
    return schema.is_boolean() && !schema.get<bool>();
}
}  // namespace

auto ref(Evaluator& ev, const json& value, const json& instance,
         const json& /*schema*/) -> ErrorStream {
    Annotations& ann = ev.annotations();
    if (!value.is_string()) {
        co_return;
    }
    auto target = ev.resolver().lookup(value.get_ref<const std::string&>());
    for (auto& error : ev.descendReference(instance, std::move(target), &ann)) {
        co_yield std::move(error);
    }
}

auto dynamicRef(Evaluator& ev, const json& value, const json& instance,
                const json& /*schema*/) -> ErrorStream {
    Annotations& ann = ev.annotations();
    if (!value.is_string()) {
        co_return;
    }
    auto target =
        ev.resolver().lookupDynamic(value.get_ref<const std::string&>());
    for (auto& error : ev.descendReference(instance, std::move(target), &ann)) {
        co_yield std::move(error);
    }
}

auto recursiveRef(Evaluator& ev, const json& value, const json& instance,
                  const json& /*schema*/) -> ErrorStream {
    Annotations& ann = ev.annotations();
    if (!value.is_string()) {
        co_return;
    }
    auto target =
        ev.resolver().lookupRecursive(value.get_ref<const std::string&>());
    for (auto& error : ev.descendReference(instance, std::move(target), &ann)) {
        co_yield std::move(error);
    }
}

auto allOf(Evaluator& ev, const json& value, const json& instance,
           const json& /*schema*/) -> ErrorStream {
    Annotations& ann = ev.annotations();
    for (std::size_t index = 0; index < value.size(); ++index) {
        for (auto& error :
             ev.descend(instance, value[index], std::nullopt, index, &ann)) {
            co_yield std::move(error);
        }
    }
}

auto anyOf(Evaluator& ev, const json& value, const json& instance,
           const json& /*schema*/) -> ErrorStream {
    Annotations& ann = ev.annotations();
    std::vector<ValidationError> context;
    std::optional<std::size_t> matched;
    for (std::size_t index = 0; index < value.size(); ++index) {
        auto errors =
            collect(ev.descend(instance, value[index], std::nullopt, index,
                               &ann));
        if (errors.empty()) {
            matched = index;
            break;
        }
        std::move(errors.begin(), errors.end(), std::back_inserter(context));
    }
    if (!matched) {
        co_yield ValidationError(
            repr(instance) + " is not valid under any of the given schemas",
            std::move(context));
        co_return;
    }
    // Later branches may still claim properties or items.
    if (ev.tracksAnnotations()) {
        for (std::size_t index = *matched + 1; index < value.size(); ++index) {
            ev.annotate(instance, value[index], &ann);
        }
    }
}

auto oneOf(Evaluator& ev, const json& value, const json& instance,
           const json& /*schema*/) -> ErrorStream {
    Annotations& ann = ev.annotations();
    std::vector<ValidationError> context;
    Annotations branch;
    std::optional<std::size_t> first;
    for (std::size_t index = 0; index < value.size(); ++index) {
        auto errors =
            collect(ev.descend(instance, value[index], std::nullopt, index,
                               &branch));
        if (errors.empty()) {
            first = index;
            break;
        }
        std::move(errors.begin(), errors.end(), std::back_inserter(context));
    }
    if (!first) {
        co_yield ValidationError(
            repr(instance) + " is not valid under any of the given schemas",
            std::move(context));
        co_return;
    }

    std::string matching = repr(value[*first]);
    bool ambiguous = false;
    for (std::size_t index = *first + 1; index < value.size(); ++index) {
        if (ev.isValid(instance, value[index])) {
            ambiguous = true;
            matching += ", " + repr(value[index]);
        }
    }
    if (ambiguous) {
        co_yield ValidationError(repr(instance) + " is valid under each of " +
                                 matching);
        co_return;
    }
    ann.merge(branch);
}

auto notKeyword(Evaluator& ev, const json& value, const json& instance,
                const json& /*schema*/) -> ErrorStream {
    if (ev.isValid(instance, value)) {
        co_yield ValidationError(repr(value) + " is not allowed for " +
                                 repr(instance));
    }
}

auto ifThenElse(Evaluator& ev, const json& value, const json& instance,
                const json& schema) -> ErrorStream {
    Annotations& ann = ev.annotations();
    Annotations condition;
    if (ev.isValid(instance, value, &condition)) {
        ann.merge(condition);
        if (auto it = schema.find("then"); it != schema.end()) {
            for (auto& error :
                 ev.descend(instance, *it, std::nullopt, "then", &ann)) {
                co_yield std::move(error);
            }
        }
    } else if (auto it = schema.find("else"); it != schema.end()) {
        for (auto& error :
             ev.descend(instance, *it, std::nullopt, "else", &ann)) {
            co_yield std::move(error);
        }
    }
}

auto dependentSchemas(Evaluator& ev, const json& value, const json& instance,
                      const json& /*schema*/) -> ErrorStream {
    Annotations& ann = ev.annotations();
    if (!ev.isType(instance, "object") || !value.is_object()) {
        co_return;
    }
    for (auto it = value.cbegin(); it != value.cend(); ++it) {
        if (!instance.contains(it.key())) {
            continue;
        }
        for (auto& error :
             ev.descend(instance, it.value(), std::nullopt, it.key(), &ann)) {
            co_yield std::move(error);
        }
    }
}

auto properties(Evaluator& ev, const json& value, const json& instance,
                const json& /*schema*/) -> ErrorStream {
    Annotations& ann = ev.annotations();
    if (!ev.isType(instance, "object") || !value.is_object()) {
        co_return;
    }
    for (auto it = value.cbegin(); it != value.cend(); ++it) {
        auto found = instance.find(it.key());
        if (found == instance.end()) {
            continue;
        }
        ann.properties.insert(it.key());
        for (auto& error : ev.descend(*found, it.value(), it.key(), it.key())) {
            co_yield std::move(error);
        }
    }
}

auto patternProperties(Evaluator& ev, const json& value, const json& instance,
                       const json& /*schema*/) -> ErrorStream {
    Annotations& ann = ev.annotations();
    if (!ev.isType(instance, "object") || !value.is_object()) {
        co_return;
    }
    for (auto it = value.cbegin(); it != value.cend(); ++it) {
        std::exception_ptr failure;
        auto regex = compileRegex(it.key(), failure);
        if (!regex) {
            co_yield invalidPattern(it.key(), failure);
            continue;
        }
        for (auto member = instance.cbegin(); member != instance.cend();
             ++member) {
            if (!std::regex_search(member.key(), *regex)) {
                continue;
            }
            ann.properties.insert(member.key());
            for (auto& error : ev.descend(member.value(), it.value(),
                                          member.key(), it.key())) {
                co_yield std::move(error);
            }
        }
    }
}

namespace {
auto findAdditionalProperties(const json& instance, const json& schema)
    -> std::vector<std::string> {
    const json* declared = nullptr;
    if (auto it = schema.find("properties");
        it != schema.end() && it->is_object()) {
        declared = &*it;
    }
    std::vector<std::shared_ptr<const std::regex>> patterns;
    if (auto it = schema.find("patternProperties");
        it != schema.end() && it->is_object()) {
        for (auto pattern = it->cbegin(); pattern != it->cend(); ++pattern) {
            std::exception_ptr failure;
            if (auto regex = compileRegex(pattern.key(), failure)) {
                patterns.push_back(std::move(regex));
            }
        }
    }

    std::vector<std::string> extras;
    for (auto member = instance.cbegin(); member != instance.cend();
         ++member) {
        const std::string& name = member.key();
        if (declared != nullptr && declared->contains(name)) {
            continue;
        }
        bool matched = std::any_of(
            patterns.begin(), patterns.end(),
            [&](const auto& regex) { return std::regex_search(name, *regex); });
        if (!matched) {
            extras.push_back(name);
        }
    }
    return extras;
}

auto quoted(const std::vector<std::string>& names) -> std::vector<json> {
    return std::vector<json>(names.begin(), names.end());
}
}  // namespace

auto additionalProperties(Evaluator& ev, const json& value,
                          const json& instance, const json& schema)
    -> ErrorStream {
    Annotations& ann = ev.annotations();
    if (!ev.isType(instance, "object")) {
        co_return;
    }
    auto extras = findAdditionalProperties(instance, schema);
    if (value.is_object()) {
        for (const auto& extra : extras) {
            ann.properties.insert(extra);
            for (auto& error : ev.descend(instance.at(extra), value, extra)) {
                co_yield std::move(error);
            }
        }
    } else if (isFalse(value)) {
        if (extras.empty()) {
            co_return;
        }
        if (auto it = schema.find("patternProperties");
            it != schema.end() && it->is_object() && !it->empty()) {
            std::string patterns;
            for (auto pattern = it->cbegin(); pattern != it->cend();
                 ++pattern) {
                if (!patterns.empty()) {
                    patterns += ", ";
                }
                patterns += repr(json(pattern.key()));
            }
            std::string names;
            for (const auto& extra : extras) {
                if (!names.empty()) {
                    names += ", ";
                }
                names += repr(json(extra));
            }
            co_yield ValidationError(
                names + (extras.size() == 1 ? " does" : " do") +
                " not match any of the regexes: " + patterns);
        } else {
            co_yield ValidationError(
                "Additional properties are not allowed (" +
                utils::extrasMessage(quoted(extras)) + " unexpected)");
        }
    } else {
        ann.properties.insert(extras.begin(), extras.end());
    }
}

auto unevaluatedProperties(Evaluator& ev, const json& value,
                           const json& instance, const json& /*schema*/)
    -> ErrorStream {
    Annotations& ann = ev.annotations();
    if (!ev.isType(instance, "object")) {
        co_return;
    }
    std::vector<std::string> unevaluated;
    for (auto member = instance.cbegin(); member != instance.cend();
         ++member) {
        if (!ann.properties.contains(member.key())) {
            unevaluated.push_back(member.key());
        }
    }
    if (isFalse(value)) {
        if (!unevaluated.empty()) {
            co_yield ValidationError(
                "Unevaluated properties are not allowed (" +
                utils::extrasMessage(quoted(unevaluated)) + " unexpected)");
        }
        co_return;
    }
    for (const auto& name : unevaluated) {
        ann.properties.insert(name);
        for (auto& error : ev.descend(instance.at(name), value, name)) {
            co_yield std::move(error);
        }
    }
}

auto propertyNames(Evaluator& ev, const json& value, const json& instance,
                   const json& /*schema*/) -> ErrorStream {
    if (!ev.isType(instance, "object")) {
        co_return;
    }
    json name;
    for (auto member = instance.cbegin(); member != instance.cend();
         ++member) {
        name = member.key();
        for (auto& error : ev.descend(name, value)) {
            co_yield std::move(error);
        }
    }
}

auto required(Evaluator& ev, const json& value, const json& instance,
              const json& /*schema*/) -> ErrorStream {
    if (!ev.isType(instance, "object") || !value.is_array()) {
        co_return;
    }
    for (const auto& property : value) {
        if (property.is_string() &&
            !instance.contains(property.get_ref<const std::string&>())) {
            co_yield ValidationError(repr(property) +
                                     " is a required property");
        }
    }
}

auto dependentRequired(Evaluator& ev, const json& value, const json& instance,
                       const json& /*schema*/) -> ErrorStream {
    if (!ev.isType(instance, "object") || !value.is_object()) {
        co_return;
    }
    for (auto it = value.cbegin(); it != value.cend(); ++it) {
        if (!instance.contains(it.key()) || !it->is_array()) {
            continue;
        }
        for (const auto& each : *it) {
            if (each.is_string() &&
                !instance.contains(each.get_ref<const std::string&>())) {
                co_yield ValidationError(repr(each) + " is a dependency of " +
                                         repr(json(it.key())));
            }
        }
    }
}

auto dependencies(Evaluator& ev, const json& value, const json& instance,
                  const json& /*schema*/) -> ErrorStream {
    Annotations& ann = ev.annotations();
    if (!ev.isType(instance, "object") || !value.is_object()) {
        co_return;
    }
    for (auto it = value.cbegin(); it != value.cend(); ++it) {
        if (!instance.contains(it.key())) {
            continue;
        }
        const json& dependency = it.value();
        if (dependency.is_array() || dependency.is_string()) {
            // A lone string is the draft 3 spelling of a one-element array.
            const json names = dependency.is_array()
                                   ? dependency
                                   : json::array({dependency});
            for (const auto& each : names) {
                if (each.is_string() &&
                    !instance.contains(each.get_ref<const std::string&>())) {
                    co_yield ValidationError(repr(each) +
                                             " is a dependency of " +
                                             repr(json(it.key())));
                }
            }
            continue;
        }
        for (auto& error :
             ev.descend(instance, dependency, std::nullopt, it.key(), &ann)) {
            co_yield std::move(error);
        }
    }
}

auto minProperties(Evaluator& ev, const json& value, const json& instance,
                   const json& /*schema*/) -> ErrorStream {
    if (ev.isType(instance, "object") && lessThan(instance.size(), value)) {
        co_yield ValidationError(repr(instance) +
                                 " does not have enough properties");
    }
}

auto maxProperties(Evaluator& ev, const json& value, const json& instance,
                   const json& /*schema*/) -> ErrorStream {
    if (ev.isType(instance, "object") && greaterThan(instance.size(), value)) {
        co_yield ValidationError(repr(instance) + " has too many properties");
    }
}

auto prefixItems(Evaluator& ev, const json& value, const json& instance,
                 const json& /*schema*/) -> ErrorStream {
    Annotations& ann = ev.annotations();
    if (!ev.isType(instance, "array") || !value.is_array()) {
        co_return;
    }
    const std::size_t count = std::min(instance.size(), value.size());
    for (std::size_t index = 0; index < count; ++index) {
        ann.items.insert(index);
        for (auto& error :
             ev.descend(instance[index], value[index], index, index)) {
            co_yield std::move(error);
        }
    }
}

auto items(Evaluator& ev, const json& value, const json& instance,
           const json& schema) -> ErrorStream {
    Annotations& ann = ev.annotations();
    if (!ev.isType(instance, "array")) {
        co_return;
    }
    std::size_t prefix = 0;
    if (auto it = schema.find("prefixItems");
        it != schema.end() && it->is_array()) {
        prefix = it->size();
    }
    if (isFalse(value)) {
        if (instance.size() > prefix) {
            co_yield ValidationError(
                "Expected at most " + std::to_string(prefix) +
                " items but found " + std::to_string(instance.size() - prefix) +
                " extra: " + joinReprs(instance, prefix));
        }
        co_return;
    }
    for (std::size_t index = prefix; index < instance.size(); ++index) {
        ann.items.insert(index);
        for (auto& error : ev.descend(instance[index], value, index)) {
            co_yield std::move(error);
        }
    }
}

auto itemsLegacy(Evaluator& ev, const json& value, const json& instance,
                 const json& /*schema*/) -> ErrorStream {
    Annotations& ann = ev.annotations();
    if (!ev.isType(instance, "array")) {
        co_return;
    }
    if (value.is_array()) {
        const std::size_t count = std::min(instance.size(), value.size());
        for (std::size_t index = 0; index < count; ++index) {
            ann.items.insert(index);
            for (auto& error :
                 ev.descend(instance[index], value[index], index, index)) {
                co_yield std::move(error);
            }
        }
        co_return;
    }
    for (std::size_t index = 0; index < instance.size(); ++index) {
        ann.items.insert(index);
        for (auto& error : ev.descend(instance[index], value, index)) {
            co_yield std::move(error);
        }
    }
}

auto additionalItems(Evaluator& ev, const json& value, const json& instance,
                     const json& schema) -> ErrorStream {
    Annotations& ann = ev.annotations();
    if (!ev.isType(instance, "array")) {
        co_return;
    }
    auto tuple = schema.find("items");
    if (tuple == schema.end() || !tuple->is_array()) {
        co_return;
    }
    const std::size_t declared = tuple->size();
    if (instance.size() <= declared) {
        co_return;
    }
    if (isFalse(value)) {
        std::vector<json> extras(
            instance.begin() + static_cast<std::ptrdiff_t>(declared),
            instance.end());
        co_yield ValidationError("Additional items are not allowed (" +
                                 utils::extrasMessage(extras) +
                                 " unexpected)");
        co_return;
    }
    for (std::size_t index = declared; index < instance.size(); ++index) {
        ann.items.insert(index);
        for (auto& error : ev.descend(instance[index], value, index)) {
            co_yield std::move(error);
        }
    }
}

auto unevaluatedItems(Evaluator& ev, const json& value, const json& instance,
                      const json& /*schema*/) -> ErrorStream {
    Annotations& ann = ev.annotations();
    if (!ev.isType(instance, "array")) {
        co_return;
    }
    std::vector<std::size_t> unevaluated;
    for (std::size_t index = 0; index < instance.size(); ++index) {
        if (!ann.items.contains(index)) {
            unevaluated.push_back(index);
        }
    }
    if (isFalse(value)) {
        if (!unevaluated.empty()) {
            std::vector<json> extras;
            for (auto index : unevaluated) {
                extras.push_back(instance[index]);
            }
            co_yield ValidationError("Unevaluated items are not allowed (" +
                                     utils::extrasMessage(extras) +
                                     " unexpected)");
        }
        co_return;
    }
    for (auto index : unevaluated) {
        ann.items.insert(index);
        for (auto& error : ev.descend(instance[index], value, index)) {
            co_yield std::move(error);
        }
    }
}

auto contains(Evaluator& ev, const json& value, const json& instance,
              const json& schema) -> ErrorStream {
    Annotations& ann = ev.annotations();
    if (!ev.isType(instance, "array")) {
        co_return;
    }
    for (auto& error : containsImpl(ev, ann, value, instance, schema, true)) {
        co_yield std::move(error);
    }
}

auto containsDraft201909(Evaluator& ev, const json& value,
                         const json& instance, const json& schema)
    -> ErrorStream {
    Annotations& ann = ev.annotations();
    if (!ev.isType(instance, "array")) {
        co_return;
    }
    for (auto& error : containsImpl(ev, ann, value, instance, schema, false)) {
        co_yield std::move(error);
    }
}

auto containsDraft6(Evaluator& ev, const json& value, const json& instance,
                    const json& /*schema*/) -> ErrorStream {
    if (!ev.isType(instance, "array")) {
        co_return;
    }
    bool found = std::any_of(instance.begin(), instance.end(),
                             [&](const json& element) {
                                 return ev.isValid(element, value);
                             });
    if (!found) {
        co_yield ValidationError("None of " + repr(instance) +
                                 " are valid under the given schema");
    }
}

auto minItems(Evaluator& ev, const json& value, const json& instance,
              const json& /*schema*/) -> ErrorStream {
    if (ev.isType(instance, "array") && lessThan(instance.size(), value)) {
        co_yield ValidationError(repr(instance) + " is too short");
    }
}

auto maxItems(Evaluator& ev, const json& value, const json& instance,
              const json& /*schema*/) -> ErrorStream {
    if (ev.isType(instance, "array") && greaterThan(instance.size(), value)) {
        co_yield ValidationError(repr(instance) + " is too long");
    }
}

auto uniqueItems(Evaluator& ev, const json& value, const json& instance,
                 const json& /*schema*/) -> ErrorStream {
    if (value.is_boolean() && value.get<bool>() &&
        ev.isType(instance, "array") && !utils::uniq(instance)) {
        co_yield ValidationError(repr(instance) + " has non-unique elements");
    }
}

auto type(Evaluator& ev, const json& value, const json& instance,
          const json& schema) -> ErrorStream {
    const json types = value.is_array() ? value : json::array({value});
    const TypeChecker& checker = ev.dialect().typeChecker;
    bool matched = false;
    for (const auto& name : types) {
        if (!name.is_string()) {
            continue;
        }
        const auto& typeName = name.get_ref<const std::string&>();
        if (!checker.isKnown(typeName)) {
            THROW_UNKNOWN_TYPE(typeName, instance, schema);
        }
        if (checker.isType(instance, typeName)) {
            matched = true;
            break;
        }
    }
    if (!matched) {
        co_yield ValidationError(repr(instance) + " is not of type " +
                                 joinReprs(types));
    }
}

auto enumeration(Evaluator& /*ev*/, const json& value, const json& instance,
                 const json& /*schema*/) -> ErrorStream {
    bool found = false;
    if (value.is_array()) {
        found = std::any_of(value.begin(), value.end(), [&](const json& each) {
            return utils::equal(instance, each);
        });
    } else {
        found = utils::equal(instance, value);
    }
    if (!found) {
        co_yield ValidationError(repr(instance) + " is not one of " +
                                 repr(value));
    }
}

auto constant(Evaluator& /*ev*/, const json& value, const json& instance,
              const json& /*schema*/) -> ErrorStream {
    if (!utils::equal(instance, value)) {
        co_yield ValidationError(repr(value) + " was expected");
    }
}

auto format(Evaluator& ev, const json& value, const json& instance,
            const json& /*schema*/) -> ErrorStream {
    const FormatChecker* checker = ev.formatChecker();
    if (checker == nullptr || !value.is_string()) {
        co_return;
    }
    const auto& name = value.get_ref<const std::string&>();
    std::exception_ptr cause;
    if (!checker->test(instance, name, cause)) {
        co_yield ValidationError(repr(instance) + " is not a " + repr(value),
                                 cause);
    }
}

auto minimum(Evaluator& ev, const json& value, const json& instance,
             const json& /*schema*/) -> ErrorStream {
    if (ev.isType(instance, "number") && value.is_number() &&
        utils::compareNumbers(instance, value) < 0) {
        co_yield ValidationError(repr(instance) +
                                 " is less than the minimum of " + repr(value));
    }
}

auto maximum(Evaluator& ev, const json& value, const json& instance,
             const json& /*schema*/) -> ErrorStream {
    if (ev.isType(instance, "number") && value.is_number() &&
        utils::compareNumbers(instance, value) > 0) {
        co_yield ValidationError(repr(instance) +
                                 " is greater than the maximum of " +
                                 repr(value));
    }
}

auto exclusiveMinimum(Evaluator& ev, const json& value, const json& instance,
                      const json& /*schema*/) -> ErrorStream {
    if (ev.isType(instance, "number") && value.is_number() &&
        utils::compareNumbers(instance, value) <= 0) {
        co_yield ValidationError(repr(instance) +
                                 " is less than or equal to the minimum of " +
                                 repr(value));
    }
}

auto exclusiveMaximum(Evaluator& ev, const json& value, const json& instance,
                      const json& /*schema*/) -> ErrorStream {
    if (ev.isType(instance, "number") && value.is_number() &&
        utils::compareNumbers(instance, value) >= 0) {
        co_yield ValidationError(
            repr(instance) + " is greater than or equal to the maximum of " +
            repr(value));
    }
}

auto multipleOf(Evaluator& ev, const json& value, const json& instance,
                const json& /*schema*/) -> ErrorStream {
    if (ev.isType(instance, "number") && value.is_number() &&
        !utils::isMultipleOf(instance, value)) {
        co_yield ValidationError(repr(instance) + " is not a multiple of " +
                                 repr(value));
    }
}

auto minLength(Evaluator& ev, const json& value, const json& instance,
               const json& /*schema*/) -> ErrorStream {
    if (ev.isType(instance, "string") &&
        lessThan(utils::utf8Length(instance.get_ref<const std::string&>()),
                 value)) {
        co_yield ValidationError(repr(instance) + " is too short");
    }
}

auto maxLength(Evaluator& ev, const json& value, const json& instance,
               const json& /*schema*/) -> ErrorStream {
    if (ev.isType(instance, "string") &&
        greaterThan(utils::utf8Length(instance.get_ref<const std::string&>()),
                    value)) {
        co_yield ValidationError(repr(instance) + " is too long");
    }
}

auto pattern(Evaluator& ev, const json& value, const json& instance,
             const json& /*schema*/) -> ErrorStream {
    if (!ev.isType(instance, "string") || !value.is_string()) {
        co_return;
    }
    const auto& expression = value.get_ref<const std::string&>();
    std::exception_ptr failure;
    auto regex = compileRegex(expression, failure);
    if (!regex) {
        co_yield invalidPattern(expression, failure);
        co_return;
    }
    if (!std::regex_search(instance.get_ref<const std::string&>(), *regex)) {
        co_yield ValidationError(repr(instance) + " does not match " +
                                 repr(value));
    }
}

}  // namespace jsv::schema::keywords
