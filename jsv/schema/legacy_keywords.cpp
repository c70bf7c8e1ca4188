/*
 * legacy_keywords.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-19

Description: Keywords whose semantics changed after drafts 3 and 4

**************************************************/

#include "keywords.hpp"

#include <cstddef>
#include <iterator>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "jsv/schema/exceptions.hpp"
#include "jsv/schema/utils.hpp"
#include "jsv/schema/validator.hpp"

namespace jsv::schema::keywords {

using utils::repr;

namespace {
auto asList(const json& value) -> json {
    return value.is_array() ? value : json::array({value});
}

auto isExclusive(const json& schema, const char* keyword) -> bool {
    auto it = schema.find(keyword);
    return it != schema.end() && it->is_boolean() && it->get<bool>();
}

/// Whether @p instance matches one entry of a draft 3 type list.
auto matchesType(Evaluator& ev, const json& type, const json& instance,
                 const json& schema) -> bool {
    if (type.is_object()) {
        return ev.isValid(instance, type);
    }
    if (!type.is_string()) {
        return false;
    }
    const auto& name = type.get_ref<const std::string&>();
    if (!ev.dialect().typeChecker.isKnown(name)) {
        THROW_UNKNOWN_TYPE(name, instance, schema);
    }
    return ev.isType(instance, name);
}
}  // namespace

auto minimumDraft4(Evaluator& ev, const json& value, const json& instance,
                   const json& schema) -> ErrorStream {
    if (!ev.isType(instance, "number") || !value.is_number()) {
        co_return;
    }
    const int order = utils::compareNumbers(instance, value);
    if (isExclusive(schema, "exclusiveMinimum")) {
        if (order <= 0) {
            co_yield ValidationError(
                repr(instance) + " is less than or equal to the minimum of " +
                repr(value));
        }
    } else if (order < 0) {
        co_yield ValidationError(repr(instance) +
                                 " is less than the minimum of " + repr(value));
    }
}

auto maximumDraft4(Evaluator& ev, const json& value, const json& instance,
                   const json& schema) -> ErrorStream {
    if (!ev.isType(instance, "number") || !value.is_number()) {
        co_return;
    }
    const int order = utils::compareNumbers(instance, value);
    if (isExclusive(schema, "exclusiveMaximum")) {
        if (order >= 0) {
            co_yield ValidationError(
                repr(instance) +
                " is greater than or equal to the maximum of " + repr(value));
        }
    } else if (order > 0) {
        co_yield ValidationError(repr(instance) +
                                 " is greater than the maximum of " +
                                 repr(value));
    }
}

auto typeDraft3(Evaluator& ev, const json& value, const json& instance,
                const json& schema) -> ErrorStream {
    const json types = asList(value);
    std::vector<ValidationError> context;
    for (std::size_t index = 0; index < types.size(); ++index) {
        const json& type = types[index];
        if (type.is_object()) {
            std::vector<ValidationError> errors;
            for (auto& error :
                 ev.descend(instance, type, std::nullopt, index)) {
                errors.push_back(std::move(error));
            }
            if (errors.empty()) {
                co_return;
            }
            std::move(errors.begin(), errors.end(),
                      std::back_inserter(context));
        } else if (matchesType(ev, type, instance, schema)) {
            co_return;
        }
    }

    std::string names;
    for (const auto& type : types) {
        if (!names.empty()) {
            names += ", ";
        }
        names += repr(type);
    }
    co_yield ValidationError(repr(instance) + " is not of type " + names,
                             std::move(context));
}

auto propertiesDraft3(Evaluator& ev, const json& value, const json& instance,
                      const json& schema) -> ErrorStream {
    Annotations& ann = ev.annotations();
    if (!ev.isType(instance, "object") || !value.is_object()) {
        co_return;
    }
    for (auto it = value.cbegin(); it != value.cend(); ++it) {
        const json& subschema = it.value();
        if (auto found = instance.find(it.key()); found != instance.end()) {
            ann.properties.insert(it.key());
            for (auto& error :
                 ev.descend(*found, subschema, it.key(), it.key())) {
                co_yield std::move(error);
            }
            continue;
        }
        if (!subschema.is_object()) {
            continue;
        }
        auto flag = subschema.find("required");
        if (flag != subschema.end() && flag->is_boolean() &&
            flag->get<bool>()) {
            ValidationError error(repr(json(it.key())) +
                                  " is a required property");
            error.setDetails("required", *flag, instance, schema);
            error.schemaPath.push_back(it.key());
            error.schemaPath.push_back("required");
            co_yield std::move(error);
        }
    }
}

auto disallowDraft3(Evaluator& ev, const json& value, const json& instance,
                    const json& schema) -> ErrorStream {
    for (const auto& disallowed : asList(value)) {
        if (matchesType(ev, disallowed, instance, schema)) {
            co_yield ValidationError(repr(instance) + " is disallowed for " +
                                     repr(disallowed));
        }
    }
}

auto extendsDraft3(Evaluator& ev, const json& value, const json& instance,
                   const json& /*schema*/) -> ErrorStream {
    Annotations& ann = ev.annotations();
    if (value.is_object()) {
        for (auto& error :
             ev.descend(instance, value, std::nullopt, std::nullopt, &ann)) {
            co_yield std::move(error);
        }
        co_return;
    }
    if (!value.is_array()) {
        co_return;
    }
    for (std::size_t index = 0; index < value.size(); ++index) {
        for (auto& error :
             ev.descend(instance, value[index], std::nullopt, index, &ann)) {
            co_yield std::move(error);
        }
    }
}

}  // namespace jsv::schema::keywords
