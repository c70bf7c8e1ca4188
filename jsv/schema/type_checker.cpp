/*
 * type_checker.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-13

Description: Immutable mapping from JSON Schema type names to predicates

**************************************************/

#include "type_checker.hpp"

#include "jsv/schema/exceptions.hpp"
#include "jsv/schema/utils.hpp"

namespace jsv::schema {

namespace {
auto isArray(const TypeChecker&, const json& instance) -> bool {
    return instance.is_array();
}
auto isBoolean(const TypeChecker&, const json& instance) -> bool {
    return instance.is_boolean();
}
auto isNull(const TypeChecker&, const json& instance) -> bool {
    return instance.is_null();
}
auto isNumber(const TypeChecker&, const json& instance) -> bool {
    return instance.is_number();
}
auto isObject(const TypeChecker&, const json& instance) -> bool {
    return instance.is_object();
}
auto isString(const TypeChecker&, const json& instance) -> bool {
    return instance.is_string();
}
auto isStrictInteger(const TypeChecker&, const json& instance) -> bool {
    return instance.is_number_integer();
}
auto isIntegralNumber(const TypeChecker&, const json& instance) -> bool {
    return instance.is_number() && utils::isIntegral(instance);
}
auto isAny(const TypeChecker&, const json&) -> bool { return true; }
}  // namespace

TypeChecker::TypeChecker() : checkers_(std::make_shared<const Checkers>()) {}

TypeChecker::TypeChecker(Checkers checkers)
    : checkers_(std::make_shared<const Checkers>(std::move(checkers))) {}

auto TypeChecker::isType(const json& instance, std::string_view type) const
    -> bool {
    auto it = checkers_->find(type);
    if (it == checkers_->end()) {
        THROW_UNDEFINED_TYPE_CHECK(std::string(type));
    }
    return it->second(*this, instance);
}

auto TypeChecker::isKnown(std::string_view type) const -> bool {
    return checkers_->find(type) != checkers_->end();
}

auto TypeChecker::types() const -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(checkers_->size());
    for (const auto& [name, predicate] : *checkers_) {
        names.push_back(name);
    }
    return names;
}

auto TypeChecker::redefine(std::string type, Predicate predicate) const
    -> TypeChecker {
    Checkers checkers = *checkers_;
    checkers.insert_or_assign(std::move(type), std::move(predicate));
    return TypeChecker(std::move(checkers));
}

auto TypeChecker::redefineMany(const Checkers& checkers) const
    -> TypeChecker {
    Checkers merged = *checkers_;
    for (const auto& [name, predicate] : checkers) {
        merged.insert_or_assign(name, predicate);
    }
    return TypeChecker(std::move(merged));
}

auto TypeChecker::remove(std::string_view type) const -> TypeChecker {
    Checkers checkers = *checkers_;
    auto it = checkers.find(type);
    if (it == checkers.end()) {
        THROW_UNDEFINED_TYPE_CHECK(std::string(type));
    }
    checkers.erase(it);
    return TypeChecker(std::move(checkers));
}

auto draft3TypeChecker() -> const TypeChecker& {
    static const TypeChecker kChecker(TypeChecker::Checkers{
        {"any", isAny},
        {"array", isArray},
        {"boolean", isBoolean},
        {"integer", isStrictInteger},
        {"object", isObject},
        {"null", isNull},
        {"number", isNumber},
        {"string", isString},
    });
    return kChecker;
}

auto draft4TypeChecker() -> const TypeChecker& {
    static const TypeChecker kChecker = draft3TypeChecker().remove("any");
    return kChecker;
}

auto draft6TypeChecker() -> const TypeChecker& {
    static const TypeChecker kChecker =
        draft4TypeChecker().redefine("integer", isIntegralNumber);
    return kChecker;
}

}  // namespace jsv::schema
