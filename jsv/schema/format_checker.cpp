/*
 * format_checker.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-13

Description: Registry of pluggable "format" predicates

**************************************************/

#include "format_checker.hpp"

#include <spdlog/spdlog.h>

#include "jsv/error/exception.hpp"
#include "jsv/schema/exceptions.hpp"
#include "jsv/schema/utils.hpp"

namespace jsv::schema {

auto FormatChecker::raisesAny() -> Raises {
    return [](const std::exception&) { return true; };
}

void FormatChecker::registerFormat(std::string format, Predicate predicate,
                                   Raises raises) {
    if (!predicate) {
        THROW_INVALID_ARGUMENT("Empty predicate for format '", format, "'");
    }
    checkers_.insert_or_assign(std::move(format),
                               Entry{std::move(predicate), std::move(raises)});
}

auto FormatChecker::hasFormat(std::string_view format) const -> bool {
    return checkers_.find(format) != checkers_.end();
}

auto FormatChecker::formats() const -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(checkers_.size());
    for (const auto& [name, entry] : checkers_) {
        names.push_back(name);
    }
    return names;
}

auto FormatChecker::test(const json& instance, std::string_view format,
                         std::exception_ptr& cause) const -> bool {
    auto it = checkers_.find(format);
    if (it == checkers_.end()) {
        return true;
    }
    if (!it->second.raises) {
        return it->second.predicate(instance);
    }
    try {
        return it->second.predicate(instance);
    } catch (const std::exception& e) {
        if (!it->second.raises(e)) {
            throw;
        }
        spdlog::warn("Format checker for '{}' raised: {}", it->first,
                     e.what());
        cause = std::current_exception();
        return false;
    }
}

void FormatChecker::check(const json& instance,
                          std::string_view format) const {
    std::exception_ptr cause;
    if (!test(instance, format, cause)) {
        THROW_FORMAT_ERROR(utils::repr(instance) + " is not a " +
                               utils::repr(json(std::string(format))),
                           cause);
    }
}

auto FormatChecker::conforms(const json& instance,
                             std::string_view format) const -> bool {
    std::exception_ptr cause;
    return test(instance, format, cause);
}

}  // namespace jsv::schema
