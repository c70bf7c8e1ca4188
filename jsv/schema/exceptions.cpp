/*
 * exceptions.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-12

Description: Exceptions raised by schema compilation and evaluation

**************************************************/

#include "exceptions.hpp"

#include "jsv/schema/error_tree.hpp"

namespace jsv::schema {

namespace {
auto summarize(const std::vector<ValidationError>& errors) -> std::string {
    if (auto best = bestMatch(errors)) {
        return best->message;
    }
    return "schema is invalid";
}
}  // namespace

SchemaError::SchemaError(const char* file, int line, const char* func,
                         std::vector<ValidationError> errors)
    : Exception(file, line, func, summarize(errors)),
      errors_(std::move(errors)) {
    if (auto best = bestMatch(errors_)) {
        best_ = std::move(*best);
    }
}

auto SchemaError::error() const -> const ValidationError& { return best_; }

auto SchemaError::errors() const -> const std::vector<ValidationError>& {
    return errors_;
}

ValidationException::ValidationException(const char* file, int line,
                                         const char* func,
                                         ValidationError error)
    : Exception(file, line, func, error.message), error_(std::move(error)) {}

auto ValidationException::error() const -> const ValidationError& {
    return error_;
}

UnresolvableReference::UnresolvableReference(const char* file, int line,
                                             const char* func,
                                             std::string reference,
                                             const std::string& reason)
    : Exception(file, line, func, "Unresolvable reference '", reference,
                "': ", reason),
      reference_(std::move(reference)) {}

auto UnresolvableReference::reference() const -> const std::string& {
    return reference_;
}

UnknownType::UnknownType(const char* file, int line, const char* func,
                         std::string type, json instance, json schema)
    : Exception(file, line, func, "Unknown type '", type,
                "' for validator with schema: ",
                schema.dump(-1, ' ', false, json::error_handler_t::replace)),
      type_(std::move(type)),
      instance_(std::move(instance)),
      schema_(std::move(schema)) {}

auto UnknownType::type() const -> const std::string& { return type_; }
auto UnknownType::instance() const -> const json& { return instance_; }
auto UnknownType::schema() const -> const json& { return schema_; }

UndefinedTypeCheck::UndefinedTypeCheck(const char* file, int line,
                                       const char* func, std::string type)
    : Exception(file, line, func, "Type '", type,
                "' is unknown to this type checker"),
      type_(std::move(type)) {}

auto UndefinedTypeCheck::type() const -> const std::string& { return type_; }

FormatError::FormatError(const char* file, int line, const char* func,
                         const std::string& message, std::exception_ptr cause)
    : Exception(file, line, func, message), cause_(std::move(cause)) {}

auto FormatError::cause() const -> std::exception_ptr { return cause_; }

}  // namespace jsv::schema
