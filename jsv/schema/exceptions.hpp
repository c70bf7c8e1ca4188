/*
 * exceptions.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-12

Description: Exceptions raised by schema compilation and evaluation

**************************************************/

#ifndef JSV_SCHEMA_EXCEPTIONS_HPP
#define JSV_SCHEMA_EXCEPTIONS_HPP

#include <exception>
#include <string>
#include <vector>

#include "jsv/error/exception.hpp"
#include "jsv/schema/errors.hpp"

namespace jsv::schema {

/**
 * @brief A schema failed validation against its meta-schema.
 */
class SchemaError : public error::Exception {
public:
    SchemaError(const char* file, int line, const char* func,
                std::vector<ValidationError> errors);

    /// The most relevant failure.
    [[nodiscard]] auto error() const -> const ValidationError&;

    [[nodiscard]] auto errors() const -> const std::vector<ValidationError>&;

private:
    std::vector<ValidationError> errors_;
    ValidationError best_;
};

/**
 * @brief Carries the first error of Validator::validate().
 */
class ValidationException : public error::Exception {
public:
    ValidationException(const char* file, int line, const char* func,
                        ValidationError error);

    [[nodiscard]] auto error() const -> const ValidationError&;

private:
    ValidationError error_;
};

class UnresolvableReference : public error::Exception {
public:
    UnresolvableReference(const char* file, int line, const char* func,
                          std::string reference, const std::string& reason);

    [[nodiscard]] auto reference() const -> const std::string&;

private:
    std::string reference_;
};

class UnknownDialect : public error::Exception {
public:
    using Exception::Exception;
};

/**
 * @brief A schema names a type its dialect's type checker does not know.
 */
class UnknownType : public error::Exception {
public:
    UnknownType(const char* file, int line, const char* func, std::string type,
                json instance, json schema);

    [[nodiscard]] auto type() const -> const std::string&;
    [[nodiscard]] auto instance() const -> const json&;
    [[nodiscard]] auto schema() const -> const json&;

private:
    std::string type_;
    json instance_;
    json schema_;
};

class UndefinedTypeCheck : public error::Exception {
public:
    UndefinedTypeCheck(const char* file, int line, const char* func,
                       std::string type);

    [[nodiscard]] auto type() const -> const std::string&;

private:
    std::string type_;
};

class FormatError : public error::Exception {
public:
    FormatError(const char* file, int line, const char* func,
                const std::string& message, std::exception_ptr cause);

    [[nodiscard]] auto cause() const -> std::exception_ptr;

private:
    std::exception_ptr cause_;
};

class RecursionError : public error::Exception {
public:
    using Exception::Exception;
};

}  // namespace jsv::schema

#define THROW_SCHEMA_ERROR(errors)                                       \
    throw jsv::schema::SchemaError(JSV_FILE_NAME, JSV_FILE_LINE,         \
                                   JSV_FUNC_NAME, errors)
#define THROW_VALIDATION_EXCEPTION(error)                                \
    throw jsv::schema::ValidationException(JSV_FILE_NAME, JSV_FILE_LINE, \
                                           JSV_FUNC_NAME, error)
#define THROW_UNRESOLVABLE_REFERENCE(reference, reason)                    \
    throw jsv::schema::UnresolvableReference(JSV_FILE_NAME, JSV_FILE_LINE, \
                                             JSV_FUNC_NAME, reference,     \
                                             reason)
#define THROW_UNKNOWN_DIALECT(...)                                         \
    throw jsv::schema::UnknownDialect(JSV_FILE_NAME, JSV_FILE_LINE,        \
                                      JSV_FUNC_NAME, __VA_ARGS__)
#define THROW_UNKNOWN_TYPE(type, instance, schema)                       \
    throw jsv::schema::UnknownType(JSV_FILE_NAME, JSV_FILE_LINE,         \
                                   JSV_FUNC_NAME, type, instance, schema)
#define THROW_UNDEFINED_TYPE_CHECK(type)                                 \
    throw jsv::schema::UndefinedTypeCheck(JSV_FILE_NAME, JSV_FILE_LINE,  \
                                          JSV_FUNC_NAME, type)
#define THROW_FORMAT_ERROR(message, cause)                               \
    throw jsv::schema::FormatError(JSV_FILE_NAME, JSV_FILE_LINE,         \
                                   JSV_FUNC_NAME, message, cause)
#define THROW_RECURSION_ERROR(...)                                       \
    throw jsv::schema::RecursionError(JSV_FILE_NAME, JSV_FILE_LINE,      \
                                      JSV_FUNC_NAME, __VA_ARGS__)

#endif  // JSV_SCHEMA_EXCEPTIONS_HPP
