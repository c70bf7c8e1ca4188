/*
 * errors.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-12

Description: Validation error value produced by the evaluation engine

**************************************************/

#include "errors.hpp"

#include <cctype>
#include <sstream>

namespace jsv::schema {

namespace {
auto isIdentifier(const std::string& name) -> bool {
    if (name.empty() ||
        std::isdigit(static_cast<unsigned char>(name.front())) != 0) {
        return false;
    }
    for (char c : name) {
        if (std::isalnum(static_cast<unsigned char>(c)) == 0 && c != '_') {
            return false;
        }
    }
    return true;
}

auto escapePointerToken(const std::string& token) -> std::string {
    std::string escaped;
    escaped.reserve(token.size());
    for (char c : token) {
        if (c == '~') {
            escaped += "~0";
        } else if (c == '/') {
            escaped += "~1";
        } else {
            escaped += c;
        }
    }
    return escaped;
}

auto subscripts(const Path& path) -> std::string {
    std::string out;
    for (const auto& element : path) {
        if (const auto* index = std::get_if<std::size_t>(&element)) {
            out += "[" + std::to_string(*index) + "]";
        } else {
            out += "[" + json(std::get<std::string>(element)).dump() + "]";
        }
    }
    return out;
}

auto indent(const std::string& text) -> std::string {
    std::string out = "    ";
    for (char c : text) {
        out += c;
        if (c == '\n') {
            out += "    ";
        }
    }
    return out;
}
}  // namespace

auto toString(const PathElement& element) -> std::string {
    if (const auto* index = std::get_if<std::size_t>(&element)) {
        return std::to_string(*index);
    }
    return std::get<std::string>(element);
}

auto toPointer(const Path& path) -> std::string {
    std::string pointer;
    for (const auto& element : path) {
        pointer += "/" + escapePointerToken(toString(element));
    }
    return pointer;
}

ValidationError::ValidationError(std::string message,
                                 std::exception_ptr cause)
    : message(std::move(message)), cause(std::move(cause)) {}

ValidationError::ValidationError(std::string message,
                                 std::vector<ValidationError> context)
    : message(std::move(message)) {
    setContext(std::move(context));
}

ValidationError::ValidationError(const ValidationError& other)
    : message(other.message),
      keyword(other.keyword),
      keywordValue(other.keywordValue),
      instance(other.instance),
      schema(other.schema),
      path(other.path),
      schemaPath(other.schemaPath),
      cause(other.cause),
      context_(other.context_),
      detailed_(other.detailed_) {
    adoptContext();
}

ValidationError::ValidationError(ValidationError&& other) noexcept
    : message(std::move(other.message)),
      keyword(std::move(other.keyword)),
      keywordValue(std::move(other.keywordValue)),
      instance(std::move(other.instance)),
      schema(std::move(other.schema)),
      path(std::move(other.path)),
      schemaPath(std::move(other.schemaPath)),
      cause(std::move(other.cause)),
      context_(std::move(other.context_)),
      parent_(other.parent_),
      detailed_(other.detailed_) {
    adoptContext();
}

auto ValidationError::operator=(const ValidationError& other)
    -> ValidationError& {
    if (this != &other) {
        ValidationError copy(other);
        *this = std::move(copy);
    }
    return *this;
}

auto ValidationError::operator=(ValidationError&& other) noexcept
    -> ValidationError& {
    if (this != &other) {
        message = std::move(other.message);
        keyword = std::move(other.keyword);
        keywordValue = std::move(other.keywordValue);
        instance = std::move(other.instance);
        schema = std::move(other.schema);
        path = std::move(other.path);
        schemaPath = std::move(other.schemaPath);
        cause = std::move(other.cause);
        context_ = std::move(other.context_);
        detailed_ = other.detailed_;
        adoptContext();
    }
    return *this;
}

auto ValidationError::context() const -> const std::vector<ValidationError>& {
    return context_;
}

void ValidationError::setContext(std::vector<ValidationError> context) {
    context_ = std::move(context);
    adoptContext();
}

void ValidationError::adoptContext() {
    for (auto& child : context_) {
        child.parent_ = this;
    }
}

auto ValidationError::parent() const -> const ValidationError* {
    return parent_;
}

auto ValidationError::absolutePath() const -> Path {
    if (parent_ == nullptr) {
        return path;
    }
    Path result = parent_->absolutePath();
    result.insert(result.end(), path.begin(), path.end());
    return result;
}

auto ValidationError::absoluteSchemaPath() const -> Path {
    if (parent_ == nullptr) {
        return schemaPath;
    }
    Path result = parent_->absoluteSchemaPath();
    result.insert(result.end(), schemaPath.begin(), schemaPath.end());
    return result;
}

auto ValidationError::jsonPath() const -> std::string {
    std::string out = "$";
    for (const auto& element : absolutePath()) {
        if (const auto* index = std::get_if<std::size_t>(&element)) {
            out += "[" + std::to_string(*index) + "]";
        } else if (const auto& name = std::get<std::string>(element);
                   isIdentifier(name)) {
            out += "." + name;
        } else {
            out += "[" + json(name).dump() + "]";
        }
    }
    return out;
}

auto ValidationError::hasDetails() const -> bool { return detailed_; }

void ValidationError::setDetails(std::string keyword,
                                 const json& keywordValue,
                                 const json& instance, const json& schema) {
    if (detailed_) {
        return;
    }
    this->keyword = std::move(keyword);
    this->keywordValue = keywordValue;
    this->instance = instance;
    this->schema = schema;
    detailed_ = true;
}

auto ValidationError::toString() const -> std::string {
    if (!detailed_) {
        return message;
    }
    constexpr auto kReplace = json::error_handler_t::replace;
    Path schemaLocation = absoluteSchemaPath();
    if (!schemaLocation.empty()) {
        schemaLocation.pop_back();
    }
    std::ostringstream oss;
    oss << message << "\n\n";
    oss << "Failed validating " << json(keyword).dump() << " in schema"
        << subscripts(schemaLocation) << ":\n";
    oss << indent(schema.dump(4, ' ', false, kReplace)) << "\n\n";
    oss << "On instance" << subscripts(absolutePath()) << ":\n";
    oss << indent(instance.dump(4, ' ', false, kReplace));
    return oss.str();
}

auto ValidationError::toJson() const -> json {
    json result = {{"message", message},
                   {"keyword", keyword},
                   {"instanceLocation", toPointer(absolutePath())},
                   {"keywordLocation", toPointer(absoluteSchemaPath())}};
    if (!context_.empty()) {
        json nested = json::array();
        for (const auto& child : context_) {
            nested.push_back(child.toJson());
        }
        result["context"] = std::move(nested);
    }
    return result;
}

}  // namespace jsv::schema
