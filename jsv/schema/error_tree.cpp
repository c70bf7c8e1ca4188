/*
 * error_tree.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-14

Description: Error aggregation by instance path and relevance ranking

**************************************************/

#include "error_tree.hpp"

namespace jsv::schema {

ErrorTree::ErrorTree(const std::vector<ValidationError>& errors) {
    for (const auto& error : errors) {
        ErrorTree* node = this;
        for (const auto& element : error.absolutePath()) {
            node = &node->children_[element];
        }
        node->errors_.insert_or_assign(error.keyword, error);
    }
}

auto ErrorTree::contains(const PathElement& element) const -> bool {
    return children_.contains(element);
}

auto ErrorTree::operator[](const PathElement& element) const
    -> const ErrorTree& {
    static const ErrorTree kEmpty;
    auto it = children_.find(element);
    return it == children_.end() ? kEmpty : it->second;
}

auto ErrorTree::errors() const
    -> const std::map<std::string, ValidationError>& {
    return errors_;
}

auto ErrorTree::children() const -> const std::map<PathElement, ErrorTree>& {
    return children_;
}

auto ErrorTree::totalErrors() const -> std::size_t {
    std::size_t total = errors_.size();
    for (const auto& [element, child] : children_) {
        total += child.totalErrors();
    }
    return total;
}

auto ErrorTree::empty() const -> bool {
    return errors_.empty() && children_.empty();
}

auto Relevance::key(const ValidationError& error) const
    -> std::tuple<std::size_t, bool, bool> {
    return {error.absolutePath().size(), !weak.contains(error.keyword),
            strong.contains(error.keyword)};
}

namespace {
auto mostRelevant(const std::vector<ValidationError>& errors,
                  const Relevance& relevance) -> const ValidationError* {
    const ValidationError* best = nullptr;
    std::tuple<std::size_t, bool, bool> bestKey;
    for (const auto& error : errors) {
        auto key = relevance.key(error);
        if (best == nullptr || key > bestKey) {
            best = &error;
            bestKey = key;
        }
    }
    return best;
}
}  // namespace

auto bestMatch(const std::vector<ValidationError>& errors,
               const Relevance& relevance) -> std::optional<ValidationError> {
    const ValidationError* best = mostRelevant(errors, relevance);
    if (best == nullptr) {
        return std::nullopt;
    }
    while (!best->context().empty()) {
        best = mostRelevant(best->context(), relevance);
    }
    Path path = best->absolutePath();
    Path schemaPath = best->absoluteSchemaPath();
    ValidationError result(*best);
    result.path = std::move(path);
    result.schemaPath = std::move(schemaPath);
    return result;
}

}  // namespace jsv::schema
