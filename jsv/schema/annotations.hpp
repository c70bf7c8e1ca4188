/*
 * annotations.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-16

Description: Evaluated-location tracking for unevaluated* keywords

**************************************************/

#ifndef JSV_SCHEMA_ANNOTATIONS_HPP
#define JSV_SCHEMA_ANNOTATIONS_HPP

#include <cstddef>
#include <set>
#include <string>

namespace jsv::schema {

/**
 * @brief Property names and item indices claimed while evaluating one
 * schema object against one instance.
 */
struct Annotations {
    std::set<std::string, std::less<>> properties;
    std::set<std::size_t> items;

    void merge(const Annotations& other) {
        properties.insert(other.properties.begin(), other.properties.end());
        items.insert(other.items.begin(), other.items.end());
    }
};

}  // namespace jsv::schema

#endif  // JSV_SCHEMA_ANNOTATIONS_HPP
