/*
 * meta_schemas.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-15

Description: Bundled meta-schemas and vocabulary schemas of every
supported draft

**************************************************/

#ifndef JSV_SCHEMA_META_SCHEMAS_HPP
#define JSV_SCHEMA_META_SCHEMAS_HPP

#include <memory>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace jsv::schema {

using json = nlohmann::json;

/// Every bundled document, parsed once.
[[nodiscard]] auto metaSchemaDocuments()
    -> const std::vector<std::shared_ptr<const json>>&;

/**
 * @brief Bundled document whose identifier equals @p uri, ignoring an
 * empty fragment.
 * @return Null for unknown URIs.
 */
[[nodiscard]] auto metaSchema(std::string_view uri)
    -> std::shared_ptr<const json>;

}  // namespace jsv::schema

#endif  // JSV_SCHEMA_META_SCHEMAS_HPP
