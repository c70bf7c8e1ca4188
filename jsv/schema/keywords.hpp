/*
 * keywords.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-18

Description: Keyword validation functions installed by the dialects

**************************************************/

#ifndef JSV_SCHEMA_KEYWORDS_HPP
#define JSV_SCHEMA_KEYWORDS_HPP

#include "jsv/schema/dialect.hpp"

namespace jsv::schema::keywords {

// All functions share the KeywordFn signature: (evaluator, keyword value,
// instance, enclosing schema object).

// References
auto ref(Evaluator&, const json&, const json&, const json&) -> ErrorStream;
auto dynamicRef(Evaluator&, const json&, const json&, const json&)
    -> ErrorStream;
auto recursiveRef(Evaluator&, const json&, const json&, const json&)
    -> ErrorStream;

// In-place applicators
auto allOf(Evaluator&, const json&, const json&, const json&) -> ErrorStream;
auto anyOf(Evaluator&, const json&, const json&, const json&) -> ErrorStream;
auto oneOf(Evaluator&, const json&, const json&, const json&) -> ErrorStream;
auto notKeyword(Evaluator&, const json&, const json&, const json&)
    -> ErrorStream;
auto ifThenElse(Evaluator&, const json&, const json&, const json&)
    -> ErrorStream;
auto dependentSchemas(Evaluator&, const json&, const json&, const json&)
    -> ErrorStream;

// Objects
auto properties(Evaluator&, const json&, const json&, const json&)
    -> ErrorStream;
auto patternProperties(Evaluator&, const json&, const json&, const json&)
    -> ErrorStream;
auto additionalProperties(Evaluator&, const json&, const json&, const json&)
    -> ErrorStream;
auto unevaluatedProperties(Evaluator&, const json&, const json&, const json&)
    -> ErrorStream;
auto propertyNames(Evaluator&, const json&, const json&, const json&)
    -> ErrorStream;
auto required(Evaluator&, const json&, const json&, const json&)
    -> ErrorStream;
auto dependentRequired(Evaluator&, const json&, const json&, const json&)
    -> ErrorStream;
auto dependencies(Evaluator&, const json&, const json&, const json&)
    -> ErrorStream;
auto minProperties(Evaluator&, const json&, const json&, const json&)
    -> ErrorStream;
auto maxProperties(Evaluator&, const json&, const json&, const json&)
    -> ErrorStream;

// Arrays
auto prefixItems(Evaluator&, const json&, const json&, const json&)
    -> ErrorStream;
/// 2020-12 "items": applies to the elements after "prefixItems".
auto items(Evaluator&, const json&, const json&, const json&) -> ErrorStream;
/// "items" up to 2019-09: one schema for all elements, or one per position.
auto itemsLegacy(Evaluator&, const json&, const json&, const json&)
    -> ErrorStream;
auto additionalItems(Evaluator&, const json&, const json&, const json&)
    -> ErrorStream;
auto unevaluatedItems(Evaluator&, const json&, const json&, const json&)
    -> ErrorStream;
/// "contains" honouring "minContains" and "maxContains"; matching
/// indices count as evaluated items.
auto contains(Evaluator&, const json&, const json&, const json&)
    -> ErrorStream;
/// As contains(), without evaluated item annotations.
auto containsDraft201909(Evaluator&, const json&, const json&, const json&)
    -> ErrorStream;
/// "contains" of drafts 6 and 7.
auto containsDraft6(Evaluator&, const json&, const json&, const json&)
    -> ErrorStream;
auto minItems(Evaluator&, const json&, const json&, const json&)
    -> ErrorStream;
auto maxItems(Evaluator&, const json&, const json&, const json&)
    -> ErrorStream;
auto uniqueItems(Evaluator&, const json&, const json&, const json&)
    -> ErrorStream;

// Any instance
auto type(Evaluator&, const json&, const json&, const json&) -> ErrorStream;
auto enumeration(Evaluator&, const json&, const json&, const json&)
    -> ErrorStream;
auto constant(Evaluator&, const json&, const json&, const json&)
    -> ErrorStream;
auto format(Evaluator&, const json&, const json&, const json&)
    -> ErrorStream;

// Numbers and strings
auto minimum(Evaluator&, const json&, const json&, const json&)
    -> ErrorStream;
auto maximum(Evaluator&, const json&, const json&, const json&)
    -> ErrorStream;
auto exclusiveMinimum(Evaluator&, const json&, const json&, const json&)
    -> ErrorStream;
auto exclusiveMaximum(Evaluator&, const json&, const json&, const json&)
    -> ErrorStream;
auto multipleOf(Evaluator&, const json&, const json&, const json&)
    -> ErrorStream;
auto minLength(Evaluator&, const json&, const json&, const json&)
    -> ErrorStream;
auto maxLength(Evaluator&, const json&, const json&, const json&)
    -> ErrorStream;
auto pattern(Evaluator&, const json&, const json&, const json&)
    -> ErrorStream;

// Drafts 3 and 4
/// "minimum" with a boolean "exclusiveMinimum" sibling.
auto minimumDraft4(Evaluator&, const json&, const json&, const json&)
    -> ErrorStream;
/// "maximum" with a boolean "exclusiveMaximum" sibling.
auto maximumDraft4(Evaluator&, const json&, const json&, const json&)
    -> ErrorStream;
auto typeDraft3(Evaluator&, const json&, const json&, const json&)
    -> ErrorStream;
auto propertiesDraft3(Evaluator&, const json&, const json&, const json&)
    -> ErrorStream;
auto disallowDraft3(Evaluator&, const json&, const json&, const json&)
    -> ErrorStream;
auto extendsDraft3(Evaluator&, const json&, const json&, const json&)
    -> ErrorStream;

}  // namespace jsv::schema::keywords

#endif  // JSV_SCHEMA_KEYWORDS_HPP
