#pragma once
#include "matcher.h"
#include "schema.h"
#include "tag_params.h"

#include <string>

namespace pactforge {

constexpr const char* kDefaultStringExample = "string";
constexpr bool kDefaultBoolExample = true;
constexpr int64_t kDefaultIntegerExample = 1;
constexpr double kDefaultFloatExample = 1.1;

// Walks a type description and returns a matcher tree of the same shape.
// By default sequences require at least one element and scalars match by
// type; field annotations (see tag_params.h) override both.
//
// Throws UnsupportedTypeKind for map/interface fields and InvalidAnnotation
// for annotations that do not parse. Nothing is returned on failure.
Matcher match(const TypeDesc& type);
Matcher match(const TypeDesc& type, const TagParams& params);

// Looks the struct up by name first; throws std::runtime_error if unknown.
Matcher match(const SchemaRegistry& registry, const std::string& type_name);

} // namespace pactforge
