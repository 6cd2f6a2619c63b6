#pragma once
#include "schema.h"

#include <cstdint>
#include <optional>
#include <string>

namespace pactforge {

// Parameters plucked from one field annotation. Unset members select the
// synthesizer defaults.
struct TagParams {
    int min{1};                            // sequences
    std::optional<std::string> example;    // strings
    std::optional<std::string> regex;      // strings
    std::optional<int64_t> integer;        // integer kinds
    std::optional<double> number;          // float kinds
    std::optional<bool> boolean;           // bool
};

// Annotation grammar:
//   annotation := pair ("," pair)*
//   pair       := key "=" value
// Keys: example (bool, integer, float, string), regex (string, must follow
// example and runs to the end of the annotation), min (slice, array).
// Pointer fields use the grammar of the pointed-to kind.
//
// Throws InvalidAnnotation on any violation. An empty annotation yields the
// defaults.
TagParams parse_tag(const TypeDesc& type, const std::string& annotation);
TagParams parse_tag(TypeKind kind, const std::string& annotation);

} // namespace pactforge
