#pragma once
#include "matcher.h"
#include "types.h"

#include <map>
#include <string>

namespace pactforge {

// JSON-path -> rule. Paths start at "$.body", append ".field" per object key
// and "[*]" per repeated element.
using MatchingRules = std::map<std::string, MatchingRule>;

// Fixture: literal-only document plus the rules that relax its comparison.
struct PactBody {
    Node body;
    MatchingRules matching_rules;
};

constexpr const char* kBodyRootPath = "$.body";
constexpr const char* kAllListItems = "[*]";

// Walks `root` depth first. Every matcher is replaced by its example and its
// rule is recorded at the path of that position in the output document.
PactBody build_pact_body(const Node& root);

// Same walk without rule collection.
Node example_of(const Node& node);

} // namespace pactforge
