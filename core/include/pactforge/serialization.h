#pragma once

#include "body_builder.h"
#include "matcher.h"
#include "types.h"

#include <json-c/json.h>

#include <string>

namespace pactforge {

// --- json-c conversions ---
// Returned json_object* are owned by the caller (json_object_put).

// Literal nodes map to plain JSON; matcher nodes use the json_class encoding
// (Pact::SomethingLike, Pact::ArrayLike, Pact::Term, Pact::String,
// Pact::StructMatcher).
json_object* node_to_json(const Node& n);
json_object* matcher_to_json(const Matcher& m);

json_object* rule_to_json(const MatchingRule& r);
json_object* rules_to_json(const MatchingRules& rules);

// {"body": ..., "matchingRules": {...}}
json_object* pact_body_to_json(const PactBody& b);

// Decoding never throws; malformed input returns false with err filled.
bool node_from_json(json_object* o, Node* out, std::string* err);
bool rule_from_json(json_object* o, MatchingRule* out, std::string* err);
bool pact_body_from_json(json_object* o, PactBody* out, std::string* err);

// --- text helpers ---

std::string to_json_string(json_object* o, bool pretty);
std::string node_to_string(const Node& n, bool pretty = false);
std::string pact_body_to_string(const PactBody& b, bool pretty = false);

// MalformedDocument is reported as false + err.
bool parse_node(const std::string& text, Node* out, std::string* err);
bool parse_pact_body(const std::string& text, PactBody* out, std::string* err);

// Re-indents arbitrary JSON text.
bool format_json(const std::string& text, std::string* out, std::string* err);

} // namespace pactforge
