#include "pactforge/body_builder.h"

#include <string>
#include <utility>
#include <vector>

namespace pactforge {

static std::string field_path(const std::string& path, const std::string& key) {
    return path + "." + key;
}

static void record_rule(MatchingRules* rules, const std::string& path, const MatchingRule& rule) {
    if (!rules) return;
    // Repeated plain-array elements share one path; the first rule wins.
    rules->emplace(path, rule);
}

// True for a matcher that records a rule at its own path. NestedObject only
// records below it.
static bool records_own_rule(const Node& value) {
    return value.is_matcher() && value.matcher->kind() != MatcherKind::NESTED_OBJECT;
}

// Returns the literal rendition of `value`; rules (when non-null) receive one
// entry per matcher found below `path`.
static Node build(const Node& value, const std::string& path, MatchingRules* rules) {
    switch (value.kind) {
        case NodeKind::MATCHER: {
            const Matcher& m = *value.matcher;
            switch (m.kind()) {
                case MatcherKind::BOUNDED_REPEAT: {
                    record_rule(rules, path, m.rule());
                    Node element = build(m.contents(), path + kAllListItems, rules);
                    return Node::array_of(std::vector<Node>(static_cast<size_t>(m.repeat_count()), element));
                }
                case MatcherKind::NESTED_OBJECT:
                    // Structure only: its fields carry the rules.
                    return build(m.contents(), path, rules);
                case MatcherKind::LITERAL_LIKE:
                    // A wrapped matcher recording at this path owns the rule there.
                    if (!records_own_rule(m.contents())) record_rule(rules, path, m.rule());
                    return build(m.contents(), path, rules);
                case MatcherKind::REGEX_MATCH:
                case MatcherKind::RAW_STRING:
                    record_rule(rules, path, m.rule());
                    return m.contents();
            }
            return Node::null();
        }
        case NodeKind::OBJECT: {
            Node out = Node::object_of({});
            for (const auto& kv : value.object) {
                out.object.emplace(kv.first, build(kv.second, field_path(path, kv.first), rules));
            }
            return out;
        }
        case NodeKind::ARRAY: {
            Node out = Node::array_of({});
            out.array.reserve(value.array.size());
            for (const auto& el : value.array) {
                out.array.push_back(build(el, path + kAllListItems, rules));
            }
            return out;
        }
        default:
            return value;
    }
}

PactBody build_pact_body(const Node& root) {
    PactBody out;
    out.body = build(root, kBodyRootPath, &out.matching_rules);
    return out;
}

Node example_of(const Node& node) {
    return build(node, kBodyRootPath, nullptr);
}

} // namespace pactforge
