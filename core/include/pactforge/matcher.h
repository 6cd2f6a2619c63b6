#pragma once
#include "types.h"

#include <map>
#include <optional>
#include <string>
#include <utility>

namespace pactforge {

// Term regexes (frozen: existing fixtures depend on the exact text).
extern const char* const kHexadecimalRegex;
extern const char* const kIpAddressRegex;
extern const char* const kUuidRegex;
extern const char* const kTimestampRegex;
extern const char* const kDateRegex;
extern const char* const kTimeRegex;

// The closed set of matcher variants.
enum class MatcherKind {
    LITERAL_LIKE,
    REGEX_MATCH,
    BOUNDED_REPEAT,
    RAW_STRING,
    NESTED_OBJECT
};

// Class reported for introspection. A bounded repeat with a non-zero max
// classifies as ARRAY_MAX_LIKE even when a min is also present.
enum class MatcherClass {
    LIKE,
    REGEX,
    ARRAY_MIN_LIKE,
    ARRAY_MAX_LIKE
};

const char* matcher_kind_name(MatcherKind k);
const char* matcher_class_name(MatcherClass c);

// One entry of the matchingRules map.
struct MatchingRule {
    std::string match{"type"};      // "type" | "regex"
    std::optional<int> min;
    std::optional<int> max;
    std::optional<std::string> regex;
};

bool operator==(const MatchingRule& a, const MatchingRule& b);
inline bool operator!=(const MatchingRule& a, const MatchingRule& b) { return !(a == b); }

class Matcher {
public:
    MatcherKind kind() const { return kind_; }
    MatcherClass type() const;

    // Literal value placed in the generated document for this matcher.
    Node example() const;

    MatchingRule rule() const;

    // Copies materialized in the document for a bounded repeat.
    int repeat_count() const;

    // LiteralLike: the example. BoundedRepeat: the element.
    // RegexMatch/RawString: the string. NestedObject: the field object.
    const Node& contents() const { return contents_; }
    const std::string& regex() const { return regex_; }
    int min() const { return min_; }
    int max() const { return max_; }

    friend Matcher like(Node content);
    friend Matcher term(const std::string& generate, const std::string& pattern);
    friend Matcher array_like(Node content, int min, int max);
    friend Matcher raw_string(const std::string& s);
    friend Matcher struct_matcher(std::map<std::string, Node> fields);

private:
    Matcher(MatcherKind kind, Node contents) : kind_(kind), contents_(std::move(contents)) {}

    MatcherKind kind_;
    Node contents_;
    std::string regex_;
    int min_{0};
    int max_{0};
};

bool operator==(const Matcher& a, const Matcher& b);
inline bool operator!=(const Matcher& a, const Matcher& b) { return !(a == b); }

// Match by type instead of by value.
Matcher like(Node content);

// Generate `generate` and match it with the regular expression `pattern`.
Matcher term(const std::string& generate, const std::string& pattern);
Matcher regex(const std::string& generate, const std::string& pattern);

// Bounded repeat of one element. Either bound may be zero (unset); when both
// are set only max is reported in the rule.
Matcher array_like(Node content, int min, int max);

// The element may be repeated; the array must hold at least `min` items.
Matcher each_like(Node content, int min);
Matcher array_min_like(Node content, int min);

// The element may be repeated; the array must hold at most `max` items.
Matcher array_max_like(Node content, int max);

// A plain string standing in matcher position.
Matcher raw_string(const std::string& s);
Matcher S(const std::string& s);

// An object whose values may themselves be matchers.
Matcher struct_matcher(std::map<std::string, Node> fields);

// Named matchers with canonical examples.
Matcher hex_value();
Matcher identifier();
Matcher integer();
Matcher decimal();
Matcher ip_address();
Matcher ipv4_address();
Matcher ipv6_address();
Matcher uuid();
Matcher timestamp();
Matcher date();
Matcher time_of_day();

} // namespace pactforge
