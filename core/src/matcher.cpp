#include "pactforge/matcher.h"
#include "pactforge/body_builder.h"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace pactforge {

const char* const kHexadecimalRegex = R"([0-9a-fA-F]+)";
const char* const kIpAddressRegex = R"((\d{1,3}\.)+\d{1,3})";
const char* const kUuidRegex = R"([0-9a-f]{8}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{12})";
const char* const kTimestampRegex =
    R"(^([\+-]?\d{4}(?!\d{2}\b))((-?)((0[1-9]|1[0-2])(\3([12]\d|0[1-9]|3[01]))?|W([0-4]\d|5[0-2])(-?[1-7])?|(00[1-9]|0[1-9]\d|[12]\d{2}|3([0-5]\d|6[1-6])))([T\s]((([01]\d|2[0-3])((:?)[0-5]\d)?|24\:?00)([\.,]\d+(?!:))?)?(\17[0-5]\d([\.,]\d+)?)?([zZ]|([\+-])([01]\d|2[0-3]):?([0-5]\d)?)?)?)?$)";
const char* const kDateRegex =
    R"(^([\+-]?\d{4}(?!\d{2}\b))((-?)((0[1-9]|1[0-2])(\3([12]\d|0[1-9]|3[01]))?|W([0-4]\d|5[0-2])(-?[1-7])?|(00[1-9]|0[1-9]\d|[12]\d{2}|3([0-5]\d|6[1-6])))?))";
const char* const kTimeRegex = R"(^(T\d\d:\d\d(:\d\d)?(\.\d+)?(([+-]\d\d:\d\d)|Z)?)?$)";

// Fixed instant used by the date/time matchers: 2000-02-01 12:30:00 UTC.
static const char* const kExampleTimestamp = "2000-02-01T12:30:00Z";
static const char* const kExampleDate = "2000-02-01";
static const char* const kExampleTime = "T12:30:00";

const char* matcher_kind_name(MatcherKind k) {
    switch (k) {
        case MatcherKind::LITERAL_LIKE:   return "LiteralLike";
        case MatcherKind::REGEX_MATCH:    return "RegexMatch";
        case MatcherKind::BOUNDED_REPEAT: return "BoundedRepeat";
        case MatcherKind::RAW_STRING:     return "RawString";
        case MatcherKind::NESTED_OBJECT:  return "NestedObject";
    }
    return "LiteralLike";
}

const char* matcher_class_name(MatcherClass c) {
    switch (c) {
        case MatcherClass::LIKE:           return "like";
        case MatcherClass::REGEX:          return "regex";
        case MatcherClass::ARRAY_MIN_LIKE: return "array_min_like";
        case MatcherClass::ARRAY_MAX_LIKE: return "array_max_like";
    }
    return "like";
}

bool operator==(const MatchingRule& a, const MatchingRule& b) {
    return a.match == b.match && a.min == b.min && a.max == b.max && a.regex == b.regex;
}

MatcherClass Matcher::type() const {
    switch (kind_) {
        case MatcherKind::REGEX_MATCH:
            return MatcherClass::REGEX;
        case MatcherKind::BOUNDED_REPEAT:
            if (max_ != 0) return MatcherClass::ARRAY_MAX_LIKE;
            return MatcherClass::ARRAY_MIN_LIKE;
        case MatcherKind::LITERAL_LIKE:
        case MatcherKind::RAW_STRING:
        case MatcherKind::NESTED_OBJECT:
            return MatcherClass::LIKE;
    }
    return MatcherClass::LIKE;
}

Node Matcher::example() const {
    if (kind_ != MatcherKind::BOUNDED_REPEAT) return example_of(contents_);

    const Node element = example_of(contents_);
    return Node::array_of(std::vector<Node>(static_cast<size_t>(repeat_count()), element));
}

MatchingRule Matcher::rule() const {
    MatchingRule r;
    switch (kind_) {
        case MatcherKind::REGEX_MATCH:
            r.match = "regex";
            r.regex = regex_;
            break;
        case MatcherKind::BOUNDED_REPEAT:
            if (max_ != 0) {
                r.max = max_;
            } else {
                r.min = min_;
            }
            break;
        case MatcherKind::LITERAL_LIKE:
        case MatcherKind::RAW_STRING:
        case MatcherKind::NESTED_OBJECT:
            break;
    }
    return r;
}

int Matcher::repeat_count() const {
    if (kind_ != MatcherKind::BOUNDED_REPEAT) return 1;
    if (max_ != 0) {
        if (min_ > 0) return std::min(min_, max_);
        return 1;
    }
    return min_;
}

bool operator==(const Matcher& a, const Matcher& b) {
    return a.kind() == b.kind() &&
           a.contents() == b.contents() &&
           a.regex() == b.regex() &&
           a.min() == b.min() &&
           a.max() == b.max();
}

// --- factories ---

Matcher like(Node content) {
    return Matcher(MatcherKind::LITERAL_LIKE, std::move(content));
}

Matcher term(const std::string& generate, const std::string& pattern) {
    Matcher m(MatcherKind::REGEX_MATCH, Node(generate));
    m.regex_ = pattern;
    return m;
}

Matcher regex(const std::string& generate, const std::string& pattern) {
    return term(generate, pattern);
}

Matcher array_like(Node content, int min, int max) {
    if (min < 0) throw std::invalid_argument("array_like: min must not be negative");
    if (max < 0) throw std::invalid_argument("array_like: max must not be negative");
    Matcher m(MatcherKind::BOUNDED_REPEAT, std::move(content));
    m.min_ = min;
    m.max_ = max;
    return m;
}

Matcher each_like(Node content, int min) {
    return array_like(std::move(content), min, 0);
}

Matcher array_min_like(Node content, int min) {
    return array_like(std::move(content), min, 0);
}

Matcher array_max_like(Node content, int max) {
    if (max == 0) throw std::invalid_argument("array_max_like: max must be at least 1");
    return array_like(std::move(content), 0, max);
}

Matcher raw_string(const std::string& s) {
    return Matcher(MatcherKind::RAW_STRING, Node(s));
}

Matcher S(const std::string& s) {
    return raw_string(s);
}

Matcher struct_matcher(std::map<std::string, Node> fields) {
    return Matcher(MatcherKind::NESTED_OBJECT, Node::object_of(std::move(fields)));
}

// --- named matchers ---

Matcher hex_value() {
    return regex("3F", kHexadecimalRegex);
}

Matcher identifier() {
    return like(42);
}

Matcher integer() {
    return identifier();
}

Matcher decimal() {
    return like(42.0);
}

Matcher ip_address() {
    return regex("127.0.0.1", kIpAddressRegex);
}

Matcher ipv4_address() {
    return ip_address();
}

// Shares the IPv4 pattern; fixtures generated so far carry this regex.
Matcher ipv6_address() {
    return regex("::ffff:192.0.2.128", kIpAddressRegex);
}

Matcher uuid() {
    return regex("fc763eba-0905-41c5-a27f-3934ab26786c", kUuidRegex);
}

Matcher timestamp() {
    return regex(kExampleTimestamp, kTimestampRegex);
}

Matcher date() {
    return regex(kExampleDate, kDateRegex);
}

Matcher time_of_day() {
    return regex(kExampleTime, kTimeRegex);
}

} // namespace pactforge
