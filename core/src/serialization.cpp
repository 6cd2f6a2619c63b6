#include "pactforge/serialization.h"
#include "pactforge/json_mini.h"

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <utility>

namespace pactforge {

static constexpr const char* kJsonClass = "json_class";
static constexpr const char* kSomethingLike = "Pact::SomethingLike";
static constexpr const char* kArrayLike = "Pact::ArrayLike";
static constexpr const char* kTerm = "Pact::Term";
static constexpr const char* kString = "Pact::String";
static constexpr const char* kStructMatcher = "Pact::StructMatcher";

static json_object* new_string(const std::string& s) {
    return json_object_new_string_len(s.c_str(), static_cast<int>(s.size()));
}

// Shortest text that reads back as the same double; always keeps a decimal
// point or exponent so the value stays a JSON number of float type.
static std::string double_repr(double d) {
    char buf[64];
    for (int prec = 15; prec <= 17; prec++) {
        std::snprintf(buf, sizeof(buf), "%.*g", prec, d);
        if (std::strtod(buf, nullptr) == d) break;
    }
    std::string out = buf;
    if (out.find_first_of(".eE") == std::string::npos) out += ".0";
    return out;
}

// --- encoding ---

json_object* node_to_json(const Node& n) {
    switch (n.kind) {
        case NodeKind::NUL:
            return nullptr;
        case NodeKind::BOOL:
            return json_object_new_boolean(n.b ? 1 : 0);
        case NodeKind::INT:
            return json_object_new_int64(n.i);
        case NodeKind::NUMBER:
            return json_object_new_double_s(n.d, double_repr(n.d).c_str());
        case NodeKind::STRING:
            return new_string(n.s);
        case NodeKind::OBJECT: {
            json_object* o = json_object_new_object();
            for (const auto& kv : n.object) {
                json_object_object_add(o, kv.first.c_str(), node_to_json(kv.second));
            }
            return o;
        }
        case NodeKind::ARRAY: {
            json_object* a = json_object_new_array();
            for (const auto& el : n.array) json_object_array_add(a, node_to_json(el));
            return a;
        }
        case NodeKind::MATCHER:
            return n.matcher ? matcher_to_json(*n.matcher) : nullptr;
    }
    return nullptr;
}

json_object* matcher_to_json(const Matcher& m) {
    json_object* o = json_object_new_object();
    switch (m.kind()) {
        case MatcherKind::LITERAL_LIKE:
            json_object_object_add(o, kJsonClass, json_object_new_string(kSomethingLike));
            json_object_object_add(o, "contents", node_to_json(m.contents()));
            break;
        case MatcherKind::BOUNDED_REPEAT:
            json_object_object_add(o, kJsonClass, json_object_new_string(kArrayLike));
            json_object_object_add(o, "contents", node_to_json(m.contents()));
            if (m.min() != 0) json_object_object_add(o, "min", json_object_new_int(m.min()));
            if (m.max() != 0) json_object_object_add(o, "max", json_object_new_int(m.max()));
            if (m.min() == 0 && m.max() == 0) json_object_object_add(o, "min", json_object_new_int(0));
            break;
        case MatcherKind::REGEX_MATCH: {
            json_object* matcher = json_object_new_object();
            json_object_object_add(matcher, kJsonClass, json_object_new_string("Regexp"));
            json_object_object_add(matcher, "o", json_object_new_int(0));
            json_object_object_add(matcher, "s", new_string(m.regex()));
            json_object* data = json_object_new_object();
            json_object_object_add(data, "generate", node_to_json(m.contents()));
            json_object_object_add(data, "matcher", matcher);
            json_object_object_add(o, kJsonClass, json_object_new_string(kTerm));
            json_object_object_add(o, "data", data);
            break;
        }
        case MatcherKind::RAW_STRING:
            json_object_object_add(o, kJsonClass, json_object_new_string(kString));
            json_object_object_add(o, "contents", node_to_json(m.contents()));
            break;
        case MatcherKind::NESTED_OBJECT:
            json_object_object_add(o, kJsonClass, json_object_new_string(kStructMatcher));
            json_object_object_add(o, "contents", node_to_json(m.contents()));
            break;
    }
    return o;
}

json_object* rule_to_json(const MatchingRule& r) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "match", new_string(r.match));
    if (r.max) json_object_object_add(o, "max", json_object_new_int(*r.max));
    if (r.min) json_object_object_add(o, "min", json_object_new_int(*r.min));
    if (r.regex) json_object_object_add(o, "regex", new_string(*r.regex));
    return o;
}

json_object* rules_to_json(const MatchingRules& rules) {
    json_object* o = json_object_new_object();
    for (const auto& kv : rules) {
        json_object_object_add(o, kv.first.c_str(), rule_to_json(kv.second));
    }
    return o;
}

json_object* pact_body_to_json(const PactBody& b) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "body", node_to_json(b.body));
    json_object_object_add(o, "matchingRules", rules_to_json(b.matching_rules));
    return o;
}

// --- decoding ---

static bool fail(std::string* err, const std::string& path, const std::string& msg) {
    if (err) *err = path + ": " + msg;
    return false;
}

static bool decode(json_object* o, const std::string& path, Node* out, std::string* err);

static bool decode_matcher(json_object* o, const std::string& cls, const std::string& path,
                           Node* out, std::string* err) {
    json_object* contents = nullptr;
    const bool has_contents = json_object_object_get_ex(o, "contents", &contents);

    if (cls == kSomethingLike || cls == kArrayLike || cls == kString || cls == kStructMatcher) {
        if (!has_contents) return fail(err, path, std::string(cls) + " without contents");
    }

    if (cls == kSomethingLike) {
        Node inner;
        if (!decode(contents, path, &inner, err)) return false;
        *out = like(std::move(inner));
        return true;
    }

    if (cls == kArrayLike) {
        json_object* jmin = nullptr;
        json_object* jmax = nullptr;
        const bool has_min = json_object_object_get_ex(o, "min", &jmin);
        const bool has_max = json_object_object_get_ex(o, "max", &jmax);
        if ((has_min && !json_object_is_type(jmin, json_type_int)) ||
            (has_max && !json_object_is_type(jmax, json_type_int))) {
            return fail(err, path, "min/max must be integers");
        }
        const int64_t min = has_min ? json_object_get_int64(jmin) : (has_max ? 0 : 1);
        const int64_t max = has_max ? json_object_get_int64(jmax) : 0;
        if (min < 0 || max < 0 || min > INT32_MAX || max > INT32_MAX) {
            return fail(err, path, "min/max out of range");
        }
        Node inner;
        if (!decode(contents, path + kAllListItems, &inner, err)) return false;
        *out = array_like(std::move(inner), static_cast<int>(min), static_cast<int>(max));
        return true;
    }

    if (cls == kTerm) {
        json_object* data = json_mini::get_object(o, "data");
        json_object* matcher = json_mini::get_object(data, "matcher");
        auto generate = json_mini::get_string(data, "generate");
        auto pattern = json_mini::get_string(matcher, "s");
        if (!generate || !pattern) return fail(err, path, "Pact::Term needs data.generate and data.matcher.s strings");
        *out = term(*generate, *pattern);
        return true;
    }

    if (cls == kString) {
        if (!json_object_is_type(contents, json_type_string)) return fail(err, path, "Pact::String contents must be a string");
        *out = raw_string(json_object_get_string(contents));
        return true;
    }

    if (cls == kStructMatcher) {
        if (!json_object_is_type(contents, json_type_object)) return fail(err, path, "Pact::StructMatcher contents must be an object");
        Node fields;
        if (!decode(contents, path, &fields, err)) return false;
        if (!fields.is_object()) return fail(err, path, "Pact::StructMatcher contents must be a plain object");
        *out = struct_matcher(std::move(fields.object));
        return true;
    }

    return fail(err, path, "unknown json_class: " + cls);
}

static bool decode(json_object* o, const std::string& path, Node* out, std::string* err) {
    switch (json_object_get_type(o)) {
        case json_type_null:
            *out = Node::null();
            return true;
        case json_type_boolean:
            *out = Node(json_object_get_boolean(o) != 0);
            return true;
        case json_type_int:
            *out = Node(static_cast<int64_t>(json_object_get_int64(o)));
            return true;
        case json_type_double: {
            const double d = json_object_get_double(o);
            if (!std::isfinite(d)) return fail(err, path, "number is not finite");
            *out = Node(d);
            return true;
        }
        case json_type_string:
            *out = Node(std::string(json_object_get_string(o), static_cast<size_t>(json_object_get_string_len(o))));
            return true;
        case json_type_array: {
            Node arr = Node::array_of({});
            const size_t n = json_object_array_length(o);
            arr.array.reserve(n);
            for (size_t i = 0; i < n; i++) {
                Node el;
                if (!decode(json_object_array_get_idx(o, i), path + "[" + std::to_string(i) + "]", &el, err)) return false;
                arr.array.push_back(std::move(el));
            }
            *out = std::move(arr);
            return true;
        }
        case json_type_object: {
            json_object* cls = nullptr;
            if (json_object_object_get_ex(o, kJsonClass, &cls)) {
                if (!json_object_is_type(cls, json_type_string)) return fail(err, path, "json_class must be a string");
                return decode_matcher(o, json_object_get_string(cls), path, out, err);
            }
            Node obj = Node::object_of({});
            json_object_object_foreach(o, key, val) {
                Node child;
                if (!decode(val, path + "." + key, &child, err)) return false;
                obj.object[key] = std::move(child);
            }
            *out = std::move(obj);
            return true;
        }
    }
    return fail(err, path, "unsupported JSON type");
}

bool node_from_json(json_object* o, Node* out, std::string* err) {
    if (!out) return fail(err, "$", "no output node");
    return decode(o, "$", out, err);
}

bool rule_from_json(json_object* o, MatchingRule* out, std::string* err) {
    if (!out) return fail(err, "$", "no output rule");
    if (!json_object_is_type(o, json_type_object)) return fail(err, "$", "rule must be an object");
    MatchingRule r;
    auto match = json_mini::get_string(o, "match");
    if (!match || (*match != "type" && *match != "regex")) return fail(err, "$", "rule match must be \"type\" or \"regex\"");
    r.match = *match;
    json_object* v = nullptr;
    if (json_object_object_get_ex(o, "min", &v)) {
        if (!json_object_is_type(v, json_type_int)) return fail(err, "$", "rule min must be an integer");
        r.min = json_object_get_int(v);
    }
    if (json_object_object_get_ex(o, "max", &v)) {
        if (!json_object_is_type(v, json_type_int)) return fail(err, "$", "rule max must be an integer");
        r.max = json_object_get_int(v);
    }
    if (json_object_object_get_ex(o, "regex", &v)) {
        if (!json_object_is_type(v, json_type_string)) return fail(err, "$", "rule regex must be a string");
        r.regex = json_object_get_string(v);
    }
    if (r.match == "regex" && !r.regex) return fail(err, "$", "regex rule without pattern");
    *out = std::move(r);
    return true;
}

bool pact_body_from_json(json_object* o, PactBody* out, std::string* err) {
    if (!out) return fail(err, "$", "no output body");
    if (!json_object_is_type(o, json_type_object)) return fail(err, "$", "fixture must be an object");
    json_object* body = nullptr;
    if (!json_object_object_get_ex(o, "body", &body)) return fail(err, "$", "missing body");

    PactBody b;
    if (!decode(body, "$.body", &b.body, err)) return false;
    if (b.body.contains_matcher()) return fail(err, "$.body", "fixture body must be literal");

    json_object* rules = nullptr;
    if (json_object_object_get_ex(o, "matchingRules", &rules)) {
        if (!json_object_is_type(rules, json_type_object)) return fail(err, "$.matchingRules", "must be an object");
        json_object_object_foreach(rules, key, val) {
            MatchingRule r;
            std::string rerr;
            if (!rule_from_json(val, &r, &rerr)) return fail(err, std::string("$.matchingRules.") + key, rerr);
            b.matching_rules[key] = std::move(r);
        }
    }
    *out = std::move(b);
    return true;
}

// --- text helpers ---

std::string to_json_string(json_object* o, bool pretty) {
    int flags = JSON_C_TO_STRING_NOSLASHESCAPE;
    flags |= pretty ? (JSON_C_TO_STRING_PRETTY | JSON_C_TO_STRING_SPACED) : JSON_C_TO_STRING_PLAIN;
    return json_object_to_json_string_ext(o, flags);
}

std::string node_to_string(const Node& n, bool pretty) {
    json_object* o = node_to_json(n);
    std::string out = to_json_string(o, pretty);
    json_object_put(o);
    return out;
}

std::string pact_body_to_string(const PactBody& b, bool pretty) {
    json_object* o = pact_body_to_json(b);
    std::string out = to_json_string(o, pretty);
    json_object_put(o);
    return out;
}

// JSON `null` is a valid document but json-c parses it to a null pointer.
static bool is_null_text(const std::string& text) {
    const size_t b = text.find_first_not_of(" \t\r\n");
    const size_t e = text.find_last_not_of(" \t\r\n");
    return b != std::string::npos && text.compare(b, e - b + 1, "null") == 0;
}

bool parse_node(const std::string& text, Node* out, std::string* err) {
    if (is_null_text(text)) {
        if (out) *out = Node::null();
        return out != nullptr;
    }
    std::string perr;
    json_mini::Doc d = json_mini::parse(text, &perr);
    if (!d) {
        if (err) *err = "malformed document: " + perr;
        return false;
    }
    return node_from_json(d.root, out, err);
}

bool parse_pact_body(const std::string& text, PactBody* out, std::string* err) {
    std::string perr;
    json_mini::Doc d = json_mini::parse(text, &perr);
    if (!d) {
        if (err) *err = "malformed document: " + perr;
        return false;
    }
    return pact_body_from_json(d.root, out, err);
}

bool format_json(const std::string& text, std::string* out, std::string* err) {
    if (!out) return false;
    if (is_null_text(text)) {
        *out = "null";
        return true;
    }
    std::string perr;
    json_mini::Doc d = json_mini::parse(text, &perr);
    if (!d) {
        if (err) *err = "malformed document: " + perr;
        return false;
    }
    *out = to_json_string(d.root, true);
    return true;
}

} // namespace pactforge
