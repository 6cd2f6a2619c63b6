#include "pactforge/tag_params.h"
#include "pactforge/errors.h"

#include <cctype>
#include <cerrno>
#include <cfloat>
#include <climits>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <utility>
#include <vector>

namespace pactforge {

namespace {

struct Pair {
    std::string key;
    std::string value;
};

std::vector<Pair> split_pairs(const std::string& tag) {
    std::vector<Pair> out;
    size_t pos = 0;
    while (true) {
        const size_t eq = tag.find('=', pos);
        const size_t comma = tag.find(',', pos);
        if (eq == std::string::npos || (comma != std::string::npos && comma < eq)) {
            throw InvalidAnnotation(tag, "invalid format: expected key=value");
        }
        Pair p;
        p.key = tag.substr(pos, eq - pos);
        if (p.key.empty()) throw InvalidAnnotation(tag, "invalid format: empty key");

        if (p.key == "regex") {
            p.value = tag.substr(eq + 1);
            out.push_back(std::move(p));
            return out;
        }

        const size_t next = tag.find(',', eq + 1);
        if (next == std::string::npos) {
            p.value = tag.substr(eq + 1);
            out.push_back(std::move(p));
            return out;
        }
        p.value = tag.substr(eq + 1, next - eq - 1);
        out.push_back(std::move(p));
        pos = next + 1;
    }
}

bool parse_bool_literal(const std::string& s, bool* out) {
    if (s == "1" || s == "t" || s == "T" || s == "true" || s == "TRUE" || s == "True") {
        *out = true;
        return true;
    }
    if (s == "0" || s == "f" || s == "F" || s == "false" || s == "FALSE" || s == "False") {
        *out = false;
        return true;
    }
    return false;
}

void integer_range(TypeKind kind, int64_t* lo, int64_t* hi) {
    switch (kind) {
        case TypeKind::INT8:   *lo = INT8_MIN;  *hi = INT8_MAX; break;
        case TypeKind::INT16:  *lo = INT16_MIN; *hi = INT16_MAX; break;
        case TypeKind::INT32:  *lo = INT32_MIN; *hi = INT32_MAX; break;
        case TypeKind::UINT8:  *lo = 0; *hi = UINT8_MAX; break;
        case TypeKind::UINT16: *lo = 0; *hi = UINT16_MAX; break;
        case TypeKind::UINT32: *lo = 0; *hi = UINT32_MAX; break;
        // Examples are carried as int64; larger unsigned values are rejected.
        case TypeKind::UINT:
        case TypeKind::UINT64: *lo = 0; *hi = INT64_MAX; break;
        default:               *lo = INT64_MIN; *hi = INT64_MAX; break;
    }
}

int64_t parse_integer(const std::string& tag, TypeKind kind, const std::string& s) {
    if (s.empty()) throw InvalidAnnotation(tag, "expected integer");
    size_t digits_from = (s[0] == '+' || s[0] == '-') ? 1 : 0;
    if (digits_from == s.size()) throw InvalidAnnotation(tag, "expected integer");
    for (size_t i = digits_from; i < s.size(); i++) {
        if (s[i] < '0' || s[i] > '9') throw InvalidAnnotation(tag, "expected integer");
    }
    if (is_unsigned_kind(kind) && s[0] == '-') {
        throw InvalidAnnotation(tag, "expected unsigned integer");
    }

    errno = 0;
    long long v = std::strtoll(s.c_str(), nullptr, 10);
    if (errno == ERANGE) throw InvalidAnnotation(tag, "integer out of range");

    int64_t lo = 0, hi = 0;
    integer_range(kind, &lo, &hi);
    if (v < lo || v > hi) throw InvalidAnnotation(tag, "integer out of range");
    return static_cast<int64_t>(v);
}

double parse_float(const std::string& tag, TypeKind kind, const std::string& s) {
    if (s.empty() || std::isspace(static_cast<unsigned char>(s[0]))) {
        throw InvalidAnnotation(tag, "expected floating-point number");
    }
    errno = 0;
    char* end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (end != s.c_str() + s.size()) throw InvalidAnnotation(tag, "expected floating-point number");
    if (errno == ERANGE || !std::isfinite(v)) throw InvalidAnnotation(tag, "float out of range");
    if (kind == TypeKind::FLOAT32 && std::fabs(v) > FLT_MAX) {
        throw InvalidAnnotation(tag, "float out of range");
    }
    return v;
}

int parse_min(const std::string& tag, const std::string& s) {
    if (s.empty()) throw InvalidAnnotation(tag, "expected non-negative integer");
    for (char c : s) {
        if (c < '0' || c > '9') throw InvalidAnnotation(tag, "expected non-negative integer");
    }
    errno = 0;
    long long v = std::strtoll(s.c_str(), nullptr, 10);
    if (errno == ERANGE || v > INT_MAX) throw InvalidAnnotation(tag, "min out of range");
    return static_cast<int>(v);
}

bool key_allowed(TypeKind kind, const std::string& key) {
    if (key == "example") {
        return kind == TypeKind::BOOL || kind == TypeKind::STRING ||
               is_integer_kind(kind) || is_float_kind(kind);
    }
    if (key == "regex") return kind == TypeKind::STRING;
    if (key == "min") return is_sequence_kind(kind);
    return false;
}

} // namespace

TagParams parse_tag(TypeKind kind, const std::string& tag) {
    TagParams params;
    if (tag.empty()) return params;

    const std::vector<Pair> pairs = split_pairs(tag);

    const Pair* example = nullptr;
    const Pair* regex = nullptr;
    const Pair* min = nullptr;
    for (const auto& p : pairs) {
        const Pair** slot = nullptr;
        if (p.key == "example") slot = &example;
        else if (p.key == "regex") slot = &regex;
        else if (p.key == "min") slot = &min;
        else throw InvalidAnnotation(tag, "unknown key: " + p.key);

        if (!key_allowed(kind, p.key)) throw InvalidAnnotation(tag, "key not valid for this field: " + p.key);
        if (*slot) throw InvalidAnnotation(tag, "duplicate key: " + p.key);
        *slot = &p;
    }

    if (min) params.min = parse_min(tag, min->value);

    if (kind == TypeKind::STRING) {
        if (regex) {
            if (regex->value.empty()) throw InvalidAnnotation(tag, "invalid format: regex must not be empty");
            if (!example) throw InvalidAnnotation(tag, "invalid format: regex requires an example");
            params.regex = regex->value;
        }
        if (example) {
            if (example->value.empty()) throw InvalidAnnotation(tag, "invalid format: example must not be empty");
            params.example = example->value;
        }
        return params;
    }

    if (!example) return params;

    if (kind == TypeKind::BOOL) {
        bool b = false;
        if (!parse_bool_literal(example->value, &b)) throw InvalidAnnotation(tag, "expected boolean");
        params.boolean = b;
    } else if (is_integer_kind(kind)) {
        params.integer = parse_integer(tag, kind, example->value);
    } else if (is_float_kind(kind)) {
        params.number = parse_float(tag, kind, example->value);
    }
    return params;
}

TagParams parse_tag(const TypeDesc& type, const std::string& tag) {
    return parse_tag(deref(type).kind, tag);
}

} // namespace pactforge
