#pragma once

// json_mini.h
//
// Small helpers over json-c for reading manifests and request files.

#include <json-c/json.h>

#include <algorithm>
#include <climits>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pactforge::json_mini {

struct Doc {
    json_object* root{nullptr};

    Doc() = default;
    explicit Doc(json_object* r) : root(r) {}
    Doc(const Doc&) = delete;
    Doc& operator=(const Doc&) = delete;

    Doc(Doc&& other) noexcept : root(other.root) { other.root = nullptr; }
    Doc& operator=(Doc&& other) noexcept {
        if (this != &other) {
            if (root) json_object_put(root);
            root = other.root;
            other.root = nullptr;
        }
        return *this;
    }

    ~Doc() {
        if (root) json_object_put(root);
    }

    // Gives up ownership of the root.
    json_object* release() {
        json_object* r = root;
        root = nullptr;
        return r;
    }

    explicit operator bool() const { return root != nullptr; }
};

// Parses a complete JSON text. On failure returns an empty Doc and, if err is
// non-null, a description of what json-c rejected. A JSON `null` text also
// yields an empty Doc.
inline Doc parse(const std::string& json, std::string* err = nullptr) {
    json_tokener* tok = json_tokener_new();
    if (!tok) {
        if (err) *err = "out of memory";
        return Doc{};
    }
    // The terminating NUL is part of the input so a bare top-level scalar
    // ("42", "true") is seen to end.
    const int len = static_cast<int>(std::min(json.size() + 1, static_cast<size_t>(INT_MAX)));
    json_object* obj = json_tokener_parse_ex(tok, json.c_str(), len);
    json_tokener_error jerr = json_tokener_get_error(tok);
    if (jerr == json_tokener_success && json_tokener_get_parse_end(tok) < json.size()) {
        // Trailing content after the first value.
        const std::string rest = json.substr(json_tokener_get_parse_end(tok));
        if (rest.find_first_not_of(" \t\r\n") != std::string::npos) {
            json_tokener_free(tok);
            if (obj) json_object_put(obj);
            if (err) *err = "unexpected trailing content";
            return Doc{};
        }
    }
    json_tokener_free(tok);
    if (jerr != json_tokener_success) {
        if (obj) json_object_put(obj);
        if (err) {
            *err = (jerr == json_tokener_continue) ? "unexpected end of input" : json_tokener_error_desc(jerr);
        }
        return Doc{};
    }
    if (!obj && err) *err = "document is null";
    return Doc{obj};
}

inline std::optional<std::string> get_string(json_object* o, const char* key) {
    if (!o || !json_object_is_type(o, json_type_object)) return std::nullopt;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, key, &v)) return std::nullopt;
    if (!json_object_is_type(v, json_type_string)) return std::nullopt;
    return std::string(json_object_get_string(v), static_cast<size_t>(json_object_get_string_len(v)));
}

inline std::optional<int64_t> get_int(json_object* o, const char* key) {
    if (!o || !json_object_is_type(o, json_type_object)) return std::nullopt;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, key, &v)) return std::nullopt;
    if (!json_object_is_type(v, json_type_int)) return std::nullopt;
    return static_cast<int64_t>(json_object_get_int64(v));
}

// Borrowed pointer to an array member, or nullptr.
inline json_object* get_array(json_object* o, const char* key) {
    if (!o || !json_object_is_type(o, json_type_object)) return nullptr;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, key, &v)) return nullptr;
    if (!json_object_is_type(v, json_type_array)) return nullptr;
    return v;
}

// Borrowed pointer to an object member, or nullptr.
inline json_object* get_object(json_object* o, const char* key) {
    if (!o || !json_object_is_type(o, json_type_object)) return nullptr;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, key, &v)) return nullptr;
    if (!json_object_is_type(v, json_type_object)) return nullptr;
    return v;
}

inline std::vector<json_object*> array_objects(json_object* arr) {
    std::vector<json_object*> out;
    if (!arr || !json_object_is_type(arr, json_type_array)) return out;
    const size_t n = json_object_array_length(arr);
    out.reserve(n);
    for (size_t i = 0; i < n; i++) {
        json_object* el = json_object_array_get_idx(arr, i);
        if (el && json_object_is_type(el, json_type_object)) out.push_back(el);
    }
    return out;
}

} // namespace pactforge::json_mini
