#include "pactforge/schema.h"
#include "pactforge/errors.h"
#include "pactforge/json_mini.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace pactforge {

bool is_integer_kind(TypeKind k) {
    switch (k) {
        case TypeKind::INT: case TypeKind::INT8: case TypeKind::INT16:
        case TypeKind::INT32: case TypeKind::INT64:
        case TypeKind::UINT: case TypeKind::UINT8: case TypeKind::UINT16:
        case TypeKind::UINT32: case TypeKind::UINT64:
            return true;
        default:
            return false;
    }
}

bool is_unsigned_kind(TypeKind k) {
    switch (k) {
        case TypeKind::UINT: case TypeKind::UINT8: case TypeKind::UINT16:
        case TypeKind::UINT32: case TypeKind::UINT64:
            return true;
        default:
            return false;
    }
}

bool is_float_kind(TypeKind k) {
    return k == TypeKind::FLOAT32 || k == TypeKind::FLOAT64;
}

bool is_sequence_kind(TypeKind k) {
    return k == TypeKind::SLICE || k == TypeKind::ARRAY;
}

std::string FieldDesc::wire_name() const {
    std::string tag = json_tag.substr(0, json_tag.find(','));
    if (tag.empty()) return name;
    return tag;
}

bool FieldDesc::omitted() const {
    return json_tag == "-";
}

// --- builders ---

static TypePtr make_type(TypeKind kind) {
    auto t = std::make_shared<TypeDesc>();
    t->kind = kind;
    return t;
}

TypePtr string_type() { return make_type(TypeKind::STRING); }
TypePtr bool_type() { return make_type(TypeKind::BOOL); }

TypePtr int_type(TypeKind kind) {
    if (!is_integer_kind(kind)) throw std::invalid_argument("int_type: not an integer kind");
    return make_type(kind);
}

TypePtr float_type(TypeKind kind) {
    if (!is_float_kind(kind)) throw std::invalid_argument("float_type: not a float kind");
    return make_type(kind);
}

TypePtr pointer_to(TypePtr elem) {
    if (!elem) throw std::invalid_argument("pointer_to: null element type");
    auto t = std::make_shared<TypeDesc>();
    t->kind = TypeKind::POINTER;
    t->elem = std::move(elem);
    return t;
}

TypePtr slice_of(TypePtr elem) {
    if (!elem) throw std::invalid_argument("slice_of: null element type");
    auto t = std::make_shared<TypeDesc>();
    t->kind = TypeKind::SLICE;
    t->elem = std::move(elem);
    return t;
}

TypePtr array_of(TypePtr elem, size_t length) {
    if (!elem) throw std::invalid_argument("array_of: null element type");
    auto t = std::make_shared<TypeDesc>();
    t->kind = TypeKind::ARRAY;
    t->elem = std::move(elem);
    t->length = length;
    return t;
}

TypePtr map_of(TypePtr key, TypePtr value) {
    if (!key || !value) throw std::invalid_argument("map_of: null key or value type");
    auto t = std::make_shared<TypeDesc>();
    t->kind = TypeKind::MAP;
    t->key = std::move(key);
    t->elem = std::move(value);
    return t;
}

TypePtr interface_type() { return make_type(TypeKind::INTERFACE); }

TypePtr struct_type(const std::string& name, std::vector<FieldDesc> fields) {
    for (const auto& f : fields) {
        if (!f.type) throw std::invalid_argument("struct_type: field without type: " + name + "." + f.name);
    }
    auto t = std::make_shared<TypeDesc>();
    t->kind = TypeKind::STRUCT;
    t->name = name;
    t->fields = std::move(fields);
    return t;
}

static const char* scalar_name(TypeKind k) {
    switch (k) {
        case TypeKind::STRING:  return "string";
        case TypeKind::BOOL:    return "bool";
        case TypeKind::INT:     return "int";
        case TypeKind::INT8:    return "int8";
        case TypeKind::INT16:   return "int16";
        case TypeKind::INT32:   return "int32";
        case TypeKind::INT64:   return "int64";
        case TypeKind::UINT:    return "uint";
        case TypeKind::UINT8:   return "uint8";
        case TypeKind::UINT16:  return "uint16";
        case TypeKind::UINT32:  return "uint32";
        case TypeKind::UINT64:  return "uint64";
        case TypeKind::FLOAT32: return "float32";
        case TypeKind::FLOAT64: return "float64";
        case TypeKind::INTERFACE: return "interface{}";
        default: return nullptr;
    }
}

std::string type_name(const TypeDesc& t) {
    switch (t.kind) {
        case TypeKind::POINTER: return "*" + (t.elem ? type_name(*t.elem) : std::string("?"));
        case TypeKind::SLICE:   return "[]" + (t.elem ? type_name(*t.elem) : std::string("?"));
        case TypeKind::ARRAY:
            return "[" + std::to_string(t.length) + "]" + (t.elem ? type_name(*t.elem) : std::string("?"));
        case TypeKind::MAP:
            return "map[" + (t.key ? type_name(*t.key) : std::string("?")) + "]" +
                   (t.elem ? type_name(*t.elem) : std::string("?"));
        case TypeKind::STRUCT:
            return t.name.empty() ? std::string("struct{}") : t.name;
        default: {
            const char* n = scalar_name(t.kind);
            return n ? n : "?";
        }
    }
}

const TypeDesc& deref(const TypeDesc& t) {
    const TypeDesc* cur = &t;
    while (cur->kind == TypeKind::POINTER && cur->elem) cur = cur->elem.get();
    return *cur;
}

// --- manifest checks ---

static std::string slurp(const std::string& path) {
    std::ifstream f(path);
    if (!f) throw std::runtime_error("SchemaRegistry: cannot open " + path);
    std::stringstream ss; ss << f.rdbuf();
    return ss.str();
}

std::vector<SchemaIssue> check_schema_manifest(const std::string& manifest_path) {
    std::vector<SchemaIssue> issues;
    std::ifstream f(manifest_path);
    if (!f) {
        issues.push_back({"SC-00", "cannot open " + manifest_path});
        return issues;
    }
    std::stringstream ss; ss << f.rdbuf();
    std::string perr;
    json_mini::Doc d = json_mini::parse(ss.str(), &perr);
    if (!d || !json_object_is_type(d.root, json_type_object)) {
        issues.push_back({"SC-00", "not a JSON object: " + (perr.empty() ? std::string("wrong type") : perr)});
        return issues;
    }

    if (!json_mini::get_string(d.root, "schema_id")) issues.push_back({"SC-01", "missing schema_id"});

    json_object* types = nullptr;
    if (!json_object_object_get_ex(d.root, "types", &types)) {
        issues.push_back({"SC-02", "missing types[]"});
        return issues;
    }
    if (!json_object_is_type(types, json_type_array)) {
        issues.push_back({"SC-03", "types is not an array"});
        return issues;
    }

    for (json_object* t : json_mini::array_objects(types)) {
        auto name = json_mini::get_string(t, "name");
        if (!name || name->empty()) {
            issues.push_back({"SC-04", "type without name"});
            continue;
        }
        for (json_object* fld : json_mini::array_objects(json_mini::get_array(t, "fields"))) {
            auto ftype = json_mini::get_string(fld, "type");
            if (!ftype || ftype->empty()) {
                auto fname = json_mini::get_string(fld, "name");
                issues.push_back({"SC-05", "field without type: " + *name + "." + fname.value_or("<unknown>")});
            }
        }
    }
    return issues;
}

// --- registry ---

void SchemaRegistry::loadSchemaManifest(const std::string& path) {
    loadSchemaJson(slurp(path));
}

void SchemaRegistry::loadSchemaJson(const std::string& json) {
    std::string perr;
    json_mini::Doc d = json_mini::parse(json, &perr);
    if (!d) throw MalformedDocument("schema manifest: " + perr);
    if (!json_object_is_type(d.root, json_type_object)) {
        throw MalformedDocument("schema manifest: root is not an object");
    }

    json_object* types = json_mini::get_array(d.root, "types");
    if (!types) return;

    // Types resolve in file order, so a type may only use earlier ones.
    for (json_object* tj : json_mini::array_objects(types)) {
        std::string name = json_mini::get_string(tj, "name").value_or("");
        if (name.empty()) continue;

        std::vector<FieldDesc> fields;
        for (json_object* fj : json_mini::array_objects(json_mini::get_array(tj, "fields"))) {
            FieldDesc fd;
            fd.name = json_mini::get_string(fj, "name").value_or("");
            fd.json_tag = json_mini::get_string(fj, "json").value_or("");
            fd.pact_tag = json_mini::get_string(fj, "pact").value_or("");
            auto expr = json_mini::get_string(fj, "type");
            if (!expr || expr->empty()) {
                throw std::runtime_error("SchemaRegistry: field without type: " + name + "." + fd.name);
            }
            if (fd.name.empty() && fd.json_tag.empty()) {
                throw std::runtime_error("SchemaRegistry: field without name in " + name);
            }
            fd.type = parseTypeExpr(*expr);
            fields.push_back(std::move(fd));
        }
        registerType(struct_type(name, std::move(fields)));
    }
}

void SchemaRegistry::registerType(const TypePtr& type, bool allow_override) {
    if (!type || type->kind != TypeKind::STRUCT || type->name.empty()) {
        throw std::runtime_error("SchemaRegistry: only named struct types can be registered");
    }
    auto it = types_.find(type->name);
    if (it != types_.end() && !allow_override) {
        throw std::runtime_error("SchemaRegistry: duplicate type: " + type->name);
    }
    types_[type->name] = type;
}

TypePtr SchemaRegistry::getType(const std::string& name) const {
    auto it = types_.find(name);
    if (it != types_.end()) return it->second;
    return nullptr;
}

std::vector<std::string> SchemaRegistry::allTypeNames() const {
    std::vector<std::string> out;
    out.reserve(types_.size());
    for (const auto& kv : types_) out.push_back(kv.first);
    std::sort(out.begin(), out.end());
    return out;
}

static std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) b++;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) e--;
    return s.substr(b, e - b);
}

// Index of the ']' closing the '[' at `open`, or npos.
static size_t closing_bracket(const std::string& s, size_t open) {
    int depth = 0;
    for (size_t i = open; i < s.size(); i++) {
        if (s[i] == '[') depth++;
        if (s[i] == ']' && --depth == 0) return i;
    }
    return std::string::npos;
}

TypePtr SchemaRegistry::parseTypeExpr(const std::string& raw) const {
    const std::string expr = trim(raw);
    if (expr.empty()) throw std::runtime_error("SchemaRegistry: empty type expression");

    if (expr[0] == '*') return pointer_to(parseTypeExpr(expr.substr(1)));

    if (expr.rfind("[]", 0) == 0) return slice_of(parseTypeExpr(expr.substr(2)));

    if (expr[0] == '[') {
        size_t close = closing_bracket(expr, 0);
        if (close == std::string::npos) throw std::runtime_error("SchemaRegistry: unbalanced '[' in " + expr);
        const std::string len = trim(expr.substr(1, close - 1));
        if (len.empty() || !std::all_of(len.begin(), len.end(), [](unsigned char c) { return std::isdigit(c); })) {
            throw std::runtime_error("SchemaRegistry: bad array length in " + expr);
        }
        return array_of(parseTypeExpr(expr.substr(close + 1)), static_cast<size_t>(std::stoull(len)));
    }

    if (expr.rfind("map[", 0) == 0) {
        size_t close = closing_bracket(expr, 3);
        if (close == std::string::npos) throw std::runtime_error("SchemaRegistry: unbalanced '[' in " + expr);
        return map_of(parseTypeExpr(expr.substr(4, close - 4)), parseTypeExpr(expr.substr(close + 1)));
    }

    static const std::unordered_map<std::string, TypeKind> kBuiltins = {
        {"string", TypeKind::STRING}, {"bool", TypeKind::BOOL},
        {"int", TypeKind::INT}, {"int8", TypeKind::INT8}, {"int16", TypeKind::INT16},
        {"int32", TypeKind::INT32}, {"rune", TypeKind::INT32}, {"int64", TypeKind::INT64},
        {"uint", TypeKind::UINT}, {"uint8", TypeKind::UINT8}, {"byte", TypeKind::UINT8},
        {"uint16", TypeKind::UINT16}, {"uint32", TypeKind::UINT32}, {"uint64", TypeKind::UINT64},
        {"float32", TypeKind::FLOAT32}, {"float64", TypeKind::FLOAT64},
        {"interface{}", TypeKind::INTERFACE}, {"any", TypeKind::INTERFACE},
    };
    auto bit = kBuiltins.find(expr);
    if (bit != kBuiltins.end()) return make_type(bit->second);

    TypePtr named = getType(expr);
    if (!named) throw std::runtime_error("SchemaRegistry: unknown type: " + expr);
    return named;
}

} // namespace pactforge
