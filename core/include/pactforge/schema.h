#pragma once
#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace pactforge {

// Field kinds of an explicit schema description.
// MAP and INTERFACE describe real message shapes but cannot be synthesized.
enum class TypeKind {
    POINTER,
    SLICE,
    ARRAY,
    STRUCT,
    STRING,
    BOOL,
    INT, INT8, INT16, INT32, INT64,
    UINT, UINT8, UINT16, UINT32, UINT64,
    FLOAT32, FLOAT64,
    MAP,
    INTERFACE
};

bool is_integer_kind(TypeKind k);
bool is_unsigned_kind(TypeKind k);
bool is_float_kind(TypeKind k);
bool is_sequence_kind(TypeKind k);

struct TypeDesc;
using TypePtr = std::shared_ptr<const TypeDesc>;

struct FieldDesc {
    std::string name;
    std::string json_tag;   // e.g. "user_id,omitempty"; "-" drops the field
    std::string pact_tag;   // annotation, e.g. "min=2"
    TypePtr type;

    // Key used in the generated document.
    std::string wire_name() const;
    bool omitted() const;
};

struct TypeDesc {
    TypeKind kind{TypeKind::STRING};
    std::string name;              // STRUCT only
    TypePtr elem;                  // POINTER / SLICE / ARRAY element, MAP value
    TypePtr key;                   // MAP key
    size_t length{0};              // ARRAY only
    std::vector<FieldDesc> fields; // STRUCT only
};

TypePtr string_type();
TypePtr bool_type();
TypePtr int_type(TypeKind kind = TypeKind::INT);
TypePtr float_type(TypeKind kind = TypeKind::FLOAT64);
TypePtr pointer_to(TypePtr elem);
TypePtr slice_of(TypePtr elem);
TypePtr array_of(TypePtr elem, size_t length);
TypePtr map_of(TypePtr key, TypePtr value);
TypePtr interface_type();
TypePtr struct_type(const std::string& name, std::vector<FieldDesc> fields);

// Go-like type expression: "[]string", "*User", "[3]int", "map[string]int".
std::string type_name(const TypeDesc& t);

// Follows pointers down to the first non-pointer type.
const TypeDesc& deref(const TypeDesc& t);

struct SchemaIssue {
    std::string code;
    std::string message;
};

// Lightweight manifest checks (no type resolution).
std::vector<SchemaIssue> check_schema_manifest(const std::string& manifest_path);

// Named struct types available to the synthesizer.
class SchemaRegistry {
public:
    // Load types from a schema manifest JSON file.
    void loadSchemaManifest(const std::string& path);
    void loadSchemaJson(const std::string& json);

    // If allow_override is false, duplicate names throw.
    void registerType(const TypePtr& type, bool allow_override = false);

    TypePtr getType(const std::string& name) const;
    std::vector<std::string> allTypeNames() const;

    // Parses a type expression against the registered names.
    TypePtr parseTypeExpr(const std::string& expr) const;

private:
    std::unordered_map<std::string, TypePtr> types_;
};

} // namespace pactforge
