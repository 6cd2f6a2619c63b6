#include "test_common.h"
#include "pactforge/errors.h"
#include "pactforge/schema.h"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

using namespace pactforge;
namespace fs = std::filesystem;

static const char* kUserSchema = R"({
  "schema_id": "users.v1",
  "types": [
    {"name": "Address", "fields": [
      {"name": "Street", "json": "street", "type": "string"},
      {"name": "Zip", "json": "zip,omitempty", "type": "*uint32"}
    ]},
    {"name": "User", "fields": [
      {"name": "ID", "json": "id", "type": "int64", "pact": "example=7"},
      {"name": "Tags", "json": "tags", "type": "[]string", "pact": "min=2"},
      {"name": "Home", "type": "*Address"},
      {"name": "Grid", "json": "grid", "type": "[3][2]float64"},
      {"name": "Extra", "json": "-", "type": "map[string]any"}
    ]}
  ]
})";

static fs::path write_temp(const std::string& name, const std::string& body) {
    fs::path dir = fs::temp_directory_path() / "pactforge_test_schema";
    fs::create_directories(dir);
    fs::path p = dir / name;
    std::ofstream f(p);
    f << body;
    return p;
}

static void test_type_builders() {
    expect_eq_str(type_name(*slice_of(string_type())), "[]string", "name: slice");
    expect_eq_str(type_name(*array_of(int_type(), 3)), "[3]int", "name: array");
    expect_true(type_name(*map_of(string_type(), int_type(TypeKind::INT64))) == "map[string]int64", "name: map");
    expect_true(type_name(*pointer_to(struct_type("User", {}))) == "*User", "name: pointer");
    expect_true(type_name(*interface_type()) == "interface{}", "name: interface");

    TypePtr pp = pointer_to(pointer_to(bool_type()));
    expect_true(deref(*pp).kind == TypeKind::BOOL, "deref follows every pointer");

    bool threw = false;
    try {
        (void)int_type(TypeKind::STRING);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    expect_true(threw, "int_type rejects non-integer kinds");
}

static void test_wire_name() {
    FieldDesc f;
    f.name = "UserID";
    expect_true(f.wire_name() == "UserID", "wire: falls back to field name");
    f.json_tag = "user_id,omitempty";
    expect_true(f.wire_name() == "user_id", "wire: tag before comma");
    f.json_tag = ",omitempty";
    expect_true(f.wire_name() == "UserID", "wire: empty tag name");
    f.json_tag = "-";
    expect_true(f.omitted(), "wire: dash omits");
}

static void test_load_json() {
    SchemaRegistry reg;
    reg.loadSchemaJson(kUserSchema);

    auto names = reg.allTypeNames();
    expect_eq_ll((long long)names.size(), 2, "load: two types");
    expect_true(names[0] == "Address" && names[1] == "User", "load: sorted names");

    TypePtr user = reg.getType("User");
    expect_true(user != nullptr, "load: User present");
    expect_eq_ll((long long)user->fields.size(), 5, "load: User fields");
    expect_true(user->fields[0].pact_tag == "example=7", "load: pact tag kept");
    expect_true(user->fields[1].type->kind == TypeKind::SLICE, "load: slice field");
    expect_true(type_name(*user->fields[2].type) == "*Address", "load: pointer to earlier type");
    expect_true(user->fields[2].wire_name() == "Home", "load: no json tag");
    expect_true(type_name(*user->fields[3].type) == "[3][2]float64", "load: nested arrays");
    expect_true(user->fields[4].omitted(), "load: omitted field");

    expect_true(reg.getType("Nope") == nullptr, "load: unknown is null");
}

static void test_parse_type_expr() {
    SchemaRegistry reg;
    reg.loadSchemaJson(kUserSchema);
    expect_true(reg.parseTypeExpr("byte")->kind == TypeKind::UINT8, "expr: byte");
    expect_true(reg.parseTypeExpr(" []*User ")->elem->kind == TypeKind::POINTER, "expr: slice of pointer");
    expect_true(reg.parseTypeExpr("map[string][]int")->elem->kind == TypeKind::SLICE, "expr: map value");

    const char* bad[] = {"", "[x]int", "[3int", "Unknown", "map[string"};
    for (const char* b : bad) {
        bool threw = false;
        try {
            (void)reg.parseTypeExpr(b);
        } catch (const std::runtime_error&) {
            threw = true;
        }
        expect_true(threw, std::string("expr: should reject '") + b + "'");
    }
}

static void test_forward_reference_rejected() {
    SchemaRegistry reg;
    bool threw = false;
    try {
        reg.loadSchemaJson(R"({"types":[{"name":"A","fields":[{"name":"b","type":"B"}]},{"name":"B","fields":[]}]})");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    expect_true(threw, "types must be defined before use");
}

static void test_duplicate_registration() {
    SchemaRegistry reg;
    reg.registerType(struct_type("T", {}));

    bool threw = false;
    try {
        reg.registerType(struct_type("T", {}), false);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    expect_true(threw, "duplicate: should throw without allow_override");

    FieldDesc f;
    f.name = "x";
    f.type = string_type();
    reg.registerType(struct_type("T", {f}), true);
    expect_eq_ll((long long)reg.getType("T")->fields.size(), 1, "duplicate: override replaced");

    threw = false;
    try {
        reg.registerType(string_type());
    } catch (const std::runtime_error&) {
        threw = true;
    }
    expect_true(threw, "only named structs can be registered");
}

static void test_malformed_json() {
    SchemaRegistry reg;
    bool threw = false;
    try {
        reg.loadSchemaJson("{\"types\": [");
    } catch (const MalformedDocument& e) {
        threw = std::string(e.what()).find("malformed document") == 0;
    }
    expect_true(threw, "malformed: MalformedDocument");

    threw = false;
    try {
        reg.loadSchemaJson("[1,2]");
    } catch (const MalformedDocument&) {
        threw = true;
    }
    expect_true(threw, "malformed: non-object root");
}

static void test_manifest_file() {
    fs::path p = write_temp("users.json", kUserSchema);
    SchemaRegistry reg;
    reg.loadSchemaManifest(p.string());
    expect_true(reg.getType("User") != nullptr, "manifest: loaded from file");
    expect_true(check_schema_manifest(p.string()).empty(), "manifest: no issues");

    bool threw = false;
    try {
        reg.loadSchemaManifest((p.parent_path() / "missing.json").string());
    } catch (const std::runtime_error&) {
        threw = true;
    }
    expect_true(threw, "manifest: missing file throws");
}

static void test_check_issues() {
    auto codes = [](const std::string& body) {
        std::string out;
        for (const auto& i : check_schema_manifest(write_temp("check.json", body).string())) {
            if (!out.empty()) out += ",";
            out += i.code;
        }
        return out;
    };
    expect_true(codes("{}") == "SC-01,SC-02", "check: empty object");
    expect_true(codes(R"({"schema_id":"s","types":{}})") == "SC-03", "check: types not array");
    expect_true(codes(R"({"schema_id":"s","types":[{"fields":[]}]})") == "SC-04", "check: nameless type");
    expect_true(codes(R"({"schema_id":"s","types":[{"name":"T","fields":[{"name":"x"}]}]})") == "SC-05",
                "check: field without type");
    expect_true(codes("not json") == "SC-00", "check: unparsable");

    auto missing = check_schema_manifest("/nonexistent/pactforge/schema.json");
    expect_true(missing.size() == 1 && missing[0].code == "SC-00", "check: missing file");
}

int main() {
    test_type_builders();
    test_wire_name();
    test_load_json();
    test_parse_type_expr();
    test_forward_reference_rejected();
    test_duplicate_registration();
    test_malformed_json();
    test_manifest_file();
    test_check_issues();

    std::error_code ec;
    fs::remove_all(fs::temp_directory_path() / "pactforge_test_schema", ec);

    std::cout << "ALL SCHEMA TESTS PASSED\n";
    return 0;
}
