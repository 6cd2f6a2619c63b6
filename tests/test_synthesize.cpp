#include "test_common.h"
#include "pactforge/body_builder.h"
#include "pactforge/errors.h"
#include "pactforge/synthesize.h"

#include <stdexcept>
#include <string>
#include <utility>

using namespace pactforge;

static FieldDesc field(const std::string& name, const std::string& json, TypePtr type,
                       const std::string& pact = "") {
    FieldDesc f;
    f.name = name;
    f.json_tag = json;
    f.pact_tag = pact;
    f.type = std::move(type);
    return f;
}

static void test_defaults() {
    expect_true(match(*string_type()) == like("string"), "default string");
    expect_true(match(*bool_type()) == like(true), "default bool");
    expect_true(match(*int_type(TypeKind::UINT16)) == like(int64_t{1}), "default integer");
    expect_true(match(*float_type(TypeKind::FLOAT32)) == like(1.1), "default float");
    expect_true(match(*slice_of(string_type())) == each_like(like("string"), 1), "default slice");
    expect_true(match(*array_of(int_type(), 4)) == each_like(like(int64_t{1}), 1), "default array");
    expect_true(match(*pointer_to(bool_type())) == like(true), "pointer is transparent");
}

static void test_struct_fields() {
    TypePtr inner = struct_type("Inner", {field("Flag", "flag", bool_type())});
    TypePtr outer = struct_type("Outer", {
        field("Name", "name,omitempty", string_type(), "example=billy"),
        field("Age", "", int_type(), "example=0"),
        field("Ratio", "ratio", float_type(), "example=2.5"),
        field("Inner", "inner", pointer_to(inner)),
        field("Skip", "-", map_of(string_type(), string_type())),
    });

    Matcher m = match(*outer);
    expect_true(m.kind() == MatcherKind::NESTED_OBJECT, "struct: nested object");

    Matcher want = struct_matcher({
        {"name", like("billy")},
        {"Age", like(int64_t{0})},
        {"ratio", like(2.5)},
        {"inner", struct_matcher({{"flag", like(true)}})},
    });
    expect_true(m == want, "struct: field matchers keyed by wire name");
}

static void test_annotated_min_and_regex() {
    TypePtr item = struct_type("Item", {
        field("Date", "date", string_type(), "example=2000-01-01,regex=^\\d{4}-\\d{2}-\\d{2}$"),
    });
    TypePtr root = struct_type("Root", {field("Items", "items", slice_of(item), "min=2")});

    PactBody b = build_pact_body(match(*root));

    MatchingRule min2;
    min2.min = 2;
    expect_true(b.matching_rules.at("$.body.items") == min2, "min=2 on the sequence path");

    MatchingRule re;
    re.match = "regex";
    re.regex = "^\\d{4}-\\d{2}-\\d{2}$";
    expect_true(b.matching_rules.at("$.body.items[*].date") == re, "regex on the nested string path");

    const Node& items = b.body.object.at("items");
    expect_eq_ll((long long)items.array.size(), 2, "two items materialized");
    expect_true(items.array[0].object.at("date") == Node("2000-01-01"), "regex example used");
}

static void test_sequence_elements_use_defaults() {
    TypePtr t = struct_type("T", {field("Ids", "ids", slice_of(int_type()), "min=3")});
    PactBody b = build_pact_body(match(*t));
    expect_true(b.body.object.at("ids") == Node::array_of({int64_t{1}, int64_t{1}, int64_t{1}}), "element default");
}

static void test_unsupported_kinds() {
    TypePtr t = struct_type("Bad", {
        field("Name", "name", string_type()),
        field("Meta", "meta", map_of(string_type(), string_type())),
    });
    try {
        (void)match(*t);
        die("map field should not synthesize");
    } catch (const UnsupportedTypeKind& e) {
        expect_true(e.type_expr() == "map[string]string", "unsupported: names the type");
    }

    bool threw = false;
    try {
        (void)match(*slice_of(interface_type()));
    } catch (const UnsupportedTypeKind&) {
        threw = true;
    }
    expect_true(threw, "unsupported: interface element");
}

static void test_invalid_annotation() {
    TypePtr t = struct_type("T", {field("Tags", "tags", slice_of(string_type()), "min=abc")});
    bool threw = false;
    try {
        (void)match(*t);
    } catch (const InvalidAnnotation& e) {
        threw = e.annotation() == "min=abc";
    }
    expect_true(threw, "min=abc fails with InvalidAnnotation");

    TypePtr r = struct_type("R", {field("S", "s", string_type(), "example=x,regex=")});
    threw = false;
    try {
        (void)match(*r);
    } catch (const InvalidAnnotation&) {
        threw = true;
    }
    expect_true(threw, "empty regex fails");
}

static void test_registry_lookup() {
    SchemaRegistry reg;
    reg.loadSchemaJson(R"({"schema_id":"s","types":[
        {"name":"User","fields":[
            {"name":"ID","json":"id","type":"int","pact":"example=127"},
            {"name":"Emails","json":"emails","type":"[]string","pact":"min=1"}
        ]}
    ]})");

    PactBody b = build_pact_body(match(reg, "User"));
    expect_true(b.body.object.at("id") == Node(int64_t{127}), "registry: annotated example");
    expect_true(b.matching_rules.count("$.body.id") == 1, "registry: id rule");
    expect_true(b.matching_rules.count("$.body.emails[*]") == 1, "registry: element rule");

    bool threw = false;
    try {
        (void)match(reg, "Missing");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    expect_true(threw, "registry: unknown type throws");
}

int main() {
    test_defaults();
    test_struct_fields();
    test_annotated_min_and_regex();
    test_sequence_elements_use_defaults();
    test_unsupported_kinds();
    test_invalid_annotation();
    test_registry_lookup();

    std::cout << "ALL SYNTHESIZE TESTS PASSED\n";
    return 0;
}
