#include "test_common.h"
#include "pactforge/errors.h"
#include "pactforge/schema.h"
#include "pactforge/tag_params.h"

#include <string>

using namespace pactforge;

// True when parse_tag rejects the annotation with InvalidAnnotation.
static bool rejects(TypeKind kind, const std::string& tag) {
    try {
        (void)parse_tag(kind, tag);
    } catch (const InvalidAnnotation& e) {
        if (e.annotation() != tag) die("InvalidAnnotation should carry the annotation: " + tag);
        return true;
    }
    return false;
}

static void test_empty_annotation() {
    TagParams p = parse_tag(TypeKind::STRING, "");
    expect_eq_ll(p.min, 1, "empty: default min");
    expect_true(!p.example && !p.regex && !p.integer && !p.number && !p.boolean, "empty: nothing set");
}

static void test_string_example() {
    TagParams p = parse_tag(TypeKind::STRING, "example=hello world");
    expect_true(p.example && *p.example == "hello world", "string example");
    expect_true(!p.regex, "string example: no regex");
}

static void test_string_regex() {
    TagParams p = parse_tag(TypeKind::STRING, "example=2000-01-01,regex=^\\d{4}-\\d{2}-\\d{2}$");
    expect_true(p.example && *p.example == "2000-01-01", "regex: example");
    expect_true(p.regex && *p.regex == "^\\d{4}-\\d{2}-\\d{2}$", "regex: pattern");

    // The example ends at the next comma, so "b" is read as a bare key.
    expect_true(rejects(TypeKind::STRING, "example=a,b,regex=^(a|b)$"), "regex: comma inside example");
}

static void test_regex_with_commas() {
    TagParams p = parse_tag(TypeKind::STRING, "example=aa,regex=^a{1,3}$");
    expect_true(p.regex && *p.regex == "^a{1,3}$", "regex keeps commas");
}

static void test_string_errors() {
    expect_true(rejects(TypeKind::STRING, "example=x,regex="), "empty regex");
    expect_true(rejects(TypeKind::STRING, "regex=^a$"), "regex without example");
    expect_true(rejects(TypeKind::STRING, "example="), "empty example");
    expect_true(rejects(TypeKind::STRING, "min=2"), "min on string");
    expect_true(rejects(TypeKind::STRING, "sample=x"), "unknown key");
    expect_true(rejects(TypeKind::STRING, "example=a,example=b"), "duplicate key");
    expect_true(rejects(TypeKind::STRING, "example"), "missing equals");
    expect_true(rejects(TypeKind::STRING, "=x"), "empty key");
    expect_true(rejects(TypeKind::STRING, "example=a,"), "trailing comma");
    expect_true(rejects(TypeKind::STRING, "example=hello, world"), "comma inside an example");
}

static void test_bool() {
    expect_true(*parse_tag(TypeKind::BOOL, "example=false").boolean == false, "bool false");
    expect_true(*parse_tag(TypeKind::BOOL, "example=T").boolean == true, "bool T");
    expect_true(*parse_tag(TypeKind::BOOL, "example=0").boolean == false, "bool 0");
    expect_true(rejects(TypeKind::BOOL, "example=yes"), "bool yes");
    expect_true(rejects(TypeKind::BOOL, "example=x,regex=y"), "regex on bool");
}

static void test_integers() {
    expect_eq_ll(*parse_tag(TypeKind::INT, "example=-42").integer, -42, "int negative");
    expect_eq_ll(*parse_tag(TypeKind::INT64, "example=+7").integer, 7, "int plus sign");
    expect_eq_ll(*parse_tag(TypeKind::INT, "example=0").integer, 0, "int zero honored");
    expect_eq_ll(*parse_tag(TypeKind::UINT8, "example=255").integer, 255, "uint8 max");

    expect_true(rejects(TypeKind::INT8, "example=128"), "int8 overflow");
    expect_true(rejects(TypeKind::UINT8, "example=256"), "uint8 overflow");
    expect_true(rejects(TypeKind::UINT, "example=-1"), "unsigned negative");
    expect_true(rejects(TypeKind::INT, "example=1.5"), "int fraction");
    expect_true(rejects(TypeKind::INT, "example=12abc"), "int trailing junk");
    expect_true(rejects(TypeKind::INT, "example=-"), "sign only");
    expect_true(rejects(TypeKind::INT64, "example=99999999999999999999"), "int64 overflow");
}

static void test_floats() {
    expect_true(*parse_tag(TypeKind::FLOAT64, "example=2.5").number == 2.5, "float");
    expect_true(*parse_tag(TypeKind::FLOAT64, "example=1e3").number == 1000.0, "float exponent");
    expect_true(rejects(TypeKind::FLOAT64, "example=abc"), "float junk");
    expect_true(rejects(TypeKind::FLOAT64, "example=1.5x"), "float trailing junk");
    expect_true(rejects(TypeKind::FLOAT64, "example=inf"), "float infinite");
    expect_true(rejects(TypeKind::FLOAT32, "example=1e39"), "float32 overflow");
}

static void test_min() {
    expect_eq_ll(parse_tag(TypeKind::SLICE, "min=2").min, 2, "slice min");
    expect_eq_ll(parse_tag(TypeKind::ARRAY, "min=0").min, 0, "array min zero");
    expect_true(rejects(TypeKind::SLICE, "min=abc"), "min letters");
    expect_true(rejects(TypeKind::SLICE, "min=-1"), "min negative");
    expect_true(rejects(TypeKind::SLICE, "min=99999999999"), "min overflow");
    expect_true(rejects(TypeKind::SLICE, "example=1"), "example on slice");
}

static void test_struct_and_unsupported() {
    expect_true(rejects(TypeKind::STRUCT, "min=1"), "struct takes no keys");
    expect_true(rejects(TypeKind::MAP, "example=x"), "map takes no keys");
    TagParams p = parse_tag(TypeKind::STRUCT, "");
    expect_eq_ll(p.min, 1, "struct: empty annotation is fine");
}

static void test_pointer_uses_target_kind() {
    TypePtr t = pointer_to(int_type(TypeKind::INT16));
    expect_eq_ll(*parse_tag(*t, "example=300").integer, 300, "pointer to int16");

    bool threw = false;
    try {
        (void)parse_tag(*t, "example=40000");
    } catch (const InvalidAnnotation&) {
        threw = true;
    }
    expect_true(threw, "pointer to int16: range of target kind");
}

static void test_error_message() {
    try {
        (void)parse_tag(TypeKind::SLICE, "min=abc");
        die("min=abc should throw");
    } catch (const InvalidAnnotation& e) {
        const std::string msg = e.what();
        expect_true(msg.find("invalid pact tag \"min=abc\"") != std::string::npos, "message names the tag");
        expect_true(!e.reason().empty(), "reason is set");
    }
}

int main() {
    test_empty_annotation();
    test_string_example();
    test_string_regex();
    test_regex_with_commas();
    test_string_errors();
    test_bool();
    test_integers();
    test_floats();
    test_min();
    test_struct_and_unsupported();
    test_pointer_uses_target_kind();
    test_error_message();

    std::cout << "ALL TAG_PARAMS TESTS PASSED\n";
    return 0;
}
