#include "runner_utils.h"

#include "pactforge/body_builder.h"
#include "pactforge/errors.h"
#include "pactforge/pact_file.h"
#include "pactforge/schema.h"
#include "pactforge/serialization.h"
#include "pactforge/synthesize.h"

#include <iostream>
#include <stdexcept>
#include <string>

using namespace pactforge;

static bool read_input(const std::string& path, std::string* out) {
    try {
        *out = slurp(path);
        return true;
    } catch (const std::runtime_error& e) {
        std::cerr << "[pactforge] " << e.what() << "\n";
        return false;
    }
}

static int print_fixture(const CliContext& ctx, const std::string& source, const Node& tree) {
    PactBody b = build_pact_body(tree);
    std::cout << pact_body_to_string(b, ctx.settings.pretty) << "\n";
    ctx.event("fixture_built", "{\"source\":" + json_quote(source) +
                               ",\"rules\":" + std::to_string(b.matching_rules.size()) + "}");
    return kExitOk;
}

// Usage: pactforge_cli body <tree.json>
// The file holds a matcher tree in json_class encoding.
static int cmd_body(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: pactforge_cli body <tree.json>\n";
        return kExitUsage;
    }
    CliContext ctx = make_context();
    std::string text;
    if (!read_input(argv[2], &text)) return kExitInput;

    Node tree;
    std::string err;
    if (!parse_node(text, &tree, &err)) {
        std::cerr << "[pactforge] " << argv[2] << ": " << err << "\n";
        return kExitInput;
    }
    return print_fixture(ctx, argv[2], tree);
}

// Usage: pactforge_cli synth <schema.json> <TypeName>
static int cmd_synth(int argc, char** argv) {
    if (argc < 4) {
        std::cerr << "usage: pactforge_cli synth <schema.json> <TypeName>\n";
        return kExitUsage;
    }
    CliContext ctx = make_context();
    const std::string type = argv[3];

    SchemaRegistry reg;
    try {
        reg.loadSchemaManifest(argv[2]);
    } catch (const std::exception& e) {
        std::cerr << "[pactforge] " << argv[2] << ": " << e.what() << "\n";
        return kExitInput;
    }
    if (!reg.getType(type)) {
        std::cerr << "[pactforge] unknown type: " << type << "\n";
        return kExitInput;
    }

    Node tree;
    try {
        tree = match(reg, type);
    } catch (const PactError& e) {
        std::cerr << "[pactforge] " << e.what() << "\n";
        ctx.event("synthesis_failed", "{\"type\":" + json_quote(type) + ",\"error\":" + json_quote(e.what()) + "}");
        return kExitSynthesis;
    }
    return print_fixture(ctx, type, tree);
}

// Usage: pactforge_cli pact <request.json>
static int cmd_pact(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: pactforge_cli pact <request.json>\n";
        return kExitUsage;
    }
    CliContext ctx = make_context();
    std::string text;
    if (!read_input(argv[2], &text)) return kExitInput;

    PactFile pact;
    std::string err;
    if (!load_pact_request(text, &pact, &err)) {
        std::cerr << "[pactforge] " << argv[2] << ": " << err << "\n";
        return kExitInput;
    }
    pact.spec_version = ctx.settings.spec_version;

    const std::string path = write_pact_file(pact, ctx.settings.pact_dir, ctx.settings, &err);
    if (path.empty()) {
        std::cerr << "[pactforge] " << err << "\n";
        return kExitInput;
    }
    ctx.event("pact_written", "{\"path\":" + json_quote(path) +
                              ",\"interactions\":" + std::to_string(pact.interactions.size()) + "}");
    std::cout << path << "\n";
    return kExitOk;
}

// Usage: pactforge_cli check <schema.json>
static int cmd_check(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: pactforge_cli check <schema.json>\n";
        return kExitUsage;
    }
    auto issues = check_schema_manifest(argv[2]);
    if (issues.empty()) {
        std::cout << "schema: OK\n";
        return kExitOk;
    }
    for (auto& i : issues) std::cout << "schema issue " << i.code << ": " << i.message << "\n";
    return kExitIssues;
}

// Usage: pactforge_cli format <file.json>
static int cmd_format(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: pactforge_cli format <file.json>\n";
        return kExitUsage;
    }
    std::string text;
    if (!read_input(argv[2], &text)) return kExitInput;

    std::string out, err;
    if (!format_json(text, &out, &err)) {
        std::cerr << "[pactforge] " << argv[2] << ": " << err << "\n";
        return kExitInput;
    }
    std::cout << out << "\n";
    return kExitOk;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "pactforge_cli <body|synth|pact|check|format> ...\n";
        return kExitUsage;
    }
    std::string cmd = argv[1];
    if (cmd == "body") return cmd_body(argc, argv);
    if (cmd == "synth") return cmd_synth(argc, argv);
    if (cmd == "pact") return cmd_pact(argc, argv);
    if (cmd == "check") return cmd_check(argc, argv);
    if (cmd == "format") return cmd_format(argc, argv);
    std::cerr << "unknown command: " << cmd << "\n";
    return kExitUsage;
}
