#pragma once
#include "config.h"
#include "types.h"

#include <json-c/json.h>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pactforge {

struct Request {
    std::string method{"GET"};
    std::string path{"/"};
    std::string query;
    std::map<std::string, std::string> headers;
    std::optional<Node> body;   // may contain matchers
};

struct Response {
    int status{200};
    std::map<std::string, std::string> headers;
    std::optional<Node> body;   // may contain matchers
};

struct Interaction {
    std::string description;
    std::string provider_state;
    Request request;
    Response response;
};

struct PactFile {
    std::string consumer;
    std::string provider;
    std::vector<Interaction> interactions;
    std::string spec_version{"2.0.0"};
};

// Appends an interaction. Throws std::runtime_error on an empty description
// or one already present in the pact.
void add_interaction(PactFile& pact, Interaction interaction);

// "<consumer>-<provider>.json", lowercased, spaces replaced by '_'.
std::string pact_file_name(const PactFile& pact);

// Bodies are built into example documents with their matching rules.
// Caller owns the result.
json_object* pact_file_to_json(const PactFile& pact);
std::string pact_file_to_string(const PactFile& pact, bool pretty);

// Writes the pact into `dir` (created if missing). Returns the written path,
// or an empty string with err filled. With settings.overwrite unset an
// existing file is left alone and reported as an error.
std::string write_pact_file(const PactFile& pact, const std::string& dir,
                            const Settings& settings, std::string* err);

// Reads a pact request document:
// {"consumer","provider","interactions":[{"description","providerState",
//   "request":{"method","path","query","headers","body"},
//   "response":{"status","headers","body"}}]}
// Bodies use the matcher-tree encoding (see serialization.h).
bool load_pact_request(const std::string& text, PactFile* out, std::string* err);

} // namespace pactforge
