#pragma once

#include "pactforge/config.h"
#include "pactforge/log.h"

#include <memory>
#include <string>

namespace pactforge {

// Exit codes shared by all commands.
constexpr int kExitOk = 0;
constexpr int kExitIssues = 1;
constexpr int kExitUsage = 2;
constexpr int kExitInput = 3;
constexpr int kExitSynthesis = 4;

// Throws std::runtime_error if the file cannot be read.
std::string slurp(const std::string& path);

struct CliContext {
    Settings settings;
    std::unique_ptr<JsonlLogger> log;   // null when PACTFORGE_LOG is unset

    void event(const std::string& name, const std::string& payload_json) const;
};

// Applies profile defaults, then reads Settings and opens the event log.
CliContext make_context();

// Minimal JSON string quoting for log payloads.
std::string json_quote(const std::string& s);

} // namespace pactforge
