#pragma once
#include <cstdint>
#include <fstream>
#include <string>

namespace pactforge {

struct LogHeader {
    std::string tool{"pactforge"};
    std::string run_id;   // make_run_id() when empty
};

// Random 32-hex-digit id. PACTFORGE_DETERMINISTIC_RUN_ID=1 fixes the seed.
std::string make_run_id();

// Append-only JSONL event log. Every line is a key-sorted JSON object:
// {"event","payload","run_id","seq","tool","ts"}.
class JsonlLogger {
public:
    JsonlLogger(const LogHeader& hdr, const std::string& path);
    bool is_open() const { return out_.is_open(); }

    // payload_json is embedded as JSON when it parses, else as a string.
    void event(const std::string& name, const std::string& payload_json);

    const std::string& path() const { return path_; }
    const std::string& run_id() const { return hdr_.run_id; }

private:
    LogHeader hdr_;
    std::string path_;
    std::ofstream out_;
    int64_t seq_{0};
};

} // namespace pactforge
