#include "runner_utils.h"

#include <json-c/json.h>

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace pactforge {

std::string slurp(const std::string& path) {
    std::ifstream f(path);
    if (!f) throw std::runtime_error("cannot open: " + path);
    std::stringstream ss; ss << f.rdbuf();
    return ss.str();
}

void CliContext::event(const std::string& name, const std::string& payload_json) const {
    if (log) log->event(name, payload_json);
}

CliContext make_context() {
    Profile p = detect_profile();
    apply_profile_defaults(p);

    CliContext ctx;
    ctx.settings = load_settings();
    if (!ctx.settings.log_path.empty()) {
        LogHeader hdr;
        hdr.tool = "pactforge_cli";
        ctx.log = std::make_unique<JsonlLogger>(hdr, ctx.settings.log_path);
        if (!ctx.log->is_open()) {
            std::cerr << "[warn] cannot open log " << ctx.settings.log_path << ", events disabled\n";
            ctx.log.reset();
        }
    }
    return ctx;
}

std::string json_quote(const std::string& s) {
    json_object* o = json_object_new_string_len(s.data(), static_cast<int>(s.size()));
    std::string out = json_object_to_json_string_ext(o, JSON_C_TO_STRING_PLAIN | JSON_C_TO_STRING_NOSLASHESCAPE);
    json_object_put(o);
    return out;
}

} // namespace pactforge
