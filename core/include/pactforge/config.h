#pragma once
#include <string>

namespace pactforge {

enum class Profile { DEV, CI };

// Detect profile from PACTFORGE_PROFILE env var. Default: DEV.
Profile detect_profile();

// Returns string name of profile.
const char* profile_name(Profile p);

// Apply profile defaults: sets env vars that are not already set.
// DEV: pretty output, pact files are overwritten
// CI:  compact output, an existing pact file is never replaced
void apply_profile_defaults(Profile p);

struct Settings {
    std::string pact_dir{"pacts"};       // PACTFORGE_PACT_DIR
    std::string spec_version{"2.0.0"};   // PACTFORGE_SPEC_VERSION
    std::string log_path;                // PACTFORGE_LOG (empty = no log)
    bool pretty{true};                   // PACTFORGE_PRETTY
    bool overwrite{true};                // PACTFORGE_OVERWRITE
};

// Reads Settings from the environment; unset or empty vars keep defaults.
Settings load_settings();

} // namespace pactforge
