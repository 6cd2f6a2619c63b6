#include "pactforge/config.h"
#include <cstdlib>
#include <algorithm>
#include <cctype>

namespace pactforge {

static std::string lower(std::string val) {
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return val;
}

Profile detect_profile() {
    const char* env = std::getenv("PACTFORGE_PROFILE");
    if (!env) return Profile::DEV;

    std::string val = lower(env);
    if (val == "ci") return Profile::CI;
    return Profile::DEV;
}

const char* profile_name(Profile p) {
    switch (p) {
        case Profile::CI:  return "ci";
        case Profile::DEV: return "dev";
    }
    return "dev";
}

void apply_profile_defaults(Profile p) {
    // SAFETY: Must be called before any worker threads are created.
    // setenv() is not thread-safe with getenv() on some platforms.
    constexpr int NO_OVERWRITE = 0;

    switch (p) {
        case Profile::DEV:
            setenv("PACTFORGE_PRETTY",    "1", NO_OVERWRITE);
            setenv("PACTFORGE_OVERWRITE", "1", NO_OVERWRITE);
            break;

        case Profile::CI:
            setenv("PACTFORGE_PRETTY",    "0", NO_OVERWRITE);
            setenv("PACTFORGE_OVERWRITE", "0", NO_OVERWRITE);
            break;
    }
}

static bool env_flag(const char* key, bool defv) {
    const char* e = std::getenv(key);
    if (!e || !*e) return defv;
    std::string v = lower(e);
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    return defv;
}

static std::string env_str(const char* key, const std::string& defv) {
    const char* e = std::getenv(key);
    if (!e || !*e) return defv;
    return e;
}

Settings load_settings() {
    Settings s;
    s.pact_dir = env_str("PACTFORGE_PACT_DIR", s.pact_dir);
    s.spec_version = env_str("PACTFORGE_SPEC_VERSION", s.spec_version);
    s.log_path = env_str("PACTFORGE_LOG", s.log_path);
    s.pretty = env_flag("PACTFORGE_PRETTY", s.pretty);
    s.overwrite = env_flag("PACTFORGE_OVERWRITE", s.overwrite);
    return s;
}

} // namespace pactforge
