#include "test_common.h"
#include "pactforge/config.h"
#include <cstdlib>

int main() {
    // Test 1: Default profile is DEV
    unsetenv("PACTFORGE_PROFILE");
    auto p = pactforge::detect_profile();
    expect_true(p == pactforge::Profile::DEV, "default should be DEV");

    // Test 2: CI detection
    setenv("PACTFORGE_PROFILE", "ci", 1);
    p = pactforge::detect_profile();
    expect_true(p == pactforge::Profile::CI, "should detect CI");

    // Test 3: Case insensitive
    setenv("PACTFORGE_PROFILE", "CI", 1);
    p = pactforge::detect_profile();
    expect_true(p == pactforge::Profile::CI, "should detect CI case-insensitive");

    // Test 4: Apply defaults (won't override existing)
    setenv("PACTFORGE_PRETTY", "1", 1); // pre-existing
    unsetenv("PACTFORGE_OVERWRITE");
    pactforge::apply_profile_defaults(pactforge::Profile::CI);
    std::string val = std::getenv("PACTFORGE_PRETTY") ? std::getenv("PACTFORGE_PRETTY") : "";
    expect_true(val == "1", "should NOT override pre-existing env var");

    // Test 5: Apply sets missing vars
    val = std::getenv("PACTFORGE_OVERWRITE") ? std::getenv("PACTFORGE_OVERWRITE") : "";
    expect_true(val == "0", "CI should set OVERWRITE=0");

    // Test 6: Settings follow the environment
    setenv("PACTFORGE_PACT_DIR", "/tmp/pacts-out", 1);
    unsetenv("PACTFORGE_SPEC_VERSION");
    unsetenv("PACTFORGE_LOG");
    auto s = pactforge::load_settings();
    expect_true(s.pact_dir == "/tmp/pacts-out", "pact dir from env");
    expect_true(s.spec_version == "2.0.0", "default spec version");
    expect_true(s.log_path.empty(), "log disabled by default");
    expect_true(s.pretty, "pretty from env");
    expect_true(!s.overwrite, "overwrite from env");

    // Test 7: Unrecognized flag values keep the default
    setenv("PACTFORGE_OVERWRITE", "maybe", 1);
    expect_true(pactforge::load_settings().overwrite, "unknown flag keeps default");

    // Test 8: Profile name
    expect_true(std::string(pactforge::profile_name(pactforge::Profile::DEV)) == "dev", "dev name");
    expect_true(std::string(pactforge::profile_name(pactforge::Profile::CI)) == "ci", "ci name");

    // Cleanup
    unsetenv("PACTFORGE_PROFILE");
    unsetenv("PACTFORGE_PRETTY");
    unsetenv("PACTFORGE_OVERWRITE");
    unsetenv("PACTFORGE_PACT_DIR");

    std::cerr << "test_config: ALL PASSED" << std::endl;
    return 0;
}
