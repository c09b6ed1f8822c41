#include "test_common.h"
#include "scriptgate/config.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>

int main() {
    namespace fs = std::filesystem;
    using namespace scriptgate;

    // Test 1: Default profile is DEV
    unsetenv("SCRIPTGATE_PROFILE");
    auto p = detect_profile();
    expect_true(p == Profile::DEV, "default should be DEV");

    // Test 2: PROD detection, case insensitive
    setenv("SCRIPTGATE_PROFILE", "PROD", 1);
    p = detect_profile();
    expect_true(p == Profile::PROD, "should detect PROD case-insensitive");

    // Test 3: Apply defaults (won't override existing)
    setenv("SCRIPTGATE_WATCH_POLL_MS", "42", 1);
    apply_profile_defaults(Profile::PROD);
    std::string val = std::getenv("SCRIPTGATE_WATCH_POLL_MS") ? std::getenv("SCRIPTGATE_WATCH_POLL_MS") : "";
    expect_true(val == "42", "should NOT override pre-existing env var");

    // Test 4: Apply sets missing vars
    unsetenv("SCRIPTGATE_AUDIT_LOG");
    apply_profile_defaults(Profile::PROD);
    val = std::getenv("SCRIPTGATE_AUDIT_LOG") ? std::getenv("SCRIPTGATE_AUDIT_LOG") : "";
    expect_true(val == "scriptgate_audit.jsonl", "PROD should enable the audit log");

    // Test 5: Options read from env, with clamping
    {
        setenv("SCRIPTGATE_RESOLVE_MAX_ATTEMPTS", "0", 1);
        setenv("SCRIPTGATE_RESOLVE_BASE_DELAY_MS", "not a number", 1);
        GateOptions o = gate_options_from_env();
        expect_eq_ll(o.resolve_max_attempts, 1, "attempts clamped to 1");
        expect_eq_ll(o.resolve_base_delay_ms, 100, "unparsable value falls back to default");
        expect_eq_ll(o.watch_poll_ms, 42, "poll interval from env");
        expect_eq_str(o.audit_log_path, "scriptgate_audit.jsonl", "audit path from env");
    }

    // Test 6: Profile name
    expect_eq_str(profile_name(Profile::DEV), "dev", "dev name");
    expect_eq_str(profile_name(Profile::PROD), "prod", "prod name");

    fs::path dir = make_scratch_dir("config");

    // Test 7: missing config file gives defaults
    {
        GateConfig cfg = load_config((dir / "none.json").string());
        expect_true(cfg.trusted_hashes.empty() && cfg.trusted_hash_notes.empty(), "empty defaults");
        expect_true(!cfg.allow_untrusted_code, "gated by default");
    }

    // Test 8: save then load keeps every field
    {
        GateConfig cfg;
        cfg.trusted_hash_notes = {"Trust/Hashes"};
        cfg.trusted_hash_files = {"/etc/scriptgate/hashes.txt"};
        cfg.trusted_hashes = {"d287bb7f9d15abdc5b6e98536263815744b6ef21c8f3c839fc434ca70d8efe99"};
        cfg.integration_bypass["meta-bind"] = true;
        std::string err;
        std::string path = (dir / "cfg.json").string();
        expect_true(save_config(cfg, path, &err), "save: " + err);

        GateConfig back = load_config(path);
        expect_eq_str(back.trusted_hash_notes.at(0), "Trust/Hashes", "notes");
        expect_eq_str(back.trusted_hash_files.at(0), "/etc/scriptgate/hashes.txt", "files");
        expect_eq_ll((long long)back.trusted_hashes.size(), 1, "manual digests");
        expect_true(back.flags().bypasses("meta-bind"), "integration bypass");
        expect_true(!back.flags().allow_untrusted, "global flag");

        auto src = back.sources();
        expect_eq_ll((long long)src.size(), 2, "one note source and one file source");
        expect_true(src[0].kind == SourceKind::NOTE && src[1].kind == SourceKind::EXTERNAL_FILE, "source kinds");
    }

    // Test 9: unknown keys and wrong types are ignored, a non-object is an error
    {
        std::string path = (dir / "odd.json").string();
        {
            std::ofstream f(path);
            f << "{\"trusted_hashes\": [\"abc\", 7], \"allow_untrusted_code\": \"yes\", \"extra\": 1}";
        }
        GateConfig cfg = load_config(path);
        expect_eq_ll((long long)cfg.trusted_hashes.size(), 1, "non-string array items skipped");
        expect_true(!cfg.allow_untrusted_code, "non-bool flag ignored");

        {
            std::ofstream f(path, std::ios::trunc);
            f << "[1, 2, 3]";
        }
        bool threw = false;
        try {
            load_config(path);
        } catch (const std::runtime_error&) {
            threw = true;
        }
        expect_true(threw, "array config rejected");
    }

    // Cleanup
    fs::remove_all(dir);
    unsetenv("SCRIPTGATE_PROFILE");
    unsetenv("SCRIPTGATE_WATCH_POLL_MS");
    unsetenv("SCRIPTGATE_AUDIT_LOG");
    unsetenv("SCRIPTGATE_RESOLVE_MAX_ATTEMPTS");
    unsetenv("SCRIPTGATE_RESOLVE_BASE_DELAY_MS");
    unsetenv("SCRIPTGATE_REFRESH_DEBOUNCE_MS");

    std::cerr << "test_config: ALL PASSED" << std::endl;
    return 0;
}
