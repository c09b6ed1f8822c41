#pragma once
#include "policy.h"
#include "trust_source.h"

#include <map>
#include <string>
#include <vector>

namespace scriptgate {

// Persisted operator settings (JSON).
struct GateConfig {
    std::vector<std::string> trusted_hash_notes;  // note references, no ".md"
    std::vector<std::string> trusted_hash_files;  // absolute paths
    std::vector<std::string> trusted_hashes;      // manual digests
    bool allow_untrusted_code{false};
    std::map<std::string, bool> integration_bypass;

    std::vector<TrustSource> sources() const;
    PolicyFlags flags() const;
};

// Missing file -> defaults. Malformed file -> std::runtime_error.
GateConfig load_config(const std::string& path);
// Writes atomically (temp file + rename).
bool save_config(const GateConfig& cfg, const std::string& path, std::string* err);

// Tuning for the gate controller.
struct GateOptions {
    int resolve_max_attempts{10};
    int resolve_base_delay_ms{100};
    int resolve_max_delay_ms{10000};
    int refresh_debounce_ms{1000};
    int watch_poll_ms{500};
    std::string audit_log_path;  // empty: no audit log
};

// Reads SCRIPTGATE_* env vars over the defaults above.
GateOptions gate_options_from_env();

enum class Profile { DEV, PROD };

// Detect profile from SCRIPTGATE_PROFILE env var. Default: DEV.
Profile detect_profile();

const char* profile_name(Profile p);

// Sets SCRIPTGATE_* env vars that are not already set.
void apply_profile_defaults(Profile p);

} // namespace scriptgate
