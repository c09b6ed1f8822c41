#include "scriptgate/config.h"
#include "scriptgate/json_util.h"

#include <json-c/json.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace scriptgate {

std::vector<TrustSource> GateConfig::sources() const {
    std::vector<TrustSource> out;
    out.reserve(trusted_hash_notes.size() + trusted_hash_files.size());
    for (const auto& n : trusted_hash_notes) out.push_back({SourceKind::NOTE, n});
    for (const auto& f : trusted_hash_files) out.push_back({SourceKind::EXTERNAL_FILE, f});
    return out;
}

PolicyFlags GateConfig::flags() const {
    PolicyFlags f;
    f.allow_untrusted = allow_untrusted_code;
    f.integration_bypass = integration_bypass;
    return f;
}

GateConfig load_config(const std::string& path) {
    GateConfig cfg;
    std::ifstream f(path);
    if (!f) return cfg;
    std::stringstream ss;
    ss << f.rdbuf();
    std::string text = ss.str();

    json_object* root = json_tokener_parse(text.c_str());
    if (!root || !json_object_is_type(root, json_type_object)) {
        if (root) json_object_put(root);
        throw std::runtime_error("config is not a JSON object: " + path);
    }

    cfg.trusted_hash_notes = json_get_string_array(root, "trusted_hash_notes");
    cfg.trusted_hash_files = json_get_string_array(root, "trusted_hash_files");
    cfg.trusted_hashes = json_get_string_array(root, "trusted_hashes");
    json_get_bool(root, "allow_untrusted_code", &cfg.allow_untrusted_code);
    cfg.integration_bypass = json_get_bool_map(root, "integration_bypass");

    json_object_put(root);
    return cfg;
}

bool save_config(const GateConfig& cfg, const std::string& path, std::string* err) {
    json_object* root = json_object_new_object();
    json_object_object_add(root, "trusted_hash_notes", json_new_string_array(cfg.trusted_hash_notes));
    json_object_object_add(root, "trusted_hash_files", json_new_string_array(cfg.trusted_hash_files));
    json_object_object_add(root, "trusted_hashes", json_new_string_array(cfg.trusted_hashes));
    json_object_object_add(root, "allow_untrusted_code", json_object_new_boolean(cfg.allow_untrusted_code ? 1 : 0));
    json_object* bypass = json_object_new_object();
    for (const auto& kv : cfg.integration_bypass) {
        json_object_object_add(bypass, kv.first.c_str(), json_object_new_boolean(kv.second ? 1 : 0));
    }
    json_object_object_add(root, "integration_bypass", bypass);

    std::string text = json_object_to_json_string_ext(root, JSON_C_TO_STRING_PRETTY);
    json_object_put(root);

    std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::out | std::ios::trunc);
        if (!out) {
            if (err) *err = "cannot write: " + tmp;
            return false;
        }
        out << text << "\n";
        if (!out.flush()) {
            if (err) *err = "write failed: " + tmp;
            return false;
        }
    }
    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        if (err) *err = "rename failed: " + ec.message();
        std::filesystem::remove(tmp, ec);
        return false;
    }
    return true;
}

static int getenv_int(const char* name, int defv) {
    if (const char* v = std::getenv(name)) {
        try {
            return std::stoi(v);
        } catch (const std::exception&) {
            return defv;
        }
    }
    return defv;
}

GateOptions gate_options_from_env() {
    GateOptions o;
    o.resolve_max_attempts  = std::max(1, getenv_int("SCRIPTGATE_RESOLVE_MAX_ATTEMPTS", o.resolve_max_attempts));
    o.resolve_base_delay_ms = std::max(0, getenv_int("SCRIPTGATE_RESOLVE_BASE_DELAY_MS", o.resolve_base_delay_ms));
    o.resolve_max_delay_ms  = std::max(o.resolve_base_delay_ms,
                                       getenv_int("SCRIPTGATE_RESOLVE_MAX_DELAY_MS", o.resolve_max_delay_ms));
    o.refresh_debounce_ms   = std::max(0, getenv_int("SCRIPTGATE_REFRESH_DEBOUNCE_MS", o.refresh_debounce_ms));
    o.watch_poll_ms         = std::max(10, getenv_int("SCRIPTGATE_WATCH_POLL_MS", o.watch_poll_ms));
    if (const char* p = std::getenv("SCRIPTGATE_AUDIT_LOG")) o.audit_log_path = p;
    return o;
}

Profile detect_profile() {
    const char* env = std::getenv("SCRIPTGATE_PROFILE");
    if (!env) return Profile::DEV;

    std::string val(env);
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (val == "prod" || val == "production") return Profile::PROD;
    return Profile::DEV;
}

const char* profile_name(Profile p) {
    switch (p) {
        case Profile::PROD: return "prod";
        case Profile::DEV:  return "dev";
    }
    return "dev";
}

void apply_profile_defaults(Profile p) {
    // SAFETY: call before the controller starts its threads.
    constexpr int NO_OVERWRITE = 0;

    setenv("SCRIPTGATE_RESOLVE_MAX_ATTEMPTS",  "10",   NO_OVERWRITE);
    setenv("SCRIPTGATE_RESOLVE_BASE_DELAY_MS", "100",  NO_OVERWRITE);
    setenv("SCRIPTGATE_REFRESH_DEBOUNCE_MS",   "1000", NO_OVERWRITE);

    switch (p) {
        case Profile::DEV:
            setenv("SCRIPTGATE_WATCH_POLL_MS", "500", NO_OVERWRITE);
            break;

        case Profile::PROD:
            setenv("SCRIPTGATE_WATCH_POLL_MS", "2000", NO_OVERWRITE);
            // Every denial and lifecycle change is audited in prod.
            setenv("SCRIPTGATE_AUDIT_LOG", "scriptgate_audit.jsonl", NO_OVERWRITE);
            break;
    }
}

} // namespace scriptgate
