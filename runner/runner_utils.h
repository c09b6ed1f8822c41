#pragma once

#include "scriptgate/config.h"

#include <string>

namespace scriptgate {

// Contents of `path`, or of stdin when path is "-". Throws std::runtime_error.
std::string slurp(const std::string& path);

// "on"/"off" (also true/false, 1/0). False if the word is neither.
bool parse_on_off(const std::string& word, bool* out);

// Load the config at `path`; prints the error and returns false if malformed.
bool load_config_or_report(const std::string& path, GateConfig* out);

// Save and report. Returns the process exit code (0 or 1).
int save_config_or_report(const GateConfig& cfg, const std::string& path);

// Apply the profile, then read the tuning knobs.
GateOptions load_options();

} // namespace scriptgate
