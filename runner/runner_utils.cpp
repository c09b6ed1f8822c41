#include "runner_utils.h"

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace scriptgate {

std::string slurp(const std::string& path) {
    std::stringstream ss;
    if (path == "-") {
        ss << std::cin.rdbuf();
        return ss.str();
    }
    std::ifstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("cannot open: " + path);
    ss << f.rdbuf();
    return ss.str();
}

bool parse_on_off(const std::string& word, bool* out) {
    if (word == "on" || word == "true" || word == "1") { *out = true; return true; }
    if (word == "off" || word == "false" || word == "0") { *out = false; return true; }
    return false;
}

bool load_config_or_report(const std::string& path, GateConfig* out) {
    try {
        *out = load_config(path);
        return true;
    } catch (const std::runtime_error& e) {
        std::cerr << "[config] error: " << e.what() << "\n";
        return false;
    }
}

int save_config_or_report(const GateConfig& cfg, const std::string& path) {
    std::string err;
    if (!save_config(cfg, path, &err)) {
        std::cerr << "[config] error: " << err << "\n";
        return 1;
    }
    return 0;
}

GateOptions load_options() {
    Profile p = detect_profile();
    apply_profile_defaults(p);
    return gate_options_from_env();
}

} // namespace scriptgate
