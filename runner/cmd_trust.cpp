#include "cmd_trust.h"
#include "runner_utils.h"

#include "scriptgate/digest.h"
#include "scriptgate/document_store.h"
#include "scriptgate/file_watcher.h"
#include "scriptgate/trust_source.h"
#include "scriptgate/trust_store.h"

#include <algorithm>
#include <filesystem>
#include <iostream>

using namespace scriptgate;

// Add or remove `value` in `list`. Returns false if nothing changed.
static bool edit_list(std::vector<std::string>& list, const std::string& op, const std::string& value) {
    auto it = std::find(list.begin(), list.end(), value);
    if (op == "add") {
        if (it != list.end()) return false;
        list.push_back(value);
        return true;
    }
    if (it == list.end()) return false;
    list.erase(it);
    return true;
}

static int list_trust(const std::string& cfg_path, const std::string& vault) {
    GateConfig cfg;
    if (!load_config_or_report(cfg_path, &cfg)) return 1;

    FileWatcher watcher;
    FsDocumentStore docs(vault, watcher);
    TrustStore trust(&docs);
    trust.replace_config(cfg.trusted_hashes, cfg.sources());
    auto snap = trust.refresh();

    int unavailable = 0;
    for (const auto& r : trust.last_report()) {
        std::cout << "# " << source_kind_name(r.source.kind) << " " << r.source.ref << ": ";
        if (r.ok) {
            std::cout << r.entries << " entr" << (r.entries == 1 ? "y" : "ies") << "\n";
        } else {
            std::cout << "unavailable (" << r.error << ")\n";
            unavailable++;
        }
    }
    for (const auto& e : snap->sorted_entries()) std::cout << e << "\n";
    return unavailable ? 4 : 0;
}

int cmd_trust(int argc, char** argv) {
    if (argc >= 5 && std::string(argv[2]) == "list") return list_trust(argv[3], argv[4]);
    if (argc < 5) {
        std::cerr << "usage: scriptgate_cli trust list <config.json> <vault_dir>\n"
                  << "       scriptgate_cli trust add|remove <config.json> <digest>\n";
        return 2;
    }
    const std::string op = argv[2];
    if (op != "add" && op != "remove") {
        std::cerr << "unknown trust operation: " << op << "\n";
        return 2;
    }
    const std::string cfg_path = argv[3];
    const TrustEntry entry = digest::normalize(argv[4]);
    if (!digest::is_sha256_hex(entry)) {
        std::cerr << "[warn] " << entry << " does not look like a SHA-256 hex digest\n";
    }

    GateConfig cfg;
    if (!load_config_or_report(cfg_path, &cfg)) return 1;
    if (!edit_list(cfg.trusted_hashes, op, entry)) {
        std::cerr << "[config] no change: " << entry << "\n";
        return 0;
    }
    return save_config_or_report(cfg, cfg_path);
}

int cmd_notes(int argc, char** argv) {
    if (argc < 5 || (std::string(argv[2]) != "add" && std::string(argv[2]) != "remove")) {
        std::cerr << "usage: scriptgate_cli notes add|remove <config.json> <note_ref>\n";
        return 2;
    }
    const std::string cfg_path = argv[3];
    const std::string ref = normalize_note_ref(argv[4]);
    if (ref.empty()) {
        std::cerr << "empty note reference\n";
        return 2;
    }

    GateConfig cfg;
    if (!load_config_or_report(cfg_path, &cfg)) return 1;
    if (!edit_list(cfg.trusted_hash_notes, argv[2], ref)) {
        std::cerr << "[config] no change: " << ref << "\n";
        return 0;
    }
    return save_config_or_report(cfg, cfg_path);
}

int cmd_files(int argc, char** argv) {
    if (argc < 5 || (std::string(argv[2]) != "add" && std::string(argv[2]) != "remove")) {
        std::cerr << "usage: scriptgate_cli files add|remove <config.json> <path>\n";
        return 2;
    }
    const std::string cfg_path = argv[3];
    std::filesystem::path p = argv[4];
    if (!p.is_absolute()) {
        std::cerr << "trusted hash files must be absolute paths: " << p.string() << "\n";
        return 2;
    }

    GateConfig cfg;
    if (!load_config_or_report(cfg_path, &cfg)) return 1;
    if (!edit_list(cfg.trusted_hash_files, argv[2], p.lexically_normal().string())) {
        std::cerr << "[config] no change: " << p.string() << "\n";
        return 0;
    }
    return save_config_or_report(cfg, cfg_path);
}

int cmd_flags(int argc, char** argv) {
    bool on = false;
    if (argc < 5 || !parse_on_off(argv[4], &on)) {
        std::cerr << "usage: scriptgate_cli flags <config.json> allow_untrusted|<integration> on|off\n";
        return 2;
    }
    const std::string cfg_path = argv[2];
    const std::string which = argv[3];

    GateConfig cfg;
    if (!load_config_or_report(cfg_path, &cfg)) return 1;
    if (which == "allow_untrusted") {
        cfg.allow_untrusted_code = on;
        if (on) std::cerr << "[warn] all scripts in all integrations will run unchecked\n";
    } else {
        cfg.integration_bypass[which] = on;
        if (on) std::cerr << "[warn] all " << which << " scripts will run unchecked\n";
    }
    return save_config_or_report(cfg, cfg_path);
}
