#include "cmd_check.h"
#include "runner_utils.h"

#include "scriptgate/digest.h"
#include "scriptgate/document_store.h"
#include "scriptgate/file_watcher.h"
#include "scriptgate/policy.h"
#include "scriptgate/renderer.h"
#include "scriptgate/trust_store.h"

#include <iostream>
#include <stdexcept>

using namespace scriptgate;

int cmd_hash(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: scriptgate_cli hash <file|->\n";
        return 2;
    }
    const std::string path = argv[2];
    if (path != "-") {
        std::string d = digest::sha256_hex_file(path);
        if (d.empty()) {
            std::cerr << "[hash] error: cannot read: " << path << "\n";
            return 1;
        }
        std::cout << d << "\n";
        return 0;
    }
    std::string body;
    try {
        body = slurp(path);
    } catch (const std::runtime_error& e) {
        std::cerr << "[hash] error: " << e.what() << "\n";
        return 1;
    }
    std::cout << digest::of(body) << "\n";
    return 0;
}

// Exit 0 when the script would run, 3 when it would be blocked.
int cmd_check(int argc, char** argv) {
    if (argc < 6) {
        std::cerr << "usage: scriptgate_cli check <config.json> <vault_dir> <integration> <script|->\n";
        return 2;
    }
    const std::string cfg_path = argv[2];
    const std::string vault = argv[3];
    const std::string integration = argv[4];

    GateConfig cfg;
    if (!load_config_or_report(cfg_path, &cfg)) return 1;

    std::string body;
    try {
        body = slurp(argv[5]);
    } catch (const std::runtime_error& e) {
        std::cerr << "[check] error: " << e.what() << "\n";
        return 1;
    }

    FileWatcher watcher;
    FsDocumentStore docs(vault, watcher);
    TrustStore trust(&docs);
    trust.replace_config(cfg.trusted_hashes, cfg.sources());
    auto snap = trust.refresh();

    Decision d = decide(body, integration, cfg.flags(), *snap);
    std::cout << verdict_name(d.verdict) << " " << decision_reason_name(d.reason) << " " << d.digest << "\n";
    if (d.allowed()) return 0;

    DenialReport rep;
    rep.location = argv[5];
    rep.digest = d.digest;
    rep.integration = integration;
    std::cout << render_denied_placeholder(rep);
    return 3;
}
