#include "cmd_watch.h"
#include "runner_utils.h"

#include "scriptgate/document_store.h"
#include "scriptgate/file_watcher.h"
#include "scriptgate/gate_controller.h"
#include "scriptgate/log.h"
#include "scriptgate/renderer.h"
#include "scriptgate/trust_store.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

using namespace scriptgate;

static std::atomic<bool> g_stop{false};
static std::atomic<bool> g_reread{false};

static void on_signal(int sig) {
    if (sig == SIGHUP) {
        g_reread.store(true);
        return;
    }
    g_stop.store(true);
}

// Keeps the trust store live against its sources and the config file,
// printing every refresh. SIGHUP forces a re-read. Runs until SIGINT/SIGTERM.
int cmd_watch(int argc, char** argv) {
    if (argc < 4) {
        std::cerr << "usage: scriptgate_cli watch <config.json> <vault_dir>\n";
        return 2;
    }
    const std::string cfg_path = argv[2];
    const std::string vault = argv[3];

    GateConfig cfg;
    if (!load_config_or_report(cfg_path, &cfg)) return 1;
    GateOptions opts = load_options();
    std::cerr << "[watch] profile=" << profile_name(detect_profile())
              << " poll_ms=" << opts.watch_poll_ms
              << " debounce_ms=" << opts.refresh_debounce_ms << "\n";

    std::unique_ptr<AuditLog> audit = opts.audit_log_path.empty()
        ? std::make_unique<AuditLog>()
        : std::make_unique<AuditLog>(opts.audit_log_path);

    FileWatcher watcher(opts.watch_poll_ms);
    FsDocumentStore docs(vault, watcher);
    TrustStore trust(&docs);
    PolicySettings policy(cfg.flags());
    ConsoleRenderer renderer;
    trust.replace_config(cfg.trusted_hashes, cfg.sources());

    GateController gate(trust, policy, renderer, &docs, &watcher, audit.get(), opts);

    std::atomic<bool> config_changed{false};
    WatchId cfg_watch = watcher.add(cfg_path, [&config_changed] { config_changed.store(true); });

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    std::signal(SIGHUP, on_signal);

    gate.activate();
    watcher.start();

    uint64_t seen = 0;
    while (!g_stop.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        if (g_reread.exchange(false)) {
            std::cerr << "[watch] SIGHUP, re-reading trust sources\n";
            gate.request_refresh();
        }

        if (config_changed.exchange(false)) {
            GateConfig next;
            if (load_config_or_report(cfg_path, &next)) {
                std::cerr << "[watch] config changed, reloading\n";
                gate.apply_config(next);
            }
        }

        uint64_t n = gate.refresh_count();
        if (n != seen) {
            seen = n;
            auto snap = trust.snapshot();
            std::cout << "generation " << snap->generation() << ": " << snap->size() << " trusted digest(s)\n";
            for (const auto& r : trust.last_report()) {
                if (!r.ok) std::cout << "  unavailable: " << source_kind_name(r.source.kind) << " " << r.source.ref << "\n";
            }
            std::cout.flush();
        }
    }

    watcher.remove(cfg_watch);
    gate.deactivate();
    watcher.stop();
    return 0;
}

int cmd_audit(int argc, char** argv) {
    if (argc < 4 || std::string(argv[2]) != "verify") {
        std::cerr << "usage: scriptgate_cli audit verify <audit.jsonl>\n";
        return 2;
    }
    size_t lines = 0;
    std::string err;
    if (!verify_audit_chain(argv[3], &lines, &err)) {
        std::cerr << "[audit] chain broken: " << err << "\n";
        return 1;
    }
    std::cout << "OK " << lines << " record(s)\n";
    return 0;
}
