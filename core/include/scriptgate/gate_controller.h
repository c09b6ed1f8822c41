#pragma once

// Gate Controller: owns the gate's lifecycle.
//
// activate():
//   1. refresh the trust store and subscribe to every note / external file
//      source so later edits trigger a (debounced) background refresh;
//   2. resolve each registered integration on a background thread, retrying
//      with exponential backoff up to resolve_max_attempts;
//   3. install a guard on every entry point of each resolved integration.
// deactivate() undoes all of it and restores every original entry point.
//
// The controller is the only owner of interception bindings.

#include "config.h"
#include "document_store.h"
#include "file_watcher.h"
#include "guard.h"
#include "integration.h"
#include "interception.h"
#include "log.h"
#include "policy.h"
#include "renderer.h"
#include "trust_store.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace scriptgate {

enum class IntegrationState {
    PENDING,      // not resolved yet
    SECURED,      // guards installed
    UNAVAILABLE,  // never resolved within the retry budget, or install failed
    CANCELLED,    // deactivated before it resolved
};

const char* integration_state_name(IntegrationState s);

struct IntegrationStatus {
    std::string name;
    IntegrationState state{IntegrationState::PENDING};
    int attempts{0};
    std::string error;
};

// Audit payload for a flags change:
// {"allow_untrusted":bool,"integration_bypass":{name:bool,...}}
std::string flags_payload(const PolicyFlags& flags);

// Backoff before retry number `attempt` (1-based): base * 2^(attempt-1), capped.
int resolve_backoff_ms(int attempt, int base_ms, int max_ms);

class GateController {
public:
    // `docs` resolves and watches NOTE sources and FILE_REFERENCE entry
    // points; `files` watches EXTERNAL_FILE sources. Both may be null.
    GateController(TrustStore& trust,
                   PolicySettings& policy,
                   IRenderer& renderer,
                   IDocumentStore* docs,
                   FileWatcher* files,
                   AuditLog* audit,
                   GateOptions opts);
    ~GateController();

    GateController(const GateController&) = delete;
    GateController& operator=(const GateController&) = delete;

    // Register before activate().
    void add_integration(IntegrationSpec spec, Resolver resolver);

    void activate();
    void deactivate();
    bool active() const;

    // Block until no integration is PENDING. False on timeout.
    bool wait_until_settled(std::chrono::milliseconds timeout);

    std::vector<IntegrationStatus> integrations() const;
    IntegrationState integration_state(const std::string& name) const;

    // Coalesced background refresh (returns immediately).
    void request_refresh();
    // Synchronous refresh + rerender.
    std::shared_ptr<const TrustSnapshot> refresh_now();
    // Number of completed refreshes (startup included).
    uint64_t refresh_count() const;

    // Replace trust configuration and flags, resubscribe, refresh.
    void apply_config(const GateConfig& cfg);
    void set_flags(PolicyFlags flags);

    const InterceptionManager& interceptions() const { return interceptions_; }
    const GateStats& stats() const { return stats_; }

private:
    struct Integration {
        IntegrationSpec spec;
        Resolver resolver;
        IntegrationStatus status;
        std::vector<InterceptionBinding> bindings;
    };

    // Shared with watch callbacks, which may outlive a deactivate() in flight.
    struct RefreshSignal {
        std::mutex mu;
        std::condition_variable cv;
        bool pending{false};
        bool stop{false};
        std::chrono::steady_clock::time_point last_request{};

        void raise() {
            {
                std::lock_guard<std::mutex> lk(mu);
                pending = true;
                last_request = std::chrono::steady_clock::now();
            }
            cv.notify_all();
        }
    };

    void resolve_loop();
    void refresh_loop();
    bool try_secure(Integration& in, const std::shared_ptr<HostObject>& host);
    void remove_bindings(Integration& in);
    void subscribe_sources();
    void unsubscribe_sources();
    void after_refresh(const TrustSnapshot& snap);

    TrustStore& trust_;
    PolicySettings& policy_;
    IRenderer& renderer_;
    IDocumentStore* docs_;
    FileWatcher* files_;
    AuditLog* audit_;
    GateOptions opts_;

    InterceptionManager interceptions_;
    GateStats stats_;

    mutable std::mutex mu_;  // integrations_, active_, cancel_
    std::condition_variable state_cv_;
    std::vector<Integration> integrations_;
    bool active_{false};
    bool cancel_{false};
    std::thread resolver_;

    std::shared_ptr<RefreshSignal> refresh_signal_;
    std::thread refresher_;
    std::atomic<uint64_t> refreshes_{0};

    std::mutex watch_mu_;
    std::vector<WatchId> note_watches_;
    std::vector<WatchId> file_watches_;
};

} // namespace scriptgate
