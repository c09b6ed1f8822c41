#include "scriptgate/gate_controller.h"
#include "scriptgate/json_util.h"

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace scriptgate {

const char* integration_state_name(IntegrationState s) {
    switch (s) {
        case IntegrationState::PENDING:     return "pending";
        case IntegrationState::SECURED:     return "secured";
        case IntegrationState::UNAVAILABLE: return "unavailable";
        case IntegrationState::CANCELLED:   return "cancelled";
    }
    return "pending";
}

std::string flags_payload(const PolicyFlags& flags) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "allow_untrusted", json_object_new_boolean(flags.allow_untrusted ? 1 : 0));
    json_object* bypass = json_object_new_object();
    for (const auto& kv : flags.integration_bypass) {
        json_object_object_add(bypass, kv.first.c_str(), json_object_new_boolean(kv.second ? 1 : 0));
    }
    json_object_object_add(o, "integration_bypass", bypass);
    std::string out = json_canonical(o);
    json_object_put(o);
    return out;
}

int resolve_backoff_ms(int attempt, int base_ms, int max_ms) {
    if (attempt < 1) attempt = 1;
    if (base_ms <= 0) return 0;
    long long d = base_ms;
    for (int i = 1; i < attempt && d < max_ms; i++) d *= 2;
    return (int)std::min<long long>(d, max_ms);
}

GateController::GateController(TrustStore& trust,
                               PolicySettings& policy,
                               IRenderer& renderer,
                               IDocumentStore* docs,
                               FileWatcher* files,
                               AuditLog* audit,
                               GateOptions opts)
    : trust_(trust),
      policy_(policy),
      renderer_(renderer),
      docs_(docs),
      files_(files),
      audit_(audit),
      opts_(std::move(opts)),
      refresh_signal_(std::make_shared<RefreshSignal>()) {}

GateController::~GateController() {
    deactivate();
}

void GateController::add_integration(IntegrationSpec spec, Resolver resolver) {
    if (!resolver) throw std::invalid_argument("add_integration: null resolver for " + spec.name);
    std::lock_guard<std::mutex> lk(mu_);
    if (active_) throw std::logic_error("add_integration after activate: " + spec.name);
    for (const auto& in : integrations_) {
        if (in.spec.name == spec.name) throw std::invalid_argument("duplicate integration: " + spec.name);
    }
    Integration in;
    in.status.name = spec.name;
    in.spec = std::move(spec);
    in.resolver = std::move(resolver);
    integrations_.push_back(std::move(in));
}

void GateController::activate() {
    size_t count = 0;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (active_) return;
        count = integrations_.size();
        active_ = true;
        cancel_ = false;
        for (auto& in : integrations_) {
            in.status.state = IntegrationState::PENDING;
            in.status.attempts = 0;
            in.status.error.clear();
        }
    }

    refresh_now();
    subscribe_sources();

    {
        std::lock_guard<std::mutex> lk(refresh_signal_->mu);
        refresh_signal_->stop = false;
        refresh_signal_->pending = false;
    }
    refresher_ = std::thread([this] { refresh_loop(); });
    resolver_ = std::thread([this] { resolve_loop(); });

    std::cerr << "[gate] activated with " << count << " integration(s)\n";
    if (audit_) audit_->event("gate.activate", json_fields({{"integrations", std::to_string(count)}}));
}

void GateController::deactivate() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!active_) return;
        cancel_ = true;
    }
    state_cv_.notify_all();
    if (resolver_.joinable()) resolver_.join();

    {
        std::lock_guard<std::mutex> lk(refresh_signal_->mu);
        refresh_signal_->stop = true;
    }
    refresh_signal_->cv.notify_all();
    if (refresher_.joinable()) refresher_.join();

    unsubscribe_sources();

    {
        std::lock_guard<std::mutex> lk(mu_);
        for (auto& in : integrations_) {
            remove_bindings(in);
            if (in.status.state == IntegrationState::PENDING) in.status.state = IntegrationState::CANCELLED;
        }
        active_ = false;
    }
    state_cv_.notify_all();

    std::cerr << "[gate] deactivated; original entry points restored\n";
    if (audit_) audit_->event("gate.deactivate", "{}");
}

bool GateController::active() const {
    std::lock_guard<std::mutex> lk(mu_);
    return active_;
}

bool GateController::wait_until_settled(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(mu_);
    return state_cv_.wait_for(lk, timeout, [this] {
        return std::none_of(integrations_.begin(), integrations_.end(), [](const Integration& in) {
            return in.status.state == IntegrationState::PENDING;
        });
    });
}

std::vector<IntegrationStatus> GateController::integrations() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<IntegrationStatus> out;
    out.reserve(integrations_.size());
    for (const auto& in : integrations_) out.push_back(in.status);
    return out;
}

IntegrationState GateController::integration_state(const std::string& name) const {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& in : integrations_) {
        if (in.spec.name == name) return in.status.state;
    }
    throw std::invalid_argument("unknown integration: " + name);
}

// --- integration resolution ---

void GateController::resolve_loop() {
    const int max_attempts = std::max(1, opts_.resolve_max_attempts);

    for (int attempt = 1; attempt <= max_attempts; attempt++) {
        for (size_t i = 0; i < integrations_.size(); i++) {
            Resolver resolver;
            {
                std::lock_guard<std::mutex> lk(mu_);
                if (cancel_) return;
                if (integrations_[i].status.state != IntegrationState::PENDING) continue;
                resolver = integrations_[i].resolver;
            }

            std::shared_ptr<HostObject> host;
            std::string failure;
            try {
                host = resolver();
            } catch (const std::exception& e) {
                failure = std::string("resolver failed: ") + e.what();
            }

            std::lock_guard<std::mutex> lk(mu_);
            if (cancel_) return;
            Integration& in = integrations_[i];
            in.status.attempts = attempt;
            if (!failure.empty()) {
                in.status.error = failure;
                std::cerr << "[gate] warn: " << in.spec.name << ": " << failure
                          << " (attempt " << attempt << ")\n";
            }
            if (host) try_secure(in, host);
        }
        state_cv_.notify_all();

        std::unique_lock<std::mutex> lk(mu_);
        bool pending = std::any_of(integrations_.begin(), integrations_.end(), [](const Integration& in) {
            return in.status.state == IntegrationState::PENDING;
        });
        if (!pending || attempt == max_attempts) break;

        auto delay = std::chrono::milliseconds(
            resolve_backoff_ms(attempt, opts_.resolve_base_delay_ms, opts_.resolve_max_delay_ms));
        if (state_cv_.wait_for(lk, delay, [this] { return cancel_; })) return;
    }

    std::lock_guard<std::mutex> lk(mu_);
    if (cancel_) return;
    for (auto& in : integrations_) {
        if (in.status.state != IntegrationState::PENDING) continue;
        in.status.state = IntegrationState::UNAVAILABLE;
        std::string last = in.status.error;
        in.status.error = "not resolved after " + std::to_string(in.status.attempts) + " attempt(s)";
        if (!last.empty()) in.status.error += "; last error: " + last;
        std::cerr << "[gate] error: " << in.spec.name << " not secured: " << in.status.error << "\n";
        if (audit_) {
            audit_->event("gate.integration_unavailable",
                          json_fields({{"integration", in.spec.name}, {"error", in.status.error}}));
        }
    }
    state_cv_.notify_all();
}

// Caller holds mu_.
bool GateController::try_secure(Integration& in, const std::shared_ptr<HostObject>& host) {
    for (const auto& ep : in.spec.entry_points) {
        if (!host->has(ep.name)) {
            std::cerr << "[gate] warn: " << in.spec.name << ": " << host->name()
                      << " has no entry point " << ep.name << "\n";
            continue;
        }
        GuardContext ctx;
        ctx.interceptions = &interceptions_;
        ctx.trust = &trust_;
        ctx.policy = &policy_;
        ctx.renderer = &renderer_;
        ctx.docs = docs_;
        ctx.audit = audit_;
        ctx.stats = &stats_;
        ctx.integration = in.spec.name;
        ctx.entry_point = ep;
        ctx.substitute = in.spec.substitute;

        try {
            in.bindings.push_back(interceptions_.install(host, ep.name, make_guard(std::move(ctx))));
        } catch (const InterceptionError& e) {
            if (e.code() == InterceptionErrc::ENTRY_POINT_MISSING) {
                std::cerr << "[gate] warn: " << in.spec.name << ": " << e.what() << "\n";
                continue;
            }
            in.status.error = std::string(interception_errc_name(e.code())) + ": " + e.what();
            remove_bindings(in);
            in.status.state = IntegrationState::UNAVAILABLE;
            std::cerr << "[gate] error: " << in.spec.name << ": " << in.status.error << "\n";
            return false;
        } catch (const std::invalid_argument& e) {
            in.status.error = e.what();
            remove_bindings(in);
            in.status.state = IntegrationState::UNAVAILABLE;
            std::cerr << "[gate] error: " << in.spec.name << ": " << in.status.error << "\n";
            return false;
        }

        if (audit_) {
            audit_->event("gate.install", json_fields({
                {"integration", in.spec.name},
                {"host", host->name()},
                {"entry_point", ep.name},
            }));
        }
    }

    if (in.bindings.empty()) {
        in.status.state = IntegrationState::UNAVAILABLE;
        in.status.error = "no interceptable entry point on " + host->name();
        std::cerr << "[gate] error: " << in.spec.name << ": " << in.status.error << "\n";
        return false;
    }

    in.status.state = IntegrationState::SECURED;
    in.status.error.clear();
    std::cerr << "[gate] secured " << in.spec.name << " (" << in.bindings.size()
              << " entry point(s), attempt " << in.status.attempts << ")\n";
    return true;
}

// Caller holds mu_.
void GateController::remove_bindings(Integration& in) {
    for (const auto& b : in.bindings) {
        try {
            interceptions_.uninstall(b);
        } catch (const InterceptionError& e) {
            std::cerr << "[gate] warn: " << in.spec.name << ": binding already gone: " << e.what() << "\n";
            continue;
        }
        if (audit_) {
            audit_->event("gate.uninstall", json_fields({
                {"integration", in.spec.name},
                {"entry_point", b.entry_point},
            }));
        }
    }
    in.bindings.clear();
}

// --- trust refresh ---

void GateController::request_refresh() {
    refresh_signal_->raise();
}

std::shared_ptr<const TrustSnapshot> GateController::refresh_now() {
    auto snap = trust_.refresh();
    after_refresh(*snap);
    return snap;
}

uint64_t GateController::refresh_count() const {
    return refreshes_.load();
}

void GateController::after_refresh(const TrustSnapshot& snap) {
    refreshes_++;
    size_t unavailable = 0;
    for (const auto& r : trust_.last_report()) {
        if (!r.ok) unavailable++;
    }
    if (audit_) {
        audit_->event("trust.refresh", json_fields({
            {"entries", std::to_string(snap.size())},
            {"generation", std::to_string(snap.generation())},
            {"unavailable_sources", std::to_string(unavailable)},
        }));
    }
    try {
        renderer_.rerender_all();
    } catch (const std::exception& e) {
        std::cerr << "[gate] warn: rerender failed: " << e.what() << "\n";
    }
}

void GateController::refresh_loop() {
    auto sig = refresh_signal_;
    const auto debounce = std::chrono::milliseconds(opts_.refresh_debounce_ms);

    std::unique_lock<std::mutex> lk(sig->mu);
    while (true) {
        sig->cv.wait(lk, [&] { return sig->stop || sig->pending; });
        if (sig->stop) break;

        // trailing debounce: run once the notifications have been quiet for `debounce`
        while (!sig->stop) {
            auto due = sig->last_request + debounce;
            if (std::chrono::steady_clock::now() >= due) break;
            sig->cv.wait_until(lk, due, [&] { return sig->stop; });
        }
        if (sig->stop) break;
        sig->pending = false;

        lk.unlock();
        try {
            refresh_now();
        } catch (const std::exception& e) {
            std::cerr << "[gate] error: background trust refresh failed: " << e.what() << "\n";
        }
        lk.lock();
    }
}

void GateController::subscribe_sources() {
    std::lock_guard<std::mutex> lk(watch_mu_);
    std::shared_ptr<RefreshSignal> sig = refresh_signal_;
    auto on_change = [sig]() { sig->raise(); };

    for (const auto& s : trust_.sources()) {
        if (s.kind == SourceKind::NOTE && docs_) {
            try {
                note_watches_.push_back(docs_->watch(note_document_path(s.ref), on_change));
            } catch (const DocumentNotFound& e) {
                std::cerr << "[gate] warn: cannot watch trust note: " << e.what() << "\n";
            }
        } else if (s.kind == SourceKind::EXTERNAL_FILE && files_) {
            file_watches_.push_back(files_->add(s.ref, on_change));
        }
    }
}

void GateController::unsubscribe_sources() {
    std::lock_guard<std::mutex> lk(watch_mu_);
    if (docs_) {
        for (auto id : note_watches_) docs_->unwatch(id);
    }
    if (files_) {
        for (auto id : file_watches_) files_->remove(id);
    }
    note_watches_.clear();
    file_watches_.clear();
}

// --- configuration ---

void GateController::apply_config(const GateConfig& cfg) {
    trust_.replace_config(cfg.trusted_hashes, cfg.sources());
    PolicyFlags flags = cfg.flags();
    if (audit_) audit_->event("gate.flags", flags_payload(flags));
    policy_.set(std::move(flags));
    if (active()) {
        unsubscribe_sources();
        subscribe_sources();
    }
    refresh_now();
}

void GateController::set_flags(PolicyFlags flags) {
    if (audit_) audit_->event("gate.flags", flags_payload(flags));
    policy_.set(std::move(flags));
    try {
        renderer_.rerender_all();
    } catch (const std::exception& e) {
        std::cerr << "[gate] warn: rerender failed: " << e.what() << "\n";
    }
}

} // namespace scriptgate
