#pragma once
#include "digest.h"
#include "trust_store.h"

#include <map>
#include <mutex>
#include <string>

namespace scriptgate {

// Operator override switches. Configuration state, never derived.
struct PolicyFlags {
    bool allow_untrusted{false};                   // run everything, everywhere
    std::map<std::string, bool> integration_bypass; // run everything for one integration

    bool bypasses(const std::string& integration) const {
        auto it = integration_bypass.find(integration);
        return it != integration_bypass.end() && it->second;
    }
};

enum class Verdict { ALLOW, DENY };

enum class DecisionReason {
    TRUSTED_HASH,
    GLOBAL_OVERRIDE,
    INTEGRATION_OVERRIDE,
    UNTRUSTED,
};

struct Decision {
    Verdict verdict{Verdict::DENY};
    DecisionReason reason{DecisionReason::UNTRUSTED};
    TrustEntry digest;

    bool allowed() const { return verdict == Verdict::ALLOW; }
};

const char* verdict_name(Verdict v);
const char* decision_reason_name(DecisionReason r);

// ALLOW iff digest(content) is trusted, or the global override is on, or the
// integration's override is on. Pure: same inputs, same decision.
Decision decide(const std::string& content,
                const std::string& integration,
                const PolicyFlags& flags,
                const TrustSnapshot& trust);

// Decides against the store's current snapshot (taken once).
Decision decide(const std::string& content,
                const std::string& integration,
                const PolicyFlags& flags,
                const TrustStore& trust);

// Live, thread-safe holder for the flags. Guards copy the flags once per
// invocation.
class PolicySettings {
public:
    PolicySettings() = default;
    explicit PolicySettings(PolicyFlags flags) : flags_(std::move(flags)) {}

    PolicyFlags get() const;
    void set(PolicyFlags flags);
    void set_allow_untrusted(bool on);
    void set_integration_bypass(const std::string& integration, bool on);

private:
    mutable std::mutex mu_;
    PolicyFlags flags_;
};

} // namespace scriptgate
