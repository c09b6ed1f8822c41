#include "scriptgate/policy.h"

namespace scriptgate {

const char* verdict_name(Verdict v) {
    return v == Verdict::ALLOW ? "ALLOW" : "DENY";
}

const char* decision_reason_name(DecisionReason r) {
    switch (r) {
        case DecisionReason::TRUSTED_HASH:         return "trusted_hash";
        case DecisionReason::GLOBAL_OVERRIDE:      return "global_override";
        case DecisionReason::INTEGRATION_OVERRIDE: return "integration_override";
        case DecisionReason::UNTRUSTED:            return "untrusted";
    }
    return "untrusted";
}

Decision decide(const std::string& content,
                const std::string& integration,
                const PolicyFlags& flags,
                const TrustSnapshot& trust) {
    Decision d;
    d.digest = digest::of(content);

    if (trust.contains(d.digest)) {
        d.verdict = Verdict::ALLOW;
        d.reason = DecisionReason::TRUSTED_HASH;
    } else if (flags.allow_untrusted) {
        d.verdict = Verdict::ALLOW;
        d.reason = DecisionReason::GLOBAL_OVERRIDE;
    } else if (flags.bypasses(integration)) {
        d.verdict = Verdict::ALLOW;
        d.reason = DecisionReason::INTEGRATION_OVERRIDE;
    } else {
        d.verdict = Verdict::DENY;
        d.reason = DecisionReason::UNTRUSTED;
    }
    return d;
}

Decision decide(const std::string& content,
                const std::string& integration,
                const PolicyFlags& flags,
                const TrustStore& trust) {
    auto snap = trust.snapshot();
    return decide(content, integration, flags, *snap);
}

PolicyFlags PolicySettings::get() const {
    std::lock_guard<std::mutex> lk(mu_);
    return flags_;
}

void PolicySettings::set(PolicyFlags flags) {
    std::lock_guard<std::mutex> lk(mu_);
    flags_ = std::move(flags);
}

void PolicySettings::set_allow_untrusted(bool on) {
    std::lock_guard<std::mutex> lk(mu_);
    flags_.allow_untrusted = on;
}

void PolicySettings::set_integration_bypass(const std::string& integration, bool on) {
    std::lock_guard<std::mutex> lk(mu_);
    flags_.integration_bypass[integration] = on;
}

} // namespace scriptgate
