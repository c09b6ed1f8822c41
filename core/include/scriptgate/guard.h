#pragma once
#include "document_store.h"
#include "integration.h"
#include "interception.h"
#include "log.h"
#include "policy.h"
#include "renderer.h"
#include "trust_store.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>

namespace scriptgate {

struct GateStats {
    std::atomic<uint64_t> allowed{0};
    std::atomic<uint64_t> denied{0};
    std::atomic<uint64_t> failed{0};  // content could not be resolved

    uint64_t decisions() const { return allowed.load() + denied.load(); }
};

// Everything a guard needs, captured when it is built. The guard never looks
// anything up by name at call time.
struct GuardContext {
    InterceptionManager* interceptions{nullptr};
    const TrustStore* trust{nullptr};
    const PolicySettings* policy{nullptr};
    IRenderer* renderer{nullptr};
    IDocumentStore* docs{nullptr};  // required for FILE_REFERENCE entry points
    AuditLog* audit{nullptr};       // optional
    GateStats* stats{nullptr};      // optional

    std::string integration;
    EntryPointSpec entry_point;
    std::function<std::string(const TrustEntry&)> substitute;
};

// Guard for one entry point:
//   resolve content -> digest -> decide against one snapshot ->
//   ALLOW: delegate to the original inside a DelegationScope
//   DENY:  report, then BLOCK or SUBSTITUTE
// Exceptions thrown by the engine itself propagate to the foreign caller
// after the guard is reinstated.
EntryPoint make_guard(GuardContext ctx);

} // namespace scriptgate
