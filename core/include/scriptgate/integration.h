#pragma once
#include "digest.h"
#include "host_object.h"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace scriptgate {

// What the invocation's `source` field holds.
enum class ContentKind {
    INLINE,          // the script text itself
    FILE_REFERENCE,  // a vault-relative file path, read as given from the document store
};

// What a guard does with a denied invocation (after reporting it).
enum class DenyMode {
    BLOCK,       // do not call the engine; return a BLOCKED placeholder
    SUBSTITUTE,  // call the engine with a harmless substitute script
};

struct EntryPointSpec {
    std::string name;
    ContentKind content{ContentKind::INLINE};
    DenyMode on_deny{DenyMode::BLOCK};
    // Entry point that actually runs the (resolved) script. Empty: `name`.
    // File entry points delegate to the engine's inline entry point so the
    // text that was hashed is the text that runs.
    std::string delegate_to;

    const std::string& target() const { return delegate_to.empty() ? name : delegate_to; }
};

using Resolver = std::function<std::shared_ptr<HostObject>()>;

// One foreign execution engine being gated.
struct IntegrationSpec {
    std::string name;       // key for overrides and reports, e.g. "dataviewjs"
    std::string host_name;  // name of the host object in the HostDirectory
    std::vector<EntryPointSpec> entry_points;
    // Script run in place of a denied one (SUBSTITUTE entry points).
    std::function<std::string(const TrustEntry&)> substitute;
};

// dataviewjs and meta-bind, as wired by the host application.
std::vector<IntegrationSpec> builtin_integrations();

// Resolves `host_name` through `dir` on every call.
Resolver directory_resolver(const HostDirectory& dir, const std::string& host_name);

} // namespace scriptgate
