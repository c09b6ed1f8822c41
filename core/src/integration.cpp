#include "scriptgate/integration.h"

namespace scriptgate {

static std::string log_only_script(const std::string& integration, const TrustEntry& digest) {
    return "console.log(\"scriptgate: blocked untrusted " + integration +
           " execution. Hash: " + digest + "\")";
}

std::vector<IntegrationSpec> builtin_integrations() {
    std::vector<IntegrationSpec> out;

    IntegrationSpec dv;
    dv.name = "dataviewjs";
    dv.host_name = "dataview";
    dv.entry_points.push_back({"executeJs", ContentKind::INLINE, DenyMode::BLOCK, ""});
    out.push_back(std::move(dv));

    IntegrationSpec mb;
    mb.name = "meta-bind";
    mb.host_name = "obsidian-meta-bind-plugin";
    mb.entry_points.push_back({"jsEngineRunCode", ContentKind::INLINE, DenyMode::SUBSTITUTE, ""});
    mb.entry_points.push_back({"jsEngineRunFile", ContentKind::FILE_REFERENCE, DenyMode::SUBSTITUTE,
                               "jsEngineRunCode"});
    mb.substitute = [](const TrustEntry& d) { return log_only_script("meta-bind", d); };
    out.push_back(std::move(mb));

    return out;
}

Resolver directory_resolver(const HostDirectory& dir, const std::string& host_name) {
    const HostDirectory* d = &dir;
    return [d, host_name]() { return d->find(host_name); };
}

} // namespace scriptgate
