#include "scriptgate/guard.h"
#include "scriptgate/json_util.h"

#include <iostream>
#include <stdexcept>

namespace scriptgate {

// Calls `target` on `self`, bracketed if that entry point is intercepted.
static InvocationResult run_original(InterceptionManager& im, HostObject& self,
                                     const std::string& target, const Invocation& inv) {
    if (im.is_installed(self, target)) {
        return im.delegate(self, target, [&] { return self.call(target, inv); });
    }
    return self.call(target, inv);
}

EntryPoint make_guard(GuardContext ctx) {
    if (!ctx.interceptions || !ctx.trust || !ctx.policy || !ctx.renderer) {
        throw std::invalid_argument("make_guard: incomplete context for " + ctx.integration);
    }
    if (ctx.entry_point.content == ContentKind::FILE_REFERENCE && !ctx.docs) {
        throw std::invalid_argument("make_guard: file entry point without document store: " +
                                    ctx.entry_point.name);
    }

    return make_entry_point([ctx](HostObject& self, const Invocation& inv) -> InvocationResult {
        const EntryPointSpec& ep = ctx.entry_point;
        const std::string& target = ep.target();
        const bool file_ref = ep.content == ContentKind::FILE_REFERENCE;

        std::string content = inv.source;
        if (file_ref) {
            try {
                content = ctx.docs->read_text(inv.source);
            } catch (const std::exception& e) {
                if (ctx.stats) ctx.stats->failed++;
                std::cerr << "[gate] error: " << ctx.integration << "." << ep.name
                          << ": cannot read script file " << inv.source << ": " << e.what() << "\n";
                InvocationResult r;
                r.status = InvocationStatus::FAILED;
                r.error = e.what();
                return r;
            }
        }

        // One snapshot and one copy of the flags for the whole decision.
        auto snap = ctx.trust->snapshot();
        PolicyFlags flags = ctx.policy->get();
        Decision d = decide(content, ctx.integration, flags, *snap);

        // Inline delegation target gets the text that was hashed.
        Invocation call = inv;
        if (file_ref && target != ep.name) call.source = content;

        if (d.allowed()) {
            if (ctx.stats) ctx.stats->allowed++;
            return run_original(*ctx.interceptions, self, target, call);
        }

        if (ctx.stats) ctx.stats->denied++;
        std::cerr << "[gate] blocked untrusted " << ctx.integration << " execution. hash: "
                  << d.digest << "\n";

        DenialReport rep;
        rep.location = inv.location;
        rep.digest = d.digest;
        rep.integration = ctx.integration;
        rep.entry_point = ep.name;
        rep.container = inv.container;
        try {
            ctx.renderer->report_denied(rep);
        } catch (const std::exception& e) {
            std::cerr << "[gate] warn: renderer failed to report denial: " << e.what() << "\n";
        }
        if (ctx.audit) {
            ctx.audit->event("gate.denied", json_fields({
                {"integration", ctx.integration},
                {"entry_point", ep.name},
                {"location", inv.location},
                {"digest", d.digest},
            }));
        }

        const bool can_substitute = ep.on_deny == DenyMode::SUBSTITUTE && ctx.substitute &&
                                    (!file_ref || target != ep.name);
        if (can_substitute) {
            Invocation sub = call;
            sub.source = ctx.substitute(d.digest);
            return run_original(*ctx.interceptions, self, target, sub);
        }

        InvocationResult r;
        r.status = InvocationStatus::BLOCKED;
        r.output = render_denied_placeholder(rep);
        return r;
    });
}

} // namespace scriptgate
