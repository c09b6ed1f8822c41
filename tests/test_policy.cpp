#include "test_common.h"
#include "scriptgate/policy.h"
#include "scriptgate/trust_store.h"

int main() {
    using namespace scriptgate;
    const std::string code = "dv.paragraph('hi')";
    const std::string d = digest::of(code);

    TrustSnapshot trusted({d}, 1);
    TrustSnapshot untrusted({digest::of("something else")}, 1);

    // Test 1: full truth table over (trusted, global, integration override)
    {
        struct Row {
            bool trusted, global, bypass;
            Verdict verdict;
            DecisionReason reason;
        };
        const Row rows[] = {
            {false, false, false, Verdict::DENY,  DecisionReason::UNTRUSTED},
            {false, false, true,  Verdict::ALLOW, DecisionReason::INTEGRATION_OVERRIDE},
            {false, true,  false, Verdict::ALLOW, DecisionReason::GLOBAL_OVERRIDE},
            {false, true,  true,  Verdict::ALLOW, DecisionReason::GLOBAL_OVERRIDE},
            {true,  false, false, Verdict::ALLOW, DecisionReason::TRUSTED_HASH},
            {true,  false, true,  Verdict::ALLOW, DecisionReason::TRUSTED_HASH},
            {true,  true,  false, Verdict::ALLOW, DecisionReason::TRUSTED_HASH},
            {true,  true,  true,  Verdict::ALLOW, DecisionReason::TRUSTED_HASH},
        };
        int i = 0;
        for (const auto& r : rows) {
            PolicyFlags f;
            f.allow_untrusted = r.global;
            f.integration_bypass["dataviewjs"] = r.bypass;
            Decision dec = decide(code, "dataviewjs", f, r.trusted ? trusted : untrusted);
            std::string tag = "row " + std::to_string(i++);
            expect_true(dec.verdict == r.verdict, tag + ": verdict " + verdict_name(dec.verdict));
            expect_eq_str(decision_reason_name(dec.reason), decision_reason_name(r.reason), tag + ": reason");
            expect_eq_str(dec.digest, d, tag + ": digest reported");
        }
    }

    // Test 2: an override for one integration does not leak to another
    {
        PolicyFlags f;
        f.integration_bypass["meta-bind"] = true;
        expect_true(decide(code, "meta-bind", f, untrusted).allowed(), "meta-bind bypassed");
        expect_true(!decide(code, "dataviewjs", f, untrusted).allowed(), "dataviewjs still gated");
        f.integration_bypass["meta-bind"] = false;
        expect_true(!decide(code, "meta-bind", f, untrusted).allowed(), "explicit false is not a bypass");
    }

    // Test 3: empty content is hashed like anything else
    {
        PolicyFlags f;
        Decision dec = decide("", "dataviewjs", f, untrusted);
        expect_true(!dec.allowed(), "empty content denied when untrusted");
        expect_eq_str(dec.digest, "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855",
                      "empty content digest");
    }

    // Test 4: decide against a live store uses its current snapshot
    {
        TrustStore store;
        PolicyFlags f;
        store.refresh();
        expect_true(!decide(code, "dataviewjs", f, store).allowed(), "denied before trust");
        store.add_manual(d);
        store.refresh();
        expect_true(decide(code, "dataviewjs", f, store).allowed(), "allowed after trust");
    }

    // Test 5: settings object
    {
        PolicySettings s;
        expect_true(!s.get().allow_untrusted, "default is gated");
        s.set_allow_untrusted(true);
        s.set_integration_bypass("dataviewjs", true);
        PolicyFlags f = s.get();
        expect_true(f.allow_untrusted && f.bypasses("dataviewjs"), "flags stored");
        expect_true(!f.bypasses("meta-bind"), "unset integration not bypassed");
    }

    std::cerr << "test_policy: ALL PASSED" << std::endl;
    return 0;
}
