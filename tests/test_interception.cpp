#include "test_common.h"
#include "scriptgate/interception.h"

#include <memory>
#include <stdexcept>

using namespace scriptgate;

static InvocationResult ok_with(const std::string& out) {
    InvocationResult r;
    r.output = out;
    return r;
}

int main() {
    // Test 1: install swaps the slot, uninstall restores the identical value
    {
        auto host = std::make_shared<HostObject>("dataview");
        EntryPoint original = make_entry_point([](HostObject&, const Invocation& inv) {
            return ok_with("ran:" + inv.source);
        });
        host->set("executeJs", original);

        InterceptionManager im;
        EntryPoint guard = make_entry_point([](HostObject&, const Invocation&) { return ok_with("guarded"); });
        auto b = im.install(host, "executeJs", guard);

        expect_true(host->get("executeJs") == guard, "guard installed");
        expect_true(b.original == original, "binding keeps the original");
        expect_true(im.is_installed(*host, "executeJs"), "manager tracks binding");
        expect_eq_str(host->call("executeJs", {"x", "", ""}).output, "guarded", "calls go to guard");

        im.uninstall(b);
        expect_true(host->get("executeJs") == original, "original restored by identity");
        expect_eq_ll((long long)im.size(), 0, "table empty");
        expect_eq_str(host->call("executeJs", {"x", "", ""}).output, "ran:x", "original runs again");
    }

    // Test 2: error kinds
    {
        auto host = std::make_shared<HostObject>("engine");
        host->set("run", make_entry_point([](HostObject&, const Invocation&) { return ok_with("r"); }));
        InterceptionManager im;
        EntryPoint g = make_entry_point([](HostObject&, const Invocation&) { return ok_with("g"); });

        auto b = im.install(host, "run", g);
        bool threw = false;
        try {
            im.install(host, "run", g);
        } catch (const InterceptionError& e) {
            threw = e.code() == InterceptionErrc::ALREADY_INSTALLED;
        }
        expect_true(threw, "double install is ALREADY_INSTALLED");

        threw = false;
        try {
            im.install(host, "missing", g);
        } catch (const InterceptionError& e) {
            threw = e.code() == InterceptionErrc::ENTRY_POINT_MISSING;
        }
        expect_true(threw, "absent entry point is ENTRY_POINT_MISSING");

        threw = false;
        try {
            im.install(host, "other", nullptr);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        expect_true(threw, "null guard rejected");

        im.uninstall(b);
        threw = false;
        try {
            im.uninstall(b);
        } catch (const InterceptionError& e) {
            threw = e.code() == InterceptionErrc::BINDING_NOT_FOUND;
        }
        expect_true(threw, "second uninstall is BINDING_NOT_FOUND");

        // stale binding from an earlier install does not remove a newer one
        auto b2 = im.install(host, "run", g);
        threw = false;
        try {
            im.uninstall(b);
        } catch (const InterceptionError& e) {
            threw = e.code() == InterceptionErrc::BINDING_NOT_FOUND;
        }
        expect_true(threw, "stale binding rejected");
        expect_true(im.is_installed(*host, "run"), "newer binding untouched");
        im.uninstall(b2);
    }

    // Test 3: delegation brackets the original and reinstalls the guard,
    // also when the original throws
    {
        auto host = std::make_shared<HostObject>("engine");
        EntryPoint original = make_entry_point([](HostObject&, const Invocation& inv) -> InvocationResult {
            if (inv.source == "boom") throw std::runtime_error("engine failure");
            return ok_with("orig");
        });
        host->set("run", original);
        InterceptionManager im;

        EntryPoint guard;
        guard = make_entry_point([&im](HostObject& self, const Invocation& inv) {
            return im.delegate(self, "run", [&] {
                // while delegating the slot holds the original
                return self.call("run", inv);
            });
        });
        auto b = im.install(host, "run", guard);

        expect_eq_str(host->call("run", {"fine", "", ""}).output, "orig", "delegated call reaches original");
        expect_true(host->get("run") == guard, "guard back after delegation");

        bool threw = false;
        try {
            host->call("run", {"boom", "", ""});
        } catch (const std::runtime_error& e) {
            threw = std::string(e.what()) == "engine failure";
        }
        expect_true(threw, "engine exception propagates unchanged");
        expect_true(host->get("run") == guard, "guard back after exception");

        im.uninstall(b);
        expect_true(host->get("run") == original, "original restored");
    }

    // Test 4: nested delegation only swaps at the outermost level
    {
        auto host = std::make_shared<HostObject>("engine");
        EntryPoint original = make_entry_point([](HostObject&, const Invocation&) { return ok_with("o"); });
        host->set("run", original);
        InterceptionManager im;
        EntryPoint guard = make_entry_point([](HostObject&, const Invocation&) { return ok_with("g"); });
        im.install(host, "run", guard);

        {
            InterceptionManager::DelegationScope outer(im, *host, "run");
            expect_true(host->get("run") == original, "outer scope swaps in original");
            {
                InterceptionManager::DelegationScope inner(im, *host, "run");
                expect_true(host->get("run") == original, "inner scope keeps original");
            }
            expect_true(host->get("run") == original, "inner exit does not reinstall");
        }
        expect_true(host->get("run") == guard, "outer exit reinstalls guard");

        bool threw = false;
        try {
            InterceptionManager::DelegationScope s(im, *host, "other");
        } catch (const InterceptionError& e) {
            threw = e.code() == InterceptionErrc::BINDING_NOT_FOUND;
        }
        expect_true(threw, "delegating an unintercepted entry point throws");
    }

    // Test 5: another actor replaced the guard; uninstall still restores the original
    {
        auto host = std::make_shared<HostObject>("engine");
        EntryPoint original = make_entry_point([](HostObject&, const Invocation&) { return ok_with("o"); });
        host->set("run", original);
        InterceptionManager im;
        auto b = im.install(host, "run", make_entry_point([](HostObject&, const Invocation&) { return ok_with("g"); }));
        host->set("run", make_entry_point([](HostObject&, const Invocation&) { return ok_with("foreign"); }));
        im.uninstall(b);
        expect_true(host->get("run") == original, "original restored over foreign value");
    }

    // Test 6: uninstall_all and destructor restore every binding
    {
        auto h1 = std::make_shared<HostObject>("a");
        auto h2 = std::make_shared<HostObject>("b");
        EntryPoint o1 = make_entry_point([](HostObject&, const Invocation&) { return ok_with("1"); });
        EntryPoint o2 = make_entry_point([](HostObject&, const Invocation&) { return ok_with("2"); });
        h1->set("run", o1);
        h2->set("run", o2);
        EntryPoint g = make_entry_point([](HostObject&, const Invocation&) { return ok_with("g"); });
        {
            InterceptionManager im;
            im.install(h1, "run", g);
            im.install(h2, "run", g);
            expect_eq_ll((long long)im.bindings().size(), 2, "two bindings");
            expect_true(im.find(*h1, "run").has_value(), "find binding");
            expect_true(!im.find(*h1, "nope").has_value(), "find missing");
        }
        expect_true(h1->get("run") == o1 && h2->get("run") == o2, "destructor restored both");

        InterceptionManager im;
        im.install(h1, "run", g);
        expect_eq_ll((long long)im.uninstall_all(), 1, "uninstall_all count");
        expect_true(h1->get("run") == o1, "uninstall_all restored");
    }

    // Test 7: the slot is changed by someone else while the original runs;
    // leaving the scope puts the guard back
    {
        auto host = std::make_shared<HostObject>("engine");
        EntryPoint original = make_entry_point([](HostObject&, const Invocation&) { return ok_with("o"); });
        EntryPoint foreign = make_entry_point([](HostObject&, const Invocation&) { return ok_with("foreign"); });
        host->set("run", original);
        InterceptionManager im;
        EntryPoint guard = make_entry_point([](HostObject&, const Invocation&) { return ok_with("g"); });
        im.install(host, "run", guard);
        {
            InterceptionManager::DelegationScope s(im, *host, "run");
            expect_true(host->get("run") == original, "original in place while delegating");
            host->set("run", foreign);
        }
        expect_true(host->get("run") == guard, "guard reinstalled over the foreign value");
        expect_eq_str(host->call("run", {"", "", ""}).output, "g", "calls reach the guard again");
        im.uninstall_all();
        expect_true(host->get("run") == original, "original restored afterwards");
    }

    std::cerr << "test_interception: ALL PASSED" << std::endl;
    return 0;
}
