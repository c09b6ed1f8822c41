#pragma once

// Interception Manager: the only component that writes entry-point slots.
//
// Lifecycle per (host object, entry point):
//   UNINSTALLED --install()--> INSTALLED --uninstall()--> UNINSTALLED
//
// While INSTALLED, a guard that decides to run the original wraps the call in
// a DelegationScope: the original is put back in the slot for exactly that
// call, so a recursive call from inside the original reaches the original
// instead of the guard, and the guard is reinstated on every exit path
// (return or throw) before the outer call returns.

#include "host_object.h"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace scriptgate {

enum class InterceptionErrc {
    ALREADY_INSTALLED,
    BINDING_NOT_FOUND,
    ENTRY_POINT_MISSING,
};

const char* interception_errc_name(InterceptionErrc c);

class InterceptionError : public std::runtime_error {
public:
    InterceptionError(InterceptionErrc code, const std::string& what)
        : std::runtime_error(what), code_(code) {}
    InterceptionErrc code() const { return code_; }

private:
    InterceptionErrc code_;
};

struct InterceptionBinding {
    uint64_t id{0};
    std::shared_ptr<HostObject> target;
    std::string entry_point;
    EntryPoint original;  // value captured at install time
    EntryPoint guard;     // value written in its place
};

class InterceptionManager {
public:
    InterceptionManager() = default;
    // Restores every binding still installed.
    ~InterceptionManager();

    InterceptionManager(const InterceptionManager&) = delete;
    InterceptionManager& operator=(const InterceptionManager&) = delete;

    // Throws InterceptionError (ALREADY_INSTALLED, ENTRY_POINT_MISSING).
    InterceptionBinding install(const std::shared_ptr<HostObject>& target,
                                const std::string& entry_point,
                                EntryPoint guard);

    // Writes the captured original back, even if another actor replaced the
    // guard meanwhile (a warning is logged in that case).
    // Throws InterceptionError(BINDING_NOT_FOUND).
    void uninstall(const InterceptionBinding& binding);

    // Uninstalls everything; returns how many bindings were restored.
    size_t uninstall_all();

    bool is_installed(const HostObject& target, const std::string& entry_point) const;
    std::optional<InterceptionBinding> find(const HostObject& target,
                                            const std::string& entry_point) const;
    std::vector<InterceptionBinding> bindings() const;
    size_t size() const;

    class DelegationScope {
    public:
        // Throws InterceptionError(BINDING_NOT_FOUND).
        DelegationScope(InterceptionManager& mgr, HostObject& target, const std::string& entry_point);
        ~DelegationScope();

        DelegationScope(const DelegationScope&) = delete;
        DelegationScope& operator=(const DelegationScope&) = delete;

    private:
        InterceptionManager& mgr_;
        HostObject& target_;
        std::string entry_point_;
        uint64_t binding_id_;
    };

    // Run fn() with the original reinstated at (target, entry_point).
    template <typename Fn>
    auto delegate(HostObject& target, const std::string& entry_point, Fn&& fn) -> decltype(fn()) {
        DelegationScope scope(*this, target, entry_point);
        return fn();
    }

private:
    using Key = std::pair<const HostObject*, std::string>;
    struct Slot {
        InterceptionBinding binding;
        int depth{0};  // active DelegationScopes
    };

    void restore_locked(Slot& slot);

    mutable std::mutex mu_;
    std::map<Key, Slot> table_;
    uint64_t next_id_{1};
};

} // namespace scriptgate
