#include "scriptgate/interception.h"

#include <iostream>

namespace scriptgate {

const char* interception_errc_name(InterceptionErrc c) {
    switch (c) {
        case InterceptionErrc::ALREADY_INSTALLED:   return "ALREADY_INSTALLED";
        case InterceptionErrc::BINDING_NOT_FOUND:   return "BINDING_NOT_FOUND";
        case InterceptionErrc::ENTRY_POINT_MISSING: return "ENTRY_POINT_MISSING";
    }
    return "BINDING_NOT_FOUND";
}

InterceptionManager::~InterceptionManager() {
    uninstall_all();
}

InterceptionBinding InterceptionManager::install(const std::shared_ptr<HostObject>& target,
                                                 const std::string& entry_point,
                                                 EntryPoint guard) {
    if (!target) {
        throw InterceptionError(InterceptionErrc::ENTRY_POINT_MISSING,
                                "install: null target for " + entry_point);
    }
    if (!guard) {
        throw std::invalid_argument("install: null guard for " + entry_point);
    }

    std::lock_guard<std::mutex> lk(mu_);
    Key key{target.get(), entry_point};
    if (table_.count(key)) {
        throw InterceptionError(InterceptionErrc::ALREADY_INSTALLED,
                                "already intercepted: " + target->name() + "." + entry_point);
    }

    EntryPoint original = target->get(entry_point);
    if (!original) {
        throw InterceptionError(InterceptionErrc::ENTRY_POINT_MISSING,
                                "no entry point to intercept: " + target->name() + "." + entry_point);
    }

    Slot slot;
    slot.binding.id = next_id_++;
    slot.binding.target = target;
    slot.binding.entry_point = entry_point;
    slot.binding.original = std::move(original);
    slot.binding.guard = std::move(guard);

    target->set(entry_point, slot.binding.guard);
    InterceptionBinding out = slot.binding;
    table_.emplace(std::move(key), std::move(slot));
    return out;
}

void InterceptionManager::restore_locked(Slot& slot) {
    auto& b = slot.binding;
    // While delegating the slot legitimately holds the original.
    EntryPoint live = b.target->get(b.entry_point);
    EntryPoint expected = slot.depth > 0 ? b.original : b.guard;
    if (live != expected) {
        std::cerr << "[intercept] warn: " << b.target->name() << "." << b.entry_point
                  << " was replaced by another actor; restoring the original anyway\n";
    }
    b.target->set(b.entry_point, b.original);
}

void InterceptionManager::uninstall(const InterceptionBinding& binding) {
    std::lock_guard<std::mutex> lk(mu_);
    if (!binding.target) {
        throw InterceptionError(InterceptionErrc::BINDING_NOT_FOUND, "uninstall: empty binding");
    }
    Key key{binding.target.get(), binding.entry_point};
    auto it = table_.find(key);
    if (it == table_.end() || it->second.binding.id != binding.id) {
        throw InterceptionError(InterceptionErrc::BINDING_NOT_FOUND,
                                "no such binding: " + binding.target->name() + "." + binding.entry_point);
    }
    restore_locked(it->second);
    table_.erase(it);
}

size_t InterceptionManager::uninstall_all() {
    std::lock_guard<std::mutex> lk(mu_);
    size_t n = 0;
    for (auto& kv : table_) {
        restore_locked(kv.second);
        n++;
    }
    table_.clear();
    return n;
}

bool InterceptionManager::is_installed(const HostObject& target, const std::string& entry_point) const {
    std::lock_guard<std::mutex> lk(mu_);
    return table_.count(Key{&target, entry_point}) > 0;
}

std::optional<InterceptionBinding> InterceptionManager::find(const HostObject& target,
                                                             const std::string& entry_point) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = table_.find(Key{&target, entry_point});
    if (it == table_.end()) return std::nullopt;
    return it->second.binding;
}

std::vector<InterceptionBinding> InterceptionManager::bindings() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<InterceptionBinding> out;
    out.reserve(table_.size());
    for (const auto& kv : table_) out.push_back(kv.second.binding);
    return out;
}

size_t InterceptionManager::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return table_.size();
}

// --- DelegationScope ---

InterceptionManager::DelegationScope::DelegationScope(InterceptionManager& mgr,
                                                      HostObject& target,
                                                      const std::string& entry_point)
    : mgr_(mgr), target_(target), entry_point_(entry_point), binding_id_(0) {
    std::lock_guard<std::mutex> lk(mgr_.mu_);
    auto it = mgr_.table_.find(Key{&target_, entry_point_});
    if (it == mgr_.table_.end()) {
        throw InterceptionError(InterceptionErrc::BINDING_NOT_FOUND,
                                "delegate: not intercepted: " + target_.name() + "." + entry_point_);
    }
    Slot& slot = it->second;
    binding_id_ = slot.binding.id;
    if (slot.depth++ == 0) {
        target_.set(entry_point_, slot.binding.original);
    }
}

InterceptionManager::DelegationScope::~DelegationScope() {
    std::lock_guard<std::mutex> lk(mgr_.mu_);
    auto it = mgr_.table_.find(Key{&target_, entry_point_});
    // uninstalled while delegating: the original is already back in place
    if (it == mgr_.table_.end() || it->second.binding.id != binding_id_) return;
    Slot& slot = it->second;
    if (--slot.depth == 0) {
        if (target_.get(entry_point_) != slot.binding.original) {
            std::cerr << "[intercept] warn: " << target_.name() << "." << entry_point_
                      << " changed during delegation; reinstalling guard\n";
        }
        target_.set(entry_point_, slot.binding.guard);
    }
}

} // namespace scriptgate
