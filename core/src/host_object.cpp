#include "scriptgate/host_object.h"

#include <algorithm>
#include <stdexcept>

namespace scriptgate {

EntryPoint make_entry_point(EntryPointFn fn) {
    return std::make_shared<const EntryPointFn>(std::move(fn));
}

EntryPoint HostObject::get(const std::string& entry_point) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = slots_.find(entry_point);
    if (it == slots_.end()) return nullptr;
    return it->second;
}

void HostObject::set(const std::string& entry_point, EntryPoint value) {
    std::lock_guard<std::mutex> lk(mu_);
    slots_[entry_point] = std::move(value);
}

bool HostObject::has(const std::string& entry_point) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = slots_.find(entry_point);
    return it != slots_.end() && it->second != nullptr;
}

std::vector<std::string> HostObject::entry_points() const {
    std::vector<std::string> out;
    {
        std::lock_guard<std::mutex> lk(mu_);
        out.reserve(slots_.size());
        for (const auto& kv : slots_) out.push_back(kv.first);
    }
    std::sort(out.begin(), out.end());
    return out;
}

InvocationResult HostObject::call(const std::string& entry_point, const Invocation& inv) {
    EntryPoint fn = get(entry_point);
    if (!fn || !*fn) {
        throw std::runtime_error("no entry point '" + entry_point + "' on " + name_);
    }
    // fn keeps the callable alive even if the slot is swapped mid-call
    return (*fn)(*this, inv);
}

void HostDirectory::add(std::shared_ptr<HostObject> obj) {
    if (!obj) return;
    std::lock_guard<std::mutex> lk(mu_);
    objects_[obj->name()] = std::move(obj);
}

std::shared_ptr<HostObject> HostDirectory::find(const std::string& name) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = objects_.find(name);
    if (it == objects_.end()) return nullptr;
    return it->second;
}

} // namespace scriptgate
