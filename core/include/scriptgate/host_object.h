#pragma once

// Foreign objects whose script entry points the gate intercepts.
//
// A HostObject is an explicit indirection table: entry-point name ->
// swappable function reference. Foreign code dispatches through call(), which
// reads the live value on every invocation, so replacing a slot redirects all
// later calls. Values are shared_ptrs; two values are "the same" iff they are
// the same pointer.

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace scriptgate {

struct Invocation {
    std::string source;     // script text, or a vault-relative file path for file entry points
    std::string location;   // document the fragment belongs to
    std::string container;  // opaque render target handed back to the renderer
};

enum class InvocationStatus {
    OK,
    FAILED,
    BLOCKED,
};

struct InvocationResult {
    InvocationStatus status{InvocationStatus::OK};
    std::string output;
    std::string error;
};


class HostObject;

using EntryPointFn = std::function<InvocationResult(HostObject& self, const Invocation& inv)>;
using EntryPoint = std::shared_ptr<const EntryPointFn>;

EntryPoint make_entry_point(EntryPointFn fn);

class HostObject {
public:
    explicit HostObject(std::string name) : name_(std::move(name)) {}

    HostObject(const HostObject&) = delete;
    HostObject& operator=(const HostObject&) = delete;

    const std::string& name() const { return name_; }

    // nullptr if the slot does not exist.
    EntryPoint get(const std::string& entry_point) const;
    void set(const std::string& entry_point, EntryPoint value);
    bool has(const std::string& entry_point) const;
    std::vector<std::string> entry_points() const;

    // Dispatch to the live value. Throws std::runtime_error if the slot is
    // missing or empty; whatever the entry point throws propagates.
    InvocationResult call(const std::string& entry_point, const Invocation& inv);

private:
    std::string name_;
    mutable std::mutex mu_;
    std::unordered_map<std::string, EntryPoint> slots_;
};

// Named host objects that are currently loaded (the host's plugin registry).
// Integrations are looked up here by name; they may appear late.
class HostDirectory {
public:
    void add(std::shared_ptr<HostObject> obj);
    std::shared_ptr<HostObject> find(const std::string& name) const;

private:
    mutable std::mutex mu_;
    std::unordered_map<std::string, std::shared_ptr<HostObject>> objects_;
};

} // namespace scriptgate
