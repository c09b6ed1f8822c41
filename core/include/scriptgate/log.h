#pragma once
#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>

namespace scriptgate {

// Append-only JSONL audit trail of gate decisions and lifecycle events.
// Every line carries chain_prev/chain_hash with
//   chain_hash = SHA256(chain_prev || canonical(record))
// so deleting or editing a line breaks the chain. Opening an existing file
// continues its chain.
class AuditLog {
public:
    AuditLog() = default;  // disabled: event() is a no-op
    explicit AuditLog(const std::string& path);

    bool enabled() const { return enabled_; }
    const std::string& path() const { return path_; }

    void event(const std::string& name, const std::string& payload_json);

private:
    bool enabled_{false};
    std::string path_;
    std::mutex mu_;
    std::ofstream out_;
    std::string chain_prev_{std::string(64, '0')};
    uint64_t seq_{0};
};

// Re-hash every line of an audit file. Returns false and fills err at the
// first broken link. `lines` receives the number of verified lines.
bool verify_audit_chain(const std::string& path, size_t* lines, std::string* err);

} // namespace scriptgate
