#pragma once
#include "digest.h"

#include <mutex>
#include <string>
#include <vector>

namespace scriptgate {

struct DenialReport {
    std::string location;     // document holding the blocked fragment
    TrustEntry digest;        // what the operator would have to trust
    std::string integration;  // e.g. "dataviewjs"
    std::string entry_point;
    std::string container;
};

// Host-side presentation of gate outcomes.
struct IRenderer {
    virtual ~IRenderer() = default;
    // Called once per denied invocation.
    virtual void report_denied(const DenialReport& report) = 0;
    // Trust set or flags changed; previously rendered output may be stale.
    virtual void rerender_all() {}
};

// Placeholder shown instead of the blocked fragment's output.
std::string render_denied_placeholder(const DenialReport& report);

// Writes placeholders to stderr. Used by the CLI.
class ConsoleRenderer : public IRenderer {
public:
    void report_denied(const DenialReport& report) override;
};

// Keeps every report in memory.
class RecordingRenderer : public IRenderer {
public:
    void report_denied(const DenialReport& report) override;
    void rerender_all() override;

    std::vector<DenialReport> reports() const;
    size_t rerender_count() const;

private:
    mutable std::mutex mu_;
    std::vector<DenialReport> reports_;
    size_t rerenders_{0};
};

} // namespace scriptgate
