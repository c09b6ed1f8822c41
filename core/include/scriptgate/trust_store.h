#pragma once

// Trust Store: the set of content digests allowed to execute.
//
// Entries come from three kinds of sources (see trust_source.h). refresh()
// re-reads every source and swaps in a new immutable TrustSnapshot. Readers
// grab a shared_ptr to the current snapshot and decide against it; a refresh
// that completes later never changes a decision already in progress.
//
// A source that cannot be read contributes nothing and is recorded in
// last_report(). refresh() does not throw for source errors.

#include "digest.h"
#include "document_store.h"
#include "trust_source.h"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace scriptgate {

class TrustSnapshot {
public:
    TrustSnapshot() = default;
    TrustSnapshot(std::unordered_set<TrustEntry> entries, uint64_t generation)
        : entries_(std::move(entries)), generation_(generation) {}

    // `entry` is normalized before lookup.
    bool contains(const std::string& entry) const;
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    uint64_t generation() const { return generation_; }

    const std::unordered_set<TrustEntry>& entries() const { return entries_; }
    std::vector<TrustEntry> sorted_entries() const;
    bool same_entries(const TrustSnapshot& o) const { return entries_ == o.entries_; }

private:
    std::unordered_set<TrustEntry> entries_;
    uint64_t generation_{0};
};

struct SourceReport {
    TrustSource source;
    bool ok{true};
    size_t entries{0};
    std::string error;
};

class TrustStore {
public:
    // `docs` resolves NOTE sources; may be null, in which case every note
    // source is reported unavailable.
    explicit TrustStore(IDocumentStore* docs = nullptr);

    std::shared_ptr<const TrustSnapshot> refresh();
    std::shared_ptr<const TrustSnapshot> snapshot() const;
    bool contains(const std::string& entry) const;

    // Configuration mutators. Return true if the configuration changed.
    // Changes take effect on the next refresh().
    bool add_manual(const std::string& entry);
    bool remove_manual(const std::string& entry);
    bool add_source(const TrustSource& source);
    bool remove_source(const TrustSource& source);
    void replace_config(const std::vector<TrustEntry>& manual,
                        const std::vector<TrustSource>& sources);

    std::vector<TrustEntry> manual_entries() const;
    std::vector<TrustSource> sources() const;
    std::vector<SourceReport> last_report() const;

private:
    std::unordered_set<TrustEntry> read_source(const TrustSource& src, SourceReport* rep) const;

    IDocumentStore* docs_;

    mutable std::mutex cfg_mu_;
    std::vector<TrustEntry> manual_;
    std::vector<TrustSource> sources_;

    std::mutex refresh_mu_;  // serializes refresh() calls

    mutable std::mutex snap_mu_;
    std::shared_ptr<const TrustSnapshot> snap_;
    std::vector<SourceReport> report_;
    uint64_t generation_{0};
};

} // namespace scriptgate
