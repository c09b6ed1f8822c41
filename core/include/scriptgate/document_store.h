#pragma once

#include "file_watcher.h"

#include <filesystem>
#include <functional>
#include <stdexcept>
#include <string>

namespace scriptgate {

class DocumentNotFound : public std::runtime_error {
public:
    explicit DocumentNotFound(const std::string& ref)
        : std::runtime_error("document not found: " + ref), ref_(ref) {}
    const std::string& ref() const { return ref_; }

private:
    std::string ref_;
};

// Host document corpus, as seen by the gate.
struct IDocumentStore {
    virtual ~IDocumentStore() = default;

    // Full text body of the document at a corpus-relative path, taken as
    // given ("notes/a.md", "scripts/run.js"). Throws DocumentNotFound.
    virtual std::string read_text(const std::string& path) = 0;

    // Subscribe to changes of one document. The callback may run on any thread.
    virtual WatchId watch(const std::string& path, std::function<void()> on_change) = 0;
    virtual void unwatch(WatchId id) = 0;
};

// Document store over a directory ("vault"). A path "a/b.md" names the
// file <root>/a/b.md.
class FsDocumentStore : public IDocumentStore {
public:
    FsDocumentStore(std::filesystem::path root, FileWatcher& watcher);

    std::string read_text(const std::string& path) override;
    WatchId watch(const std::string& path, std::function<void()> on_change) override;
    void unwatch(WatchId id) override;

    // Throws DocumentNotFound for empty paths and paths that leave the root.
    std::filesystem::path path_for(const std::string& path) const;
    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
    FileWatcher& watcher_;
};

} // namespace scriptgate
