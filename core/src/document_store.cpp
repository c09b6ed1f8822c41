#include "scriptgate/document_store.h"

#include <fstream>
#include <sstream>

namespace scriptgate {

FsDocumentStore::FsDocumentStore(std::filesystem::path root, FileWatcher& watcher)
    : root_(std::move(root)), watcher_(watcher) {}

std::filesystem::path FsDocumentStore::path_for(const std::string& path) const {
    std::filesystem::path rel(path);
    if (path.empty() || rel.is_absolute() || rel.has_root_name()) throw DocumentNotFound(path);
    for (const auto& part : rel) {
        if (part == "..") throw DocumentNotFound(path);
    }
    return root_ / rel;
}

std::string FsDocumentStore::read_text(const std::string& path) {
    auto p = path_for(path);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(p, ec)) throw DocumentNotFound(path);

    std::ifstream f(p, std::ios::binary);
    if (!f) throw DocumentNotFound(path);
    std::stringstream ss;
    ss << f.rdbuf();
    if (f.bad()) throw std::runtime_error("read failed: " + p.string());
    return ss.str();
}

WatchId FsDocumentStore::watch(const std::string& path, std::function<void()> on_change) {
    return watcher_.add(path_for(path), std::move(on_change));
}

void FsDocumentStore::unwatch(WatchId id) {
    watcher_.remove(id);
}

} // namespace scriptgate
