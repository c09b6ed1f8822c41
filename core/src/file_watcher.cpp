#include "scriptgate/file_watcher.h"

#include <chrono>
#include <vector>

namespace scriptgate {

FileWatcher::FileWatcher(int poll_interval_ms)
    : poll_ms_(poll_interval_ms < 10 ? 10 : poll_interval_ms) {}

FileWatcher::~FileWatcher() {
    stop();
}

FileWatcher::Fingerprint FileWatcher::fingerprint(const std::filesystem::path& p) {
    Fingerprint fp;
    std::error_code ec;
    auto st = std::filesystem::status(p, ec);
    if (ec || !std::filesystem::is_regular_file(st)) return fp;
    fp.size = std::filesystem::file_size(p, ec);
    if (ec) return Fingerprint{};
    fp.mtime = std::filesystem::last_write_time(p, ec);
    if (ec) return Fingerprint{};
    fp.exists = true;
    return fp;
}

WatchId FileWatcher::add(const std::filesystem::path& path, Callback cb) {
    Watch w;
    w.path = path;
    w.cb = std::move(cb);
    w.last = fingerprint(path);

    std::lock_guard<std::mutex> lk(mu_);
    WatchId id = next_id_++;
    watches_.emplace(id, std::move(w));
    return id;
}

void FileWatcher::remove(WatchId id) {
    std::lock_guard<std::mutex> lk(mu_);
    watches_.erase(id);
}

size_t FileWatcher::watch_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return watches_.size();
}

size_t FileWatcher::poll_once() {
    std::vector<std::pair<WatchId, std::filesystem::path>> targets;
    {
        std::lock_guard<std::mutex> lk(mu_);
        targets.reserve(watches_.size());
        for (const auto& kv : watches_) targets.emplace_back(kv.first, kv.second.path);
    }

    // stat outside the lock, then collect callbacks for changed entries
    std::vector<Callback> fire;
    for (const auto& t : targets) {
        Fingerprint now = fingerprint(t.second);
        std::lock_guard<std::mutex> lk(mu_);
        auto it = watches_.find(t.first);
        if (it == watches_.end()) continue;  // removed meanwhile
        if (it->second.last == now) continue;
        it->second.last = now;
        if (it->second.cb) fire.push_back(it->second.cb);
    }

    for (auto& cb : fire) cb();
    return fire.size();
}

void FileWatcher::start() {
    std::lock_guard<std::mutex> lk(run_mu_);
    if (running_.load()) return;
    stop_requested_ = false;
    running_.store(true);
    thread_ = std::thread([this] { loop(); });
}

void FileWatcher::stop() {
    {
        std::lock_guard<std::mutex> lk(run_mu_);
        if (!running_.load()) return;
        stop_requested_ = true;
    }
    run_cv_.notify_all();
    if (thread_.joinable()) thread_.join();
    running_.store(false);
}

void FileWatcher::loop() {
    std::unique_lock<std::mutex> lk(run_mu_);
    while (!stop_requested_) {
        run_cv_.wait_for(lk, std::chrono::milliseconds(poll_ms_), [this] { return stop_requested_; });
        if (stop_requested_) break;
        lk.unlock();
        poll_once();
        lk.lock();
    }
}

} // namespace scriptgate
