#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace scriptgate {

using WatchId = uint64_t;

// Polling change detector for individual files.
// A file "changes" when it appears, disappears, or its size or mtime differs
// from the previous poll. Callbacks run on the polling thread (or the caller
// of poll_once()), never while the watch table is locked.
class FileWatcher {
public:
    using Callback = std::function<void()>;

    explicit FileWatcher(int poll_interval_ms = 500);
    ~FileWatcher();

    FileWatcher(const FileWatcher&) = delete;
    FileWatcher& operator=(const FileWatcher&) = delete;

    WatchId add(const std::filesystem::path& path, Callback cb);
    // Unknown ids are ignored.
    void remove(WatchId id);

    // Check every watched file once. Returns the number of callbacks fired.
    size_t poll_once();

    void start();
    void stop();
    bool running() const { return running_.load(); }

    size_t watch_count() const;
    int poll_interval_ms() const { return poll_ms_; }

private:
    struct Fingerprint {
        bool exists{false};
        uintmax_t size{0};
        std::filesystem::file_time_type mtime{};
        bool operator==(const Fingerprint& o) const {
            return exists == o.exists && size == o.size && mtime == o.mtime;
        }
    };
    struct Watch {
        std::filesystem::path path;
        Callback cb;
        Fingerprint last;
    };

    static Fingerprint fingerprint(const std::filesystem::path& p);
    void loop();

    int poll_ms_;
    mutable std::mutex mu_;
    std::unordered_map<WatchId, Watch> watches_;
    WatchId next_id_{1};

    std::mutex run_mu_;
    std::condition_variable run_cv_;
    std::atomic<bool> running_{false};
    bool stop_requested_{false};
    std::thread thread_;
};

} // namespace scriptgate
