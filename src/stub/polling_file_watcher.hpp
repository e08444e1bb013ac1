#pragma once

#include "../interfaces/i_file_watcher.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <thread>

namespace kiosk {

// Portable fallback for platforms without a native file notification API
// wired up: samples the file on an interval.
class PollingFileWatcher : public IFileWatcher {
public:
    explicit PollingFileWatcher(std::chrono::milliseconds interval = std::chrono::milliseconds(250));
    ~PollingFileWatcher() override;

    PollingFileWatcher(const PollingFileWatcher&) = delete;
    PollingFileWatcher& operator=(const PollingFileWatcher&) = delete;

    void subscribe(const std::filesystem::path& file, EventCallback callback) override;
    void unsubscribe() override;

private:
    [[nodiscard]] bool file_present() const;
    void poll_thread_func();

    std::filesystem::path file_;
    EventCallback callback_;
    std::chrono::milliseconds interval_;

    std::thread poll_thread_;
    std::atomic<bool> running_{false};
    std::condition_variable cv_;
    std::mutex cv_mutex_;
};

} // namespace kiosk
