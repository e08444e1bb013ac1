#include "polling_file_watcher.hpp"
#include "../errors.hpp"

#include <format>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace kiosk {

PollingFileWatcher::PollingFileWatcher(const std::chrono::milliseconds interval)
    : interval_(interval) {
}

PollingFileWatcher::~PollingFileWatcher() {
    unsubscribe();
}

void PollingFileWatcher::subscribe(const fs::path& file, EventCallback callback) {
    if (running_) {
        throw CommIOError(std::format("Already watching {}", file_.string()));
    }

    std::error_code ec;
    if (!fs::is_directory(file.parent_path(), ec)) {
        throw CommIOError(std::format("Unable to watch {}: not a directory", file.parent_path().string()));
    }

    file_ = file;
    callback_ = std::move(callback);
    running_ = true;
    poll_thread_ = std::thread(&PollingFileWatcher::poll_thread_func, this);
}

void PollingFileWatcher::unsubscribe() {
    if (!running_.exchange(false)) return;

    cv_.notify_all();
    if (poll_thread_.joinable()) {
        poll_thread_.join();
    }
}

bool PollingFileWatcher::file_present() const {
    std::error_code ec;
    return fs::is_regular_file(file_, ec);
}

void PollingFileWatcher::poll_thread_func() {
    bool was_present = false;

    // The record's presence is the signal: fire on every tick it exists, so a
    // file recreated while the handler ran is never mistaken for the old one.
    while (running_) {
        const bool present = file_present();
        if (present) {
            try {
                callback_(was_present ? FileEvent::Modified : FileEvent::Created);
            } catch (const std::exception& e) {
                spdlog::warn("File watch handler for {} failed: {}", file_.string(), e.what());
            }
        }
        was_present = present;

        std::unique_lock lock(cv_mutex_);
        cv_.wait_for(lock, interval_, [this] {
            return !running_;
        });
    }
}

} // namespace kiosk
