#include "inotify_file_watcher.hpp"
#include "../errors.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <poll.h>
#include <spdlog/spdlog.h>
#include <sys/inotify.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace kiosk {

namespace {

constexpr uint32_t kWatchMask = IN_CREATE | IN_MOVED_TO | IN_MODIFY | IN_CLOSE_WRITE |
                                IN_DELETE_SELF | IN_MOVE_SELF | IN_ONLYDIR;

// Retry interval while the watched directory is gone
constexpr int kRearmIntervalMs = 1000;

} // namespace

InotifyFileWatcher::~InotifyFileWatcher() {
    unsubscribe();
}

void InotifyFileWatcher::subscribe(const fs::path& file, EventCallback callback) {
    if (running_) {
        throw CommIOError(std::format("Already watching {}", (directory_ / file_name_).string()));
    }

    directory_ = file.parent_path();
    file_name_ = file.filename().string();
    callback_ = std::move(callback);

    inotify_fd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (inotify_fd_ < 0) {
        throw CommIOError(std::format("inotify_init1 failed: {}", std::strerror(errno)));
    }

    if (pipe2(wake_pipe_, O_NONBLOCK | O_CLOEXEC) != 0) {
        const int err = errno;
        close_fds();
        throw CommIOError(std::format("pipe2 failed: {}", std::strerror(err)));
    }

    if (!add_watch()) {
        const int err = errno;
        close_fds();
        throw CommIOError(std::format("Unable to watch {}: {}", directory_.string(), std::strerror(err)));
    }

    running_ = true;
    listener_ = std::thread(&InotifyFileWatcher::listen_thread, this);
}

void InotifyFileWatcher::unsubscribe() {
    if (!running_.exchange(false)) {
        close_fds();
        return;
    }

    // Wake poll() so the listener sees running_ == false
    const char byte = 'x';
    const ssize_t written = write(wake_pipe_[1], &byte, 1);
    (void)written; // a full pipe already wakes the listener

    if (listener_.joinable()) {
        listener_.join();
    }
    close_fds();
}

bool InotifyFileWatcher::add_watch() {
    watch_fd_ = inotify_add_watch(inotify_fd_, directory_.c_str(), kWatchMask);
    return watch_fd_ >= 0;
}

void InotifyFileWatcher::close_fds() {
    if (inotify_fd_ >= 0) {
        close(inotify_fd_);  // also drops the watch
        inotify_fd_ = -1;
    }
    watch_fd_ = -1;
    for (int& fd : wake_pipe_) {
        if (fd >= 0) {
            close(fd);
            fd = -1;
        }
    }
}

void InotifyFileWatcher::listen_thread() {
    // Buffer for a batch of events; names are at most NAME_MAX bytes
    alignas(inotify_event) char buffer[16 * 1024];

    auto dispatch = [this](const FileEvent event) {
        try {
            callback_(event);
        } catch (const std::exception& e) {
            spdlog::warn("File watch handler for {} failed: {}", file_name_, e.what());
        }
    };

    while (running_) {
        pollfd fds[2] = {
            {inotify_fd_, POLLIN, 0},
            {wake_pipe_[0], POLLIN, 0},
        };
        const int timeout = watch_fd_ < 0 ? kRearmIntervalMs : -1;
        const int n = poll(fds, 2, timeout);
        if (n < 0) {
            if (errno == EINTR) continue;
            spdlog::warn("poll on inotify descriptor failed: {}", std::strerror(errno));
            std::this_thread::sleep_for(std::chrono::milliseconds(kRearmIntervalMs));
            continue;
        }
        if (!running_ || (fds[1].revents & POLLIN)) {
            break;
        }

        if (watch_fd_ < 0) {
            std::error_code ec;
            fs::create_directories(directory_, ec);
            if (add_watch()) {
                spdlog::info("Re-armed watch on {}", directory_.string());
                dispatch(FileEvent::Rearmed);
            }
            continue;
        }

        if (!(fds[0].revents & POLLIN)) continue;

        bool created = false;
        bool modified = false;
        bool lost = false;

        for (;;) {
            const ssize_t len = read(inotify_fd_, buffer, sizeof(buffer));
            if (len <= 0) break;  // EAGAIN: batch drained

            for (ssize_t offset = 0; offset < len;) {
                const auto* ev = reinterpret_cast<const inotify_event*>(buffer + offset);
                offset += static_cast<ssize_t>(sizeof(inotify_event) + ev->len);

                if (ev->mask & IN_Q_OVERFLOW) {
                    // Events were dropped; treat as a write so the record is rescanned
                    modified = true;
                    continue;
                }
                if (ev->wd != watch_fd_) continue;

                if (ev->mask & (IN_DELETE_SELF | IN_MOVE_SELF | IN_IGNORED)) {
                    lost = true;
                    continue;
                }
                if (ev->len == 0 || file_name_ != ev->name) continue;

                if (ev->mask & (IN_CREATE | IN_MOVED_TO)) created = true;
                if (ev->mask & (IN_MODIFY | IN_CLOSE_WRITE)) modified = true;
            }
        }

        if (created) {
            dispatch(FileEvent::Created);
        } else if (modified) {
            dispatch(FileEvent::Modified);
        }

        if (lost) {
            spdlog::warn("Watch on {} lost, re-arming", directory_.string());
            if (watch_fd_ >= 0) {
                inotify_rm_watch(inotify_fd_, watch_fd_);
            }
            watch_fd_ = -1;

            std::error_code ec;
            fs::create_directories(directory_, ec);
            if (add_watch()) {
                dispatch(FileEvent::Rearmed);
            }
        }
    }
}

} // namespace kiosk
