#pragma once

#include "../interfaces/i_file_watcher.hpp"
#include <atomic>
#include <string>
#include <thread>

namespace kiosk {

// inotify watch on the file's parent directory, so creation of a file that
// does not exist yet is observed as well as writes to it.
class InotifyFileWatcher : public IFileWatcher {
public:
    InotifyFileWatcher() = default;
    ~InotifyFileWatcher() override;

    InotifyFileWatcher(const InotifyFileWatcher&) = delete;
    InotifyFileWatcher& operator=(const InotifyFileWatcher&) = delete;

    void subscribe(const std::filesystem::path& file, EventCallback callback) override;
    void unsubscribe() override;

private:
    void listen_thread();
    bool add_watch();
    void close_fds();

    std::filesystem::path directory_;
    std::string file_name_;
    EventCallback callback_;

    int inotify_fd_ = -1;
    int watch_fd_ = -1;
    int wake_pipe_[2] = {-1, -1};

    std::thread listener_;
    std::atomic<bool> running_{false};
};

} // namespace kiosk
