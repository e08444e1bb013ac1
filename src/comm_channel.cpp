#include "comm_channel.hpp"
#include "errors.hpp"
#include "work_directory.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <spdlog/spdlog.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace kiosk {

namespace {

// A drain unlinking the record between our open() and flock() makes us retry
constexpr int kMaxSendAttempts = 8;

class ScopedFd {
public:
    explicit ScopedFd(int fd) : fd_(fd) {}
    ~ScopedFd() {
        if (fd_ >= 0) close(fd_);
    }

    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;

    [[nodiscard]] int get() const { return fd_; }
    [[nodiscard]] bool valid() const { return fd_ >= 0; }

private:
    int fd_;
};

bool write_all(const int fd, std::string_view data) {
    while (!data.empty()) {
        const ssize_t n = write(fd, data.data(), data.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data.remove_prefix(static_cast<size_t>(n));
    }
    return true;
}

bool read_all(const int fd, std::string& out) {
    char buf[4096];
    for (;;) {
        const ssize_t n = read(fd, buf, sizeof(buf));
        if (n == 0) return true;
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        out.append(buf, static_cast<size_t>(n));
    }
}

int lock_exclusive(const int fd) {
    int rc;
    do {
        rc = flock(fd, LOCK_EX);
    } while (rc != 0 && errno == EINTR);
    return rc;
}

} // namespace

CommChannel::CommChannel(fs::path comms_dir, WatcherFactory make_watcher)
    : comms_dir_(std::move(comms_dir))
    , make_watcher_(std::move(make_watcher)) {
}

CommChannel::~CommChannel() {
    std::vector<std::string> ids;
    {
        std::lock_guard lock(watches_mutex_);
        for (const auto& [id, watcher] : watches_) {
            ids.push_back(id);
        }
    }
    for (const auto& id : ids) {
        stop(id);
    }
}

fs::path CommChannel::record_path(const std::string& id) const {
    return comms_dir_ / id;
}

void CommChannel::ensure_comms_dir() const {
    try {
        force_create_directory(comms_dir_);
    } catch (const fs::filesystem_error& e) {
        throw CommIOError(std::format("Unable to create comm directory {}: {}", comms_dir_.string(), e.code().message()));
    }
}

std::vector<std::string> CommChannel::split_commands(std::string_view body) {
    std::vector<std::string> commands;
    while (!body.empty()) {
        const size_t eol = body.find('\n');
        std::string_view line = body.substr(0, eol);
        body.remove_prefix(eol == std::string_view::npos ? body.size() : eol + 1);

        const size_t first = line.find_first_not_of(" \t\r");
        if (first == std::string_view::npos) continue;
        const size_t last = line.find_last_not_of(" \t\r");
        commands.emplace_back(line.substr(first, last - first + 1));
    }
    return commands;
}

void CommChannel::send(const std::string& id, const std::string_view command) const {
    ensure_comms_dir();

    const fs::path path = record_path(id);
    std::string line(command);
    line.push_back('\n');

    for (int attempt = 0; attempt < kMaxSendAttempts; ++attempt) {
        const ScopedFd fd(open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644));
        if (!fd.valid()) {
            throw CommIOError(std::format("Unable to open comm record {}: {}", path.string(), std::strerror(errno)));
        }
        if (lock_exclusive(fd.get()) != 0) {
            throw CommIOError(std::format("Unable to lock comm record {}: {}", path.string(), std::strerror(errno)));
        }

        struct stat st {};
        if (fstat(fd.get(), &st) != 0) {
            throw CommIOError(std::format("Unable to stat comm record {}: {}", path.string(), std::strerror(errno)));
        }
        if (st.st_nlink == 0) {
            // Drained and unlinked while we waited for the lock
            continue;
        }

        if (!write_all(fd.get(), line)) {
            throw CommIOError(std::format("Unable to write comm record {}: {}", path.string(), std::strerror(errno)));
        }
        spdlog::debug("Sent '{}' to {}", command, path.string());
        return;
    }
    throw CommIOError(std::format("Unable to write comm record {}: record kept disappearing", path.string()));
}

std::vector<std::string> CommChannel::read_and_remove(const std::string& id) const {
    const fs::path path = record_path(id);

    const ScopedFd fd(open(path.c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd.valid()) {
        if (errno == ENOENT) return {};
        throw CommIOError(std::format("Unable to open comm record {}: {}", path.string(), std::strerror(errno)));
    }

    struct stat st {};
    if (fstat(fd.get(), &st) == 0 && !S_ISREG(st.st_mode)) {
        // Not a record; clear it so senders can create one
        std::error_code ec;
        fs::remove_all(path, ec);
        return {};
    }
    if (lock_exclusive(fd.get()) != 0) {
        throw CommIOError(std::format("Unable to lock comm record {}: {}", path.string(), std::strerror(errno)));
    }

    std::string body;
    if (!read_all(fd.get(), body)) {
        throw CommIOError(std::format("Unable to read comm record {}: {}", path.string(), std::strerror(errno)));
    }

    // Unlink while still holding the lock
    if (unlink(path.c_str()) != 0 && errno != ENOENT) {
        throw CommIOError(std::format("Unable to remove comm record {}: {}", path.string(), std::strerror(errno)));
    }
    return split_commands(body);
}

std::vector<std::string> CommChannel::drain(const std::string& id) {
    std::lock_guard lock(drain_mutex_);
    return read_and_remove(id);
}

void CommChannel::drain_and_dispatch(const std::string& id, const CommandHandler& on_command) {
    std::lock_guard lock(drain_mutex_);

    std::vector<std::string> commands;
    try {
        commands = read_and_remove(id);
    } catch (const CommIOError& e) {
        spdlog::warn("{}", e.what());
        return;
    }

    for (const auto& command : commands) {
        spdlog::debug("Dispatching comm command '{}'", command);
        try {
            on_command(command);
        } catch (const std::exception& e) {
            spdlog::warn("Handler for command '{}' failed: {}", command, e.what());
        }
    }
}

void CommChannel::watch(const std::string& id, CommandHandler on_command) {
    {
        std::lock_guard lock(watches_mutex_);
        if (watches_.contains(id)) {
            throw CommIOError(std::format("Already watching comm record {}", id));
        }
    }

    ensure_comms_dir();

    auto watcher = make_watcher_();
    watcher->subscribe(record_path(id), [this, id, on_command](const FileEvent event) {
        spdlog::trace("Comm record {} event {}", id, static_cast<int>(event));
        drain_and_dispatch(id, on_command);
    });

    {
        std::lock_guard lock(watches_mutex_);
        watches_.emplace(id, std::move(watcher));
    }

    // Commands sent before the watch existed
    drain_and_dispatch(id, on_command);
}

void CommChannel::stop(const std::string& id) {
    std::unique_ptr<IFileWatcher> watcher;
    {
        std::lock_guard lock(watches_mutex_);
        if (const auto it = watches_.find(id); it != watches_.end()) {
            watcher = std::move(it->second);
            watches_.erase(it);
        }
    }
    if (watcher) {
        watcher->unsubscribe();
    }

    std::error_code ec;
    fs::remove_all(record_path(id), ec);
    if (ec) {
        spdlog::warn("Unable to remove comm record {}: {}", record_path(id).string(), ec.message());
    }
}

bool CommChannel::is_watching(const std::string& id) const {
    std::lock_guard lock(watches_mutex_);
    return watches_.contains(id);
}

} // namespace kiosk
