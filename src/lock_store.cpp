#include "lock_store.hpp"
#include "errors.hpp"
#include "work_directory.hpp"

#include <charconv>
#include <format>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace kiosk {

LockStore::LockStore(fs::path locks_dir)
    : locks_dir_(std::move(locks_dir)) {
}

fs::path LockStore::record_path(const std::string& id) const {
    return locks_dir_ / id;
}

int LockStore::parse_pid(const std::string& body) {
    const auto first = body.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return 0;
    const auto last = body.find_last_not_of(" \t\r\n");

    int pid = 0;
    const char* begin = body.data() + first;
    const char* end = body.data() + last + 1;
    if (auto [ptr, ec] = std::from_chars(begin, end, pid); ec != std::errc{} || ptr != end) {
        return 0;
    }
    return pid > 0 ? pid : 0;
}

LockProbe LockStore::probe(const std::string& id) const {
    const fs::path path = record_path(id);

    std::error_code ec;
    const auto link_status = fs::symlink_status(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        throw LockIOError(std::format("Unable to read lock: {} ({})", path.string(), ec.message()));
    }
    if (!fs::exists(link_status)) {
        return {LockState::Absent, 0};
    }
    if (!fs::is_regular_file(fs::status(path, ec))) {
        return {LockState::Malformed, 0};
    }

    std::ifstream file(path);
    if (!file) {
        throw LockIOError(std::format("Unable to read lock: {}", path.string()));
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        throw LockIOError(std::format("Unable to read lock: {}", path.string()));
    }
    return {LockState::Held, parse_pid(ss.str())};
}

void LockStore::reclaim(const std::string& id) const {
    std::error_code ec;
    fs::remove_all(record_path(id), ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        throw LockIOError(std::format("Unable to remove lock: {} ({})", record_path(id).string(), ec.message()));
    }
}

void LockStore::acquire(const std::string& id, const int pid) const {
    try {
        force_create_directory(locks_dir_);
    } catch (const fs::filesystem_error& e) {
        throw LockIOError(std::format("Unable to create lock directory {}: {}", locks_dir_.string(), e.code().message()));
    }

    // Write aside and rename so readers never see a partial PID
    const fs::path path = record_path(id);
    const fs::path tmp = locks_dir_ / std::format(".{}.{}.tmp", id, pid);
    {
        std::ofstream file(tmp, std::ios::out | std::ios::trunc);
        if (!file) {
            throw LockIOError(std::format("Unable to write lock: {}", path.string()));
        }
        file << pid;
        file.flush();
        if (!file) {
            std::error_code ignored;
            fs::remove(tmp, ignored);
            throw LockIOError(std::format("Unable to write lock: {}", path.string()));
        }
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw LockIOError(std::format("Unable to write lock: {} ({})", path.string(), ec.message()));
    }
}

} // namespace kiosk
