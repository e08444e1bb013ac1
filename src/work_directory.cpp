#include "work_directory.hpp"
#include "errors.hpp"

#include <format>
#include <spdlog/spdlog.h>
#include <system_error>

namespace fs = std::filesystem;

namespace kiosk {

WorkDirectory::WorkDirectory()
    : root_(default_root()) {
}

WorkDirectory::WorkDirectory(fs::path root)
    : root_(std::move(root)) {
}

fs::path WorkDirectory::default_root() {
    std::error_code ec;
    fs::path tmp = fs::temp_directory_path(ec);
    if (ec || tmp.empty()) {
        tmp = "/tmp";
    }
    return tmp / "kiosk";
}

void WorkDirectory::ensure_created() const {
    for (const auto& dir : {root_, locks_dir(), comms_dir()}) {
        try {
            force_create_directory(dir);
        } catch (const fs::filesystem_error& e) {
            throw LockIOError(std::format("Unable to create directory {}: {}", dir.string(), e.code().message()));
        }
    }
}

void force_create_directory(const fs::path& dir) {
    const auto status = fs::symlink_status(dir);
    if (!fs::exists(status)) {
        fs::create_directories(dir);
        return;
    }
    if (fs::is_directory(fs::status(dir))) {
        return;
    }

    spdlog::debug("Replacing non-directory at {}", dir.string());
    fs::remove_all(dir);
    fs::create_directories(dir);
}

} // namespace kiosk
