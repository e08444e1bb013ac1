#pragma once

#include <filesystem>

namespace kiosk {

// Process-wide coordination directory:
//   <root>/locks/<instance id>   owner PID
//   <root>/comms/<instance id>   pending commands
// The directories are created on demand and never torn down; only the
// records inside them are cleaned up per instance.
class WorkDirectory {
public:
    // <os temp dir>/kiosk
    WorkDirectory();
    explicit WorkDirectory(std::filesystem::path root);

    [[nodiscard]] const std::filesystem::path& root() const { return root_; }
    [[nodiscard]] std::filesystem::path locks_dir() const { return root_ / "locks"; }
    [[nodiscard]] std::filesystem::path comms_dir() const { return root_ / "comms"; }

    // Force-create root, locks/ and comms/. Throws LockIOError.
    void ensure_created() const;

    static std::filesystem::path default_root();

private:
    std::filesystem::path root_;
};

// Create dir (and missing parents). If a non-directory occupies dir it is
// removed and replaced by a directory. Throws std::filesystem::filesystem_error.
void force_create_directory(const std::filesystem::path& dir);

} // namespace kiosk
