#pragma once

#include "process_info.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace kiosk {

class ProcfsReader {
public:
    explicit ProcfsReader(std::filesystem::path proc_root = "/proc");

    // Parses <root>/<pid>/stat and reads the exe link.
    // std::nullopt if the process does not exist or its stat is unusable.
    std::optional<ProcessInfo> get_process_info(int pid);

private:
    static std::string read_file(const std::filesystem::path& path);
    static std::string read_symlink(const std::filesystem::path& path);

    std::filesystem::path proc_root_;
};

} // namespace kiosk
