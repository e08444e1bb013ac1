#include "procfs_reader.hpp"
#include <fstream>
#include <spdlog/spdlog.h>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace kiosk {

ProcfsReader::ProcfsReader(fs::path proc_root)
    : proc_root_(std::move(proc_root)) {
}

std::string ProcfsReader::read_file(const fs::path& path) {
    std::ifstream file(path);
    if (!file) return {};
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

std::string ProcfsReader::read_symlink(const fs::path& path) {
    char buf[4096];
    const ssize_t len = readlink(path.c_str(), buf, sizeof(buf) - 1);
    if (len == -1) return {};
    buf[len] = '\0';
    return buf;
}

std::optional<ProcessInfo> ProcfsReader::get_process_info(const int pid) {
    if (pid <= 0) return std::nullopt;

    const fs::path proc_path = proc_root_ / std::to_string(pid);

    // Read stat file
    const std::string stat_content = read_file(proc_path / "stat");
    if (stat_content.empty()) return std::nullopt;

    ProcessInfo info;
    info.pid = pid;

    // Parse stat - format: pid (comm) state ...
    // comm can contain spaces and parentheses, so find the last ')'
    const size_t comm_start = stat_content.find('(');
    const size_t comm_end = stat_content.rfind(')');
    if (comm_start == std::string::npos || comm_end == std::string::npos || comm_end <= comm_start) {
        spdlog::debug("PID {}: malformed stat (missing comm)", pid);
        return std::nullopt;
    }

    info.name = stat_content.substr(comm_start + 1, comm_end - comm_start - 1);

    if (comm_end + 2 >= stat_content.size()) {
        spdlog::debug("PID {}: truncated stat (no fields after comm)", pid);
        return std::nullopt;
    }

    std::istringstream iss(stat_content.substr(comm_end + 2));
    std::string state;
    iss >> state;
    if (state.empty()) {
        spdlog::debug("PID {}: failed to parse stat fields", pid);
        return std::nullopt;
    }
    info.state_char = state[0];

    // Read exe symlink (fails for other users' processes unless privileged)
    info.executable_path = read_symlink(proc_path / "exe");

    return info;
}

} // namespace kiosk
