#include "solaris_process_table.hpp"

#include <procfs.h>
#include <fcntl.h>
#include <unistd.h>

#include <filesystem>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace kiosk {

char SolarisProcessTable::map_state(const char sname) {
    switch (sname) {
        case 'O': return 'R';  // On processor
        case 'R': return 'R';
        case 'S': return 'S';
        case 'T': return 'T';
        case 'Z': return 'Z';
        case 'I': return 'I';
        case 'W': return 'D';  // Waiting for CPU cap
        default: return '?';
    }
}

std::optional<ProcessInfo> SolarisProcessTable::find_process(const int pid) {
    if (pid <= 0) return std::nullopt;

    const std::string proc_path = "/proc/" + std::to_string(pid);

    // Read psinfo
    const std::string psinfo_path = proc_path + "/psinfo";
    const int fd = open(psinfo_path.c_str(), O_RDONLY);
    if (fd < 0) {
        return std::nullopt;
    }

    psinfo_t psinfo;
    const ssize_t n = read(fd, &psinfo, sizeof(psinfo));
    close(fd);

    if (n != sizeof(psinfo)) {
        spdlog::debug("PID {}: short psinfo read", pid);
        return std::nullopt;
    }

    ProcessInfo info;
    info.pid = psinfo.pr_pid;
    info.name = psinfo.pr_fname;
    info.state_char = map_state(psinfo.pr_lwp.pr_sname);

    // Executable path - try to read from /proc/<pid>/path/a.out
    std::error_code ec;
    const fs::path exe = fs::read_symlink(proc_path + "/path/a.out", ec);
    if (!ec) {
        info.executable_path = exe.string();
    }

    return info;
}

} // namespace kiosk
