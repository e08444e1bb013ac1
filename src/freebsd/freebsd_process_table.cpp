#include "freebsd_process_table.hpp"

#include <sys/types.h>
#include <sys/sysctl.h>
#include <sys/user.h>
#include <sys/param.h>
#include <unistd.h>

#include <cstring>
#include <spdlog/spdlog.h>

namespace kiosk {

char FreeBSDProcessTable::map_state(const int state) {
    switch (state) {
        case SRUN: return 'R';
        case SSLEEP: return 'S';
        case SSTOP: return 'T';
        case SZOMB: return 'Z';
        case SWAIT: return 'D';
        case SLOCK: return 'D';
        case SIDL: return 'I';
        default: return '?';
    }
}

std::string FreeBSDProcessTable::get_executable_path(const int pid) {
    int mib[4] = { CTL_KERN, KERN_PROC, KERN_PROC_PATHNAME, pid };
    char path[PATH_MAX];
    size_t len = sizeof(path);
    if (sysctl(mib, 4, path, &len, nullptr, 0) < 0 || len == 0) {
        return {};
    }
    return std::string(path, strnlen(path, len));
}

std::optional<ProcessInfo> FreeBSDProcessTable::find_process(const int pid) {
    if (pid <= 0) return std::nullopt;

    int mib[4] = { CTL_KERN, KERN_PROC, KERN_PROC_PID, pid };
    struct kinfo_proc kp;
    size_t len = sizeof(kp);

    if (sysctl(mib, 4, &kp, &len, nullptr, 0) < 0 || len == 0) {
        spdlog::debug("sysctl KERN_PROC_PID {} found no process", pid);
        return std::nullopt;
    }

    ProcessInfo info;
    info.pid = kp.ki_pid;
    info.name = kp.ki_comm;
    info.state_char = map_state(kp.ki_stat);
    info.executable_path = get_executable_path(pid);
    return info;
}

} // namespace kiosk
