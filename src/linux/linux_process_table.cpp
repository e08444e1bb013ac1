#include "linux_process_table.hpp"

namespace kiosk {

LinuxProcessTable::LinuxProcessTable() = default;

LinuxProcessTable::LinuxProcessTable(std::filesystem::path proc_root)
    : reader_(std::move(proc_root)) {
}

std::optional<ProcessInfo> LinuxProcessTable::find_process(const int pid) {
    return reader_.get_process_info(pid);
}

} // namespace kiosk
