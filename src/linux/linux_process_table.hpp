#pragma once

#include "../interfaces/i_process_table.hpp"
#include "../procfs_reader.hpp"

namespace kiosk {

class LinuxProcessTable : public IProcessTable {
public:
    LinuxProcessTable();
    explicit LinuxProcessTable(std::filesystem::path proc_root);
    ~LinuxProcessTable() override = default;

    std::optional<ProcessInfo> find_process(int pid) override;

private:
    ProcfsReader reader_;
};

} // namespace kiosk
