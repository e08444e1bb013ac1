#pragma once

#include "../interfaces/i_process_table.hpp"

namespace kiosk {

class FreeBSDProcessTable : public IProcessTable {
public:
    FreeBSDProcessTable() = default;
    ~FreeBSDProcessTable() override = default;

    std::optional<ProcessInfo> find_process(int pid) override;

private:
    static char map_state(int state);
    static std::string get_executable_path(int pid);
};

} // namespace kiosk
