#pragma once

#include "../interfaces/i_process_table.hpp"

namespace kiosk {

class SolarisProcessTable : public IProcessTable {
public:
    SolarisProcessTable() = default;
    ~SolarisProcessTable() override = default;

    std::optional<ProcessInfo> find_process(int pid) override;

private:
    static char map_state(char sname);
};

} // namespace kiosk
