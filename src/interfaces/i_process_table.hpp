#pragma once

#include "../process_info.hpp"
#include <optional>

namespace kiosk {

// Read-only view of the OS process table
class IProcessTable {
public:
    virtual ~IProcessTable() = default;

    // std::nullopt if no process with this pid exists or it cannot be queried
    virtual std::optional<ProcessInfo> find_process(int pid) = 0;
};

} // namespace kiosk
