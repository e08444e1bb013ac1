#pragma once

#include "../interfaces/i_process_table.hpp"

namespace kiosk {

// Stub implementation for platforms without native support.
// No process can be looked up, so every recorded lock owner is treated as
// gone and a contested lock is always reclaimed.
class StubProcessTable : public IProcessTable {
public:
    std::optional<ProcessInfo> find_process(int pid) override;
};

} // namespace kiosk
