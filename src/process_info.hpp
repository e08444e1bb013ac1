#pragma once

#include <string>

namespace kiosk {

// Process state characters (platform-neutral meanings):
// 'R' = Running/Runnable
// 'S' = Sleeping (interruptible)
// 'D' = Disk sleep (uninterruptible)
// 'Z' = Zombie
// 'T' = Stopped (signal or debugger)
// 'I' = Idle
// '?' = Unknown

struct ProcessInfo {
    int pid = 0;
    std::string name;              // Kernel command name (may be truncated)
    std::string executable_path;   // Empty when not readable (other users, kernel threads)
    char state_char = '?';

    [[nodiscard]] bool is_zombie() const { return state_char == 'Z'; }
};

} // namespace kiosk
