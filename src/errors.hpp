#pragma once

#include <stdexcept>
#include <string>

namespace kiosk {

// Work/lock directory or lock record could not be created, read or written.
// Fatal for a launch: exclusivity cannot be decided without the lock record.
class LockIOError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Comm record could not be written, read or watched.
// Only degrades the "bring to foreground" feature.
class CommIOError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Bad command line
class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace kiosk
