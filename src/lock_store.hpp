#pragma once

#include <filesystem>
#include <string>

namespace kiosk {

enum class LockState {
    Absent,
    Held,       // regular file; pid holds the recorded owner (0 if unparsable)
    Malformed,  // path occupied by something that is not a regular file
};

struct LockProbe {
    LockState state = LockState::Absent;
    int pid = 0;
};

// Directory-backed lock records, one file per instance id whose body is the
// decimal PID of the owner. acquire() is last-writer-wins: callers decide
// ownership through probe() first.
class LockStore {
public:
    explicit LockStore(std::filesystem::path locks_dir);

    // Throws LockIOError if the record exists but cannot be read.
    [[nodiscard]] LockProbe probe(const std::string& id) const;

    // Delete the record (file or directory). Absent is not an error.
    // Throws LockIOError if the record cannot be removed.
    void reclaim(const std::string& id) const;

    // Write pid as the record body, creating the locks directory if needed.
    // Throws LockIOError.
    void acquire(const std::string& id, int pid) const;

    // Shutdown alias for reclaim()
    void release(const std::string& id) const { reclaim(id); }

    [[nodiscard]] std::filesystem::path record_path(const std::string& id) const;
    [[nodiscard]] const std::filesystem::path& locks_dir() const { return locks_dir_; }

    // Parse a record body into a PID; 0 if it is not a positive decimal number.
    static int parse_pid(const std::string& body);

private:
    std::filesystem::path locks_dir_;
};

} // namespace kiosk
