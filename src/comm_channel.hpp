#pragma once

#include "interfaces/i_file_watcher.hpp"
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace kiosk {

// Command asking the owning instance to bring its window to the foreground
constexpr std::string_view kFocusCommand = "focus";

// One-way mailbox per instance id: a file of newline-separated command
// tokens under the comms directory. Losing launches append; the owner
// watches the file and drains it (read, then delete) on every event.
//
// Appends and drains both hold an exclusive flock() on the record. A sender
// that locked a record which was drained and unlinked in the meantime
// reopens the path, so no command is lost to a concurrent drain.
class CommChannel {
public:
    using CommandHandler = std::function<void(const std::string& command)>;
    using WatcherFactory = std::function<std::unique_ptr<IFileWatcher>()>;

    CommChannel(std::filesystem::path comms_dir, WatcherFactory make_watcher);
    ~CommChannel();

    CommChannel(const CommChannel&) = delete;
    CommChannel& operator=(const CommChannel&) = delete;

    // Append command + "\n", creating the record if absent. Throws CommIOError.
    void send(const std::string& id, std::string_view command) const;

    // Dispatch every command written to the record, in file order, until
    // stop(). A record already pending is drained before watch() returns.
    // The handler runs on the watcher thread and must not call stop().
    // Throws CommIOError if the watch cannot be established.
    void watch(const std::string& id, CommandHandler on_command);

    // Read and delete the record; returns its non-empty tokens in order.
    // Throws CommIOError.
    std::vector<std::string> drain(const std::string& id);

    // End the watch and remove the record. Idempotent, never throws.
    void stop(const std::string& id);

    [[nodiscard]] bool is_watching(const std::string& id) const;
    [[nodiscard]] std::filesystem::path record_path(const std::string& id) const;

    static std::vector<std::string> split_commands(std::string_view body);

private:
    std::vector<std::string> read_and_remove(const std::string& id) const;
    void drain_and_dispatch(const std::string& id, const CommandHandler& on_command);
    void ensure_comms_dir() const;

    std::filesystem::path comms_dir_;
    WatcherFactory make_watcher_;

    mutable std::mutex watches_mutex_;
    std::map<std::string, std::unique_ptr<IFileWatcher>> watches_;

    // Serializes drains: one record is fully read and deleted before the
    // next event is handled
    std::mutex drain_mutex_;
};

} // namespace kiosk
