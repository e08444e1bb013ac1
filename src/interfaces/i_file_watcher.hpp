#pragma once

#include <filesystem>
#include <functional>

namespace kiosk {

enum class FileEvent {
    Created,   // file appeared (created or moved into place)
    Modified,  // file content written
    Rearmed,   // watch was lost and re-established; state may have changed meanwhile
};

// Event subscription on a single file path. Events are delivered on a
// background thread owned by the watcher, one callback at a time.
class IFileWatcher {
public:
    using EventCallback = std::function<void(FileEvent)>;

    virtual ~IFileWatcher() = default;

    // Start delivering events for `file`. The file need not exist yet; its
    // parent directory must. Throws CommIOError if the watch cannot be set up.
    virtual void subscribe(const std::filesystem::path& file, EventCallback callback) = 0;

    // Stop delivering events and wait for an in-flight callback to return.
    // Idempotent. Must not be called from inside the callback.
    virtual void unsubscribe() = 0;
};

} // namespace kiosk
