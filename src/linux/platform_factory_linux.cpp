#include "../platform_factory.hpp"

#include "inotify_file_watcher.hpp"
#include "linux_process_table.hpp"

namespace kiosk {

std::unique_ptr<IProcessTable> make_process_table() {
    return std::make_unique<LinuxProcessTable>();
}

std::unique_ptr<IFileWatcher> make_file_watcher() {
    return std::make_unique<InotifyFileWatcher>();
}

} // namespace kiosk
