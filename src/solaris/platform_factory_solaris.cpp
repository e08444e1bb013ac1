#include "../platform_factory.hpp"

#include "solaris_process_table.hpp"
#include "../stub/polling_file_watcher.hpp"

namespace kiosk {

std::unique_ptr<IProcessTable> make_process_table() {
    return std::make_unique<SolarisProcessTable>();
}

std::unique_ptr<IFileWatcher> make_file_watcher() {
    return std::make_unique<PollingFileWatcher>();
}

} // namespace kiosk
