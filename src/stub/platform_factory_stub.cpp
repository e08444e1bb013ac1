#include "../platform_factory.hpp"
#include "polling_file_watcher.hpp"
#include "stub_providers.hpp"

namespace kiosk {

std::unique_ptr<IProcessTable> make_process_table() {
    return std::make_unique<StubProcessTable>();
}

std::unique_ptr<IFileWatcher> make_file_watcher() {
    return std::make_unique<PollingFileWatcher>();
}

} // namespace kiosk
