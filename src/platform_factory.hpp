#pragma once

#include "interfaces/i_file_watcher.hpp"
#include "interfaces/i_process_table.hpp"
#include <memory>

namespace kiosk {

// Factory functions to create platform-specific providers.
// Implemented per-platform; the build picks one platform_factory_*.cpp.
std::unique_ptr<IProcessTable> make_process_table();
std::unique_ptr<IFileWatcher> make_file_watcher();

} // namespace kiosk
