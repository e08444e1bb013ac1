#include "stub_providers.hpp"

namespace kiosk {

std::optional<ProcessInfo> StubProcessTable::find_process(int /*pid*/) {
    return std::nullopt;
}

} // namespace kiosk
