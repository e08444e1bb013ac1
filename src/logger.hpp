#pragma once

#include <filesystem>
#include <optional>
#include <string_view>

namespace kiosk {

enum class LogLevel {
    None,
    Error,
    Warn,
    Info,
    Debug,
    Trace,
};

// Case-insensitive level name (NONE, ERROR, WARN, INFO, DEBUG, TRACE).
// Throws UsageError for anything else.
[[nodiscard]] LogLevel parse_log_level(std::string_view name);

const char* to_string(LogLevel level);

// Install the process-wide "kiosk" logger: colored stderr, plus an appending
// file sink when log_file is set. Throws spdlog::spdlog_ex if the file cannot
// be opened.
void init_logging(LogLevel level, const std::optional<std::filesystem::path>& log_file = std::nullopt);

} // namespace kiosk
