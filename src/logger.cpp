#include "logger.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <memory>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace kiosk {

namespace {

constexpr const char* kLogPattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%P] %v";

spdlog::level::level_enum to_spdlog(const LogLevel level) {
    switch (level) {
        case LogLevel::None: return spdlog::level::off;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Warn: return spdlog::level::warn;
        case LogLevel::Info: return spdlog::level::info;
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Trace: return spdlog::level::trace;
    }
    return spdlog::level::warn;
}

} // namespace

LogLevel parse_log_level(const std::string_view name) {
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](const unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "NONE") return LogLevel::None;
    if (upper == "ERROR") return LogLevel::Error;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::Warn;
    if (upper == "INFO") return LogLevel::Info;
    if (upper == "DEBUG") return LogLevel::Debug;
    if (upper == "TRACE") return LogLevel::Trace;
    throw UsageError(std::format("Invalid log level: {}", name));
}

const char* to_string(const LogLevel level) {
    switch (level) {
        case LogLevel::None: return "NONE";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Info: return "INFO";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Trace: return "TRACE";
    }
    return "?";
}

void init_logging(const LogLevel level, const std::optional<std::filesystem::path>& log_file) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (log_file) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file->string(), false));
    }

    auto logger = std::make_shared<spdlog::logger>("kiosk", sinks.begin(), sinks.end());
    logger->set_pattern(kLogPattern);
    logger->set_level(to_spdlog(level));
    logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(std::move(logger));
}

} // namespace kiosk
