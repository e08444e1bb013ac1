#pragma once

#include "logger.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace kiosk {

constexpr const char* kKioskVersion = "1.2.0";

constexpr float kMinZoom = 0.25f;
constexpr float kMaxZoom = 5.0f;

// Parsed command line of the kiosk executable.
// Both "--opt value" and "--opt=value" forms are accepted; boolean flags
// take an optional "=true" / "=false".
struct LaunchOptions {
    bool show_help = false;      // --help / -h
    bool show_version = false;   // --version / -v

    std::string path;            // --path / -p (required)
    int width = 1024;            // --width / -x
    int height = 768;            // --height / -y

    std::optional<std::string> singleton;  // --singleton / -s, --singleton-id / -i

    bool fullscreen = false;     // --fullscreen / -f
    bool always_on_top = false;  // --always-on-top / -t
    bool show_menu = false;      // --show-menu / -m
    bool developer = false;      // --developer / -d
    bool maximize = false;       // --maximize
    bool minimize = false;       // --minimize
    float zoom = 1.0f;           // --zoom / -z, clamped to [kMinZoom, kMaxZoom]

    std::optional<std::filesystem::path> icon;      // --icon
    std::optional<std::filesystem::path> work_dir;  // --work-dir

    LogLevel log_level = LogLevel::Warn;            // --log-level / -l
    std::optional<std::filesystem::path> log_file;  // --log-file
};

// Throws UsageError on unknown options, missing values and bad numbers.
// A missing --path is only an error when neither help nor version was asked for.
[[nodiscard]] LaunchOptions parse_launch_options(const std::vector<std::string>& args);
[[nodiscard]] LaunchOptions parse_launch_options(int argc, char* argv[]);

// http://, https:// and file:// pass through; an existing regular file
// becomes a file:// URL of its absolute path. Anything else: nullopt.
[[nodiscard]] std::optional<std::string> resolve_url(const std::string& path);

[[nodiscard]] float clamp_zoom(float zoom);

[[nodiscard]] std::string build_help_text(const std::string& program);

} // namespace kiosk
