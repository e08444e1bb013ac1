#include "launch_options.hpp"
#include "errors.hpp"
#include "work_directory.hpp"

#include <algorithm>
#include <charconv>
#include <format>

namespace fs = std::filesystem;

namespace kiosk {

namespace {

int parse_dimension(const std::string& option, const std::string& value) {
    int result = 0;
    const char* end = value.data() + value.size();
    const auto [ptr, ec] = std::from_chars(value.data(), end, result);
    if (ec != std::errc() || ptr != end || result <= 0) {
        throw UsageError(std::format("Invalid value for {}: '{}'", option, value));
    }
    return result;
}

float parse_zoom(const std::string& option, const std::string& value) {
    float result = 0.0f;
    const char* end = value.data() + value.size();
    const auto [ptr, ec] = std::from_chars(value.data(), end, result);
    if (ec != std::errc() || ptr != end || !(result > 0.0f)) {
        throw UsageError(std::format("Invalid value for {}: '{}'", option, value));
    }
    return clamp_zoom(result);
}

bool parse_flag(const std::string& option, const std::optional<std::string>& value) {
    if (!value) return true;
    if (*value == "true" || *value == "1") return true;
    if (*value == "false" || *value == "0") return false;
    throw UsageError(std::format("Invalid value for {}: '{}' (expected true or false)", option, *value));
}

} // namespace

float clamp_zoom(const float zoom) {
    return std::clamp(zoom, kMinZoom, kMaxZoom);
}

LaunchOptions parse_launch_options(const std::vector<std::string>& args) {
    LaunchOptions out;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& raw = args[i];
        if (raw.empty()) continue;
        if (raw[0] != '-' || raw == "-") {
            throw UsageError(std::format("Unexpected argument: '{}'", raw));
        }

        // Split "--opt=value"
        std::string name = raw;
        std::optional<std::string> inline_value;
        if (const size_t eq = raw.find('='); eq != std::string::npos) {
            name = raw.substr(0, eq);
            inline_value = raw.substr(eq + 1);
        }

        auto is = [&name](const char* long_name, const char* short_name = nullptr) {
            return name == long_name || (short_name && name == short_name);
        };

        auto take_value = [&]() -> std::string {
            if (inline_value) return *inline_value;
            if (i + 1 >= args.size()) {
                throw UsageError(std::format("Missing value for {}", name));
            }
            return args[++i];
        };

        if (is("--help", "-h")) { out.show_help = parse_flag(name, inline_value); continue; }
        if (is("--version", "-v")) { out.show_version = parse_flag(name, inline_value); continue; }

        // Boolean flags
        if (is("--fullscreen", "-f")) { out.fullscreen = parse_flag(name, inline_value); continue; }
        if (is("--always-on-top", "-t")) { out.always_on_top = parse_flag(name, inline_value); continue; }
        if (is("--show-menu", "-m")) { out.show_menu = parse_flag(name, inline_value); continue; }
        if (is("--developer", "-d")) { out.developer = parse_flag(name, inline_value); continue; }
        if (is("--maximize")) { out.maximize = parse_flag(name, inline_value); continue; }
        if (is("--minimize")) { out.minimize = parse_flag(name, inline_value); continue; }

        // Options with values
        if (is("--path", "-p")) {
            out.path = take_value();
            continue;
        }
        if (is("--width", "-x")) {
            out.width = parse_dimension(name, take_value());
            continue;
        }
        if (is("--height", "-y")) {
            out.height = parse_dimension(name, take_value());
            continue;
        }
        if (is("--singleton", "-s") || is("--singleton-id", "-i")) {
            std::string key = take_value();
            if (key.empty()) {
                throw UsageError(std::format("Empty singleton key for {}", name));
            }
            out.singleton = std::move(key);
            continue;
        }
        if (is("--zoom", "-z")) {
            out.zoom = parse_zoom(name, take_value());
            continue;
        }
        if (is("--icon")) {
            out.icon = fs::path(take_value());
            continue;
        }
        if (is("--work-dir")) {
            out.work_dir = fs::path(take_value());
            continue;
        }
        if (is("--log-level", "-l")) {
            out.log_level = parse_log_level(take_value());
            continue;
        }
        if (is("--log-file")) {
            out.log_file = fs::path(take_value());
            continue;
        }

        throw UsageError(std::format("Unknown option: {}", name));
    }

    if (out.path.empty() && !out.show_help && !out.show_version) {
        throw UsageError("Missing required option: --path");
    }
    return out;
}

LaunchOptions parse_launch_options(const int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse_launch_options(args);
}

std::optional<std::string> resolve_url(const std::string& path) {
    if (path.starts_with("http://") || path.starts_with("https://") || path.starts_with("file://")) {
        return path;
    }

    std::error_code ec;
    if (path.empty() || !fs::is_regular_file(path, ec)) {
        return std::nullopt;
    }
    const fs::path absolute = fs::absolute(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return "file://" + absolute.lexically_normal().string();
}

std::string build_help_text(const std::string& program) {
    return std::format(
        "Usage: {} --path <url|file> [options]\n"
        "\n"
        "Options:\n"
        "  -p, --path <url>           Path (URL) to launch (required)\n"
        "  -x, --width <px>           Width of the window (default 1024)\n"
        "  -y, --height <px>          Height of the window (default 768)\n"
        "  -s, --singleton <key>      Limit to a single instance per key and user\n"
        "  -i, --singleton-id <key>   Same as --singleton\n"
        "  -f, --fullscreen           Launch the window in full screen mode\n"
        "  -t, --always-on-top        Keep the window above other windows\n"
        "  -m, --show-menu            Show menu bar in the window\n"
        "  -d, --developer            Enable developer tools\n"
        "  -z, --zoom <factor>        Initial zoom ({} to {}, default 1.0)\n"
        "      --maximize             Start maximized\n"
        "      --minimize             Start minimized\n"
        "      --icon <png>           Window icon\n"
        "      --work-dir <dir>       Coordination directory (default {})\n"
        "  -l, --log-level <level>    NONE, ERROR, WARN, INFO, DEBUG or TRACE (default WARN)\n"
        "      --log-file <file>      Also append log lines to this file\n"
        "  -h, --help                 Show this help\n"
        "  -v, --version              Show version number\n",
        program, kMinZoom, kMaxZoom, WorkDirectory::default_root().string());
}

} // namespace kiosk
