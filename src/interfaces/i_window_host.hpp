#pragma once

#include "../viewmodels/window_view_model.hpp"
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace kiosk {

struct WindowConfig {
    std::string url;
    int width = 1024;
    int height = 768;
    bool always_on_top = false;
    bool maximize = false;
    bool minimize = false;
    std::optional<std::filesystem::path> icon;
    WindowViewModel view;

    static WindowConfig from_options(const LaunchOptions& options, std::string url) {
        WindowConfig config;
        config.url = std::move(url);
        config.width = options.width;
        config.height = options.height;
        config.always_on_top = options.always_on_top;
        config.maximize = options.maximize;
        config.minimize = options.minimize;
        config.icon = options.icon;
        config.view = WindowViewModel::from_options(options);
        return config;
    }
};

// The single top-level window of a kiosk launch
class IWindowHost {
public:
    virtual ~IWindowHost() = default;

    // Throws std::runtime_error if the window cannot be created
    virtual void create_window(const WindowConfig& config) = 0;

    // Event loop; returns once the window has closed
    virtual void run() = 0;

    // Thread-safe
    virtual void request_focus() = 0;
    virtual void request_close() = 0;

    // Invoked on the run() thread once the event loop has ended,
    // before the window is destroyed. Owners stop calling request_* here.
    virtual void set_on_closed(std::function<void()> callback) = 0;
};

} // namespace kiosk
