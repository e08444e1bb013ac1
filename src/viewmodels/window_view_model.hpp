#pragma once

#include "../launch_options.hpp"
#include <cmath>

namespace kiosk {

// Zoom steps follow browser zoom levels: each step scales by 1.2
constexpr float kZoomStepFactor = 1.2f;

// UI state of the kiosk window (single source of truth for the view)
struct WindowViewModel {
    float zoom = 1.0f;
    float initial_zoom = 1.0f;
    bool fullscreen = false;
    bool show_menu = false;
    bool developer = false;
    bool dev_tools_open = false;

    static WindowViewModel from_options(const LaunchOptions& options) {
        WindowViewModel vm;
        vm.initial_zoom = clamp_zoom(options.zoom);
        vm.zoom = vm.initial_zoom;
        vm.fullscreen = options.fullscreen;
        vm.show_menu = options.show_menu;
        vm.developer = options.developer;
        return vm;
    }

    void reset_zoom() { zoom = initial_zoom; }
    void zoom_in() { zoom = clamp_zoom(zoom * kZoomStepFactor); }
    void zoom_out() { zoom = clamp_zoom(zoom / kZoomStepFactor); }

    void toggle_fullscreen() { fullscreen = !fullscreen; }

    // Dev tools exist only in developer mode
    void toggle_dev_tools() {
        if (developer) {
            dev_tools_open = !dev_tools_open;
        }
    }

    [[nodiscard]] bool zoom_changed_from(const float previous) const {
        return std::fabs(zoom - previous) > 1e-4f;
    }
};

} // namespace kiosk
