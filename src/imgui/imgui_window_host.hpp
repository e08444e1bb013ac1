#pragma once

#include "../interfaces/i_window_host.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>

struct GLFWwindow;

namespace kiosk {

class ImGuiWindowHost : public IWindowHost {
public:
    ImGuiWindowHost() = default;
    ~ImGuiWindowHost() override;

    ImGuiWindowHost(const ImGuiWindowHost&) = delete;
    ImGuiWindowHost& operator=(const ImGuiWindowHost&) = delete;

    void create_window(const WindowConfig& config) override;
    void run() override;
    void request_focus() override;
    void request_close() override;
    void set_on_closed(std::function<void()> callback) override;

private:
    void render();
    void render_menu_bar();
    void render_content();
    void handle_accelerators();

    void apply_zoom();
    void apply_fullscreen();
    void raise_window();
    void close_window();
    void destroy_window();

    void load_content();
    void set_window_icon();

    WindowConfig config_;

    // UI state (zoom, full screen, menu, dev tools)
    WindowViewModel view_model_;
    float applied_zoom_ = 0.0f;

    // Document text shown for file:// URLs
    std::string content_;
    std::string content_error_;

    // Window pointer for focus handling
    GLFWwindow* window_ = nullptr;
    std::atomic<bool> window_ready_{false};
    std::atomic<bool> focus_requested_{false};
    std::atomic<bool> close_requested_{false};

    // Windowed geometry restored when leaving full screen
    int windowed_x_ = 0;
    int windowed_y_ = 0;
    int windowed_width_ = 0;
    int windowed_height_ = 0;

    std::function<void()> on_closed_;

    // Event debouncing
    void post_empty_event_debounced();
    std::mutex event_debounce_mutex_;
    std::chrono::steady_clock::time_point last_event_post_time_;
    static constexpr auto kEventDebounceInterval = std::chrono::milliseconds(16);

    static constexpr float kBaseFontScale = 1.5f;
};

} // namespace kiosk
