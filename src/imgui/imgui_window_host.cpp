#include "imgui_window_host.hpp"
#include "imgui.h"
#include "imgui_impl_glfw.h"
#include "imgui_impl_opengl3.h"
#include <GLFW/glfw3.h>
#include <format>
#include <fstream>
#include <iterator>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace kiosk {

namespace {

// Largest document shown inline
constexpr std::streamsize kMaxContentBytes = 4 * 1024 * 1024;

} // namespace

ImGuiWindowHost::~ImGuiWindowHost() {
    destroy_window();
}

void ImGuiWindowHost::create_window(const WindowConfig& config) {
    if (window_) {
        throw std::runtime_error("Window already created");
    }
    config_ = config;
    view_model_ = config.view;

    // Initialize GLFW
    if (!glfwInit()) {
        throw std::runtime_error("Failed to initialize GLFW");
    }

    // GL 3.3 + GLSL 330
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);

    // Set Wayland app_id for desktop integration
    glfwWindowHintString(GLFW_WAYLAND_APP_ID, "kiosk");

    // Shown once fully set up
    glfwWindowHint(GLFW_VISIBLE, GLFW_FALSE);
    glfwWindowHint(GLFW_FLOATING, config.always_on_top ? GLFW_TRUE : GLFW_FALSE);
    glfwWindowHint(GLFW_MAXIMIZED, config.maximize ? GLFW_TRUE : GLFW_FALSE);

    window_ = glfwCreateWindow(config.width, config.height, config.url.c_str(), nullptr, nullptr);
    if (!window_) {
        glfwTerminate();
        throw std::runtime_error("Failed to create GLFW window");
    }

    glfwMakeContextCurrent(window_);
    glfwSwapInterval(1);

    if (config.icon) {
        set_window_icon();
    }

    // Setup Dear ImGui context
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    io.IniFilename = nullptr;

    // Setup style
    ImGui::GetStyle().ScaleAllSizes(kBaseFontScale);

    ImGuiStyle& style = ImGui::GetStyle();
    style.WindowRounding = 0.0f;
    style.FrameRounding = 2.0f;
    style.ScrollbarRounding = 2.0f;

    // Setup Platform/Renderer backends
    ImGui_ImplGlfw_InitForOpenGL(window_, true);
    ImGui_ImplOpenGL3_Init("#version 330");

    apply_zoom();
    load_content();

    glfwShowWindow(window_);
    if (view_model_.fullscreen) {
        apply_fullscreen();
    }
    if (config.minimize) {
        glfwIconifyWindow(window_);
    }

    {
        std::lock_guard lock(event_debounce_mutex_);
        window_ready_ = true;
    }
    spdlog::debug("Window created for {} ({}x{})", config.url, config.width, config.height);
}

void ImGuiWindowHost::run() {
    if (!window_) {
        throw std::runtime_error("No window to run");
    }

    // Main loop
    while (!glfwWindowShouldClose(window_)) {
        glfwWaitEventsTimeout(0.1);

        if (close_requested_) {
            glfwSetWindowShouldClose(window_, GLFW_TRUE);
            break;
        }

        // Handle focus request from another launch
        if (focus_requested_.exchange(false)) {
            raise_window();
        }

        // Start the Dear ImGui frame
        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();

        render();

        // Rendering
        ImGui::Render();
        int display_w, display_h;
        glfwGetFramebufferSize(window_, &display_w, &display_h);
        glViewport(0, 0, display_w, display_h);
        glClearColor(0.1f, 0.1f, 0.1f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());

        glfwSwapBuffers(window_);

        // Zoom and full screen changes from the menu take effect next frame
        apply_zoom();
        if (view_model_.fullscreen != (glfwGetWindowMonitor(window_) != nullptr)) {
            apply_fullscreen();
        }
    }

    // Owners drop their handle before GLFW goes away
    if (on_closed_) {
        on_closed_();
    }

    destroy_window();
}

void ImGuiWindowHost::destroy_window() {
    if (!window_) return;

    {
        // Waits out a post already in flight on another thread
        std::lock_guard lock(event_debounce_mutex_);
        window_ready_ = false;
    }

    // Cleanup
    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();

    glfwDestroyWindow(window_);
    window_ = nullptr;
    glfwTerminate();
}

void ImGuiWindowHost::request_focus() {
    focus_requested_ = true;
    post_empty_event_debounced();
}

void ImGuiWindowHost::request_close() {
    close_requested_ = true;

    std::lock_guard lock(event_debounce_mutex_);
    if (window_ready_) {
        glfwPostEmptyEvent();
    }
}

void ImGuiWindowHost::set_on_closed(std::function<void()> callback) {
    on_closed_ = std::move(callback);
}

void ImGuiWindowHost::post_empty_event_debounced() {
    std::lock_guard lock(event_debounce_mutex_);
    if (!window_ready_) return;

    const auto now = std::chrono::steady_clock::now();
    if (now - last_event_post_time_ >= kEventDebounceInterval) {
        last_event_post_time_ = now;
        glfwPostEmptyEvent();
    }
}

void ImGuiWindowHost::raise_window() {
    if (glfwGetWindowAttrib(window_, GLFW_ICONIFIED)) {
        glfwRestoreWindow(window_);
    }
    glfwShowWindow(window_);
    glfwFocusWindow(window_);
    glfwRequestWindowAttention(window_);
    spdlog::debug("Window raised on focus request");
}

void ImGuiWindowHost::close_window() {
    glfwSetWindowShouldClose(window_, GLFW_TRUE);
}

void ImGuiWindowHost::apply_zoom() {
    if (!view_model_.zoom_changed_from(applied_zoom_)) return;
    ImGui::GetIO().FontGlobalScale = kBaseFontScale * view_model_.zoom;
    applied_zoom_ = view_model_.zoom;
}

void ImGuiWindowHost::apply_fullscreen() {
    if (view_model_.fullscreen) {
        GLFWmonitor* monitor = glfwGetPrimaryMonitor();
        const GLFWvidmode* mode = monitor ? glfwGetVideoMode(monitor) : nullptr;
        if (!mode) {
            spdlog::warn("No monitor available for full screen");
            view_model_.fullscreen = false;
            return;
        }
        glfwGetWindowPos(window_, &windowed_x_, &windowed_y_);
        glfwGetWindowSize(window_, &windowed_width_, &windowed_height_);
        glfwSetWindowMonitor(window_, monitor, 0, 0, mode->width, mode->height, mode->refreshRate);
    } else {
        const int width = windowed_width_ > 0 ? windowed_width_ : config_.width;
        const int height = windowed_height_ > 0 ? windowed_height_ : config_.height;
        glfwSetWindowMonitor(window_, nullptr, windowed_x_, windowed_y_, width, height, GLFW_DONT_CARE);
    }
}

void ImGuiWindowHost::load_content() {
    content_.clear();
    content_error_.clear();

    constexpr std::string_view file_scheme = "file://";
    if (!config_.url.starts_with(file_scheme)) return;

    const std::string path = config_.url.substr(file_scheme.size());
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        content_error_ = std::format("Unable to open {}", path);
        spdlog::warn("{}", content_error_);
        return;
    }
    content_.resize(static_cast<size_t>(kMaxContentBytes));
    in.read(content_.data(), kMaxContentBytes);
    content_.resize(static_cast<size_t>(in.gcount()));
}

void ImGuiWindowHost::render() {
    // Create main window that fills the viewport
    const ImGuiViewport* viewport = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(viewport->Pos);
    ImGui::SetNextWindowSize(viewport->Size);

    ImGuiWindowFlags window_flags = ImGuiWindowFlags_NoTitleBar | ImGuiWindowFlags_NoCollapse |
                                    ImGuiWindowFlags_NoResize | ImGuiWindowFlags_NoMove |
                                    ImGuiWindowFlags_NoBringToFrontOnFocus;
    if (view_model_.show_menu) {
        window_flags |= ImGuiWindowFlags_MenuBar;
    }

    ImGui::Begin("Kiosk", nullptr, window_flags);

    if (view_model_.show_menu) {
        handle_accelerators();
        render_menu_bar();
    }
    render_content();

    ImGui::End();

    if (view_model_.dev_tools_open) {
        ImGui::ShowMetricsWindow(&view_model_.dev_tools_open);
    }
}

void ImGuiWindowHost::render_menu_bar() {
    if (ImGui::BeginMenuBar()) {
        if (ImGui::BeginMenu("File")) {
            if (ImGui::MenuItem("Quit", "Ctrl+Q")) {
                close_window();
            }
            ImGui::EndMenu();
        }

        if (ImGui::BeginMenu("View")) {
            if (view_model_.developer) {
                if (ImGui::MenuItem("Toggle Developer Tools", "Ctrl+Shift+I", view_model_.dev_tools_open)) {
                    view_model_.toggle_dev_tools();
                }
                ImGui::Separator();
            }
            if (ImGui::MenuItem("Reset Zoom", "Ctrl+0")) {
                view_model_.reset_zoom();
            }
            if (ImGui::MenuItem("Zoom In", "Ctrl+=")) {
                view_model_.zoom_in();
            }
            if (ImGui::MenuItem("Zoom Out", "Ctrl+-")) {
                view_model_.zoom_out();
            }
            ImGui::Separator();
            if (ImGui::MenuItem("Toggle Full Screen", "F11", view_model_.fullscreen)) {
                view_model_.toggle_fullscreen();
            }
            ImGui::EndMenu();
        }

        if (ImGui::BeginMenu("Window")) {
            if (ImGui::MenuItem("Minimize")) {
                glfwIconifyWindow(window_);
            }
            if (ImGui::MenuItem("Close")) {
                close_window();
            }
            ImGui::EndMenu();
        }

        ImGui::EndMenuBar();
    }
}

void ImGuiWindowHost::render_content() {
    ImGui::TextDisabled("%s", config_.url.c_str());
    ImGui::Separator();

    ImGui::BeginChild("Content", ImVec2(0, 0), false, ImGuiWindowFlags_HorizontalScrollbar);
    if (!content_error_.empty()) {
        ImGui::PushStyleColor(ImGuiCol_Text, ImVec4(1.0f, 0.8f, 0.2f, 1.0f));
        ImGui::TextUnformatted(content_error_.c_str());
        ImGui::PopStyleColor();
    } else if (!content_.empty()) {
        ImGui::TextUnformatted(content_.data(), content_.data() + content_.size());
    }
    ImGui::EndChild();
}

} // namespace kiosk
