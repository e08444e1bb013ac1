#include "imgui_window_host.hpp"
#include <GLFW/glfw3.h>
#include <spdlog/spdlog.h>

#define STB_IMAGE_IMPLEMENTATION
#include "stb_image.h"

namespace kiosk {

void ImGuiWindowHost::set_window_icon() {
    const std::string path = config_.icon->string();

    int width, height, channels;
    unsigned char* pixels = stbi_load(path.c_str(), &width, &height, &channels, 4);
    if (!pixels) {
        spdlog::warn("Unable to load window icon {}: {}", path, stbi_failure_reason());
        return;
    }

    GLFWimage icon;
    icon.width = width;
    icon.height = height;
    icon.pixels = pixels;
    glfwSetWindowIcon(window_, 1, &icon);
    stbi_image_free(pixels);
}

} // namespace kiosk
