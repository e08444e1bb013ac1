#include "imgui_window_host.hpp"
#include "imgui.h"

namespace kiosk {

// Menu accelerators; only active while the menu bar is shown
void ImGuiWindowHost::handle_accelerators() {
    const ImGuiIO& io = ImGui::GetIO();

    // F11 for full screen
    if (ImGui::IsKeyPressed(ImGuiKey_F11, false)) {
        view_model_.toggle_fullscreen();
        return;
    }

    if (!io.KeyCtrl) return;

    // Ctrl+Shift+I for developer tools
    if (io.KeyShift && ImGui::IsKeyPressed(ImGuiKey_I, false)) {
        view_model_.toggle_dev_tools();
        return;
    }

    if (ImGui::IsKeyPressed(ImGuiKey_Q, false)) {
        close_window();
    } else if (ImGui::IsKeyPressed(ImGuiKey_0, false) || ImGui::IsKeyPressed(ImGuiKey_Keypad0, false)) {
        view_model_.reset_zoom();
    } else if (ImGui::IsKeyPressed(ImGuiKey_Equal) || ImGui::IsKeyPressed(ImGuiKey_KeypadAdd)) {
        view_model_.zoom_in();
    } else if (ImGui::IsKeyPressed(ImGuiKey_Minus) || ImGui::IsKeyPressed(ImGuiKey_KeypadSubtract)) {
        view_model_.zoom_out();
    }
}

} // namespace kiosk
