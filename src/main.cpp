#include "errors.hpp"
#include "imgui/imgui_window_host.hpp"
#include "kiosk_app.hpp"
#include "launch_options.hpp"
#include "logger.hpp"
#include <filesystem>
#include <iostream>
#include <memory>
#include <spdlog/spdlog.h>

int main(int argc, char* argv[]) {
    const std::string program = argc > 0 ? std::filesystem::path(argv[0]).filename().string() : "kiosk";

    kiosk::LaunchOptions options;
    try {
        options = kiosk::parse_launch_options(argc, argv);
    } catch (const kiosk::UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n"
                  << "Try '" << program << " --help' for more information." << std::endl;
        return 1;
    }

    if (options.show_help) {
        std::cout << kiosk::build_help_text(program);
        return 0;
    }
    if (options.show_version) {
        std::cout << kiosk::kKioskVersion << std::endl;
        return 0;
    }

    try {
        kiosk::init_logging(options.log_level, options.log_file);

        kiosk::KioskApp app(options, argc > 0 ? argv[0] : "", []() {
            return std::make_unique<kiosk::ImGuiWindowHost>();
        });
        return app.run();
    } catch (const kiosk::LockIOError& e) {
        spdlog::error("{}", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
