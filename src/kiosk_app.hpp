#pragma once

#include "interfaces/i_window_host.hpp"
#include "launch_options.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace kiosk {

// One kiosk launch: resolve the URL, coordinate with other launches of the
// same singleton key, then show the window until it closes.
class KioskApp {
public:
    using HostFactory = std::function<std::unique_ptr<IWindowHost>()>;

    KioskApp(LaunchOptions options, std::string argv0, HostFactory make_host);

    // Returns the process exit code: 0 after the window closed normally,
    // 1 for an invalid URL or when another instance already owns the key.
    // Throws LockIOError and std::runtime_error on fatal errors.
    int run();

    // Bring the window forward; no-op while there is no window
    void request_focus();
    void request_close();

private:
    int show_window(const std::string& url);

    LaunchOptions options_;
    std::string argv0_;
    HostFactory make_host_;

    // Active window, shared with the comm watcher and signal threads
    std::mutex window_mutex_;
    IWindowHost* window_ = nullptr;
    bool close_pending_ = false;
};

} // namespace kiosk
