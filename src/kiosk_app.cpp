#include "kiosk_app.hpp"
#include "comm_channel.hpp"
#include "instance_id.hpp"
#include "liveness_oracle.hpp"
#include "lock_store.hpp"
#include "platform_factory.hpp"
#include "signal_watcher.hpp"
#include "single_instance.hpp"
#include "work_directory.hpp"

#include <iostream>
#include <spdlog/spdlog.h>
#include <unistd.h>

namespace kiosk {

KioskApp::KioskApp(LaunchOptions options, std::string argv0, HostFactory make_host)
    : options_(std::move(options))
    , argv0_(std::move(argv0))
    , make_host_(std::move(make_host)) {
}

int KioskApp::run() {
    const auto url = resolve_url(options_.path);
    if (!url) {
        std::cerr << "Invalid URL: " << options_.path << std::endl;
        return 1;
    }

    // Before any other thread exists so they all inherit the blocked signals
    SignalWatcher signals([this](int) {
        request_close();
    });

    if (!options_.singleton) {
        return show_window(*url);
    }
    const std::string& key = *options_.singleton;

    const WorkDirectory work_dir = options_.work_dir ? WorkDirectory(*options_.work_dir) : WorkDirectory();
    work_dir.ensure_created();

    // Destroyed in reverse order: the coordinator goes first
    LockStore locks(work_dir.locks_dir());
    CommChannel comms(work_dir.comms_dir(), [] { return make_file_watcher(); });
    const auto process_table = make_process_table();
    const LivenessOracle oracle(process_table.get(),
                                LivenessOracle::resolve_own_image_name(*process_table, argv0_));

    SingleInstance instance(key, current_user_name(), &locks, &comms, &oracle, static_cast<int>(getpid()));
    instance.set_raise_callback([this]() {
        request_focus();
    });

    if (!instance.try_become_primary()) {
        std::cerr << "Instance already running: " << key << std::endl;
        return 1;
    }

    const int exit_code = show_window(*url);
    instance.shutdown();
    return exit_code;
}

int KioskApp::show_window(const std::string& url) {
    const auto host = make_host_();
    host->set_on_closed([this]() {
        std::lock_guard lock(window_mutex_);
        window_ = nullptr;
    });
    host->create_window(WindowConfig::from_options(options_, url));

    {
        std::lock_guard lock(window_mutex_);
        window_ = host.get();
        if (close_pending_) {
            window_->request_close();
        }
    }

    try {
        host->run();
    } catch (const std::exception&) {
        std::lock_guard lock(window_mutex_);
        window_ = nullptr;
        throw;
    }

    std::lock_guard lock(window_mutex_);
    window_ = nullptr;
    spdlog::debug("Window closed");
    return 0;
}

void KioskApp::request_focus() {
    std::lock_guard lock(window_mutex_);
    if (window_) {
        window_->request_focus();
    } else {
        spdlog::debug("Focus requested without an active window");
    }
}

void KioskApp::request_close() {
    std::lock_guard lock(window_mutex_);
    if (window_) {
        window_->request_close();
    } else {
        close_pending_ = true;
    }
}

} // namespace kiosk
