#include "signal_watcher.hpp"

#include <cstring>
#include <format>
#include <pthread.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace kiosk {

SignalWatcher::SignalWatcher(std::function<void(int)> on_signal)
    : on_signal_(std::move(on_signal)) {
    sigemptyset(&signals_);
    sigaddset(&signals_, SIGINT);
    sigaddset(&signals_, SIGTERM);

    if (const int rc = pthread_sigmask(SIG_BLOCK, &signals_, &previous_mask_); rc != 0) {
        throw std::runtime_error(std::format("pthread_sigmask failed: {}", std::strerror(rc)));
    }
    waiter_ = std::thread(&SignalWatcher::wait_thread, this);
}

SignalWatcher::~SignalWatcher() {
    stopping_ = true;
    if (waiter_.joinable()) {
        // Consumed by sigwait(); the signal is blocked everywhere
        pthread_kill(waiter_.native_handle(), SIGTERM);
        waiter_.join();
    }
    pthread_sigmask(SIG_SETMASK, &previous_mask_, nullptr);
}

void SignalWatcher::wait_thread() {
    while (!stopping_) {
        int signal = 0;
        if (sigwait(&signals_, &signal) != 0) {
            continue;
        }
        if (stopping_) break;

        spdlog::info("Received signal {}, closing", signal);
        try {
            on_signal_(signal);
        } catch (const std::exception& e) {
            spdlog::warn("Signal handler failed: {}", e.what());
        }
    }
}

} // namespace kiosk
