#pragma once

#include <atomic>
#include <csignal>
#include <functional>
#include <thread>

namespace kiosk {

// Turns SIGINT/SIGTERM into a callback on a dedicated thread.
// Construct before starting other threads: the signals are blocked in the
// constructing thread and every thread it creates afterwards, and delivered
// only through sigwait() here. The previous mask is restored on destruction.
class SignalWatcher {
public:
    explicit SignalWatcher(std::function<void(int signal)> on_signal);
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

private:
    void wait_thread();

    std::function<void(int)> on_signal_;
    sigset_t signals_{};
    sigset_t previous_mask_{};
    std::atomic<bool> stopping_{false};
    std::thread waiter_;
};

} // namespace kiosk
