#include "single_instance.hpp"

#include "comm_channel.hpp"
#include "errors.hpp"
#include "instance_id.hpp"
#include "liveness_oracle.hpp"
#include "lock_store.hpp"

#include <spdlog/spdlog.h>

namespace kiosk {

const char* to_string(const InstanceState state) {
    switch (state) {
        case InstanceState::Start: return "START";
        case InstanceState::Probing: return "PROBING";
        case InstanceState::Winner: return "WINNER";
        case InstanceState::Running: return "RUNNING";
        case InstanceState::ShuttingDown: return "SHUTTING_DOWN";
        case InstanceState::Done: return "DONE";
        case InstanceState::Loser: return "LOSER";
        case InstanceState::Notified: return "NOTIFIED";
    }
    return "?";
}

SingleInstance::SingleInstance(const std::string& key, const std::string& user,
                               LockStore* locks, CommChannel* comms, const LivenessOracle* oracle,
                               const int own_pid)
    : key_(key)
    , id_(compute_instance_id(key, user))
    , own_pid_(own_pid)
    , locks_(locks)
    , comms_(comms)
    , oracle_(oracle) {
}

SingleInstance::~SingleInstance() {
    shutdown();
}

void SingleInstance::transition(const InstanceState next) {
    const InstanceState previous = state_.exchange(next);
    spdlog::debug("Singleton '{}' [{}]: {} -> {}", key_, id_, to_string(previous), to_string(next));
}

bool SingleInstance::try_become_primary() {
    std::lock_guard lock(lifecycle_mutex_);
    if (state_ != InstanceState::Start) {
        return state_ == InstanceState::Winner || state_ == InstanceState::Running;
    }

    transition(InstanceState::Probing);

    switch (const LockProbe probe = locks_->probe(id_); probe.state) {
        case LockState::Absent:
            break;

        case LockState::Malformed:
            spdlog::debug("Lock for '{}' is not a regular file, reclaiming", key_);
            locks_->reclaim(id_);
            break;

        case LockState::Held:
            // Our own PID can only be a leftover from an owner whose PID we inherited
            if (probe.pid != own_pid_ && oracle_->is_alive_and_same_app(probe.pid)) {
                become_loser(probe.pid);
                return false;
            }
            spdlog::debug("Stale lock for '{}' (pid {}), reclaiming", key_, probe.pid);
            locks_->reclaim(id_);
            break;
    }

    become_winner();
    return true;
}

void SingleInstance::become_winner() {
    transition(InstanceState::Winner);
    locks_->acquire(id_, own_pid_);

    try {
        comms_->watch(id_, [this](const std::string& command) {
            handle_command(command);
        });
    } catch (const CommIOError& e) {
        spdlog::warn("Focus requests from other launches are unavailable: {}", e.what());
    }

    transition(InstanceState::Running);
}

void SingleInstance::become_loser(const int owner_pid) {
    transition(InstanceState::Loser);
    spdlog::info("Instance already running: {} (pid {})", key_, owner_pid);

    try {
        comms_->send(id_, kFocusCommand);
    } catch (const CommIOError& e) {
        spdlog::warn("Unable to notify running instance: {}", e.what());
    }

    transition(InstanceState::Notified);
}

void SingleInstance::handle_command(const std::string& command) {
    if (command != kFocusCommand) {
        spdlog::debug("Ignoring unknown command '{}'", command);
        return;
    }

    std::function<void()> callback;
    {
        std::lock_guard lock(callback_mutex_);
        callback = raise_callback_;
    }
    if (callback) {
        callback();
    } else {
        spdlog::debug("Focus requested before a window exists");
    }
}

void SingleInstance::set_raise_callback(std::function<void()> callback) {
    std::lock_guard lock(callback_mutex_);
    raise_callback_ = std::move(callback);
}

void SingleInstance::shutdown() {
    std::lock_guard lock(lifecycle_mutex_);

    const InstanceState current = state_;
    if (current == InstanceState::Done || current == InstanceState::ShuttingDown) {
        return;
    }
    if (current != InstanceState::Winner && current != InstanceState::Running) {
        transition(InstanceState::Done);
        return;
    }

    transition(InstanceState::ShuttingDown);
    comms_->stop(id_);
    try {
        locks_->release(id_);
    } catch (const LockIOError& e) {
        spdlog::error("{}", e.what());
    }
    transition(InstanceState::Done);
}

} // namespace kiosk
