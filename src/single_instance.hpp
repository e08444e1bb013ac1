#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <string>

namespace kiosk {

class CommChannel;
class LivenessOracle;
class LockStore;

enum class InstanceState {
    Start,
    Probing,
    Winner,
    Running,
    ShuttingDown,
    Done,
    Loser,
    Notified,
};

const char* to_string(InstanceState state);

// Cross-process single-instance coordination for one singleton key.
//
// The first launch records its PID in the lock store and watches its comm
// record. A later launch with the same key and user finds the live owner,
// sends it "focus" and backs off. A lock whose owner is dead, a zombie or a
// different program is reclaimed.
class SingleInstance {
public:
    // Non-owning: locks, comms and oracle must outlive the SingleInstance.
    SingleInstance(const std::string& key, const std::string& user,
                   LockStore* locks, CommChannel* comms, const LivenessOracle* oracle,
                   int own_pid);
    ~SingleInstance();

    SingleInstance(const SingleInstance&) = delete;
    SingleInstance& operator=(const SingleInstance&) = delete;

    // Returns true if this is the first instance.
    // If another instance exists, sends it a focus command and returns false.
    // Throws LockIOError when the lock record cannot be read or written.
    bool try_become_primary();

    // Set callback for when another instance requests focus.
    // Runs on the comm watcher thread.
    void set_raise_callback(std::function<void()> callback);

    // Stop watching and release the lock. Only the first call has an effect.
    void shutdown();

    [[nodiscard]] InstanceState state() const { return state_; }
    [[nodiscard]] const std::string& instance_id() const { return id_; }

private:
    void transition(InstanceState next);
    void become_winner();
    void become_loser(int owner_pid);
    void handle_command(const std::string& command);

    std::string key_;
    std::string id_;
    int own_pid_;

    LockStore* locks_ = nullptr;
    CommChannel* comms_ = nullptr;
    const LivenessOracle* oracle_ = nullptr;

    std::atomic<InstanceState> state_{InstanceState::Start};
    std::mutex lifecycle_mutex_;

    std::mutex callback_mutex_;
    std::function<void()> raise_callback_;
};

} // namespace kiosk
