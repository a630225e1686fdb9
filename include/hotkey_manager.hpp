#pragma once

#include "hotkey_state_machine.hpp"
#include "keyboard_device.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace voxchord {

// Global keyboard hook. Reads raw key events on a listener thread and feeds
// them to the state machine. When the device disappears the hook is
// restarted with a linear backoff; after the last attempt it gives up.
class HotkeyManager {
public:
    struct Options {
        int max_restart_attempts = 3;
        std::chrono::milliseconds restart_backoff{1000};
        int poll_timeout_ms = 100;
    };

    using FailureCallback = std::function<void(const std::string& message)>;
    using AbortCallback = std::function<void(PipelineMode mode)>;

    HotkeyManager(HotkeyStateMachine& machine, std::unique_ptr<KeyboardDevice> device);
    HotkeyManager(HotkeyStateMachine& machine, std::unique_ptr<KeyboardDevice> device,
                  Options options);
    ~HotkeyManager();

    HotkeyManager(const HotkeyManager&) = delete;
    HotkeyManager& operator=(const HotkeyManager&) = delete;

    bool initialize();
    void shutdown();

    bool start();
    void stop();
    bool is_running() const { return running_.load(); }

    // Called once when the hook cannot be restarted
    void set_failure_callback(FailureCallback callback) { on_failure_ = std::move(callback); }

    // Called when a device loss interrupts an active mode
    void set_abort_callback(AbortCallback callback) { on_abort_ = std::move(callback); }

    std::string device_path() const { return device_->path(); }

private:
    void run_loop();
    bool recover();
    void abandon_active_mode();
    bool sleep_while_running(std::chrono::milliseconds duration);

    HotkeyStateMachine& machine_;
    std::unique_ptr<KeyboardDevice> device_;
    Options options_;

    std::atomic<bool> running_{false};
    std::thread listener_thread_;

    FailureCallback on_failure_;
    AbortCallback on_abort_;
};

} // namespace voxchord
