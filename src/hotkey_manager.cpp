#include "hotkey_manager.hpp"

#include <algorithm>
#include <iostream>

namespace voxchord {

HotkeyManager::HotkeyManager(HotkeyStateMachine& machine, std::unique_ptr<KeyboardDevice> device)
    : HotkeyManager(machine, std::move(device), Options()) {}

HotkeyManager::HotkeyManager(HotkeyStateMachine& machine, std::unique_ptr<KeyboardDevice> device,
                             Options options)
    : machine_(machine), device_(std::move(device)), options_(options) {}

HotkeyManager::~HotkeyManager() {
    shutdown();
}

bool HotkeyManager::initialize() {
    if (device_->is_open()) return true;

    if (!device_->open()) {
        std::cerr << "[Hotkey] Failed to open keyboard device. "
                  << "Add your user to the 'input' group or set hotkeys.device_path." << std::endl;
        return false;
    }
    return true;
}

void HotkeyManager::shutdown() {
    stop();
    device_->close();
}

bool HotkeyManager::start() {
    if (running_.load()) return true;
    if (!initialize()) return false;

    running_.store(true);
    listener_thread_ = std::thread([this]() {
        run_loop();
    });

    std::cout << "[Hotkey] Listening on " << device_->path() << std::endl;
    return true;
}

void HotkeyManager::stop() {
    running_.store(false);

    if (listener_thread_.joinable()) {
        listener_thread_.join();
    }
}

void HotkeyManager::run_loop() {
    while (running_.load()) {
        if (device_->poll(machine_, options_.poll_timeout_ms) != KeyboardDevice::PollStatus::Error) {
            continue;
        }

        std::cerr << "[Hotkey] Lost keyboard device " << device_->path() << std::endl;
        device_->close();
        abandon_active_mode();

        if (!running_.load()) break;

        if (!recover()) {
            std::string message = "Keyboard hook failed after " +
                                  std::to_string(options_.max_restart_attempts) +
                                  " restart attempts; hotkeys are disabled";
            std::cerr << "[Hotkey] FATAL: " << message << std::endl;
            running_.store(false);
            if (on_failure_) on_failure_(message);
            return;
        }
    }
}

// Each loss starts again from attempt 1
bool HotkeyManager::recover() {
    for (int attempt = 1; attempt <= options_.max_restart_attempts; ++attempt) {
        if (!sleep_while_running(options_.restart_backoff * attempt)) return true;

        std::cout << "[Hotkey] Restart attempt " << attempt << "/"
                  << options_.max_restart_attempts << std::endl;
        if (device_->open()) {
            std::cout << "[Hotkey] Restarted on " << device_->path() << std::endl;
            return true;
        }
    }
    return false;
}

void HotkeyManager::abandon_active_mode() {
    auto aborted = machine_.reset();
    if (aborted) {
        std::cerr << "[Hotkey] Abandoning " << to_string(*aborted) << std::endl;
        if (on_abort_) on_abort_(*aborted);
    }
}

bool HotkeyManager::sleep_while_running(std::chrono::milliseconds duration) {
    const auto deadline = std::chrono::steady_clock::now() + duration;
    const auto step = std::chrono::milliseconds(std::max(1, std::min(options_.poll_timeout_ms, 50)));
    while (running_.load()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return true;
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(step, deadline - now));
    }
    return false;
}

} // namespace voxchord
