#pragma once

#include "hotkey_state_machine.hpp"

#include <memory>
#include <string>

namespace voxchord {

// Source of raw key events for the hotkey hook
class KeyboardDevice {
public:
    enum class PollStatus { Idle, Events, Error };

    virtual ~KeyboardDevice() = default;

    virtual bool open() = 0;
    virtual void close() = 0;
    virtual bool is_open() const = 0;

    // Waits up to timeout_ms and feeds every key event read to `machine`.
    // Error means the device is gone and must be reopened.
    virtual PollStatus poll(HotkeyStateMachine& machine, int timeout_ms) = 0;

    virtual std::string path() const = 0;
};

// Platform keyboard, in platform/*/hotkey_*.cpp. An empty path picks the
// first keyboard found; `grab` suppresses consumed chords system-wide.
std::unique_ptr<KeyboardDevice> make_keyboard_device(const std::string& device_path, bool grab);

} // namespace voxchord
