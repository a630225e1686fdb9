#include "hotkey_state_machine.hpp"

#include <algorithm>
#include <iostream>

namespace voxchord {

HotkeyStateMachine::HotkeyStateMachine(std::vector<HotkeyBinding> bindings)
    : bindings_(std::move(bindings)) {}

void HotkeyStateMachine::set_bindings(std::vector<HotkeyBinding> bindings) {
    std::lock_guard<std::mutex> lock(mutex_);
    bindings_ = std::move(bindings);
}

uint8_t HotkeyStateMachine::modifiers_locked() const {
    uint8_t mods = ModNone;
    for (uint16_t key : held_modifier_keys_) {
        mods |= modifier_for_key(key);
    }
    return mods;
}

const HotkeyBinding* HotkeyStateMachine::match_locked(uint16_t code) const {
    // Exact match: Shift+F2 must not fire the plain F2 binding and vice versa
    uint8_t mods = modifiers_locked();
    for (const auto& binding : bindings_) {
        if (binding.chord.key == code && binding.chord.modifiers == mods) {
            return &binding;
        }
    }
    return nullptr;
}

KeyDisposition HotkeyStateMachine::on_key_down(uint16_t code) {
    std::optional<PipelineMode> started;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (is_modifier_key(code)) {
            if (std::find(held_modifier_keys_.begin(), held_modifier_keys_.end(), code) ==
                held_modifier_keys_.end()) {
                held_modifier_keys_.push_back(code);
            }
            return KeyDisposition::Pass;
        }

        if (active_ && code == active_key_) {
            return KeyDisposition::Suppress;
        }

        const HotkeyBinding* binding = match_locked(code);
        if (!binding) {
            return KeyDisposition::Pass;
        }

        if (active_) {
            std::cout << "[Hotkey] " << format_chord(binding->chord) << " ignored, "
                      << to_string(active_mode_) << " is active" << std::endl;
            if (std::find(swallowed_keys_.begin(), swallowed_keys_.end(), code) ==
                swallowed_keys_.end()) {
                swallowed_keys_.push_back(code);
            }
            return KeyDisposition::Suppress;
        }

        active_ = true;
        active_mode_ = binding->mode;
        active_key_ = code;
        started = binding->mode;
    }

    if (on_start_) on_start_(*started);
    return KeyDisposition::Suppress;
}

KeyDisposition HotkeyStateMachine::on_key_repeat(uint16_t code) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_ && code == active_key_) {
        return KeyDisposition::Suppress;
    }
    if (std::find(swallowed_keys_.begin(), swallowed_keys_.end(), code) != swallowed_keys_.end()) {
        return KeyDisposition::Suppress;
    }
    return KeyDisposition::Pass;
}

KeyDisposition HotkeyStateMachine::on_key_up(uint16_t code) {
    std::optional<PipelineMode> ended;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (is_modifier_key(code)) {
            held_modifier_keys_.erase(
                std::remove(held_modifier_keys_.begin(), held_modifier_keys_.end(), code),
                held_modifier_keys_.end());
            return KeyDisposition::Pass;
        }

        auto swallowed = std::find(swallowed_keys_.begin(), swallowed_keys_.end(), code);
        if (swallowed != swallowed_keys_.end()) {
            swallowed_keys_.erase(swallowed);
            return KeyDisposition::Suppress;
        }

        // The mode ends on primary key release, even if its modifiers went up first
        if (!active_ || code != active_key_) {
            return KeyDisposition::Pass;
        }

        active_ = false;
        active_key_ = 0;
        ended = active_mode_;
    }

    if (on_end_) on_end_(*ended);
    return KeyDisposition::Suppress;
}

std::optional<PipelineMode> HotkeyStateMachine::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::optional<PipelineMode> aborted;
    if (active_) aborted = active_mode_;

    active_ = false;
    active_key_ = 0;
    held_modifier_keys_.clear();
    swallowed_keys_.clear();
    return aborted;
}

std::optional<PipelineMode> HotkeyStateMachine::active_mode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!active_) return std::nullopt;
    return active_mode_;
}

uint8_t HotkeyStateMachine::held_modifiers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return modifiers_locked();
}

} // namespace voxchord
