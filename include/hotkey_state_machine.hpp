#pragma once

#include "hotkey_binding.hpp"

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

namespace voxchord {

enum class KeyDisposition {
    Pass,       // Deliver to the focused application
    Suppress    // Consumed by a binding
};

// Turns raw key transitions into mode-start / mode-end pairs.
// At most one mode is active. A second bound chord pressed while one is
// active is consumed and dropped. Auto-repeat never re-triggers.
class HotkeyStateMachine {
public:
    using ModeCallback = std::function<void(PipelineMode mode)>;

    explicit HotkeyStateMachine(std::vector<HotkeyBinding> bindings = {});

    void set_bindings(std::vector<HotkeyBinding> bindings);
    void set_on_mode_start(ModeCallback callback) { on_start_ = std::move(callback); }
    void set_on_mode_end(ModeCallback callback) { on_end_ = std::move(callback); }

    KeyDisposition on_key_down(uint16_t code);
    KeyDisposition on_key_repeat(uint16_t code);
    KeyDisposition on_key_up(uint16_t code);

    // Forget held keys and any active mode (device lost). Returns the mode
    // that was active so the caller can abandon its session.
    std::optional<PipelineMode> reset();

    std::optional<PipelineMode> active_mode() const;
    uint8_t held_modifiers() const;

private:
    uint8_t modifiers_locked() const;
    const HotkeyBinding* match_locked(uint16_t code) const;

    mutable std::mutex mutex_;
    std::vector<HotkeyBinding> bindings_;
    std::vector<uint16_t> held_modifier_keys_;

    bool active_ = false;
    PipelineMode active_mode_ = PipelineMode::Transcribe;
    uint16_t active_key_ = 0;

    // Bound keys whose press was dropped; their release is consumed too
    std::vector<uint16_t> swallowed_keys_;

    ModeCallback on_start_;
    ModeCallback on_end_;
};

} // namespace voxchord
