#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace voxchord {

struct HotkeySettings;

// The six capture-and-process pipelines a chord can start
enum class PipelineMode {
    Transcribe,
    PromptLLM,
    ClipboardPromptLLM,
    VisionCapture,
    SpeechVision,
    ClipboardTts
};

const char* to_string(PipelineMode mode);

// Modes that capture speech between chord press and release.
// The others fire once on press.
bool mode_records_audio(PipelineMode mode);

enum Modifier : uint8_t {
    ModNone  = 0,
    ModShift = 1 << 0,
    ModCtrl  = 1 << 1,
    ModAlt   = 1 << 2
};

// Modifier set plus one primary key (Linux evdev key code)
struct KeyChord {
    uint8_t modifiers = ModNone;
    uint16_t key = 0;

    bool operator==(const KeyChord& other) const {
        return modifiers == other.modifiers && key == other.key;
    }
    bool operator!=(const KeyChord& other) const { return !(*this == other); }
};

struct HotkeyBinding {
    KeyChord chord;
    PipelineMode mode = PipelineMode::Transcribe;
};

// Parses "F1", "Shift+F2", "Ctrl+Alt+K". Zero, one or two modifiers.
std::optional<KeyChord> parse_chord(const std::string& text);

std::string format_chord(const KeyChord& chord);

bool is_modifier_key(uint16_t code);

// Maps left/right Shift, Ctrl and Alt to their Modifier flag, ModNone otherwise
uint8_t modifier_for_key(uint16_t code);

// Returns a description of the first conflict (two bindings matching the same
// key state), or nullopt when the set is disjoint
std::optional<std::string> validate_bindings(const std::vector<HotkeyBinding>& bindings);

// Builds the six bindings from settings. Fails on unparsable or conflicting chords.
bool build_bindings(const HotkeySettings& settings,
                    std::vector<HotkeyBinding>& out,
                    std::string& error);

} // namespace voxchord
