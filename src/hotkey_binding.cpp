#include "hotkey_binding.hpp"
#include "config.hpp"
#include "text_utils.hpp"

#include <linux/input-event-codes.h>

#include <cctype>
#include <sstream>
#include <utility>

namespace voxchord {

namespace {

struct KeyName {
    const char* name;
    uint16_t code;
};

const KeyName kKeyNames[] = {
    {"f1", KEY_F1}, {"f2", KEY_F2}, {"f3", KEY_F3}, {"f4", KEY_F4},
    {"f5", KEY_F5}, {"f6", KEY_F6}, {"f7", KEY_F7}, {"f8", KEY_F8},
    {"f9", KEY_F9}, {"f10", KEY_F10}, {"f11", KEY_F11}, {"f12", KEY_F12},
    {"a", KEY_A}, {"b", KEY_B}, {"c", KEY_C}, {"d", KEY_D}, {"e", KEY_E},
    {"f", KEY_F}, {"g", KEY_G}, {"h", KEY_H}, {"i", KEY_I}, {"j", KEY_J},
    {"k", KEY_K}, {"l", KEY_L}, {"m", KEY_M}, {"n", KEY_N}, {"o", KEY_O},
    {"p", KEY_P}, {"q", KEY_Q}, {"r", KEY_R}, {"s", KEY_S}, {"t", KEY_T},
    {"u", KEY_U}, {"v", KEY_V}, {"w", KEY_W}, {"x", KEY_X}, {"y", KEY_Y},
    {"z", KEY_Z},
    {"0", KEY_0}, {"1", KEY_1}, {"2", KEY_2}, {"3", KEY_3}, {"4", KEY_4},
    {"5", KEY_5}, {"6", KEY_6}, {"7", KEY_7}, {"8", KEY_8}, {"9", KEY_9},
    {"space", KEY_SPACE}, {"pause", KEY_PAUSE}, {"scrolllock", KEY_SCROLLLOCK},
    {"insert", KEY_INSERT}, {"home", KEY_HOME}, {"end", KEY_END},
};

std::optional<uint16_t> key_from_name(const std::string& lower) {
    for (const auto& entry : kKeyNames) {
        if (lower == entry.name) return entry.code;
    }
    return std::nullopt;
}

std::string name_from_key(uint16_t code) {
    for (const auto& entry : kKeyNames) {
        if (entry.code == code) {
            std::string name = entry.name;
            if (!name.empty()) name[0] = static_cast<char>(std::toupper(name[0]));
            return name;
        }
    }
    return "Key" + std::to_string(code);
}

uint8_t modifier_from_name(const std::string& lower) {
    if (lower == "shift") return ModShift;
    if (lower == "ctrl" || lower == "control") return ModCtrl;
    if (lower == "alt") return ModAlt;
    return ModNone;
}

int count_bits(uint8_t value) {
    int n = 0;
    while (value) {
        n += value & 1;
        value >>= 1;
    }
    return n;
}

} // namespace

const char* to_string(PipelineMode mode) {
    switch (mode) {
        case PipelineMode::Transcribe: return "Transcribe";
        case PipelineMode::PromptLLM: return "PromptLLM";
        case PipelineMode::ClipboardPromptLLM: return "ClipboardPromptLLM";
        case PipelineMode::VisionCapture: return "VisionCapture";
        case PipelineMode::SpeechVision: return "SpeechVision";
        case PipelineMode::ClipboardTts: return "ClipboardTts";
    }
    return "Unknown";
}

bool mode_records_audio(PipelineMode mode) {
    switch (mode) {
        case PipelineMode::Transcribe:
        case PipelineMode::PromptLLM:
        case PipelineMode::ClipboardPromptLLM:
        case PipelineMode::SpeechVision:
            return true;
        case PipelineMode::VisionCapture:
        case PipelineMode::ClipboardTts:
            return false;
    }
    return false;
}

std::optional<KeyChord> parse_chord(const std::string& text) {
    std::string trimmed = trim(text);
    if (trimmed.empty()) return std::nullopt;

    std::vector<std::string> parts;
    std::stringstream ss(trimmed);
    std::string part;
    while (std::getline(ss, part, '+')) {
        parts.push_back(to_lower(trim(part)));
    }
    // "Ctrl+" leaves a dangling separator
    if (trimmed.back() == '+') return std::nullopt;

    KeyChord chord;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        uint8_t mod = modifier_from_name(parts[i]);
        if (mod == ModNone) return std::nullopt;
        if (chord.modifiers & mod) return std::nullopt;  // "Shift+Shift+F1"
        chord.modifiers |= mod;
    }
    if (count_bits(chord.modifiers) > 2) return std::nullopt;

    auto key = key_from_name(parts.back());
    if (!key) return std::nullopt;
    chord.key = *key;
    return chord;
}

std::string format_chord(const KeyChord& chord) {
    std::string out;
    if (chord.modifiers & ModCtrl) out += "Ctrl+";
    if (chord.modifiers & ModShift) out += "Shift+";
    if (chord.modifiers & ModAlt) out += "Alt+";
    out += name_from_key(chord.key);
    return out;
}

bool is_modifier_key(uint16_t code) {
    return modifier_for_key(code) != ModNone;
}

uint8_t modifier_for_key(uint16_t code) {
    switch (code) {
        case KEY_LEFTSHIFT:
        case KEY_RIGHTSHIFT:
            return ModShift;
        case KEY_LEFTCTRL:
        case KEY_RIGHTCTRL:
            return ModCtrl;
        case KEY_LEFTALT:
        case KEY_RIGHTALT:
            return ModAlt;
        default:
            return ModNone;
    }
}

std::optional<std::string> validate_bindings(const std::vector<HotkeyBinding>& bindings) {
    for (size_t i = 0; i < bindings.size(); ++i) {
        for (size_t j = i + 1; j < bindings.size(); ++j) {
            if (bindings[i].chord == bindings[j].chord) {
                return format_chord(bindings[i].chord) + " is bound to both " +
                       to_string(bindings[i].mode) + " and " + to_string(bindings[j].mode);
            }
            if (bindings[i].mode == bindings[j].mode) {
                return std::string("Mode ") + to_string(bindings[i].mode) + " is bound twice";
            }
        }
    }
    return std::nullopt;
}

bool build_bindings(const HotkeySettings& settings,
                    std::vector<HotkeyBinding>& out,
                    std::string& error) {
    const std::pair<const std::string*, PipelineMode> sources[] = {
        {&settings.transcribe, PipelineMode::Transcribe},
        {&settings.prompt_llm, PipelineMode::PromptLLM},
        {&settings.clipboard_prompt_llm, PipelineMode::ClipboardPromptLLM},
        {&settings.vision_capture, PipelineMode::VisionCapture},
        {&settings.speech_vision, PipelineMode::SpeechVision},
        {&settings.clipboard_tts, PipelineMode::ClipboardTts},
    };

    std::vector<HotkeyBinding> bindings;
    for (const auto& source : sources) {
        // An empty chord leaves the mode unbound
        if (trim(*source.first).empty()) continue;

        auto chord = parse_chord(*source.first);
        if (!chord) {
            error = "Invalid hotkey \"" + *source.first + "\" for " + to_string(source.second);
            return false;
        }
        bindings.push_back({*chord, source.second});
    }

    if (auto conflict = validate_bindings(bindings)) {
        error = *conflict;
        return false;
    }

    out = std::move(bindings);
    return true;
}

} // namespace voxchord
