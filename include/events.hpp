#pragma once

#include "hotkey_binding.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace voxchord {

enum class ErrorKind {
    None,
    HotkeyInfrastructure,
    Recording,
    Transcription,
    Llm,
    Vision,
    Clipboard,
    CapabilityProcess,
    Tts,
    Network,
    ResponseParse
};

const char* to_string(ErrorKind kind);

// Outcome of one pipeline run (or an infrastructure failure with no mode),
// reported to the user-facing layer
struct PipelineEvent {
    std::optional<PipelineMode> mode;
    bool success = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string message;
    std::string text;                       // Result text on success
    std::chrono::milliseconds elapsed{0};

    static PipelineEvent completed(PipelineMode mode, std::string text) {
        PipelineEvent event;
        event.mode = mode;
        event.success = true;
        event.text = std::move(text);
        return event;
    }

    static PipelineEvent failed(std::optional<PipelineMode> mode, ErrorKind kind, std::string message) {
        PipelineEvent event;
        event.mode = mode;
        event.error_kind = kind;
        event.message = std::move(message);
        return event;
    }
};

using EventSink = std::function<void(const PipelineEvent& event)>;

} // namespace voxchord
