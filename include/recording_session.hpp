#pragma once

#include "cancellation.hpp"
#include "hotkey_binding.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace voxchord {

// One chord activation. Created on mode-start, handed by value to the
// pipeline once capture has ended.
struct RecordingSession {
    uint64_t id = 0;
    PipelineMode mode = PipelineMode::Transcribe;
    std::chrono::system_clock::time_point started_at;
    std::string audio_path;             // Empty for modes that do not record
    std::string clipboard_snapshot;     // Taken before capture (ClipboardPromptLLM)
    CancellationToken cancel_token;
};

// Receives finished sessions, on an executor worker
class SessionHandler {
public:
    virtual ~SessionHandler() = default;
    virtual void run(RecordingSession session) = 0;
};

} // namespace voxchord
