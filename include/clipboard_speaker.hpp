#pragma once

#include "audio_playback.hpp"
#include "cancellation.hpp"
#include "clipboard.hpp"
#include "config.hpp"
#include "tts_engine.hpp"

#include <mutex>
#include <string>

namespace voxchord {

struct SpeakResult {
    bool success = false;
    std::string error;
    std::size_t characters = 0;
    PlaybackOutcome playback = PlaybackOutcome::Failed;
};

// Reads the clipboard aloud. A new request cancels the one in flight.
class ClipboardSpeaker {
public:
    ClipboardSpeaker(Clipboard& clipboard, TtsEngine& engine, AudioPlaybackController& playback);

    SpeakResult speak_clipboard(const TtsSettings& settings);
    SpeakResult speak(const std::string& text, const TtsSettings& settings);

    void cancel();

private:
    CancellationToken begin_request();

    Clipboard& clipboard_;
    TtsEngine& engine_;
    AudioPlaybackController& playback_;

    std::mutex mutex_;
    CancellationToken current_;
};

} // namespace voxchord
