#include "clipboard_speaker.hpp"
#include "text_utils.hpp"

#include <iostream>

namespace voxchord {

ClipboardSpeaker::ClipboardSpeaker(Clipboard& clipboard, TtsEngine& engine,
                                   AudioPlaybackController& playback)
    : clipboard_(clipboard), engine_(engine), playback_(playback) {}

CancellationToken ClipboardSpeaker::begin_request() {
    std::lock_guard<std::mutex> lock(mutex_);
    current_.cancel();
    current_ = CancellationToken();
    return current_;
}

void ClipboardSpeaker::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    current_.cancel();
}

SpeakResult ClipboardSpeaker::speak_clipboard(const TtsSettings& settings) {
    std::string text = clipboard_.get_text();
    if (trim(text).empty()) {
        SpeakResult result;
        result.error = "No text found in clipboard";
        return result;
    }
    return speak(text, settings);
}

SpeakResult ClipboardSpeaker::speak(const std::string& text, const TtsSettings& settings) {
    SpeakResult result;
    CancellationToken token = begin_request();

    if (!settings.enabled) {
        result.error = "Text-to-speech is disabled";
        return result;
    }
    if (trim(text).empty()) {
        result.error = "No text to speak";
        return result;
    }

    TtsRequest request;
    request.text = text;
    if (utf8_length(text) > settings.max_text_length) {
        request.text = truncate_utf8(text, settings.max_text_length);
        std::cout << "[Speaker] Truncated " << utf8_length(text) << " characters to "
                  << settings.max_text_length << std::endl;
    }
    request.voice = settings.voice;
    request.speed = settings.speed;
    result.characters = utf8_length(request.text);

    std::cout << "[Speaker] Speaking: \"" << preview(request.text) << "\"" << std::endl;

    TtsResult tts = engine_.generate(request);
    if (!tts.success) {
        result.error = tts.error_message;
        return result;
    }

    if (token.is_cancelled()) {
        result.playback = PlaybackOutcome::Superseded;
        result.success = true;
        return result;
    }

    playback_.set_volume(settings.volume);
    result.playback = playback_.play(tts.audio_data, token);
    switch (result.playback) {
        case PlaybackOutcome::Completed:
            result.success = true;
            break;
        case PlaybackOutcome::Cancelled:
        case PlaybackOutcome::Superseded:
            // Stopped on purpose; not an error for the user
            result.success = true;
            break;
        case PlaybackOutcome::Failed:
            result.error = "Audio playback failed";
            break;
    }
    return result;
}

} // namespace voxchord
