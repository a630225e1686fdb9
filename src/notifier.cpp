#include "notifier.hpp"
#include "text_utils.hpp"
#include "tray.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>

namespace voxchord {

Notifier::Notifier(AudioPlaybackController* sound, NotificationSettings settings)
    : sound_(sound), settings_(std::move(settings)) {}

void Notifier::update_settings(const NotificationSettings& settings) {
    std::lock_guard<std::mutex> lock(mutex_);
    settings_ = settings;
}

bool Notifier::wants_sound(const NotificationSettings& settings, PipelineMode mode) {
    if (!settings.enabled || settings.sound_path.empty()) return false;

    switch (mode) {
        case PipelineMode::Transcribe:
            return settings.on_speech_to_text;
        case PipelineMode::PromptLLM:
        case PipelineMode::ClipboardPromptLLM:
        case PipelineMode::VisionCapture:
        case PipelineMode::SpeechVision:
            return settings.on_llm_response;
        case PipelineMode::ClipboardTts:
            return false;
    }
    return false;
}

void Notifier::notify(const PipelineEvent& event) {
    if (!event.success) {
        std::string where = event.mode ? std::string(to_string(*event.mode)) + ": " : "";
        show_status_message("Error: " + where + event.message, true);
        return;
    }

    if (!event.text.empty()) {
        show_status_message("Copied to clipboard: \"" + preview(event.text) + "\"", false);
    } else if (!event.message.empty()) {
        show_status_message(event.message, false);
    }

    NotificationSettings settings;
    CancellationToken token;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        settings = settings_;
        token = token_;
    }

    if (!sound_ || !event.mode || !wants_sound(settings, *event.mode)) return;

    std::error_code ec;
    if (!std::filesystem::exists(settings.sound_path, ec)) {
        std::cerr << "[Notify] Sound file not found: " << settings.sound_path << std::endl;
        return;
    }

    sound_->set_volume(std::clamp(settings.volume, 0.0f, 1.0f));
    PlaybackOutcome outcome = sound_->play_file(settings.sound_path, token);
    if (outcome == PlaybackOutcome::Failed) {
        std::cerr << "[Notify] Failed to play " << settings.sound_path << std::endl;
    }
}

void Notifier::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    token_.cancel();
    token_ = CancellationToken();
}

} // namespace voxchord
