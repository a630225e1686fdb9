#pragma once

#include "audio_playback.hpp"
#include "cancellation.hpp"
#include "config.hpp"
#include "events.hpp"

#include <mutex>

namespace voxchord {

// User-facing reaction to pipeline events: a status line, and optionally a
// short sound when a result lands on the clipboard.
class Notifier {
public:
    // `sound` may be null when no output device is available
    Notifier(AudioPlaybackController* sound, NotificationSettings settings);

    void update_settings(const NotificationSettings& settings);

    // Blocks while the sound plays
    void notify(const PipelineEvent& event);

    // Stops a sound in progress
    void cancel();

    // Whether a successful event of this mode asks for a sound
    static bool wants_sound(const NotificationSettings& settings, PipelineMode mode);

private:
    AudioPlaybackController* sound_;

    std::mutex mutex_;
    NotificationSettings settings_;
    CancellationToken token_;
};

} // namespace voxchord
