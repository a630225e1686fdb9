#include "audio_playback.hpp"
#include "paths.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <thread>

namespace voxchord {

const char* to_string(PlaybackOutcome outcome) {
    switch (outcome) {
        case PlaybackOutcome::Completed: return "Completed";
        case PlaybackOutcome::Cancelled: return "Cancelled";
        case PlaybackOutcome::Superseded: return "Superseded";
        case PlaybackOutcome::Failed: return "Failed";
    }
    return "Unknown";
}

AudioPlaybackController::AudioPlaybackController(AudioOutput& output, std::string temp_dir,
                                                 std::chrono::milliseconds poll_interval)
    : output_(output)
    , temp_dir_(temp_dir.empty() ? voxchord::temp_dir() : std::move(temp_dir))
    , poll_interval_(poll_interval) {
}

PlaybackOutcome AudioPlaybackController::play(const std::vector<uint8_t>& audio,
                                              const CancellationToken& token) {
    if (audio.empty()) {
        std::cerr << "[Playback] No audio data" << std::endl;
        return PlaybackOutcome::Failed;
    }

    TempFile staged(make_temp_path(temp_dir_, "voxchord_playback", ".wav"));
    {
        std::ofstream file(staged.path(), std::ios::binary);
        file.write(reinterpret_cast<const char*>(audio.data()),
                   static_cast<std::streamsize>(audio.size()));
        if (!file) {
            std::cerr << "[Playback] Failed to stage audio in " << staged.path() << std::endl;
            return PlaybackOutcome::Failed;
        }
    }

    return play_file(staged.path(), token);
}

PlaybackOutcome AudioPlaybackController::play_file(const std::string& path,
                                                   const CancellationToken& token) {
    uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        generation = ++generation_;
        if (playing_) {
            std::cout << "[Playback] Stopping previous playback" << std::endl;
        }
        output_.stop();
        output_.set_volume(volume_.load());
        if (!output_.open(path)) {
            playing_ = false;
            std::cerr << "[Playback] Cannot play " << path << std::endl;
            return PlaybackOutcome::Failed;
        }
        playing_ = true;
    }

    while (true) {
        std::this_thread::sleep_for(poll_interval_);

        std::lock_guard<std::mutex> lock(mutex_);
        if (generation_ != generation) {
            return PlaybackOutcome::Superseded;
        }
        if (token.is_cancelled()) {
            output_.stop();
            playing_ = false;
            return PlaybackOutcome::Cancelled;
        }
        if (!output_.is_playing()) {
            output_.stop();
            playing_ = false;
            return PlaybackOutcome::Completed;
        }
    }
}

void AudioPlaybackController::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++generation_;
    output_.stop();
    playing_ = false;
}

bool AudioPlaybackController::is_playing() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return playing_;
}

void AudioPlaybackController::set_volume(float volume) {
    volume = std::max(0.0f, std::min(1.0f, volume));
    volume_.store(volume);
    std::lock_guard<std::mutex> lock(mutex_);
    output_.set_volume(volume);
}

} // namespace voxchord
