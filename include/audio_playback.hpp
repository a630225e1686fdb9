#pragma once

#include "cancellation.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace voxchord {

// Plays one audio file at a time
class AudioOutput {
public:
    virtual ~AudioOutput() = default;

    virtual bool open(const std::string& path) = 0;
    virtual bool is_playing() const = 0;
    virtual void stop() = 0;
    virtual void set_volume(float volume) = 0;
};

enum class PlaybackOutcome {
    Completed,
    Cancelled,      // Token cancelled
    Superseded,     // A newer play request took over
    Failed
};

const char* to_string(PlaybackOutcome outcome);

// Single-flight playback: a new request stops the one in progress. Audio
// bytes are staged in a temp file that is removed however playback ends.
class AudioPlaybackController {
public:
    AudioPlaybackController(AudioOutput& output, std::string temp_dir = "",
                            std::chrono::milliseconds poll_interval = std::chrono::milliseconds(50));

    // Blocks until playback ends
    PlaybackOutcome play(const std::vector<uint8_t>& audio, const CancellationToken& token);
    PlaybackOutcome play_file(const std::string& path, const CancellationToken& token);

    void stop();
    bool is_playing() const;

    void set_volume(float volume);
    float volume() const { return volume_.load(); }

private:
    AudioOutput& output_;
    std::string temp_dir_;
    std::chrono::milliseconds poll_interval_;

    mutable std::mutex mutex_;
    uint64_t generation_ = 0;
    bool playing_ = false;
    std::atomic<float> volume_{1.0f};
};

} // namespace voxchord
