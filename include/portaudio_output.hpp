#pragma once

#include "audio_playback.hpp"

#include <atomic>
#include <mutex>
#include <string>
#include <vector>
#include <portaudio.h>

namespace voxchord {

// Plays WAV files on the default output device
class PortAudioOutput : public AudioOutput {
public:
    PortAudioOutput() = default;
    ~PortAudioOutput() override;

    bool initialize();
    void shutdown();

    bool open(const std::string& path) override;
    bool is_playing() const override;
    void stop() override;
    void set_volume(float volume) override { volume_.store(volume); }

private:
    static int pa_callback(const void* input, void* output,
                          unsigned long frame_count,
                          const PaStreamCallbackTimeInfo* time_info,
                          PaStreamCallbackFlags status_flags,
                          void* user_data);

    void close_stream();

    PaStream* stream_ = nullptr;
    std::atomic<bool> initialized_{false};
    std::atomic<float> volume_{1.0f};

    std::vector<float> samples_;
    int channels_ = 1;
    std::atomic<size_t> position_{0};
    mutable std::mutex mutex_;
};

} // namespace voxchord
