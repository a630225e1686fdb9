#pragma once

#include "audio_recorder.hpp"

#include <atomic>
#include <mutex>
#include <string>
#include <vector>
#include <portaudio.h>

namespace voxchord {

class AudioCapture : public AudioRecorder {
public:
    AudioCapture(int sample_rate = 16000, int channels = 1, int frames_per_buffer = 512,
                 int max_recording_seconds = 120);
    ~AudioCapture() override;

    bool initialize();
    void shutdown();

    bool start(const std::string& output_path) override;
    bool stop() override;
    bool is_recording() const override { return recording_.load(); }

private:
    static int pa_callback(const void* input, void* output,
                          unsigned long frame_count,
                          const PaStreamCallbackTimeInfo* time_info,
                          PaStreamCallbackFlags status_flags,
                          void* user_data);

    int sample_rate_;
    int channels_;
    int frames_per_buffer_;
    size_t max_samples_;

    PaStream* stream_ = nullptr;
    std::atomic<bool> recording_{false};
    std::atomic<bool> initialized_{false};

    std::string output_path_;
    std::vector<float> audio_buffer_;
    std::mutex buffer_mutex_;
};

} // namespace voxchord
