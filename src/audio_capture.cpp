#include "audio_capture.hpp"
#include "wav_file.hpp"

#include <algorithm>
#include <iostream>

namespace voxchord {

AudioCapture::AudioCapture(int sample_rate, int channels, int frames_per_buffer,
                           int max_recording_seconds)
    : sample_rate_(sample_rate)
    , channels_(channels)
    , frames_per_buffer_(frames_per_buffer)
    , max_samples_(static_cast<size_t>(sample_rate) * channels * max_recording_seconds) {
}

AudioCapture::~AudioCapture() {
    shutdown();
}

bool AudioCapture::initialize() {
    if (initialized_.load()) return true;

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        std::cerr << "[Audio] PortAudio init failed: " << Pa_GetErrorText(err) << std::endl;
        return false;
    }

    PaStreamParameters input_params;
    input_params.device = Pa_GetDefaultInputDevice();
    if (input_params.device == paNoDevice) {
        std::cerr << "[Audio] No default input device" << std::endl;
        Pa_Terminate();
        return false;
    }

    input_params.channelCount = channels_;
    input_params.sampleFormat = paFloat32;
    input_params.suggestedLatency = Pa_GetDeviceInfo(input_params.device)->defaultLowInputLatency;
    input_params.hostApiSpecificStreamInfo = nullptr;

    err = Pa_OpenStream(&stream_,
                        &input_params,
                        nullptr,  // No output
                        sample_rate_,
                        frames_per_buffer_,
                        paClipOff,
                        pa_callback,
                        this);

    if (err != paNoError) {
        std::cerr << "[Audio] Failed to open input stream: " << Pa_GetErrorText(err) << std::endl;
        Pa_Terminate();
        return false;
    }

    initialized_.store(true);
    return true;
}

void AudioCapture::shutdown() {
    if (!initialized_.load()) return;

    if (recording_.load()) stop();

    if (stream_) {
        Pa_CloseStream(stream_);
        stream_ = nullptr;
    }

    Pa_Terminate();
    initialized_.store(false);
}

bool AudioCapture::start(const std::string& output_path) {
    if (!initialized_.load()) {
        std::cerr << "[Audio] Capture not initialized" << std::endl;
        return false;
    }
    if (recording_.load()) {
        std::cerr << "[Audio] Already recording" << std::endl;
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(buffer_mutex_);
        output_path_ = output_path;
        audio_buffer_.clear();
        audio_buffer_.reserve(sample_rate_ * channels_ * 30);  // Reserve for 30 seconds
    }

    PaError err = Pa_StartStream(stream_);
    if (err != paNoError) {
        std::cerr << "[Audio] Failed to start stream: " << Pa_GetErrorText(err) << std::endl;
        return false;
    }

    recording_.store(true);
    return true;
}

bool AudioCapture::stop() {
    if (!recording_.load()) return false;

    recording_.store(false);

    PaError err = Pa_StopStream(stream_);
    if (err != paNoError) {
        std::cerr << "[Audio] Failed to stop stream: " << Pa_GetErrorText(err) << std::endl;
    }

    std::vector<float> samples;
    std::string path;
    {
        std::lock_guard<std::mutex> lock(buffer_mutex_);
        samples.swap(audio_buffer_);
        path = output_path_;
    }

    if (!write_wav(path, samples, sample_rate_, channels_)) {
        std::cerr << "[Audio] Failed to write " << path << std::endl;
        return false;
    }

    std::cout << "[Audio] Recorded " << (samples.size() / channels_) * 1000 / sample_rate_
              << "ms to " << path << std::endl;
    return true;
}

int AudioCapture::pa_callback(const void* input, void* output,
                              unsigned long frame_count,
                              const PaStreamCallbackTimeInfo* time_info,
                              PaStreamCallbackFlags status_flags,
                              void* user_data) {
    (void)output;
    (void)time_info;
    (void)status_flags;

    auto* capture = static_cast<AudioCapture*>(user_data);
    if (!capture->recording_.load() || !input) return paContinue;

    const float* in = static_cast<const float*>(input);
    const size_t count = frame_count * capture->channels_;

    std::lock_guard<std::mutex> lock(capture->buffer_mutex_);
    size_t room = capture->max_samples_ > capture->audio_buffer_.size()
                      ? capture->max_samples_ - capture->audio_buffer_.size()
                      : 0;
    capture->audio_buffer_.insert(capture->audio_buffer_.end(), in, in + std::min(count, room));

    return paContinue;
}

} // namespace voxchord
