#include "portaudio_output.hpp"
#include "wav_file.hpp"

#include <algorithm>
#include <cstring>
#include <iostream>

namespace voxchord {

PortAudioOutput::~PortAudioOutput() {
    shutdown();
}

bool PortAudioOutput::initialize() {
    if (initialized_.load()) return true;

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        std::cerr << "[Playback] PortAudio init failed: " << Pa_GetErrorText(err) << std::endl;
        return false;
    }
    if (Pa_GetDefaultOutputDevice() == paNoDevice) {
        std::cerr << "[Playback] No default output device" << std::endl;
        Pa_Terminate();
        return false;
    }

    initialized_.store(true);
    return true;
}

void PortAudioOutput::shutdown() {
    if (!initialized_.load()) return;
    stop();
    Pa_Terminate();
    initialized_.store(false);
}

bool PortAudioOutput::open(const std::string& path) {
    if (!initialized_.load()) {
        std::cerr << "[Playback] Output not initialized" << std::endl;
        return false;
    }

    WavData wav;
    std::string error;
    if (!read_wav(path, wav, error)) {
        std::cerr << "[Playback] " << error << std::endl;
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    close_stream();

    samples_ = std::move(wav.samples);
    channels_ = wav.channels;
    position_.store(0);

    PaError err = Pa_OpenDefaultStream(&stream_,
                                       0,           // No input
                                       channels_,
                                       paFloat32,
                                       wav.sample_rate,
                                       paFramesPerBufferUnspecified,
                                       pa_callback,
                                       this);
    if (err != paNoError) {
        std::cerr << "[Playback] Failed to open output stream: " << Pa_GetErrorText(err) << std::endl;
        stream_ = nullptr;
        return false;
    }

    err = Pa_StartStream(stream_);
    if (err != paNoError) {
        std::cerr << "[Playback] Failed to start output stream: " << Pa_GetErrorText(err) << std::endl;
        close_stream();
        return false;
    }
    return true;
}

bool PortAudioOutput::is_playing() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stream_ && Pa_IsStreamActive(stream_) == 1;
}

void PortAudioOutput::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    close_stream();
}

void PortAudioOutput::close_stream() {
    if (!stream_) return;
    Pa_AbortStream(stream_);
    Pa_CloseStream(stream_);
    stream_ = nullptr;
    samples_.clear();
    position_.store(0);
}

int PortAudioOutput::pa_callback(const void* input, void* output,
                                 unsigned long frame_count,
                                 const PaStreamCallbackTimeInfo* time_info,
                                 PaStreamCallbackFlags status_flags,
                                 void* user_data) {
    (void)input;
    (void)time_info;
    (void)status_flags;

    auto* self = static_cast<PortAudioOutput*>(user_data);
    float* out = static_cast<float*>(output);

    const size_t wanted = frame_count * self->channels_;
    const size_t pos = self->position_.load();
    const size_t available = self->samples_.size() > pos ? self->samples_.size() - pos : 0;
    const size_t n = std::min(wanted, available);
    const float volume = self->volume_.load();

    for (size_t i = 0; i < n; ++i) {
        out[i] = self->samples_[pos + i] * volume;
    }
    std::memset(out + n, 0, (wanted - n) * sizeof(float));
    self->position_.store(pos + n);

    return n < wanted ? paComplete : paContinue;
}

} // namespace voxchord
