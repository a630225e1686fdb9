#pragma once

#include "config.hpp"
#include "transcription_service.hpp"

#include <mutex>
#include <string>
#include <vector>

// Forward declare whisper types
struct whisper_context;

namespace voxchord {

// Local whisper.cpp inference. Calls are serialized on the one context.
class Transcriber : public TranscriptionService {
public:
    Transcriber();
    ~Transcriber() override;

    // Initialize with model path
    bool initialize(const WhisperSettings& settings);
    void shutdown();
    bool is_initialized() const { return ctx_ != nullptr; }

    TranscriptionResult transcribe_file(const std::string& wav_path) override;

    // Transcribe audio samples (16kHz mono float)
    TranscriptionResult transcribe(const std::vector<float>& audio);

    std::string model_name() const override { return "Whisper:" + model_size_; }

    void set_language(const std::string& lang);

private:
    // Calculate confidence from token probabilities
    float calculate_confidence() const;

    whisper_context* ctx_ = nullptr;
    int n_threads_ = 4;
    std::string language_ = "auto";
    std::string model_size_;
    std::mutex mutex_;
};

} // namespace voxchord
