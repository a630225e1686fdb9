#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace voxchord {

struct TranscriptionSegment {
    int64_t start_ms = 0;
    int64_t end_ms = 0;
    std::string text;
};

struct TranscriptionResult {
    bool success = false;
    std::string full_text;
    std::vector<TranscriptionSegment> segments;
    std::string language;           // Detected or forced language code
    int64_t duration_ms = 0;        // Inference time
    float confidence = 0.0f;        // Average token probability (0.0 - 1.0)
    std::string error;
};

// Speech-to-text over a recorded WAV file
class TranscriptionService {
public:
    virtual ~TranscriptionService() = default;

    virtual TranscriptionResult transcribe_file(const std::string& wav_path) = 0;
    virtual std::string model_name() const = 0;
};

} // namespace voxchord
