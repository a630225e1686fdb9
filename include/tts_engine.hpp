#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace voxchord {

struct TtsRequest {
    std::string text;
    std::string voice = "expr-voice-2-f";
    float speed = 1.0f;
};

struct TtsResult {
    bool success = false;
    std::vector<uint8_t> audio_data;    // WAV bytes
    std::string error_message;
    std::chrono::milliseconds elapsed{0};
    std::string engine;

    static TtsResult failure(std::string message, std::chrono::milliseconds elapsed = {}) {
        TtsResult result;
        result.error_message = std::move(message);
        result.elapsed = elapsed;
        return result;
    }
};

struct TtsVoice {
    std::string id;
    std::string description;
    std::string language = "en";
};

class TtsEngine {
public:
    virtual ~TtsEngine() = default;

    virtual TtsResult generate(const TtsRequest& request) = 0;
    virtual bool is_available() = 0;
    virtual std::vector<TtsVoice> voices() = 0;
    virtual std::string engine_info() const = 0;
};

} // namespace voxchord
