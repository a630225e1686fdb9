#pragma once

#include "capability_process_manager.hpp"
#include "tts_engine.hpp"

#include <chrono>
#include <mutex>
#include <string>
#include <vector>

namespace voxchord {

// Neural voices through the Python speech bridge. Each request spawns the
// bridge with --text/--voice/--speed/--output and reads the WAV it writes.
class KittenTtsEngine : public TtsEngine {
public:
    struct Options {
        std::string temp_dir;                       // Empty: system temp
        std::chrono::milliseconds timeout{30000};
        std::size_t max_text_length = 10000;
    };

    explicit KittenTtsEngine(CapabilityProvider& bridge);
    KittenTtsEngine(CapabilityProvider& bridge, Options options);

    TtsResult generate(const TtsRequest& request) override;
    bool is_available() override;
    std::vector<TtsVoice> voices() override;
    std::string engine_info() const override { return "KittenTTS (speech bridge)"; }

    static std::vector<TtsVoice> fallback_voices();

private:
    CapabilityProvider& bridge_;
    Options options_;

    std::mutex voices_mutex_;
    std::vector<TtsVoice> voices_;
};

} // namespace voxchord
