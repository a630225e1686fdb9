#pragma once

#include "process_runner.hpp"
#include "tts_engine.hpp"

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace voxchord {

// Native speech through espeak-ng (or classic espeak) writing a WAV file
class EspeakTtsEngine : public TtsEngine {
public:
    struct Options {
        std::vector<std::string> executables{"espeak-ng", "espeak"};
        std::string temp_dir;
        std::chrono::milliseconds timeout{30000};
    };

    EspeakTtsEngine();
    explicit EspeakTtsEngine(Options options, ProcessRunner runner = ProcessRunner());

    TtsResult generate(const TtsRequest& request) override;
    bool is_available() override;
    std::vector<TtsVoice> voices() override;
    std::string engine_info() const override { return "eSpeak NG (native)"; }

    // Bridge voice ids ("expr-voice-2-f") map onto an English variant. Other
    // ids pass through when `installed` lists them (by language or voice name,
    // ignoring a "+variant" suffix) and otherwise become "en".
    static std::string map_voice(const std::string& voice, const std::vector<TtsVoice>& installed);
    static int words_per_minute(float speed);

private:
    std::string executable();

    // Parsed `--voices` output, listed once
    std::vector<TtsVoice> installed_voices();

    Options options_;
    ProcessRunner runner_;

    std::mutex mutex_;
    std::optional<std::string> executable_;

    std::mutex voices_mutex_;
    std::optional<std::vector<TtsVoice>> installed_;
};

} // namespace voxchord
