#include "kitten_tts_engine.hpp"
#include "paths.hpp"
#include "text_utils.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <sstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace voxchord {

namespace {

std::string format_speed(float speed) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2) << speed;
    return out.str();
}

std::vector<uint8_t> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return {};
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(file)),
                                std::istreambuf_iterator<char>());
}

std::chrono::milliseconds since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
}

} // namespace

KittenTtsEngine::KittenTtsEngine(CapabilityProvider& bridge)
    : KittenTtsEngine(bridge, Options()) {}

KittenTtsEngine::KittenTtsEngine(CapabilityProvider& bridge, Options options)
    : bridge_(bridge), options_(std::move(options)) {
    if (options_.temp_dir.empty()) options_.temp_dir = temp_dir();
}

bool KittenTtsEngine::is_available() {
    return bridge_.is_available();
}

TtsResult KittenTtsEngine::generate(const TtsRequest& request) {
    const auto start = std::chrono::steady_clock::now();

    if (trim(request.text).empty()) {
        return TtsResult::failure("Text cannot be empty");
    }
    if (!bridge_.is_available()) {
        return TtsResult::failure("KittenTTS bridge is not available");
    }

    std::string text = request.text;
    if (utf8_length(text) > options_.max_text_length) {
        text = truncate_utf8(text, options_.max_text_length);
        std::cout << "[KittenTTS] Text truncated to " << options_.max_text_length
                  << " characters" << std::endl;
    }

    TempFile output(make_temp_path(options_.temp_dir, "voxchord_tts", ".wav"));

    // The bridge decodes --text as a JSON string literal
    std::vector<std::string> args = {
        "--text", json(text).dump(),
        "--voice", request.voice,
        "--speed", format_speed(request.speed),
        "--output", output.path(),
    };

    auto result = bridge_.invoke(args, options_.timeout);
    if (!result.success) {
        std::string error = trim(result.standard_error);
        if (error.empty()) error = "exit code " + std::to_string(result.exit_code);
        return TtsResult::failure("KittenTTS generation failed: " + error, since(start));
    }

    std::error_code ec;
    if (!fs::exists(output.path(), ec)) {
        return TtsResult::failure("KittenTTS did not produce an output file", since(start));
    }

    TtsResult tts;
    tts.audio_data = read_file(output.path());
    if (tts.audio_data.empty()) {
        return TtsResult::failure("KittenTTS produced an empty audio file", since(start));
    }
    tts.success = true;
    tts.engine = "KittenTTS";
    tts.elapsed = since(start);

    std::cout << "[KittenTTS] Generated " << tts.audio_data.size() << " bytes in "
              << tts.elapsed.count() << "ms" << std::endl;
    return tts;
}

std::vector<TtsVoice> KittenTtsEngine::voices() {
    std::lock_guard<std::mutex> lock(voices_mutex_);
    if (!voices_.empty()) return voices_;

    if (bridge_.is_available()) {
        auto result = bridge_.invoke({"--list-voices"}, options_.timeout);
        if (result.success) {
            try {
                json response = json::parse(result.standard_output);
                if (response.value("success", false) && response.contains("voices")) {
                    for (const auto& v : response["voices"]) {
                        TtsVoice voice;
                        voice.id = v.value("id", "");
                        voice.description = v.value("description", voice.id);
                        if (!voice.id.empty()) voices_.push_back(voice);
                    }
                }
            } catch (const json::exception& e) {
                std::cerr << "[KittenTTS] Failed to parse voice list: " << e.what() << std::endl;
            }
        }
    }

    if (voices_.empty()) return fallback_voices();
    return voices_;
}

std::vector<TtsVoice> KittenTtsEngine::fallback_voices() {
    std::vector<TtsVoice> list;
    for (int n = 2; n <= 5; ++n) {
        for (const char* gender : {"m", "f"}) {
            std::string id = "expr-voice-" + std::to_string(n) + "-" + gender;
            std::string description = std::string("Expressive voice ") + std::to_string(n) +
                                      (gender[0] == 'm' ? " (male)" : " (female)");
            list.push_back({id, description, "en"});
        }
    }
    return list;
}

} // namespace voxchord
