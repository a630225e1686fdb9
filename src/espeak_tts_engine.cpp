#include "espeak_tts_engine.hpp"
#include "paths.hpp"
#include "text_utils.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>

namespace fs = std::filesystem;

namespace voxchord {

namespace {

constexpr int BASE_WPM = 175;

std::chrono::milliseconds since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
}

} // namespace

EspeakTtsEngine::EspeakTtsEngine() : EspeakTtsEngine(Options()) {}

EspeakTtsEngine::EspeakTtsEngine(Options options, ProcessRunner runner)
    : options_(std::move(options)), runner_(runner) {
    if (options_.temp_dir.empty()) options_.temp_dir = temp_dir();
}

std::string EspeakTtsEngine::executable() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!executable_) {
        executable_ = std::string();
        for (const auto& candidate : options_.executables) {
            if (runner_.run({candidate, "--version"}, std::chrono::milliseconds(5000)).success) {
                executable_ = candidate;
                std::cout << "[eSpeak] Using " << candidate << std::endl;
                break;
            }
        }
        if (executable_->empty()) {
            std::cerr << "[eSpeak] Neither espeak-ng nor espeak found" << std::endl;
        }
    }
    return *executable_;
}

bool EspeakTtsEngine::is_available() {
    return !executable().empty();
}

std::string EspeakTtsEngine::map_voice(const std::string& voice,
                                       const std::vector<TtsVoice>& installed) {
    if (voice.empty()) return "en";
    if (voice.rfind("expr-voice", 0) == 0) {
        if (voice.size() >= 2 && voice.compare(voice.size() - 2, 2, "-m") == 0) return "en+m3";
        if (voice.size() >= 2 && voice.compare(voice.size() - 2, 2, "-f") == 0) return "en+f3";
        return "en";
    }

    const std::string base = to_lower(voice.substr(0, voice.find('+')));
    if (base == "en") return voice;
    for (const auto& known : installed) {
        if (to_lower(known.id) == base || to_lower(known.description) == base) return voice;
    }
    std::cerr << "[eSpeak] Unknown voice \"" << voice << "\", using en" << std::endl;
    return "en";
}

int EspeakTtsEngine::words_per_minute(float speed) {
    int wpm = static_cast<int>(BASE_WPM * speed);
    return std::max(80, std::min(450, wpm));
}

TtsResult EspeakTtsEngine::generate(const TtsRequest& request) {
    const auto start = std::chrono::steady_clock::now();

    if (trim(request.text).empty()) {
        return TtsResult::failure("Text cannot be empty");
    }

    std::string exe = executable();
    if (exe.empty()) {
        return TtsResult::failure("espeak-ng is not installed");
    }

    // Text goes through a file so leading dashes are never read as options
    TempFile text_file(make_temp_path(options_.temp_dir, "voxchord_tts_text", ".txt"));
    {
        std::ofstream out(text_file.path(), std::ios::binary);
        out << request.text;
        if (!out) {
            return TtsResult::failure("Failed to write text for espeak", since(start));
        }
    }

    TempFile output(make_temp_path(options_.temp_dir, "voxchord_tts", ".wav"));
    auto result = runner_.run({exe,
                               "-v", map_voice(request.voice, installed_voices()),
                               "-s", std::to_string(words_per_minute(request.speed)),
                               "-w", output.path(),
                               "-f", text_file.path()},
                              options_.timeout);
    if (!result.success) {
        std::string error = trim(result.standard_error);
        if (error.empty()) error = "exit code " + std::to_string(result.exit_code);
        return TtsResult::failure("espeak failed: " + error, since(start));
    }

    std::ifstream file(output.path(), std::ios::binary);
    TtsResult tts;
    tts.audio_data.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    if (tts.audio_data.empty()) {
        return TtsResult::failure("espeak produced no audio", since(start));
    }
    tts.success = true;
    tts.engine = "eSpeak";
    tts.elapsed = since(start);
    return tts;
}

std::vector<TtsVoice> EspeakTtsEngine::installed_voices() {
    std::lock_guard<std::mutex> lock(voices_mutex_);
    if (installed_) return *installed_;

    std::vector<TtsVoice> list;
    std::string exe = executable();
    if (exe.empty()) return list;

    auto result = runner_.run({exe, "--voices"}, options_.timeout);
    if (!result.success) {
        installed_ = list;
        return list;
    }

    // "Pty Language Age/Gender VoiceName File Other Languages"
    std::istringstream lines(result.standard_output);
    std::string line;
    std::getline(lines, line);  // header
    while (std::getline(lines, line)) {
        std::istringstream fields(line);
        std::string pty, language, gender, name;
        if (!(fields >> pty >> language >> gender >> name)) continue;
        list.push_back({language, name, language});
    }
    installed_ = list;
    return list;
}

std::vector<TtsVoice> EspeakTtsEngine::voices() {
    std::vector<TtsVoice> list = installed_voices();
    if (list.empty()) {
        list.push_back({"en", "English", "en"});
    }
    return list;
}

} // namespace voxchord
