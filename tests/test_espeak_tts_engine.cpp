// Tests for the native speech engine, driven by a shell script standing in
// for espeak-ng

#include "espeak_tts_engine.hpp"
#include "test_fakes.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

using namespace voxchord;
using namespace voxchord::testing;

namespace fs = std::filesystem;

// Logs every call next to itself; -w gets a tiny WAV
const char* FAKE_ESPEAK = R"(#!/bin/sh
log="$(dirname "$0")/calls.log"
case "$1" in
    --version)
        echo "eSpeak NG text-to-speech: 1.51"
        exit 0
        ;;
    --voices)
        echo "voices" >> "$log"
        echo "Pty Language       Age/Gender VoiceName          File                 Other Languages"
        echo " 5  af              --/M      Afrikaans          gmw/af"
        echo " 2  en-us           --/M      English_(America)  gmw/en-US"
        echo " 5  fr-fr           --/M      French_(France)    roa/fr"
        exit 0
        ;;
esac
echo "speak $*" >> "$log"
out=""
while [ $# -gt 0 ]; do
    if [ "$1" = "-w" ]; then
        out="$2"
        shift
    fi
    shift
done
printf 'RIFFfakewav' > "$out"
)";

std::vector<std::string> read_calls(const std::string& dir) {
    std::ifstream log(fs::path(dir) / "calls.log");
    std::vector<std::string> calls;
    std::string line;
    while (std::getline(log, line)) calls.push_back(line);
    return calls;
}

EspeakTtsEngine::Options fake_options(const std::string& dir) {
    const fs::path script = fs::path(dir) / "fake-espeak";
    {
        std::ofstream out(script);
        out << FAKE_ESPEAK;
    }
    fs::permissions(script, fs::perms::owner_all, fs::perm_options::replace);

    EspeakTtsEngine::Options options;
    options.executables = {"/nonexistent/espeak-ng", script.string()};
    options.temp_dir = dir;
    options.timeout = std::chrono::milliseconds(5000);
    return options;
}

void test_map_voice() {
    std::cout << "Testing voice mapping..." << std::endl;

    const std::vector<TtsVoice> installed = {
        {"en-us", "English_(America)", "en-us"},
        {"fr-fr", "French_(France)", "fr-fr"}
    };

    assert(EspeakTtsEngine::map_voice("", installed) == "en");
    assert(EspeakTtsEngine::map_voice("expr-voice-2-m", installed) == "en+m3");
    assert(EspeakTtsEngine::map_voice("expr-voice-5-f", installed) == "en+f3");
    assert(EspeakTtsEngine::map_voice("fr-fr", installed) == "fr-fr");
    assert(EspeakTtsEngine::map_voice("fr-fr+f2", installed) == "fr-fr+f2" && "Variant suffix kept");
    assert(EspeakTtsEngine::map_voice("French_(France)", installed) == "French_(France)");
    assert(EspeakTtsEngine::map_voice("en+m3", installed) == "en+m3");

    assert(EspeakTtsEngine::map_voice("klingon", installed) == "en");
    assert(EspeakTtsEngine::map_voice("af", installed) == "en" && "Only installed voices pass");
    assert(EspeakTtsEngine::map_voice("fr-fr", {}) == "en");

    std::cout << "  PASS: Unknown ids fall back to en" << std::endl;
}

void test_unknown_voice_still_speaks() {
    std::cout << "Testing unknown voice synthesis..." << std::endl;

    std::string dir = make_test_dir("espeak_unknown_voice");
    EspeakTtsEngine engine(fake_options(dir));
    assert(engine.is_available());

    TtsRequest request;
    request.text = "-- leading dashes are text";
    request.voice = "no-such-voice";
    TtsResult result = engine.generate(request);
    assert(result.success);
    assert(result.engine == "eSpeak");
    assert(std::string(result.audio_data.begin(), result.audio_data.end()) == "RIFFfakewav");

    request.voice = "fr-fr";
    assert(engine.generate(request).success);

    auto calls = read_calls(dir);
    assert(calls.size() == 3 && "Voices listed once for both requests");
    assert(calls[0] == "voices");
    assert(calls[1].find("-v en ") != std::string::npos);
    assert(calls[2].find("-v fr-fr ") != std::string::npos);

    auto voices = engine.voices();
    assert(voices.size() == 3);
    assert(voices[1].id == "en-us");
    assert(voices[1].description == "English_(America)");
    assert(read_calls(dir).size() == 3);

    for (const auto& entry : fs::directory_iterator(dir)) {
        const std::string ext = entry.path().extension().string();
        assert(ext != ".wav" && ext != ".txt" && "Temp files removed");
    }

    fs::remove_all(dir);
    std::cout << "  PASS: Bad voice id spoken with en" << std::endl;
}

void test_missing_executable() {
    std::cout << "Testing missing espeak..." << std::endl;

    EspeakTtsEngine::Options options;
    options.executables = {"/nonexistent/espeak-ng", "/nonexistent/espeak"};
    EspeakTtsEngine engine(options);

    assert(!engine.is_available());
    TtsRequest request;
    request.text = "hello";
    TtsResult result = engine.generate(request);
    assert(!result.success);
    assert(result.error_message == "espeak-ng is not installed");

    auto voices = engine.voices();
    assert(voices.size() == 1 && voices[0].id == "en");

    std::cout << "  PASS: Typed failure without an executable" << std::endl;
}

int main() {
    std::cout << "=== eSpeak Engine Test Suite ===" << std::endl;

    test_map_voice();
    test_unknown_voice_still_speaks();
    test_missing_executable();

    std::cout << "\n=== All Tests Passed! ===" << std::endl;
    return 0;
}
