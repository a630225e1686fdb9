// Tests for the speech bridge locator and the KittenTTS engine, driven by
// shell scripts standing in for the interpreter and the bridge

#include "capability_process_manager.hpp"
#include "kitten_tts_engine.hpp"
#include "test_fakes.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

using namespace voxchord;
using namespace voxchord::testing;

namespace fs = std::filesystem;

// Answers --version like Python, runs everything else with /bin/sh
const char* FAKE_INTERPRETER = R"(#!/bin/sh
if [ "$1" = "--version" ]; then
    echo version >> "$(dirname "$0")/version_checks.log"
    echo "Python 3.11.4"
    exit 0
fi
exec /bin/sh "$@"
)";

const char* FAKE_BRIDGE = R"(
case "$1" in
    --list-voices)
        echo '{"success": true, "voices": [{"id": "expr-voice-2-f", "description": "Calm"}, {"id": "expr-voice-4-m", "description": "Bright"}]}'
        ;;
    --text)
        while [ $# -gt 0 ]; do
            if [ "$1" = "--output" ]; then
                printf 'RIFFfakewavdata' > "$2"
                shift
            fi
            shift
        done
        echo '{"success": true}'
        ;;
    *)
        echo "unknown command" >&2
        exit 2
        ;;
esac
)";

void write_file(const fs::path& path, const std::string& content, bool executable = false) {
    std::ofstream out(path);
    out << content;
    out.close();
    if (executable) {
        fs::permissions(path, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec,
                        fs::perm_options::replace);
    }
}

int version_check_count(const std::string& dir) {
    std::ifstream log(fs::path(dir) / "version_checks.log");
    int count = 0;
    std::string line;
    while (std::getline(log, line)) ++count;
    return count;
}

struct BridgeFixture {
    explicit BridgeFixture(const std::string& name, const char* bridge = FAKE_BRIDGE)
        : dir(make_test_dir(name)) {
        interpreter = (fs::path(dir) / "fake-python").string();
        write_file(interpreter, FAKE_INTERPRETER, true);
        if (bridge) write_file(fs::path(dir) / "kitten_tts_bridge.py", bridge);
    }

    ~BridgeFixture() { fs::remove_all(dir); }

    CapabilityProcessManager::Options options() const {
        CapabilityProcessManager::Options o;
        o.interpreter = interpreter;
        o.scripts_dir = dir;
        o.system_interpreters.clear();
        return o;
    }

    std::string dir;
    std::string interpreter;
};

void test_availability_is_cached() {
    std::cout << "Testing bridge discovery..." << std::endl;

    BridgeFixture fixture("bridge_cached");
    CapabilityProcessManager manager(fixture.options());

    assert(manager.is_available());
    assert(manager.interpreter() == fixture.interpreter);
    assert(manager.is_available());
    assert(version_check_count(fixture.dir) == 1 && "Interpreter checked once");

    manager.reset();
    assert(manager.is_available());
    assert(version_check_count(fixture.dir) == 2 && "Reset forces a new search");

    std::cout << "  PASS: Interpreter located once and reused" << std::endl;
}

void test_candidates_tried_in_order() {
    std::cout << "Testing interpreter search order..." << std::endl;

    BridgeFixture fixture("bridge_order");
    auto options = fixture.options();
    options.interpreter = "/nonexistent/python3";
    options.system_interpreters = {fixture.interpreter};

    CapabilityProcessManager manager(options);
    assert(manager.is_available());
    assert(manager.interpreter() == fixture.interpreter);

    std::cout << "  PASS: Broken configured interpreter skipped" << std::endl;
}

void test_missing_or_broken_bridge() {
    std::cout << "Testing unusable bridge..." << std::endl;

    {
        BridgeFixture fixture("bridge_missing", nullptr);
        CapabilityProcessManager manager(fixture.options());
        assert(!manager.is_available());
        assert(version_check_count(fixture.dir) == 0 && "No probing without a script");

        auto result = manager.invoke({"--list-voices"}, std::chrono::seconds(5));
        assert(!result.success);
        assert(result.standard_error.find("not available") != std::string::npos);
    }
    {
        BridgeFixture fixture("bridge_garbage", "echo 'not json'\n");
        CapabilityProcessManager manager(fixture.options());
        assert(!manager.is_available() && "Voice list must parse");
    }

    std::cout << "  PASS: Missing script and bad voice list mean unavailable" << std::endl;
}

void test_kitten_generates_audio() {
    std::cout << "Testing KittenTTS generation..." << std::endl;

    BridgeFixture fixture("bridge_generate");
    CapabilityProcessManager manager(fixture.options());

    KittenTtsEngine::Options engine_options;
    engine_options.temp_dir = fixture.dir;
    KittenTtsEngine engine(manager, engine_options);

    TtsRequest request;
    request.text = "Read this \"quoted\" line aloud";
    TtsResult result = engine.generate(request);
    assert(result.success);
    assert(result.engine == "KittenTTS");
    assert(std::string(result.audio_data.begin(), result.audio_data.end()) == "RIFFfakewavdata");

    for (const auto& entry : fs::directory_iterator(fixture.dir)) {
        assert(entry.path().extension() != ".wav" && "Output file removed after reading");
    }

    TtsRequest blank;
    blank.text = "   ";
    TtsResult rejected = engine.generate(blank);
    assert(!rejected.success);
    assert(rejected.error_message == "Text cannot be empty");

    std::cout << "  PASS: Bridge output read and temp file removed" << std::endl;
}

void test_kitten_voices() {
    std::cout << "Testing voice listing..." << std::endl;

    {
        BridgeFixture fixture("bridge_voices");
        CapabilityProcessManager manager(fixture.options());
        KittenTtsEngine engine(manager);

        auto voices = engine.voices();
        assert(voices.size() == 2);
        assert(voices[0].id == "expr-voice-2-f");
        assert(voices[1].description == "Bright");
    }
    {
        BridgeFixture fixture("bridge_no_voices", nullptr);
        CapabilityProcessManager manager(fixture.options());
        KittenTtsEngine engine(manager);

        auto voices = engine.voices();
        assert(voices.size() == 8);
        assert(voices.size() == KittenTtsEngine::fallback_voices().size());
        assert(voices.front().id == "expr-voice-2-m");
        assert(voices.back().id == "expr-voice-5-f");
    }

    std::cout << "  PASS: Voices parsed, built-in list when unavailable" << std::endl;
}

int main() {
    std::cout << "=== Capability Process Manager Test Suite ===" << std::endl;

    test_availability_is_cached();
    test_candidates_tried_in_order();
    test_missing_or_broken_bridge();
    test_kitten_generates_audio();
    test_kitten_voices();

    std::cout << "\n=== All Tests Passed! ===" << std::endl;
    return 0;
}
