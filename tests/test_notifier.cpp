// Tests for result notifications

#include "notifier.hpp"
#include "test_fakes.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace voxchord;
using namespace voxchord::testing;

namespace fs = std::filesystem;

const auto POLL = std::chrono::milliseconds(5);

NotificationSettings sound_settings(const std::string& sound_path) {
    NotificationSettings settings;
    settings.enabled = true;
    settings.sound_path = sound_path;
    settings.volume = 0.3f;
    return settings;
}

void test_wants_sound() {
    std::cout << "Testing sound selection..." << std::endl;

    NotificationSettings settings = sound_settings("/usr/share/sounds/done.wav");
    assert(Notifier::wants_sound(settings, PipelineMode::Transcribe));
    assert(Notifier::wants_sound(settings, PipelineMode::PromptLLM));
    assert(Notifier::wants_sound(settings, PipelineMode::SpeechVision));
    assert(!Notifier::wants_sound(settings, PipelineMode::ClipboardTts) && "Speech is its own feedback");

    settings.on_speech_to_text = false;
    assert(!Notifier::wants_sound(settings, PipelineMode::Transcribe));
    assert(Notifier::wants_sound(settings, PipelineMode::VisionCapture));

    settings.on_llm_response = false;
    assert(!Notifier::wants_sound(settings, PipelineMode::ClipboardPromptLLM));

    NotificationSettings disabled = sound_settings("/usr/share/sounds/done.wav");
    disabled.enabled = false;
    assert(!Notifier::wants_sound(disabled, PipelineMode::Transcribe));
    assert(!Notifier::wants_sound(sound_settings(""), PipelineMode::Transcribe));

    std::cout << "  PASS: Sound follows the per-mode switches" << std::endl;
}

void test_sound_played_on_success() {
    std::cout << "Testing notification sound..." << std::endl;

    std::string dir = make_test_dir("notifier_sound");
    std::string sound_path = (fs::path(dir) / "done.wav").string();
    assert(write_wav(sound_path, std::vector<float>(160, 0.1f), 16000, 1));

    FakeAudioOutput output;
    output.duration = std::chrono::milliseconds(20);
    AudioPlaybackController controller(output, dir, POLL);

    NotificationSettings settings = sound_settings(sound_path);
    settings.volume = 3.0f;
    Notifier notifier(&controller, settings);

    notifier.notify(PipelineEvent::completed(PipelineMode::Transcribe, "hello world"));
    assert(output.open_calls == 1);
    assert(output.opened_paths[0] == sound_path);
    assert(controller.volume() == 1.0f && "Volume clamped");
    assert(fs::exists(sound_path) && "Sound file is not consumed");

    // Failures and modes without a sound stay silent
    notifier.notify(PipelineEvent::failed(PipelineMode::PromptLLM, ErrorKind::Llm, "HTTP 500"));
    notifier.notify(PipelineEvent::completed(PipelineMode::ClipboardTts, ""));
    assert(output.open_calls == 1);

    settings.volume = 0.25f;
    settings.on_llm_response = false;
    notifier.update_settings(settings);
    notifier.notify(PipelineEvent::completed(PipelineMode::PromptLLM, "answer"));
    assert(output.open_calls == 1);
    notifier.notify(PipelineEvent::completed(PipelineMode::Transcribe, "again"));
    assert(output.open_calls == 2);
    assert(controller.volume() == 0.25f);

    fs::remove_all(dir);
    std::cout << "  PASS: Sound played only for wanted successes" << std::endl;
}

void test_missing_sound_or_device() {
    std::cout << "Testing missing sound..." << std::endl;

    std::string dir = make_test_dir("notifier_missing");
    FakeAudioOutput output;
    AudioPlaybackController controller(output, dir, POLL);

    Notifier notifier(&controller, sound_settings((fs::path(dir) / "absent.wav").string()));
    notifier.notify(PipelineEvent::completed(PipelineMode::Transcribe, "text"));
    assert(output.open_calls == 0);

    // No output device at all
    Notifier silent(nullptr, sound_settings((fs::path(dir) / "absent.wav").string()));
    silent.notify(PipelineEvent::completed(PipelineMode::Transcribe, "text"));
    silent.notify(PipelineEvent::failed(std::nullopt, ErrorKind::HotkeyInfrastructure, "no keyboard"));

    fs::remove_all(dir);
    std::cout << "  PASS: Absent sound file or device is skipped" << std::endl;
}

void test_cancel_stops_sound() {
    std::cout << "Testing notification cancel..." << std::endl;

    std::string dir = make_test_dir("notifier_cancel");
    std::string sound_path = (fs::path(dir) / "long.wav").string();
    assert(write_wav(sound_path, std::vector<float>(160, 0.1f), 16000, 1));

    FakeAudioOutput output;
    output.duration = std::chrono::seconds(30);
    AudioPlaybackController controller(output, dir, POLL);
    Notifier notifier(&controller, sound_settings(sound_path));

    std::thread player([&] {
        notifier.notify(PipelineEvent::completed(PipelineMode::Transcribe, "long"));
    });
    while (!controller.is_playing()) {
        std::this_thread::sleep_for(POLL);
    }

    const auto start = std::chrono::steady_clock::now();
    notifier.cancel();
    player.join();
    assert(std::chrono::steady_clock::now() - start < std::chrono::seconds(5));
    assert(!controller.is_playing());

    fs::remove_all(dir);
    std::cout << "  PASS: Cancel ends the sound early" << std::endl;
}

int main() {
    std::cout << "=== Notifier Test Suite ===" << std::endl;

    test_wants_sound();
    test_sound_played_on_success();
    test_missing_sound_or_device();
    test_cancel_stops_sound();

    std::cout << "\n=== All Tests Passed! ===" << std::endl;
    return 0;
}
