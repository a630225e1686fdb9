// Tests for recording session lifecycle and hand-off

#include "recording_session_manager.hpp"
#include "test_fakes.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

using namespace voxchord;
using namespace voxchord::testing;

namespace fs = std::filesystem;

class CollectingHandler : public SessionHandler {
public:
    void run(RecordingSession session) override {
        std::lock_guard<std::mutex> lock(mutex);
        sessions.push_back(std::move(session));
    }

    std::mutex mutex;
    std::vector<RecordingSession> sessions;
};

struct Harness {
    explicit Harness(const std::string& name)
        : dir(make_test_dir(name))
        , manager(recorder, clipboard, executor, handler, options(dir)) {
        manager.set_event_sink([this](const PipelineEvent& e) {
            std::lock_guard<std::mutex> lock(mutex);
            events.push_back(e);
        });
        manager.set_state_callback([this](AppState s) {
            std::lock_guard<std::mutex> lock(mutex);
            states.push_back(s);
        });
    }

    ~Harness() {
        manager.shutdown();
        executor.shutdown();
        fs::remove_all(dir);
    }

    // Session control first: its hand-offs land on the executor
    void settle() {
        manager.wait_idle();
        executor.wait_idle();
    }

    static RecordingSessionManager::Options options(const std::string& dir) {
        RecordingSessionManager::Options o;
        o.temp_dir = dir;
        o.release_grace = std::chrono::milliseconds(0);
        return o;
    }

    std::string dir;
    FakeRecorder recorder;
    FakeClipboard clipboard;
    TaskExecutor executor{2};
    CollectingHandler handler;
    RecordingSessionManager manager;

    std::mutex mutex;
    std::vector<PipelineEvent> events;
    std::vector<AppState> states;
};

void test_press_release_hands_off_recording() {
    std::cout << "Testing record and hand-off..." << std::endl;

    Harness h("session_handoff");
    h.manager.on_mode_start(PipelineMode::Transcribe);
    h.settle();
    assert(h.manager.has_active_session());
    assert(h.manager.active_mode() == PipelineMode::Transcribe);
    assert(h.recorder.is_recording());

    h.manager.on_mode_end(PipelineMode::Transcribe);
    h.settle();

    assert(!h.manager.has_active_session());
    assert(h.handler.sessions.size() == 1);
    const RecordingSession& session = h.handler.sessions[0];
    assert(session.mode == PipelineMode::Transcribe);
    assert(session.audio_path == h.recorder.last_path());
    assert(fs::path(session.audio_path).parent_path() == fs::path(h.dir));
    assert(fs::file_size(session.audio_path) > WAV_HEADER_SIZE + 1024);
    assert(h.events.empty());

    assert(h.states.size() == 2);
    assert(h.states[0] == AppState::Recording);
    assert(h.states[1] == AppState::Processing);

    std::cout << "  PASS: Recording handed to the pipeline" << std::endl;
}

void test_short_recording_is_discarded() {
    std::cout << "Testing empty recording..." << std::endl;

    Harness h("session_short");
    h.recorder.samples = 10;

    h.manager.on_mode_start(PipelineMode::PromptLLM);
    h.manager.on_mode_end(PipelineMode::PromptLLM);
    h.settle();

    assert(h.handler.sessions.empty());
    assert(h.events.size() == 1);
    assert(!h.events[0].success);
    assert(h.events[0].error_kind == ErrorKind::Recording);
    assert(h.events[0].message == "No audio captured");
    assert(!fs::exists(h.recorder.last_path()) && "Short recording is deleted");

    std::cout << "  PASS: Near-empty WAV rejected and deleted" << std::endl;
}

void test_second_mode_ignored_while_recording() {
    std::cout << "Testing overlapping modes..." << std::endl;

    Harness h("session_overlap");
    h.manager.on_mode_start(PipelineMode::Transcribe);
    h.manager.on_mode_start(PipelineMode::PromptLLM);
    h.manager.on_mode_end(PipelineMode::PromptLLM);
    h.settle();

    assert(h.recorder.start_calls.load() == 1);
    assert(h.manager.active_mode() == PipelineMode::Transcribe && "Mismatched end keeps recording");

    h.manager.on_mode_end(PipelineMode::Transcribe);
    h.settle();

    assert(h.handler.sessions.size() == 1);
    assert(h.handler.sessions[0].mode == PipelineMode::Transcribe);

    std::cout << "  PASS: Only the first mode records" << std::endl;
}

void test_clipboard_snapshot_taken_on_press() {
    std::cout << "Testing clipboard snapshot..." << std::endl;

    Harness h("session_clipboard");
    h.clipboard.set_text("Bonjour le monde");

    h.manager.on_mode_start(PipelineMode::ClipboardPromptLLM);
    h.settle();
    h.clipboard.set_text("changed while recording");
    h.manager.on_mode_end(PipelineMode::ClipboardPromptLLM);
    h.settle();

    assert(h.handler.sessions.size() == 1);
    assert(h.handler.sessions[0].clipboard_snapshot == "Bonjour le monde");

    // Plain prompt mode does not read the clipboard
    int reads = h.clipboard.get_calls.load();
    h.manager.on_mode_start(PipelineMode::PromptLLM);
    h.manager.on_mode_end(PipelineMode::PromptLLM);
    h.settle();
    assert(h.clipboard.get_calls.load() == reads);
    assert(h.handler.sessions.size() == 2);
    assert(h.handler.sessions[1].clipboard_snapshot.empty());

    std::cout << "  PASS: Clipboard captured when the chord went down" << std::endl;
}

void test_instant_modes_skip_recording() {
    std::cout << "Testing instant modes..." << std::endl;

    Harness h("session_instant");
    h.manager.on_mode_start(PipelineMode::VisionCapture);
    h.settle();

    assert(h.recorder.start_calls.load() == 0);
    assert(h.handler.sessions.size() == 1);
    assert(h.handler.sessions[0].mode == PipelineMode::VisionCapture);
    assert(h.handler.sessions[0].audio_path.empty());

    // The release carries no work
    h.manager.on_mode_end(PipelineMode::VisionCapture);
    h.manager.on_mode_start(PipelineMode::ClipboardTts);
    h.settle();
    assert(h.handler.sessions.size() == 2);
    assert(h.handler.sessions[1].mode == PipelineMode::ClipboardTts);

    std::cout << "  PASS: Vision and clipboard speech run on press" << std::endl;
}

void test_cancel_discards_session() {
    std::cout << "Testing session cancellation..." << std::endl;

    Harness h("session_cancel");
    h.manager.on_mode_start(PipelineMode::SpeechVision);
    h.settle();
    assert(h.manager.has_active_session());

    h.manager.cancel_current();
    h.settle();

    assert(!h.manager.has_active_session());
    assert(!h.recorder.is_recording());
    assert(!fs::exists(h.recorder.last_path()));

    // The late release is a no-op
    h.manager.on_mode_end(PipelineMode::SpeechVision);
    h.settle();
    assert(h.handler.sessions.empty());

    std::cout << "  PASS: Cancelled session is dropped with its file" << std::endl;
}

void test_recorder_failure_reported() {
    std::cout << "Testing recorder failure..." << std::endl;

    Harness h("session_fail");
    h.recorder.fail_start = true;

    h.manager.on_mode_start(PipelineMode::Transcribe);
    h.settle();

    assert(!h.manager.has_active_session());
    assert(h.events.size() == 1);
    assert(h.events[0].error_kind == ErrorKind::Recording);
    assert(h.events[0].mode == PipelineMode::Transcribe);

    std::cout << "  PASS: Start failure becomes a Recording event" << std::endl;
}

void test_capture_starts_while_pipelines_busy() {
    std::cout << "Testing capture with a busy pool..." << std::endl;

    Harness h("session_busy_pool");

    // Occupy every pipeline worker until released
    std::atomic<bool> release{false};
    std::atomic<int> blocked{0};
    for (int i = 0; i < 2; ++i) {
        h.executor.post("slow-pipeline", [&] {
            blocked.fetch_add(1);
            while (!release.load()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
        });
    }
    while (blocked.load() < 2) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    const auto pressed = std::chrono::steady_clock::now();
    h.manager.on_mode_start(PipelineMode::Transcribe);
    h.manager.wait_idle();
    const auto waited = std::chrono::steady_clock::now() - pressed;

    assert(h.recorder.is_recording() && "Microphone opened without a free worker");
    assert(h.recorder.start_calls.load() == 1);
    assert(waited < std::chrono::milliseconds(500));

    h.manager.on_mode_end(PipelineMode::Transcribe);
    h.manager.wait_idle();
    assert(!h.recorder.is_recording());
    assert(h.handler.sessions.empty() && "Hand-off waits for a worker");

    release.store(true);
    h.settle();
    assert(h.handler.sessions.size() == 1);

    std::cout << "  PASS: Recording started and stopped while every worker was busy" << std::endl;
}

int main() {
    std::cout << "=== Recording Session Manager Test Suite ===" << std::endl;

    test_press_release_hands_off_recording();
    test_short_recording_is_discarded();
    test_second_mode_ignored_while_recording();
    test_clipboard_snapshot_taken_on_press();
    test_instant_modes_skip_recording();
    test_cancel_discards_session();
    test_recorder_failure_reported();
    test_capture_starts_while_pipelines_busy();

    std::cout << "\n=== All Tests Passed! ===" << std::endl;
    return 0;
}
