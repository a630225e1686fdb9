#pragma once

#include "config.hpp"
#include "audio_capture.hpp"
#include "audio_playback.hpp"
#include "capability_process_manager.hpp"
#include "clipboard.hpp"
#include "clipboard_speaker.hpp"
#include "espeak_tts_engine.hpp"
#include "events.hpp"
#include "hotkey_manager.hpp"
#include "hotkey_state_machine.hpp"
#include "kitten_tts_engine.hpp"
#include "model_cache.hpp"
#include "model_discovery.hpp"
#include "notifier.hpp"
#include "ollama_client.hpp"
#include "openrouter_client.hpp"
#include "pipeline_dispatcher.hpp"
#include "portaudio_output.hpp"
#include "recording_session_manager.hpp"
#include "screen_capture.hpp"
#include "task_executor.hpp"
#include "transcriber.hpp"
#include "transcription_history.hpp"
#include "tray.hpp"
#include "tts_fallback_chain.hpp"

#include <atomic>
#include <memory>
#include <string>

namespace voxchord {

class App {
public:
    App();
    ~App();

    // Initialize all components
    bool initialize(const Config& config);
    void shutdown();

    // Run the application (blocking until quit())
    int run();

    // Async-signal-safe
    void quit() { should_quit_.store(true); }

    AppState state() const { return state_.load(); }

private:
    bool init_hotkeys();
    void init_speech();
    void check_selected_model();

    void on_event(const PipelineEvent& event);
    void on_hotkey_failure(const std::string& message);
    void set_state(AppState state);

    Config config_;

    // Declaration order is construction order; references flow downwards
    std::unique_ptr<TaskExecutor> executor_;
    std::unique_ptr<AudioCapture> audio_;
    std::unique_ptr<Transcriber> transcriber_;
    std::unique_ptr<SystemClipboard> clipboard_;
    std::unique_ptr<OpenRouterClient> openrouter_;
    std::unique_ptr<OllamaClient> ollama_;
    std::unique_ptr<ModelCache> model_cache_;
    std::unique_ptr<ModelDiscovery> model_discovery_;
    std::unique_ptr<RegionScreenCapture> screen_;

    std::unique_ptr<CapabilityProcessManager> bridge_;
    std::unique_ptr<KittenTtsEngine> kitten_;
    std::unique_ptr<EspeakTtsEngine> espeak_;
    std::unique_ptr<TtsFallbackChain> tts_chain_;
    std::unique_ptr<PortAudioOutput> speech_output_;
    std::unique_ptr<AudioPlaybackController> speech_playback_;
    std::unique_ptr<ClipboardSpeaker> speaker_;

    std::unique_ptr<PortAudioOutput> notify_output_;
    std::unique_ptr<AudioPlaybackController> notify_playback_;
    std::unique_ptr<Notifier> notifier_;

    std::unique_ptr<TranscriptionHistory> history_;
    std::unique_ptr<PipelineDispatcher> dispatcher_;
    std::unique_ptr<RecordingSessionManager> sessions_;
    std::unique_ptr<HotkeyStateMachine> machine_;
    std::unique_ptr<HotkeyManager> hotkey_;

    std::atomic<AppState> state_{AppState::Idle};
    std::atomic<bool> should_quit_{false};
};

} // namespace voxchord
