#include "app.hpp"
#include "hotkey_binding.hpp"
#include "paths.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <thread>

namespace voxchord {

App::App() = default;

App::~App() {
    shutdown();
}

bool App::initialize(const Config& config) {
    config_ = config;
    should_quit_.store(false);

    executor_ = std::make_unique<TaskExecutor>(
        static_cast<std::size_t>(std::max(1, config_.worker_threads)));

    // Initialize audio capture
    audio_ = std::make_unique<AudioCapture>(
        config_.audio.sample_rate,
        config_.audio.channels,
        config_.audio.frames_per_buffer,
        config_.audio.max_recording_seconds
    );
    if (!audio_->initialize()) {
        std::cerr << "Failed to initialize audio capture" << std::endl;
        return false;
    }
    std::cout << "Audio capture initialized" << std::endl;

    // Initialize transcriber
    transcriber_ = std::make_unique<Transcriber>();
    if (!transcriber_->initialize(config_.whisper)) {
        std::cerr << "Failed to initialize transcriber" << std::endl;
        return false;
    }
    std::cout << "Transcriber initialized (" << transcriber_->model_name() << ")" << std::endl;

    clipboard_ = std::make_unique<SystemClipboard>();
    openrouter_ = std::make_unique<OpenRouterClient>(config_.llm.openrouter);
    ollama_ = std::make_unique<OllamaClient>(config_.llm.ollama);
    model_cache_ = std::make_unique<ModelCache>(cache_dir());
    model_discovery_ = std::make_unique<ModelDiscovery>(*openrouter_, *model_cache_);
    screen_ = std::make_unique<RegionScreenCapture>(
        temp_dir(), std::chrono::seconds(config_.vision.capture_timeout_seconds));

    init_speech();

    notify_output_ = std::make_unique<PortAudioOutput>();
    if (config_.notifications.enabled && notify_output_->initialize()) {
        notify_playback_ = std::make_unique<AudioPlaybackController>(*notify_output_);
    }
    notifier_ = std::make_unique<Notifier>(notify_playback_.get(), config_.notifications);

    if (config_.history.enabled) {
        history_ = std::make_unique<TranscriptionHistory>(
            (std::filesystem::path(data_dir()) / "history").string());
        history_->cleanup(config_.history.retention_days);
    }

    PipelineDispatcher::Services services{
        *transcriber_, *openrouter_, *ollama_, *screen_, *clipboard_, *speaker_, history_.get()
    };
    dispatcher_ = std::make_unique<PipelineDispatcher>(services, config_);
    dispatcher_->set_event_sink([this](const PipelineEvent& event) { on_event(event); });
    dispatcher_->set_state_callback([this](AppState state) { set_state(state); });

    RecordingSessionManager::Options session_options;
    session_options.temp_dir = temp_dir();
    session_options.release_grace = std::chrono::milliseconds(config_.audio.release_grace_ms);
    session_options.min_audio_bytes = config_.audio.min_audio_bytes;
    sessions_ = std::make_unique<RecordingSessionManager>(
        *audio_, *clipboard_, *executor_, *dispatcher_, session_options);
    sessions_->set_event_sink([this](const PipelineEvent& event) { on_event(event); });
    sessions_->set_state_callback([this](AppState state) { set_state(state); });

    if (!init_hotkeys()) {
        return false;
    }

    // Create tray icon
    if (!create_tray_icon()) {
        std::cerr << "Failed to create tray icon" << std::endl;
        // Continue anyway - not critical
    }

    model_cache_->cleanup_expired();
    check_selected_model();

    set_state(AppState::Idle);
    return true;
}

void App::init_speech() {
    const TtsSettings& tts = config_.tts;

    CapabilityProcessManager::Options bridge_options;
    bridge_options.interpreter = tts.python_executable;
    bridge_options.app_dir = executable_dir();
    bridge_options.scripts_dir = tts.scripts_dir;
    bridge_ = std::make_unique<CapabilityProcessManager>(bridge_options);

    KittenTtsEngine::Options kitten_options;
    kitten_options.temp_dir = temp_dir();
    kitten_options.timeout = std::chrono::seconds(tts.timeout_seconds);
    kitten_ = std::make_unique<KittenTtsEngine>(*bridge_, kitten_options);

    EspeakTtsEngine::Options espeak_options;
    espeak_options.temp_dir = temp_dir();
    espeak_options.timeout = std::chrono::seconds(tts.timeout_seconds);
    espeak_ = std::make_unique<EspeakTtsEngine>(espeak_options);

    TtsEngine* engine = kitten_.get();
    if (tts.native_fallback) {
        tts_chain_ = std::make_unique<TtsFallbackChain>(*kitten_, *espeak_);
        engine = tts_chain_.get();
    }

    speech_output_ = std::make_unique<PortAudioOutput>();
    if (tts.enabled && !speech_output_->initialize()) {
        std::cerr << "Speech output unavailable; clipboard reading will fail" << std::endl;
    }
    speech_playback_ = std::make_unique<AudioPlaybackController>(*speech_output_, temp_dir());
    speaker_ = std::make_unique<ClipboardSpeaker>(*clipboard_, *engine, *speech_playback_);

    std::cout << "Text-to-speech: " << (tts.enabled ? engine->engine_info() : "disabled") << std::endl;
}

bool App::init_hotkeys() {
    std::vector<HotkeyBinding> bindings;
    std::string error;
    if (!build_bindings(config_.hotkeys, bindings, error)) {
        std::cerr << "Invalid hotkey configuration: " << error << std::endl;
        return false;
    }

    machine_ = std::make_unique<HotkeyStateMachine>(bindings);
    machine_->set_on_mode_start([this](PipelineMode mode) { sessions_->on_mode_start(mode); });
    machine_->set_on_mode_end([this](PipelineMode mode) { sessions_->on_mode_end(mode); });

    hotkey_ = std::make_unique<HotkeyManager>(
        *machine_, make_keyboard_device(config_.hotkeys.device_path, config_.hotkeys.grab_keyboard));
    hotkey_->set_abort_callback([this](PipelineMode) { sessions_->cancel_current(); });
    hotkey_->set_failure_callback([this](const std::string& message) { on_hotkey_failure(message); });

    if (!hotkey_->initialize()) {
        std::cerr << "Failed to initialize hotkey manager" << std::endl;
        return false;
    }

    for (const auto& binding : bindings) {
        std::cout << "  " << format_chord(binding.chord) << " -> " << to_string(binding.mode) << std::endl;
    }
    std::cout << "Hotkey manager initialized" << std::endl;
    return true;
}

void App::check_selected_model() {
    if (config_.llm.provider != LlmProvider::OpenRouter || config_.llm.openrouter.api_key.empty()) {
        return;
    }

    const std::string key = config_.llm.openrouter.api_key;
    const std::string selected = config_.llm.openrouter.selected_model;
    executor_->post("model-discovery", [this, key, selected]() {
        auto models = model_discovery_->get_models(key);
        bool found = std::any_of(models.begin(), models.end(),
                                 [&](const ModelDescriptor& m) { return m.id == selected; });
        if (!found) {
            std::cerr << "[Models] Selected model \"" << selected << "\" is not in the "
                      << model_discovery_->last_source() << " model list" << std::endl;
        }
    });
}

void App::shutdown() {
    should_quit_.store(true);
    if (!executor_) return;

    if (hotkey_) {
        hotkey_->shutdown();
    }
    if (sessions_) {
        sessions_->cancel_current();
        sessions_->shutdown();
    }
    if (speaker_) {
        speaker_->cancel();
    }
    if (notifier_) {
        notifier_->cancel();
    }

    // Finish queued pipelines before tearing down what they use
    executor_->shutdown();

    hotkey_.reset();
    machine_.reset();
    sessions_.reset();
    dispatcher_.reset();

    if (notify_output_) notify_output_->shutdown();
    if (speech_output_) speech_output_->shutdown();

    if (audio_) {
        audio_->shutdown();
    }
    if (transcriber_) {
        transcriber_->shutdown();
    }

    destroy_tray_icon();
    executor_.reset();
}

int App::run() {
    if (!hotkey_->start()) {
        std::cerr << "Failed to start hotkey listener" << std::endl;
        return 1;
    }

    std::cout << "\n=== VoxChord Ready ===" << std::endl;
    std::cout << "Hold a chord to record, release to run its pipeline." << std::endl;
    std::cout << "Results are copied to the clipboard.\n" << std::endl;

    while (!should_quit_.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    return 0;
}

void App::on_event(const PipelineEvent& event) {
    if (!event.success && state_.load() != AppState::Recording) {
        update_tray_state(AppState::Error);
    }
    notifier_->notify(event);
}

void App::on_hotkey_failure(const std::string& message) {
    set_state(AppState::Error);
    on_event(PipelineEvent::failed(std::nullopt, ErrorKind::HotkeyInfrastructure, message));
}

void App::set_state(AppState state) {
    if (state_.exchange(state) != state) {
        update_tray_state(state);
    }
}

} // namespace voxchord
