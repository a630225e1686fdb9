#include "pipeline_dispatcher.hpp"
#include "text_utils.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <thread>

namespace fs = std::filesystem;

namespace voxchord {

namespace {

constexpr const char* DEFAULT_IMAGE_PROMPT = "Analyze this image and describe what you see.";
constexpr const char* IMAGE_SYSTEM_PROMPT =
    "You are a helpful AI assistant that can analyze images. Describe what you see in detail.";

ErrorKind error_kind_for(PipelineMode mode) {
    switch (mode) {
        case PipelineMode::Transcribe: return ErrorKind::Transcription;
        case PipelineMode::PromptLLM:
        case PipelineMode::ClipboardPromptLLM: return ErrorKind::Llm;
        case PipelineMode::VisionCapture:
        case PipelineMode::SpeechVision: return ErrorKind::Vision;
        case PipelineMode::ClipboardTts: return ErrorKind::Tts;
    }
    return ErrorKind::None;
}

} // namespace

PipelineDispatcher::PipelineDispatcher(Services services, const Config& config)
    : services_(services), config_(config) {}

void PipelineDispatcher::update_settings(const Config& config) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    config_ = config;
}

std::string PipelineDispatcher::combine_prompt(const std::string& transcript,
                                               const std::string& clipboard) {
    // Blank clipboards are skipped; otherwise the text goes as copied
    if (trim(clipboard).empty()) return transcript;
    return transcript + ", " + clipboard;
}

void PipelineDispatcher::run(RecordingSession session) {
    const auto start = std::chrono::steady_clock::now();

    Config config;
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        config = config_;
    }
    Context ctx{config, session, {}, {}, {}};

    std::cout << "[Pipeline] " << to_string(session.mode) << " (#" << session.id << ") started" << std::endl;
    set_state(session.mode == PipelineMode::ClipboardTts ? AppState::Speaking : AppState::Processing);

    PipelineEvent event;
    try {
        switch (session.mode) {
            case PipelineMode::Transcribe:
                event = run_transcribe(ctx);
                break;
            case PipelineMode::PromptLLM:
                event = run_prompt(ctx, false);
                break;
            case PipelineMode::ClipboardPromptLLM:
                event = run_prompt(ctx, true);
                break;
            case PipelineMode::VisionCapture:
                event = run_vision(ctx, false);
                break;
            case PipelineMode::SpeechVision:
                event = run_vision(ctx, true);
                break;
            case PipelineMode::ClipboardTts:
                event = run_clipboard_tts(ctx);
                break;
        }
    } catch (const std::exception& e) {
        event = PipelineEvent::failed(session.mode, error_kind_for(session.mode),
                                      std::string("Unexpected error: ") + e.what());
    }

    finish(ctx);

    event.mode = session.mode;
    event.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    if (event.success) {
        std::cout << "[Pipeline] " << to_string(session.mode) << " completed in "
                  << event.elapsed.count() << "ms" << std::endl;
    } else {
        std::cerr << "[Pipeline] " << to_string(session.mode) << " failed ("
                  << to_string(event.error_kind) << "): " << event.message << std::endl;
    }

    set_state(AppState::Idle);
    if (sink_) sink_(event);
}

PipelineEvent PipelineDispatcher::run_transcribe(Context& ctx) {
    PipelineEvent failure;
    if (!transcribe(ctx, failure)) return failure;

    record_history(ctx);
    return deliver(ctx, ctx.transcript.full_text);
}

PipelineEvent PipelineDispatcher::run_prompt(Context& ctx, bool with_clipboard) {
    PipelineEvent failure;
    if (!transcribe(ctx, failure)) return failure;

    std::string prompt = ctx.transcript.full_text;
    if (with_clipboard) {
        prompt = combine_prompt(prompt, ctx.session.clipboard_snapshot);
    }

    if (!ask_llm(ctx, prompt, failure)) return failure;

    record_history(ctx);
    return deliver(ctx, ctx.response);
}

PipelineEvent PipelineDispatcher::run_vision(Context& ctx, bool with_speech) {
    PipelineEvent failure;

    // Without speech the configured vision prompt is the instruction itself
    std::string prompt = ctx.config.vision.system_prompt;
    if (trim(prompt).empty()) prompt = DEFAULT_IMAGE_PROMPT;
    std::string system_prompt = IMAGE_SYSTEM_PROMPT;

    if (with_speech) {
        // Speech first: the region is selected after the chord is released
        if (!transcribe(ctx, failure)) return failure;
        prompt = ctx.transcript.full_text;
        system_prompt = ctx.config.vision.system_prompt;
    }

    CaptureResult capture = services_.screen.capture_region();
    if (!capture.success) {
        std::string message = capture.error.empty() ? "Screen capture failed" : capture.error;
        if (capture.cancelled) message = "Screen capture was cancelled";
        return PipelineEvent::failed(ctx.session.mode, ErrorKind::Vision, message);
    }

    if (!ask_vision(ctx, prompt, system_prompt, capture.png, failure)) return failure;

    record_history(ctx);
    return deliver(ctx, ctx.response);
}

PipelineEvent PipelineDispatcher::run_clipboard_tts(Context& ctx) {
    SpeakResult spoken = services_.speaker.speak_clipboard(ctx.config.tts);
    if (!spoken.success) {
        return PipelineEvent::failed(ctx.session.mode, ErrorKind::Tts, spoken.error);
    }

    PipelineEvent event = PipelineEvent::completed(ctx.session.mode, "");
    event.message = "Spoke " + std::to_string(spoken.characters) + " characters (" +
                    to_string(spoken.playback) + ")";
    return event;
}

bool PipelineDispatcher::transcribe(Context& ctx, PipelineEvent& failure) {
    const PipelineMode mode = ctx.session.mode;

    if (ctx.session.audio_path.empty()) {
        failure = PipelineEvent::failed(mode, ErrorKind::Recording, "No recording for this session");
        return false;
    }

    try {
        ctx.transcript = services_.transcriber.transcribe_file(ctx.session.audio_path);
    } catch (const std::exception& e) {
        failure = PipelineEvent::failed(mode, ErrorKind::Transcription,
                                        std::string("Transcription processing failed: ") + e.what());
        return false;
    }

    if (!ctx.transcript.success) {
        failure = PipelineEvent::failed(mode, ErrorKind::Transcription,
                                        ctx.transcript.error.empty() ? "Transcription failed"
                                                                     : ctx.transcript.error);
        return false;
    }

    ctx.transcript.full_text = trim(ctx.transcript.full_text);
    if (ctx.transcript.full_text.empty()) {
        failure = PipelineEvent::failed(mode, ErrorKind::Transcription, "No speech detected in audio");
        return false;
    }

    ctx.model_used = services_.transcriber.model_name();
    std::cout << "[Pipeline] Transcript: \"" << preview(ctx.transcript.full_text) << "\"" << std::endl;
    return true;
}

bool PipelineDispatcher::ask_llm(Context& ctx, const std::string& prompt, PipelineEvent& failure) {
    LlmClient& llm = llm_for(ctx.config);
    const std::string model = llm_model(ctx.config);

    if (!llm.is_configured()) {
        failure = PipelineEvent::failed(ctx.session.mode, ErrorKind::Llm,
                                        llm.name() + " is not configured");
        return false;
    }

    LlmResponse response;
    try {
        response = llm.complete(prompt, llm_system_prompt(ctx.config), model);
    } catch (const std::exception& e) {
        failure = PipelineEvent::failed(ctx.session.mode, ErrorKind::Llm,
                                        llm.name() + " request failed: " + e.what());
        return false;
    }

    if (!response.success) {
        ErrorKind kind = response.error_kind == ErrorKind::None ? ErrorKind::Llm : response.error_kind;
        failure = PipelineEvent::failed(ctx.session.mode, kind, response.error);
        return false;
    }

    ctx.response = response.text;
    ctx.model_used += (ctx.model_used.empty() ? "" : " + ") + llm.name() + ":" +
                      (model.empty() ? "default" : model);
    return true;
}

bool PipelineDispatcher::ask_vision(Context& ctx, const std::string& prompt,
                                    const std::string& system_prompt,
                                    const std::vector<uint8_t>& png, PipelineEvent& failure) {
    LlmClient& llm = llm_for(ctx.config);
    std::string model = ctx.config.vision.model;
    if (model.empty() && ctx.config.llm.provider == LlmProvider::OpenRouter) {
        model = ctx.config.llm.openrouter.selected_model;
    }

    if (!llm.is_configured()) {
        failure = PipelineEvent::failed(ctx.session.mode, ErrorKind::Vision,
                                        llm.name() + " is not configured");
        return false;
    }

    LlmResponse response;
    try {
        response = llm.complete_with_image(prompt, png, system_prompt, model);
    } catch (const std::exception& e) {
        failure = PipelineEvent::failed(ctx.session.mode, ErrorKind::Vision,
                                        std::string("Vision analysis failed: ") + e.what());
        return false;
    }

    if (!response.success) {
        ErrorKind kind = response.error_kind == ErrorKind::Network ? ErrorKind::Network : ErrorKind::Vision;
        failure = PipelineEvent::failed(ctx.session.mode, kind, response.error);
        return false;
    }

    ctx.response = response.text;
    ctx.model_used += (ctx.model_used.empty() ? "" : " + ") + llm.name() + ":" +
                      (model.empty() ? "default" : model);
    return true;
}

PipelineEvent PipelineDispatcher::deliver(Context& ctx, const std::string& text) {
    if (!services_.clipboard.set_text(text)) {
        PipelineEvent event = PipelineEvent::failed(ctx.session.mode, ErrorKind::Clipboard,
                                                    "Failed to copy result to clipboard");
        event.text = text;
        return event;
    }

    if (ctx.config.auto_paste) {
        // Let the clipboard owner settle before the synthetic Ctrl+V
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        if (!services_.clipboard.paste()) {
            std::cerr << "[Pipeline] Auto-paste failed, result is on the clipboard" << std::endl;
        }
    }

    return PipelineEvent::completed(ctx.session.mode, text);
}

LlmClient& PipelineDispatcher::llm_for(const Config& config) {
    return config.llm.provider == LlmProvider::Ollama ? services_.ollama : services_.openrouter;
}

std::string PipelineDispatcher::llm_model(const Config& config) const {
    return config.llm.provider == LlmProvider::Ollama ? config.llm.ollama.selected_model
                                                      : config.llm.openrouter.selected_model;
}

std::string PipelineDispatcher::llm_system_prompt(const Config& config) const {
    return config.llm.provider == LlmProvider::Ollama ? config.llm.ollama.system_prompt
                                                      : config.llm.openrouter.system_prompt;
}

void PipelineDispatcher::record_history(const Context& ctx) {
    if (!services_.history || !ctx.config.history.enabled) return;

    HistoryEntry entry;
    entry.timestamp = ctx.session.started_at;
    entry.mode = ctx.session.mode;
    entry.text = ctx.transcript.full_text;
    entry.response = ctx.response;
    entry.segments = ctx.transcript.segments;
    entry.language = ctx.transcript.language;
    entry.duration_ms = ctx.transcript.duration_ms;
    entry.model_used = ctx.model_used;
    if (ctx.config.history.save_audio_files) entry.audio_path = ctx.session.audio_path;

    if (!services_.history->append(entry)) {
        std::cerr << "[Pipeline] Failed to record history" << std::endl;
    }
}

void PipelineDispatcher::finish(Context& ctx) {
    if (ctx.session.audio_path.empty() || ctx.config.history.save_audio_files) return;

    std::error_code ec;
    fs::remove(ctx.session.audio_path, ec);
    if (ec) {
        std::cerr << "[Pipeline] Failed to delete " << ctx.session.audio_path << ": "
                  << ec.message() << std::endl;
    }
}

void PipelineDispatcher::set_state(AppState state) {
    if (state_callback_) state_callback_(state);
}

} // namespace voxchord
