#pragma once

#include "clipboard.hpp"
#include "clipboard_speaker.hpp"
#include "config.hpp"
#include "events.hpp"
#include "llm_client.hpp"
#include "recording_session.hpp"
#include "screen_capture.hpp"
#include "transcription_history.hpp"
#include "transcription_service.hpp"
#include "tray.hpp"

#include <functional>
#include <mutex>
#include <string>

namespace voxchord {

// Runs the pipeline for a finished session and reports one PipelineEvent.
//
//   Transcribe          transcript -> clipboard
//   PromptLLM           transcript -> LLM -> clipboard
//   ClipboardPromptLLM  "transcript, clipboard" -> LLM -> clipboard
//   VisionCapture       region image + vision prompt -> LLM -> clipboard
//   SpeechVision        region image + transcript -> LLM -> clipboard
//   ClipboardTts        clipboard text -> speech
class PipelineDispatcher : public SessionHandler {
public:
    struct Services {
        TranscriptionService& transcriber;
        LlmClient& openrouter;
        LlmClient& ollama;
        ScreenCapture& screen;
        Clipboard& clipboard;
        ClipboardSpeaker& speaker;
        TranscriptionHistory* history;      // Optional
    };

    using StateCallback = std::function<void(AppState state)>;

    PipelineDispatcher(Services services, const Config& config);

    void update_settings(const Config& config);

    void set_event_sink(EventSink sink) { sink_ = std::move(sink); }
    void set_state_callback(StateCallback callback) { state_callback_ = std::move(callback); }

    void run(RecordingSession session) override;

    // "transcript, clipboard", or the transcript alone for a blank clipboard
    static std::string combine_prompt(const std::string& transcript, const std::string& clipboard);

private:
    struct Context {
        Config config;
        RecordingSession& session;
        TranscriptionResult transcript;
        std::string response;
        std::string model_used;
    };

    PipelineEvent run_transcribe(Context& ctx);
    PipelineEvent run_prompt(Context& ctx, bool with_clipboard);
    PipelineEvent run_vision(Context& ctx, bool with_speech);
    PipelineEvent run_clipboard_tts(Context& ctx);

    bool transcribe(Context& ctx, PipelineEvent& failure);
    bool ask_llm(Context& ctx, const std::string& prompt, PipelineEvent& failure);
    bool ask_vision(Context& ctx, const std::string& prompt, const std::string& system_prompt,
                    const std::vector<uint8_t>& png, PipelineEvent& failure);
    PipelineEvent deliver(Context& ctx, const std::string& text);

    LlmClient& llm_for(const Config& config);
    std::string llm_model(const Config& config) const;
    std::string llm_system_prompt(const Config& config) const;

    void record_history(const Context& ctx);
    void finish(Context& ctx);
    void set_state(AppState state);

    Services services_;
    EventSink sink_;
    StateCallback state_callback_;

    mutable std::mutex config_mutex_;
    Config config_;
};

} // namespace voxchord
