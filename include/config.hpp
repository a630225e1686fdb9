#pragma once

#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>

namespace voxchord {

enum class LlmProvider {
    OpenRouter,
    Ollama
};

const char* to_string(LlmProvider provider);
std::optional<LlmProvider> parse_llm_provider(const std::string& name);

// Chord strings, parsed by parse_chord(). Empty leaves a mode unbound.
struct HotkeySettings {
    std::string transcribe = "F1";
    std::string prompt_llm = "Shift+F2";
    std::string clipboard_prompt_llm = "Ctrl+F2";
    std::string vision_capture = "Shift+F3";
    std::string speech_vision = "Ctrl+F3";
    std::string clipboard_tts = "Ctrl+F1";

    std::string device_path;        // Empty: first keyboard under /dev/input
    bool grab_keyboard = false;     // Exclusive grab, re-emitting unbound keys via uinput
};

struct AudioSettings {
    int sample_rate = 16000;        // Whisper expects 16kHz
    int channels = 1;               // Mono
    int frames_per_buffer = 512;    // Low latency buffer
    int max_recording_seconds = 120;

    int release_grace_ms = 250;             // Wait after chord release before reading the file
    std::uintmax_t min_audio_bytes = 1024;  // Payload beyond the WAV header
};

struct WhisperSettings {
    std::string model_dir = "models";
    std::string model_size = "base";  // tiny, base, small, medium, large-v3, ...
    std::string language = "auto";
    int n_threads = 4;              // CPU threads for inference
    bool use_gpu = false;

    std::string model_path() const {
        return model_dir + "/ggml-" + model_size + ".bin";
    }
};

struct OpenRouterSettings {
    std::string api_key;            // OPENROUTER_API_KEY overrides when set
    std::string base_url = "https://openrouter.ai";
    std::string selected_model = "anthropic/claude-sonnet-4";
    std::string system_prompt = "You are a helpful assistant. Please provide a clear, "
                                "concise response to the user's voice input.";
    double temperature = 0.7;
    int max_tokens = 1000;
    int timeout_seconds = 60;
};

struct OllamaSettings {
    std::string server_url = "http://localhost:11434";
    std::string selected_model = "llama3.2";
    std::string vision_model = "llava";
    std::string system_prompt = "You are a helpful assistant. Please provide a clear, "
                                "concise response to the user's voice input.";
    int timeout_seconds = 120;
};

struct LlmSettings {
    LlmProvider provider = LlmProvider::OpenRouter;
    OpenRouterSettings openrouter;
    OllamaSettings ollama;
};

struct VisionSettings {
    std::string system_prompt = "Describe the image in a single line paragraph";
    std::string model;              // Empty: provider's vision-capable default
    int capture_timeout_seconds = 60;
};

struct TtsSettings {
    bool enabled = true;
    std::string voice = "expr-voice-2-f";
    float speed = 1.0f;
    std::size_t max_text_length = 5000;
    float volume = 1.0f;
    int timeout_seconds = 30;

    std::string python_executable;  // Empty: bundled interpreter, then python3/python
    std::string scripts_dir;        // Empty: <executable dir>/scripts
    bool native_fallback = true;    // espeak-ng as secondary engine
};

struct HistorySettings {
    bool enabled = true;
    bool save_audio_files = false;
    int retention_days = 30;
};

struct NotificationSettings {
    bool enabled = false;
    std::string sound_path;
    float volume = 0.5f;
    bool on_speech_to_text = true;
    bool on_llm_response = true;
};

struct Config {
    HotkeySettings hotkeys;
    AudioSettings audio;
    WhisperSettings whisper;
    LlmSettings llm;
    VisionSettings vision;
    TtsSettings tts;
    HistorySettings history;
    NotificationSettings notifications;

    // Behavior
    bool auto_paste = false;
    int worker_threads = 4;
};

} // namespace voxchord
