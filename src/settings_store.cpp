#include "settings_store.hpp"
#include "paths.hpp"
#include "text_utils.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace voxchord {

const char* to_string(LlmProvider provider) {
    switch (provider) {
        case LlmProvider::OpenRouter: return "openrouter";
        case LlmProvider::Ollama: return "ollama";
    }
    return "openrouter";
}

std::optional<LlmProvider> parse_llm_provider(const std::string& name) {
    std::string lower = to_lower(trim(name));
    if (lower == "openrouter") return LlmProvider::OpenRouter;
    if (lower == "ollama") return LlmProvider::Ollama;
    return std::nullopt;
}

namespace {

const char* API_KEY_ENV = "OPENROUTER_API_KEY";

std::string env_api_key() {
    const char* value = std::getenv(API_KEY_ENV);
    return value ? std::string(value) : std::string();
}

// Section accessor: missing or mistyped sections read as empty objects
const json& section(const json& j, const char* name) {
    static const json empty = json::object();
    auto it = j.find(name);
    return (it != j.end() && it->is_object()) ? *it : empty;
}

json hotkeys_to_json(const HotkeySettings& s) {
    return {
        {"transcribe", s.transcribe},
        {"prompt_llm", s.prompt_llm},
        {"clipboard_prompt_llm", s.clipboard_prompt_llm},
        {"vision_capture", s.vision_capture},
        {"speech_vision", s.speech_vision},
        {"clipboard_tts", s.clipboard_tts},
        {"device_path", s.device_path},
        {"grab_keyboard", s.grab_keyboard}
    };
}

void hotkeys_from_json(const json& j, HotkeySettings& s) {
    s.transcribe = j.value("transcribe", s.transcribe);
    s.prompt_llm = j.value("prompt_llm", s.prompt_llm);
    s.clipboard_prompt_llm = j.value("clipboard_prompt_llm", s.clipboard_prompt_llm);
    s.vision_capture = j.value("vision_capture", s.vision_capture);
    s.speech_vision = j.value("speech_vision", s.speech_vision);
    s.clipboard_tts = j.value("clipboard_tts", s.clipboard_tts);
    s.device_path = j.value("device_path", s.device_path);
    s.grab_keyboard = j.value("grab_keyboard", s.grab_keyboard);
}

json audio_to_json(const AudioSettings& s) {
    return {
        {"sample_rate", s.sample_rate},
        {"channels", s.channels},
        {"frames_per_buffer", s.frames_per_buffer},
        {"max_recording_seconds", s.max_recording_seconds},
        {"release_grace_ms", s.release_grace_ms},
        {"min_audio_bytes", s.min_audio_bytes}
    };
}

void audio_from_json(const json& j, AudioSettings& s) {
    s.sample_rate = j.value("sample_rate", s.sample_rate);
    s.channels = j.value("channels", s.channels);
    s.frames_per_buffer = j.value("frames_per_buffer", s.frames_per_buffer);
    s.max_recording_seconds = j.value("max_recording_seconds", s.max_recording_seconds);
    s.release_grace_ms = j.value("release_grace_ms", s.release_grace_ms);
    s.min_audio_bytes = j.value("min_audio_bytes", s.min_audio_bytes);
}

json whisper_to_json(const WhisperSettings& s) {
    return {
        {"model_dir", s.model_dir},
        {"model_size", s.model_size},
        {"language", s.language},
        {"threads", s.n_threads},
        {"use_gpu", s.use_gpu}
    };
}

void whisper_from_json(const json& j, WhisperSettings& s) {
    s.model_dir = j.value("model_dir", s.model_dir);
    s.model_size = j.value("model_size", s.model_size);
    s.language = j.value("language", s.language);
    s.n_threads = j.value("threads", s.n_threads);
    s.use_gpu = j.value("use_gpu", s.use_gpu);
}

json llm_to_json(const LlmSettings& s, bool include_key) {
    json openrouter = {
        {"base_url", s.openrouter.base_url},
        {"selected_model", s.openrouter.selected_model},
        {"system_prompt", s.openrouter.system_prompt},
        {"temperature", s.openrouter.temperature},
        {"max_tokens", s.openrouter.max_tokens},
        {"timeout_seconds", s.openrouter.timeout_seconds}
    };
    if (include_key) openrouter["api_key"] = s.openrouter.api_key;

    return {
        {"provider", to_string(s.provider)},
        {"openrouter", openrouter},
        {"ollama", {
            {"server_url", s.ollama.server_url},
            {"selected_model", s.ollama.selected_model},
            {"vision_model", s.ollama.vision_model},
            {"system_prompt", s.ollama.system_prompt},
            {"timeout_seconds", s.ollama.timeout_seconds}
        }}
    };
}

void llm_from_json(const json& j, LlmSettings& s) {
    std::string provider = j.value("provider", std::string(to_string(s.provider)));
    if (auto parsed = parse_llm_provider(provider)) {
        s.provider = *parsed;
    } else {
        std::cerr << "[Settings] Unknown LLM provider \"" << provider << "\", keeping "
                  << to_string(s.provider) << std::endl;
    }

    const json& openrouter = section(j, "openrouter");
    s.openrouter.api_key = openrouter.value("api_key", s.openrouter.api_key);
    s.openrouter.base_url = openrouter.value("base_url", s.openrouter.base_url);
    s.openrouter.selected_model = openrouter.value("selected_model", s.openrouter.selected_model);
    s.openrouter.system_prompt = openrouter.value("system_prompt", s.openrouter.system_prompt);
    s.openrouter.temperature = openrouter.value("temperature", s.openrouter.temperature);
    s.openrouter.max_tokens = openrouter.value("max_tokens", s.openrouter.max_tokens);
    s.openrouter.timeout_seconds = openrouter.value("timeout_seconds", s.openrouter.timeout_seconds);

    const json& ollama = section(j, "ollama");
    s.ollama.server_url = ollama.value("server_url", s.ollama.server_url);
    s.ollama.selected_model = ollama.value("selected_model", s.ollama.selected_model);
    s.ollama.vision_model = ollama.value("vision_model", s.ollama.vision_model);
    s.ollama.system_prompt = ollama.value("system_prompt", s.ollama.system_prompt);
    s.ollama.timeout_seconds = ollama.value("timeout_seconds", s.ollama.timeout_seconds);
}

json tts_to_json(const TtsSettings& s) {
    return {
        {"enabled", s.enabled},
        {"voice", s.voice},
        {"speed", s.speed},
        {"max_text_length", s.max_text_length},
        {"volume", s.volume},
        {"timeout_seconds", s.timeout_seconds},
        {"python_executable", s.python_executable},
        {"scripts_dir", s.scripts_dir},
        {"native_fallback", s.native_fallback}
    };
}

void tts_from_json(const json& j, TtsSettings& s) {
    s.enabled = j.value("enabled", s.enabled);
    s.voice = j.value("voice", s.voice);
    s.speed = j.value("speed", s.speed);
    s.max_text_length = j.value("max_text_length", s.max_text_length);
    s.volume = j.value("volume", s.volume);
    s.timeout_seconds = j.value("timeout_seconds", s.timeout_seconds);
    s.python_executable = j.value("python_executable", s.python_executable);
    s.scripts_dir = j.value("scripts_dir", s.scripts_dir);
    s.native_fallback = j.value("native_fallback", s.native_fallback);
}

} // namespace

SettingsStore::SettingsStore(std::string path)
    : path_(path.empty() ? (fs::path(config_dir()) / "settings.json").string() : std::move(path)) {
}

bool SettingsStore::exists() const {
    std::error_code ec;
    return fs::exists(path_, ec);
}

std::string SettingsStore::to_json_text(const Config& config) {
    const std::string env_key = env_api_key();
    const bool include_key = !config.llm.openrouter.api_key.empty() &&
                             config.llm.openrouter.api_key != env_key;

    json j = {
        {"hotkeys", hotkeys_to_json(config.hotkeys)},
        {"audio", audio_to_json(config.audio)},
        {"whisper", whisper_to_json(config.whisper)},
        {"llm", llm_to_json(config.llm, include_key)},
        {"vision", {
            {"system_prompt", config.vision.system_prompt},
            {"model", config.vision.model},
            {"capture_timeout_seconds", config.vision.capture_timeout_seconds}
        }},
        {"tts", tts_to_json(config.tts)},
        {"history", {
            {"enabled", config.history.enabled},
            {"save_audio_files", config.history.save_audio_files},
            {"retention_days", config.history.retention_days}
        }},
        {"notifications", {
            {"enabled", config.notifications.enabled},
            {"sound_path", config.notifications.sound_path},
            {"volume", config.notifications.volume},
            {"on_speech_to_text", config.notifications.on_speech_to_text},
            {"on_llm_response", config.notifications.on_llm_response}
        }},
        {"auto_paste", config.auto_paste},
        {"worker_threads", config.worker_threads}
    };
    return j.dump(2);
}

bool SettingsStore::from_json_text(const std::string& text, Config& config, std::string& error) {
    Config parsed;
    try {
        json j = json::parse(text);
        if (!j.is_object()) {
            error = "top-level value is not an object";
            return false;
        }

        hotkeys_from_json(section(j, "hotkeys"), parsed.hotkeys);
        audio_from_json(section(j, "audio"), parsed.audio);
        whisper_from_json(section(j, "whisper"), parsed.whisper);
        llm_from_json(section(j, "llm"), parsed.llm);

        const json& vision = section(j, "vision");
        parsed.vision.system_prompt = vision.value("system_prompt", parsed.vision.system_prompt);
        parsed.vision.model = vision.value("model", parsed.vision.model);
        parsed.vision.capture_timeout_seconds =
            vision.value("capture_timeout_seconds", parsed.vision.capture_timeout_seconds);

        tts_from_json(section(j, "tts"), parsed.tts);

        const json& history = section(j, "history");
        parsed.history.enabled = history.value("enabled", parsed.history.enabled);
        parsed.history.save_audio_files = history.value("save_audio_files", parsed.history.save_audio_files);
        parsed.history.retention_days = history.value("retention_days", parsed.history.retention_days);

        const json& notifications = section(j, "notifications");
        parsed.notifications.enabled = notifications.value("enabled", parsed.notifications.enabled);
        parsed.notifications.sound_path = notifications.value("sound_path", parsed.notifications.sound_path);
        parsed.notifications.volume = notifications.value("volume", parsed.notifications.volume);
        parsed.notifications.on_speech_to_text =
            notifications.value("on_speech_to_text", parsed.notifications.on_speech_to_text);
        parsed.notifications.on_llm_response =
            notifications.value("on_llm_response", parsed.notifications.on_llm_response);

        parsed.auto_paste = j.value("auto_paste", parsed.auto_paste);
        parsed.worker_threads = j.value("worker_threads", parsed.worker_threads);
    } catch (const json::exception& e) {
        error = e.what();
        return false;
    }

    config = parsed;
    return true;
}

Config SettingsStore::load() const {
    Config config;

    std::ifstream file(path_);
    if (file.is_open()) {
        std::stringstream buffer;
        buffer << file.rdbuf();

        std::string error;
        if (from_json_text(buffer.str(), config, error)) {
            std::cout << "[Settings] Loaded " << path_ << std::endl;
        } else {
            std::cerr << "[Settings] Ignoring malformed " << path_ << ": " << error << std::endl;
            config = Config();
        }
    }

    const std::string env_key = env_api_key();
    if (!env_key.empty()) {
        config.llm.openrouter.api_key = env_key;
    }
    return config;
}

bool SettingsStore::save(const Config& config) const {
    std::error_code ec;
    fs::create_directories(fs::path(path_).parent_path(), ec);

    const std::string tmp = path_ + ".tmp";
    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!file.is_open()) {
            std::cerr << "[Settings] Cannot write " << tmp << std::endl;
            return false;
        }
        file << to_json_text(config) << '\n';
        if (!file) {
            std::cerr << "[Settings] Write failed for " << tmp << std::endl;
            return false;
        }
    }

    fs::rename(tmp, path_, ec);
    if (ec) {
        std::cerr << "[Settings] Cannot replace " << path_ << ": " << ec.message() << std::endl;
        fs::remove(tmp, ec);
        return false;
    }
    return true;
}

} // namespace voxchord
