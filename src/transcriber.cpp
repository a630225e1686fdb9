#include "transcriber.hpp"
#include "text_utils.hpp"
#include "wav_file.hpp"
#include "whisper.h"

#include <chrono>
#include <iostream>

namespace voxchord {

namespace {

constexpr int WHISPER_SAMPLE_RATE_HZ = 16000;

} // namespace

Transcriber::Transcriber() = default;

Transcriber::~Transcriber() {
    shutdown();
}

bool Transcriber::initialize(const WhisperSettings& settings) {
    if (ctx_) return true;

    n_threads_ = settings.n_threads;
    language_ = settings.language.empty() ? "auto" : settings.language;
    model_size_ = settings.model_size;

    struct whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = settings.use_gpu;

    const std::string model_path = settings.model_path();
    ctx_ = whisper_init_from_file_with_params(model_path.c_str(), cparams);
    if (!ctx_) {
        std::cerr << "[Whisper] Failed to load model: " << model_path << std::endl;
        return false;
    }

    std::cout << "[Whisper] Loaded model: " << model_path << std::endl;
    return true;
}

void Transcriber::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
    }
}

void Transcriber::set_language(const std::string& lang) {
    std::lock_guard<std::mutex> lock(mutex_);
    language_ = lang.empty() ? "auto" : lang;
}

TranscriptionResult Transcriber::transcribe_file(const std::string& wav_path) {
    WavData wav;
    std::string error;
    if (!read_wav(wav_path, wav, error)) {
        TranscriptionResult result;
        result.error = "Cannot read recording: " + error;
        return result;
    }
    return transcribe(to_mono(wav, WHISPER_SAMPLE_RATE_HZ));
}

TranscriptionResult Transcriber::transcribe(const std::vector<float>& audio) {
    TranscriptionResult result;

    std::lock_guard<std::mutex> lock(mutex_);
    if (!ctx_) {
        result.error = "Transcriber not initialized";
        return result;
    }

    if (audio.empty()) {
        result.error = "No audio data";
        return result;
    }

    auto start_time = std::chrono::steady_clock::now();

    whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_BEAM_SEARCH);
    wparams.print_progress   = false;
    wparams.print_special    = false;
    wparams.print_realtime   = false;
    wparams.print_timestamps = false;
    wparams.translate        = false;
    wparams.no_context       = true;
    wparams.language         = language_.c_str();  // "auto" detects per recording
    wparams.n_threads        = n_threads_;
    wparams.beam_search.beam_size = 5;
    wparams.greedy.best_of   = 5;

    int ret = whisper_full(ctx_, wparams, audio.data(), static_cast<int>(audio.size()));
    if (ret != 0) {
        result.error = "Whisper inference failed";
        return result;
    }

    const int n_segments = whisper_full_n_segments(ctx_);
    std::string text;
    for (int i = 0; i < n_segments; ++i) {
        const char* segment_text = whisper_full_get_segment_text(ctx_, i);
        if (!segment_text) continue;

        TranscriptionSegment segment;
        // Timestamps come in units of 10ms
        segment.start_ms = whisper_full_get_segment_t0(ctx_, i) * 10;
        segment.end_ms = whisper_full_get_segment_t1(ctx_, i) * 10;
        segment.text = trim(segment_text);
        result.segments.push_back(segment);

        text += segment_text;
    }

    const int lang_id = whisper_full_lang_id(ctx_);
    const char* lang = lang_id >= 0 ? whisper_lang_str(lang_id) : nullptr;
    result.language = lang ? lang : language_;

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    result.full_text = trim(text);
    result.duration_ms = duration.count();
    result.confidence = calculate_confidence();
    result.success = true;

    std::cout << "[Whisper] Transcription took " << result.duration_ms << "ms (lang: "
              << result.language << ", conf: " << static_cast<int>(result.confidence * 100)
              << "%): \"" << preview(result.full_text) << "\"" << std::endl;

    return result;
}

float Transcriber::calculate_confidence() const {
    if (!ctx_) return 0.0f;

    const int n_segments = whisper_full_n_segments(ctx_);
    if (n_segments == 0) return 0.0f;

    float total_prob = 0.0f;
    int total_tokens = 0;

    for (int seg = 0; seg < n_segments; ++seg) {
        const int n_tokens = whisper_full_n_tokens(ctx_, seg);
        for (int tok = 0; tok < n_tokens; ++tok) {
            whisper_token_data token_data = whisper_full_get_token_data(ctx_, seg, tok);
            // Skip special tokens (negative IDs or very low probability)
            if (token_data.id >= 0 && token_data.p > 0.0f) {
                total_prob += token_data.p;
                total_tokens++;
            }
        }
    }

    return total_tokens > 0 ? total_prob / static_cast<float>(total_tokens) : 0.0f;
}

} // namespace voxchord
