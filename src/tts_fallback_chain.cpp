#include "tts_fallback_chain.hpp"

#include <algorithm>
#include <iostream>

namespace voxchord {

TtsFallbackChain::TtsFallbackChain(TtsEngine& primary, TtsEngine& secondary)
    : primary_(primary), secondary_(secondary) {}

bool TtsFallbackChain::primary_available() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!primary_available_) {
        try {
            primary_available_ = primary_.is_available();
        } catch (const std::exception& e) {
            std::cerr << "[TTS] Primary availability check failed: " << e.what() << std::endl;
            primary_available_ = false;
        }
        std::cout << "[TTS] " << primary_.engine_info()
                  << (*primary_available_ ? " available" : " unavailable, using fallback") << std::endl;
    }
    return *primary_available_;
}

TtsResult TtsFallbackChain::generate(const TtsRequest& request) {
    const auto start = std::chrono::steady_clock::now();
    std::string primary_error;
    std::string secondary_error;

    if (primary_available()) {
        try {
            TtsResult result = primary_.generate(request);
            if (result.success) return result;
            primary_error = result.error_message.empty() ? "unknown error" : result.error_message;
        } catch (const std::exception& e) {
            primary_error = e.what();
        }
        std::cerr << "[TTS] Primary engine failed: " << primary_error << std::endl;
    } else {
        primary_error = "not available";
    }

    try {
        TtsResult result = secondary_.generate(request);
        if (result.success) return result;
        secondary_error = result.error_message.empty() ? "unknown error" : result.error_message;
    } catch (const std::exception& e) {
        secondary_error = e.what();
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    return TtsResult::failure("All TTS engines failed. Primary: " + primary_error +
                              "; Secondary: " + secondary_error, elapsed);
}

bool TtsFallbackChain::is_available() {
    if (primary_available()) return true;
    try {
        return secondary_.is_available();
    } catch (const std::exception& e) {
        std::cerr << "[TTS] Secondary availability check failed: " << e.what() << std::endl;
        return false;
    }
}

std::vector<TtsVoice> TtsFallbackChain::voices() {
    std::vector<TtsVoice> merged;
    auto add = [&merged](std::vector<TtsVoice> list) {
        for (auto& voice : list) {
            bool known = std::any_of(merged.begin(), merged.end(),
                                     [&voice](const TtsVoice& v) { return v.id == voice.id; });
            if (!known) merged.push_back(std::move(voice));
        }
    };

    try {
        if (primary_available()) add(primary_.voices());
        add(secondary_.voices());
    } catch (const std::exception& e) {
        std::cerr << "[TTS] Voice listing failed: " << e.what() << std::endl;
    }

    if (merged.empty()) merged.push_back({"en", "English (default)", "en"});
    return merged;
}

std::string TtsFallbackChain::engine_info() const {
    return primary_.engine_info() + " with fallback to " + secondary_.engine_info();
}

} // namespace voxchord
