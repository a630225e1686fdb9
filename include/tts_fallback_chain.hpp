#pragma once

#include "tts_engine.hpp"

#include <mutex>
#include <optional>

namespace voxchord {

// Tries the primary engine, then the secondary. The primary's availability
// is checked once per instance. Never throws out of generate().
class TtsFallbackChain : public TtsEngine {
public:
    TtsFallbackChain(TtsEngine& primary, TtsEngine& secondary);

    TtsResult generate(const TtsRequest& request) override;
    bool is_available() override;
    std::vector<TtsVoice> voices() override;
    std::string engine_info() const override;

private:
    bool primary_available();

    TtsEngine& primary_;
    TtsEngine& secondary_;

    std::mutex mutex_;
    std::optional<bool> primary_available_;
};

} // namespace voxchord
