#pragma once

#include "config.hpp"
#include "llm_client.hpp"

#include <mutex>
#include <string>
#include <vector>

namespace voxchord {

// Local Ollama server: /api/generate for prompts and images, /api/tags for models
class OllamaClient : public LlmClient {
public:
    explicit OllamaClient(OllamaSettings settings);

    void update_settings(const OllamaSettings& settings);

    LlmResponse complete(const std::string& prompt,
                         const std::string& system_prompt,
                         const std::string& model) override;

    LlmResponse complete_with_image(const std::string& prompt,
                                    const std::vector<uint8_t>& png,
                                    const std::string& system_prompt,
                                    const std::string& model) override;

    bool is_configured() const override;
    std::string name() const override { return "Ollama"; }

    std::vector<std::string> available_models();

private:
    LlmResponse generate(const std::string& prompt, const std::vector<uint8_t>* png,
                         const std::string& system_prompt, const std::string& model);
    OllamaSettings settings() const;

    mutable std::mutex mutex_;
    OllamaSettings settings_;
};

} // namespace voxchord
