#pragma once

#include "config.hpp"
#include "llm_client.hpp"
#include "model_discovery.hpp"

#include <nlohmann/json.hpp>

#include <mutex>
#include <string>

namespace voxchord {

// OpenRouter chat completions (OpenAI-compatible) and model listing
class OpenRouterClient : public LlmClient, public ModelFetcher {
public:
    explicit OpenRouterClient(OpenRouterSettings settings);

    void update_settings(const OpenRouterSettings& settings);

    LlmResponse complete(const std::string& prompt,
                         const std::string& system_prompt,
                         const std::string& model) override;

    LlmResponse complete_with_image(const std::string& prompt,
                                    const std::vector<uint8_t>& png,
                                    const std::string& system_prompt,
                                    const std::string& model) override;

    bool is_configured() const override;
    std::string name() const override { return "OpenRouter"; }

    FetchResult fetch_models(const std::string& credential) override;

    // choices[0].message.content from a completion response
    static LlmResponse parse_completion(const std::string& body);

private:
    LlmResponse post_chat(const nlohmann::json& messages, const std::string& model);
    OpenRouterSettings settings() const;

    mutable std::mutex mutex_;
    OpenRouterSettings settings_;
};

} // namespace voxchord
