#include "openrouter_client.hpp"
#include "text_utils.hpp"

#include <httplib.h>

#include <iostream>

using json = nlohmann::json;

namespace voxchord {

namespace {

constexpr const char* API_PREFIX = "/api/v1";

httplib::Headers default_headers(const std::string& api_key) {
    httplib::Headers headers = {
        {"User-Agent", "VoxChord/1.0 (Linux)"},
        {"X-Title", "VoxChord"}
    };
    if (!api_key.empty()) {
        headers.emplace("Authorization", "Bearer " + api_key);
    }
    return headers;
}

std::string error_excerpt(const std::string& body) {
    return preview(body, 200);
}

} // namespace

OpenRouterClient::OpenRouterClient(OpenRouterSettings settings)
    : settings_(std::move(settings)) {}

void OpenRouterClient::update_settings(const OpenRouterSettings& settings) {
    std::lock_guard<std::mutex> lock(mutex_);
    settings_ = settings;
}

OpenRouterSettings OpenRouterClient::settings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return settings_;
}

bool OpenRouterClient::is_configured() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !settings_.api_key.empty();
}

LlmResponse OpenRouterClient::complete(const std::string& prompt,
                                       const std::string& system_prompt,
                                       const std::string& model) {
    json messages = json::array();
    if (!system_prompt.empty()) {
        messages.push_back({{"role", "system"}, {"content", system_prompt}});
    }
    messages.push_back({{"role", "user"}, {"content", prompt}});
    return post_chat(messages, model);
}

LlmResponse OpenRouterClient::complete_with_image(const std::string& prompt,
                                                  const std::vector<uint8_t>& png,
                                                  const std::string& system_prompt,
                                                  const std::string& model) {
    json content = json::array();
    content.push_back({{"type", "text"}, {"text", prompt}});
    content.push_back({
        {"type", "image_url"},
        {"image_url", {{"url", "data:image/png;base64," + base64_encode(png)}}}
    });

    json messages = json::array();
    if (!system_prompt.empty()) {
        messages.push_back({{"role", "system"}, {"content", system_prompt}});
    }
    messages.push_back({{"role", "user"}, {"content", content}});
    return post_chat(messages, model);
}

LlmResponse OpenRouterClient::post_chat(const json& messages, const std::string& model) {
    const OpenRouterSettings s = settings();
    if (s.api_key.empty()) {
        return LlmResponse::failure(ErrorKind::Llm, "OpenRouter API key is not configured");
    }

    json request = {
        {"model", model.empty() ? s.selected_model : model},
        {"messages", messages},
        {"temperature", s.temperature},
        {"max_tokens", s.max_tokens},
        {"stream", false}
    };

    httplib::Client cli(s.base_url);
    cli.set_connection_timeout(10);
    cli.set_read_timeout(s.timeout_seconds);
    cli.set_write_timeout(s.timeout_seconds);

    auto res = cli.Post(std::string(API_PREFIX) + "/chat/completions",
                        default_headers(s.api_key), request.dump(), "application/json");
    if (!res) {
        std::cerr << "[OpenRouter] Connection failed: " << static_cast<int>(res.error()) << std::endl;
        return LlmResponse::failure(ErrorKind::Network,
                                    "Cannot reach OpenRouter (error " +
                                    std::to_string(static_cast<int>(res.error())) + ")");
    }
    if (res->status != 200) {
        std::cerr << "[OpenRouter] HTTP Error " << res->status << ": " << error_excerpt(res->body) << std::endl;
        return LlmResponse::failure(ErrorKind::Llm,
                                    "OpenRouter returned HTTP " + std::to_string(res->status) +
                                    ": " + error_excerpt(res->body));
    }

    return parse_completion(res->body);
}

LlmResponse OpenRouterClient::parse_completion(const std::string& body) {
    try {
        json response = json::parse(body);
        if (response.contains("error")) {
            std::string message = response["error"].is_object()
                                      ? response["error"].value("message", "unknown error")
                                      : response["error"].dump();
            return LlmResponse::failure(ErrorKind::Llm, "OpenRouter error: " + message);
        }

        const auto& choices = response.at("choices");
        if (!choices.is_array() || choices.empty()) {
            return LlmResponse::failure(ErrorKind::ResponseParse, "OpenRouter response has no choices");
        }
        const auto& content = choices[0].at("message").at("content");
        if (!content.is_string()) {
            return LlmResponse::failure(ErrorKind::ResponseParse, "OpenRouter response has no text content");
        }

        std::string text = trim(content.get<std::string>());
        if (text.empty()) {
            return LlmResponse::failure(ErrorKind::Llm, "OpenRouter returned an empty response");
        }
        return LlmResponse::ok(text);
    } catch (const json::exception& e) {
        std::cerr << "[OpenRouter] JSON Parse Error: " << e.what() << std::endl;
        return LlmResponse::failure(ErrorKind::ResponseParse,
                                    std::string("Invalid OpenRouter response: ") + e.what());
    }
}

FetchResult OpenRouterClient::fetch_models(const std::string& credential) {
    const OpenRouterSettings s = settings();
    FetchResult result;

    httplib::Client cli(s.base_url);
    cli.set_connection_timeout(10);
    cli.set_read_timeout(30);

    auto res = cli.Get(std::string(API_PREFIX) + "/models", default_headers(credential));
    if (!res) {
        result.error = "Connection failed (error " + std::to_string(static_cast<int>(res.error())) + ")";
        return result;
    }

    result.success = true;
    result.status = res->status;
    result.body = res->body;
    return result;
}

} // namespace voxchord
