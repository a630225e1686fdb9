#include "ollama_client.hpp"
#include "text_utils.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <iostream>

using json = nlohmann::json;

namespace voxchord {

OllamaClient::OllamaClient(OllamaSettings settings)
    : settings_(std::move(settings)) {}

void OllamaClient::update_settings(const OllamaSettings& settings) {
    std::lock_guard<std::mutex> lock(mutex_);
    settings_ = settings;
}

OllamaSettings OllamaClient::settings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return settings_;
}

bool OllamaClient::is_configured() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !settings_.server_url.empty() && !settings_.selected_model.empty();
}

LlmResponse OllamaClient::complete(const std::string& prompt,
                                   const std::string& system_prompt,
                                   const std::string& model) {
    return generate(prompt, nullptr, system_prompt, model);
}

LlmResponse OllamaClient::complete_with_image(const std::string& prompt,
                                              const std::vector<uint8_t>& png,
                                              const std::string& system_prompt,
                                              const std::string& model) {
    return generate(prompt, &png, system_prompt, model);
}

LlmResponse OllamaClient::generate(const std::string& prompt, const std::vector<uint8_t>* png,
                                   const std::string& system_prompt, const std::string& model) {
    const OllamaSettings s = settings();

    std::string model_name = model;
    if (model_name.empty()) model_name = png ? s.vision_model : s.selected_model;

    json request = {
        {"model", model_name},
        {"prompt", prompt},
        {"stream", false}
    };
    if (!system_prompt.empty()) {
        request["system"] = system_prompt;
    }
    if (png) {
        request["images"] = json::array({base64_encode(*png)});
    }

    httplib::Client cli(s.server_url);
    cli.set_connection_timeout(5);
    cli.set_read_timeout(s.timeout_seconds);

    auto res = cli.Post("/api/generate", request.dump(), "application/json");
    if (!res) {
        std::cerr << "[Ollama] Connection failed: " << static_cast<int>(res.error()) << std::endl;
        return LlmResponse::failure(ErrorKind::Network, "Cannot reach Ollama at " + s.server_url);
    }
    if (res->status != 200) {
        std::cerr << "[Ollama] HTTP Error " << res->status << ": " << preview(res->body, 200) << std::endl;
        return LlmResponse::failure(ErrorKind::Llm,
                                    "Ollama returned HTTP " + std::to_string(res->status) +
                                    ": " + preview(res->body, 200));
    }

    try {
        auto body = json::parse(res->body);
        if (!body.contains("response") || !body["response"].is_string()) {
            return LlmResponse::failure(ErrorKind::ResponseParse, "Ollama response has no text");
        }
        std::string text = trim(body["response"].get<std::string>());
        if (text.empty()) {
            return LlmResponse::failure(ErrorKind::Llm, "Ollama returned an empty response");
        }
        return LlmResponse::ok(text);
    } catch (const json::exception& e) {
        std::cerr << "[Ollama] JSON Parse Error: " << e.what() << std::endl;
        return LlmResponse::failure(ErrorKind::ResponseParse,
                                    std::string("Invalid Ollama response: ") + e.what());
    }
}

std::vector<std::string> OllamaClient::available_models() {
    const OllamaSettings s = settings();
    httplib::Client cli(s.server_url);
    cli.set_read_timeout(5);

    std::vector<std::string> models;
    auto res = cli.Get("/api/tags");
    if (!res || res->status != 200) {
        std::cerr << "[Ollama] Cannot list models at " << s.server_url << std::endl;
        return models;
    }

    try {
        auto body = json::parse(res->body);
        if (body.contains("models") && body["models"].is_array()) {
            for (const auto& item : body["models"]) {
                if (item.contains("name")) {
                    models.push_back(item["name"].get<std::string>());
                }
            }
        }
    } catch (const json::exception& e) {
        std::cerr << "[Ollama] JSON Parse Error: " << e.what() << std::endl;
    }
    return models;
}

} // namespace voxchord
