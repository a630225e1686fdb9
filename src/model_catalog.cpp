#include "model_catalog.hpp"
#include "text_utils.hpp"

#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>

using json = nlohmann::json;

namespace voxchord {

namespace {

// One logical field, spelled per convention
struct FieldName {
    const char* camel;
    const char* snake;
    const char* pascal;
};

constexpr FieldName kData = {"data", "data", "Data"};
constexpr FieldName kModels = {"models", "models", "Models"};
constexpr FieldName kId = {"id", "id", "Id"};
constexpr FieldName kName = {"name", "name", "Name"};
constexpr FieldName kDescription = {"description", "description", "Description"};
constexpr FieldName kPricing = {"pricing", "pricing", "Pricing"};
constexpr FieldName kPrompt = {"prompt", "prompt", "Prompt"};
constexpr FieldName kCompletion = {"completion", "completion", "Completion"};
constexpr FieldName kContextLength = {"contextLength", "context_length", "ContextLength"};

std::string normalize(const std::string& key) {
    std::string out;
    for (char c : key) {
        if (c != '_') out += c;
    }
    return to_lower(out);
}

const json* find_loose(const json& obj, const FieldName& field) {
    const std::string wanted = normalize(field.camel);
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        if (normalize(it.key()) == wanted) return &it.value();
    }
    return nullptr;
}

const json* find_field(const json& obj, const FieldName& field, NamingConvention convention) {
    if (!obj.is_object()) return nullptr;

    const char* key = nullptr;
    switch (convention) {
        case NamingConvention::CamelCase: key = field.camel; break;
        case NamingConvention::SnakeCase: key = field.snake; break;
        case NamingConvention::PascalCase: key = field.pascal; break;
        case NamingConvention::CaseInsensitive: return find_loose(obj, field);
    }
    auto it = obj.find(key);
    return it == obj.end() ? nullptr : &*it;
}

// The field is present, but spelled for another convention
bool spelled_differently(const json& obj, const FieldName& field, NamingConvention convention) {
    if (convention == NamingConvention::CaseInsensitive || !obj.is_object()) return false;
    return find_field(obj, field, convention) == nullptr && find_loose(obj, field) != nullptr;
}

double to_number(const json* value, double fallback) {
    if (!value) return fallback;
    double number = fallback;
    if (value->is_number()) {
        number = value->get<double>();
    } else if (value->is_string()) {
        try {
            number = std::stod(value->get<std::string>());
        } catch (const std::invalid_argument&) {
            return fallback;
        } catch (const std::out_of_range&) {
            return fallback;
        }
    }
    return std::isfinite(number) ? number : fallback;
}

// Remote values past the int range are clamped before conversion
int to_context_length(double context) {
    constexpr int DEFAULT_CONTEXT_LENGTH = 4096;
    if (!(context > 0)) return DEFAULT_CONTEXT_LENGTH;
    if (context >= static_cast<double>(std::numeric_limits<int>::max())) {
        return std::numeric_limits<int>::max();
    }
    return static_cast<int>(context);
}

std::string to_text(const json* value) {
    if (!value || !value->is_string()) return "";
    return value->get<std::string>();
}

} // namespace

const char* to_string(NamingConvention convention) {
    switch (convention) {
        case NamingConvention::CamelCase: return "camelCase";
        case NamingConvention::SnakeCase: return "snake_case";
        case NamingConvention::PascalCase: return "PascalCase";
        case NamingConvention::CaseInsensitive: return "case-insensitive";
    }
    return "unknown";
}

std::optional<std::vector<ModelDescriptor>> parse_models(const json& payload,
                                                         NamingConvention convention) {
    // The list sits under "data" (OpenRouter) or "models" (Ollama-style)
    const json* list = nullptr;
    for (const FieldName* field : {&kData, &kModels}) {
        if (spelled_differently(payload, *field, convention)) return std::nullopt;
        list = find_field(payload, *field, convention);
        if (list) break;
    }
    if (!list || !list->is_array()) return std::nullopt;

    std::vector<ModelDescriptor> models;
    for (const auto& entry : *list) {
        if (!entry.is_object()) continue;

        for (const FieldName* field : {&kId, &kName, &kDescription, &kPricing, &kContextLength}) {
            if (spelled_differently(entry, *field, convention)) return std::nullopt;
        }

        ModelDescriptor model;
        model.id = trim(to_text(find_field(entry, kId, convention)));
        if (model.id.empty()) continue;

        model.name = to_text(find_field(entry, kName, convention));
        if (model.name.empty()) model.name = model.id;
        model.description = to_text(find_field(entry, kDescription, convention));

        if (const json* pricing = find_field(entry, kPricing, convention)) {
            if (spelled_differently(*pricing, kPrompt, convention)) return std::nullopt;
            model.prompt_price = to_number(find_field(*pricing, kPrompt, convention), 0.0);
            model.completion_price = to_number(find_field(*pricing, kCompletion, convention), 0.0);
        }

        model.context_length =
            to_context_length(to_number(find_field(entry, kContextLength, convention), 0.0));

        models.push_back(std::move(model));
    }

    if (models.empty()) return std::nullopt;
    return models;
}

std::vector<ModelDescriptor> parse_model_list(const std::string& body,
                                              std::string* convention_used) {
    json payload;
    try {
        payload = json::parse(body);
    } catch (const json::exception& e) {
        std::cerr << "[Models] Response is not JSON: " << e.what() << std::endl;
        return {};
    }

    for (auto convention : {NamingConvention::CamelCase, NamingConvention::SnakeCase,
                            NamingConvention::PascalCase, NamingConvention::CaseInsensitive}) {
        auto models = parse_models(payload, convention);
        if (models) {
            if (convention_used) *convention_used = to_string(convention);
            return *models;
        }
    }

    std::cerr << "[Models] No naming convention matched the model list" << std::endl;
    return {};
}

ModelDescriptor default_model() {
    ModelDescriptor model;
    model.id = "anthropic/claude-sonnet-4";
    model.name = "Claude Sonnet 4 (Fallback)";
    model.description = "Fallback model when API models cannot be loaded";
    model.prompt_price = 0.015;
    model.context_length = 200000;
    return model;
}

void to_json(json& j, const ModelDescriptor& model) {
    j = json{
        {"id", model.id},
        {"name", model.name},
        {"description", model.description},
        {"prompt_price", model.prompt_price},
        {"completion_price", model.completion_price},
        {"context_length", model.context_length}
    };
}

void from_json(const json& j, ModelDescriptor& model) {
    model.id = j.value("id", "");
    model.name = j.value("name", model.id);
    model.description = j.value("description", "");
    model.prompt_price = j.value("prompt_price", 0.0);
    model.completion_price = j.value("completion_price", 0.0);
    model.context_length = j.value("context_length", 4096);
}

} // namespace voxchord
