#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace voxchord {

struct ModelDescriptor {
    std::string id;
    std::string name;
    std::string description;
    double prompt_price = 0.0;          // Per token, as reported by the provider
    double completion_price = 0.0;
    int context_length = 4096;

    bool operator==(const ModelDescriptor& other) const {
        return id == other.id && name == other.name && description == other.description &&
               prompt_price == other.prompt_price && completion_price == other.completion_price &&
               context_length == other.context_length;
    }
};

enum class NamingConvention {
    CamelCase,          // contextLength
    SnakeCase,          // context_length
    PascalCase,         // ContextLength
    CaseInsensitive     // any of the above, matched loosely
};

const char* to_string(NamingConvention convention);

// Parses one provider payload under a single naming convention. Returns
// nullopt when the payload does not follow that convention or lists no
// usable model.
std::optional<std::vector<ModelDescriptor>> parse_models(const nlohmann::json& payload,
                                                         NamingConvention convention);

// Tries each convention in turn; empty when none fits
std::vector<ModelDescriptor> parse_model_list(const std::string& body,
                                              std::string* convention_used = nullptr);

// Used when neither the network nor the cache has anything
ModelDescriptor default_model();

void to_json(nlohmann::json& j, const ModelDescriptor& model);
void from_json(const nlohmann::json& j, ModelDescriptor& model);

} // namespace voxchord
