#pragma once

#include "events.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace voxchord {

struct LlmResponse {
    bool success = false;
    std::string text;
    std::string error;
    ErrorKind error_kind = ErrorKind::None;

    static LlmResponse ok(std::string text) {
        LlmResponse response;
        response.success = true;
        response.text = std::move(text);
        return response;
    }

    static LlmResponse failure(ErrorKind kind, std::string error) {
        LlmResponse response;
        response.error_kind = kind;
        response.error = std::move(error);
        return response;
    }
};

class LlmClient {
public:
    virtual ~LlmClient() = default;

    virtual LlmResponse complete(const std::string& prompt,
                                 const std::string& system_prompt,
                                 const std::string& model) = 0;

    virtual LlmResponse complete_with_image(const std::string& prompt,
                                            const std::vector<uint8_t>& png,
                                            const std::string& system_prompt,
                                            const std::string& model) = 0;

    virtual bool is_configured() const = 0;
    virtual std::string name() const = 0;
};

} // namespace voxchord
