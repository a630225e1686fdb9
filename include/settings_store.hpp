#pragma once

#include "config.hpp"

#include <string>

namespace voxchord {

// Persists Config as JSON. Missing keys keep their compiled-in defaults and
// unknown keys are ignored, so older files keep loading.
class SettingsStore {
public:
    // Empty path: <config_dir>/settings.json
    explicit SettingsStore(std::string path = "");

    // Defaults when the file is missing or malformed.
    // OPENROUTER_API_KEY takes precedence over the stored key.
    Config load() const;

    // Writes atomically. A key that came from the environment is not stored.
    bool save(const Config& config) const;

    bool exists() const;
    const std::string& path() const { return path_; }

    static std::string to_json_text(const Config& config);
    static bool from_json_text(const std::string& text, Config& config, std::string& error);

private:
    std::string path_;
};

} // namespace voxchord
