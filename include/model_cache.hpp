#pragma once

#include "model_catalog.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace voxchord {

struct ModelCacheEntry {
    std::string credential_hash;
    std::vector<ModelDescriptor> models;
    std::chrono::system_clock::time_point cached_at;
    std::chrono::system_clock::time_point expires_at;

    bool is_valid_for(const std::string& hash, std::chrono::system_clock::time_point now) const {
        return credential_hash == hash && now < expires_at && !models.empty();
    }
};

struct ModelCacheInfo {
    bool exists = false;
    bool valid = false;
    std::size_t model_count = 0;
    std::chrono::seconds age{0};
    std::chrono::seconds remaining{0};

    std::string status_text() const;
};

// Model lists keyed by credential hash, in memory and as
// <dir>/models_<hash prefix>.json. Empty dir keeps everything in memory.
class ModelCache {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    explicit ModelCache(std::string cache_dir,
                        std::chrono::seconds ttl = std::chrono::hours(24),
                        Clock clock = [] { return std::chrono::system_clock::now(); });

    // Unexpired entry for this credential
    std::optional<ModelCacheEntry> get_valid(const std::string& credential_hash);

    // Any entry for this credential, expired or not (stale-if-error)
    std::optional<ModelCacheEntry> get_any(const std::string& credential_hash);

    void store(const std::string& credential_hash, const std::vector<ModelDescriptor>& models);
    void invalidate(const std::string& credential_hash);
    void clear_all();

    // Deletes expired files; returns how many
    std::size_t cleanup_expired();

    ModelCacheInfo info(const std::string& credential_hash);

    // SHA-256 hex of the credential, "default" when empty
    static std::string credential_hash(const std::string& credential);

private:
    std::optional<ModelCacheEntry> lookup(const std::string& hash);
    std::optional<ModelCacheEntry> load_file(const std::string& path) const;
    bool save_file(const ModelCacheEntry& entry) const;
    std::string file_path(const std::string& hash) const;

    std::string cache_dir_;
    std::chrono::seconds ttl_;
    Clock clock_;

    std::mutex mutex_;
    std::map<std::string, ModelCacheEntry> entries_;
};

} // namespace voxchord
