#pragma once

#include "model_cache.hpp"
#include "model_catalog.hpp"

#include <string>
#include <vector>

namespace voxchord {

struct FetchResult {
    bool success = false;       // A response arrived
    int status = 0;
    std::string body;
    std::string error;
};

// Retrieves the raw model list from a provider
class ModelFetcher {
public:
    virtual ~ModelFetcher() = default;
    virtual FetchResult fetch_models(const std::string& credential) = 0;
};

// Cache first, then network, then stale cache, then the built-in default.
// Always returns at least one model.
class ModelDiscovery {
public:
    ModelDiscovery(ModelFetcher& fetcher, ModelCache& cache);

    std::vector<ModelDescriptor> get_models(const std::string& credential, bool force_refresh = false);

    // Where the last list came from: "cache", "network", "stale cache" or "default"
    const std::string& last_source() const { return last_source_; }

private:
    ModelFetcher& fetcher_;
    ModelCache& cache_;
    std::string last_source_;
};

} // namespace voxchord
