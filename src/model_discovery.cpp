#include "model_discovery.hpp"

#include <iostream>

namespace voxchord {

ModelDiscovery::ModelDiscovery(ModelFetcher& fetcher, ModelCache& cache)
    : fetcher_(fetcher), cache_(cache) {}

std::vector<ModelDescriptor> ModelDiscovery::get_models(const std::string& credential,
                                                        bool force_refresh) {
    const std::string hash = ModelCache::credential_hash(credential);

    if (!force_refresh) {
        if (auto cached = cache_.get_valid(hash)) {
            last_source_ = "cache";
            return cached->models;
        }
    }

    FetchResult response = fetcher_.fetch_models(credential);
    if (response.success && response.status == 200) {
        std::string convention;
        auto models = parse_model_list(response.body, &convention);
        if (!models.empty()) {
            std::cout << "[Models] Loaded " << models.size() << " models (" << convention << ")" << std::endl;
            cache_.store(hash, models);
            last_source_ = "network";
            return models;
        }
        std::cerr << "[Models] Model list response could not be parsed" << std::endl;
    } else if (response.success) {
        std::cerr << "[Models] HTTP " << response.status << " while loading models" << std::endl;
    } else {
        std::cerr << "[Models] Failed to load models: " << response.error << std::endl;
    }

    if (auto stale = cache_.get_any(hash)) {
        std::cout << "[Models] Using cached list (" << stale->models.size() << " models)" << std::endl;
        last_source_ = "stale cache";
        return stale->models;
    }

    last_source_ = "default";
    return {default_model()};
}

} // namespace voxchord
