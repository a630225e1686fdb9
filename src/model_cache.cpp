#include "model_cache.hpp"

#include <nlohmann/json.hpp>
#include <openssl/evp.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace voxchord {

namespace {

constexpr const char* CACHE_VERSION = "1.0";

int64_t to_epoch(std::chrono::system_clock::time_point t) {
    return std::chrono::duration_cast<std::chrono::seconds>(t.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_epoch(int64_t seconds) {
    return std::chrono::system_clock::time_point(std::chrono::seconds(seconds));
}

} // namespace

std::string ModelCacheInfo::status_text() const {
    if (!exists) return "No cache";

    auto hours = std::chrono::duration_cast<std::chrono::hours>(age).count();
    std::ostringstream out;
    out << model_count << " models, cached ";
    if (hours > 0) {
        out << hours << "h ago";
    } else {
        out << std::chrono::duration_cast<std::chrono::minutes>(age).count() << "m ago";
    }
    out << (valid ? "" : " (expired)");
    return out.str();
}

ModelCache::ModelCache(std::string cache_dir, std::chrono::seconds ttl, Clock clock)
    : cache_dir_(std::move(cache_dir)), ttl_(ttl), clock_(std::move(clock)) {
    if (!cache_dir_.empty()) {
        std::error_code ec;
        fs::create_directories(cache_dir_, ec);
        if (ec) {
            std::cerr << "[ModelCache] Cannot create " << cache_dir_ << ": " << ec.message() << std::endl;
        }
    }
}

std::string ModelCache::credential_hash(const std::string& credential) {
    if (credential.empty()) return "default";

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_Digest(credential.data(), credential.size(), digest, &length, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }

    std::ostringstream hex;
    for (unsigned int i = 0; i < length; ++i) {
        hex << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    }
    return hex.str();
}

std::string ModelCache::file_path(const std::string& hash) const {
    return (fs::path(cache_dir_) / ("models_" + hash.substr(0, 8) + ".json")).string();
}

std::optional<ModelCacheEntry> ModelCache::lookup(const std::string& hash) {
    auto it = entries_.find(hash);
    if (it != entries_.end()) return it->second;

    if (cache_dir_.empty()) return std::nullopt;

    auto entry = load_file(file_path(hash));
    // Two credentials can share a file name prefix
    if (!entry || entry->credential_hash != hash) return std::nullopt;

    entries_[hash] = *entry;
    return entry;
}

std::optional<ModelCacheEntry> ModelCache::get_valid(const std::string& credential_hash) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto entry = lookup(credential_hash);
    if (!entry || !entry->is_valid_for(credential_hash, clock_())) return std::nullopt;
    return entry;
}

std::optional<ModelCacheEntry> ModelCache::get_any(const std::string& credential_hash) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto entry = lookup(credential_hash);
    if (!entry || entry->models.empty()) return std::nullopt;
    return entry;
}

void ModelCache::store(const std::string& credential_hash, const std::vector<ModelDescriptor>& models) {
    ModelCacheEntry entry;
    entry.credential_hash = credential_hash;
    entry.models = models;
    entry.cached_at = clock_();
    entry.expires_at = entry.cached_at + ttl_;

    std::lock_guard<std::mutex> lock(mutex_);
    entries_[credential_hash] = entry;
    if (!cache_dir_.empty() && !save_file(entry)) {
        std::cerr << "[ModelCache] Keeping models in memory only" << std::endl;
    }
}

void ModelCache::invalidate(const std::string& credential_hash) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(credential_hash);
    if (cache_dir_.empty()) return;

    std::error_code ec;
    fs::remove(file_path(credential_hash), ec);
}

void ModelCache::clear_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    if (cache_dir_.empty()) return;

    std::error_code ec;
    for (const auto& file : fs::directory_iterator(cache_dir_, ec)) {
        const std::string name = file.path().filename().string();
        if (name.rfind("models_", 0) == 0 && file.path().extension() == ".json") {
            fs::remove(file.path(), ec);
        }
    }
}

std::size_t ModelCache::cleanup_expired() {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = clock_();

    for (auto it = entries_.begin(); it != entries_.end();) {
        if (now >= it->second.expires_at) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }

    std::size_t removed = 0;
    if (cache_dir_.empty()) return removed;

    std::error_code ec;
    for (const auto& file : fs::directory_iterator(cache_dir_, ec)) {
        const std::string name = file.path().filename().string();
        if (name.rfind("models_", 0) != 0 || file.path().extension() != ".json") continue;

        auto entry = load_file(file.path().string());
        // Unreadable files count as expired
        if (!entry || now >= entry->expires_at) {
            std::error_code rm_ec;
            if (fs::remove(file.path(), rm_ec)) ++removed;
        }
    }
    return removed;
}

ModelCacheInfo ModelCache::info(const std::string& credential_hash) {
    std::lock_guard<std::mutex> lock(mutex_);
    ModelCacheInfo info;
    auto entry = lookup(credential_hash);
    if (!entry) return info;

    const auto now = clock_();
    info.exists = true;
    info.valid = entry->is_valid_for(credential_hash, now);
    info.model_count = entry->models.size();
    info.age = std::chrono::duration_cast<std::chrono::seconds>(now - entry->cached_at);
    if (info.valid) {
        info.remaining = std::chrono::duration_cast<std::chrono::seconds>(entry->expires_at - now);
    }
    return info;
}

std::optional<ModelCacheEntry> ModelCache::load_file(const std::string& path) const {
    std::error_code ec;
    if (!fs::exists(path, ec)) return std::nullopt;

    try {
        std::ifstream file(path);
        if (!file.is_open()) return std::nullopt;

        json j = json::parse(file);
        ModelCacheEntry entry;
        entry.credential_hash = j.at("credential_hash").get<std::string>();
        entry.cached_at = from_epoch(j.at("cached_at").get<int64_t>());
        entry.expires_at = from_epoch(j.at("expires_at").get<int64_t>());
        entry.models = j.at("models").get<std::vector<ModelDescriptor>>();

        // A truncated write leaves fewer models than recorded
        if (j.value("model_count", -1) != static_cast<int>(entry.models.size())) {
            std::cerr << "[ModelCache] Integrity check failed for " << path << std::endl;
            return std::nullopt;
        }
        return entry;
    } catch (const json::exception& e) {
        std::cerr << "[ModelCache] Corrupt cache file " << path << ": " << e.what() << std::endl;
        return std::nullopt;
    }
}

bool ModelCache::save_file(const ModelCacheEntry& entry) const {
    json j = {
        {"version", CACHE_VERSION},
        {"credential_hash", entry.credential_hash},
        {"cached_at", to_epoch(entry.cached_at)},
        {"expires_at", to_epoch(entry.expires_at)},
        {"model_count", entry.models.size()},
        {"models", entry.models}
    };

    const std::string path = file_path(entry.credential_hash);
    const std::string tmp = path + ".tmp";
    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!file.is_open()) {
            std::cerr << "[ModelCache] Cannot write " << tmp << std::endl;
            return false;
        }
        file << j.dump(2);
        if (!file) {
            std::cerr << "[ModelCache] Write failed for " << tmp << std::endl;
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        std::cerr << "[ModelCache] Cannot replace " << path << ": " << ec.message() << std::endl;
        fs::remove(tmp, ec);
        return false;
    }
    return true;
}

} // namespace voxchord
