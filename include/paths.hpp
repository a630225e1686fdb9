#pragma once

#include <string>
#include <utility>

namespace voxchord {

// XDG base directories with a voxchord subdirectory
std::string config_dir();   // $XDG_CONFIG_HOME/voxchord or ~/.config/voxchord
std::string data_dir();     // $XDG_DATA_HOME/voxchord or ~/.local/share/voxchord
std::string cache_dir();    // $XDG_CACHE_HOME/voxchord or ~/.cache/voxchord

std::string temp_dir();
std::string executable_dir();

// Unique path "<dir>/<prefix>_<yyyyMMdd_HHmmss_fff>_<n><extension>"
std::string make_temp_path(const std::string& dir, const std::string& prefix,
                           const std::string& extension);

// Removes the file on destruction unless released
class TempFile {
public:
    explicit TempFile(std::string path) : path_(std::move(path)) {}
    ~TempFile();

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    const std::string& path() const { return path_; }
    void release() { path_.clear(); }

private:
    std::string path_;
};

} // namespace voxchord
