#include "paths.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

#include <unistd.h>

namespace fs = std::filesystem;

namespace voxchord {

namespace {

std::string xdg_dir(const char* variable, const char* fallback) {
    const char* xdg = std::getenv(variable);
    if (xdg && *xdg) return std::string(xdg) + "/voxchord";

    const char* home = std::getenv("HOME");
    if (!home || !*home) home = "/tmp";
    return std::string(home) + "/" + fallback + "/voxchord";
}

} // namespace

std::string config_dir() {
    return xdg_dir("XDG_CONFIG_HOME", ".config");
}

std::string data_dir() {
    return xdg_dir("XDG_DATA_HOME", ".local/share");
}

std::string cache_dir() {
    return xdg_dir("XDG_CACHE_HOME", ".cache");
}

std::string temp_dir() {
    std::error_code ec;
    fs::path tmp = fs::temp_directory_path(ec);
    return ec ? std::string("/tmp") : tmp.string();
}

std::string executable_dir() {
    std::error_code ec;
    fs::path exe = fs::read_symlink("/proc/self/exe", ec);
    if (ec) return fs::current_path(ec).string();
    return exe.parent_path().string();
}

std::string make_temp_path(const std::string& dir, const std::string& prefix,
                           const std::string& extension) {
    static std::atomic<unsigned> counter{0};

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()).count() % 1000;

    std::tm tm{};
    localtime_r(&t, &tm);

    std::ostringstream name;
    name << prefix << "_" << std::put_time(&tm, "%Y%m%d_%H%M%S") << "_"
         << std::setw(3) << std::setfill('0') << ms
         << "_" << getpid() << "_" << counter.fetch_add(1) << extension;

    return (fs::path(dir) / name.str()).string();
}

TempFile::~TempFile() {
    if (path_.empty()) return;
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        std::cerr << "[Files] Failed to delete " << path_ << ": " << ec.message() << std::endl;
    }
}

} // namespace voxchord
