#include "capability_process_manager.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace voxchord {

CapabilityProcessManager::CapabilityProcessManager(Options options, ProcessRunner runner)
    : options_(std::move(options)), runner_(runner) {
    if (options_.scripts_dir.empty()) {
        options_.scripts_dir = (fs::path(options_.app_dir) / "scripts").string();
    }
    bridge_path_ = (fs::path(options_.scripts_dir) / options_.bridge_script).string();
}

bool CapabilityProcessManager::is_available() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!available_) {
        available_ = initialize_locked();
    }
    return *available_;
}

void CapabilityProcessManager::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    available_.reset();
    interpreter_.clear();
}

std::string CapabilityProcessManager::interpreter() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return interpreter_;
}

std::string CapabilityProcessManager::bridge_path() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bridge_path_;
}

std::vector<std::string> CapabilityProcessManager::candidates() const {
    std::vector<std::string> list;
    if (!options_.interpreter.empty()) {
        list.push_back(options_.interpreter);
    }

    if (!options_.app_dir.empty()) {
        fs::path bundled = fs::path(options_.app_dir) / "python" / "bin" / "python3";
        std::error_code ec;
        if (fs::exists(bundled, ec)) list.push_back(bundled.string());
    }

    for (const auto& name : options_.system_interpreters) {
        list.push_back(name);
    }
    return list;
}

bool CapabilityProcessManager::initialize_locked() {
    std::error_code ec;
    if (!fs::exists(bridge_path_, ec)) {
        std::cerr << "[Bridge] Bridge script not found: " << bridge_path_ << std::endl;
        return false;
    }

    for (const auto& candidate : candidates()) {
        if (!check_version(candidate)) continue;

        if (verify(candidate, bridge_path_)) {
            interpreter_ = candidate;
            std::cout << "[Bridge] Using " << candidate << " with " << bridge_path_ << std::endl;
            return true;
        }
        std::cerr << "[Bridge] " << candidate << " cannot run the bridge" << std::endl;
    }

    std::cerr << "[Bridge] No working interpreter found, speech bridge unavailable" << std::endl;
    return false;
}

bool CapabilityProcessManager::check_version(const std::string& interpreter) const {
    auto result = runner_.run({interpreter, "--version"}, options_.version_timeout);
    return result.success;
}

bool CapabilityProcessManager::verify(const std::string& interpreter,
                                      const std::string& bridge) const {
    auto result = runner_.run({interpreter, bridge, "--list-voices"}, options_.verify_timeout);
    if (!result.success) return false;

    try {
        json response = json::parse(result.standard_output);
        return response.is_object() && response.value("success", false);
    } catch (const json::exception& e) {
        std::cerr << "[Bridge] Unreadable voice list: " << e.what() << std::endl;
        return false;
    }
}

ProcessExecutionResult CapabilityProcessManager::invoke(const std::vector<std::string>& args,
                                                        std::chrono::milliseconds timeout) {
    if (!is_available()) {
        ProcessExecutionResult result;
        result.standard_error = "Speech bridge is not available";
        return result;
    }

    std::vector<std::string> argv;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        argv.push_back(interpreter_);
        argv.push_back(bridge_path_);
    }
    argv.insert(argv.end(), args.begin(), args.end());

    return runner_.run(argv, timeout, options_.scripts_dir);
}

} // namespace voxchord
