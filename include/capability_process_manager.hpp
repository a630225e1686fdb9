#pragma once

#include "process_runner.hpp"

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace voxchord {

// An external helper reached by spawning a process per request
class CapabilityProvider {
public:
    virtual ~CapabilityProvider() = default;

    // Locates and verifies the helper on first call; cached afterwards
    virtual bool is_available() = 0;

    // Runs the helper with the given arguments. Never throws.
    virtual ProcessExecutionResult invoke(const std::vector<std::string>& args,
                                          std::chrono::milliseconds timeout) = 0;
};

// Locates a Python interpreter able to run the speech bridge script:
// configured path, then <app>/python/bin/python3, then python3 and python
// from PATH. A candidate is accepted once "--list-voices" succeeds.
class CapabilityProcessManager : public CapabilityProvider {
public:
    struct Options {
        std::string interpreter;                    // Explicit path, tried first
        std::string app_dir;                        // For the bundled interpreter
        std::string scripts_dir;                    // Empty: <app_dir>/scripts
        std::string bridge_script = "kitten_tts_bridge.py";
        std::vector<std::string> system_interpreters{"python3", "python"};
        std::chrono::milliseconds version_timeout{5000};
        std::chrono::milliseconds verify_timeout{10000};
    };

    explicit CapabilityProcessManager(Options options, ProcessRunner runner = ProcessRunner());

    bool is_available() override;
    ProcessExecutionResult invoke(const std::vector<std::string>& args,
                                  std::chrono::milliseconds timeout) override;

    // Forget the located interpreter; the next call searches again
    void reset();

    std::string interpreter() const;
    std::string bridge_path() const;

private:
    bool initialize_locked();
    std::vector<std::string> candidates() const;
    bool check_version(const std::string& interpreter) const;
    bool verify(const std::string& interpreter, const std::string& bridge) const;

    Options options_;
    ProcessRunner runner_;

    mutable std::mutex mutex_;
    std::optional<bool> available_;
    std::string interpreter_;
    std::string bridge_path_;
};

} // namespace voxchord
