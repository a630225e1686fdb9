#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace voxchord {

struct ProcessExecutionResult {
    bool success = false;           // Exited with status 0 before the deadline
    std::string standard_output;
    std::string standard_error;
    int exit_code = -1;
    std::chrono::milliseconds elapsed{0};
    bool timed_out = false;
};

// Runs an external program with captured stdout/stderr and a hard deadline.
// The child gets its own process group; on timeout the whole group is
// killed, so nothing it started outlives the call.
class ProcessRunner {
public:
    ProcessExecutionResult run(const std::vector<std::string>& argv,
                               std::chrono::milliseconds timeout,
                               const std::string& working_dir = "") const;
};

} // namespace voxchord
