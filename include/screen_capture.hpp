#pragma once

#include "process_runner.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace voxchord {

struct CaptureResult {
    bool success = false;
    bool cancelled = false;         // User dismissed the selection
    std::vector<uint8_t> png;
    std::string error;
};

// Interactive region selection returning a PNG
class ScreenCapture {
public:
    virtual ~ScreenCapture() = default;
    virtual CaptureResult capture_region() = 0;
};

// maim -s, falling back to ImageMagick's import
class RegionScreenCapture : public ScreenCapture {
public:
    explicit RegionScreenCapture(std::string temp_dir = "",
                                 std::chrono::milliseconds timeout = std::chrono::seconds(60),
                                 ProcessRunner runner = ProcessRunner());

    CaptureResult capture_region() override;

private:
    std::string temp_dir_;
    std::chrono::milliseconds timeout_;
    ProcessRunner runner_;
};

} // namespace voxchord
