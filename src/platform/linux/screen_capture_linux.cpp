#include "screen_capture.hpp"
#include "paths.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>

namespace fs = std::filesystem;

namespace voxchord {

RegionScreenCapture::RegionScreenCapture(std::string temp_dir, std::chrono::milliseconds timeout,
                                         ProcessRunner runner)
    : temp_dir_(temp_dir.empty() ? voxchord::temp_dir() : std::move(temp_dir))
    , timeout_(timeout)
    , runner_(runner) {
}

CaptureResult RegionScreenCapture::capture_region() {
    CaptureResult result;
    TempFile image(make_temp_path(temp_dir_, "voxchord_capture", ".png"));

    // maim exits non-zero when the selection is dismissed with Escape or a right click
    auto run = runner_.run({"maim", "-s", "-u", image.path()}, timeout_);
    if (!run.success && run.exit_code == 127) {
        std::cout << "[Capture] maim not found, trying import" << std::endl;
        run = runner_.run({"import", image.path()}, timeout_);
        if (!run.success && run.exit_code == 127) {
            result.error = "No screen capture tool found. Install maim or ImageMagick.";
            return result;
        }
    }

    if (run.timed_out) {
        result.error = "Screen capture timed out";
        return result;
    }

    std::error_code ec;
    if (!run.success || !fs::exists(image.path(), ec) || fs::file_size(image.path(), ec) == 0) {
        result.cancelled = true;
        result.error = "Screen capture was cancelled";
        return result;
    }

    std::ifstream file(image.path(), std::ios::binary);
    result.png.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    if (result.png.empty()) {
        result.error = "Failed to read captured image";
        return result;
    }

    std::cout << "[Capture] Captured " << result.png.size() << " bytes" << std::endl;
    result.success = true;
    return result;
}

} // namespace voxchord
