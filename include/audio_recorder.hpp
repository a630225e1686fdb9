#pragma once

#include <string>

namespace voxchord {

// Records microphone audio into a WAV file between start() and stop()
class AudioRecorder {
public:
    virtual ~AudioRecorder() = default;

    virtual bool start(const std::string& output_path) = 0;

    // Stops capture and finalizes the file at the path given to start()
    virtual bool stop() = 0;

    virtual bool is_recording() const = 0;
};

} // namespace voxchord
