#pragma once

#include "audio_recorder.hpp"
#include "clipboard.hpp"
#include "events.hpp"
#include "recording_session.hpp"
#include "task_executor.hpp"
#include "tray.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace voxchord {

// Owns the single live recording session. Mode-start / mode-end
// notifications arrive from the hotkey thread and run in order on a private
// control thread, so the microphone starts even while every pipeline worker
// is busy. Finished sessions are handed to the SessionHandler on the executor.
class RecordingSessionManager {
public:
    struct Options {
        std::string temp_dir;
        std::chrono::milliseconds release_grace{250};
        std::uintmax_t min_audio_bytes = 1024;  // Beyond the WAV header
    };

    using StateCallback = std::function<void(AppState state)>;

    RecordingSessionManager(AudioRecorder& recorder,
                            Clipboard& clipboard,
                            TaskExecutor& executor,
                            SessionHandler& handler,
                            Options options);

    void set_event_sink(EventSink sink) { sink_ = std::move(sink); }
    void set_state_callback(StateCallback callback) { state_callback_ = std::move(callback); }

    // Hotkey thread entry points; return immediately
    void on_mode_start(PipelineMode mode);
    void on_mode_end(PipelineMode mode);

    // Stops and discards the live session, if any (hotkey device lost)
    void cancel_current();

    // Blocks until queued start/stop/cancel requests have run
    void wait_idle();

    // Runs queued requests, then stops the control thread
    void shutdown();

    bool has_active_session() const;
    std::optional<PipelineMode> active_mode() const;

private:
    void begin_session(PipelineMode mode);
    void end_session(PipelineMode mode);
    void discard_current();
    void hand_off(RecordingSession session);
    void report_failure(PipelineMode mode, ErrorKind kind, const std::string& message);
    void set_state(AppState state);

    AudioRecorder& recorder_;
    Clipboard& clipboard_;
    TaskExecutor& executor_;
    SessionHandler& handler_;
    Options options_;

    EventSink sink_;
    StateCallback state_callback_;

    mutable std::mutex mutex_;
    std::optional<RecordingSession> current_;
    std::atomic<uint64_t> next_id_{1};

    // Last member: joined before the state its tasks touch is destroyed
    TaskExecutor control_{1};
};

} // namespace voxchord
