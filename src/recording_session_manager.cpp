#include "recording_session_manager.hpp"
#include "paths.hpp"
#include "wav_file.hpp"

#include <filesystem>
#include <iostream>
#include <thread>

namespace fs = std::filesystem;

namespace voxchord {

RecordingSessionManager::RecordingSessionManager(AudioRecorder& recorder,
                                                 Clipboard& clipboard,
                                                 TaskExecutor& executor,
                                                 SessionHandler& handler,
                                                 Options options)
    : recorder_(recorder)
    , clipboard_(clipboard)
    , executor_(executor)
    , handler_(handler)
    , options_(std::move(options)) {
    if (options_.temp_dir.empty()) options_.temp_dir = temp_dir();
}

void RecordingSessionManager::on_mode_start(PipelineMode mode) {
    control_.post("mode-start", [this, mode] { begin_session(mode); });
}

void RecordingSessionManager::on_mode_end(PipelineMode mode) {
    control_.post("mode-end", [this, mode] { end_session(mode); });
}

void RecordingSessionManager::cancel_current() {
    control_.post("cancel-session", [this] { discard_current(); });
}

void RecordingSessionManager::wait_idle() {
    control_.wait_idle();
}

void RecordingSessionManager::shutdown() {
    control_.shutdown();
}

bool RecordingSessionManager::has_active_session() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_.has_value();
}

std::optional<PipelineMode> RecordingSessionManager::active_mode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!current_) return std::nullopt;
    return current_->mode;
}

void RecordingSessionManager::begin_session(PipelineMode mode) {
    RecordingSession session;
    session.id = next_id_.fetch_add(1);
    session.mode = mode;
    session.started_at = std::chrono::system_clock::now();

    if (!mode_records_audio(mode)) {
        // Screen capture and clipboard speech run once, on press
        std::cout << "[Session] " << to_string(mode) << " triggered" << std::endl;
        hand_off(std::move(session));
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (current_) {
            std::cout << "[Session] " << to_string(mode) << " ignored, "
                      << to_string(current_->mode) << " is recording" << std::endl;
            return;
        }
    }

    if (mode == PipelineMode::ClipboardPromptLLM) {
        session.clipboard_snapshot = clipboard_.get_text();
    }

    session.audio_path = make_temp_path(options_.temp_dir, "voxchord_recording", ".wav");
    if (!recorder_.start(session.audio_path)) {
        report_failure(mode, ErrorKind::Recording, "Failed to start recording");
        return;
    }

    std::cout << "[Session] Recording " << to_string(mode) << " (#" << session.id << ")" << std::endl;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        current_ = std::move(session);
    }
    set_state(AppState::Recording);
}

void RecordingSessionManager::end_session(PipelineMode mode) {
    RecordingSession session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!current_ || current_->mode != mode) return;
        session = std::move(*current_);
        current_.reset();
    }

    if (!recorder_.stop()) {
        std::error_code ec;
        fs::remove(session.audio_path, ec);
        report_failure(mode, ErrorKind::Recording, "Failed to finalize recording");
        return;
    }

    // Let the writer flush before the file is inspected
    std::this_thread::sleep_for(options_.release_grace);

    std::error_code ec;
    std::uintmax_t size = fs::file_size(session.audio_path, ec);
    if (ec || size <= WAV_HEADER_SIZE + options_.min_audio_bytes) {
        fs::remove(session.audio_path, ec);
        report_failure(mode, ErrorKind::Recording, "No audio captured");
        return;
    }

    set_state(AppState::Processing);
    hand_off(std::move(session));
}

void RecordingSessionManager::discard_current() {
    std::optional<RecordingSession> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session.swap(current_);
    }
    if (!session) return;

    std::cout << "[Session] Discarding " << to_string(session->mode)
              << " (#" << session->id << ")" << std::endl;
    session->cancel_token.cancel();
    if (recorder_.is_recording() && !recorder_.stop()) {
        std::cerr << "[Session] Recorder did not stop cleanly" << std::endl;
    }
    std::error_code ec;
    fs::remove(session->audio_path, ec);
    set_state(AppState::Idle);
}

void RecordingSessionManager::hand_off(RecordingSession session) {
    bool posted = executor_.post(std::string("pipeline-") + to_string(session.mode),
                                 [this, session]() mutable { handler_.run(std::move(session)); });
    if (!posted) {
        report_failure(session.mode, ErrorKind::Recording, "Application is shutting down");
    }
}

void RecordingSessionManager::report_failure(PipelineMode mode, ErrorKind kind,
                                             const std::string& message) {
    std::cerr << "[Session] " << to_string(mode) << ": " << message << std::endl;
    set_state(AppState::Idle);
    if (sink_) sink_(PipelineEvent::failed(mode, kind, message));
}

void RecordingSessionManager::set_state(AppState state) {
    if (state_callback_) state_callback_(state);
}

} // namespace voxchord
