#pragma once

#include <string>

namespace voxchord {

enum class AppState {
    Idle,
    Recording,
    Processing,
    Speaking,
    Error
};

const char* to_string(AppState state);

// Platform-specific status indicator
bool create_tray_icon();
void destroy_tray_icon();
void update_tray_state(AppState state);
void show_status_message(const std::string& message, bool is_error);

} // namespace voxchord
