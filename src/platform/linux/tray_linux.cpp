#include "tray.hpp"

#include <iostream>
#include <mutex>

// Linux status output: console lines instead of a tray icon
// (an indicator would need GTK or Qt)

namespace voxchord {

namespace {

std::mutex g_output_mutex;

} // namespace

const char* to_string(AppState state) {
    switch (state) {
        case AppState::Idle: return "Ready";
        case AppState::Recording: return "Recording...";
        case AppState::Processing: return "Processing...";
        case AppState::Speaking: return "Speaking...";
        case AppState::Error: return "Error";
    }
    return "";
}

bool create_tray_icon() {
    std::cout << "[VoxChord] Status is reported on the console" << std::endl;
    return true;
}

void destroy_tray_icon() {
}

void update_tray_state(AppState state) {
    std::lock_guard<std::mutex> lock(g_output_mutex);
    std::cout << "[VoxChord] " << to_string(state) << std::endl;
}

void show_status_message(const std::string& message, bool is_error) {
    std::lock_guard<std::mutex> lock(g_output_mutex);
    if (is_error) {
        std::cerr << "[VoxChord] " << message << std::endl;
    } else {
        std::cout << "[VoxChord] " << message << std::endl;
    }
}

} // namespace voxchord
