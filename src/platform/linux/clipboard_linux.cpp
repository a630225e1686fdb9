#include "clipboard.hpp"

#include <array>
#include <cstdio>
#include <iostream>
#include <memory>

#include <X11/Xlib.h>
#include <X11/keysym.h>
#include <X11/extensions/XTest.h>

namespace voxchord {

namespace {

// Runs a command and collects its stdout; false when it exits non-zero
bool read_command(const char* cmd, std::string& out) {
    std::array<char, 4096> buffer;
    FILE* pipe = popen(cmd, "r");
    if (!pipe) return false;

    out.clear();
    size_t n;
    while ((n = fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
        out.append(buffer.data(), n);
    }
    return pclose(pipe) == 0;
}

bool write_command(const char* cmd, const std::string& text) {
    FILE* pipe = popen(cmd, "w");
    if (!pipe) return false;
    size_t written = fwrite(text.data(), 1, text.size(), pipe);
    int ret = pclose(pipe);
    return ret == 0 && written == text.size();
}

} // namespace

bool SystemClipboard::set_text(const std::string& text) {
    if (write_command("xclip -selection clipboard 2>/dev/null", text)) return true;
    if (write_command("xsel --clipboard --input 2>/dev/null", text)) return true;

    std::cerr << "[Clipboard] Failed to set clipboard. Install xclip or xsel." << std::endl;
    return false;
}

std::string SystemClipboard::get_text() {
    std::string result;
    if (read_command("xclip -selection clipboard -o 2>/dev/null", result)) return result;
    if (read_command("xsel --clipboard --output 2>/dev/null", result)) return result;
    return "";
}

bool SystemClipboard::paste() {
    Display* display = XOpenDisplay(nullptr);
    if (!display) {
        std::cerr << "[Clipboard] Failed to open X display" << std::endl;
        return false;
    }

    KeyCode ctrl_keycode = XKeysymToKeycode(display, XK_Control_L);
    KeyCode v_keycode = XKeysymToKeycode(display, XK_v);

    if (ctrl_keycode == 0 || v_keycode == 0) {
        std::cerr << "[Clipboard] Failed to get keycodes" << std::endl;
        XCloseDisplay(display);
        return false;
    }

    XTestFakeKeyEvent(display, ctrl_keycode, True, 0);
    XTestFakeKeyEvent(display, v_keycode, True, 0);
    XTestFakeKeyEvent(display, v_keycode, False, 0);
    XTestFakeKeyEvent(display, ctrl_keycode, False, 0);
    XFlush(display);

    XCloseDisplay(display);
    return true;
}

} // namespace voxchord
