#pragma once

#include <string>

namespace voxchord {

class Clipboard {
public:
    virtual ~Clipboard() = default;

    // Set text to clipboard
    virtual bool set_text(const std::string& text) = 0;

    // Current clipboard text, empty when there is none
    virtual std::string get_text() = 0;

    // Paste clipboard content into the focused window (simulates Ctrl+V)
    virtual bool paste() = 0;
};

// X11 clipboard through xclip or xsel, paste through XTest
class SystemClipboard : public Clipboard {
public:
    bool set_text(const std::string& text) override;
    std::string get_text() override;
    bool paste() override;
};

} // namespace voxchord
