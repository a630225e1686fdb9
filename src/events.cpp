#include "events.hpp"

namespace voxchord {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "None";
        case ErrorKind::HotkeyInfrastructure: return "HotkeyInfrastructure";
        case ErrorKind::Recording: return "Recording";
        case ErrorKind::Transcription: return "Transcription";
        case ErrorKind::Llm: return "Llm";
        case ErrorKind::Vision: return "Vision";
        case ErrorKind::Clipboard: return "Clipboard";
        case ErrorKind::CapabilityProcess: return "CapabilityProcess";
        case ErrorKind::Tts: return "Tts";
        case ErrorKind::Network: return "Network";
        case ErrorKind::ResponseParse: return "ResponseParse";
    }
    return "Unknown";
}

} // namespace voxchord
