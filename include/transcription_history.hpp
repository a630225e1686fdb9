#pragma once

#include "hotkey_binding.hpp"
#include "transcription_service.hpp"

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace voxchord {

struct HistoryEntry {
    std::chrono::system_clock::time_point timestamp;
    PipelineMode mode = PipelineMode::Transcribe;
    std::string text;               // Transcript
    std::string response;           // LLM or vision output, if any
    std::vector<TranscriptionSegment> segments;
    std::string language;
    int64_t duration_ms = 0;
    std::string model_used;
    std::string audio_path;         // Only when recordings are kept
};

// Append-only JSON Lines log at <dir>/transcriptions.jsonl
class TranscriptionHistory {
public:
    explicit TranscriptionHistory(std::string directory);

    bool append(const HistoryEntry& entry);

    // Newest last; at most `limit` entries
    std::vector<HistoryEntry> recent(std::size_t limit);

    // Drops entries older than the retention window. Returns how many.
    std::size_t cleanup(int retention_days);

    const std::string& path() const { return path_; }

private:
    std::vector<HistoryEntry> load_all();

    std::string directory_;
    std::string path_;
    std::mutex mutex_;
};

} // namespace voxchord
