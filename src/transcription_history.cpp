#include "transcription_history.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace voxchord {

namespace {

const PipelineMode kModes[] = {
    PipelineMode::Transcribe, PipelineMode::PromptLLM, PipelineMode::ClipboardPromptLLM,
    PipelineMode::VisionCapture, PipelineMode::SpeechVision, PipelineMode::ClipboardTts,
};

PipelineMode mode_from_string(const std::string& name) {
    for (auto mode : kModes) {
        if (name == to_string(mode)) return mode;
    }
    return PipelineMode::Transcribe;
}

int64_t to_epoch_ms(std::chrono::system_clock::time_point t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

json entry_to_json(const HistoryEntry& entry) {
    json segments = json::array();
    for (const auto& s : entry.segments) {
        segments.push_back({{"start_ms", s.start_ms}, {"end_ms", s.end_ms}, {"text", s.text}});
    }

    json j = {
        {"timestamp", to_epoch_ms(entry.timestamp)},
        {"mode", to_string(entry.mode)},
        {"text", entry.text},
        {"segments", segments},
        {"language", entry.language},
        {"duration_ms", entry.duration_ms},
        {"model", entry.model_used}
    };
    if (!entry.response.empty()) j["response"] = entry.response;
    if (!entry.audio_path.empty()) j["audio_path"] = entry.audio_path;
    return j;
}

HistoryEntry entry_from_json(const json& j) {
    HistoryEntry entry;
    entry.timestamp = std::chrono::system_clock::time_point(
        std::chrono::milliseconds(j.value("timestamp", int64_t{0})));
    entry.mode = mode_from_string(j.value("mode", ""));
    entry.text = j.value("text", "");
    entry.response = j.value("response", "");
    entry.language = j.value("language", "");
    entry.duration_ms = j.value("duration_ms", int64_t{0});
    entry.model_used = j.value("model", "");
    entry.audio_path = j.value("audio_path", "");
    if (j.contains("segments") && j["segments"].is_array()) {
        for (const auto& s : j["segments"]) {
            entry.segments.push_back({s.value("start_ms", int64_t{0}), s.value("end_ms", int64_t{0}),
                                      s.value("text", "")});
        }
    }
    return entry;
}

} // namespace

TranscriptionHistory::TranscriptionHistory(std::string directory)
    : directory_(std::move(directory))
    , path_((fs::path(directory_) / "transcriptions.jsonl").string()) {
}

bool TranscriptionHistory::append(const HistoryEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    fs::create_directories(directory_, ec);

    std::ofstream file(path_, std::ios::app);
    if (!file.is_open()) {
        std::cerr << "[History] Cannot open " << path_ << std::endl;
        return false;
    }
    file << entry_to_json(entry).dump() << '\n';
    return static_cast<bool>(file);
}

std::vector<HistoryEntry> TranscriptionHistory::load_all() {
    std::vector<HistoryEntry> entries;
    std::ifstream file(path_);
    if (!file.is_open()) return entries;

    std::string line;
    size_t line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        if (line.empty()) continue;
        try {
            entries.push_back(entry_from_json(json::parse(line)));
        } catch (const json::exception& e) {
            std::cerr << "[History] Skipping line " << line_no << ": " << e.what() << std::endl;
        }
    }
    return entries;
}

std::vector<HistoryEntry> TranscriptionHistory::recent(std::size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto entries = load_all();
    if (entries.size() > limit) {
        entries.erase(entries.begin(), entries.end() - static_cast<std::ptrdiff_t>(limit));
    }
    return entries;
}

std::size_t TranscriptionHistory::cleanup(int retention_days) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (retention_days <= 0) return 0;

    auto entries = load_all();
    const auto cutoff = std::chrono::system_clock::now() - std::chrono::hours(24 * retention_days);

    std::vector<HistoryEntry> kept;
    for (auto& entry : entries) {
        if (entry.timestamp >= cutoff) {
            kept.push_back(std::move(entry));
        } else if (!entry.audio_path.empty()) {
            std::error_code ec;
            fs::remove(entry.audio_path, ec);
        }
    }

    const std::size_t removed = entries.size() - kept.size();
    if (removed == 0) return 0;

    const std::string tmp = path_ + ".tmp";
    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!file.is_open()) {
            std::cerr << "[History] Cannot rewrite " << path_ << std::endl;
            return 0;
        }
        for (const auto& entry : kept) {
            file << entry_to_json(entry).dump() << '\n';
        }
    }

    std::error_code ec;
    fs::rename(tmp, path_, ec);
    if (ec) {
        std::cerr << "[History] Cannot replace " << path_ << ": " << ec.message() << std::endl;
        return 0;
    }

    std::cout << "[History] Removed " << removed << " entries older than "
              << retention_days << " days" << std::endl;
    return removed;
}

} // namespace voxchord
