// Tests for the JSON Lines transcription log

#include "transcription_history.hpp"
#include "test_fakes.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace voxchord;
using namespace voxchord::testing;

namespace fs = std::filesystem;

HistoryEntry make_entry(const std::string& text, std::chrono::system_clock::time_point when) {
    HistoryEntry entry;
    entry.timestamp = when;
    entry.text = text;
    entry.language = "en";
    entry.duration_ms = 1200;
    entry.model_used = "Whisper:base";
    return entry;
}

void test_append_and_recent() {
    std::cout << "Testing history append..." << std::endl;

    std::string dir = make_test_dir("history_append");
    TranscriptionHistory history((fs::path(dir) / "history").string());
    const auto now = std::chrono::system_clock::now();

    HistoryEntry first = make_entry("first note", now);
    first.segments.push_back({0, 800, "first"});
    first.segments.push_back({800, 1200, "note"});
    assert(history.append(first));

    HistoryEntry second = make_entry("what is this", now);
    second.mode = PipelineMode::SpeechVision;
    second.response = "A terminal window";
    assert(history.append(second));

    assert(history.append(make_entry("third", now)));

    auto all = history.recent(10);
    assert(all.size() == 3);
    assert(all[0].text == "first note");
    assert(all[0].segments.size() == 2);
    assert(all[0].segments[1].text == "note");
    assert(all[0].segments[1].end_ms == 1200);
    assert(all[1].mode == PipelineMode::SpeechVision);
    assert(all[1].response == "A terminal window");
    assert(all[2].model_used == "Whisper:base");

    auto last_two = history.recent(2);
    assert(last_two.size() == 2);
    assert(last_two[0].text == "what is this" && "Newest entries kept, oldest first");

    // A damaged line does not hide the rest
    {
        std::ofstream file(history.path(), std::ios::app);
        file << "{broken\n";
    }
    assert(history.append(make_entry("after damage", now)));
    assert(history.recent(10).size() == 4);

    fs::remove_all(dir);
    std::cout << "  PASS: Entries read back in order" << std::endl;
}

void test_cleanup_removes_old_entries() {
    std::cout << "Testing history retention..." << std::endl;

    std::string dir = make_test_dir("history_cleanup");
    TranscriptionHistory history(dir);
    const auto now = std::chrono::system_clock::now();

    std::string old_audio = (fs::path(dir) / "old.wav").string();
    { std::ofstream(old_audio) << "RIFF"; }

    HistoryEntry old_entry = make_entry("last month", now - std::chrono::hours(24 * 40));
    old_entry.audio_path = old_audio;
    history.append(old_entry);
    history.append(make_entry("last week", now - std::chrono::hours(24 * 7)));
    history.append(make_entry("today", now));

    assert(history.cleanup(0) == 0 && "Zero retention keeps everything");
    assert(history.cleanup(30) == 1);
    assert(!fs::exists(old_audio) && "Kept recording removed with its entry");

    auto left = history.recent(10);
    assert(left.size() == 2);
    assert(left[0].text == "last week");
    assert(left[1].text == "today");

    assert(history.cleanup(30) == 0);

    fs::remove_all(dir);
    std::cout << "  PASS: Entries past retention dropped" << std::endl;
}

int main() {
    std::cout << "=== Transcription History Test Suite ===" << std::endl;

    test_append_and_recent();
    test_cleanup_removes_old_entries();

    std::cout << "\n=== All Tests Passed! ===" << std::endl;
    return 0;
}
