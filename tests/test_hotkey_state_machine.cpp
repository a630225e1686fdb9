// Tests for chord parsing and the hotkey state machine

#include "config.hpp"
#include "hotkey_binding.hpp"
#include "hotkey_state_machine.hpp"

#include <linux/input-event-codes.h>

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

using namespace voxchord;

struct Recorder {
    std::vector<std::string> events;

    void attach(HotkeyStateMachine& machine) {
        machine.set_on_mode_start([this](PipelineMode m) {
            events.push_back(std::string("start:") + to_string(m));
        });
        machine.set_on_mode_end([this](PipelineMode m) {
            events.push_back(std::string("end:") + to_string(m));
        });
    }
};

std::vector<HotkeyBinding> default_bindings() {
    std::vector<HotkeyBinding> bindings;
    std::string error;
    bool ok = build_bindings(HotkeySettings{}, bindings, error);
    assert(ok && "Default bindings should be valid");
    return bindings;
}

void test_parse_chord() {
    std::cout << "Testing chord parsing..." << std::endl;

    auto f1 = parse_chord("F1");
    assert(f1 && f1->key == KEY_F1 && f1->modifiers == ModNone);

    auto shift_f2 = parse_chord(" shift + f2 ");
    assert(shift_f2 && shift_f2->key == KEY_F2 && shift_f2->modifiers == ModShift);

    auto ctrl_alt_k = parse_chord("Ctrl+Alt+K");
    assert(ctrl_alt_k && ctrl_alt_k->key == KEY_K);
    assert(ctrl_alt_k->modifiers == (ModCtrl | ModAlt));

    assert(!parse_chord(""));
    assert(!parse_chord("Ctrl+"));
    assert(!parse_chord("Hyper+F1"));
    assert(!parse_chord("Shift+Shift+F1"));
    assert(!parse_chord("Ctrl+Shift+Alt+F1") && "At most two modifiers");
    assert(!parse_chord("F13"));

    assert(format_chord(*parse_chord("shift+ctrl+f3")) == "Ctrl+Shift+F3");

    std::cout << "  PASS: Chords parse and format" << std::endl;
}

void test_validate_bindings() {
    std::cout << "Testing binding validation..." << std::endl;

    auto bindings = default_bindings();
    assert(bindings.size() == 6);
    assert(!validate_bindings(bindings));

    HotkeySettings clash;
    clash.prompt_llm = "F1";
    std::vector<HotkeyBinding> out;
    std::string error;
    assert(!build_bindings(clash, out, error));
    assert(error.find("Transcribe") != std::string::npos);
    assert(error.find("PromptLLM") != std::string::npos);

    HotkeySettings bad;
    bad.vision_capture = "Shift+";
    error.clear();
    assert(!build_bindings(bad, out, error));
    assert(error.find("VisionCapture") != std::string::npos);

    std::cout << "  PASS: Conflicts and bad chords rejected" << std::endl;
}

void test_press_release_single_pair() {
    std::cout << "Testing press/release emits one start and one end..." << std::endl;

    HotkeyStateMachine machine(default_bindings());
    Recorder rec;
    rec.attach(machine);

    assert(machine.on_key_down(KEY_F1) == KeyDisposition::Suppress);
    // Auto-repeat while held
    for (int i = 0; i < 20; ++i) {
        assert(machine.on_key_repeat(KEY_F1) == KeyDisposition::Suppress);
    }
    assert(machine.active_mode() == PipelineMode::Transcribe);
    assert(machine.on_key_up(KEY_F1) == KeyDisposition::Suppress);

    assert(rec.events.size() == 2);
    assert(rec.events[0] == "start:Transcribe");
    assert(rec.events[1] == "end:Transcribe");
    assert(!machine.active_mode());

    std::cout << "  PASS: Exactly one start/end pair" << std::endl;
}

void test_modifier_exact_match() {
    std::cout << "Testing modifiers select distinct bindings..." << std::endl;

    HotkeyStateMachine machine(default_bindings());
    Recorder rec;
    rec.attach(machine);

    // Plain F2 is unbound and passes through
    assert(machine.on_key_down(KEY_F2) == KeyDisposition::Pass);
    assert(machine.on_key_up(KEY_F2) == KeyDisposition::Pass);
    assert(rec.events.empty());

    // Shift+F2
    assert(machine.on_key_down(KEY_LEFTSHIFT) == KeyDisposition::Pass);
    assert(machine.held_modifiers() == ModShift);
    machine.on_key_down(KEY_F2);
    machine.on_key_up(KEY_F2);
    machine.on_key_up(KEY_LEFTSHIFT);

    // Right Ctrl+F2
    machine.on_key_down(KEY_RIGHTCTRL);
    machine.on_key_down(KEY_F2);
    machine.on_key_up(KEY_F2);
    machine.on_key_up(KEY_RIGHTCTRL);

    // Shift+F1 matches nothing (F1 is bound without modifiers)
    machine.on_key_down(KEY_RIGHTSHIFT);
    assert(machine.on_key_down(KEY_F1) == KeyDisposition::Pass);
    machine.on_key_up(KEY_F1);
    machine.on_key_up(KEY_RIGHTSHIFT);

    assert(rec.events.size() == 4);
    assert(rec.events[0] == "start:PromptLLM");
    assert(rec.events[1] == "end:PromptLLM");
    assert(rec.events[2] == "start:ClipboardPromptLLM");
    assert(rec.events[3] == "end:ClipboardPromptLLM");

    std::cout << "  PASS: Exact modifier matching" << std::endl;
}

void test_overlapping_chord_dropped() {
    std::cout << "Testing overlapping chord is dropped..." << std::endl;

    HotkeyStateMachine machine(default_bindings());
    Recorder rec;
    rec.attach(machine);

    machine.on_key_down(KEY_LEFTSHIFT);
    machine.on_key_down(KEY_F2);                 // PromptLLM starts
    machine.on_key_up(KEY_LEFTSHIFT);

    machine.on_key_down(KEY_LEFTCTRL);
    assert(machine.on_key_down(KEY_F3) == KeyDisposition::Suppress);  // SpeechVision, dropped
    assert(machine.on_key_repeat(KEY_F3) == KeyDisposition::Suppress);
    assert(machine.on_key_up(KEY_F3) == KeyDisposition::Suppress);
    machine.on_key_up(KEY_LEFTCTRL);

    // The active mode ends on its own key even though Shift was released first
    machine.on_key_up(KEY_F2);

    assert(rec.events.size() == 2);
    assert(rec.events[0] == "start:PromptLLM");
    assert(rec.events[1] == "end:PromptLLM");

    std::cout << "  PASS: Second chord ignored while first is active" << std::endl;
}

void test_reset_aborts_active_mode() {
    std::cout << "Testing reset reports the aborted mode..." << std::endl;

    HotkeyStateMachine machine(default_bindings());
    Recorder rec;
    rec.attach(machine);

    machine.on_key_down(KEY_LEFTCTRL);
    machine.on_key_down(KEY_F3);
    auto aborted = machine.reset();
    assert(aborted == PipelineMode::SpeechVision);
    assert(machine.held_modifiers() == ModNone);
    assert(!machine.active_mode());

    // Stale release after reset is not a chord end
    assert(machine.on_key_up(KEY_F3) == KeyDisposition::Pass);
    assert(rec.events.size() == 1);
    assert(!machine.reset());

    std::cout << "  PASS: Reset clears state" << std::endl;
}

int main() {
    std::cout << "\n=== Hotkey State Machine Test Suite ===" << std::endl << std::endl;

    test_parse_chord();
    test_validate_bindings();
    test_press_release_single_pair();
    test_modifier_exact_match();
    test_overlapping_chord_dropped();
    test_reset_aborts_active_mode();

    std::cout << "\n=== All Tests Passed! ===" << std::endl << std::endl;
    return 0;
}
