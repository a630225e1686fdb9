// Tests for external process execution with deadlines

#include "process_runner.hpp"
#include "test_fakes.hpp"

#include <cassert>
#include <cerrno>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>

#include <signal.h>
#include <sys/wait.h>

using namespace voxchord;
using namespace voxchord::testing;

namespace fs = std::filesystem;

// A killed process may linger as a zombie until its new parent reaps it
bool is_zombie(pid_t pid) {
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    std::string line;
    if (!std::getline(stat, line)) return false;
    auto close_paren = line.rfind(')');
    return close_paren != std::string::npos && close_paren + 2 < line.size() &&
           line[close_paren + 2] == 'Z';
}

bool process_gone(pid_t pid, std::chrono::milliseconds within) {
    const auto deadline = std::chrono::steady_clock::now() + within;
    while (std::chrono::steady_clock::now() < deadline) {
        if (kill(pid, 0) != 0 && errno == ESRCH) return true;
        if (is_zombie(pid)) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return false;
}

void test_captures_output_and_exit_code() {
    std::cout << "Testing output capture..." << std::endl;

    ProcessRunner runner;
    auto result = runner.run({"/bin/sh", "-c", "echo out; echo err >&2; exit 3"},
                             std::chrono::seconds(5));
    assert(!result.success);
    assert(!result.timed_out);
    assert(result.exit_code == 3);
    assert(result.standard_output == "out\n");
    assert(result.standard_error == "err\n");

    auto ok = runner.run({"/bin/sh", "-c", "printf hi"}, std::chrono::seconds(5));
    assert(ok.success && ok.exit_code == 0);
    assert(ok.standard_output == "hi");

    std::cout << "  PASS: stdout, stderr and exit status captured" << std::endl;
}

void test_missing_program() {
    std::cout << "Testing missing executable..." << std::endl;

    ProcessRunner runner;
    auto result = runner.run({"/nonexistent/voxchord-helper"}, std::chrono::seconds(5));
    assert(!result.success);
    assert(result.exit_code == 127);

    std::cout << "  PASS: exec failure reports 127" << std::endl;
}

void test_large_output_does_not_block() {
    std::cout << "Testing large output..." << std::endl;

    ProcessRunner runner;
    auto result = runner.run({"/bin/sh", "-c", "head -c 300000 /dev/zero | tr '\\000' a; echo done >&2"},
                             std::chrono::seconds(10));
    assert(result.success);
    assert(result.standard_output.size() == 300000);
    assert(result.standard_error == "done\n");

    std::cout << "  PASS: 300000 bytes read without deadlock" << std::endl;
}

void test_working_directory() {
    std::cout << "Testing working directory..." << std::endl;

    std::string dir = make_test_dir("runner_cwd");
    ProcessRunner runner;
    auto result = runner.run({"/bin/sh", "-c", "pwd"}, std::chrono::seconds(5), dir);
    assert(result.success);

    std::string printed = result.standard_output;
    while (!printed.empty() && printed.back() == '\n') printed.pop_back();
    assert(fs::canonical(printed) == fs::canonical(dir));

    fs::remove_all(dir);
    std::cout << "  PASS: Child runs in the requested directory" << std::endl;
}

void test_timeout_kills_process_group() {
    std::cout << "Testing timeout..." << std::endl;

    std::string dir = make_test_dir("runner_timeout");
    std::string pid_file = (fs::path(dir) / "child.pid").string();

    // The grandchild would outlive a plain kill of the shell
    ProcessRunner runner;
    auto start = std::chrono::steady_clock::now();
    auto result = runner.run({"/bin/sh", "-c", "sleep 30 & echo $! > \"$0\"; sleep 30", pid_file},
                             std::chrono::milliseconds(300));
    auto elapsed = std::chrono::steady_clock::now() - start;

    assert(result.timed_out);
    assert(!result.success);
    assert(elapsed < std::chrono::seconds(5));
    assert(result.standard_error.find("timed out") != std::string::npos);

    std::ifstream in(pid_file);
    pid_t grandchild = 0;
    in >> grandchild;
    assert(grandchild > 0);
    assert(process_gone(grandchild, std::chrono::seconds(3)) && "No orphan left behind");

    fs::remove_all(dir);
    std::cout << "  PASS: Timed-out process tree killed" << std::endl;
}

void test_finished_process_group_cleaned_up() {
    std::cout << "Testing leftovers of a finished process..." << std::endl;

    std::string dir = make_test_dir("runner_leftovers");
    std::string pid_file = (fs::path(dir) / "child.pid").string();

    // The background sleep closes the pipes so the shell's exit is seen
    ProcessRunner runner;
    auto result = runner.run({"/bin/sh", "-c",
                              "sleep 30 >/dev/null 2>&1 & echo $! > \"$0\"; echo done; exit 3",
                              pid_file},
                             std::chrono::milliseconds(5000));

    assert(!result.timed_out);
    assert(result.exit_code == 3 && "Exit status survives the group kill");
    assert(result.standard_output == "done\n");
    assert(result.elapsed < std::chrono::seconds(5));

    std::ifstream in(pid_file);
    pid_t grandchild = 0;
    in >> grandchild;
    assert(grandchild > 0);
    assert(process_gone(grandchild, std::chrono::seconds(3)) && "Background child killed");

    // The shell was reaped by the run itself
    assert(waitpid(-1, nullptr, WNOHANG) <= 0);

    fs::remove_all(dir);
    std::cout << "  PASS: Group killed before the shell was reaped" << std::endl;
}

int main() {
    std::cout << "=== Process Runner Test Suite ===" << std::endl;

    test_captures_output_and_exit_code();
    test_missing_program();
    test_large_output_does_not_block();
    test_working_directory();
    test_timeout_kills_process_group();
    test_finished_process_group_cleaned_up();

    std::cout << "\n=== All Tests Passed! ===" << std::endl;
    return 0;
}
