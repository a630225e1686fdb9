#include "process_runner.hpp"

#include <cerrno>
#include <cstring>
#include <iostream>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace voxchord {

namespace {

using Clock = std::chrono::steady_clock;

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

int exit_code_from_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

} // namespace

ProcessExecutionResult ProcessRunner::run(const std::vector<std::string>& argv,
                                          std::chrono::milliseconds timeout,
                                          const std::string& working_dir) const {
    ProcessExecutionResult result;
    const auto start = Clock::now();
    const auto deadline = start + timeout;

    if (argv.empty()) {
        result.standard_error = "No command given";
        return result;
    }

    // Built before fork: only async-signal-safe calls in the child
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (pipe2(out_pipe, O_CLOEXEC) != 0 || pipe2(err_pipe, O_CLOEXEC) != 0) {
        result.standard_error = std::string("pipe failed: ") + std::strerror(errno);
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        return result;
    }

    pid_t pid = fork();
    if (pid < 0) {
        result.standard_error = std::string("fork failed: ") + std::strerror(errno);
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        close_fd(err_pipe[0]);
        close_fd(err_pipe[1]);
        return result;
    }

    if (pid == 0) {
        setpgid(0, 0);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) dup2(devnull, STDIN_FILENO);

        if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) {
            static const char msg[] = "cannot change working directory\n";
            (void)!write(STDERR_FILENO, msg, sizeof(msg) - 1);
            _exit(127);
        }

        execvp(args[0], args.data());
        static const char msg[] = "exec failed\n";
        (void)!write(STDERR_FILENO, msg, sizeof(msg) - 1);
        _exit(127);
    }

    // Also from the parent, so the group exists before any kill
    setpgid(pid, pid);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);

    int fds[2] = {out_pipe[0], err_pipe[0]};
    std::string* sinks[2] = {&result.standard_output, &result.standard_error};
    for (int fd : fds) {
        fcntl(fd, F_SETFL, fcntl(fd, F_GETFL) | O_NONBLOCK);
    }

    char buffer[4096];
    while (fds[0] >= 0 || fds[1] >= 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (remaining.count() <= 0) {
            result.timed_out = true;
            break;
        }

        pollfd pfds[2];
        nfds_t count = 0;
        int index[2];
        for (int i = 0; i < 2; ++i) {
            if (fds[i] >= 0) {
                pfds[count].fd = fds[i];
                pfds[count].events = POLLIN;
                pfds[count].revents = 0;
                index[count] = i;
                ++count;
            }
        }

        int ready = poll(pfds, count, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) continue;
            result.standard_error += std::string("poll failed: ") + std::strerror(errno);
            result.timed_out = true;  // Treat as fatal: kill and reap below
            break;
        }

        for (nfds_t p = 0; p < count; ++p) {
            if (pfds[p].revents == 0) continue;
            int i = index[p];
            ssize_t n = read(fds[i], buffer, sizeof(buffer));
            if (n > 0) {
                sinks[i]->append(buffer, static_cast<size_t>(n));
            } else if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
                close_fd(fds[i]);
            }
        }
    }

    // Wait for the leader to exit without reaping it. Its zombie keeps the
    // group id reserved, so the group kill below cannot hit a reused id.
    bool exited = false;
    while (!result.timed_out) {
        siginfo_t info;
        std::memset(&info, 0, sizeof(info));
        int r = waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT);
        if (r == 0 && info.si_pid == pid) {
            exited = true;
            break;
        }
        if (r < 0 && errno != EINTR) {
            break;
        }
        if (Clock::now() >= deadline) {
            result.timed_out = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    // Anything the program left running still belongs to its group
    if (exited || result.timed_out) {
        kill(-pid, SIGKILL);
    }

    int status = 0;
    pid_t waited;
    while ((waited = waitpid(pid, &status, 0)) < 0 && errno == EINTR) {
    }
    const bool reaped = waited == pid;

    if (result.timed_out) {
        result.exit_code = -1;
        if (!result.standard_error.empty() && result.standard_error.back() != '\n') {
            result.standard_error += '\n';
        }
        result.standard_error += "Process timed out after " + std::to_string(timeout.count()) + "ms";
    } else if (reaped) {
        result.exit_code = exit_code_from_status(status);
    }

    close_fd(fds[0]);
    close_fd(fds[1]);

    result.success = !result.timed_out && reaped && result.exit_code == 0;
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);

    if (!result.success) {
        std::cerr << "[Process] " << argv[0] << " failed (exit " << result.exit_code
                  << (result.timed_out ? ", timed out" : "") << ")" << std::endl;
    }
    return result;
}

} // namespace voxchord
