// ============================================================================
// subprocess.cpp - implementation for subprocess.hpp
// ============================================================================

#include "subprocess.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace espfleet {

namespace {

using Clock = std::chrono::steady_clock;

constexpr int kReapPollMs = 10;

int remaining_ms(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

int decode_wait_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

enum class Reap { Done, Deadline, Error };

Reap wait_child(pid_t pid, Clock::time_point deadline, int& status) {
    while (true) {
        pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid) return Reap::Done;
        if (r < 0) {
            if (errno == EINTR) continue;
            return Reap::Error;
        }
        if (remaining_ms(deadline) == 0) return Reap::Deadline;
        std::this_thread::sleep_for(std::chrono::milliseconds(kReapPollMs));
    }
}

void kill_and_reap(pid_t pid) {
    ::kill(pid, SIGKILL);
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
}

// Child side: never returns.
[[noreturn]] void exec_child(const std::vector<std::string>& argv, const ProcessOptions& opts,
                             int out_w, int err_w, int exec_w) {
    int devnull = ::open("/dev/null", O_RDWR);
    if (devnull >= 0) {
        ::dup2(devnull, STDIN_FILENO);
        if (!opts.capture) ::dup2(devnull, STDOUT_FILENO);
    }
    if (opts.capture) {
        ::dup2(out_w, STDOUT_FILENO);
        ::dup2(err_w, STDERR_FILENO);
    }

    if (!opts.cwd.empty() && ::chdir(opts.cwd.c_str()) != 0) {
        int e = errno;
        (void)!::write(exec_w, &e, sizeof e);
        _exit(127);
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    ::execvp(args[0], args.data());
    int e = errno;
    (void)!::write(exec_w, &e, sizeof e);
    _exit(127);
}

} // namespace

std::string join_argv(const std::vector<std::string>& argv) {
    std::string s;
    for (const auto& a : argv) {
        if (!s.empty()) s += ' ';
        if (a.find_first_of(" \t'\"") != std::string::npos) s += "'" + a + "'";
        else s += a;
    }
    return s;
}

Status run_process(const std::vector<std::string>& argv, const ProcessOptions& opts, ProcessOutput& result) {
    result = ProcessOutput{};
    if (argv.empty()) return Status::error(ErrorKind::Usage, "empty_command", "no program given");

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};

    auto close_all = [&] {
        close_fd(out_pipe[0]); close_fd(out_pipe[1]);
        close_fd(err_pipe[0]); close_fd(err_pipe[1]);
        close_fd(exec_pipe[0]); close_fd(exec_pipe[1]);
    };

    if (::pipe2(exec_pipe, O_CLOEXEC) != 0 ||
        (opts.capture && (::pipe2(out_pipe, O_CLOEXEC) != 0 || ::pipe2(err_pipe, O_CLOEXEC) != 0))) {
        std::string why = std::strerror(errno);
        close_all();
        return Status::error(ErrorKind::Process, "spawn_failed", "pipe: " + why);
    }

    spdlog::debug("exec: {}", join_argv(argv));
    const auto deadline = Clock::now() + std::chrono::milliseconds(opts.timeout_ms);

    pid_t pid = ::fork();
    if (pid < 0) {
        std::string why = std::strerror(errno);
        close_all();
        return Status::error(ErrorKind::Process, "spawn_failed", "fork: " + why);
    }
    if (pid == 0) exec_child(argv, opts, out_pipe[1], err_pipe[1], exec_pipe[1]);

    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);

    // EOF means exec succeeded; an int means it failed with that errno.
    int exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_pipe[0], &exec_errno, sizeof exec_errno);
    } while (n < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);
    if (n == static_cast<ssize_t>(sizeof exec_errno)) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        close_all();
        return Status::error(ErrorKind::Process, "spawn_failed",
                             argv[0] + ": " + std::strerror(exec_errno));
    }

    if (opts.capture) {
        pollfd fds[2] = {{out_pipe[0], POLLIN, 0}, {err_pipe[0], POLLIN, 0}};
        std::string* sinks[2] = {&result.out, &result.err};
        char buf[4096];

        while (fds[0].fd >= 0 || fds[1].fd >= 0) {
            int wait = remaining_ms(deadline);
            if (wait == 0) {
                result.timed_out = true;
                break;
            }
            int pr = ::poll(fds, 2, wait);
            if (pr < 0) {
                if (errno == EINTR) continue;
                break;
            }
            for (int i = 0; i < 2; ++i) {
                if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
                ssize_t r = ::read(fds[i].fd, buf, sizeof buf);
                if (r > 0) {
                    sinks[i]->append(buf, static_cast<size_t>(r));
                } else if (r == 0 || errno != EINTR) {
                    ::close(fds[i].fd);
                    fds[i].fd = -1;
                }
            }
        }
        // The pollfd copies own the descriptors now.
        if (fds[0].fd >= 0) ::close(fds[0].fd);
        if (fds[1].fd >= 0) ::close(fds[1].fd);
        out_pipe[0] = -1;
        err_pipe[0] = -1;
    }

    int status = 0;
    Reap reap = result.timed_out ? Reap::Deadline : wait_child(pid, deadline, status);
    if (reap == Reap::Deadline) {
        kill_and_reap(pid);
        result.timed_out = true;
        result.exit_code = 128 + SIGKILL;
        spdlog::warn("exec: '{}' timed out after {} ms", argv[0], opts.timeout_ms);
        return Status::error(ErrorKind::Process, "timeout",
                             argv[0] + " did not finish within " + std::to_string(opts.timeout_ms) + " ms");
    }
    if (reap == Reap::Error) {
        return Status::error(ErrorKind::Process, "wait_failed", argv[0] + ": " + std::strerror(errno));
    }

    result.exit_code = decode_wait_status(status);
    spdlog::debug("exec: '{}' exited {}", argv[0], result.exit_code);
    return Status::success();
}

} // namespace espfleet
