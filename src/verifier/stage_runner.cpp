#include "verifier/stage_runner.hpp"
#include "common/debug_control.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace zk_insurance {

namespace {

// Per-stream capture limit; output beyond it is drained and dropped
constexpr size_t MAX_CAPTURE_BYTES = 1 << 20;

// How long to keep draining pipes after the stage was killed
constexpr auto KILL_DRAIN_GRACE = std::chrono::seconds(2);

constexpr int POLL_INTERVAL_MS = 100;

void close_pipe(int fds[2]) {
    if (fds[0] >= 0) ::close(fds[0]);
    if (fds[1] >= 0) ::close(fds[1]);
    fds[0] = fds[1] = -1;
}

void kill_stage(pid_t pid) {
    // Negative pid targets the whole process group created in the child
    if (::kill(-pid, SIGKILL) < 0 && errno == ESRCH) {
        ::kill(pid, SIGKILL);
    }
}

std::string join_command(const std::vector<std::string>& args) {
    std::string out;
    for (const auto& a : args) {
        if (!out.empty()) out += ' ';
        out += a;
    }
    return out;
}

} // namespace

SubprocessStageRunner::SubprocessStageRunner(std::chrono::milliseconds timeout)
    : timeout_(timeout) {}

StageOutcome SubprocessStageRunner::run_stage(const std::string& name,
                                              const std::vector<std::string>& args,
                                              const std::filesystem::path& work_dir,
                                              const CancelCheck& cancelled) {
    StageOutcome outcome;
    outcome.stage = name;

    if (args.empty()) {
        outcome.stderr_text = "no command given for stage " + name;
        return outcome;
    }

    // Everything the child touches is prepared before fork
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) {
        argv.push_back(const_cast<char*>(a.c_str()));
    }
    argv.push_back(nullptr);
    const std::string cwd = work_dir.string();

    ZKI_DEBUG_COUT("[stage] " << name << ": " << join_command(args)
                   << " (cwd " << cwd << ")" << std::endl);

    // Close-on-exec so stages forked by other sessions never inherit these
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (::pipe2(stdout_pipe, O_CLOEXEC) < 0 || ::pipe2(stderr_pipe, O_CLOEXEC) < 0) {
        outcome.stderr_text = std::string("failed to create pipes: ") + strerror(errno);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        std::cerr << "[stage] " << name << ": " << outcome.stderr_text << std::endl;
        return outcome;
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        outcome.stderr_text = std::string("failed to fork: ") + strerror(errno);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        std::cerr << "[stage] " << name << ": " << outcome.stderr_text << std::endl;
        return outcome;
    }

    if (pid == 0) {
        // Child process: only async-signal-safe calls until exec
        ::setpgid(0, 0);
        ::dup2(stdout_pipe[1], STDOUT_FILENO);
        ::dup2(stderr_pipe[1], STDERR_FILENO);

        if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
            static const char msg[] = "failed to enter stage working directory\n";
            ssize_t ignored = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
            (void)ignored;
            _exit(127);
        }

        ::execvp(argv[0], argv.data());

        static const char msg[] = "failed to exec stage binary\n";
        ssize_t ignored = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
        (void)ignored;
        _exit(127);
    }

    // Parent process. Also set the group here so a kill issued before the
    // child reaches setpgid still finds it.
    ::setpgid(pid, pid);
    ::close(stdout_pipe[1]);
    ::close(stderr_pipe[1]);
    outcome.launched = true;

    const auto start = std::chrono::steady_clock::now();
    const bool has_deadline = timeout_.count() > 0;
    const auto deadline = start + timeout_;
    std::chrono::steady_clock::time_point drain_deadline;
    bool killed = false;

    struct pollfd fds[2];
    fds[0].fd = stdout_pipe[0];
    fds[1].fd = stderr_pipe[0];
    std::string* sinks[2] = {&outcome.stdout_text, &outcome.stderr_text};
    int open_fds = 2;
    char buffer[4096];

    while (open_fds > 0) {
        for (auto& p : fds) {
            p.events = POLLIN;
            p.revents = 0;
        }

        int rc = ::poll(fds, 2, POLL_INTERVAL_MS);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            std::cerr << "[stage] " << name << ": poll failed: " << strerror(errno) << std::endl;
            if (!killed) {
                kill_stage(pid);
                killed = true;
            }
            break;
        }

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) {
                continue;
            }
            ssize_t n = ::read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0) {
                size_t room = MAX_CAPTURE_BYTES - std::min(MAX_CAPTURE_BYTES, sinks[i]->size());
                sinks[i]->append(buffer, std::min(room, static_cast<size_t>(n)));
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                ::close(fds[i].fd);
                fds[i].fd = -1;  // poll ignores negative descriptors
                --open_fds;
            }
        }

        auto now = std::chrono::steady_clock::now();
        if (!killed) {
            if (cancelled && cancelled()) {
                outcome.cancelled = true;
            } else if (has_deadline && now >= deadline) {
                outcome.timed_out = true;
            }
            if (outcome.cancelled || outcome.timed_out) {
                std::cerr << "[stage] " << name << ": "
                          << (outcome.cancelled ? "cancelled" : "timed out")
                          << ", killing pid " << pid << std::endl;
                kill_stage(pid);
                killed = true;
                drain_deadline = now + KILL_DRAIN_GRACE;
            }
        } else if (now >= drain_deadline) {
            // A descendant escaped the group and still holds a pipe
            break;
        }
    }

    for (auto& p : fds) {
        if (p.fd >= 0) {
            ::close(p.fd);
        }
    }

    // The stage may close its pipes and keep running, so the deadline and
    // cancellation still apply while reaping
    int status = 0;
    while (true) {
        pid_t rc = ::waitpid(pid, &status, killed ? 0 : WNOHANG);
        if (rc == pid) {
            break;
        }
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            std::cerr << "[stage] " << name << ": waitpid failed: " << strerror(errno) << std::endl;
            return outcome;
        }

        if (cancelled && cancelled()) {
            outcome.cancelled = true;
        } else if (has_deadline && std::chrono::steady_clock::now() >= deadline) {
            outcome.timed_out = true;
        }
        if (outcome.cancelled || outcome.timed_out) {
            std::cerr << "[stage] " << name << ": "
                      << (outcome.cancelled ? "cancelled" : "timed out")
                      << ", killing pid " << pid << std::endl;
            kill_stage(pid);
            killed = true;
            continue;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(POLL_INTERVAL_MS));
    }

    if (WIFEXITED(status)) {
        outcome.exit_status = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        outcome.term_signal = WTERMSIG(status);
    }

    double duration_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count();
    std::cout << "[stage] " << name << " finished: exit=" << outcome.exit_status
              << " signal=" << outcome.term_signal
              << " duration_ms=" << duration_ms << std::endl;
    ZKI_DEBUG_COUT("[stage] " << name << " stdout:\n" << outcome.stdout_text << std::endl
                   << "[stage] " << name << " stderr:\n" << outcome.stderr_text << std::endl);

    return outcome;
}

} // namespace zk_insurance
