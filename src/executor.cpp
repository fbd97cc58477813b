#include "executor.hpp"
#include "util.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

extern char** environ;

namespace cmdgate {

namespace {

using Clock = std::chrono::steady_clock;

constexpr int kExecFailedStatus = 127;
// How long to keep draining pipes after the shell exits; background
// children may hold them open indefinitely.
constexpr int kDrainGraceMs = 50;

bool make_pipe(int fds[2]) {
#ifdef __linux__
    return ::pipe2(fds, O_CLOEXEC) == 0;
#else
    if (::pipe(fds) != 0) return false;
    ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return true;
#endif
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Inherited environment with overrides applied (last writer wins).
std::vector<std::string> merged_environment(const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> out;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        std::string key = entry.substr(0, eq);
        if (overrides.count(key) == 0) {
            out.push_back(std::move(entry));
        }
    }
    for (const auto& [key, value] : overrides) {
        out.push_back(key + "=" + value);
    }
    return out;
}

struct Capture {
    int fd = -1;
    std::string* text = nullptr;
    bool truncated = false;
};

// Read whatever is available; closes fd on EOF or error.
void drain(Capture& c, size_t cap) {
    std::array<char, 4096> buf;
    ssize_t n = ::read(c.fd, buf.data(), buf.size());
    if (n > 0) {
        size_t room = c.text->size() < cap ? cap - c.text->size() : 0;
        size_t take = std::min(room, static_cast<size_t>(n));
        c.text->append(buf.data(), take);
        if (take < static_cast<size_t>(n)) c.truncated = true;
        return;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) return;
    close_fd(c.fd);
}

int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

void kill_group(pid_t pid) {
    // The child called setsid(), so its pid is also its process-group id.
    ::kill(-pid, SIGKILL);
    ::kill(pid, SIGKILL);
}

} // namespace

CommandExecutor::CommandExecutor(ExecutorConfig config)
    : config_(std::move(config)) {}

ExecutionResult CommandExecutor::execute(const ExecRequest& request) const {
    const auto start = Clock::now();
    ExecutionResult result;

    auto finish = [&]() -> ExecutionResult {
        result.duration = std::chrono::duration_cast<std::chrono::nanoseconds>(
            Clock::now() - start);
        return result;
    };
    auto fail = [&](std::string message) -> ExecutionResult {
        result.exit_code = -1;
        result.error = std::move(message);
        return finish();
    };

    std::chrono::milliseconds timeout = request.timeout.value_or(config_.default_timeout);
    if (timeout.count() <= 0) timeout = config_.default_timeout;

    if (!request.working_directory.empty()) {
        std::error_code ec;
        auto st = std::filesystem::status(request.working_directory, ec);
        if (!std::filesystem::exists(st)) {
            return fail("working directory does not exist: " + request.working_directory);
        }
        if (!std::filesystem::is_directory(st)) {
            return fail("working directory is not a directory: " + request.working_directory);
        }
    }

    // Everything the child needs is built before fork().
    std::vector<std::string> args;
    args.push_back(config_.shell);
    if (!config_.shell_arg.empty()) args.push_back(config_.shell_arg);
    args.push_back(request.command);
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    argv.push_back(nullptr);

    std::vector<std::string> env_strings = merged_environment(request.env);
    std::vector<char*> envp;
    for (auto& e : env_strings) envp.push_back(e.data());
    envp.push_back(nullptr);

    const char* cwd = request.working_directory.empty() ? nullptr
                                                        : request.working_directory.c_str();

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    if (!make_pipe(out_pipe) || !make_pipe(err_pipe) || !make_pipe(exec_pipe)) {
        int saved = errno;
        for (int* p : {out_pipe, err_pipe, exec_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return fail(std::string("failed to create pipes: ") + std::strerror(saved));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int saved = errno;
        for (int* p : {out_pipe, err_pipe, exec_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return fail(std::string("failed to fork: ") + std::strerror(saved));
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only.
        ::setsid();
        ::signal(SIGPIPE, SIG_DFL);
        // report[0]: 0 = chdir failed, 1 = exec failed; report[1]: errno
        int report[2] = {0, 0};
        if (cwd && ::chdir(cwd) != 0) {
            report[1] = errno;
        } else {
            int devnull = ::open("/dev/null", O_RDONLY);
            if (devnull >= 0) {
                ::dup2(devnull, STDIN_FILENO);
                ::close(devnull);
            }
            ::dup2(out_pipe[1], STDOUT_FILENO);
            ::dup2(err_pipe[1], STDERR_FILENO);
            environ = envp.data();
            ::execvp(argv[0], argv.data());
            report[0] = 1;
            report[1] = errno;
        }
        ssize_t ignored = ::write(exec_pipe[1], report, sizeof(report));
        (void)ignored;
        ::_exit(kExecFailedStatus);
    }

    spawned_.fetch_add(1);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);

    // exec_pipe closes on successful exec (O_CLOEXEC) or carries a report.
    int report[2] = {0, 0};
    ssize_t n;
    do {
        n = ::read(exec_pipe[0], report, sizeof(report));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(report))) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        close_fd(out_pipe[0]);
        close_fd(err_pipe[0]);
        if (report[0] == 0) {
            return fail("failed to enter working directory " + request.working_directory +
                        ": " + std::strerror(report[1]));
        }
        return fail("failed to start " + config_.shell + ": " + std::strerror(report[1]));
    }

    Capture out{out_pipe[0], &result.stdout_text};
    Capture err{err_pipe[0], &result.stderr_text};
    const auto deadline = start + timeout;

    int status = 0;
    int poll_errno = 0;
    bool exited = false;
    std::optional<Clock::time_point> drain_until;

    while (true) {
        auto now = Clock::now();
        if (!exited && now >= deadline) {
            kill_group(pid);
            ::waitpid(pid, &status, 0);
            result.timed_out = true;
            break;
        }

        if (!exited) {
            pid_t w = ::waitpid(pid, &status, WNOHANG);
            if (w == pid) {
                exited = true;
                drain_until = Clock::now() + std::chrono::milliseconds(kDrainGraceMs);
            }
        }
        if (exited && ((out.fd < 0 && err.fd < 0) || Clock::now() >= *drain_until)) {
            break;
        }

        auto limit = exited ? *drain_until : deadline;
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            limit - Clock::now()).count();
        // Wake periodically to reap the child even while pipes stay quiet.
        int wait_ms = static_cast<int>(std::max<int64_t>(0, std::min<int64_t>(remaining, 20)));

        struct pollfd fds[2];
        nfds_t nfds = 0;
        Capture* order[2] = {nullptr, nullptr};
        for (Capture* c : {&out, &err}) {
            if (c->fd >= 0) {
                fds[nfds].fd = c->fd;
                fds[nfds].events = POLLIN;
                fds[nfds].revents = 0;
                order[nfds] = c;
                ++nfds;
            }
        }

        int ret = ::poll(nfds > 0 ? fds : nullptr, nfds, wait_ms);
        if (ret < 0 && errno != EINTR) {
            poll_errno = errno;
            break;
        }
        for (nfds_t i = 0; ret > 0 && i < nfds; ++i) {
            if (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) {
                drain(*order[i], config_.max_output_bytes);
            }
        }
    }

    close_fd(out.fd);
    close_fd(err.fd);

    if (out.truncated) result.stdout_text += "\n[truncated]";
    if (err.truncated) result.stderr_text += "\n[truncated]";

    if (result.timed_out) {
        return fail("command timed out after " + format_duration(timeout));
    }
    if (!exited) {
        // poll() failed hard; make sure nothing is left running.
        kill_group(pid);
        ::waitpid(pid, &status, 0);
        return fail(std::string("lost track of command: ") + std::strerror(poll_errno));
    }

    result.exit_code = decode_status(status);
    return finish();
}

} // namespace cmdgate
