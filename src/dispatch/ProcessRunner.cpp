#include "dispatch/ProcessRunner.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace mcpify {

namespace {

// Output still arriving this long after a kill is abandoned.
constexpr std::chrono::milliseconds kKillGrace{200};
constexpr int kPollIntervalMs = 50;

void ignore_sigpipe() {
    static std::once_flag once;
    std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
        fd = -1;
    }
}

void drain_pipe(int& fd, std::string& out) {
    if (fd < 0) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        close_fd(fd);
        return;
    }
}

void feed_stdin(int& fd, const std::string& input, size_t& written) {
    while (fd >= 0 && written < input.size()) {
        const ssize_t n = write(fd, input.data() + written, input.size() - written);
        if (n > 0) {
            written += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        // EPIPE: the child stopped reading
        close_fd(fd);
        return;
    }
    close_fd(fd);
}

struct Pipe {
    int read_end = -1;
    int write_end = -1;

    ~Pipe() {
        close_fd(read_end);
        close_fd(write_end);
    }

    void open() {
        int fds[2];
        // Close-on-exec so children forked by concurrent calls do not inherit them
        if (pipe2(fds, O_CLOEXEC) != 0) {
            throw std::runtime_error(std::string("Failed to create pipe: ") + std::strerror(errno));
        }
        read_end = fds[0];
        write_end = fds[1];
    }
};

} // namespace

ProcessResult ProcessRunner::run(const ProcessRequest& request) {
    if (request.argv.empty()) {
        throw ProcessLaunchError("Empty command line");
    }
    ignore_sigpipe();

    ProcessResult result;
    if (request.cancel && request.cancel->load()) {
        result.cancelled = true;
        return result;
    }

    Pipe in, out, err, exec_status;
    in.open();
    out.open();
    err.open();
    exec_status.open();

    // Everything the child needs is prepared before fork.
    std::vector<char*> argv;
    argv.reserve(request.argv.size() + 1);
    for (const auto& arg : request.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    const char* cwd = request.working_dir.empty() ? nullptr : request.working_dir.c_str();

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        throw std::runtime_error(std::string("Failed to fork: ") + std::strerror(errno));
    }

    if (pid == 0) {
        static_cast<void>(setpgid(0, 0));
        int error = 0;
        if (cwd && chdir(cwd) != 0) {
            error = errno;
        } else {
            // dup2 clears close-on-exec on the standard descriptors only
            static_cast<void>(dup2(in.read_end, STDIN_FILENO));
            static_cast<void>(dup2(out.write_end, STDOUT_FILENO));
            static_cast<void>(dup2(err.write_end, STDERR_FILENO));
            execvp(argv[0], argv.data());
            error = errno;
        }
        static_cast<void>(write(exec_status.write_end, &error, sizeof(error)));
        _exit(127);
    }

    // Also set from the parent so the group exists before any kill.
    static_cast<void>(setpgid(pid, pid));

    close_fd(in.read_end);
    close_fd(out.write_end);
    close_fd(err.write_end);
    close_fd(exec_status.write_end);

    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(exec_status.read_end, &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_status.read_end);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        static_cast<void>(waitpid(pid, &status, 0));
        throw ProcessLaunchError("Cannot execute '" + request.argv.front() + "'" +
                                 (cwd ? " in " + request.working_dir : std::string()) +
                                 ": " + std::strerror(exec_errno));
    }

    spdlog::debug("Started pid {}: {}", pid, request.argv.front());

    set_nonblocking(in.write_end);
    set_nonblocking(out.read_end);
    set_nonblocking(err.read_end);
    size_t written = 0;
    if (request.input.empty()) {
        close_fd(in.write_end);
    }

    bool child_exited = false;
    bool killed = false;
    int status = 0;
    std::chrono::steady_clock::time_point killed_at;

    auto kill_group = [&]() {
        if (!killed) {
            static_cast<void>(kill(-pid, SIGKILL));
            killed = true;
            killed_at = std::chrono::steady_clock::now();
        }
    };

    while (true) {
        const auto now = std::chrono::steady_clock::now();

        if (!killed && request.cancel && request.cancel->load()) {
            result.cancelled = true;
            kill_group();
        }
        if (!killed && request.timeout.count() > 0 && now - started > request.timeout) {
            result.timed_out = true;
            kill_group();
        }
        if (killed && now - killed_at > kKillGrace) {
            break;
        }

        pollfd fds[3];
        nfds_t nfds = 0;
        if (out.read_end >= 0) {
            fds[nfds++] = {out.read_end, POLLIN, 0};
        }
        if (err.read_end >= 0) {
            fds[nfds++] = {err.read_end, POLLIN, 0};
        }
        if (in.write_end >= 0) {
            fds[nfds++] = {in.write_end, POLLOUT, 0};
        }
        if (nfds > 0) {
            static_cast<void>(poll(fds, nfds, kPollIntervalMs));
        } else if (!child_exited) {
            usleep(kPollIntervalMs * 1000);
        }

        feed_stdin(in.write_end, request.input, written);
        drain_pipe(out.read_end, result.stdout_text);
        drain_pipe(err.read_end, result.stderr_text);

        if (!child_exited && waitpid(pid, &status, WNOHANG) == pid) {
            child_exited = true;
        }
        if (child_exited && out.read_end < 0 && err.read_end < 0) {
            break;
        }
    }

    if (!child_exited) {
        kill_group();
        static_cast<void>(waitpid(pid, &status, 0));
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }

    result.duration_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - started).count();
    spdlog::debug("pid {} finished: exit {} in {:.1f} ms{}", pid, result.exit_code, result.duration_ms,
                  result.timed_out ? " (timed out)" : (result.cancelled ? " (cancelled)" : ""));
    return result;
}

} // namespace mcpify
