#include "process.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <stdexcept>
#include <sys/wait.h>
#include <unistd.h>

namespace gitmcp {

namespace {

// Upper bound on bytes taken from one stream per wakeup so a chatty child
// cannot starve the rest of the poll loop.
constexpr size_t kMaxReadPerEvent = 64 * 1024;

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Both ends close-on-exec: a pipe end must never leak into a sibling child,
// or that sibling would hold the other child's stdin open.
bool make_pipe(int fds[2]) {
    if (::pipe(fds) != 0) return false;
    for (int i = 0; i < 2; ++i) {
        int flags = ::fcntl(fds[i], F_GETFD);
        if (flags < 0 || ::fcntl(fds[i], F_SETFD, flags | FD_CLOEXEC) != 0) {
            ::close(fds[0]);
            ::close(fds[1]);
            fds[0] = fds[1] = -1;
            return false;
        }
    }
    return true;
}

bool set_nonblocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL);
    return flags >= 0 && ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

// Child side only: async-signal-safe calls from here on.
bool redirect(int fd, int target) {
    if (fd == target) {
        int flags = ::fcntl(fd, F_GETFD);
        return flags >= 0 && ::fcntl(fd, F_SETFD, flags & ~FD_CLOEXEC) == 0;
    }
    return ::dup2(fd, target) >= 0;
}

[[noreturn]] void child_fail(int report_fd, int err) {
    ssize_t n = ::write(report_fd, &err, sizeof(err));
    (void)n;
    _exit(127);
}

int decode_wait_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return -WTERMSIG(status);
    return kSpawnFailureExitCode;
}

} // namespace

ChildProcess::ChildProcess(const CommandSpec& spec) {
    spawn(spec);
}

ChildProcess::~ChildProcess() {
    close_fd(stdin_fd_);
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
    if (!reaped_ && pid_ > 0) {
        // Owner went away before the child finished
        ::kill(pid_, SIGKILL);
        int status = 0;
        while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
        }
    }
}

void ChildProcess::fail_spawn(const std::string& what, int err) {
    pid_ = -1;
    reaped_ = true;
    outcome_.exit_code = kSpawnFailureExitCode;
    outcome_.stdout_bytes.clear();
    outcome_.stderr_bytes = what + ": " + std::strerror(err);
}

void ChildProcess::spawn(const CommandSpec& spec) {
    if (spec.argv.empty()) {
        fail_spawn("Failed to execute command", EINVAL);
        return;
    }

    // Build the exec vector before fork; the child must not allocate.
    std::vector<char*> cargs;
    cargs.reserve(spec.argv.size() + 1);
    for (const auto& arg : spec.argv) {
        cargs.push_back(const_cast<char*>(arg.c_str()));
    }
    cargs.push_back(nullptr);

    const bool has_stdin = spec.stdin_text.has_value();
    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};

    auto close_all = [&]() {
        close_fd(in_pipe[0]);   close_fd(in_pipe[1]);
        close_fd(out_pipe[0]);  close_fd(out_pipe[1]);
        close_fd(err_pipe[0]);  close_fd(err_pipe[1]);
        close_fd(exec_pipe[0]); close_fd(exec_pipe[1]);
    };

    if ((has_stdin && !make_pipe(in_pipe)) || !make_pipe(out_pipe) ||
        !make_pipe(err_pipe) || !make_pipe(exec_pipe)) {
        int err = errno;
        close_all();
        fail_spawn("Failed to create pipes", err);
        return;
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        close_all();
        fail_spawn("Failed to fork process", err);
        return;
    }

    if (pid == 0) {
        // SIGPIPE is ignored in the bridge; the script gets the default back.
        ::signal(SIGPIPE, SIG_DFL);
        int in_fd = has_stdin ? in_pipe[0] : ::open("/dev/null", O_RDONLY);
        if (in_fd < 0 ||
            !redirect(in_fd, STDIN_FILENO) ||
            !redirect(out_pipe[1], STDOUT_FILENO) ||
            !redirect(err_pipe[1], STDERR_FILENO)) {
            child_fail(exec_pipe[1], errno);
        }
        ::execvp(cargs[0], cargs.data());
        child_fail(exec_pipe[1], errno);
    }

    // Parent process
    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);

    // exec_pipe closes on a successful exec; an int arrives only on failure.
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        close_all();
        fail_spawn("Failed to execute " + spec.argv[0], child_errno);
        return;
    }

    pid_ = pid;
    stdout_fd_ = out_pipe[0];
    stderr_fd_ = err_pipe[0];
    stdin_fd_ = in_pipe[1];
    set_nonblocking(stdout_fd_);
    set_nonblocking(stderr_fd_);

    if (has_stdin) {
        pending_stdin_ = *spec.stdin_text;
        set_nonblocking(stdin_fd_);
        if (pending_stdin_.empty()) close_stdin();
    }
}

void ChildProcess::add_poll_fds(std::vector<struct pollfd>& fds) const {
    if (stdin_fd_ >= 0) fds.push_back({stdin_fd_, POLLOUT, 0});
    if (stdout_fd_ >= 0) fds.push_back({stdout_fd_, POLLIN, 0});
    if (stderr_fd_ >= 0) fds.push_back({stderr_fd_, POLLIN, 0});
}

void ChildProcess::handle_events(const std::vector<struct pollfd>& fds) {
    for (const auto& pfd : fds) {
        if (pfd.revents == 0 || pfd.fd < 0) continue;
        if (pfd.fd == stdin_fd_) {
            write_stdin();
        } else if (pfd.fd == stdout_fd_) {
            drain(stdout_fd_, outcome_.stdout_bytes);
        } else if (pfd.fd == stderr_fd_) {
            drain(stderr_fd_, outcome_.stderr_bytes);
        }
    }
}

void ChildProcess::write_stdin() {
    while (stdin_fd_ >= 0 && stdin_offset_ < pending_stdin_.size()) {
        ssize_t n = ::write(stdin_fd_, pending_stdin_.data() + stdin_offset_,
                            pending_stdin_.size() - stdin_offset_);
        if (n > 0) {
            stdin_offset_ += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
        // EPIPE: the child stopped reading; drop the rest
        break;
    }
    close_stdin();
}

void ChildProcess::drain(int& fd, std::string& sink) {
    std::array<char, 4096> buffer;
    size_t taken = 0;
    while (fd >= 0 && taken < kMaxReadPerEvent) {
        ssize_t n = ::read(fd, buffer.data(), buffer.size());
        if (n > 0) {
            sink.append(buffer.data(), static_cast<size_t>(n));
            taken += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
        // EOF or read error ends the stream
        close_fd(fd);
    }
}

void ChildProcess::close_stdin() {
    close_fd(stdin_fd_);
    pending_stdin_.clear();
    stdin_offset_ = 0;
}

bool ChildProcess::awaiting_exit() const {
    return !reaped_ && stdout_fd_ < 0 && stderr_fd_ < 0;
}

bool ChildProcess::done() {
    if (stdout_fd_ >= 0 || stderr_fd_ >= 0) return false;
    if (reaped_) return true;

    int status = 0;
    pid_t r = ::waitpid(pid_, &status, WNOHANG);
    if (r == 0) return false;
    if (r < 0) {
        if (errno == EINTR) return false;
        outcome_.exit_code = kSpawnFailureExitCode;
        outcome_.stderr_bytes += std::string("Failed to collect exit status: ") +
                                 std::strerror(errno);
    } else {
        outcome_.exit_code = decode_wait_status(status);
    }
    reaped_ = true;
    close_stdin();
    return true;
}

ExecutionOutcome run_process(const CommandSpec& spec) {
    ChildProcess child(spec);
    std::vector<struct pollfd> fds;
    while (!child.done()) {
        fds.clear();
        child.add_poll_fds(fds);
        int timeout = child.awaiting_exit() ? kReapPollIntervalMs : -1;
        int ret = ::poll(fds.data(), fds.size(), timeout);
        if (ret < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error(std::string("poll failed: ") + std::strerror(errno));
        }
        child.handle_events(fds);
    }
    return child.outcome();
}

} // namespace gitmcp
