#pragma once
#include <optional>
#include <string>
#include <vector>
#include <poll.h>
#include <sys/types.h>

namespace gitmcp {

// One process to run: argv[0] is the executable (a path, or a bare name
// looked up on PATH), stdin_text is written to the child and then closed.
// Without stdin_text the child reads from /dev/null.
struct CommandSpec {
    std::vector<std::string> argv;
    std::optional<std::string> stdin_text;
};

// Raw result of a finished child. stdout/stderr hold undecoded bytes.
// exit_code is the exit status, or -N when the child died from signal N.
struct ExecutionOutcome {
    int exit_code = 0;
    std::string stdout_bytes;
    std::string stderr_bytes;
};

// Exit code reported when the child could not be started at all.
constexpr int kSpawnFailureExitCode = 1;

// Poll timeout used while a child has closed its output but not yet exited.
constexpr int kReapPollIntervalMs = 10;

// A running child process with its stdin, stdout and stderr on separate
// pipes. Designed to be driven by a poll() loop: the owner collects the
// descriptors with add_poll_fds(), polls, then passes the results back
// through handle_events(). Never blocks after construction.
//
// Spawn failures do not throw: the object is born finished, with
// kSpawnFailureExitCode and the OS error text in stderr.
class ChildProcess {
public:
    explicit ChildProcess(const CommandSpec& spec);
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    // Append the descriptors this child still needs serviced.
    void add_poll_fds(std::vector<struct pollfd>& fds) const;

    // Read/write whichever of this child's descriptors are ready.
    void handle_events(const std::vector<struct pollfd>& fds);

    // True once both output streams reached EOF and the exit status was
    // collected. Reaps without blocking.
    bool done();

    // Output is fully drained but the child has not exited yet; the poll
    // loop has no descriptor to wait on and must poll with a timeout.
    bool awaiting_exit() const;

    const ExecutionOutcome& outcome() const { return outcome_; }
    pid_t pid() const { return pid_; }

private:
    void spawn(const CommandSpec& spec);
    void fail_spawn(const std::string& what, int err);
    void write_stdin();
    void drain(int& fd, std::string& sink);
    void close_stdin();

    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    std::string pending_stdin_;
    size_t stdin_offset_ = 0;
    bool reaped_ = false;
    ExecutionOutcome outcome_;
};

// Run one command to completion and return what it produced. Blocks the
// calling thread; there is no timeout.
ExecutionOutcome run_process(const CommandSpec& spec);

} // namespace gitmcp
