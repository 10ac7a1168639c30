#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

namespace platform {

// Opaque handle to a spawned child process.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // Read end of the child's stdout pipe, or -1 if stdout was not captured.
    int stdout_fd() const { return stdout_fd_; }

    // Block until the process exits. Returns exit code, or -1 if it was
    // killed by a signal.
    int wait();

    int native_handle() const { return pid_; }

private:
    int pid_ = -1;
    int stdout_fd_ = -1;

    friend ProcessHandle spawn(const std::string& program,
                               const std::vector<std::string>& args,
                               bool capture_stdout);
};

// Spawn a child process with stdin closed and stderr sent to /dev/null.
// capture_stdout: connect the child's stdout to a pipe readable via stdout_fd().
ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    bool capture_stdout = false);

// Exit code the child uses when exec itself failed.
constexpr int kExecFailedExitCode = 127;

// Run a program to completion, collecting all of its stdout.
// Err only when the child could not be started at all; a non-zero exit is
// reported through CommandResult::exit_code.
Result<CommandResult> run_capture(const std::string& program,
                                  const std::vector<std::string>& args);

} // namespace platform
