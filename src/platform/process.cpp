#include "process.hpp"
#include <core/constants.hpp>

#include <unistd.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>

namespace platform {

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
    if (stdout_fd_ >= 0) close(stdout_fd_);
    // Reap a child nobody waited for so it does not linger as a zombie
    if (pid_ > 0) waitpid(pid_, nullptr, WNOHANG);
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept {
    pid_ = other.pid_;
    stdout_fd_ = other.stdout_fd_;
    other.pid_ = -1;
    other.stdout_fd_ = -1;
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        if (stdout_fd_ >= 0) close(stdout_fd_);
        pid_ = other.pid_;
        stdout_fd_ = other.stdout_fd_;
        other.pid_ = -1;
        other.stdout_fd_ = -1;
    }
    return *this;
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

int ProcessHandle::wait() {
    if (pid_ <= 0) return -1;
    int status = 0;
    pid_t ret;
    do {
        ret = waitpid(pid_, &status, 0);
    } while (ret < 0 && errno == EINTR);
    pid_ = -1;
    if (ret < 0) return -1;
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

// ── spawn ────────────────────────────────────────────────────

ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    bool capture_stdout) {
    ProcessHandle handle;

    int out_pipe[2] = {-1, -1};
    if (capture_stdout && pipe2(out_pipe, O_CLOEXEC) != 0) {
        return handle;
    }

    // Build argv before fork: the child may only call async-signal-safe code
    std::vector<const char*> argv;
    argv.push_back(program.c_str());
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        if (capture_stdout) {
            close(out_pipe[0]);
            close(out_pipe[1]);
        }
        return handle;  // fork failed
    }

    if (pid == 0) {
        // Child process
        close(STDIN_FILENO);

        int devnull = open("/dev/null", O_WRONLY);
        if (devnull >= 0) {
            dup2(devnull, STDERR_FILENO);
            if (!capture_stdout) dup2(devnull, STDOUT_FILENO);
            close(devnull);
        }
        if (capture_stdout) {
            dup2(out_pipe[1], STDOUT_FILENO);
        }

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        _exit(kExecFailedExitCode);  // exec failed
    }

    // Parent
    if (capture_stdout) {
        close(out_pipe[1]);
        handle.stdout_fd_ = out_pipe[0];
    }
    handle.pid_ = pid;
    return handle;
}

// ── run_capture ──────────────────────────────────────────────

Result<CommandResult> run_capture(const std::string& program,
                                  const std::vector<std::string>& args) {
    ProcessHandle proc = spawn(program, args, true);
    if (!proc.valid()) {
        return Result<CommandResult>::Err(
            "Failed to start " + program + ": " + std::strerror(errno));
    }

    CommandResult result{0, ""};
    char buf[CAPTURE_READ_BUF_SIZE];
    for (;;) {
        ssize_t n = read(proc.stdout_fd(), buf, sizeof(buf));
        if (n > 0) {
            result.stdout_data.append(buf, static_cast<size_t>(n));
        } else if (n == 0) {
            break;
        } else if (errno != EINTR) {
            break;
        }
    }

    result.exit_code = proc.wait();
    return Result<CommandResult>::Ok(std::move(result));
}

} // namespace platform
