#pragma once

#include <mcp_gateway/process/i_child_process.hpp>

#include <sys/types.h>

#include <chrono>
#include <optional>
#include <string>

namespace mcp_gateway {

// ---------------------------------------------------------------------------
// PosixChildProcess: IChildProcess over three pipes and a pid.
//
// Reads poll stdout and stderr together: stderr is drained into a bounded
// tail buffer so a child that logs heavily cannot block on a full pipe while
// the gateway waits for its reply. Writes use a non-blocking descriptor and
// poll, so a child that stops reading cannot hang the writer forever.
//
// Takes ownership of the file descriptors. The child is expected to lead its
// own process group; signals go to the whole group, and Terminate() returns
// only once the group is gone or has been sent SIGKILL.
// ---------------------------------------------------------------------------
class PosixChildProcess : public IChildProcess {
public:
    PosixChildProcess(std::string name, pid_t pid,
                      int stdin_fd, int stdout_fd, int stderr_fd,
                      std::chrono::milliseconds write_timeout = std::chrono::seconds{30});

    // Terminates with the default grace period if still running.
    ~PosixChildProcess() override;

    [[nodiscard]] Result<void, Error> WriteLine(std::string_view line) override;
    [[nodiscard]] Result<std::optional<std::string>, Error> ReadLine(
        std::chrono::milliseconds timeout) override;

    [[nodiscard]] int Pid() const override { return static_cast<int>(pid_); }
    [[nodiscard]] std::string StderrTail() override;
    [[nodiscard]] bool IsRunning() override;
    void Terminate(std::chrono::milliseconds grace) noexcept override;
    [[nodiscard]] bool IsTerminated() const override { return terminated_; }
    [[nodiscard]] std::optional<int> ExitStatus() const override { return exit_status_; }

    static constexpr size_t kStderrTailBytes = 4096;

private:
    Error MakeError(const std::string& operation, const std::string& message,
                    ErrorCategory category) const;
    void AppendStderr(const char* data, size_t size);
    bool PumpStderr();
    bool TryReap();
    bool GroupAlive() const noexcept;
    void Signal(int signo) noexcept;
    static void CloseFd(int& fd) noexcept;

    std::string name_;
    pid_t pid_;
    int stdin_fd_;
    int stdout_fd_;
    int stderr_fd_;
    std::chrono::milliseconds write_timeout_;

    std::string read_buffer_;
    std::string stderr_tail_;
    bool stdout_eof_ = false;
    bool terminated_ = false;
    std::optional<int> exit_status_;
};

/// Human-readable description of a raw wait status ("exit code 1", "signal 9").
std::string DescribeWaitStatus(int status);

} // namespace mcp_gateway
