#include <mcp_gateway/process/child_process.hpp>

#include <mcp_gateway/core/log.hpp>

#include <cerrno>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace mcp_gateway {

namespace {

constexpr auto kDefaultGrace = std::chrono::milliseconds{5000};
constexpr auto kReapPollInterval = std::chrono::milliseconds{10};
constexpr size_t kReadChunk = 4096;

int RemainingMs(std::chrono::steady_clock::time_point deadline) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) return 0;
    if (remaining.count() > 0x7fffffff) return 0x7fffffff;
    return static_cast<int>(remaining.count());
}

std::string ErrnoText(int err) {
    return std::string(std::strerror(err));
}

} // anonymous namespace

std::string DescribeWaitStatus(int status) {
    if (WIFEXITED(status)) {
        return "exit code " + std::to_string(WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status)) {
        return "signal " + std::to_string(WTERMSIG(status));
    }
    return "status " + std::to_string(status);
}

PosixChildProcess::PosixChildProcess(std::string name, pid_t pid,
                                     int stdin_fd, int stdout_fd, int stderr_fd,
                                     std::chrono::milliseconds write_timeout)
    : name_(std::move(name)),
      pid_(pid),
      stdin_fd_(stdin_fd),
      stdout_fd_(stdout_fd),
      stderr_fd_(stderr_fd),
      write_timeout_(write_timeout) {
    if (stdin_fd_ >= 0) {
        int flags = ::fcntl(stdin_fd_, F_GETFL);
        if (flags >= 0) {
            ::fcntl(stdin_fd_, F_SETFL, flags | O_NONBLOCK);
        }
    }
}

PosixChildProcess::~PosixChildProcess() {
    Terminate(kDefaultGrace);
}

Error PosixChildProcess::MakeError(const std::string& operation,
                                   const std::string& message,
                                   ErrorCategory category) const {
    return Error{operation, name_, std::nullopt, message, std::nullopt, category};
}

void PosixChildProcess::CloseFd(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// ---------------------------------------------------------------------------
// Writing
// ---------------------------------------------------------------------------
Result<void, Error> PosixChildProcess::WriteLine(std::string_view line) {
    if (terminated_ || stdin_fd_ < 0) {
        return Result<void, Error>::Err(
            MakeError("WriteLine", "child stdin is closed", ErrorCategory::Io));
    }

    std::string data(line);
    data.push_back('\n');

    const auto deadline = std::chrono::steady_clock::now() + write_timeout_;
    size_t written = 0;
    while (written < data.size()) {
        auto n = ::write(stdin_fd_, data.data() + written, data.size() - written);
        if (n > 0) {
            written += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            pollfd pfd{stdin_fd_, POLLOUT, 0};
            int ready = ::poll(&pfd, 1, RemainingMs(deadline));
            if (ready < 0 && errno == EINTR) {
                continue;
            }
            if (ready == 0) {
                return Result<void, Error>::Err(MakeError(
                    "WriteLine", "timed out writing to child stdin",
                    ErrorCategory::Timeout));
            }
            if (ready < 0) {
                return Result<void, Error>::Err(MakeError(
                    "WriteLine", "poll failed: " + ErrnoText(errno),
                    ErrorCategory::Io));
            }
            continue;
        }
        const int err = errno;
        if (err == EPIPE) {
            return Result<void, Error>::Err(MakeError(
                "WriteLine", "broken pipe: child closed its stdin",
                ErrorCategory::Io));
        }
        return Result<void, Error>::Err(MakeError(
            "WriteLine", "write failed: " + ErrnoText(err), ErrorCategory::Io));
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// Reading
// ---------------------------------------------------------------------------
void PosixChildProcess::AppendStderr(const char* data, size_t size) {
    stderr_tail_.append(data, size);
    if (stderr_tail_.size() > kStderrTailBytes) {
        stderr_tail_.erase(0, stderr_tail_.size() - kStderrTailBytes);
    }
}

// Reads whatever stderr has available without blocking. Returns false once
// stderr reached end of stream.
// At most one tail's worth is read per call, so a child that never stops
// writing cannot keep the caller here.
bool PosixChildProcess::PumpStderr() {
    char chunk[kReadChunk];
    size_t drained = 0;
    while (stderr_fd_ >= 0 && drained < kStderrTailBytes) {
        pollfd pfd{stderr_fd_, POLLIN, 0};
        int ready = ::poll(&pfd, 1, 0);
        if (ready < 0 && errno == EINTR) continue;
        if (ready <= 0) return true;

        auto n = ::read(stderr_fd_, chunk, sizeof(chunk));
        if (n > 0) {
            AppendStderr(chunk, static_cast<size_t>(n));
            drained += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        CloseFd(stderr_fd_);
        return false;
    }
    return stderr_fd_ >= 0;
}

Result<std::optional<std::string>, Error> PosixChildProcess::ReadLine(
    std::chrono::milliseconds timeout) {
    using R = Result<std::optional<std::string>, Error>;
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    for (;;) {
        auto newline = read_buffer_.find('\n');
        if (newline != std::string::npos) {
            std::string line = read_buffer_.substr(0, newline);
            read_buffer_.erase(0, newline + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return R::Ok(std::optional<std::string>(std::move(line)));
        }

        if (stdout_eof_ || stdout_fd_ < 0) {
            if (!read_buffer_.empty()) {
                // Final line without a terminator.
                std::string rest = std::move(read_buffer_);
                read_buffer_.clear();
                return R::Ok(std::optional<std::string>(std::move(rest)));
            }
            return R::Ok(std::optional<std::string>{});
        }

        pollfd fds[2];
        nfds_t count = 0;
        fds[count++] = pollfd{stdout_fd_, POLLIN, 0};
        if (stderr_fd_ >= 0) {
            fds[count++] = pollfd{stderr_fd_, POLLIN, 0};
        }

        int ready = ::poll(fds, count, RemainingMs(deadline));
        if (ready < 0) {
            if (errno == EINTR) continue;
            return R::Err(MakeError("ReadLine", "poll failed: " + ErrnoText(errno),
                                    ErrorCategory::Io));
        }
        if (ready == 0) {
            return R::Err(MakeError(
                "ReadLine",
                "no reply within " + std::to_string(timeout.count()) + " ms",
                ErrorCategory::Timeout));
        }

        if (count > 1 && fds[1].revents != 0) {
            PumpStderr();
        }

        if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
            char chunk[kReadChunk];
            auto n = ::read(stdout_fd_, chunk, sizeof(chunk));
            if (n > 0) {
                read_buffer_.append(chunk, static_cast<size_t>(n));
            } else if (n == 0) {
                stdout_eof_ = true;
            } else if (errno != EINTR && errno != EAGAIN) {
                return R::Err(MakeError("ReadLine",
                                        "read failed: " + ErrnoText(errno),
                                        ErrorCategory::Io));
            }
        }
    }
}

std::string PosixChildProcess::StderrTail() {
    PumpStderr();
    return stderr_tail_;
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------
bool PosixChildProcess::TryReap() {
    if (exit_status_.has_value()) return true;
    if (pid_ <= 0) return true;

    int status = 0;
    pid_t r = ::waitpid(pid_, &status, WNOHANG);
    if (r == pid_) {
        exit_status_ = status;
        return true;
    }
    if (r < 0 && errno == ECHILD) {
        // Already reaped elsewhere; nothing left to wait for.
        exit_status_ = 0;
        return true;
    }
    return false;
}

bool PosixChildProcess::IsRunning() {
    return !TryReap();
}

void PosixChildProcess::Signal(int signo) noexcept {
    // The child leads its own process group, so helpers it started go too.
    if (::kill(-pid_, signo) == 0) return;
    if (::kill(pid_, signo) != 0 && errno != ESRCH) {
        LogWarn("process", "kill(" + std::to_string(pid_) + ", " +
                               std::to_string(signo) + ") failed: " +
                               ErrnoText(errno));
    }
}

// Also true while only helpers the child left behind remain in its group.
bool PosixChildProcess::GroupAlive() const noexcept {
    return pid_ > 0 && ::kill(-pid_, 0) == 0;
}

void PosixChildProcess::Terminate(std::chrono::milliseconds grace) noexcept {
    if (terminated_) return;
    terminated_ = true;

    try {
        // EOF on stdin is the politest stop request; many servers exit on it.
        CloseFd(stdin_fd_);

        // Signal even when the leader already exited: background helpers it
        // started still belong to the group.
        auto stopped = [this] { return TryReap() && !GroupAlive(); };
        if (!stopped()) {
            Signal(SIGTERM);
            const auto deadline = std::chrono::steady_clock::now() + grace;
            while (!stopped() && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(kReapPollInterval);
            }
        }

        if (!stopped()) {
            LogWarn("process", name_ + " (pid " + std::to_string(pid_) +
                                   ") ignored SIGTERM for " +
                                   std::to_string(grace.count()) +
                                   " ms, sending SIGKILL");
            Signal(SIGKILL);
            if (!exit_status_.has_value()) {
                int status = 0;
                pid_t r;
                do {
                    r = ::waitpid(pid_, &status, 0);
                } while (r < 0 && errno == EINTR);
                if (r == pid_) {
                    exit_status_ = status;
                } else {
                    LogWarn("process", "waitpid(" + std::to_string(pid_) +
                                           ") failed: " + ErrnoText(errno));
                }
            }
        }

        PumpStderr();
        CloseFd(stdout_fd_);
        CloseFd(stderr_fd_);

        LogDebug("process", name_ + " (pid " + std::to_string(pid_) + ") terminated: " +
                                (exit_status_ ? DescribeWaitStatus(*exit_status_)
                                              : std::string("unknown status")));
    } catch (const std::exception& e) {
        CloseFd(stdin_fd_);
        CloseFd(stdout_fd_);
        CloseFd(stderr_fd_);
        LogError("process", std::string("terminate failed: ") + e.what());
    }
}

} // namespace mcp_gateway
