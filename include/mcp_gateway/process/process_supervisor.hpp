#pragma once

#include <mcp_gateway/core/result.hpp>
#include <mcp_gateway/process/i_child_process.hpp>
#include <mcp_gateway/process/server_descriptor.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace mcp_gateway {

// ---------------------------------------------------------------------------
// IProcessSupervisor: spawns tool servers and guarantees their teardown.
//
// McpSession depends on this interface rather than on fork/exec so session
// and handshake logic can be tested offline with MockProcessSupervisor.
// ---------------------------------------------------------------------------
class IProcessSupervisor {
public:
    virtual ~IProcessSupervisor() = default;

    IProcessSupervisor(const IProcessSupervisor&) = delete;
    IProcessSupervisor& operator=(const IProcessSupervisor&) = delete;
    IProcessSupervisor(IProcessSupervisor&&) = delete;
    IProcessSupervisor& operator=(IProcessSupervisor&&) = delete;

    /// Start the descriptor's command with piped stdio. Fails with
    /// ErrorCategory::Spawn without creating a process when the script or
    /// program is missing or not executable. Never retried.
    [[nodiscard]] virtual Result<std::unique_ptr<IChildProcess>, Error> Spawn(
        const ServerDescriptor& descriptor) = 0;

    /// Stop the process (graceful, then forced). Idempotent, never throws.
    virtual void Terminate(IChildProcess& process) noexcept = 0;

protected:
    IProcessSupervisor() = default;
};

// ---------------------------------------------------------------------------
// SupervisorOptions
// ---------------------------------------------------------------------------
struct SupervisorOptions {
    std::chrono::milliseconds grace_period{5000};
    std::chrono::milliseconds write_timeout{30000};
    // Added to (and overriding) the inherited environment.
    std::map<std::string, std::string> extra_env;
};

// ---------------------------------------------------------------------------
// ProcessSupervisor: posix_spawn based implementation.
//
// Every child gets:
//   - stdin/stdout/stderr connected to pipes owned by the returned process
//   - its own process group (so termination reaches helpers it started)
//   - default signal dispositions and an empty signal mask
//   - a UTF-8 environment (PYTHONIOENCODING=utf-8:replace, LANG/LC_ALL)
//
// Constructing a supervisor sets SIGPIPE to SIG_IGN for the whole gateway,
// so writing to a child that already exited fails with EPIPE instead of
// killing the process.
// ---------------------------------------------------------------------------
class ProcessSupervisor : public IProcessSupervisor {
public:
    explicit ProcessSupervisor(SupervisorOptions options = {});

    [[nodiscard]] Result<std::unique_ptr<IChildProcess>, Error> Spawn(
        const ServerDescriptor& descriptor) override;

    void Terminate(IChildProcess& process) noexcept override;

    [[nodiscard]] const SupervisorOptions& Options() const noexcept { return options_; }

private:
    SupervisorOptions options_;
};

/// Resolve a program name the way execvp would: names containing '/' are
/// used as-is, bare names are searched on PATH. Returns an empty string if
/// nothing executable is found.
std::string ResolveProgram(const std::string& program);

/// The environment a child is started with: the current environment with
/// the UTF-8 settings and `extra` applied, as KEY=VALUE strings.
std::vector<std::string> BuildChildEnvironment(
    const std::map<std::string, std::string>& extra);

} // namespace mcp_gateway
