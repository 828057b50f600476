#pragma once

#include <mcp_gateway/rpc/line_channel.hpp>

#include <chrono>
#include <optional>
#include <string>

namespace mcp_gateway {

// ---------------------------------------------------------------------------
// IChildProcess: one spawned tool server and its three standard streams.
//
// Owned by exactly one McpSession. Once terminated it is never reused: every
// later WriteLine fails and ReadLine reports end of stream.
// ---------------------------------------------------------------------------
class IChildProcess : public ILineChannel {
public:
    ~IChildProcess() override = default;

    IChildProcess(const IChildProcess&) = delete;
    IChildProcess& operator=(const IChildProcess&) = delete;
    IChildProcess(IChildProcess&&) = delete;
    IChildProcess& operator=(IChildProcess&&) = delete;

    [[nodiscard]] virtual int Pid() const = 0;

    /// Drain whatever the child has written to stderr so far and return the
    /// retained tail (bounded in size).
    [[nodiscard]] virtual std::string StderrTail() = 0;

    /// Non-blocking liveness check; reaps the child if it has exited.
    [[nodiscard]] virtual bool IsRunning() = 0;

    /// Close stdin, SIGTERM, wait up to `grace`, then SIGKILL and reap.
    /// Idempotent and never throws.
    virtual void Terminate(std::chrono::milliseconds grace) noexcept = 0;

    [[nodiscard]] virtual bool IsTerminated() const = 0;

    /// Raw wait status once reaped.
    [[nodiscard]] virtual std::optional<int> ExitStatus() const = 0;

protected:
    IChildProcess() = default;
};

} // namespace mcp_gateway
