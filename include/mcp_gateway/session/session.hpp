#pragma once

#include <mcp_gateway/core/result.hpp>
#include <mcp_gateway/process/i_child_process.hpp>
#include <mcp_gateway/process/process_supervisor.hpp>
#include <mcp_gateway/process/server_descriptor.hpp>
#include <mcp_gateway/rpc/rpc_message.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace mcp_gateway {

enum class SessionState {
    Created,      // nothing spawned yet
    Started,      // child running, handshake not done
    Initialized,  // handshake complete
    InUse,        // serving an operation
    Closed,       // child terminated normally
    Failed,       // transport or handshake failure; child terminated
};

const char* SessionStateName(SessionState state) noexcept;

struct SessionOptions {
    // Upper bound for waiting on a single reply line.
    std::chrono::milliseconds read_timeout{30000};
    // Upper bound for everything after Start(): handshake and requests share
    // one deadline.
    std::chrono::milliseconds operation_timeout{60000};
};

// ---------------------------------------------------------------------------
// McpSession: one tool-server child and its JSON-RPC conversation.
//
// Request ids start at 1 and increase by one per request. A mutex covers
// each write-then-read pair, so concurrent callers never interleave on the
// pipes. Transport failures move the session to Failed and terminate the
// child; an RPC error object is returned to the caller and leaves the
// session usable. The child is torn down exactly once, by Close() or Fail()
// (and the destructor as a last resort).
// ---------------------------------------------------------------------------
class McpSession {
public:
    McpSession(ServerDescriptor descriptor, IProcessSupervisor& supervisor,
               SessionOptions options = {});
    ~McpSession();

    McpSession(const McpSession&) = delete;
    McpSession& operator=(const McpSession&) = delete;

    /// Spawn the child and start the operation deadline. Created -> Started.
    /// A spawn failure leaves nothing to tear down; the session moves to
    /// Failed.
    [[nodiscard]] Result<void, Error> Start();

    /// Send a request and wait for the response with the same id. Returns
    /// the `result` member, or an Rpc error carrying the server's code.
    [[nodiscard]] Result<nlohmann::json, Error> Request(
        const std::string& method,
        nlohmann::json params = nlohmann::json::object());

    /// Send a notification; no reply is expected.
    [[nodiscard]] Result<void, Error> Notify(
        const std::string& method,
        std::optional<nlohmann::json> params = std::nullopt);

    /// Started -> Initialized, after a successful handshake.
    void MarkInitialized();

    /// Initialized -> InUse.
    void BeginOperation();

    /// Terminate the child if it is still running. Idempotent.
    void Close() noexcept;

    /// Record a failure and terminate the child. Idempotent.
    void Fail(const Error& error) noexcept;

    [[nodiscard]] SessionState State() const noexcept { return state_.load(); }
    [[nodiscard]] RpcRequestId LastRequestId() const noexcept { return next_id_.load() - 1; }
    [[nodiscard]] const ServerDescriptor& Descriptor() const noexcept { return descriptor_; }
    [[nodiscard]] std::optional<Error> LastError() const;

private:
    Result<nlohmann::json, Error> Exchange(const std::string& method, nlohmann::json params);
    Error Annotate(Error error);
    void Teardown() noexcept;

    ServerDescriptor descriptor_;
    IProcessSupervisor& supervisor_;
    SessionOptions options_;

    std::unique_ptr<IChildProcess> process_;
    std::atomic<SessionState> state_{SessionState::Created};
    std::atomic<RpcRequestId> next_id_{1};
    std::chrono::steady_clock::time_point deadline_{};

    mutable std::mutex io_mutex_;        // one write-then-read at a time
    mutable std::mutex lifecycle_mutex_; // guards process_ and last_error_
    std::optional<Error> last_error_;
};

} // namespace mcp_gateway
