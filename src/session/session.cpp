#include <mcp_gateway/session/session.hpp>

#include <mcp_gateway/core/log.hpp>
#include <mcp_gateway/rpc/transport_framer.hpp>

#include <algorithm>

namespace mcp_gateway {

namespace {

Error MakeSessionError(const std::string& operation, const std::string& target,
                       const std::string& message, ErrorCategory category) {
    return Error{operation, target, std::nullopt, message, std::nullopt, category};
}

std::chrono::milliseconds Remaining(std::chrono::steady_clock::time_point deadline) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    return std::max(remaining, std::chrono::milliseconds{0});
}

} // anonymous namespace

const char* SessionStateName(SessionState state) noexcept {
    switch (state) {
        case SessionState::Created:     return "created";
        case SessionState::Started:     return "started";
        case SessionState::Initialized: return "initialized";
        case SessionState::InUse:       return "in_use";
        case SessionState::Closed:      return "closed";
        case SessionState::Failed:      return "failed";
    }
    return "unknown";
}

McpSession::McpSession(ServerDescriptor descriptor, IProcessSupervisor& supervisor,
                       SessionOptions options)
    : descriptor_(std::move(descriptor)),
      supervisor_(supervisor),
      options_(options) {}

McpSession::~McpSession() {
    Close();
}

Result<void, Error> McpSession::Start() {
    if (state_.load() != SessionState::Created) {
        return Result<void, Error>::Err(MakeSessionError(
            "Start", descriptor_.name,
            std::string("session already ") + SessionStateName(state_.load()),
            ErrorCategory::Internal));
    }

    auto spawned = supervisor_.Spawn(descriptor_);
    if (spawned.IsErr()) {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        last_error_ = spawned.Error();
        state_ = SessionState::Failed;
        return Result<void, Error>::Err(std::move(spawned).Error());
    }

    {
        std::lock_guard<std::mutex> io_lock(io_mutex_);
        deadline_ = std::chrono::steady_clock::now() + options_.operation_timeout;
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        process_ = std::move(spawned).Value();
    }
    state_ = SessionState::Started;
    LogDebug("session", descriptor_.name + ": started");
    return Result<void, Error>::Ok();
}

Result<nlohmann::json, Error> McpSession::Request(const std::string& method,
                                                  nlohmann::json params) {
    using R = Result<nlohmann::json, Error>;

    const auto state = state_.load();
    const bool allowed = method == "initialize"
                             ? state == SessionState::Started
                             : (state == SessionState::Initialized ||
                                state == SessionState::InUse);
    if (!allowed) {
        return R::Err(MakeSessionError(
            method, descriptor_.name,
            std::string("session not initialized (state: ") +
                SessionStateName(state) + ")",
            ErrorCategory::Internal));
    }

    auto result = Exchange(method, std::move(params));
    if (result.IsErr() && result.Error().IsTransport()) {
        auto error = Annotate(std::move(result).Error());
        Fail(error);
        return R::Err(std::move(error));
    }
    return result;
}

Result<nlohmann::json, Error> McpSession::Exchange(const std::string& method,
                                                   nlohmann::json params) {
    using R = Result<nlohmann::json, Error>;

    std::lock_guard<std::mutex> io_lock(io_mutex_);
    if (!process_) {
        return R::Err(MakeSessionError(method, descriptor_.name,
                                       "session has no running process",
                                       ErrorCategory::Internal));
    }
    const RpcRequest request{next_id_.fetch_add(1), method, std::move(params)};
    auto deadline_exceeded = [&] {
        return MakeSessionError(
            request.method, descriptor_.name,
            "operation deadline of " + std::to_string(options_.operation_timeout.count()) +
                " ms exceeded",
            ErrorCategory::Timeout);
    };

    if (Remaining(deadline_).count() == 0) {
        return R::Err(deadline_exceeded());
    }

    auto written = WriteMessage(*process_, request);
    if (written.IsErr()) {
        auto error = std::move(written).Error();
        error.operation = request.method;
        return R::Err(std::move(error));
    }

    for (;;) {
        const auto remaining = Remaining(deadline_);
        if (remaining.count() == 0) {
            return R::Err(deadline_exceeded());
        }
        const auto budget = std::min(options_.read_timeout, remaining);

        auto read = ReadMessage(*process_, budget);
        if (read.IsErr()) {
            auto error = std::move(read).Error();
            error.operation = request.method;
            error.target = descriptor_.name;
            return R::Err(std::move(error));
        }

        auto outcome = std::move(read).Value();
        if (std::holds_alternative<EndOfStream>(outcome)) {
            return R::Err(MakeSessionError(request.method, descriptor_.name,
                                           "no response from server",
                                           ErrorCategory::NoResponse));
        }

        auto& message = std::get<RpcMessage>(outcome);
        if (auto* response = std::get_if<RpcResponse>(&message)) {
            if (response->id != request.id) {
                return R::Err(MakeSessionError(
                    request.method, descriptor_.name,
                    "response id mismatch: expected " + std::to_string(request.id) +
                        ", got " + std::to_string(response->id),
                    ErrorCategory::MalformedResponse));
            }
            if (response->IsError()) {
                Error error{request.method, descriptor_.name, response->error->code,
                            response->error->message, std::nullopt, ErrorCategory::Rpc};
                return R::Err(std::move(error));
            }
            return R::Ok(std::move(response->result));
        }

        // Server-initiated traffic (log notifications, progress, pings) is
        // not part of this exchange.
        LogDebug("session", descriptor_.name + ": skipping " + MethodOf(message) +
                                " while waiting for id " + std::to_string(request.id));
    }
}

Result<void, Error> McpSession::Notify(const std::string& method,
                                       std::optional<nlohmann::json> params) {
    const auto state = state_.load();
    if (state != SessionState::Started && state != SessionState::Initialized &&
        state != SessionState::InUse) {
        return Result<void, Error>::Err(MakeSessionError(
            method, descriptor_.name,
            std::string("session not running (state: ") + SessionStateName(state) + ")",
            ErrorCategory::Internal));
    }

    Result<void, Error> written = Result<void, Error>::Ok();
    {
        std::lock_guard<std::mutex> io_lock(io_mutex_);
        if (!process_) {
            return Result<void, Error>::Err(MakeSessionError(
                method, descriptor_.name, "session has no running process",
                ErrorCategory::Internal));
        }
        written = WriteMessage(*process_, RpcNotification{method, std::move(params)});
    }
    if (written.IsErr()) {
        auto error = std::move(written).Error();
        error.operation = method;
        error.target = descriptor_.name;
        error = Annotate(std::move(error));
        Fail(error);
        return Result<void, Error>::Err(std::move(error));
    }
    return Result<void, Error>::Ok();
}

void McpSession::MarkInitialized() {
    auto expected = SessionState::Started;
    state_.compare_exchange_strong(expected, SessionState::Initialized);
}

void McpSession::BeginOperation() {
    auto expected = SessionState::Initialized;
    state_.compare_exchange_strong(expected, SessionState::InUse);
}

std::optional<Error> McpSession::LastError() const {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    return last_error_;
}

// Attach whatever the child printed to stderr; it usually explains a crash.
Error McpSession::Annotate(Error error) {
    std::lock_guard<std::mutex> io_lock(io_mutex_);
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (process_ && !error.stderr_tail.has_value()) {
        auto tail = process_->StderrTail();
        if (!tail.empty()) {
            error.stderr_tail = std::move(tail);
        }
    }
    return error;
}

// Waits for an exchange in progress, so the process is never destroyed
// while another thread is reading from it.
void McpSession::Teardown() noexcept {
    std::lock_guard<std::mutex> io_lock(io_mutex_);
    std::unique_ptr<IChildProcess> process;
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        process = std::move(process_);
    }
    if (process) {
        supervisor_.Terminate(*process);
    }
}

void McpSession::Close() noexcept {
    auto state = state_.load();
    if (state == SessionState::Closed || state == SessionState::Failed) {
        Teardown();
        return;
    }
    state_ = SessionState::Closed;
    Teardown();
}

void McpSession::Fail(const Error& error) noexcept {
    try {
        {
            std::lock_guard<std::mutex> lock(lifecycle_mutex_);
            if (!last_error_) last_error_ = error;
        }
        LogWarn("session", descriptor_.name + ": " + error.ToString());
    } catch (const std::exception&) {
        // Logging failed; teardown below still has to happen.
    }
    state_ = SessionState::Failed;
    Teardown();
}

} // namespace mcp_gateway
