#pragma once

#include <optional>
#include <ostream>
#include <string>

namespace mcp_gateway {

// ---------------------------------------------------------------------------
// ErrorCategory: classifies gateway failures for logging, HTTP status codes
// and CLI exit codes.
// ---------------------------------------------------------------------------
enum class ErrorCategory {
    Spawn,              // executable missing, unreadable or unstartable
    Handshake,          // initialize/initialized failed; see Error::cause
    NoResponse,         // child closed stdout before replying
    MalformedResponse,  // reply was not a JSON-RPC message
    Timeout,            // read or operation deadline elapsed
    Io,                 // pipe write or file system failure
    Rpc,                // child returned a JSON-RPC error object
    NotFound,
    InvalidArgument,
    Config,
    Internal,
};

/// Stable lowercase name, used in JSON output and log lines.
const char* CategoryName(ErrorCategory category) noexcept;

/// True for the categories that describe a broken exchange with a child.
bool IsTransportCategory(ErrorCategory category) noexcept;

// ---------------------------------------------------------------------------
// Error: what every fallible gateway operation returns on failure.
// ---------------------------------------------------------------------------
struct Error {
    std::string operation;                  // e.g. "Spawn", "tools/call"
    std::string target;                     // tool-server name, when known
    std::optional<int> rpc_code;            // JSON-RPC error code (Rpc only)
    std::string message;
    std::optional<std::string> stderr_tail; // last bytes the child wrote to stderr
    ErrorCategory category = ErrorCategory::Internal;
    std::optional<ErrorCategory> cause;     // underlying category (Handshake)

    /// Transport failure, directly or as the cause of a failed handshake.
    [[nodiscard]] bool IsTransport() const noexcept;

    [[nodiscard]] int ExitCode() const noexcept;
    [[nodiscard]] int HttpStatus() const noexcept;

    [[nodiscard]] std::string CategoryName() const {
        return mcp_gateway::CategoryName(category);
    }

    /// "operation [target] (code N): message (cause: x); stderr: ..."
    [[nodiscard]] std::string ToString() const;
    /// {"error": {...}} with unset optional fields omitted.
    [[nodiscard]] std::string ToJson() const;

    friend std::ostream& operator<<(std::ostream& os, const Error& e) {
        return os << e.ToString();
    }

    bool operator==(const Error& other) const;
    bool operator!=(const Error& other) const { return !(*this == other); }
};

} // namespace mcp_gateway
