#pragma once

#include <mcp_gateway/core/result.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace mcp_gateway {

// ---------------------------------------------------------------------------
// ILineChannel: a bidirectional stream of newline-terminated lines.
//
// The transport framer only needs this much of a child process, which keeps
// framing testable without spawning anything.
// ---------------------------------------------------------------------------
class ILineChannel {
public:
    virtual ~ILineChannel() = default;

    /// Write `line` followed by '\n'. Returns only once every byte has been
    /// handed to the peer; there is no user-space buffering to flush.
    [[nodiscard]] virtual Result<void, Error> WriteLine(std::string_view line) = 0;

    /// Read one line without its terminator. Returns nullopt when the peer
    /// closed its end (end of stream). Fails with ErrorCategory::Timeout if
    /// no complete line arrives within `timeout`.
    [[nodiscard]] virtual Result<std::optional<std::string>, Error> ReadLine(
        std::chrono::milliseconds timeout) = 0;
};

} // namespace mcp_gateway
