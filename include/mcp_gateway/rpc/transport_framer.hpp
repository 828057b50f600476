#pragma once

#include <mcp_gateway/core/result.hpp>
#include <mcp_gateway/rpc/line_channel.hpp>
#include <mcp_gateway/rpc/rpc_message.hpp>

#include <chrono>
#include <string>
#include <variant>

namespace mcp_gateway {

/// The peer closed its output stream.
struct EndOfStream {};

using ReadOutcome = std::variant<RpcMessage, EndOfStream>;

/// Serialize `message` as one compact JSON line. Invalid UTF-8 in string
/// values is replaced with U+FFFD rather than failing.
std::string EncodeMessage(const RpcMessage& message);

/// Parse one line. Fails with ErrorCategory::MalformedResponse, carrying the
/// (truncated) raw line in the message.
Result<RpcMessage, Error> DecodeMessage(const std::string& line);

/// Encode and write one message.
Result<void, Error> WriteMessage(ILineChannel& channel, const RpcMessage& message);

/// Read the next message. Blank lines are skipped; end of stream is an
/// outcome, not an error. Parse failures and timeouts are errors.
Result<ReadOutcome, Error> ReadMessage(ILineChannel& channel,
                                       std::chrono::milliseconds timeout);

} // namespace mcp_gateway
