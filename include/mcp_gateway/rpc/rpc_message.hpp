#pragma once

#include <mcp_gateway/core/result.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

namespace mcp_gateway {

// ---------------------------------------------------------------------------
// JSON-RPC 2.0 messages exchanged with a tool server, one per line.
//
//   Request:      {"jsonrpc":"2.0","id":1,"method":"tools/list","params":{}}
//   Notification: {"jsonrpc":"2.0","method":"notifications/initialized"}
//   Response:     {"jsonrpc":"2.0","id":1,"result":{...}}
//                 {"jsonrpc":"2.0","id":1,"error":{"code":-32601,"message":"..."}}
// ---------------------------------------------------------------------------

using RpcRequestId = std::int64_t;

struct RpcRequest {
    RpcRequestId id = 0;
    std::string method;
    nlohmann::json params = nlohmann::json::object();
};

struct RpcNotification {
    std::string method;
    std::optional<nlohmann::json> params;  // omitted from the wire when empty
};

struct RpcErrorObject {
    int code = 0;
    std::string message;
    std::optional<nlohmann::json> data;
};

struct RpcResponse {
    RpcRequestId id = 0;
    nlohmann::json result;                // null when error is set
    std::optional<RpcErrorObject> error;

    [[nodiscard]] bool IsError() const noexcept { return error.has_value(); }
};

using RpcMessage = std::variant<RpcRequest, RpcNotification, RpcResponse>;

// Standard JSON-RPC error codes.
constexpr int kRpcParseError     = -32700;
constexpr int kRpcInvalidRequest = -32600;
constexpr int kRpcMethodNotFound = -32601;
constexpr int kRpcInvalidParams  = -32602;
constexpr int kRpcInternalError  = -32603;

/// Build the wire object for a message.
nlohmann::json ToJson(const RpcMessage& message);

/// Classify a parsed JSON value as a request, notification or response.
/// Returns a description of the problem when it is none of them.
Result<RpcMessage, std::string> FromJson(const nlohmann::json& value);

/// Method name of a request or notification, empty for responses.
std::string MethodOf(const RpcMessage& message);

} // namespace mcp_gateway
