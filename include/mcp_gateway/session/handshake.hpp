#pragma once

#include <mcp_gateway/core/result.hpp>
#include <mcp_gateway/session/session.hpp>

#include <string>

#include <nlohmann/json.hpp>

namespace mcp_gateway {

constexpr const char* kMcpProtocolVersion = "2024-11-05";

struct ClientIdentity {
    std::string name = "mcp-gateway";
    std::string version;  // defaults to kVersion when empty
};

struct HandshakeOptions {
    std::string protocol_version = kMcpProtocolVersion;
    ClientIdentity client;
};

/// The `initialize` params: protocol version, the roots/sampling
/// capabilities and the client identity.
nlohmann::json BuildInitializeParams(const HandshakeOptions& options);

/// Run `initialize` then `notifications/initialized` on a started session.
/// Returns the server's initialize result (serverInfo, capabilities).
///
/// Any failure is reported as ErrorCategory::Handshake with `cause` set to
/// the underlying category, and the session is failed so its child is torn
/// down before this returns.
[[nodiscard]] Result<nlohmann::json, Error> PerformHandshake(
    McpSession& session, const HandshakeOptions& options = {});

} // namespace mcp_gateway
