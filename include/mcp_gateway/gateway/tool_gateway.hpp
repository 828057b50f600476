#pragma once

#include <mcp_gateway/core/result.hpp>
#include <mcp_gateway/gateway/server_catalog.hpp>
#include <mcp_gateway/process/process_supervisor.hpp>
#include <mcp_gateway/process/server_descriptor.hpp>
#include <mcp_gateway/session/handshake.hpp>
#include <mcp_gateway/session/session.hpp>

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_gateway {

struct ToolDescriptor {
    std::string name;
    std::string description;
    nlohmann::json input_schema = nlohmann::json::object();
    nlohmann::json raw;  // the complete object the server reported
};

/// Parse one entry of a `tools/list` result.
Result<ToolDescriptor, std::string> ParseToolDescriptor(const nlohmann::json& tool);

/// Concatenate the `text` of every content part whose type is "text".
std::string ExtractText(const nlohmann::json& call_result);

struct GatewayOptions {
    SessionOptions session;
    HandshakeOptions handshake;
};

// ---------------------------------------------------------------------------
// ToolGateway: the three operations exposed over HTTP and the CLI.
//
// Each call runs on a fresh session with a fresh child process:
// resolve -> spawn -> handshake -> one request -> teardown. Nothing is
// pooled; teardown happens on every path.
// ---------------------------------------------------------------------------
class ToolGateway {
public:
    ToolGateway(const ServerCatalog& catalog, IProcessSupervisor& supervisor,
                GatewayOptions options = {});

    [[nodiscard]] Result<std::vector<ToolDescriptor>, Error> ListTools(
        const std::string& server) const;
    [[nodiscard]] Result<std::string, Error> CallTool(
        const std::string& server, const std::string& tool,
        const nlohmann::json& arguments) const;
    [[nodiscard]] Result<ToolDescriptor, Error> DescribeTool(
        const std::string& server, const std::string& tool) const;

    // Same operations for a descriptor that is already resolved.
    [[nodiscard]] Result<std::vector<ToolDescriptor>, Error> ListTools(
        const ServerDescriptor& descriptor) const;
    [[nodiscard]] Result<std::string, Error> CallTool(
        const ServerDescriptor& descriptor, const std::string& tool,
        const nlohmann::json& arguments) const;
    [[nodiscard]] Result<ToolDescriptor, Error> DescribeTool(
        const ServerDescriptor& descriptor, const std::string& tool) const;

private:
    // fn: McpSession& -> Result<T, Error>
    template <typename T, typename Fn>
    Result<T, Error> RunOperation(const ServerDescriptor& descriptor,
                                  const std::string& operation, Fn&& fn) const;

    const ServerCatalog& catalog_;
    IProcessSupervisor& supervisor_;
    GatewayOptions options_;
};

} // namespace mcp_gateway
