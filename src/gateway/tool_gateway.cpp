#include <mcp_gateway/gateway/tool_gateway.hpp>

#include <mcp_gateway/core/log.hpp>

namespace mcp_gateway {

namespace {

Error MakeGatewayError(const std::string& operation, const std::string& target,
                       const std::string& message, ErrorCategory category) {
    return Error{operation, target, std::nullopt, message, std::nullopt, category};
}

Result<std::vector<ToolDescriptor>, Error> ParseToolList(const std::string& target,
                                                         const nlohmann::json& result) {
    using R = Result<std::vector<ToolDescriptor>, Error>;
    std::vector<ToolDescriptor> tools;
    if (!result.is_object() || !result.contains("tools") || result["tools"].is_null()) {
        return R::Ok(std::move(tools));
    }
    const auto& list = result["tools"];
    if (!list.is_array()) {
        return R::Err(MakeGatewayError("tools/list", target,
                                       "'tools' is not an array",
                                       ErrorCategory::MalformedResponse));
    }
    for (const auto& entry : list) {
        auto tool = ParseToolDescriptor(entry);
        if (tool.IsErr()) {
            return R::Err(MakeGatewayError("tools/list", target, tool.Error(),
                                           ErrorCategory::MalformedResponse));
        }
        tools.push_back(std::move(tool).Value());
    }
    return R::Ok(std::move(tools));
}

} // anonymous namespace

Result<ToolDescriptor, std::string> ParseToolDescriptor(const nlohmann::json& tool) {
    using R = Result<ToolDescriptor, std::string>;
    if (!tool.is_object()) {
        return R::Err("tool entry is not an object");
    }
    if (!tool.contains("name") || !tool["name"].is_string()) {
        return R::Err("tool entry has no name");
    }
    ToolDescriptor out;
    out.name = tool["name"].get<std::string>();
    if (tool.contains("description") && tool["description"].is_string()) {
        out.description = tool["description"].get<std::string>();
    }
    if (tool.contains("inputSchema") && tool["inputSchema"].is_object()) {
        out.input_schema = tool["inputSchema"];
    }
    out.raw = tool;
    return R::Ok(std::move(out));
}

std::string ExtractText(const nlohmann::json& call_result) {
    std::string text;
    if (!call_result.is_object() || !call_result.contains("content") ||
        !call_result["content"].is_array()) {
        return text;
    }
    for (const auto& part : call_result["content"]) {
        if (!part.is_object()) continue;
        auto type = part.find("type");
        if (type == part.end() || *type != "text") continue;
        auto value = part.find("text");
        if (value != part.end() && value->is_string()) {
            text += value->get<std::string>();
        }
    }
    return text;
}

ToolGateway::ToolGateway(const ServerCatalog& catalog, IProcessSupervisor& supervisor,
                         GatewayOptions options)
    : catalog_(catalog), supervisor_(supervisor), options_(std::move(options)) {}

template <typename T, typename Fn>
Result<T, Error> ToolGateway::RunOperation(const ServerDescriptor& descriptor,
                                           const std::string& operation,
                                           Fn&& fn) const {
    auto fail = [&](Error error) {
        if (error.target.empty()) error.target = descriptor.name;
        LogError("gateway", operation + " failed: " + error.ToString());
        return Result<T, Error>::Err(std::move(error));
    };

    McpSession session(descriptor, supervisor_, options_.session);

    auto started = session.Start();
    if (started.IsErr()) {
        return fail(std::move(started).Error());
    }

    auto handshake = PerformHandshake(session, options_.handshake);
    if (handshake.IsErr()) {
        return fail(std::move(handshake).Error());
    }

    session.BeginOperation();
    auto result = std::forward<Fn>(fn)(session);
    session.Close();

    if (result.IsErr()) {
        return fail(std::move(result).Error());
    }
    LogDebug("gateway", operation + " on " + descriptor.name + " done");
    return result;
}

Result<std::vector<ToolDescriptor>, Error> ToolGateway::ListTools(
    const ServerDescriptor& descriptor) const {
    return RunOperation<std::vector<ToolDescriptor>>(
        descriptor, "ListTools", [&](McpSession& session) {
            return session.Request("tools/list").AndThen(
                [&](nlohmann::json result) {
                    return ParseToolList(descriptor.name, result);
                });
        });
}

Result<std::string, Error> ToolGateway::CallTool(const ServerDescriptor& descriptor,
                                                 const std::string& tool,
                                                 const nlohmann::json& arguments) const {
    return RunOperation<std::string>(
        descriptor, "CallTool", [&](McpSession& session) {
            nlohmann::json params = {
                {"name", tool},
                {"arguments", arguments.is_null() ? nlohmann::json::object() : arguments},
            };
            return session.Request("tools/call", std::move(params))
                .Map([&](nlohmann::json result) {
                    if (result.is_object() && result.value("isError", false)) {
                        LogWarn("gateway", descriptor.name + ": tool '" + tool +
                                               "' reported an error");
                    }
                    return ExtractText(result);
                });
        });
}

Result<ToolDescriptor, Error> ToolGateway::DescribeTool(
    const ServerDescriptor& descriptor, const std::string& tool) const {
    auto tools = ListTools(descriptor);
    if (tools.IsErr()) {
        return Result<ToolDescriptor, Error>::Err(std::move(tools).Error());
    }
    for (auto& candidate : std::move(tools).Value()) {
        if (candidate.name == tool) {
            return Result<ToolDescriptor, Error>::Ok(std::move(candidate));
        }
    }
    auto error = MakeGatewayError("DescribeTool", descriptor.name,
                                  "Tool '" + tool + "' not found",
                                  ErrorCategory::NotFound);
    LogWarn("gateway", error.ToString());
    return Result<ToolDescriptor, Error>::Err(std::move(error));
}

// ---------------------------------------------------------------------------
// By server name
// ---------------------------------------------------------------------------
Result<std::vector<ToolDescriptor>, Error> ToolGateway::ListTools(
    const std::string& server) const {
    auto descriptor = catalog_.Resolve(server);
    if (descriptor.IsErr()) {
        return Result<std::vector<ToolDescriptor>, Error>::Err(
            std::move(descriptor).Error());
    }
    return ListTools(descriptor.Value());
}

Result<std::string, Error> ToolGateway::CallTool(const std::string& server,
                                                 const std::string& tool,
                                                 const nlohmann::json& arguments) const {
    auto descriptor = catalog_.Resolve(server);
    if (descriptor.IsErr()) {
        return Result<std::string, Error>::Err(std::move(descriptor).Error());
    }
    return CallTool(descriptor.Value(), tool, arguments);
}

Result<ToolDescriptor, Error> ToolGateway::DescribeTool(const std::string& server,
                                                        const std::string& tool) const {
    auto descriptor = catalog_.Resolve(server);
    if (descriptor.IsErr()) {
        return Result<ToolDescriptor, Error>::Err(std::move(descriptor).Error());
    }
    return DescribeTool(descriptor.Value(), tool);
}

} // namespace mcp_gateway
