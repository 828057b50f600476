#include <mcp_gateway/session/handshake.hpp>

#include <mcp_gateway/core/log.hpp>
#include <mcp_gateway/core/version.hpp>

namespace mcp_gateway {

namespace {

Error WrapHandshakeError(Error error) {
    if (error.category != ErrorCategory::Handshake) {
        error.cause = error.category;
        error.category = ErrorCategory::Handshake;
    }
    error.message = "handshake failed during " + error.operation + ": " + error.message;
    error.operation = "Handshake";
    return error;
}

} // anonymous namespace

nlohmann::json BuildInitializeParams(const HandshakeOptions& options) {
    return {
        {"protocolVersion", options.protocol_version},
        {"capabilities", {
            {"roots", {{"listChanged", true}}},
            {"sampling", nlohmann::json::object()},
        }},
        {"clientInfo", {
            {"name", options.client.name},
            {"version", options.client.version.empty() ? std::string(kVersion)
                                                       : options.client.version},
        }},
    };
}

Result<nlohmann::json, Error> PerformHandshake(McpSession& session,
                                               const HandshakeOptions& options) {
    using R = Result<nlohmann::json, Error>;
    const auto& name = session.Descriptor().name;

    auto initialized = session.Request("initialize", BuildInitializeParams(options))
                           .MapError(WrapHandshakeError);
    if (initialized.IsErr()) {
        session.Fail(initialized.Error());
        return initialized;
    }

    auto result = std::move(initialized).Value();
    if (!result.is_object()) {
        Error error{"Handshake", name, std::nullopt,
                    "initialize result is not an object", std::nullopt,
                    ErrorCategory::Handshake, ErrorCategory::MalformedResponse};
        session.Fail(error);
        return R::Err(std::move(error));
    }

    if (result.contains("protocolVersion") && result["protocolVersion"].is_string() &&
        result["protocolVersion"] != options.protocol_version) {
        LogInfo("handshake", name + " negotiated protocol " +
                                 result["protocolVersion"].get<std::string>());
    }

    auto notified = session.Notify("notifications/initialized").MapError(WrapHandshakeError);
    if (notified.IsErr()) {
        session.Fail(notified.Error());
        return R::Err(std::move(notified).Error());
    }

    session.MarkInitialized();

    std::string server = "unknown server";
    if (result.contains("serverInfo") && result["serverInfo"].is_object()) {
        const auto& info = result["serverInfo"];
        server = info.value("name", server);
        if (info.contains("version") && info["version"].is_string()) {
            server += " " + info["version"].get<std::string>();
        }
    }
    LogDebug("handshake", name + ": initialized (" + server + ")");
    return R::Ok(std::move(result));
}

} // namespace mcp_gateway
