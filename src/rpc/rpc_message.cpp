#include <mcp_gateway/rpc/rpc_message.hpp>

#include <cstdint>
#include <limits>

namespace mcp_gateway {

namespace {

constexpr const char* kJsonRpcVersion = "2.0";

// Ids are integers on this wire. A server echoing the id back as a string
// ("1") is accepted as long as it parses to an integer.
std::optional<RpcRequestId> ParseId(const nlohmann::json& id) {
    if (id.is_number_unsigned()) {
        const auto value = id.get<std::uint64_t>();
        if (value > static_cast<std::uint64_t>(std::numeric_limits<RpcRequestId>::max())) {
            return std::nullopt;
        }
        return static_cast<RpcRequestId>(value);
    }
    if (id.is_number_integer()) {
        return id.get<RpcRequestId>();
    }
    if (id.is_string()) {
        const auto& text = id.get_ref<const std::string&>();
        if (text.empty()) return std::nullopt;
        try {
            size_t consumed = 0;
            auto value = std::stoll(text, &consumed);
            if (consumed == text.size()) {
                return static_cast<RpcRequestId>(value);
            }
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

Result<RpcErrorObject, std::string> ParseErrorObject(const nlohmann::json& error) {
    if (!error.is_object()) {
        return Result<RpcErrorObject, std::string>::Err(
            "'error' member must be an object");
    }
    RpcErrorObject out;
    if (error.contains("code") && error["code"].is_number_integer()) {
        const auto& code = error["code"];
        const bool fits =
            code.is_number_unsigned()
                ? code.get<std::uint64_t>() <=
                      static_cast<std::uint64_t>(std::numeric_limits<int>::max())
                : code.get<std::int64_t>() >= std::numeric_limits<int>::min() &&
                      code.get<std::int64_t>() <= std::numeric_limits<int>::max();
        if (!fits) {
            return Result<RpcErrorObject, std::string>::Err(
                "error code " + code.dump() + " is out of range");
        }
        out.code = static_cast<int>(code.get<std::int64_t>());
    } else {
        out.code = -1;
    }
    if (error.contains("message") && error["message"].is_string()) {
        out.message = error["message"].get<std::string>();
    } else {
        out.message = "Unknown error";
    }
    if (error.contains("data")) {
        out.data = error["data"];
    }
    return Result<RpcErrorObject, std::string>::Ok(std::move(out));
}

struct ToJsonVisitor {
    nlohmann::json operator()(const RpcRequest& request) const {
        return {
            {"jsonrpc", kJsonRpcVersion},
            {"id", request.id},
            {"method", request.method},
            {"params", request.params.is_null() ? nlohmann::json::object()
                                                : request.params},
        };
    }

    nlohmann::json operator()(const RpcNotification& notification) const {
        nlohmann::json j = {
            {"jsonrpc", kJsonRpcVersion},
            {"method", notification.method},
        };
        if (notification.params.has_value()) {
            j["params"] = *notification.params;
        }
        return j;
    }

    nlohmann::json operator()(const RpcResponse& response) const {
        nlohmann::json j = {
            {"jsonrpc", kJsonRpcVersion},
            {"id", response.id},
        };
        if (response.error.has_value()) {
            nlohmann::json err = {
                {"code", response.error->code},
                {"message", response.error->message},
            };
            if (response.error->data.has_value()) {
                err["data"] = *response.error->data;
            }
            j["error"] = std::move(err);
        } else {
            j["result"] = response.result;
        }
        return j;
    }
};

} // anonymous namespace

nlohmann::json ToJson(const RpcMessage& message) {
    return std::visit(ToJsonVisitor{}, message);
}

Result<RpcMessage, std::string> FromJson(const nlohmann::json& value) {
    using R = Result<RpcMessage, std::string>;

    if (!value.is_object()) {
        return R::Err("message is not a JSON object");
    }
    if (!value.contains("jsonrpc") || value["jsonrpc"] != kJsonRpcVersion) {
        return R::Err("missing or invalid 'jsonrpc' version");
    }

    const bool has_method = value.contains("method");
    const bool has_id = value.contains("id") && !value["id"].is_null();

    if (has_method) {
        if (!value["method"].is_string()) {
            return R::Err("'method' must be a string");
        }
        auto method = value["method"].get<std::string>();
        std::optional<nlohmann::json> params;
        if (value.contains("params")) {
            params = value["params"];
        }
        if (!has_id) {
            return R::Ok(RpcNotification{std::move(method), std::move(params)});
        }
        auto id = ParseId(value["id"]);
        if (!id) {
            return R::Err("request 'id' must be a signed 64-bit integer");
        }
        return R::Ok(RpcRequest{*id, std::move(method),
                                params.value_or(nlohmann::json::object())});
    }

    if (!has_id) {
        return R::Err("response has no 'id'");
    }
    auto id = ParseId(value["id"]);
    if (!id) {
        return R::Err("response 'id' must be a signed 64-bit integer");
    }

    const bool has_result = value.contains("result");
    const bool has_error = value.contains("error") && !value["error"].is_null();
    if (!has_result && !has_error) {
        return R::Err("response has neither 'result' nor 'error'");
    }

    RpcResponse response;
    response.id = *id;
    if (has_error) {
        auto error = ParseErrorObject(value["error"]);
        if (error.IsErr()) {
            return R::Err(std::move(error).Error());
        }
        response.error = std::move(error).Value();
    } else {
        response.result = value["result"];
    }
    return R::Ok(std::move(response));
}

std::string MethodOf(const RpcMessage& message) {
    if (const auto* request = std::get_if<RpcRequest>(&message)) {
        return request->method;
    }
    if (const auto* notification = std::get_if<RpcNotification>(&message)) {
        return notification->method;
    }
    return {};
}

} // namespace mcp_gateway
