#include <catch2/catch_test_macros.hpp>

#include <mcp_gateway/rpc/rpc_message.hpp>

using namespace mcp_gateway;
using nlohmann::json;

// ===========================================================================
// ToJson
// ===========================================================================

TEST_CASE("RpcMessage: request carries id, method and params", "[rpc][message]") {
    auto j = ToJson(RpcRequest{7, "tools/call", {{"name", "add"}}});
    CHECK(j["jsonrpc"] == "2.0");
    CHECK(j["id"] == 7);
    CHECK(j["method"] == "tools/call");
    CHECK(j["params"]["name"] == "add");
}

TEST_CASE("RpcMessage: request with null params sends an empty object", "[rpc][message]") {
    auto j = ToJson(RpcRequest{1, "tools/list", nullptr});
    CHECK(j["params"] == json::object());
}

TEST_CASE("RpcMessage: notification without params has no id and no params key",
          "[rpc][message]") {
    auto j = ToJson(RpcNotification{"notifications/initialized", std::nullopt});
    CHECK(j == json{{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}});
}

TEST_CASE("RpcMessage: notification with params keeps them", "[rpc][message]") {
    auto j = ToJson(RpcNotification{"notifications/progress", json{{"progress", 50}}});
    CHECK_FALSE(j.contains("id"));
    CHECK(j["params"]["progress"] == 50);
}

TEST_CASE("RpcMessage: error response", "[rpc][message]") {
    RpcResponse response{3, nullptr, RpcErrorObject{kRpcMethodNotFound, "nope", std::nullopt}};
    auto j = ToJson(response);
    CHECK(j["error"]["code"] == -32601);
    CHECK(j["error"]["message"] == "nope");
    CHECK_FALSE(j.contains("result"));
}

// ===========================================================================
// FromJson
// ===========================================================================

TEST_CASE("FromJson: classifies a result response", "[rpc][message]") {
    auto r = FromJson(json::parse(R"({"jsonrpc":"2.0","id":1,"result":{"tools":[]}})"));
    REQUIRE(r.IsOk());
    const auto* response = std::get_if<RpcResponse>(&r.Value());
    REQUIRE(response != nullptr);
    CHECK(response->id == 1);
    CHECK_FALSE(response->IsError());
    CHECK(response->result["tools"].is_array());
}

TEST_CASE("FromJson: null result is still a result", "[rpc][message]") {
    auto r = FromJson(json::parse(R"({"jsonrpc":"2.0","id":4,"result":null})"));
    REQUIRE(r.IsOk());
    CHECK(std::get<RpcResponse>(r.Value()).result.is_null());
}

TEST_CASE("FromJson: classifies an error response", "[rpc][message]") {
    auto r = FromJson(json::parse(
        R"({"jsonrpc":"2.0","id":2,"error":{"code":-32602,"message":"bad args","data":{"x":1}}})"));
    REQUIRE(r.IsOk());
    const auto& response = std::get<RpcResponse>(r.Value());
    REQUIRE(response.IsError());
    CHECK(response.error->code == kRpcInvalidParams);
    CHECK(response.error->message == "bad args");
    REQUIRE(response.error->data.has_value());
    CHECK((*response.error->data)["x"] == 1);
}

TEST_CASE("FromJson: accepts string ids that are integers", "[rpc][message]") {
    auto r = FromJson(json::parse(R"({"jsonrpc":"2.0","id":"12","result":{}})"));
    REQUIRE(r.IsOk());
    CHECK(std::get<RpcResponse>(r.Value()).id == 12);

    CHECK(FromJson(json::parse(R"({"jsonrpc":"2.0","id":"abc","result":{}})")).IsErr());
}

TEST_CASE("FromJson: notification and server request", "[rpc][message]") {
    auto note = FromJson(json::parse(
        R"({"jsonrpc":"2.0","method":"notifications/message","params":{"level":"info"}})"));
    REQUIRE(note.IsOk());
    REQUIRE(std::holds_alternative<RpcNotification>(note.Value()));
    CHECK(MethodOf(note.Value()) == "notifications/message");

    auto ping = FromJson(json::parse(R"({"jsonrpc":"2.0","id":99,"method":"ping"})"));
    REQUIRE(ping.IsOk());
    REQUIRE(std::holds_alternative<RpcRequest>(ping.Value()));
    CHECK(std::get<RpcRequest>(ping.Value()).params == json::object());
}

TEST_CASE("FromJson: rejects non JSON-RPC objects", "[rpc][message]") {
    CHECK(FromJson(json::array()).IsErr());
    CHECK(FromJson(json::parse(R"({"id":1,"result":{}})")).IsErr());
    CHECK(FromJson(json::parse(R"({"jsonrpc":"1.0","id":1,"result":{}})")).IsErr());
    CHECK(FromJson(json::parse(R"({"jsonrpc":"2.0","id":1})")).IsErr());
    CHECK(FromJson(json::parse(R"({"jsonrpc":"2.0","result":{}})")).IsErr());
    CHECK(FromJson(json::parse(R"({"jsonrpc":"2.0","method":5})")).IsErr());
}

TEST_CASE("FromJson: error codes and ids must fit their types", "[rpc][message]") {
    auto widest = FromJson(json::parse(
        R"({"jsonrpc":"2.0","id":9223372036854775807,"error":{"code":-2147483648,"message":"x"}})"));
    REQUIRE(widest.IsOk());
    const auto& response = std::get<RpcResponse>(widest.Value());
    CHECK(response.id == 9223372036854775807LL);
    CHECK(response.error->code == -2147483647 - 1);

    CHECK(FromJson(json::parse(
        R"({"jsonrpc":"2.0","id":1,"error":{"code":4294967296,"message":"x"}})")).IsErr());
    CHECK(FromJson(json::parse(
        R"({"jsonrpc":"2.0","id":1,"error":{"code":-2147483649,"message":"x"}})")).IsErr());
    CHECK(FromJson(json::parse(
        R"({"jsonrpc":"2.0","id":1,"error":{"code":2147483648,"message":"x"}})")).IsErr());
    CHECK(FromJson(json::parse(
        R"({"jsonrpc":"2.0","id":9223372036854775808,"result":{}})")).IsErr());
    CHECK(FromJson(json::parse(
        R"({"jsonrpc":"2.0","id":18446744073709551615,"method":"ping"})")).IsErr());
}

TEST_CASE("MethodOf: empty for responses", "[rpc][message]") {
    CHECK(MethodOf(RpcResponse{1, json::object(), std::nullopt}).empty());
}
