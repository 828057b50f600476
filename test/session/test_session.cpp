#include <catch2/catch_test_macros.hpp>

#include <mcp_gateway/session/session.hpp>
#include "../mocks/mock_process_supervisor.hpp"

#include <atomic>
#include <chrono>
#include <string>
#include <thread>

using namespace mcp_gateway;
using namespace mcp_gateway::testing;
using nlohmann::json;

namespace {

ServerDescriptor Calculator() {
    return ServerDescriptor{"calc.py", "/srv/mcp/calc.py", {"python3", "-u", "/srv/mcp/calc.py"}};
}

// Started session with `initialize` (id 1) already answered, ready for requests.
void StartInitialized(McpSession& session, MockChildScript& script) {
    script.EnqueueResult(1, {{"protocolVersion", "2024-11-05"}});
    REQUIRE(session.Start().IsOk());
    REQUIRE(session.Request("initialize", json::object()).IsOk());
    session.MarkInitialized();
}

} // anonymous namespace

// ===========================================================================
// Lifecycle
// ===========================================================================

TEST_CASE("McpSession: Start spawns the descriptor", "[session]") {
    MockProcessSupervisor supervisor;
    supervisor.EnqueueChild();
    McpSession session(Calculator(), supervisor);

    CHECK(session.State() == SessionState::Created);
    REQUIRE(session.Start().IsOk());
    CHECK(session.State() == SessionState::Started);
    REQUIRE(supervisor.SpawnCallCount() == 1);
    CHECK(supervisor.SpawnCalls()[0].name == "calc.py");
}

TEST_CASE("McpSession: spawn failure fails the session with nothing to tear down",
          "[session]") {
    MockProcessSupervisor supervisor;
    supervisor.EnqueueSpawnError(Error{"Spawn", "calc.py", std::nullopt,
                                       "executable not found", std::nullopt,
                                       ErrorCategory::Spawn});
    {
        McpSession session(Calculator(), supervisor);
        auto started = session.Start();
        REQUIRE(started.IsErr());
        CHECK(started.Error().category == ErrorCategory::Spawn);
        CHECK(session.State() == SessionState::Failed);
        REQUIRE(session.LastError().has_value());
        CHECK(session.LastError()->category == ErrorCategory::Spawn);
    }
    CHECK(supervisor.TerminateCallCount() == 0);
}

TEST_CASE("McpSession: Start twice is rejected", "[session]") {
    MockProcessSupervisor supervisor;
    supervisor.EnqueueChild();
    McpSession session(Calculator(), supervisor);
    REQUIRE(session.Start().IsOk());

    auto again = session.Start();
    REQUIRE(again.IsErr());
    CHECK(again.Error().category == ErrorCategory::Internal);
    CHECK(supervisor.SpawnCallCount() == 1);
}

TEST_CASE("McpSession: Close tears down exactly once", "[session]") {
    MockProcessSupervisor supervisor;
    auto script = supervisor.EnqueueChild();
    {
        McpSession session(Calculator(), supervisor);
        REQUIRE(session.Start().IsOk());
        session.Close();
        session.Close();
        CHECK(session.State() == SessionState::Closed);
        CHECK(script->terminate_calls == 1);
        CHECK(script->destroyed);
    }
    CHECK(supervisor.TerminateCallCount() == 1);
}

TEST_CASE("McpSession: destructor tears down a running child", "[session]") {
    MockProcessSupervisor supervisor;
    auto script = supervisor.EnqueueChild();
    {
        McpSession session(Calculator(), supervisor);
        REQUIRE(session.Start().IsOk());
    }
    CHECK(supervisor.TerminateCallCount() == 1);
    CHECK(script->destroyed);
}

// ===========================================================================
// Request gating
// ===========================================================================

TEST_CASE("McpSession: requests before the handshake are rejected", "[session]") {
    MockProcessSupervisor supervisor;
    auto script = supervisor.EnqueueChild();
    McpSession session(Calculator(), supervisor);
    REQUIRE(session.Start().IsOk());

    auto r = session.Request("tools/list");
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Internal);
    CHECK(r.Error().message.find("session not initialized") != std::string::npos);
    CHECK(script->written.empty());
    // A misuse error does not fail the session.
    CHECK(session.State() == SessionState::Started);
}

TEST_CASE("McpSession: requests on a session that was never started are rejected",
          "[session]") {
    MockProcessSupervisor supervisor;
    McpSession session(Calculator(), supervisor);
    auto r = session.Request("initialize");
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Internal);
}

// ===========================================================================
// Request / response
// ===========================================================================

TEST_CASE("McpSession: ids start at 1 and increase per request", "[session]") {
    MockProcessSupervisor supervisor;
    auto script = supervisor.EnqueueChild();
    McpSession session(Calculator(), supervisor);
    StartInitialized(session, *script);

    script->EnqueueResult(2, {{"tools", json::array()}});
    script->EnqueueResult(3, {{"content", json::array()}});
    REQUIRE(session.Request("tools/list").IsOk());
    REQUIRE(session.Request("tools/call", {{"name", "add"}}).IsOk());

    auto written = script->WrittenJson();
    REQUIRE(written.size() == 3);
    CHECK(written[0]["id"] == 1);
    CHECK(written[0]["method"] == "initialize");
    CHECK(written[1]["id"] == 2);
    CHECK(written[1]["params"] == json::object());
    CHECK(written[2]["id"] == 3);
    CHECK(written[2]["params"]["name"] == "add");
    CHECK(session.LastRequestId() == 3);
}

TEST_CASE("McpSession: server notifications before the response are skipped", "[session]") {
    MockProcessSupervisor supervisor;
    auto script = supervisor.EnqueueChild();
    McpSession session(Calculator(), supervisor);
    StartInitialized(session, *script);

    script->EnqueueLine(R"({"jsonrpc":"2.0","method":"notifications/message","params":{"data":"hi"}})");
    script->EnqueueLine("");
    script->EnqueueResult(2, {{"tools", json::array({{{"name", "add"}}})}});

    auto r = session.Request("tools/list");
    REQUIRE(r.IsOk());
    CHECK(r.Value()["tools"][0]["name"] == "add");
}

TEST_CASE("McpSession: RPC error is request-scoped", "[session]") {
    MockProcessSupervisor supervisor;
    auto script = supervisor.EnqueueChild();
    McpSession session(Calculator(), supervisor);
    StartInitialized(session, *script);

    script->EnqueueRpcError(2, -32601, "Method not found");
    auto r = session.Request("resources/list");
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Rpc);
    CHECK(r.Error().rpc_code == -32601);
    CHECK(r.Error().message == "Method not found");
    CHECK(r.Error().operation == "resources/list");

    CHECK(session.State() == SessionState::Initialized);
    CHECK(script->terminate_calls == 0);

    script->EnqueueResult(3, {{"tools", json::array()}});
    CHECK(session.Request("tools/list").IsOk());
}

// ===========================================================================
// Transport failures
// ===========================================================================

TEST_CASE("McpSession: end of stream is NoResponse with stderr attached", "[session]") {
    MockProcessSupervisor supervisor;
    auto script = supervisor.EnqueueChild();
    McpSession session(Calculator(), supervisor);
    StartInitialized(session, *script);

    script->stderr_tail = "ImportError: No module named 'mcp'";
    script->EnqueueEof();
    auto r = session.Request("tools/list");
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::NoResponse);
    CHECK(r.Error().message == "no response from server");
    CHECK(r.Error().target == "calc.py");
    CHECK(r.Error().stderr_tail == std::optional<std::string>("ImportError: No module named 'mcp'"));

    CHECK(session.State() == SessionState::Failed);
    CHECK(supervisor.TerminateCallCount() == 1);
}

TEST_CASE("McpSession: mismatched response id is MalformedResponse", "[session]") {
    MockProcessSupervisor supervisor;
    auto script = supervisor.EnqueueChild();
    McpSession session(Calculator(), supervisor);
    StartInitialized(session, *script);

    script->EnqueueResult(7, json::object());
    auto r = session.Request("tools/list");
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::MalformedResponse);
    CHECK(r.Error().message.find("response id mismatch") != std::string::npos);
    CHECK(session.State() == SessionState::Failed);
    CHECK(supervisor.TerminateCallCount() == 1);
}

TEST_CASE("McpSession: garbage output is MalformedResponse", "[session]") {
    MockProcessSupervisor supervisor;
    auto script = supervisor.EnqueueChild();
    McpSession session(Calculator(), supervisor);
    StartInitialized(session, *script);

    script->EnqueueLine("Hello from print()");
    auto r = session.Request("tools/list");
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::MalformedResponse);
    CHECK(r.Error().operation == "tools/list");
    CHECK(session.State() == SessionState::Failed);
}

TEST_CASE("McpSession: read timeout fails the session", "[session]") {
    MockProcessSupervisor supervisor;
    auto script = supervisor.EnqueueChild();
    McpSession session(Calculator(), supervisor);
    StartInitialized(session, *script);

    auto r = session.Request("tools/list");  // nothing enqueued
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Timeout);
    CHECK(session.State() == SessionState::Failed);
    CHECK(script->terminate_calls == 1);
}

TEST_CASE("McpSession: the operation deadline spans every request", "[session]") {
    MockProcessSupervisor supervisor;
    auto script = supervisor.EnqueueChild();
    SessionOptions options;
    options.read_timeout = std::chrono::milliseconds(1000);
    options.operation_timeout = std::chrono::milliseconds(50);
    McpSession session(Calculator(), supervisor, options);
    StartInitialized(session, *script);

    std::this_thread::sleep_for(std::chrono::milliseconds(80));
    script->EnqueueResult(2, {{"tools", json::array()}});

    auto r = session.Request("tools/list");
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Timeout);
    CHECK(r.Error().message.find("operation deadline of 50 ms") != std::string::npos);
    CHECK(session.State() == SessionState::Failed);
    // Nothing was sent after the deadline passed.
    CHECK(script->written.size() == 1);
}

TEST_CASE("McpSession: write failure is Io and fails the session", "[session]") {
    MockProcessSupervisor supervisor;
    auto script = supervisor.EnqueueChild();
    McpSession session(Calculator(), supervisor);
    StartInitialized(session, *script);

    script->write_error = Error{"WriteLine", "", std::nullopt, "broken pipe",
                                std::nullopt, ErrorCategory::Io};
    auto r = session.Request("tools/list");
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Io);
    CHECK(session.State() == SessionState::Failed);
}

TEST_CASE("McpSession: a failed session stays failed", "[session]") {
    MockProcessSupervisor supervisor;
    auto script = supervisor.EnqueueChild();
    McpSession session(Calculator(), supervisor);
    StartInitialized(session, *script);

    script->EnqueueEof();
    REQUIRE(session.Request("tools/list").IsErr());
    session.Close();
    CHECK(session.State() == SessionState::Failed);
    CHECK(supervisor.TerminateCallCount() == 1);

    auto after = session.Request("tools/list");
    REQUIRE(after.IsErr());
    CHECK(after.Error().category == ErrorCategory::Internal);
}

// ===========================================================================
// Notifications
// ===========================================================================

TEST_CASE("McpSession: Notify writes no id and no params by default", "[session]") {
    MockProcessSupervisor supervisor;
    auto script = supervisor.EnqueueChild();
    McpSession session(Calculator(), supervisor);
    REQUIRE(session.Start().IsOk());

    REQUIRE(session.Notify("notifications/initialized").IsOk());
    REQUIRE(script->written.size() == 1);
    CHECK(script->written[0] == R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
    CHECK(session.LastRequestId() == 0);
}

// ===========================================================================
// Concurrency
// ===========================================================================

TEST_CASE("McpSession: concurrent requests never interleave", "[session]") {
    MockProcessSupervisor supervisor;
    auto script = supervisor.EnqueueChild();
    McpSession session(Calculator(), supervisor);
    StartInitialized(session, *script);

    constexpr int kRequests = 20;
    for (int id = 2; id < 2 + kRequests; ++id) {
        script->EnqueueResult(id, {{"n", id}});
    }

    std::vector<std::thread> threads;
    std::atomic<int> ok{0};
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < kRequests / 4; ++i) {
                if (session.Request("ping").IsOk()) ++ok;
            }
        });
    }
    for (auto& th : threads) th.join();

    CHECK(ok == kRequests);
    CHECK(session.State() == SessionState::Initialized);
    CHECK(session.LastRequestId() == 1 + kRequests);
}
