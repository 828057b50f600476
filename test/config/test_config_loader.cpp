#include <catch2/catch_test_macros.hpp>

#include <mcp_gateway/config/config_loader.hpp>

#include <cstdlib>
#include <string>
#include <vector>

using namespace mcp_gateway;

namespace {

// testdata lives beside the test sources; derive it from this file's path so
// the tests do not depend on the working directory.
std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto test_dir = this_file.substr(0, this_file.rfind('/'));   // .../test/config
    auto test_root = test_dir.substr(0, test_dir.rfind('/'));    // .../test
    return test_root + "/testdata/" + filename;
}

template <size_t N>
Result<CliInvocation, Error> ParseArgs(const char* (&argv)[N]) {
    return LoadFromCli(static_cast<int>(N), argv);
}

// Sets MCP_SERVERS_DIR for the lifetime of the guard.
class ServersDirEnv {
public:
    explicit ServersDirEnv(const char* value) { setenv(kServersDirEnv, value, 1); }
    ~ServersDirEnv() { unsetenv(kServersDirEnv); }
};

} // anonymous namespace

// ===========================================================================
// LoadFromYaml
// ===========================================================================

TEST_CASE("LoadFromYaml: full config", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("full_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.server.host == "127.0.0.1");
    CHECK(config.server.port == 9100);
    CHECK(config.server.workers == 4);

    CHECK(config.catalog.directory == "/srv/mcp");
    CHECK(config.catalog.extension == ".py");
    CHECK(config.catalog.interpreter ==
          std::vector<std::string>{"/usr/bin/python3.12", "-u"});
    CHECK(config.catalog.max_upload_bytes == 2048);

    CHECK(config.session.protocol_version == "2025-03-26");
    CHECK(config.session.client_name == "mcp-gateway-ci");
    CHECK(config.session.read_timeout_ms == 1500);
    CHECK(config.session.write_timeout_ms == 700);
    CHECK(config.session.operation_timeout_ms == 4000);
    CHECK(config.session.grace_period_ms == 250);
    REQUIRE(config.session.env.size() == 2);
    CHECK(config.session.env.at("OPENWEATHER_API_KEY") == "test-key");

    CHECK(config.log_file == std::optional<std::string>("/var/log/mcp-gateway.log"));
    CHECK(config.json_logs);
    CHECK(config.verbose);
    CHECK_FALSE(config.quiet);
}

TEST_CASE("LoadFromYaml: minimal config keeps defaults", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("minimal_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.catalog.directory == "./servers");
    CHECK(config.catalog.interpreter ==
          std::vector<std::string>{"python3", "-X", "utf8"});
    CHECK(config.server.host == "0.0.0.0");
    CHECK(config.server.port == 8001);
    CHECK(config.catalog.extension == ".py");
    CHECK(config.session.protocol_version == "2024-11-05");
    CHECK(config.session.read_timeout_ms == 30000);
    CHECK(config.session.write_timeout_ms == 30000);
    CHECK_FALSE(config.log_file.has_value());
}

TEST_CASE("LoadFromYaml: nonexistent file", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("does_not_exist.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
    CHECK(result.Error().ExitCode() == 9);
}

TEST_CASE("LoadFromYaml: syntax error", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("invalid_config.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("Failed to parse YAML") != std::string::npos);
}

TEST_CASE("LoadFromYaml: root must be a mapping", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("list_root.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "Config root must be a mapping");
}

// ===========================================================================
// LoadFromCli
// ===========================================================================

TEST_CASE("LoadFromCli: serve with overrides", "[config][cli]") {
    const char* argv[] = {"mcp-gateway", "serve", "--host", "127.0.0.1",
                          "--port", "9000", "--workers", "2",
                          "--servers-dir", "/tmp/servers", "--json-logs"};
    auto result = ParseArgs(argv);
    REQUIRE(result.IsOk());
    const auto& cli = result.Value();
    CHECK(cli.command == Command::Serve);
    CHECK(cli.overrides.host == std::optional<std::string>("127.0.0.1"));
    CHECK(cli.overrides.port == std::optional<int>(9000));
    CHECK(cli.overrides.workers == std::optional<int>(2));
    CHECK(cli.overrides.servers_dir == std::optional<std::string>("/tmp/servers"));
    CHECK(cli.overrides.json_logs);
    CHECK_FALSE(cli.config_path.has_value());
}

TEST_CASE("LoadFromCli: servers with config file", "[config][cli]") {
    const char* argv[] = {"mcp-gateway", "servers", "-c", "gateway.yaml"};
    auto result = ParseArgs(argv);
    REQUIRE(result.IsOk());
    CHECK(result.Value().command == Command::Servers);
    CHECK(result.Value().config_path == std::optional<std::string>("gateway.yaml"));
}

TEST_CASE("LoadFromCli: tools and describe positionals", "[config][cli]") {
    const char* tools_argv[] = {"mcp-gateway", "tools", "weather.py"};
    auto tools = ParseArgs(tools_argv);
    REQUIRE(tools.IsOk());
    CHECK(tools.Value().command == Command::Tools);
    CHECK(tools.Value().server == "weather.py");

    const char* describe_argv[] = {"mcp-gateway", "describe", "weather.py", "forecast", "-v"};
    auto describe = ParseArgs(describe_argv);
    REQUIRE(describe.IsOk());
    CHECK(describe.Value().command == Command::Describe);
    CHECK(describe.Value().server == "weather.py");
    CHECK(describe.Value().tool == "forecast");
    CHECK(describe.Value().overrides.verbose);
}

TEST_CASE("LoadFromCli: call parses --args", "[config][cli]") {
    const char* argv[] = {"mcp-gateway", "call", "calc.py", "add",
                          "--args", R"({"a":2,"b":3})",
                          "--interpreter", "python3 -u", "--read-timeout", "500"};
    auto result = ParseArgs(argv);
    REQUIRE(result.IsOk());
    const auto& cli = result.Value();
    CHECK(cli.command == Command::Call);
    CHECK(cli.tool == "add");
    CHECK(cli.arguments == nlohmann::json{{"a", 2}, {"b", 3}});
    CHECK(cli.overrides.interpreter == std::optional<std::vector<std::string>>(
                                           std::vector<std::string>{"python3", "-u"}));
    CHECK(cli.overrides.read_timeout_ms == std::optional<int>(500));
}

TEST_CASE("LoadFromCli: call without --args sends an empty object", "[config][cli]") {
    const char* argv[] = {"mcp-gateway", "call", "calc.py", "ping"};
    auto result = ParseArgs(argv);
    REQUIRE(result.IsOk());
    CHECK(result.Value().arguments == nlohmann::json::object());
}

TEST_CASE("LoadFromCli: --args must be a JSON object", "[config][cli]") {
    const char* argv[] = {"mcp-gateway", "call", "calc.py", "add", "--args", "[1,2]"};
    auto result = ParseArgs(argv);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::InvalidArgument);

    const char* broken[] = {"mcp-gateway", "call", "calc.py", "add", "--args", "{a:"};
    CHECK(ParseArgs(broken).IsErr());
}

TEST_CASE("LoadFromCli: --version", "[config][cli]") {
    const char* argv[] = {"mcp-gateway", "--version"};
    auto result = ParseArgs(argv);
    REQUIRE(result.IsOk());
    CHECK(result.Value().command == Command::Version);
}

TEST_CASE("LoadFromCli: missing command", "[config][cli]") {
    const char* argv[] = {"mcp-gateway"};
    auto result = ParseArgs(argv);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
}

TEST_CASE("LoadFromCli: non-numeric port", "[config][cli]") {
    const char* argv[] = {"mcp-gateway", "serve", "--port", "http"};
    auto result = ParseArgs(argv);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("CLI parse error") != std::string::npos);
}

TEST_CASE("LoadFromCli: tools requires a server", "[config][cli]") {
    const char* argv[] = {"mcp-gateway", "tools"};
    CHECK(ParseArgs(argv).IsErr());
}

// ===========================================================================
// Environment and merging
// ===========================================================================

TEST_CASE("ApplyEnvironment: MCP_SERVERS_DIR replaces the file value", "[config][env]") {
    ServersDirEnv env("/opt/mcp");
    AppConfig base;
    base.catalog.directory = "/srv/mcp";
    CHECK(ApplyEnvironment(base).catalog.directory == "/opt/mcp");
}

TEST_CASE("ApplyEnvironment: empty MCP_SERVERS_DIR is ignored", "[config][env]") {
    ServersDirEnv env("");
    AppConfig base;
    base.catalog.directory = "/srv/mcp";
    CHECK(ApplyEnvironment(base).catalog.directory == "/srv/mcp");
}

TEST_CASE("MergeConfigs: command line wins over environment", "[config][env]") {
    ServersDirEnv env("/opt/mcp");
    CliOverrides cli;
    cli.servers_dir = "/home/me/servers";
    auto merged = MergeConfigs(ApplyEnvironment(AppConfig{}), cli);
    CHECK(merged.catalog.directory == "/home/me/servers");
}

TEST_CASE("MergeConfigs: unset overrides keep the base", "[config]") {
    AppConfig base;
    base.server.port = 9100;
    base.session.grace_period_ms = 250;

    CliOverrides cli;
    cli.host = "localhost";
    cli.interpreter = std::vector<std::string>{};
    cli.quiet = true;

    auto merged = MergeConfigs(base, cli);
    CHECK(merged.server.port == 9100);
    CHECK(merged.server.host == "localhost");
    CHECK(merged.session.grace_period_ms == 250);
    CHECK(merged.catalog.interpreter.empty());
    CHECK(merged.quiet);
    CHECK_FALSE(merged.verbose);
}

TEST_CASE("SplitCommandLine: splits on whitespace", "[config]") {
    CHECK(SplitCommandLine("python3  -u\t-X utf8") ==
          std::vector<std::string>{"python3", "-u", "-X", "utf8"});
    CHECK(SplitCommandLine("   ").empty());
}

// ===========================================================================
// ValidateConfig
// ===========================================================================

TEST_CASE("ValidateConfig: defaults are valid", "[config][validate]") {
    CHECK(ValidateConfig(AppConfig{}).IsOk());
}

TEST_CASE("ValidateConfig: rejects out-of-range values", "[config][validate]") {
    SECTION("port zero") {
        AppConfig c;
        c.server.port = 0;
        CHECK(ValidateConfig(c).IsErr());
    }
    SECTION("port too large") {
        AppConfig c;
        c.server.port = 70000;
        CHECK(ValidateConfig(c).IsErr());
    }
    SECTION("no workers") {
        AppConfig c;
        c.server.workers = 0;
        CHECK(ValidateConfig(c).IsErr());
    }
    SECTION("extension without dot") {
        AppConfig c;
        c.catalog.extension = "py";
        CHECK(ValidateConfig(c).IsErr());
    }
    SECTION("empty directory") {
        AppConfig c;
        c.catalog.directory.clear();
        CHECK(ValidateConfig(c).IsErr());
    }
    SECTION("zero read timeout") {
        AppConfig c;
        c.session.read_timeout_ms = 0;
        CHECK(ValidateConfig(c).IsErr());
    }
    SECTION("zero write timeout") {
        AppConfig c;
        c.session.write_timeout_ms = 0;
        CHECK(ValidateConfig(c).IsErr());
    }
    SECTION("negative grace period") {
        AppConfig c;
        c.session.grace_period_ms = -1;
        CHECK(ValidateConfig(c).IsErr());
    }
    SECTION("verbose and quiet") {
        AppConfig c;
        c.verbose = true;
        c.quiet = true;
        auto result = ValidateConfig(c);
        REQUIRE(result.IsErr());
        CHECK(result.Error().category == ErrorCategory::Config);
    }
}

TEST_CASE("ValidateConfig: zero grace period is allowed", "[config][validate]") {
    AppConfig c;
    c.session.grace_period_ms = 0;
    CHECK(ValidateConfig(c).IsOk());
}
