#include <mcp_gateway/config/config_loader.hpp>
#include <mcp_gateway/core/log.hpp>
#include <mcp_gateway/core/version.hpp>
#include <mcp_gateway/gateway/server_catalog.hpp>
#include <mcp_gateway/gateway/tool_gateway.hpp>
#include <mcp_gateway/http/http_server.hpp>
#include <mcp_gateway/process/process_supervisor.hpp>

#include <nlohmann/json.hpp>

#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <pthread.h>
#include <signal.h>

using namespace mcp_gateway;

namespace {

constexpr int kExitSuccess = 0;

// -- Wiring -----------------------------------------------------------------

CatalogOptions MakeCatalogOptions(const AppConfig& config) {
    CatalogOptions options;
    options.directory = config.catalog.directory;
    options.extension = config.catalog.extension;
    options.interpreter = config.catalog.interpreter;
    options.max_upload_bytes = config.catalog.max_upload_bytes;
    return options;
}

SupervisorOptions MakeSupervisorOptions(const AppConfig& config) {
    SupervisorOptions options;
    options.grace_period = std::chrono::milliseconds{config.session.grace_period_ms};
    options.write_timeout = std::chrono::milliseconds{config.session.write_timeout_ms};
    options.extra_env = config.session.env;
    return options;
}

GatewayOptions MakeGatewayOptions(const AppConfig& config) {
    GatewayOptions options;
    options.session.read_timeout = std::chrono::milliseconds{config.session.read_timeout_ms};
    options.session.operation_timeout =
        std::chrono::milliseconds{config.session.operation_timeout_ms};
    options.handshake.protocol_version = config.session.protocol_version;
    options.handshake.client.name = config.session.client_name;
    options.handshake.client.version = kVersion;
    return options;
}

void InitLogging(const AppConfig& config, Command command) {
    // The server reports progress by default; one-shot commands stay quiet
    // unless asked so stdout and stderr remain easy to script against.
    const auto level = ThresholdFor(command == Command::Serve ? LogLevel::Info : LogLevel::Warn,
                                    config.verbose, config.quiet);

    std::unique_ptr<ILogSink> sink;
    if (config.json_logs) {
        sink = std::make_unique<JsonSink>(std::cerr);
    } else {
        sink = std::make_unique<ColorConsoleSink>(ConsoleSupportsColor());
    }
    if (config.log_file) {
        auto file = std::make_unique<FileSink>(*config.log_file);
        if (file->IsOpen()) {
            sink = std::make_unique<TeeSink>(std::move(sink), std::move(file));
        } else {
            std::cerr << "Warning: cannot open log file " << *config.log_file << "\n";
        }
    }
    InitGlobalLogger(std::move(sink), level);
}

int ReportError(const Error& error) {
    std::cerr << "Error: " << error.ToString() << "\n";
    return error.ExitCode();
}

void PrintJson(const nlohmann::json& value) {
    std::cout << value.dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
              << "\n";
}

// -- Commands ---------------------------------------------------------------

int RunServe(const AppConfig& config, const ServerCatalog& catalog,
             const ToolGateway& gateway) {
    HttpServerOptions options;
    options.host = config.server.host;
    options.port = static_cast<uint16_t>(config.server.port);
    options.workers = static_cast<std::size_t>(config.server.workers);

    // SIGINT/SIGTERM are blocked here and in every thread started below, then
    // collected with sigwait so shutdown runs outside signal context.
    sigset_t stop_signals;
    sigemptyset(&stop_signals);
    sigaddset(&stop_signals, SIGINT);
    sigaddset(&stop_signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr);

    HttpServer server(catalog, gateway, options);
    LogInfo("http", "MCP servers directory: " + config.catalog.directory +
                        (catalog.RootExists() ? "" : " (missing)"));

    Result<void, Error> outcome = Result<void, Error>::Ok();
    std::thread listener([&] { outcome = server.Listen(); });

    std::thread waiter([&] {
        int signo = 0;
        sigwait(&stop_signals, &signo);
        if (signo == SIGINT || signo == SIGTERM) {
            LogInfo("http", "signal " + std::to_string(signo) + ", shutting down");
            server.Stop();
        }
    });

    listener.join();
    if (outcome.IsErr()) {
        // Listen failed on its own; release the signal waiter.
        pthread_kill(waiter.native_handle(), SIGTERM);
    }
    waiter.join();

    if (outcome.IsErr()) {
        return ReportError(outcome.Error());
    }
    return kExitSuccess;
}

int RunServers(const ServerCatalog& catalog) {
    auto servers = catalog.List();
    if (servers.IsErr()) {
        return ReportError(servers.Error());
    }
    PrintJson({
        {"servers", servers.Value()},
        {"count", servers.Value().size()},
        {"directory", catalog.Options().directory.string()},
    });
    return kExitSuccess;
}

int RunTools(const ToolGateway& gateway, const CliInvocation& cli) {
    auto tools = gateway.ListTools(cli.server);
    if (tools.IsErr()) {
        return ReportError(tools.Error());
    }
    auto list = nlohmann::json::array();
    for (const auto& tool : tools.Value()) {
        list.push_back(tool.raw);
    }
    PrintJson({{"tools", std::move(list)}});
    return kExitSuccess;
}

int RunDescribe(const ToolGateway& gateway, const CliInvocation& cli) {
    auto tool = gateway.DescribeTool(cli.server, cli.tool);
    if (tool.IsErr()) {
        return ReportError(tool.Error());
    }
    PrintJson(tool.Value().raw);
    return kExitSuccess;
}

int RunCall(const ToolGateway& gateway, const CliInvocation& cli) {
    auto text = gateway.CallTool(cli.server, cli.tool, cli.arguments);
    if (text.IsErr()) {
        return ReportError(text.Error());
    }
    std::cout << text.Value() << "\n";
    return kExitSuccess;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    auto cli = LoadFromCli(argc, argv);
    if (cli.IsErr()) {
        return ReportError(cli.Error());
    }
    const auto& invocation = cli.Value();
    if (invocation.command == Command::Version) {
        std::cout << "mcp-gateway " << kVersion << "\n";
        return kExitSuccess;
    }

    AppConfig base;
    if (invocation.config_path) {
        auto loaded = LoadFromYaml(*invocation.config_path);
        if (loaded.IsErr()) {
            return ReportError(loaded.Error());
        }
        base = std::move(loaded).Value();
    }
    const auto config = MergeConfigs(ApplyEnvironment(std::move(base)), invocation.overrides);

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        return ReportError(valid.Error());
    }

    InitLogging(config, invocation.command);

    ServerCatalog catalog(MakeCatalogOptions(config));
    ProcessSupervisor supervisor(MakeSupervisorOptions(config));
    ToolGateway gateway(catalog, supervisor, MakeGatewayOptions(config));

    switch (invocation.command) {
        case Command::Serve:    return RunServe(config, catalog, gateway);
        case Command::Servers:  return RunServers(catalog);
        case Command::Tools:    return RunTools(gateway, invocation);
        case Command::Describe: return RunDescribe(gateway, invocation);
        case Command::Call:     return RunCall(gateway, invocation);
        case Command::Version:  break;
    }
    return kExitSuccess;
}
