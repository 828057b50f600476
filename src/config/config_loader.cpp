#include <mcp_gateway/config/config_loader.hpp>

#include <mcp_gateway/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <sstream>

namespace mcp_gateway {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", "", std::nullopt, message, std::nullopt,
                 ErrorCategory::Config};
}

std::vector<std::string> ParseInterpreter(const YAML::Node& node) {
    if (node.IsSequence()) {
        std::vector<std::string> argv;
        for (const auto& part : node) {
            argv.push_back(part.as<std::string>());
        }
        return argv;
    }
    if (node.IsNull()) {
        return {};
    }
    return SplitCommandLine(node.as<std::string>());
}

void ParseServerSection(const YAML::Node& node, ServerConfig& out) {
    if (node["host"]) out.host = node["host"].as<std::string>();
    if (node["port"]) out.port = node["port"].as<int>();
    if (node["workers"]) out.workers = node["workers"].as<int>();
}

void ParseCatalogSection(const YAML::Node& node, CatalogConfig& out) {
    if (node["directory"]) out.directory = node["directory"].as<std::string>();
    if (node["extension"]) out.extension = node["extension"].as<std::string>();
    if (node["interpreter"]) out.interpreter = ParseInterpreter(node["interpreter"]);
    if (node["max_upload_bytes"]) {
        out.max_upload_bytes = node["max_upload_bytes"].as<std::uint64_t>();
    }
}

void ParseSessionSection(const YAML::Node& node, SessionConfig& out) {
    if (node["protocol_version"]) {
        out.protocol_version = node["protocol_version"].as<std::string>();
    }
    if (node["client_name"]) out.client_name = node["client_name"].as<std::string>();
    if (node["read_timeout_ms"]) out.read_timeout_ms = node["read_timeout_ms"].as<int>();
    if (node["write_timeout_ms"]) out.write_timeout_ms = node["write_timeout_ms"].as<int>();
    if (node["operation_timeout_ms"]) {
        out.operation_timeout_ms = node["operation_timeout_ms"].as<int>();
    }
    if (node["grace_period_ms"]) out.grace_period_ms = node["grace_period_ms"].as<int>();
    if (node["env"]) {
        for (const auto& entry : node["env"]) {
            out.env[entry.first.as<std::string>()] = entry.second.as<std::string>();
        }
    }
}

// Options shared by every subcommand.
void AddCommonArguments(argparse::ArgumentParser& parser) {
    parser.add_argument("-c", "--config")
        .help("Path to YAML config file");
    parser.add_argument("--servers-dir")
        .help("Directory holding the MCP server files");
    parser.add_argument("--interpreter")
        .help("Command used to run server files (empty: run them directly)");
    parser.add_argument("--read-timeout")
        .help("Per-read timeout in milliseconds")
        .scan<'i', int>();
    parser.add_argument("--grace-period")
        .help("Milliseconds between SIGTERM and SIGKILL")
        .scan<'i', int>();
    parser.add_argument("--json-logs")
        .help("Log as JSON lines")
        .default_value(false)
        .implicit_value(true);
    parser.add_argument("--log-file")
        .help("Also write logs to this file");
    parser.add_argument("-v", "--verbose")
        .help("Verbose output")
        .default_value(false)
        .implicit_value(true);
    parser.add_argument("-q", "--quiet")
        .help("Quiet output")
        .default_value(false)
        .implicit_value(true);
}

void ReadCommonArguments(const argparse::ArgumentParser& parser, CliInvocation& out) {
    auto& o = out.overrides;
    if (auto val = parser.present("--config")) out.config_path = *val;
    if (auto val = parser.present("--servers-dir")) o.servers_dir = *val;
    if (auto val = parser.present("--interpreter")) o.interpreter = SplitCommandLine(*val);
    if (auto val = parser.present<int>("--read-timeout")) o.read_timeout_ms = *val;
    if (auto val = parser.present<int>("--grace-period")) o.grace_period_ms = *val;
    if (auto val = parser.present("--log-file")) o.log_file = *val;
    o.json_logs = parser.get<bool>("--json-logs");
    o.verbose = parser.get<bool>("--verbose");
    o.quiet = parser.get<bool>("--quiet");
}

} // anonymous namespace

std::vector<std::string> SplitCommandLine(std::string_view text) {
    std::vector<std::string> parts;
    std::istringstream stream{std::string(text)};
    std::string part;
    while (stream >> part) {
        parts.push_back(part);
    }
    return parts;
}

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    AppConfig config;
    try {
        YAML::Node root = YAML::LoadFile(std::string(file_path));
        if (root.IsNull()) {
            return Result<AppConfig, Error>::Ok(std::move(config));
        }
        if (!root.IsMap()) {
            return Result<AppConfig, Error>::Err(
                MakeConfigError("Config root must be a mapping"));
        }

        if (root["server"]) ParseServerSection(root["server"], config.server);
        if (root["catalog"]) ParseCatalogSection(root["catalog"], config.catalog);
        if (root["session"]) ParseSessionSection(root["session"], config.session);

        if (root["log_file"]) config.log_file = root["log_file"].as<std::string>();
        if (root["json_logs"]) config.json_logs = root["json_logs"].as<bool>();
        if (root["verbose"]) config.verbose = root["verbose"].as<bool>();
        if (root["quiet"]) config.quiet = root["quiet"].as<bool>();
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }
    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<CliInvocation, Error> LoadFromCli(int argc, const char* const* argv) {
    using R = Result<CliInvocation, Error>;

    argparse::ArgumentParser program("mcp-gateway", kVersion,
                                     argparse::default_arguments::help);
    program.add_description("HTTP gateway to MCP tool servers spawned over stdio.");
    program.add_argument("--version")
        .help("Print version and exit")
        .default_value(false)
        .implicit_value(true);

    argparse::ArgumentParser serve("serve", kVersion, argparse::default_arguments::help);
    serve.add_description("Run the HTTP gateway");
    AddCommonArguments(serve);
    serve.add_argument("--host").help("Bind address");
    serve.add_argument("--port").help("Bind port").scan<'i', int>();
    serve.add_argument("--workers").help("HTTP worker threads").scan<'i', int>();

    argparse::ArgumentParser servers("servers", kVersion, argparse::default_arguments::help);
    servers.add_description("List server files in the catalog");
    AddCommonArguments(servers);

    argparse::ArgumentParser tools("tools", kVersion, argparse::default_arguments::help);
    tools.add_description("List the tools of one server");
    tools.add_argument("server").help("Server file name");
    AddCommonArguments(tools);

    argparse::ArgumentParser describe("describe", kVersion,
                                      argparse::default_arguments::help);
    describe.add_description("Show one tool's definition");
    describe.add_argument("server").help("Server file name");
    describe.add_argument("tool").help("Tool name");
    AddCommonArguments(describe);

    argparse::ArgumentParser call("call", kVersion, argparse::default_arguments::help);
    call.add_description("Call one tool and print its text output");
    call.add_argument("server").help("Server file name");
    call.add_argument("tool").help("Tool name");
    call.add_argument("--args").help("Tool arguments as a JSON object").default_value(
        std::string("{}"));
    AddCommonArguments(call);

    program.add_subparser(serve);
    program.add_subparser(servers);
    program.add_subparser(tools);
    program.add_subparser(describe);
    program.add_subparser(call);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return R::Err(MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    CliInvocation out;
    if (program.get<bool>("--version")) {
        out.command = Command::Version;
        return R::Ok(std::move(out));
    }

    try {
        if (program.is_subcommand_used(serve)) {
            out.command = Command::Serve;
            ReadCommonArguments(serve, out);
            if (auto val = serve.present("--host")) out.overrides.host = *val;
            if (auto val = serve.present<int>("--port")) out.overrides.port = *val;
            if (auto val = serve.present<int>("--workers")) out.overrides.workers = *val;
        } else if (program.is_subcommand_used(servers)) {
            out.command = Command::Servers;
            ReadCommonArguments(servers, out);
        } else if (program.is_subcommand_used(tools)) {
            out.command = Command::Tools;
            ReadCommonArguments(tools, out);
            out.server = tools.get<std::string>("server");
        } else if (program.is_subcommand_used(describe)) {
            out.command = Command::Describe;
            ReadCommonArguments(describe, out);
            out.server = describe.get<std::string>("server");
            out.tool = describe.get<std::string>("tool");
        } else if (program.is_subcommand_used(call)) {
            out.command = Command::Call;
            ReadCommonArguments(call, out);
            out.server = call.get<std::string>("server");
            out.tool = call.get<std::string>("tool");
            auto arguments = nlohmann::json::parse(call.get<std::string>("--args"),
                                                   nullptr, false);
            if (arguments.is_discarded() || !arguments.is_object()) {
                return R::Err(Error{"ConfigLoader", "", std::nullopt,
                                    "--args must be a JSON object", std::nullopt,
                                    ErrorCategory::InvalidArgument});
            }
            out.arguments = std::move(arguments);
        } else {
            return R::Err(MakeConfigError(
                "No command given (serve, servers, tools, describe, call)"));
        }
    } catch (const std::exception& e) {
        return R::Err(MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    return R::Ok(std::move(out));
}

// ---------------------------------------------------------------------------
// ApplyEnvironment
// ---------------------------------------------------------------------------
AppConfig ApplyEnvironment(AppConfig config) {
    const char* dir = std::getenv(kServersDirEnv);
    if (dir != nullptr && *dir != '\0') {
        config.catalog.directory = dir;
    }
    return config;
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& base, const CliOverrides& cli) {
    AppConfig merged = base;

    if (cli.host) merged.server.host = *cli.host;
    if (cli.port) merged.server.port = *cli.port;
    if (cli.workers) merged.server.workers = *cli.workers;
    if (cli.servers_dir) merged.catalog.directory = *cli.servers_dir;
    if (cli.interpreter) merged.catalog.interpreter = *cli.interpreter;
    if (cli.read_timeout_ms) merged.session.read_timeout_ms = *cli.read_timeout_ms;
    if (cli.grace_period_ms) merged.session.grace_period_ms = *cli.grace_period_ms;
    if (cli.log_file) merged.log_file = cli.log_file;

    if (cli.json_logs) merged.json_logs = true;
    if (cli.verbose) merged.verbose = true;
    if (cli.quiet) merged.quiet = true;

    return merged;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.server.host.empty()) {
        return Result<void, Error>::Err(MakeConfigError("Missing required field: server.host"));
    }
    if (config.server.port <= 0 || config.server.port > 65535) {
        return Result<void, Error>::Err(
            MakeConfigError("Invalid port: " + std::to_string(config.server.port)));
    }
    if (config.server.workers <= 0) {
        return Result<void, Error>::Err(MakeConfigError(
            "Worker count must be positive, got " + std::to_string(config.server.workers)));
    }
    if (config.catalog.directory.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("Missing required field: catalog.directory"));
    }
    if (config.catalog.extension.empty() || config.catalog.extension.front() != '.') {
        return Result<void, Error>::Err(MakeConfigError(
            "Extension must start with '.', got '" + config.catalog.extension + "'"));
    }
    if (config.catalog.max_upload_bytes == 0) {
        return Result<void, Error>::Err(
            MakeConfigError("max_upload_bytes must be positive"));
    }
    if (config.session.protocol_version.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("Missing required field: session.protocol_version"));
    }
    if (config.session.read_timeout_ms <= 0) {
        return Result<void, Error>::Err(MakeConfigError(
            "Read timeout must be positive, got " +
            std::to_string(config.session.read_timeout_ms)));
    }
    if (config.session.write_timeout_ms <= 0) {
        return Result<void, Error>::Err(MakeConfigError(
            "Write timeout must be positive, got " +
            std::to_string(config.session.write_timeout_ms)));
    }
    if (config.session.operation_timeout_ms <= 0) {
        return Result<void, Error>::Err(MakeConfigError(
            "Operation timeout must be positive, got " +
            std::to_string(config.session.operation_timeout_ms)));
    }
    if (config.session.grace_period_ms < 0) {
        return Result<void, Error>::Err(MakeConfigError(
            "Grace period must not be negative, got " +
            std::to_string(config.session.grace_period_ms)));
    }
    if (config.verbose && config.quiet) {
        return Result<void, Error>::Err(
            MakeConfigError("--verbose and --quiet are mutually exclusive"));
    }
    return Result<void, Error>::Ok();
}

} // namespace mcp_gateway
