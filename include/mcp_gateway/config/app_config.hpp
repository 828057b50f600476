#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_gateway {

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 8001;
    int workers = 8;
};

struct CatalogConfig {
    std::string directory = "./mcp_servers";
    std::string extension = ".py";
    std::vector<std::string> interpreter = {"python3", "-u"};
    std::uint64_t max_upload_bytes = 10 * 1024 * 1024;
};

struct SessionConfig {
    std::string protocol_version = "2024-11-05";
    std::string client_name = "mcp-gateway";
    int read_timeout_ms = 30000;
    int write_timeout_ms = 30000;
    int operation_timeout_ms = 60000;
    int grace_period_ms = 5000;
    std::map<std::string, std::string> env;
};

struct AppConfig {
    ServerConfig server;
    CatalogConfig catalog;
    SessionConfig session;
    std::optional<std::string> log_file;
    bool json_logs = false;
    bool verbose = false;
    bool quiet = false;
};

enum class Command {
    Serve,
    Servers,
    Tools,
    Describe,
    Call,
    Version,
};

// Values given on the command line; unset fields leave the config alone.
struct CliOverrides {
    std::optional<std::string> host;
    std::optional<int> port;
    std::optional<int> workers;
    std::optional<std::string> servers_dir;
    std::optional<std::vector<std::string>> interpreter;
    std::optional<int> read_timeout_ms;
    std::optional<int> grace_period_ms;
    std::optional<std::string> log_file;
    bool json_logs = false;
    bool verbose = false;
    bool quiet = false;
};

struct CliInvocation {
    Command command = Command::Serve;
    std::optional<std::string> config_path;
    std::string server;
    std::string tool;
    nlohmann::json arguments = nlohmann::json::object();
    CliOverrides overrides;
};

} // namespace mcp_gateway
