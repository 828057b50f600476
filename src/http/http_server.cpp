#include <mcp_gateway/http/http_server.hpp>

#include <mcp_gateway/core/log.hpp>
#include <mcp_gateway/core/version.hpp>

#include <httplib.h>
#include <nlohmann/json.hpp>

namespace mcp_gateway {

namespace {

constexpr const char* kJsonContentType = "application/json";

std::string Dump(const nlohmann::json& value) {
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void SendJson(httplib::Response& res, int status, const nlohmann::json& body) {
    res.status = status;
    res.set_content(Dump(body), kJsonContentType);
}

void SendError(httplib::Response& res, const Error& error) {
    auto details = nlohmann::json::parse(error.ToJson(), nullptr, false);
    nlohmann::json body = {{"detail", error.ToString()}};
    if (!details.is_discarded() && details.contains("error")) {
        body["error"] = details["error"];
    }
    SendJson(res, error.HttpStatus(), body);
}

void SendBadRequest(httplib::Response& res, const std::string& operation,
                    const std::string& message) {
    SendError(res, Error{operation, "", std::nullopt, message, std::nullopt,
                         ErrorCategory::InvalidArgument});
}

} // anonymous namespace

struct HttpServer::Impl {
    const ServerCatalog& catalog;
    const ToolGateway& gateway;
    HttpServerOptions options;
    httplib::Server server;

    Impl(const ServerCatalog& c, const ToolGateway& g, HttpServerOptions opts)
        : catalog(c), gateway(g), options(std::move(opts)) {
        const auto workers = options.workers == 0 ? std::size_t{1} : options.workers;
        server.new_task_queue = [workers] { return new httplib::ThreadPool(workers); };
        server.set_logger([](const httplib::Request& req, const httplib::Response& res) {
            LogInfo("http", req.method + " " + req.path + " -> " +
                                std::to_string(res.status));
        });
        RegisterRoutes();
    }

    void RegisterRoutes() {
        server.Get("/", [](const httplib::Request&, httplib::Response& res) {
            SendJson(res, 200, {
                {"message", "MCP gateway"},
                {"version", kVersion},
                {"endpoints", {
                    {"health", "GET /health"},
                    {"servers", "GET /servers"},
                    {"upload", "POST /upload"},
                    {"delete", "DELETE /servers/{server}"},
                    {"list_tools", "GET /{server}/tools"},
                    {"call_tool", "POST /{server}/tools/call"},
                    {"describe_tool", "GET /{server}/tools/{tool}"},
                }},
            });
        });

        server.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
            SendJson(res, 200, {
                {"status", "healthy"},
                {"mcp_servers_dir", catalog.Options().directory.string()},
                {"mcp_servers_dir_exists", catalog.RootExists()},
            });
        });

        server.Get("/servers", [this](const httplib::Request&, httplib::Response& res) {
            auto servers = catalog.List();
            if (servers.IsErr()) {
                SendError(res, servers.Error());
                return;
            }
            SendJson(res, 200, {
                {"servers", servers.Value()},
                {"count", servers.Value().size()},
                {"directory", catalog.Options().directory.string()},
            });
        });

        server.Post("/upload", [this](const httplib::Request& req, httplib::Response& res) {
            if (!req.has_file("file")) {
                SendBadRequest(res, "Upload", "multipart field 'file' is required");
                return;
            }
            const auto file = req.get_file_value("file");
            if (file.filename.empty()) {
                SendBadRequest(res, "Upload", "uploaded file has no name");
                return;
            }
            auto stored = catalog.Upload(file.filename, file.content);
            if (stored.IsErr()) {
                SendError(res, stored.Error());
                return;
            }
            const auto& info = stored.Value();
            SendJson(res, 200, {
                {"success", true},
                {"filename", info.name},
                {"size", info.size},
                {"path", info.path.string()},
                {"message", "MCP server '" + info.name + "' uploaded successfully"},
            });
        });

        server.Delete(R"(/servers/([^/]+))",
                      [this](const httplib::Request& req, httplib::Response& res) {
            const auto name = req.matches[1].str();
            auto removed = catalog.Remove(name);
            if (removed.IsErr()) {
                SendError(res, removed.Error());
                return;
            }
            SendJson(res, 200, {
                {"success", true},
                {"filename", name},
                {"message", "MCP server '" + name + "' deleted successfully"},
            });
        });

        server.Get(R"(/([^/]+)/tools)",
                   [this](const httplib::Request& req, httplib::Response& res) {
            auto tools = gateway.ListTools(req.matches[1].str());
            if (tools.IsErr()) {
                SendError(res, tools.Error());
                return;
            }
            auto list = nlohmann::json::array();
            for (const auto& tool : tools.Value()) {
                list.push_back(tool.raw);
            }
            SendJson(res, 200, {{"tools", std::move(list)}});
        });

        server.Post(R"(/([^/]+)/tools/call)",
                    [this](const httplib::Request& req, httplib::Response& res) {
            auto body = nlohmann::json::parse(req.body, nullptr, false);
            if (body.is_discarded() || !body.is_object()) {
                SendBadRequest(res, "CallTool", "request body must be a JSON object");
                return;
            }
            if (!body.contains("name") || !body["name"].is_string()) {
                SendBadRequest(res, "CallTool", "'name' must be a string");
                return;
            }
            auto arguments = body.value("arguments", nlohmann::json::object());
            if (!arguments.is_object()) {
                SendBadRequest(res, "CallTool", "'arguments' must be an object");
                return;
            }

            auto descriptor = catalog.Resolve(req.matches[1].str());
            if (descriptor.IsErr()) {
                SendError(res, descriptor.Error());
                return;
            }
            const auto tool = body["name"].get<std::string>();
            auto text = gateway.CallTool(descriptor.Value(), tool, arguments);
            if (text.IsErr()) {
                SendError(res, text.Error());
                return;
            }
            SendJson(res, 200, {
                {"success", true},
                {"result", text.Value()},
                {"server_file", descriptor.Value().name},
                {"tool_name", tool},
                {"arguments", arguments},
            });
        });

        server.Get(R"(/([^/]+)/tools/([^/]+))",
                   [this](const httplib::Request& req, httplib::Response& res) {
            auto tool = gateway.DescribeTool(req.matches[1].str(), req.matches[2].str());
            if (tool.IsErr()) {
                SendError(res, tool.Error());
                return;
            }
            SendJson(res, 200, tool.Value().raw);
        });
    }
};

HttpServer::HttpServer(const ServerCatalog& catalog, const ToolGateway& gateway,
                       HttpServerOptions options)
    : impl_(std::make_unique<Impl>(catalog, gateway, std::move(options))) {}

HttpServer::~HttpServer() {
    Stop();
}

Result<void, Error> HttpServer::Listen() {
    const auto& opts = impl_->options;
    LogInfo("http", "listening on " + opts.host + ":" + std::to_string(opts.port));
    if (!impl_->server.listen(opts.host, opts.port)) {
        return Result<void, Error>::Err(Error{
            "Listen", opts.host + ":" + std::to_string(opts.port), std::nullopt,
            "cannot bind or serve on " + opts.host + ":" + std::to_string(opts.port),
            std::nullopt, ErrorCategory::Io});
    }
    return Result<void, Error>::Ok();
}

int HttpServer::BindToAnyPort(const std::string& host) {
    return impl_->server.bind_to_any_port(host);
}

bool HttpServer::ListenAfterBind() {
    return impl_->server.listen_after_bind();
}

void HttpServer::WaitUntilReady() const {
    impl_->server.wait_until_ready();
}

void HttpServer::Stop() {
    if (impl_ && impl_->server.is_running()) {
        impl_->server.stop();
    }
}

bool HttpServer::IsRunning() const {
    return impl_->server.is_running();
}

} // namespace mcp_gateway
