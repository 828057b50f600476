#pragma once

#include <mcp_gateway/core/result.hpp>
#include <mcp_gateway/gateway/server_catalog.hpp>
#include <mcp_gateway/gateway/tool_gateway.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace mcp_gateway {

struct HttpServerOptions {
    std::string host = "0.0.0.0";
    uint16_t port = 8001;
    std::size_t workers = 8;
};

// ---------------------------------------------------------------------------
// HttpServer: REST front end over ServerCatalog and ToolGateway.
//
// Uses pimpl to keep httplib out of the public header. Each request runs on
// a worker of the server's thread pool; gateway operations block that worker
// only.
//
//   GET    /                        service banner
//   GET    /health                  liveness and catalog root status
//   GET    /servers                 list server files
//   POST   /upload                  multipart field "file"
//   DELETE /servers/{server}        delete a server file
//   GET    /{server}/tools          list tools
//   POST   /{server}/tools/call     {"name": ..., "arguments": {...}}
//   GET    /{server}/tools/{tool}   describe one tool
// ---------------------------------------------------------------------------
class HttpServer {
public:
    HttpServer(const ServerCatalog& catalog, const ToolGateway& gateway,
               HttpServerOptions options = {});
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Bind `options.host` on `options.port` and serve until Stop().
    [[nodiscard]] Result<void, Error> Listen();

    /// Bind to an OS-chosen port on `host`. Returns the port, or -1.
    int BindToAnyPort(const std::string& host);
    /// Serve on a socket bound by BindToAnyPort. Blocks until Stop().
    bool ListenAfterBind();

    void WaitUntilReady() const;
    void Stop();
    [[nodiscard]] bool IsRunning() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace mcp_gateway
