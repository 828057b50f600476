#pragma once

#include <mcp_gateway/core/result.hpp>
#include <mcp_gateway/process/server_descriptor.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace mcp_gateway {

struct CatalogOptions {
    std::filesystem::path directory = "./mcp_servers";
    std::string extension = ".py";
    // Prepended to the script path; empty means the script is run directly.
    std::vector<std::string> interpreter = {"python3", "-u"};
    std::uintmax_t max_upload_bytes = 10 * 1024 * 1024;
};

struct UploadInfo {
    std::string name;
    std::uintmax_t size = 0;
    std::filesystem::path path;
};

// ---------------------------------------------------------------------------
// ServerCatalog: the directory of tool-server definitions.
//
// Names are validated with ServerName, and every resolved path is checked
// against the canonical root so symlinks cannot point outside it.
// ---------------------------------------------------------------------------
class ServerCatalog {
public:
    explicit ServerCatalog(CatalogOptions options);

    /// Sorted file names with the configured extension. Missing root -> empty.
    [[nodiscard]] Result<std::vector<std::string>, Error> List() const;

    [[nodiscard]] Result<ServerDescriptor, Error> Resolve(const std::string& name) const;

    [[nodiscard]] Result<UploadInfo, Error> Upload(const std::string& filename,
                                                   const std::string& content) const;

    [[nodiscard]] Result<void, Error> Remove(const std::string& name) const;

    [[nodiscard]] bool RootExists() const;
    [[nodiscard]] const CatalogOptions& Options() const noexcept { return options_; }

    /// The command line used to run `script`.
    [[nodiscard]] std::vector<std::string> CommandFor(
        const std::filesystem::path& script) const;

private:
    CatalogOptions options_;
};

} // namespace mcp_gateway
