#include <mcp_gateway/gateway/server_catalog.hpp>

#include <mcp_gateway/core/log.hpp>
#include <mcp_gateway/core/types.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>

#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace mcp_gateway {

namespace {

Error MakeCatalogError(const std::string& operation, const std::string& target,
                       const std::string& message, ErrorCategory category) {
    return Error{operation, target, std::nullopt, message, std::nullopt, category};
}

// True if `path` equals `root` or lies beneath it. Both must be canonical.
bool IsWithin(const fs::path& root, const fs::path& path) {
    auto r = root.begin();
    auto p = path.begin();
    for (; r != root.end(); ++r, ++p) {
        if (r->empty()) continue;  // trailing separator
        if (p == path.end() || *p != *r) return false;
    }
    return true;
}

} // anonymous namespace

ServerCatalog::ServerCatalog(CatalogOptions options) : options_(std::move(options)) {}

bool ServerCatalog::RootExists() const {
    std::error_code ec;
    return fs::is_directory(options_.directory, ec);
}

std::vector<std::string> ServerCatalog::CommandFor(const fs::path& script) const {
    std::vector<std::string> argv = options_.interpreter;
    argv.push_back(script.string());
    return argv;
}

Result<std::vector<std::string>, Error> ServerCatalog::List() const {
    using R = Result<std::vector<std::string>, Error>;
    std::vector<std::string> names;
    if (!RootExists()) {
        return R::Ok(std::move(names));
    }

    std::error_code ec;
    fs::directory_iterator it(options_.directory, ec);
    if (ec) {
        return R::Err(MakeCatalogError("List", "",
                                       "cannot read " + options_.directory.string() +
                                           ": " + ec.message(),
                                       ErrorCategory::Io));
    }
    for (const auto& entry : it) {
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec)) continue;
        auto name = entry.path().filename().string();
        if (name.empty() || name.front() == '.') continue;
        if (!EndsWith(name, options_.extension)) continue;
        names.push_back(std::move(name));
    }
    std::sort(names.begin(), names.end());
    return R::Ok(std::move(names));
}

Result<ServerDescriptor, Error> ServerCatalog::Resolve(const std::string& name) const {
    using R = Result<ServerDescriptor, Error>;

    auto server = ServerName::WithExtension(name, options_.extension);
    if (server.IsErr()) {
        return R::Err(MakeCatalogError("Resolve", name, server.Error(),
                                       ErrorCategory::InvalidArgument));
    }
    const auto& file_name = server.Value().Value();

    std::error_code ec;
    const auto candidate = options_.directory / file_name;
    if (!fs::is_regular_file(candidate, ec)) {
        return R::Err(MakeCatalogError("Resolve", file_name,
                                       "MCP server file '" + file_name + "' not found",
                                       ErrorCategory::NotFound));
    }

    const auto root = fs::canonical(options_.directory, ec);
    if (ec) {
        return R::Err(MakeCatalogError("Resolve", file_name,
                                       "cannot resolve catalog root: " + ec.message(),
                                       ErrorCategory::Io));
    }
    const auto script = fs::canonical(candidate, ec);
    if (ec) {
        return R::Err(MakeCatalogError("Resolve", file_name,
                                       "cannot resolve server file: " + ec.message(),
                                       ErrorCategory::Io));
    }
    if (!IsWithin(root, script)) {
        return R::Err(MakeCatalogError("Resolve", file_name,
                                       "server file resolves outside the catalog root",
                                       ErrorCategory::InvalidArgument));
    }

    return R::Ok(ServerDescriptor{file_name, script, CommandFor(script)});
}

Result<UploadInfo, Error> ServerCatalog::Upload(const std::string& filename,
                                                const std::string& content) const {
    using R = Result<UploadInfo, Error>;

    if (!EndsWith(filename, options_.extension)) {
        return R::Err(MakeCatalogError("Upload", filename,
                                       "only " + options_.extension +
                                           " files are allowed",
                                       ErrorCategory::InvalidArgument));
    }
    auto server = ServerName::Create(filename);
    if (server.IsErr()) {
        return R::Err(MakeCatalogError("Upload", filename, server.Error(),
                                       ErrorCategory::InvalidArgument));
    }
    if (content.size() > options_.max_upload_bytes) {
        return R::Err(MakeCatalogError(
            "Upload", filename,
            "file exceeds the upload limit of " +
                std::to_string(options_.max_upload_bytes) + " bytes",
            ErrorCategory::InvalidArgument));
    }

    std::error_code ec;
    fs::create_directories(options_.directory, ec);
    if (ec) {
        return R::Err(MakeCatalogError("Upload", filename,
                                       "cannot create " + options_.directory.string() +
                                           ": " + ec.message(),
                                       ErrorCategory::Io));
    }

    const auto target = options_.directory / filename;
    // Concurrent uploads of one name each get their own hidden temp file;
    // the last rename wins.
    std::string temp_name = (options_.directory / ("." + filename + ".XXXXXX")).string();
    const int temp_fd = ::mkstemp(temp_name.data());
    if (temp_fd < 0) {
        return R::Err(MakeCatalogError("Upload", filename,
                                       "cannot create a temporary file in " +
                                           options_.directory.string() + ": " +
                                           std::strerror(errno),
                                       ErrorCategory::Io));
    }
    if (::fchmod(temp_fd, 0644) != 0) {
        LogWarn("catalog", "cannot set permissions on " + temp_name + ": " +
                               std::strerror(errno));
    }
    ::close(temp_fd);
    const fs::path temp(temp_name);
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            fs::remove(temp, ec);
            return R::Err(MakeCatalogError("Upload", filename,
                                           "cannot write " + temp.string(),
                                           ErrorCategory::Io));
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!out) {
            out.close();
            fs::remove(temp, ec);
            return R::Err(MakeCatalogError("Upload", filename,
                                           "short write to " + temp.string(),
                                           ErrorCategory::Io));
        }
    }

    if (options_.interpreter.empty()) {
        fs::permissions(temp,
                        fs::perms::owner_exec | fs::perms::group_exec |
                            fs::perms::others_exec,
                        fs::perm_options::add, ec);
        if (ec) {
            LogWarn("catalog", "cannot mark " + filename + " executable: " + ec.message());
        }
    }

    fs::rename(temp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp, ignored);
        return R::Err(MakeCatalogError("Upload", filename,
                                       "cannot store file: " + ec.message(),
                                       ErrorCategory::Io));
    }

    LogInfo("catalog", "stored " + filename + " (" + std::to_string(content.size()) +
                           " bytes)");
    return R::Ok(UploadInfo{filename, content.size(), target});
}

Result<void, Error> ServerCatalog::Remove(const std::string& name) const {
    auto resolved = Resolve(name);
    if (resolved.IsErr()) {
        auto error = std::move(resolved).Error();
        error.operation = "Remove";
        return Result<void, Error>::Err(std::move(error));
    }

    const auto& descriptor = resolved.Value();
    std::error_code ec;
    if (!fs::remove(options_.directory / descriptor.name, ec) || ec) {
        return Result<void, Error>::Err(MakeCatalogError(
            "Remove", descriptor.name,
            "cannot delete file" + (ec ? ": " + ec.message() : std::string()),
            ErrorCategory::Io));
    }
    LogInfo("catalog", "deleted " + descriptor.name);
    return Result<void, Error>::Ok();
}

} // namespace mcp_gateway
