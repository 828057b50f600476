#include <mcp_gateway/core/types.hpp>

namespace mcp_gateway {

namespace {

constexpr size_t kMaxServerNameLength = 255;

} // anonymous namespace

bool EndsWith(std::string_view text, std::string_view suffix) {
    return text.size() >= suffix.size() &&
           text.substr(text.size() - suffix.size()) == suffix;
}

// ---------------------------------------------------------------------------
// ServerName
// ---------------------------------------------------------------------------
Result<ServerName, std::string> ServerName::Create(std::string_view name) {
    if (name.empty()) {
        return Result<ServerName, std::string>::Err("Server name must not be empty");
    }
    if (name.size() > kMaxServerNameLength) {
        return Result<ServerName, std::string>::Err(
            "Server name must be at most 255 bytes, got " +
            std::to_string(name.size()));
    }
    if (name.find("..") != std::string_view::npos) {
        return Result<ServerName, std::string>::Err(
            "Server name must not contain '..'");
    }
    if (name.find('/') != std::string_view::npos ||
        name.find('\\') != std::string_view::npos) {
        return Result<ServerName, std::string>::Err(
            "Server name must not contain path separators");
    }
    if (name.find('\0') != std::string_view::npos) {
        return Result<ServerName, std::string>::Err(
            "Server name must not contain NUL bytes");
    }
    if (name.front() == '.') {
        return Result<ServerName, std::string>::Err(
            "Server name must not start with '.'");
    }
    return Result<ServerName, std::string>::Ok(ServerName(std::string(name)));
}

Result<ServerName, std::string> ServerName::WithExtension(std::string_view name,
                                                          std::string_view extension) {
    if (extension.empty() || EndsWith(name, extension)) {
        return Create(name);
    }
    std::string full(name);
    full += extension;
    return Create(full);
}

} // namespace mcp_gateway
