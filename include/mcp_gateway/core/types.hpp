#pragma once

#include <mcp_gateway/core/result.hpp>

#include <string>
#include <string_view>

namespace mcp_gateway {

// File name of one tool-server script inside the catalog root. Non-empty,
// at most 255 bytes, no "..", '/', '\\' or NUL, and no leading '.'.
class ServerName {
public:
    static Result<ServerName, std::string> Create(std::string_view name);

    /// Same as Create, then appends `extension` unless the name already ends with it.
    static Result<ServerName, std::string> WithExtension(std::string_view name,
                                                         std::string_view extension);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const ServerName& other) const { return value_ == other.value_; }
    bool operator!=(const ServerName& other) const { return value_ != other.value_; }

private:
    explicit ServerName(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

/// True if `text` ends with `suffix`.
bool EndsWith(std::string_view text, std::string_view suffix);

} // namespace mcp_gateway
