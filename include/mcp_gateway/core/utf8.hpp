#pragma once

#include <string>
#include <string_view>

namespace mcp_gateway {

/// Replace every invalid UTF-8 sequence (stray continuation bytes, truncated
/// or overlong multibyte sequences, surrogates, code points above U+10FFFF)
/// with U+FFFD. Valid input is returned unchanged.
std::string SanitizeUtf8(std::string_view text);

/// True if `text` is entirely valid UTF-8.
bool IsValidUtf8(std::string_view text);

} // namespace mcp_gateway
