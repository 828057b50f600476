#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace mcp_gateway {

// ---------------------------------------------------------------------------
// ServerDescriptor: a resolved, validated reference to one tool server.
//
// Produced by ServerCatalog::Resolve (or built directly by callers that
// already know the command line). `argv[0]` is the program to execute; it is
// either the configured interpreter or the script itself.
// ---------------------------------------------------------------------------
struct ServerDescriptor {
    std::string name;
    std::filesystem::path script_path;
    std::vector<std::string> argv;
};

} // namespace mcp_gateway
