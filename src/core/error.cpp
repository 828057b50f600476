#include <mcp_gateway/core/error.hpp>

#include <nlohmann/json.hpp>

#include <sstream>

namespace mcp_gateway {

const char* CategoryName(ErrorCategory category) noexcept {
    switch (category) {
        case ErrorCategory::Spawn:             return "spawn";
        case ErrorCategory::Handshake:         return "handshake";
        case ErrorCategory::NoResponse:        return "no_response";
        case ErrorCategory::MalformedResponse: return "malformed_response";
        case ErrorCategory::Timeout:           return "timeout";
        case ErrorCategory::Io:                return "io";
        case ErrorCategory::Rpc:               return "rpc";
        case ErrorCategory::NotFound:          return "not_found";
        case ErrorCategory::InvalidArgument:   return "invalid_argument";
        case ErrorCategory::Config:            return "config";
        case ErrorCategory::Internal:          return "internal";
    }
    return "internal";
}

bool IsTransportCategory(ErrorCategory category) noexcept {
    switch (category) {
        case ErrorCategory::NoResponse:
        case ErrorCategory::MalformedResponse:
        case ErrorCategory::Timeout:
        case ErrorCategory::Io:
            return true;
        default:
            return false;
    }
}

bool Error::IsTransport() const noexcept {
    if (IsTransportCategory(category)) {
        return true;
    }
    return category == ErrorCategory::Handshake && cause.has_value() &&
           IsTransportCategory(*cause);
}

int Error::ExitCode() const noexcept {
    switch (category) {
        case ErrorCategory::Spawn:             return 2;
        case ErrorCategory::Handshake:         return 3;
        case ErrorCategory::NoResponse:        return 4;
        case ErrorCategory::MalformedResponse: return 4;
        case ErrorCategory::Rpc:               return 5;
        case ErrorCategory::NotFound:          return 6;
        case ErrorCategory::InvalidArgument:   return 7;
        case ErrorCategory::Timeout:           return 8;
        case ErrorCategory::Config:            return 9;
        case ErrorCategory::Io:                return 10;
        case ErrorCategory::Internal:          return 99;
    }
    return 99;
}

int Error::HttpStatus() const noexcept {
    switch (category) {
        case ErrorCategory::InvalidArgument: return 400;
        case ErrorCategory::NotFound:        return 404;
        case ErrorCategory::Timeout:         return 504;
        case ErrorCategory::Handshake:
            return cause == ErrorCategory::Timeout ? 504 : 500;
        default:
            return 500;
    }
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation;
    if (!target.empty()) {
        oss << " [" << target << "]";
    }
    if (rpc_code.has_value()) {
        oss << " (code " << *rpc_code << ")";
    }
    oss << ": " << message;
    if (cause.has_value()) {
        oss << " (cause: " << mcp_gateway::CategoryName(*cause) << ")";
    }
    if (stderr_tail.has_value() && !stderr_tail->empty()) {
        oss << "; stderr: " << *stderr_tail;
    }
    return oss.str();
}

std::string Error::ToJson() const {
    nlohmann::json j;
    j["category"] = CategoryName();
    j["operation"] = operation;
    if (!target.empty()) {
        j["target"] = target;
    }
    if (rpc_code.has_value()) {
        j["rpc_code"] = *rpc_code;
    }
    j["message"] = message;
    if (cause.has_value()) {
        j["cause"] = mcp_gateway::CategoryName(*cause);
    }
    if (stderr_tail.has_value() && !stderr_tail->empty()) {
        j["stderr"] = *stderr_tail;
    }
    j["exit_code"] = ExitCode();
    return nlohmann::json{{"error", j}}.dump(-1, ' ', false,
                                             nlohmann::json::error_handler_t::replace);
}

bool Error::operator==(const Error& other) const {
    return category == other.category && cause == other.cause &&
           rpc_code == other.rpc_code && operation == other.operation &&
           target == other.target && message == other.message &&
           stderr_tail == other.stderr_tail;
}

} // namespace mcp_gateway
