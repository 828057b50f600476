#include <mcp_gateway/rpc/transport_framer.hpp>

#include <mcp_gateway/core/log.hpp>
#include <mcp_gateway/core/utf8.hpp>

#include <algorithm>

namespace mcp_gateway {

namespace {

constexpr size_t kMaxRawExcerpt = 512;

bool IsBlank(const std::string& line) {
    return std::all_of(line.begin(), line.end(), [](unsigned char c) {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n';
    });
}

std::string Excerpt(const std::string& line) {
    if (line.size() <= kMaxRawExcerpt) {
        return line;
    }
    return line.substr(0, kMaxRawExcerpt) + "...";
}

Error MakeMalformed(const std::string& detail, const std::string& raw) {
    return Error{"ReadMessage", "", std::nullopt,
                 detail + "; raw: " + Excerpt(raw), std::nullopt,
                 ErrorCategory::MalformedResponse};
}

} // anonymous namespace

std::string EncodeMessage(const RpcMessage& message) {
    // dump() without indentation never emits a raw newline, so one message
    // is always exactly one line.
    return ToJson(message).dump(-1, ' ', false,
                                nlohmann::json::error_handler_t::replace);
}

Result<RpcMessage, Error> DecodeMessage(const std::string& line) {
    nlohmann::json value;
    try {
        value = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& e) {
        return Result<RpcMessage, Error>::Err(
            MakeMalformed(std::string("JSON parse error: ") + e.what(), line));
    }

    auto message = FromJson(value);
    if (message.IsErr()) {
        return Result<RpcMessage, Error>::Err(
            MakeMalformed("not a JSON-RPC message: " + message.Error(), line));
    }
    return Result<RpcMessage, Error>::Ok(std::move(message).Value());
}

Result<void, Error> WriteMessage(ILineChannel& channel, const RpcMessage& message) {
    auto line = EncodeMessage(message);
    LogDebug("framer", "-> " + line);
    return channel.WriteLine(line);
}

Result<ReadOutcome, Error> ReadMessage(ILineChannel& channel,
                                       std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    for (;;) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() < 0) {
            remaining = std::chrono::milliseconds{0};
        }

        auto line = channel.ReadLine(remaining);
        if (line.IsErr()) {
            return Result<ReadOutcome, Error>::Err(std::move(line).Error());
        }
        auto maybe_line = std::move(line).Value();
        if (!maybe_line.has_value()) {
            return Result<ReadOutcome, Error>::Ok(EndOfStream{});
        }

        auto text = SanitizeUtf8(*maybe_line);
        if (IsBlank(text)) {
            continue;
        }
        LogDebug("framer", "<- " + Excerpt(text));

        auto message = DecodeMessage(text);
        if (message.IsErr()) {
            return Result<ReadOutcome, Error>::Err(std::move(message).Error());
        }
        return Result<ReadOutcome, Error>::Ok(std::move(message).Value());
    }
}

} // namespace mcp_gateway
