#include <mcp_gateway/core/log.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <sstream>

#include <unistd.h>

namespace mcp_gateway {

namespace {

constexpr const char* kReset = "\033[0m";
constexpr const char* kGrey = "\033[90m";

const char* LevelColor(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return kGrey;
        case LogLevel::Info:  return "\033[36m";
        case LogLevel::Warn:  return "\033[33m";
        case LogLevel::Error: return "\033[1;31m";
    }
    return kReset;
}

// Level names padded to five columns so messages line up.
std::string PaddedLevel(LogLevel level) {
    std::string name = LogLevelName(level);
    name.resize(5, ' ');
    return name;
}

// UTC with milliseconds: 2024-11-05T09:30:12.345Z
std::string UtcTimestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            now.time_since_epoch()).count() % 1000;

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << millis << 'Z';
    return oss.str();
}

std::string LocalClock() {
    const auto seconds = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%H:%M:%S");
    return oss.str();
}

void WritePlainLine(std::ostream& out, LogLevel level, std::string_view component,
                    std::string_view message) {
    out << UtcTimestamp() << " [" << LogLevelName(level) << "] [" << component << "] "
        << message << '\n';
}

class DiscardSink : public ILogSink {
public:
    void Write(LogLevel, std::string_view, std::string_view) override {}
};

std::unique_ptr<Logger>& GlobalLoggerSlot() {
    static auto logger =
        std::make_unique<Logger>(std::make_unique<DiscardSink>(), LogLevel::Error);
    return logger;
}

} // anonymous namespace

const char* LogLevelName(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "ERROR";
}

LogLevel ThresholdFor(LogLevel base, bool verbose, bool quiet) noexcept {
    if (quiet) return LogLevel::Error;
    if (verbose) return LogLevel::Debug;
    return base;
}

bool ConsoleSupportsColor() {
    return std::getenv("NO_COLOR") == nullptr && ::isatty(STDERR_FILENO) != 0;
}

// ---------------------------------------------------------------------------
// ColorConsoleSink
// ---------------------------------------------------------------------------
ColorConsoleSink::ColorConsoleSink(bool use_color, std::ostream& out)
    : use_color_(use_color), out_(out) {}

void ColorConsoleSink::Write(LogLevel level, std::string_view component,
                             std::string_view message) {
    if (!use_color_) {
        WritePlainLine(out_, level, component, message);
        return;
    }

    const char* color = LevelColor(level);
    out_ << kGrey << LocalClock() << kReset << ' '
         << color << PaddedLevel(level) << kReset << ' '
         << kGrey << '[' << component << ']' << kReset << ' ';
    // Errors are the lines an operator scans for; paint the whole message.
    if (level == LogLevel::Error) {
        out_ << color << message << kReset;
    } else {
        out_ << message;
    }
    out_ << '\n';
}

// ---------------------------------------------------------------------------
// JsonSink
// ---------------------------------------------------------------------------
JsonSink::JsonSink(std::ostream& out) : out_(out) {}

void JsonSink::Write(LogLevel level, std::string_view component,
                     std::string_view message) {
    nlohmann::json line = {
        {"ts", UtcTimestamp()},
        {"level", LogLevelName(level)},
        {"component", std::string(component)},
        {"message", std::string(message)},
        {"pid", static_cast<long>(::getpid())},
    };
    // Child stderr can contain anything; never let it break a log line.
    out_ << line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
}

// ---------------------------------------------------------------------------
// FileSink / TeeSink
// ---------------------------------------------------------------------------
FileSink::FileSink(const std::string& path) : file_(path, std::ios::out | std::ios::app) {}

void FileSink::Write(LogLevel level, std::string_view component,
                     std::string_view message) {
    if (!file_.is_open()) return;
    WritePlainLine(file_, level, component, message);
    file_.flush();
}

TeeSink::TeeSink(std::unique_ptr<ILogSink> first, std::unique_ptr<ILogSink> second)
    : first_(std::move(first)), second_(std::move(second)) {}

void TeeSink::Write(LogLevel level, std::string_view component,
                    std::string_view message) {
    if (first_) first_->Write(level, component, message);
    if (second_) second_->Write(level, component, message);
}

// ---------------------------------------------------------------------------
// Logger
// ---------------------------------------------------------------------------
Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel threshold)
    : sink_(std::move(sink)), threshold_(threshold) {}

void Logger::SetThreshold(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    threshold_ = level;
}

LogLevel Logger::Threshold() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return threshold_;
}

bool Logger::Enabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= threshold_;
}

void Logger::Log(LogLevel level, std::string_view component, std::string_view message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level >= threshold_ && sink_) {
        sink_->Write(level, component, message);
    }
}

// ---------------------------------------------------------------------------
// Global logger
// ---------------------------------------------------------------------------
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel threshold) {
    GlobalLoggerSlot() = std::make_unique<Logger>(std::move(sink), threshold);
}

Logger& GlobalLogger() {
    return *GlobalLoggerSlot();
}

void LogDebug(std::string_view component, std::string_view message) {
    GlobalLogger().Log(LogLevel::Debug, component, message);
}

void LogInfo(std::string_view component, std::string_view message) {
    GlobalLogger().Log(LogLevel::Info, component, message);
}

void LogWarn(std::string_view component, std::string_view message) {
    GlobalLogger().Log(LogLevel::Warn, component, message);
}

void LogError(std::string_view component, std::string_view message) {
    GlobalLogger().Log(LogLevel::Error, component, message);
}

} // namespace mcp_gateway
