#pragma once

#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>

namespace mcp_gateway {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

const char* LogLevelName(LogLevel level) noexcept;

/// Threshold for a command: `base`, lowered to Debug by --verbose or raised
/// to Error by --quiet.
LogLevel ThresholdFor(LogLevel base, bool verbose, bool quiet) noexcept;

/// stderr is a terminal and NO_COLOR (https://no-color.org/) is unset.
bool ConsoleSupportsColor();

// Where log lines end up. Sinks are called under the Logger's mutex.
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void Write(LogLevel level, std::string_view component,
                       std::string_view message) = 0;
};

// Human-readable lines on a console stream. With color: "HH:MM:SS LEVEL
// [component] message"; without: the timestamped plain format FileSink uses.
class ColorConsoleSink : public ILogSink {
public:
    explicit ColorConsoleSink(bool use_color, std::ostream& out = std::cerr);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    bool use_color_;
    std::ostream& out_;
};

// One JSON object per line: {"component","level","message","pid","ts"}.
class JsonSink : public ILogSink {
public:
    explicit JsonSink(std::ostream& out);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    std::ostream& out_;
};

// Appends plain lines to a file, flushing after each one so the log
// survives a crash of the gateway.
class FileSink : public ILogSink {
public:
    explicit FileSink(const std::string& path);
    [[nodiscard]] bool IsOpen() const { return file_.is_open(); }
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    std::ofstream file_;
};

// Console plus --log-file.
class TeeSink : public ILogSink {
public:
    TeeSink(std::unique_ptr<ILogSink> first, std::unique_ptr<ILogSink> second);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    std::unique_ptr<ILogSink> first_;
    std::unique_ptr<ILogSink> second_;
};

// Gateway operations log from HTTP worker threads, so every write goes
// through one mutex.
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink,
                    LogLevel threshold = LogLevel::Info);

    void SetThreshold(LogLevel level);
    [[nodiscard]] LogLevel Threshold() const;
    [[nodiscard]] bool Enabled(LogLevel level) const;

    void Log(LogLevel level, std::string_view component, std::string_view message);

private:
    std::unique_ptr<ILogSink> sink_;
    LogLevel threshold_;
    mutable std::mutex mutex_;
};

// ---------------------------------------------------------------------------
// Global logger: installed once by main(), used by every component.
// ---------------------------------------------------------------------------

/// Replace the global logger. Until the first call only errors are kept,
/// and those are discarded.
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel threshold);

Logger& GlobalLogger();

void LogDebug(std::string_view component, std::string_view message);
void LogInfo(std::string_view component, std::string_view message);
void LogWarn(std::string_view component, std::string_view message);
void LogError(std::string_view component, std::string_view message);

} // namespace mcp_gateway
