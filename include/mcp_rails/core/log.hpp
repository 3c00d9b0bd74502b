#pragma once

#include <iostream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string_view>

namespace mcp_rails {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

// Where log lines go. Sinks must never write to stdout: stdout carries the
// JSON-RPC stream.
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void Write(LogLevel level, std::string_view component,
                       std::string_view message) = 0;
};

// Human-readable lines. Plain: "<iso8601> [LEVEL] [component] message".
// Colored: "HH:MM:SS LEVEL [component] message" with ANSI codes.
class ColorConsoleSink : public ILogSink {
public:
    explicit ColorConsoleSink(bool use_color, std::ostream& out = std::cerr);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    bool use_color_;
    std::ostream& out_;
};

// One JSON object per line: {"ts", "level", "component", "message"}.
class JsonSink : public ILogSink {
public:
    explicit JsonSink(std::ostream& out = std::cerr);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    std::ostream& out_;
};

class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink,
                    LogLevel min_level = LogLevel::Info);

    void Debug(std::string_view component, std::string_view message);
    void Info(std::string_view component, std::string_view message);
    void Warn(std::string_view component, std::string_view message);
    void Error(std::string_view component, std::string_view message);

private:
    void Log(LogLevel level, std::string_view component,
             std::string_view message);

    std::unique_ptr<ILogSink> sink_;
    LogLevel min_level_;
    std::mutex mutex_;
};

// ---------------------------------------------------------------------------
// Process-wide logger. Discards everything until InitGlobalLogger() runs.
// ---------------------------------------------------------------------------
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level);
Logger& GlobalLogger();

void LogDebug(std::string_view component, std::string_view message);
void LogInfo(std::string_view component, std::string_view message);
void LogWarn(std::string_view component, std::string_view message);
void LogError(std::string_view component, std::string_view message);

} // namespace mcp_rails
