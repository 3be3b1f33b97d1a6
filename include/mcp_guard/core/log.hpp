#pragma once

#include <nlohmann/json.hpp>

#include <iostream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>

namespace mcp_guard {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

// Abstract log sink - implementations decide where/how to write.
//
// WriteFields carries structured key/value context (security events,
// rate-limit rejections). Sinks that cannot render fields natively get
// them appended to the message.
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void Write(LogLevel level, std::string_view component,
                       std::string_view message) = 0;
    virtual void WriteFields(LogLevel level, std::string_view component,
                             std::string_view message,
                             const nlohmann::json& fields);
};

// Plain console sink, one line per message on stderr.
class ConsoleSink : public ILogSink {
public:
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
};

// Colored compact output. Falls back to the ConsoleSink format when
// use_color is false.
class ColorConsoleSink : public ILogSink {
public:
    explicit ColorConsoleSink(bool use_color, std::ostream& out = std::cerr);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    bool use_color_;
    std::ostream& out_;
};

// JSON lines - one object per message, fields merged at top level.
class JsonSink : public ILogSink {
public:
    explicit JsonSink(std::ostream& out);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
    void WriteFields(LogLevel level, std::string_view component,
                     std::string_view message,
                     const nlohmann::json& fields) override;
private:
    std::ostream& out_;
};

// Thread-safe logger that dispatches to a sink.
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink,
                    LogLevel min_level = LogLevel::Info);

    void SetLevel(LogLevel level);
    [[nodiscard]] bool Enabled(LogLevel level) const;

    void Debug(std::string_view component, std::string_view message);
    void Info(std::string_view component, std::string_view message);
    void Warn(std::string_view component, std::string_view message);
    void Error(std::string_view component, std::string_view message);

    void LogFields(LogLevel level, std::string_view component,
                   std::string_view message, const nlohmann::json& fields);

private:
    void Log(LogLevel level, std::string_view component,
             std::string_view message);

    std::unique_ptr<ILogSink> sink_;
    LogLevel min_level_;
    mutable std::mutex mutex_;
};

const char* LogLevelName(LogLevel level);

// ---------------------------------------------------------------------------
// Global logger - set once at startup, used by all components.
// ---------------------------------------------------------------------------

/// Initialize the global logger. Must be called before any logging.
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level);

/// Get the global logger. Returns a no-op logger if not initialized.
Logger& GlobalLogger();

void LogDebug(std::string_view component, std::string_view message);
void LogInfo(std::string_view component, std::string_view message);
void LogWarn(std::string_view component, std::string_view message);
void LogError(std::string_view component, std::string_view message);

/// True if stderr is attached to a terminal.
bool IsStderrTty();

/// True if NO_COLOR is set (https://no-color.org/).
bool NoColorEnvSet();

} // namespace mcp_guard
