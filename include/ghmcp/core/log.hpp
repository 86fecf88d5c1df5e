#pragma once

#include <iostream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ghmcp {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

// Ordered key/value attributes attached to a log record.
using LogFields = std::vector<std::pair<std::string, std::string>>;

// Abstract log sink: implementations decide where/how to write.
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void Write(LogLevel level, std::string_view component,
                       std::string_view message, const LogFields& fields) = 0;
};

// Console sink: human-readable key=value lines, stderr by default.
class ConsoleSink : public ILogSink {
public:
    explicit ConsoleSink(std::ostream& out = std::cerr);
    void Write(LogLevel level, std::string_view component,
               std::string_view message, const LogFields& fields) override;
private:
    std::ostream& out_;
};

// Color console sink: colored, compact output to a stream.
// When use_color is false, falls back to the same format as ConsoleSink.
class ColorConsoleSink : public ILogSink {
public:
    explicit ColorConsoleSink(bool use_color, std::ostream& out = std::cerr);
    void Write(LogLevel level, std::string_view component,
               std::string_view message, const LogFields& fields) override;
private:
    bool use_color_;
    std::ostream& out_;
};

// JSON sink: machine-readable JSON lines to a stream. Fields become
// top-level string members of the record.
class JsonSink : public ILogSink {
public:
    explicit JsonSink(std::ostream& out);
    void Write(LogLevel level, std::string_view component,
               std::string_view message, const LogFields& fields) override;
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

    void Debug(std::string_view component, std::string_view message,
               const LogFields& fields = {});
    void Info(std::string_view component, std::string_view message,
              const LogFields& fields = {});
    void Warn(std::string_view component, std::string_view message,
              const LogFields& fields = {});
    void Error(std::string_view component, std::string_view message,
               const LogFields& fields = {});

private:
    void Log(LogLevel level, std::string_view component,
             std::string_view message, const LogFields& fields);

    std::unique_ptr<ILogSink> sink_;
    LogLevel min_level_;
    mutable std::mutex mutex_;
};

/// Parse "debug", "info", "warn"/"warning", "error" (case-insensitive).
/// Returns false and leaves `out` untouched for anything else.
bool ParseLogLevel(std::string_view text, LogLevel& out);

// ---------------------------------------------------------------------------
// Global logger: set once at startup, used by all components.
// ---------------------------------------------------------------------------

/// Initialize the global logger. Must be called before any logging.
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level);

/// Get the global logger. Returns a no-op logger if not initialized.
Logger& GlobalLogger();

/// Convenience free functions that forward to GlobalLogger().
void LogDebug(std::string_view component, std::string_view message,
              const LogFields& fields = {});
void LogInfo(std::string_view component, std::string_view message,
             const LogFields& fields = {});
void LogWarn(std::string_view component, std::string_view message,
             const LogFields& fields = {});
void LogError(std::string_view component, std::string_view message,
              const LogFields& fields = {});

} // namespace ghmcp
