#pragma once

#include <string>

namespace txproof {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Log writes timestamped single-line records to stderr.
// Lines from concurrent workers are serialized so they never interleave.
class Log {
public:
    static void set_level(LogLevel level);
    static LogLevel level();

    // Parses "debug", "info", "warn" or "error"
    static LogLevel parse_level(const std::string& name);

    static void debug(const std::string& message) { write(LogLevel::Debug, message); }
    static void info(const std::string& message) { write(LogLevel::Info, message); }
    static void warn(const std::string& message) { write(LogLevel::Warn, message); }
    static void error(const std::string& message) { write(LogLevel::Error, message); }

private:
    Log() = delete;

    static void write(LogLevel level, const std::string& message);
};

} // namespace txproof
