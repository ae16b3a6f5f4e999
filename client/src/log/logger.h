#pragma once
#include <string>
#include <unordered_map>

namespace gme {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Process-wide entry point. Every call becomes a LogRecord routed through
// LogManager, so sinks (console, file, console dock) see the same stream.
class Logger {
public:
    using Fields = std::unordered_map<std::string, std::string>;

    static void debug(const std::string& msg, const std::string& source = "app");
    static void info(const std::string& msg, const std::string& source = "app");
    static void warn(const std::string& msg, const std::string& source = "app");
    static void error(const std::string& msg, const std::string& source = "app");

    static void write(LogLevel level, const std::string& source,
                      const std::string& msg, const Fields& fields = {});

    static std::string level_to_string(LogLevel level);
    static bool parse_level(const std::string& text, LogLevel& out);
};

} // namespace gme
