#include "log/logger.h"
#include <algorithm>
#include <cctype>
#include <iostream>
#include "log/log_manager.h"
#include "log/log_record.h"

namespace gme {

void Logger::debug(const std::string& msg, const std::string& source) {
    write(LogLevel::Debug, source, msg);
}

void Logger::info(const std::string& msg, const std::string& source) {
    write(LogLevel::Info, source, msg);
}

void Logger::warn(const std::string& msg, const std::string& source) {
    write(LogLevel::Warn, source, msg);
}

void Logger::error(const std::string& msg, const std::string& source) {
    write(LogLevel::Error, source, msg);
}

void Logger::write(LogLevel level, const std::string& source,
                   const std::string& msg, const Fields& fields) {
    LogRecord rec;
    rec.level = level;
    rec.source = source;
    rec.message = msg;
    rec.ts = std::chrono::system_clock::now();
    rec.fields = fields;

    try {
        LogManager::instance().publish(rec);
    } catch (const std::exception& ex) {
        // a broken sink must not take the UI down; fall back to stderr
        std::cerr << "[" << level_to_string(level) << "] " << msg
                  << " (log pipeline failed: " << ex.what() << ")" << std::endl;
    }
}

std::string Logger::level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        default: return "UNK";
    }
}

bool Logger::parse_level(const std::string& text, LogLevel& out) {
    std::string v = text;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "debug") { out = LogLevel::Debug; return true; }
    if (v == "info")  { out = LogLevel::Info;  return true; }
    if (v == "warn" || v == "warning") { out = LogLevel::Warn; return true; }
    if (v == "error") { out = LogLevel::Error; return true; }
    return false;
}

} // namespace gme
