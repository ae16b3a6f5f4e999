#pragma once
#include <string>
#include "log/log_record.h"

namespace gme {

// One record per line, e.g.
// 2026-10-19 12:00:01.204 [INFO] http msg="GET /projects -> 200" duration_ms=37 method=GET
class LogFormatter {
public:
    static LogFormatter& instance();

    std::string formatLine(const LogRecord& r) const;

private:
    LogFormatter() = default;

    static std::string formatTimestamp_(std::chrono::system_clock::time_point ts);
    static std::string escapeMsg_(const std::string& s);
};

} // namespace gme
