#include "log/log_formatter.h"
#include <ctime>
#include <iomanip>
#include <map>
#include <sstream>

namespace gme {

LogFormatter& LogFormatter::instance() {
    static LogFormatter f;
    return f;
}

std::string LogFormatter::formatTimestamp_(std::chrono::system_clock::time_point ts) {
    const auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(ts);
    const std::time_t tt = std::chrono::system_clock::to_time_t(seconds);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()) % 1000;

    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    ss << "." << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

std::string LogFormatter::escapeMsg_(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '\n') out += "\\n";
        else if (c == '\r') out += "\\r";
        else if (c == '\t') out += "\\t";
        else if (c == '"')  out += "\\\"";
        else out += c;
    }
    return out;
}

std::string LogFormatter::formatLine(const LogRecord& r) const {
    std::ostringstream oss;

    oss << formatTimestamp_(r.ts)
        << " [" << Logger::level_to_string(r.level) << "]"
        << " " << (r.source.empty() ? "app" : r.source)
        << " msg=\"" << escapeMsg_(r.message) << "\"";

    if (r.durationMs > 0) oss << " duration_ms=" << r.durationMs;

    // sorted so identical records always render identically
    const std::map<std::string, std::string> sorted(r.fields.begin(), r.fields.end());
    for (const auto& kv : sorted) {
        oss << " " << kv.first << "=" << escapeMsg_(kv.second);
    }

    return oss.str();
}

} // namespace gme
