#include "log/log_manager.h"
#include <algorithm>

namespace gme {

LogManager& LogManager::instance() {
    static LogManager g;
    return g;
}

void LogManager::publish(const LogRecord& rec) {
    LogRecord stored;
    std::vector<std::shared_ptr<ILogSink>> sinksSnapshot;

    {
        std::lock_guard<std::mutex> lk(_mu);
        if (rec.level < _minLevel) return;
        stored = rec;
        stored.seq = _nextSeq++;
        sinksSnapshot = _sinks;
        if (_sinks.empty() && _holdEarly && _early.size() < kMaxEarlyRecords) {
            _early.push_back(stored);
        }
    }

    for (auto& s : sinksSnapshot) {
        if (s) s->consume(stored);
    }
}

void LogManager::setMinLevel(LogLevel level) {
    std::lock_guard<std::mutex> lk(_mu);
    _minLevel = level;
}

LogLevel LogManager::minLevel() const {
    std::lock_guard<std::mutex> lk(_mu);
    return _minLevel;
}

void LogManager::addSink(std::shared_ptr<ILogSink> sink) {
    if (!sink) return;
    std::vector<LogRecord> replay;
    {
        std::lock_guard<std::mutex> lk(_mu);
        _sinks.push_back(sink);
        replay = _early;
    }
    for (const auto& rec : replay) sink->consume(rec);
}

void LogManager::releaseEarlyRecords() {
    std::lock_guard<std::mutex> lk(_mu);
    _holdEarly = false;
    _early.clear();
    _early.shrink_to_fit();
}

void LogManager::removeSink(const std::shared_ptr<ILogSink>& sink) {
    std::lock_guard<std::mutex> lk(_mu);
    _sinks.erase(std::remove(_sinks.begin(), _sinks.end(), sink), _sinks.end());
}

void LogManager::clearSinks() {
    std::lock_guard<std::mutex> lk(_mu);
    _sinks.clear();
}

} // namespace gme
