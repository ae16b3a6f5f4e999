#pragma once
#include <memory>
#include <vector>
#include <mutex>
#include <cstdint>
#include <cstddef>

#include "log/log_record.h"
#include "log/log_sink.h"

namespace gme {

// Fan-out point for all log records. Sinks are snapshotted under the lock and
// consumed outside it, so a slow sink never blocks another emitter.
class LogManager {
public:
    static LogManager& instance();

    void publish(const LogRecord& rec);

    void setMinLevel(LogLevel level);
    LogLevel minLevel() const;

    void addSink(std::shared_ptr<ILogSink> sink);
    void removeSink(const std::shared_ptr<ILogSink>& sink);
    void clearSinks();

    // Records published while no sink exists (configuration warnings at
    // startup) are held and replayed to every sink added, until released.
    void releaseEarlyRecords();

    static constexpr std::size_t kMaxEarlyRecords = 256;

private:
    LogManager() = default;

private:
    mutable std::mutex _mu;
    std::vector<std::shared_ptr<ILogSink>> _sinks;
    LogLevel _minLevel{LogLevel::Info};
    std::uint64_t _nextSeq{1};
    std::vector<LogRecord> _early;
    bool _holdEarly{true};
};

} // namespace gme
