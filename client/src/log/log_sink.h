#pragma once
#include "log/log_record.h"

namespace gme {

class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void consume(const LogRecord& rec) = 0;
};

} // namespace gme
