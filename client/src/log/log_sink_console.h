#pragma once
#include "log/log_sink.h"

namespace gme {

class ConsoleLogSink : public ILogSink {
public:
    void consume(const LogRecord& rec) override;
};

} // namespace gme
