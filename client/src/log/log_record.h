#pragma once
#include <string>
#include <unordered_map>
#include <chrono>
#include <cstdint>
#include "log/logger.h"

namespace gme {

struct LogRecord {
    LogLevel level{LogLevel::Info};
    std::string source;                    // http / session / nav / ui / qt ...
    std::string message;

    std::chrono::system_clock::time_point ts{std::chrono::system_clock::now()};
    std::int64_t durationMs{0};            // optional: request round trip

    std::unordered_map<std::string, std::string> fields;

    // assigned by LogManager, strictly increasing
    std::uint64_t seq{0};
};

inline std::int64_t toEpochMs(std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;
    return duration_cast<milliseconds>(tp.time_since_epoch()).count();
}

} // namespace gme
