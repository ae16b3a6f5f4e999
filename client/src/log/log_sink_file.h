#pragma once
#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>
#include "log/log_rotation.h"
#include "log/log_sink.h"

namespace gme {

// Appends formatted lines to one file and rotates it by size. The parent
// directory is created on first write.
class FileLogSink : public ILogSink {
public:
    struct Options {
        std::string path = "./logs/gme-client.log";
        std::uint64_t rotateBytes = 5 * 1024 * 1024;
        int maxFiles = 3;
        bool flushEachLine = true;
    };

    explicit FileLogSink(Options opt);

    void consume(const LogRecord& rec) override;

    const std::string& path() const { return _opt.path; }

private:
    bool open_();

private:
    Options _opt;
    LogRotation _rotation;
    std::ofstream _ofs;
    std::uint64_t _size = 0;
    bool _failed = false;
    std::mutex _mu;
};

} // namespace gme
