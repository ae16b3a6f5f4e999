#include "log/log_sink_file.h"
#include <filesystem>
#include <iostream>
#include "log/log_formatter.h"

namespace fs = std::filesystem;

namespace gme {

FileLogSink::FileLogSink(Options opt)
    : _opt(std::move(opt)),
      _rotation(RotationPolicy{_opt.rotateBytes, _opt.maxFiles}) {}

bool FileLogSink::open_() {
    std::error_code ec;
    const fs::path parent = fs::path(_opt.path).parent_path();
    if (!parent.empty()) fs::create_directories(parent, ec);

    _ofs.open(_opt.path, std::ios::app);
    if (!_ofs.is_open()) return false;

    const auto existing = fs::file_size(_opt.path, ec);
    _size = ec ? 0 : static_cast<std::uint64_t>(existing);
    return true;
}

void FileLogSink::consume(const LogRecord& rec) {
    std::lock_guard<std::mutex> lk(_mu);
    if (_opt.path.empty() || _failed) return;

    if (!_ofs.is_open() && !open_()) {
        // reported once; the console sink keeps working
        _failed = true;
        std::cerr << "log file " << _opt.path << " cannot be opened, file logging disabled" << std::endl;
        return;
    }

    const std::string line = LogFormatter::instance().formatLine(rec) + "\n";
    if (_rotation.shouldRotate(_size, line.size())) {
        _ofs.close();
        if (!_rotation.rotate(_opt.path)) {
            std::cerr << "log file " << _opt.path << " could not be rotated" << std::endl;
        }
        if (!open_()) {
            _failed = true;
            std::cerr << "log file " << _opt.path << " cannot be reopened, file logging disabled" << std::endl;
            return;
        }
    }

    _ofs << line;
    _size += line.size();
    if (_opt.flushEachLine) _ofs.flush();
}

} // namespace gme
