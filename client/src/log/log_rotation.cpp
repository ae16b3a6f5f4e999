#include "log/log_rotation.h"
#include <filesystem>

namespace fs = std::filesystem;

namespace gme {

LogRotation::LogRotation(RotationPolicy policy) : _p(policy) {}

bool LogRotation::shouldRotate(std::uint64_t currentSizeBytes, std::uint64_t addBytes) const {
    // a single oversized line still goes into an empty file
    if (_p.maxBytes == 0 || currentSizeBytes == 0) return false;
    return currentSizeBytes + addBytes > _p.maxBytes;
}

std::string LogRotation::backupName(const std::string& basePath, int index) {
    return basePath + "." + std::to_string(index);
}

bool LogRotation::move_(const std::string& from, const std::string& to) {
    std::error_code ec;
    fs::rename(from, to, ec);
    if (!ec) return true;

    // rename across file systems fails; fall back to copy + remove
    ec.clear();
    fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
    if (ec) return false;
    fs::remove(from, ec);
    return true;
}

bool LogRotation::rotate(const std::string& basePath) const {
    std::error_code ec;
    if (!fs::exists(basePath, ec)) return true;

    if (_p.maxFiles <= 0) {
        return fs::remove(basePath, ec);
    }

    fs::remove(backupName(basePath, _p.maxFiles), ec);
    for (int i = _p.maxFiles - 1; i >= 1; --i) {
        const std::string from = backupName(basePath, i);
        if (fs::exists(from, ec)) move_(from, backupName(basePath, i + 1));
    }
    return move_(basePath, backupName(basePath, 1));
}

} // namespace gme
