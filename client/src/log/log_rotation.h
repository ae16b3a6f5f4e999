#pragma once
#include <cstdint>
#include <string>

namespace gme {

// Size based rotation with numbered backups:
//   gme-client.log     current file
//   gme-client.log.1   newest backup
//   gme-client.log.N   oldest backup, N == maxFiles
// Rotating shifts every backup up by one and drops whatever falls off the end.
struct RotationPolicy {
    std::uint64_t maxBytes = 5 * 1024 * 1024;
    int maxFiles = 3;
};

class LogRotation {
public:
    explicit LogRotation(RotationPolicy policy);

    bool shouldRotate(std::uint64_t currentSizeBytes, std::uint64_t addBytes) const;

    // false when the current file could not be moved aside
    bool rotate(const std::string& basePath) const;

    static std::string backupName(const std::string& basePath, int index);

private:
    static bool move_(const std::string& from, const std::string& to);

    RotationPolicy _p;
};

} // namespace gme
