#pragma once

#include <cstdint>
#include <string>

namespace tether {

struct SweepResult {
    size_t filesRemoved = 0;
    uint64_t bytesRemoved = 0;
    size_t failures = 0;
};

/// Deletes transient files (`tmp_*`, `*.tmp`, `*.temp`) from one directory.
/// Subdirectories are left alone.
class TempFileSweeper {
public:
    explicit TempFileSweeper(std::string directory = "");

    /// Remove matching regular files.  A missing or empty directory is not
    /// an error; individual failures are logged and counted.
    SweepResult sweep() const;

    /// Whether `filename` (no directory part) looks transient.
    static bool isTransient(const std::string& filename);

    void setDirectory(std::string directory) { m_directory = std::move(directory); }
    const std::string& directory() const { return m_directory; }

private:
    std::string m_directory;
};

} // namespace tether
