#include "memory/TempFileSweeper.hpp"
#include "core/Log.hpp"

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace tether {

namespace {

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size()
        && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

TempFileSweeper::TempFileSweeper(std::string directory)
    : m_directory(std::move(directory)) {}

bool TempFileSweeper::isTransient(const std::string& filename) {
    return filename.rfind("tmp_", 0) == 0
        || endsWith(filename, ".tmp")
        || endsWith(filename, ".temp");
}

SweepResult TempFileSweeper::sweep() const {
    SweepResult result;
    if (m_directory.empty()) return result;

    std::error_code ec;
    if (!fs::is_directory(m_directory, ec)) {
        LOG_DEBUG("Temp sweep: '{}' is not a directory, skipping", m_directory);
        return result;
    }

    try {
        for (const auto& entry : fs::directory_iterator(m_directory)) {
            if (!entry.is_regular_file(ec)) continue;
            if (!isTransient(entry.path().filename().string())) continue;

            uint64_t size = entry.file_size(ec);
            if (ec) size = 0;

            if (fs::remove(entry.path(), ec)) {
                ++result.filesRemoved;
                result.bytesRemoved += size;
            } else {
                ++result.failures;
                LOG_WARN("Temp sweep: could not remove '{}': {}", entry.path().string(), ec.message());
            }
        }
    } catch (const fs::filesystem_error& e) {
        ++result.failures;
        LOG_WARN("Temp sweep of '{}' failed: {}", m_directory, e.what());
    }

    if (result.filesRemoved > 0) {
        LOG_DEBUG("Temp sweep: removed {} file(s) from '{}'", result.filesRemoved, m_directory);
    }
    return result;
}

} // namespace tether
