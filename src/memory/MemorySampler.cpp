#include "memory/MemorySampler.hpp"
#include "core/Log.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

namespace tether {

namespace {

std::string readWholeFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return {};
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

} // namespace

ProcMemorySampler::ProcMemorySampler(std::string meminfoPath, std::string statusPath)
    : m_meminfoPath(std::move(meminfoPath))
    , m_statusPath(std::move(statusPath)) {}

std::optional<uint64_t> ProcMemorySampler::readKbField(const std::string& content,
                                                        const std::string& key) {
    std::stringstream ss(content);
    std::string line;
    const std::string wanted = key + ":";
    while (std::getline(ss, line)) {
        std::string name;
        uint64_t value = 0;
        std::stringstream lineStream(line);
        lineStream >> name >> value;
        if (name == wanted && !lineStream.fail()) {
            return value * 1024;
        }
    }
    return std::nullopt;
}

std::optional<RawMemorySample> ProcMemorySampler::sample() {
    std::string meminfo = readWholeFile(m_meminfoPath);
    if (meminfo.empty()) {
        LOG_WARN("Cannot read {}", m_meminfoPath);
        return std::nullopt;
    }

    auto total = readKbField(meminfo, "MemTotal");
    auto available = readKbField(meminfo, "MemAvailable");
    if (!available) available = readKbField(meminfo, "MemFree");
    if (!total || *total == 0 || !available) {
        LOG_WARN("{} is missing MemTotal/MemAvailable", m_meminfoPath);
        return std::nullopt;
    }

    RawMemorySample raw;
    raw.totalMemory = *total;
    raw.freeMemory = std::min(*available, *total);
    raw.usedMemory = raw.totalMemory - raw.freeMemory;

    std::string status = readWholeFile(m_statusPath);
    if (auto rss = readKbField(status, "VmRSS")) {
        raw.appMemoryUsage = *rss;
    }
    return raw;
}

} // namespace tether
