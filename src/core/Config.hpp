#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace tether {

/// Runtime tuning as a JSON document, addressed with dot-separated paths
/// ("memory.leak.threshold_seconds").
///
/// Reads never fail: a path that is absent or holds the wrong JSON type
/// yields the caller's default.  Loads and merges are all-or-nothing; on
/// failure the document is untouched and lastError() says why.
class Config {
public:
    bool loadFromFile(const std::string& path);
    bool loadFromString(const std::string& jsonStr);

    /// Lay the file's document over the current one.  Nested objects are
    /// merged key by key; any other value (arrays included) replaces the
    /// existing one.
    bool mergeFromFile(const std::string& path);

    std::string getString(const std::string& key, const std::string& defaultVal = "") const;
    int         getInt(const std::string& key, int defaultVal = 0) const;
    int64_t     getInt64(const std::string& key, int64_t defaultVal = 0) const;
    /// Integers are accepted too.
    double      getDouble(const std::string& key, double defaultVal = 0.0) const;
    bool        getBool(const std::string& key, bool defaultVal = false) const;

    /// String elements of an array; other elements are dropped.
    std::vector<std::string> getStringList(const std::string& key,
                                           const std::vector<std::string>& defaultVal = {}) const;

    bool hasKey(const std::string& key) const;

    /// Reason the last load or merge failed; empty after a success.
    const std::string& lastError() const { return m_lastError; }

    const nlohmann::json& raw() const { return m_data; }

private:
    bool parseFile(const std::string& path, nlohmann::json& out);
    bool parseText(const std::string& text, nlohmann::json& out);

    const nlohmann::json* find(const std::string& key) const;

    static void overlay(nlohmann::json& target, const nlohmann::json& source);

    nlohmann::json m_data = nlohmann::json::object();
    std::string m_lastError;
};

} // namespace tether
