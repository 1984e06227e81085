#include "core/Config.hpp"

#include <fstream>
#include <iterator>

namespace tether {

// --- Loading ---

bool Config::parseText(const std::string& text, nlohmann::json& out) {
    try {
        out = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        m_lastError = e.what();
        return false;
    }
    m_lastError.clear();
    return true;
}

bool Config::parseFile(const std::string& path, nlohmann::json& out) {
    std::ifstream in(path);
    if (!in) {
        m_lastError = "cannot open '" + path + "'";
        return false;
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return parseText(text, out);
}

bool Config::loadFromFile(const std::string& path) {
    nlohmann::json parsed;
    if (!parseFile(path, parsed)) return false;
    m_data = std::move(parsed);
    return true;
}

bool Config::loadFromString(const std::string& jsonStr) {
    nlohmann::json parsed;
    if (!parseText(jsonStr, parsed)) return false;
    m_data = std::move(parsed);
    return true;
}

bool Config::mergeFromFile(const std::string& path) {
    nlohmann::json layer;
    if (!parseFile(path, layer)) return false;

    nlohmann::json result = m_data;
    overlay(result, layer);
    m_data = std::move(result);
    return true;
}

void Config::overlay(nlohmann::json& target, const nlohmann::json& source) {
    if (!source.is_object() || !target.is_object()) {
        target = source;
        return;
    }
    for (const auto& item : source.items()) {
        auto existing = target.find(item.key());
        if (existing != target.end() && existing->is_object() && item.value().is_object()) {
            overlay(*existing, item.value());
        } else {
            target[item.key()] = item.value();
        }
    }
}

// --- Lookup ---

const nlohmann::json* Config::find(const std::string& key) const {
    const nlohmann::json* node = &m_data;
    size_t start = 0;
    while (start <= key.size()) {
        size_t dot = key.find('.', start);
        if (dot == std::string::npos) dot = key.size();

        if (!node->is_object()) return nullptr;
        auto it = node->find(key.substr(start, dot - start));
        if (it == node->end()) return nullptr;
        node = &*it;
        start = dot + 1;
    }
    return node;
}

bool Config::hasKey(const std::string& key) const {
    return find(key) != nullptr;
}

std::string Config::getString(const std::string& key, const std::string& defaultVal) const {
    const auto* node = find(key);
    return node && node->is_string() ? node->get<std::string>() : defaultVal;
}

int Config::getInt(const std::string& key, int defaultVal) const {
    const auto* node = find(key);
    return node && node->is_number_integer() ? node->get<int>() : defaultVal;
}

int64_t Config::getInt64(const std::string& key, int64_t defaultVal) const {
    const auto* node = find(key);
    return node && node->is_number_integer() ? node->get<int64_t>() : defaultVal;
}

double Config::getDouble(const std::string& key, double defaultVal) const {
    const auto* node = find(key);
    return node && node->is_number() ? node->get<double>() : defaultVal;
}

bool Config::getBool(const std::string& key, bool defaultVal) const {
    const auto* node = find(key);
    return node && node->is_boolean() ? node->get<bool>() : defaultVal;
}

std::vector<std::string> Config::getStringList(const std::string& key,
                                               const std::vector<std::string>& defaultVal) const {
    const auto* node = find(key);
    if (!node || !node->is_array()) return defaultVal;

    std::vector<std::string> values;
    for (const auto& element : *node) {
        if (element.is_string()) values.push_back(element.get<std::string>());
    }
    return values;
}

} // namespace tether
