/**
 * @file ConfigStore.cpp
 * @brief Implementation of ConfigStore.
 */

#include "infrastructure/ConfigStore.hpp"
#include <algorithm>
#include <array>
#include <iostream>
#include <stdexcept>
#include "infrastructure/JsonCodec.hpp"

namespace dialog::infrastructure {

using json = nlohmann::json;

namespace {

constexpr std::array<const char*, 5> kKnownKeys = {"theme", "accentColor", "editor", "autoSaveInterval", "ai"};

json Defaults() {
    return json(domain::AppConfig{});
}

} // namespace

ConfigStore::ConfigStore(std::shared_ptr<domain::HostRuntime> host, std::shared_ptr<PathResolver> paths)
    : m_host(std::move(host)), m_paths(std::move(paths)) {}

bool ConfigStore::IsKnownKey(const std::string& key) {
    return std::any_of(kKnownKeys.begin(), kKnownKeys.end(), [&](const char* k) { return key == k; });
}

json& ConfigStore::ensureLoaded() {
    if (m_cache) {
        return *m_cache;
    }

    const std::string path = m_paths->resolve().configFile;
    auto text = m_host->readFile(path);
    if (!text) {
        std::cerr << "[ConfigStore] Config not found, creating default..." << std::endl;
        m_cache = Defaults();
        writeToFile(*m_cache);
        return *m_cache;
    }

    try {
        json parsed = json::parse(*text);
        if (!parsed.is_object()) {
            throw std::invalid_argument("config must be an object");
        }
        json merged = Defaults();
        merged.update(parsed);
        // Reject values the typed view cannot read.
        (void)merged.get<domain::AppConfig>();
        m_cache = std::move(merged);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigStore] Error reading " << path << ", restoring defaults: " << e.what() << std::endl;
        m_cache = Defaults();
        writeToFile(*m_cache);
    }
    return *m_cache;
}

void ConfigStore::writeToFile(const json& config) {
    const std::string path = m_paths->resolve().configFile;
    if (!m_host->writeFile(path, toFileText(config))) {
        std::cerr << "[ConfigStore] Error writing " << path << std::endl;
    }
}

domain::AppConfig ConfigStore::load() {
    return ensureLoaded().get<domain::AppConfig>();
}

void ConfigStore::save(const domain::AppConfig& config) {
    json& current = ensureLoaded();
    current.update(json(config));
    if (!config.accentColor) {
        current.erase("accentColor");
    }
    writeToFile(current);
}

json ConfigStore::getValue(const std::string& key) {
    if (!IsKnownKey(key)) {
        throw std::invalid_argument("Unknown config key: " + key);
    }
    const json& current = ensureLoaded();
    auto it = current.find(key);
    return it != current.end() ? *it : json();
}

void ConfigStore::setValue(const std::string& key, const json& value) {
    if (!IsKnownKey(key)) {
        throw std::invalid_argument("Unknown config key: " + key);
    }

    if (key == "accentColor" && !value.is_null() && !value.is_string()) {
        throw std::invalid_argument("accentColor must be a string or null, got " + value.dump());
    }

    json candidate = ensureLoaded();
    if (value.is_null() && key == "accentColor") {
        candidate.erase(key);
    } else {
        candidate[key] = value;
    }

    domain::AppConfig typed;
    try {
        typed = candidate.get<domain::AppConfig>();
    } catch (const json::exception& e) {
        throw std::invalid_argument("Invalid value for config key " + key + ": " + e.what());
    }

    // Enum readers fall back silently on unknown names, so compare the round trip.
    if (key == "theme" && json(typed.theme) != candidate["theme"]) {
        throw std::invalid_argument("Unknown theme: " + value.dump());
    }
    if (key == "ai" && value.is_object() && value.contains("provider") && json(typed.ai.provider) != value["provider"]) {
        throw std::invalid_argument("Unknown AI provider: " + value["provider"].dump());
    }

    m_cache = std::move(candidate);
    writeToFile(*m_cache);
}

std::string ConfigStore::storageDir() {
    return m_paths->resolve().storageDir;
}

void ConfigStore::reset() {
    m_cache.reset();
}

} // namespace dialog::infrastructure
