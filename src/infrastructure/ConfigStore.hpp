/**
 * @file ConfigStore.hpp
 * @brief Cached read/patch/write access to the application settings file (app.json).
 *
 * Settings change rarely, so every update is written straight through.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "domain/AppConfig.hpp"
#include "domain/HostRuntime.hpp"
#include "infrastructure/PathResolver.hpp"

namespace dialog::infrastructure {

class ConfigStore {
public:
    ConfigStore(std::shared_ptr<domain::HostRuntime> host, std::shared_ptr<PathResolver> paths);

    /**
     * @brief Returns the settings, reading app.json on first use.
     * A missing or malformed file is replaced by the defaults, which are written back.
     */
    domain::AppConfig load();

    /** @brief Replaces every known setting and writes the file. */
    void save(const domain::AppConfig& config);

    /**
     * @brief Reads one top-level setting ("theme", "editor", "ai", ...).
     * @throws std::invalid_argument for unknown keys.
     */
    nlohmann::json getValue(const std::string& key);

    /**
     * @brief Replaces one top-level setting and writes the file.
     * @throws std::invalid_argument for unknown keys or values of the wrong shape; nothing is changed then.
     */
    void setValue(const std::string& key, const nlohmann::json& value);

    /** @brief Directory holding every file the app stores. */
    std::string storageDir();

    /** @brief Forgets the cached settings. */
    void reset();

    static bool IsKnownKey(const std::string& key);

private:
    nlohmann::json& ensureLoaded();
    void writeToFile(const nlohmann::json& config);

    std::shared_ptr<domain::HostRuntime> m_host;
    std::shared_ptr<PathResolver> m_paths;
    std::optional<nlohmann::json> m_cache;
};

} // namespace dialog::infrastructure
