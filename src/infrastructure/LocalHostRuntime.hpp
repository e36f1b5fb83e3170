/**
 * @file LocalHostRuntime.hpp
 * @brief HostRuntime backed by the local filesystem and system clock.
 */

#pragma once
#include <mutex>
#include <random>
#include "domain/HostRuntime.hpp"

namespace dialog::infrastructure {

/**
 * @class LocalHostRuntime
 * @brief Direct filesystem implementation of the host primitives.
 *
 * Writes go to a temporary sibling file that is renamed over the target, so a
 * crash mid-write never leaves a truncated record behind.
 */
class LocalHostRuntime : public domain::HostRuntime {
public:
    LocalHostRuntime();

    std::optional<std::string> readFile(const std::string& path) override;
    bool writeFile(const std::string& path, const std::string& text) override;
    bool deleteFile(const std::string& path) override;
    std::vector<std::string> listFiles(const std::string& directory) override;
    std::string currentDirectory() override;

    /** @brief Random RFC 4122 version 4 UUID. */
    std::string newUniqueId() override;

    domain::Timestamp now() override;

private:
    std::mutex m_rngMutex;
    std::mt19937_64 m_rng;
};

} // namespace dialog::infrastructure
