// PathResolver Header
#pragma once
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "domain/HostRuntime.hpp"

namespace dialog::infrastructure {

/**
 * @struct PathSet
 * @brief Every location the storage core reads or writes, derived from one base directory.
 */
struct PathSet {
    std::string baseDir;
    char separator = '/';
    std::string storageDir;   ///< <base>/.dialog
    std::string recordDir;    ///< <storage>/content
    std::string metadataFile; ///< <storage>/workspace.json
    std::string configFile;   ///< <storage>/app.json
    std::string assetDir;     ///< <storage>/assets
};

/**
 * @class PathResolver
 * @brief Asks the host for the working directory once and caches every derived path.
 */
class PathResolver {
public:
    explicit PathResolver(std::shared_ptr<domain::HostRuntime> host);

    /** @brief Resolves on first use; later calls never reach the host. */
    PathSet resolve();

    /** @brief <recordDir>/<id>.json */
    std::string recordPath(const std::string& id);

    /** @brief <assetDir>/<name> */
    std::string assetPath(const std::string& name);

    /** @brief Forgets the cached paths so the next resolve() asks the host again. */
    void reset();

    bool isResolved() const;

private:
    const PathSet& ensureResolved();

    std::shared_ptr<domain::HostRuntime> m_host;
    mutable std::mutex m_mutex;
    std::optional<PathSet> m_paths;
};

} // namespace dialog::infrastructure
