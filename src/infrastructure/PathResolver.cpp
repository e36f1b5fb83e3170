#include "infrastructure/PathResolver.hpp"

namespace dialog::infrastructure {

namespace {

constexpr const char* kStorageDirName = ".dialog";
constexpr const char* kRecordDirName = "content";
constexpr const char* kAssetDirName = "assets";
constexpr const char* kMetadataFileName = "workspace.json";
constexpr const char* kConfigFileName = "app.json";
constexpr const char* kRecordExtension = ".json";

std::string Join(const std::string& dir, char sep, const std::string& name) {
    return dir + sep + name;
}

} // namespace

PathResolver::PathResolver(std::shared_ptr<domain::HostRuntime> host) : m_host(std::move(host)) {}

const PathSet& PathResolver::ensureResolved() {
    if (m_paths) {
        return *m_paths;
    }

    PathSet paths;
    std::string cwd = m_host->currentDirectory();
    if (cwd.empty()) {
        cwd = ".";
    }

    // Backslashes only show up in Windows paths.
    paths.separator = cwd.find('\\') != std::string::npos ? '\\' : '/';

    std::string base = cwd;
    if (!base.empty() && base.back() == paths.separator) {
        base.pop_back();
    }

    paths.baseDir = base;
    paths.storageDir = Join(base, paths.separator, kStorageDirName);
    paths.recordDir = Join(paths.storageDir, paths.separator, kRecordDirName);
    paths.metadataFile = Join(paths.storageDir, paths.separator, kMetadataFileName);
    paths.configFile = Join(paths.storageDir, paths.separator, kConfigFileName);
    paths.assetDir = Join(paths.storageDir, paths.separator, kAssetDirName);

    m_paths = std::move(paths);
    return *m_paths;
}

PathSet PathResolver::resolve() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return ensureResolved();
}

std::string PathResolver::recordPath(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const PathSet& paths = ensureResolved();
    return Join(paths.recordDir, paths.separator, id + kRecordExtension);
}

std::string PathResolver::assetPath(const std::string& name) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const PathSet& paths = ensureResolved();
    return Join(paths.assetDir, paths.separator, name);
}

void PathResolver::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_paths.reset();
}

bool PathResolver::isResolved() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_paths.has_value();
}

} // namespace dialog::infrastructure
