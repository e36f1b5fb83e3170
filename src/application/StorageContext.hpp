/**
 * @file StorageContext.hpp
 * @brief Owns every storage component for one process (or one test) and wires them together.
 */

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include "application/RecordStore.hpp"
#include "application/WorkspaceReconciler.hpp"
#include "domain/HostRuntime.hpp"
#include "infrastructure/ConfigStore.hpp"
#include "infrastructure/PathResolver.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/RecordFileStore.hpp"
#include "infrastructure/WorkspaceStore.hpp"

namespace dialog::application {

/**
 * @struct StorageOptions
 * @brief Tuning knobs for the storage core.
 */
struct StorageOptions {
    std::chrono::milliseconds metadataQuietPeriod = infrastructure::WorkspaceStore::kDefaultQuietPeriod;
    bool flushMetadataOnShutdown = true;
    bool pruneStaleMetadata = false;
};

/**
 * @struct StartupReport
 * @brief Outcome of StorageContext::open().
 */
struct StartupReport {
    std::size_t recordsLoaded = 0;
    ReconcileResult reconcile;
};

class StorageContext {
public:
    explicit StorageContext(std::shared_ptr<domain::HostRuntime> host, StorageOptions options = {});
    ~StorageContext();

    StorageContext(const StorageContext&) = delete;
    StorageContext& operator=(const StorageContext&) = delete;

    /**
     * @brief Startup sequence: resolve paths, load settings, warm the cache from the
     * record files, then reconcile workspace.json against it.
     */
    StartupReport open();

    /**
     * @brief Returns a note for editing and makes it the active one.
     *
     * Falls back from the cache to the record file (re-caching what it finds),
     * and finally to a fresh empty note that is not stored until saved.
     */
    domain::NoteRecord openRecord(const std::string& id);

    /** @brief Flushes pending metadata (if configured) and drains queued file operations. */
    void shutdown();

    /** @brief Forgets every cached value, as if the process had just started. */
    void reset();

    RecordStore& records() { return *m_records; }
    infrastructure::WorkspaceStore& workspace() { return *m_workspace; }
    infrastructure::ConfigStore& config() { return *m_config; }
    infrastructure::PathResolver& paths() { return *m_paths; }
    infrastructure::RecordFileStore& files() { return *m_files; }
    infrastructure::PersistenceService& persistence() { return *m_persistence; }
    WorkspaceReconciler& reconciler() { return *m_reconciler; }

private:
    std::size_t warmCache();

    std::shared_ptr<domain::HostRuntime> m_host;
    StorageOptions m_options;

    std::shared_ptr<infrastructure::PathResolver> m_paths;
    std::shared_ptr<infrastructure::PersistenceService> m_persistence;
    std::shared_ptr<infrastructure::RecordFileStore> m_files;
    std::shared_ptr<infrastructure::WorkspaceStore> m_workspace;
    std::shared_ptr<infrastructure::ConfigStore> m_config;
    std::shared_ptr<RecordStore> m_records;
    std::unique_ptr<WorkspaceReconciler> m_reconciler;
    bool m_shutdown = false;
};

} // namespace dialog::application
