/**
 * @file StorageContext.cpp
 * @brief Implementation of StorageContext.
 */

#include "application/StorageContext.hpp"
#include <iostream>

namespace dialog::application {

using namespace dialog::infrastructure;

StorageContext::StorageContext(std::shared_ptr<domain::HostRuntime> host, StorageOptions options)
    : m_host(std::move(host)), m_options(options) {
    m_paths = std::make_shared<PathResolver>(m_host);
    m_persistence = std::make_shared<PersistenceService>(m_host);
    m_files = std::make_shared<RecordFileStore>(m_host, m_paths, m_persistence);
    m_workspace = std::make_shared<WorkspaceStore>(m_host, m_paths, m_options.metadataQuietPeriod);
    m_config = std::make_shared<ConfigStore>(m_host, m_paths);
    m_records = std::make_shared<RecordStore>(m_host, m_files, m_workspace);
    m_reconciler = std::make_unique<WorkspaceReconciler>(
        m_records, m_workspace, ReconcileOptions{m_options.pruneStaleMetadata});
}

StorageContext::~StorageContext() {
    shutdown();
}

StartupReport StorageContext::open() {
    StartupReport report;
    m_paths->resolve();
    m_config->load();
    report.recordsLoaded = warmCache();
    report.reconcile = m_reconciler->run();
    return report;
}

std::size_t StorageContext::warmCache() {
    std::size_t loaded = 0;
    for (const auto& record : m_files->readAll()) {
        m_records->hydrate(record);
        ++loaded;
    }
    return loaded;
}

domain::NoteRecord StorageContext::openRecord(const std::string& id) {
    domain::NoteRecord result;
    if (auto cached = m_records->load(id)) {
        result = std::move(*cached);
    } else if (auto fromDisk = m_files->readRecord(id)) {
        m_records->hydrate(*fromDisk);
        result = std::move(*fromDisk);
    } else {
        std::cerr << "[StorageContext] Note " << id << " not found, starting empty" << std::endl;
        result.id = id;
        result.title = domain::kUntitled;
        result.updatedAt = m_host->now();
    }

    m_workspace->setActiveRecord(id);
    return result;
}

void StorageContext::shutdown() {
    if (m_shutdown) return;
    m_shutdown = true;

    if (m_options.flushMetadataOnShutdown) {
        m_workspace->flush();
    }
    m_persistence->stop();
}

void StorageContext::reset() {
    m_persistence->waitIdle();
    m_workspace->reset();
    m_config->reset();
    m_records->clear();
    m_paths->reset();
}

} // namespace dialog::application
