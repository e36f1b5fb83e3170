/**
 * @file RecordStore.cpp
 * @brief Implementation of RecordStore.
 */

#include "application/RecordStore.hpp"
#include <iostream>

namespace dialog::application {

RecordStore::RecordStore(std::shared_ptr<domain::HostRuntime> host,
                         std::shared_ptr<infrastructure::RecordFileStore> files,
                         std::shared_ptr<infrastructure::WorkspaceStore> workspace)
    : m_host(std::move(host)), m_files(std::move(files)), m_workspace(std::move(workspace)) {}

std::string RecordStore::create(const std::string& title) {
    domain::NoteRecord record;
    record.id = m_host->newUniqueId();
    record.title = title;
    record.content = nullptr;
    record.updatedAt = m_host->now();

    m_index.put(record);
    m_files->writeRecord(record);
    m_workspace->upsertNote({record.id, record.title, record.updatedAt});
    return record.id;
}

void RecordStore::save(const std::string& id, const nlohmann::json& content,
                       const std::optional<std::string>& title, const SaveOptions& options) {
    const domain::NoteRecord* existing = m_index.find(id);
    const bool wasDeleted = existing && existing->isDeleted;
    const domain::Timestamp now = m_host->now();

    domain::NoteRecord record;
    record.id = id;
    record.title = title ? *title : (existing ? existing->title : std::string(domain::kUntitled));
    record.content = content;
    record.updatedAt = now;
    record.isFavorite = existing ? existing->isFavorite : false;

    if (options.isDeleted.has_value()) {
        if (*options.isDeleted) {
            // Keep the first trash time if it was already deleted.
            record.markDeleted(wasDeleted && existing->deletedAt ? *existing->deletedAt : now);
        } else {
            record.clearDeleted();
        }
    } else if (wasDeleted) {
        record.markDeleted(existing->deletedAt.value_or(now));
    }

    m_index.put(record);
    m_files->writeRecord(record);

    // Edits to trashed notes never touch the workspace lists.
    const bool deleting = options.isDeleted.value_or(false);
    if (!deleting && !wasDeleted && !options.skipMetadataSync) {
        m_workspace->upsertNote({record.id, record.title, record.updatedAt});
    }
}

std::optional<domain::NoteRecord> RecordStore::load(const std::string& id) const {
    const domain::NoteRecord* record = m_index.find(id);
    if (!record) {
        return std::nullopt;
    }
    return *record;
}

std::vector<domain::NoteRecord> RecordStore::listActive() const {
    return m_index.active();
}

std::vector<domain::NoteRecord> RecordStore::listFavorites() const {
    return m_index.favorites();
}

std::vector<domain::NoteRecord> RecordStore::listTrash() const {
    return m_index.trash();
}

std::vector<domain::NoteRecord> RecordStore::search(const std::string& query) const {
    return m_index.searchTitles(query);
}

void RecordStore::toggleFavorite(const std::string& id) {
    const domain::NoteRecord* existing = m_index.find(id);
    if (!existing) {
        std::cerr << "[RecordStore] toggleFavorite: unknown note " << id << std::endl;
        return;
    }

    domain::NoteRecord record = *existing;
    record.isFavorite = !record.isFavorite;
    m_index.put(record);
    m_files->writeRecord(record);

    // Favorites only list notes that are outside the trash.
    m_workspace->setFavorite(id, record.isFavorite && !record.isDeleted);
}

void RecordStore::moveToTrash(const std::string& id) {
    const domain::NoteRecord* existing = m_index.find(id);
    if (!existing) {
        std::cerr << "[RecordStore] moveToTrash: unknown note " << id << std::endl;
        return;
    }

    domain::NoteRecord record = *existing;
    const domain::Timestamp now = m_host->now();
    record.markDeleted(now);
    m_index.put(record);
    m_files->writeRecord(record);

    m_workspace->addTrash({record.id, record.title, now});
}

void RecordStore::restoreFromTrash(const std::string& id) {
    const domain::NoteRecord* existing = m_index.find(id);
    if (!existing) {
        std::cerr << "[RecordStore] restoreFromTrash: unknown note " << id << std::endl;
        return;
    }

    domain::NoteRecord record = *existing;
    record.clearDeleted();
    record.updatedAt = m_host->now(); // resurface at the top of the lists
    m_index.put(record);
    m_files->writeRecord(record);

    // Out of the trash before back into notes, never both at once.
    m_workspace->removeFromTrash(id);
    m_workspace->upsertNote({record.id, record.title, record.updatedAt});
    if (record.isFavorite) {
        m_workspace->setFavorite(id, true);
    }
}

void RecordStore::permanentlyDelete(const std::string& id) {
    m_index.erase(id);
    m_files->deleteRecord(id);

    // Unconditional: the id may linger in the lists even if the cache never had it.
    m_workspace->removeFromTrash(id);
    m_workspace->removeNote(id);
}

void RecordStore::hydrate(const domain::NoteRecord& record) {
    m_index.put(record);
}

void RecordStore::clear() {
    m_index.clear();
}

} // namespace dialog::application
