/**
 * @file RecordStore.hpp
 * @brief Note operations over the record cache, with durable writes and metadata upkeep.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/HostRuntime.hpp"
#include "domain/NoteRecord.hpp"
#include "infrastructure/RecordFileStore.hpp"
#include "infrastructure/RecordIndex.hpp"
#include "infrastructure/WorkspaceStore.hpp"

namespace dialog::application {

/**
 * @struct SaveOptions
 * @brief Optional behaviour for RecordStore::save.
 */
struct SaveOptions {
    std::optional<bool> isDeleted; ///< Changes the trash state when set.
    bool skipMetadataSync = false; ///< Leaves workspace.json untouched.
};

/**
 * @class RecordStore
 * @brief Authoritative store of notes for the running session.
 *
 * Every mutation updates the cache first, then queues the record file write
 * and keeps the workspace lists in step. File failures never undo a cache
 * change.
 */
class RecordStore {
public:
    RecordStore(std::shared_ptr<domain::HostRuntime> host,
                std::shared_ptr<infrastructure::RecordFileStore> files,
                std::shared_ptr<infrastructure::WorkspaceStore> workspace);

    /**
     * @brief Creates an empty note.
     * @return The new note id.
     */
    std::string create(const std::string& title = domain::kUntitled);

    /**
     * @brief Inserts or updates a note's content, keeping fields that are not given.
     * @param id Note to write; created with defaults if unknown.
     * @param content New editor payload.
     * @param title New title, or keep the current one.
     */
    void save(const std::string& id, const nlohmann::json& content,
              const std::optional<std::string>& title = std::nullopt, const SaveOptions& options = {});

    /** @brief Cache lookup only; see StorageContext::openRecord for the file fallback. */
    std::optional<domain::NoteRecord> load(const std::string& id) const;

    /** @brief Non-deleted notes, most recently updated first. Content is not included. */
    std::vector<domain::NoteRecord> listActive() const;

    /** @brief Favorite non-deleted notes, most recently updated first. Content is not included. */
    std::vector<domain::NoteRecord> listFavorites() const;

    /** @brief Trashed notes, most recently deleted first. Content is not included. */
    std::vector<domain::NoteRecord> listTrash() const;

    /** @brief Case-insensitive title search over non-deleted notes, returning full records. */
    std::vector<domain::NoteRecord> search(const std::string& query) const;

    void toggleFavorite(const std::string& id);
    void moveToTrash(const std::string& id);
    void restoreFromTrash(const std::string& id);
    void permanentlyDelete(const std::string& id);

    /** @brief Puts a record read from disk into the cache, with no writes or metadata calls. */
    void hydrate(const domain::NoteRecord& record);

    std::size_t size() const { return m_index.size(); }

    /** @brief Empties the cache. Files are left alone. */
    void clear();

private:
    std::shared_ptr<domain::HostRuntime> m_host;
    std::shared_ptr<infrastructure::RecordFileStore> m_files;
    std::shared_ptr<infrastructure::WorkspaceStore> m_workspace;
    infrastructure::RecordIndex m_index;
};

} // namespace dialog::application
