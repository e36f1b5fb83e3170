/**
 * @file WorkspaceStore.hpp
 * @brief Owner of workspace.json: the aggregated list/sidebar metadata.
 */

#pragma once
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "domain/HostRuntime.hpp"
#include "domain/WorkspaceSnapshot.hpp"
#include "infrastructure/DebounceTimer.hpp"
#include "infrastructure/PathResolver.hpp"

namespace dialog::infrastructure {

/**
 * @class WorkspaceStore
 * @brief Keeps the workspace snapshot in memory and writes it back after a quiet period.
 *
 * Every mutation is visible to the next snapshot() call immediately. The file
 * is written once the quiet period passes without further mutations, and only
 * if the serialized text differs from what was last persisted.
 */
class WorkspaceStore {
public:
    static constexpr std::chrono::milliseconds kDefaultQuietPeriod{1000};

    WorkspaceStore(std::shared_ptr<domain::HostRuntime> host,
                   std::shared_ptr<PathResolver> paths,
                   std::chrono::milliseconds quietPeriod = kDefaultQuietPeriod);

    /** @brief Current snapshot, loading workspace.json on first access. */
    domain::WorkspaceSnapshot snapshot();

    /** @brief Replaces the whole snapshot and schedules a write. */
    void setSnapshot(const domain::WorkspaceSnapshot& snapshot);

    /**
     * @brief Replaces the whole snapshot and writes it immediately.
     * @return True if a write reached the host.
     */
    bool commitSnapshot(const domain::WorkspaceSnapshot& snapshot);

    /** @brief Sets the open note. A non-empty id is also pushed onto recentIds. */
    void setActiveRecord(const std::optional<std::string>& id);

    /** @brief Moves @p id to the front of recentIds, keeping at most kMaxRecentIds entries. */
    void addRecentId(const std::string& id);

    void updateSidebar(std::optional<bool> collapsed, std::optional<int> width);
    void setWindowState(const domain::WindowState& window);

    // --- Notes ---
    void upsertNote(const domain::NoteSummary& note);
    /** @brief Updates an existing entry; ids not in the list are ignored. */
    void updateNote(const std::string& id, const std::optional<std::string>& title,
                    std::optional<domain::Timestamp> updatedAt);
    /** @brief Forgets the note everywhere: notes, favorites, recents and the active slot. */
    void removeNote(const std::string& id);

    // --- Favorites ---
    void setFavorite(const std::string& id, bool favorite);
    void toggleFavorite(const std::string& id);

    // --- Trash ---
    /** @brief Adds (or replaces) a trash entry and drops the id from notes and favorites. */
    void addTrash(const domain::TrashEntry& entry);
    void removeFromTrash(const std::string& id);

    /**
     * @brief Cancels the pending timer and writes now if the content changed.
     * @return True if a write reached the host.
     */
    bool persistNow();

    /** @brief Runs a pending debounced write right away. @return True if one was pending. */
    bool flush();

    bool hasPendingWrite() const;

    /** @brief Drops the cached snapshot and the persisted baseline. Pending writes are cancelled. */
    void reset();

private:
    domain::WorkspaceSnapshot& loadLocked();
    bool writeIfChangedLocked();
    void scheduleWrite();

    template <typename Fn>
    void mutate(Fn&& fn) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            fn(loadLocked());
        }
        scheduleWrite();
    }

    std::shared_ptr<domain::HostRuntime> m_host;
    std::shared_ptr<PathResolver> m_paths;

    mutable std::mutex m_mutex;
    std::optional<domain::WorkspaceSnapshot> m_snapshot;
    std::optional<std::string> m_lastPersisted; ///< Exact text of the last successful write or load.

    DebounceTimer m_timer; // declared last: its thread calls back into this object
};

} // namespace dialog::infrastructure
