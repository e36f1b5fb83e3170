/**
 * @file WorkspaceStore.cpp
 * @brief Implementation of WorkspaceStore.
 */

#include "infrastructure/WorkspaceStore.hpp"
#include <algorithm>
#include <iostream>
#include "infrastructure/JsonCodec.hpp"

namespace dialog::infrastructure {

using json = nlohmann::json;

namespace {

void SortNotes(std::vector<domain::NoteSummary>& notes) {
    std::stable_sort(notes.begin(), notes.end(), [](const auto& a, const auto& b) {
        return a.updatedAt > b.updatedAt;
    });
}

void SortTrash(std::vector<domain::TrashEntry>& trash) {
    std::stable_sort(trash.begin(), trash.end(), [](const auto& a, const auto& b) {
        return a.deletedAt > b.deletedAt;
    });
}

template <typename T>
void EraseById(std::vector<T>& items, const std::string& id) {
    items.erase(std::remove_if(items.begin(), items.end(), [&](const T& item) { return item.id == id; }),
                items.end());
}

void EraseValue(std::vector<std::string>& ids, const std::string& id) {
    ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
}

void PushRecent(domain::WorkspaceSnapshot& ws, const std::string& id) {
    EraseValue(ws.recentIds, id);
    ws.recentIds.insert(ws.recentIds.begin(), id);
    if (ws.recentIds.size() > domain::kMaxRecentIds) {
        ws.recentIds.resize(domain::kMaxRecentIds);
    }
}

} // namespace

WorkspaceStore::WorkspaceStore(std::shared_ptr<domain::HostRuntime> host,
                               std::shared_ptr<PathResolver> paths,
                               std::chrono::milliseconds quietPeriod)
    : m_host(std::move(host)), m_paths(std::move(paths)), m_timer(quietPeriod) {}

domain::WorkspaceSnapshot& WorkspaceStore::loadLocked() {
    if (m_snapshot) {
        return *m_snapshot;
    }

    const std::string path = m_paths->resolve().metadataFile;
    auto text = m_host->readFile(path);
    if (!text) {
        std::cerr << "[WorkspaceStore] Workspace not found, using defaults..." << std::endl;
        m_snapshot = domain::WorkspaceSnapshot{};
        return *m_snapshot;
    }

    try {
        m_snapshot = json::parse(*text).get<domain::WorkspaceSnapshot>();
        m_lastPersisted = toFileText(json(*m_snapshot));
    } catch (const std::exception& e) {
        std::cerr << "[WorkspaceStore] Malformed workspace file, resetting to defaults: " << e.what() << std::endl;
        m_snapshot = domain::WorkspaceSnapshot{};
        writeIfChangedLocked();
    }
    return *m_snapshot;
}

bool WorkspaceStore::writeIfChangedLocked() {
    if (!m_snapshot) {
        return false;
    }

    const std::string text = toFileText(json(*m_snapshot));
    if (m_lastPersisted && *m_lastPersisted == text) {
        return false;
    }

    const std::string path = m_paths->resolve().metadataFile;
    if (!m_host->writeFile(path, text)) {
        // Keep the old baseline so the next mutation retries.
        std::cerr << "[WorkspaceStore] Failed to write " << path << std::endl;
        return false;
    }
    m_lastPersisted = text;
    return true;
}

void WorkspaceStore::scheduleWrite() {
    m_timer.schedule([this] { persistNow(); });
}

domain::WorkspaceSnapshot WorkspaceStore::snapshot() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return loadLocked();
}

void WorkspaceStore::setSnapshot(const domain::WorkspaceSnapshot& snapshot) {
    mutate([&](domain::WorkspaceSnapshot& ws) { ws = snapshot; });
}

bool WorkspaceStore::commitSnapshot(const domain::WorkspaceSnapshot& snapshot) {
    m_timer.cancel();
    std::lock_guard<std::mutex> lock(m_mutex);
    loadLocked();
    m_snapshot = snapshot;
    return writeIfChangedLocked();
}

void WorkspaceStore::setActiveRecord(const std::optional<std::string>& id) {
    mutate([&](domain::WorkspaceSnapshot& ws) {
        ws.activeRecordId = id;
        if (id && !id->empty()) {
            PushRecent(ws, *id);
        }
    });
}

void WorkspaceStore::addRecentId(const std::string& id) {
    mutate([&](domain::WorkspaceSnapshot& ws) { PushRecent(ws, id); });
}

void WorkspaceStore::updateSidebar(std::optional<bool> collapsed, std::optional<int> width) {
    mutate([&](domain::WorkspaceSnapshot& ws) {
        if (collapsed) ws.sidebar.collapsed = *collapsed;
        if (width) ws.sidebar.width = *width;
    });
}

void WorkspaceStore::setWindowState(const domain::WindowState& window) {
    mutate([&](domain::WorkspaceSnapshot& ws) { ws.window = window; });
}

void WorkspaceStore::upsertNote(const domain::NoteSummary& note) {
    mutate([&](domain::WorkspaceSnapshot& ws) {
        auto it = std::find_if(ws.notes.begin(), ws.notes.end(), [&](const auto& n) { return n.id == note.id; });
        if (it != ws.notes.end()) {
            *it = note;
        } else {
            ws.notes.push_back(note);
        }
        SortNotes(ws.notes);
    });
}

void WorkspaceStore::updateNote(const std::string& id, const std::optional<std::string>& title,
                                std::optional<domain::Timestamp> updatedAt) {
    mutate([&](domain::WorkspaceSnapshot& ws) {
        auto it = std::find_if(ws.notes.begin(), ws.notes.end(), [&](const auto& n) { return n.id == id; });
        if (it == ws.notes.end()) return;
        if (title) it->title = *title;
        if (updatedAt) it->updatedAt = *updatedAt;
        SortNotes(ws.notes);
    });
}

void WorkspaceStore::removeNote(const std::string& id) {
    mutate([&](domain::WorkspaceSnapshot& ws) {
        EraseById(ws.notes, id);
        EraseValue(ws.favorites, id);
        EraseValue(ws.recentIds, id);
        if (ws.activeRecordId == id) {
            ws.activeRecordId.reset();
        }
    });
}

void WorkspaceStore::setFavorite(const std::string& id, bool favorite) {
    mutate([&](domain::WorkspaceSnapshot& ws) {
        bool present = std::find(ws.favorites.begin(), ws.favorites.end(), id) != ws.favorites.end();
        if (favorite && !present) {
            ws.favorites.insert(ws.favorites.begin(), id);
        } else if (!favorite && present) {
            EraseValue(ws.favorites, id);
        }
    });
}

void WorkspaceStore::toggleFavorite(const std::string& id) {
    mutate([&](domain::WorkspaceSnapshot& ws) {
        auto it = std::find(ws.favorites.begin(), ws.favorites.end(), id);
        if (it != ws.favorites.end()) {
            ws.favorites.erase(it);
        } else {
            ws.favorites.insert(ws.favorites.begin(), id);
        }
    });
}

void WorkspaceStore::addTrash(const domain::TrashEntry& entry) {
    mutate([&](domain::WorkspaceSnapshot& ws) {
        EraseById(ws.notes, entry.id);
        EraseValue(ws.favorites, entry.id);
        EraseById(ws.trash, entry.id);
        ws.trash.push_back(entry);
        SortTrash(ws.trash);
    });
}

void WorkspaceStore::removeFromTrash(const std::string& id) {
    mutate([&](domain::WorkspaceSnapshot& ws) { EraseById(ws.trash, id); });
}

bool WorkspaceStore::persistNow() {
    m_timer.cancel();
    std::lock_guard<std::mutex> lock(m_mutex);
    return writeIfChangedLocked();
}

bool WorkspaceStore::flush() {
    return m_timer.fireNow();
}

bool WorkspaceStore::hasPendingWrite() const {
    return m_timer.isPending();
}

void WorkspaceStore::reset() {
    m_timer.cancel();
    std::lock_guard<std::mutex> lock(m_mutex);
    m_snapshot.reset();
    m_lastPersisted.reset();
}

} // namespace dialog::infrastructure
