/**
 * @file WorkspaceReconciler.cpp
 * @brief Implementation of WorkspaceReconciler.
 */

#include "application/WorkspaceReconciler.hpp"
#include <algorithm>
#include <exception>
#include <iostream>
#include <unordered_set>

namespace dialog::application {

namespace {

template <typename T>
std::size_t PruneById(std::vector<T>& items, const std::unordered_set<std::string>& keep) {
    const std::size_t before = items.size();
    items.erase(std::remove_if(items.begin(), items.end(), [&](const T& item) { return keep.count(item.id) == 0; }),
                items.end());
    return before - items.size();
}

std::size_t PruneIds(std::vector<std::string>& ids, const std::unordered_set<std::string>& keep) {
    const std::size_t before = ids.size();
    ids.erase(std::remove_if(ids.begin(), ids.end(), [&](const std::string& id) { return keep.count(id) == 0; }),
              ids.end());
    return before - ids.size();
}

} // namespace

WorkspaceReconciler::WorkspaceReconciler(std::shared_ptr<RecordStore> records,
                                         std::shared_ptr<infrastructure::WorkspaceStore> workspace,
                                         ReconcileOptions options)
    : m_records(std::move(records)), m_workspace(std::move(workspace)), m_options(options) {}

ReconcileResult WorkspaceReconciler::run() {
    ReconcileResult result;
    result.snapshot = m_workspace->snapshot();

    std::vector<domain::NoteRecord> active;
    std::vector<domain::NoteRecord> favorites;
    std::vector<domain::NoteRecord> trash;
    try {
        active = m_records->listActive();
        favorites = m_records->listFavorites();
        trash = m_records->listTrash();
    } catch (const std::exception& e) {
        std::cerr << "[WorkspaceReconciler] Record store unavailable, keeping workspace as loaded: "
                  << e.what() << std::endl;
        return result;
    }

    domain::WorkspaceSnapshot& ws = result.snapshot;
    ReconcileReport& report = result.report;

    // 1. Notes
    std::unordered_set<std::string> noteIds;
    for (const auto& n : ws.notes) noteIds.insert(n.id);
    for (const auto& doc : active) {
        if (noteIds.insert(doc.id).second) {
            ws.notes.push_back({doc.id, doc.title, doc.updatedAt});
            ++report.notesAdded;
        }
    }

    // 2. Favorites
    std::unordered_set<std::string> favoriteIds(ws.favorites.begin(), ws.favorites.end());
    for (const auto& doc : favorites) {
        if (favoriteIds.insert(doc.id).second) {
            ws.favorites.push_back(doc.id);
            ++report.favoritesAdded;
        }
    }

    // 3. Trash
    std::unordered_set<std::string> trashIds;
    for (const auto& t : ws.trash) trashIds.insert(t.id);
    for (const auto& doc : trash) {
        if (trashIds.insert(doc.id).second) {
            ws.trash.push_back({doc.id, doc.title, doc.deletedAt.value_or(doc.updatedAt)});
            ++report.trashAdded;
        }
    }

    if (m_options.pruneStale) {
        std::unordered_set<std::string> activeIds;
        for (const auto& doc : active) activeIds.insert(doc.id);
        std::unordered_set<std::string> favoriteKeep;
        for (const auto& doc : favorites) favoriteKeep.insert(doc.id);
        std::unordered_set<std::string> trashKeep;
        for (const auto& doc : trash) trashKeep.insert(doc.id);

        report.entriesPruned += PruneById(ws.notes, activeIds);
        report.entriesPruned += PruneIds(ws.favorites, favoriteKeep);
        report.entriesPruned += PruneById(ws.trash, trashKeep);
    }

    if (!report.changed()) {
        return result;
    }

    std::stable_sort(ws.notes.begin(), ws.notes.end(), [](const auto& a, const auto& b) {
        return a.updatedAt > b.updatedAt;
    });
    std::stable_sort(ws.trash.begin(), ws.trash.end(), [](const auto& a, const auto& b) {
        return a.deletedAt > b.deletedAt;
    });

    std::cerr << "[WorkspaceReconciler] Migrating missing items into workspace: +" << report.notesAdded
              << " notes, +" << report.favoritesAdded << " favorites, +" << report.trashAdded << " trash";
    if (report.entriesPruned > 0) {
        std::cerr << ", -" << report.entriesPruned << " stale";
    }
    std::cerr << std::endl;

    report.wrote = m_workspace->commitSnapshot(ws);
    return result;
}

} // namespace dialog::application
