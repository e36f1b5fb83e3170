/**
 * @file WorkspaceSnapshot.hpp
 * @brief Derived UI state persisted in workspace.json (lists, sidebar, recents).
 */

#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "domain/NoteRecord.hpp"

namespace dialog::domain {

/** @brief Maximum number of entries kept in recentIds. */
constexpr std::size_t kMaxRecentIds = 10;

struct NoteSummary {
    std::string id;
    std::string title;
    Timestamp updatedAt = 0;

    bool operator==(const NoteSummary& other) const {
        return id == other.id && title == other.title && updatedAt == other.updatedAt;
    }
};

struct TrashEntry {
    std::string id;
    std::string title;
    Timestamp deletedAt = 0;

    bool operator==(const TrashEntry& other) const {
        return id == other.id && title == other.title && deletedAt == other.deletedAt;
    }
};

struct SidebarState {
    bool collapsed = false;
    int width = 240;

    bool operator==(const SidebarState& other) const {
        return collapsed == other.collapsed && width == other.width;
    }
};

/**
 * @struct WindowState
 * @brief Last known main window geometry.
 */
struct WindowState {
    int width = 0;
    int height = 0;
    std::optional<int> x;
    std::optional<int> y;
    bool maximized = false;

    bool operator==(const WindowState& other) const {
        return width == other.width && height == other.height && x == other.x && y == other.y &&
               maximized == other.maximized;
    }
};

/**
 * @struct WorkspaceSnapshot
 * @brief Everything the sidebar and note lists need without touching the record cache.
 *
 * notes is ordered by updatedAt descending, trash by deletedAt descending,
 * recentIds most recent first.
 */
struct WorkspaceSnapshot {
    std::optional<std::string> activeRecordId;
    SidebarState sidebar;
    std::vector<std::string> recentIds;
    std::vector<NoteSummary> notes;
    std::vector<std::string> favorites;
    std::vector<TrashEntry> trash;
    std::optional<WindowState> window;

    bool operator==(const WorkspaceSnapshot& other) const {
        return activeRecordId == other.activeRecordId && sidebar == other.sidebar &&
               recentIds == other.recentIds && notes == other.notes && favorites == other.favorites &&
               trash == other.trash && window == other.window;
    }
    bool operator!=(const WorkspaceSnapshot& other) const { return !(*this == other); }
};

} // namespace dialog::domain
