/**
 * @file WorkspaceReconciler.hpp
 * @brief Startup pass that repairs drift between the record store and workspace.json.
 */

#pragma once

#include <cstddef>
#include <memory>
#include "application/RecordStore.hpp"
#include "domain/WorkspaceSnapshot.hpp"
#include "infrastructure/WorkspaceStore.hpp"

namespace dialog::application {

struct ReconcileOptions {
    /// Also drop metadata entries the record store no longer reports.
    bool pruneStale = false;
};

/**
 * @struct ReconcileReport
 * @brief What a single reconciliation pass changed.
 */
struct ReconcileReport {
    std::size_t notesAdded = 0;
    std::size_t favoritesAdded = 0;
    std::size_t trashAdded = 0;
    std::size_t entriesPruned = 0;
    bool wrote = false; ///< True if the corrective write reached the host.

    bool changed() const { return notesAdded + favoritesAdded + trashAdded + entriesPruned > 0; }
};

struct ReconcileResult {
    domain::WorkspaceSnapshot snapshot;
    ReconcileReport report;
};

/**
 * @class WorkspaceReconciler
 * @brief Adds every note, favorite and trash entry the record store knows about to the workspace lists.
 *
 * Entries present only in the workspace are kept unless pruning is enabled.
 * Patched snapshots are written once, as a whole. Running twice in a row finds
 * nothing to do the second time.
 */
class WorkspaceReconciler {
public:
    WorkspaceReconciler(std::shared_ptr<RecordStore> records,
                        std::shared_ptr<infrastructure::WorkspaceStore> workspace,
                        ReconcileOptions options = {});

    ReconcileResult run();

private:
    std::shared_ptr<RecordStore> m_records;
    std::shared_ptr<infrastructure::WorkspaceStore> m_workspace;
    ReconcileOptions m_options;
};

} // namespace dialog::application
