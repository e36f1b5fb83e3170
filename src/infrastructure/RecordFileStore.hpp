/**
 * @file RecordFileStore.hpp
 * @brief Per-record JSON files under the record directory.
 */

#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "domain/HostRuntime.hpp"
#include "domain/NoteRecord.hpp"
#include "infrastructure/PathResolver.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace dialog::infrastructure {

/**
 * @class RecordFileStore
 * @brief Durable tier behind the record cache. Writes and deletes are queued, reads are synchronous.
 */
class RecordFileStore {
public:
    RecordFileStore(std::shared_ptr<domain::HostRuntime> host,
                    std::shared_ptr<PathResolver> paths,
                    std::shared_ptr<PersistenceService> persistence);

    /** @brief Queues a full snapshot of the record to <recordDir>/<id>.json. */
    void writeRecord(const domain::NoteRecord& record);

    /**
     * @brief Reads one record file.
     * @return The parsed record, or nullopt if the file is missing or malformed.
     */
    std::optional<domain::NoteRecord> readRecord(const std::string& id);

    /** @brief Queues removal of the record file. */
    void deleteRecord(const std::string& id);

    /** @brief Parses every record file in the record directory, skipping ones that fail. */
    std::vector<domain::NoteRecord> readAll();

private:
    std::optional<domain::NoteRecord> parse(const std::string& text, const std::string& source);

    std::shared_ptr<domain::HostRuntime> m_host;
    std::shared_ptr<PathResolver> m_paths;
    std::shared_ptr<PersistenceService> m_persistence;
};

} // namespace dialog::infrastructure
