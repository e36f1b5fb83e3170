/**
 * @file RecordFileStore.cpp
 * @brief Implementation of RecordFileStore.
 */

#include "infrastructure/RecordFileStore.hpp"
#include <iostream>
#include "infrastructure/JsonCodec.hpp"

namespace dialog::infrastructure {

using json = nlohmann::json;

namespace {

constexpr const char* kExtension = ".json";

bool HasExtension(const std::string& name) {
    const std::string ext = kExtension;
    return name.size() > ext.size() && name.compare(name.size() - ext.size(), ext.size(), ext) == 0;
}

// The file name is the record's identity; a stale id field inside must not move it.
void AdoptFileId(domain::NoteRecord& record, const std::string& id, const std::string& source) {
    if (record.id == id) return;
    if (!record.id.empty()) {
        std::cerr << "[RecordFileStore] " << source << " claims id " << record.id << ", using " << id << std::endl;
    }
    record.id = id;
}

} // namespace

RecordFileStore::RecordFileStore(std::shared_ptr<domain::HostRuntime> host,
                                 std::shared_ptr<PathResolver> paths,
                                 std::shared_ptr<PersistenceService> persistence)
    : m_host(std::move(host)), m_paths(std::move(paths)), m_persistence(std::move(persistence)) {}

void RecordFileStore::writeRecord(const domain::NoteRecord& record) {
    std::string text;
    try {
        text = toFileText(json(record));
    } catch (const json::exception& e) {
        // Content that cannot be dumped (invalid UTF-8) must not take the edit down with it.
        std::cerr << "[RecordFileStore] Cannot serialize record " << record.id << ": " << e.what() << std::endl;
        return;
    }
    m_persistence->saveTextAsync(m_paths->recordPath(record.id), text);
}

std::optional<domain::NoteRecord> RecordFileStore::readRecord(const std::string& id) {
    const std::string path = m_paths->recordPath(id);
    auto text = m_host->readFile(path);
    if (!text) {
        return std::nullopt;
    }
    auto record = parse(*text, path);
    if (record) {
        AdoptFileId(*record, id, path);
    }
    return record;
}

void RecordFileStore::deleteRecord(const std::string& id) {
    m_persistence->deleteAsync(m_paths->recordPath(id));
}

std::vector<domain::NoteRecord> RecordFileStore::readAll() {
    std::vector<domain::NoteRecord> records;
    const PathSet paths = m_paths->resolve();

    for (const auto& name : m_host->listFiles(paths.recordDir)) {
        if (!HasExtension(name)) continue;

        const std::string path = paths.recordDir + paths.separator + name;
        auto text = m_host->readFile(path);
        if (!text) {
            std::cerr << "[RecordFileStore] Unreadable record file: " << path << std::endl;
            continue;
        }
        if (auto record = parse(*text, path)) {
            AdoptFileId(*record, name.substr(0, name.size() - std::string(kExtension).size()), path);
            records.push_back(std::move(*record));
        }
    }
    return records;
}

std::optional<domain::NoteRecord> RecordFileStore::parse(const std::string& text, const std::string& source) {
    try {
        return json::parse(text).get<domain::NoteRecord>();
    } catch (const std::exception& e) {
        std::cerr << "[RecordFileStore] Malformed record file " << source << ": " << e.what() << std::endl;
        return std::nullopt;
    }
}

} // namespace dialog::infrastructure
