/**
 * @file RecordIndex.hpp
 * @brief In-memory record cache with covering indices for the list views.
 */

#pragma once
#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <unordered_map>
#include <vector>
#include "domain/NoteRecord.hpp"

namespace dialog::infrastructure {

/**
 * @class RecordIndex
 * @brief Primary map by id plus three ordered indices holding every field the list views return.
 *
 * The list queries walk an index only and never touch the (large) content
 * payload; the records they return have null content. Ties on the sort key
 * are broken by title, then id, both descending.
 */
class RecordIndex {
public:
    /** @brief Inserts or replaces a record and refreshes its index entries. */
    void put(const domain::NoteRecord& record);

    const domain::NoteRecord* find(const std::string& id) const;

    /** @brief Removes a record. @return False if it was not cached. */
    bool erase(const std::string& id);

    /** @brief Non-deleted records, updatedAt descending. */
    std::vector<domain::NoteRecord> active() const;

    /** @brief Favorite, non-deleted records, updatedAt descending. */
    std::vector<domain::NoteRecord> favorites() const;

    /** @brief Deleted records, deletedAt descending. */
    std::vector<domain::NoteRecord> trash() const;

    /** @brief Full non-deleted records whose title contains @p query, ignoring case. */
    std::vector<domain::NoteRecord> searchTitles(const std::string& query) const;

    std::size_t size() const { return m_records.size(); }
    void clear();

private:
    // [updatedAt, title, id, isFavorite]
    using ActiveKey = std::tuple<domain::Timestamp, std::string, std::string, bool>;
    // [updatedAt, title, id]
    using FavoriteKey = std::tuple<domain::Timestamp, std::string, std::string>;
    // [deletedAt, title, id, updatedAt, isFavorite]
    using TrashKey = std::tuple<domain::Timestamp, std::string, std::string, domain::Timestamp, bool>;

    void indexRecord(const domain::NoteRecord& record);
    void unindexRecord(const domain::NoteRecord& record);

    std::unordered_map<std::string, domain::NoteRecord> m_records;
    std::set<ActiveKey> m_active;
    std::set<FavoriteKey> m_favorites;
    std::set<TrashKey> m_trash;
};

} // namespace dialog::infrastructure
