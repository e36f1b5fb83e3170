/**
 * @file RecordIndex.cpp
 * @brief Implementation of RecordIndex.
 */

#include "infrastructure/RecordIndex.hpp"
#include <algorithm>
#include <cctype>

namespace dialog::infrastructure {

namespace {

std::string ToLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return std::tolower(c); });
    return text;
}

} // namespace

void RecordIndex::indexRecord(const domain::NoteRecord& record) {
    if (record.isDeleted) {
        m_trash.emplace(record.deletedAt.value_or(record.updatedAt), record.title, record.id,
                        record.updatedAt, record.isFavorite);
        return;
    }
    m_active.emplace(record.updatedAt, record.title, record.id, record.isFavorite);
    if (record.isFavorite) {
        m_favorites.emplace(record.updatedAt, record.title, record.id);
    }
}

void RecordIndex::unindexRecord(const domain::NoteRecord& record) {
    if (record.isDeleted) {
        m_trash.erase(TrashKey{record.deletedAt.value_or(record.updatedAt), record.title, record.id,
                               record.updatedAt, record.isFavorite});
        return;
    }
    m_active.erase(ActiveKey{record.updatedAt, record.title, record.id, record.isFavorite});
    if (record.isFavorite) {
        m_favorites.erase(FavoriteKey{record.updatedAt, record.title, record.id});
    }
}

void RecordIndex::put(const domain::NoteRecord& record) {
    auto it = m_records.find(record.id);
    if (it != m_records.end()) {
        unindexRecord(it->second);
        it->second = record;
    } else {
        it = m_records.emplace(record.id, record).first;
    }
    indexRecord(it->second);
}

const domain::NoteRecord* RecordIndex::find(const std::string& id) const {
    auto it = m_records.find(id);
    return it != m_records.end() ? &it->second : nullptr;
}

bool RecordIndex::erase(const std::string& id) {
    auto it = m_records.find(id);
    if (it == m_records.end()) {
        return false;
    }
    unindexRecord(it->second);
    m_records.erase(it);
    return true;
}

std::vector<domain::NoteRecord> RecordIndex::active() const {
    std::vector<domain::NoteRecord> out;
    out.reserve(m_active.size());
    for (auto it = m_active.rbegin(); it != m_active.rend(); ++it) {
        domain::NoteRecord r;
        std::tie(r.updatedAt, r.title, r.id, r.isFavorite) = *it;
        out.push_back(std::move(r));
    }
    return out;
}

std::vector<domain::NoteRecord> RecordIndex::favorites() const {
    std::vector<domain::NoteRecord> out;
    out.reserve(m_favorites.size());
    for (auto it = m_favorites.rbegin(); it != m_favorites.rend(); ++it) {
        domain::NoteRecord r;
        std::tie(r.updatedAt, r.title, r.id) = *it;
        r.isFavorite = true;
        out.push_back(std::move(r));
    }
    return out;
}

std::vector<domain::NoteRecord> RecordIndex::trash() const {
    std::vector<domain::NoteRecord> out;
    out.reserve(m_trash.size());
    for (auto it = m_trash.rbegin(); it != m_trash.rend(); ++it) {
        domain::NoteRecord r;
        domain::Timestamp deletedAt = 0;
        std::tie(deletedAt, r.title, r.id, r.updatedAt, r.isFavorite) = *it;
        r.markDeleted(deletedAt);
        out.push_back(std::move(r));
    }
    return out;
}

std::vector<domain::NoteRecord> RecordIndex::searchTitles(const std::string& query) const {
    const std::string needle = ToLower(query);
    std::vector<domain::NoteRecord> out;
    for (const auto& [id, record] : m_records) {
        if (record.isDeleted) continue;
        if (ToLower(record.title).find(needle) != std::string::npos) {
            out.push_back(record);
        }
    }
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
        return std::tie(a.updatedAt, a.title, a.id) > std::tie(b.updatedAt, b.title, b.id);
    });
    return out;
}

void RecordIndex::clear() {
    m_records.clear();
    m_active.clear();
    m_favorites.clear();
    m_trash.clear();
}

} // namespace dialog::infrastructure
