/**
 * @file NoteRecord.hpp
 * @brief Domain entity representing a single note and its lifecycle flags.
 */

#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace dialog::domain {

/// Milliseconds since the Unix epoch.
using Timestamp = std::int64_t;

/**
 * @struct NoteRecord
 * @brief A note as stored in the cache and in its per-record file.
 *
 * isDeleted == true  <=> deletedAt has a value.
 */
struct NoteRecord {
    std::string id; ///< Opaque unique identifier.
    std::string title; ///< Display title.
    nlohmann::json content; ///< Editor payload, never interpreted here. Null for new notes.
    Timestamp updatedAt = 0; ///< Last edit or restore time.
    bool isFavorite = false;
    bool isDeleted = false;
    std::optional<Timestamp> deletedAt; ///< Set while the note sits in the trash.

    /** @brief Moves the note to the trash at the given time. */
    void markDeleted(Timestamp when) {
        isDeleted = true;
        deletedAt = when;
    }

    /** @brief Takes the note out of the trash. */
    void clearDeleted() {
        isDeleted = false;
        deletedAt.reset();
    }
};

/** @brief Default title for notes created without one. */
inline const char* const kUntitled = "Untitled";

} // namespace dialog::domain
