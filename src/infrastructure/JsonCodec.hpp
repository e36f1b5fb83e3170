/**
 * @file JsonCodec.hpp
 * @brief nlohmann::json conversions for the persisted domain types.
 *
 * The functions live in dialog::domain so that nlohmann's ADL lookup finds them.
 */

#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "domain/AppConfig.hpp"
#include "domain/NoteRecord.hpp"
#include "domain/WorkspaceSnapshot.hpp"

namespace dialog::domain {

NLOHMANN_JSON_SERIALIZE_ENUM(Theme, {
    {Theme::Light, "light"},
    {Theme::Dark, "dark"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(AiProvider, {
    {AiProvider::OpenAI, "openai"},
    {AiProvider::Gemini, "gemini"},
    {AiProvider::Claude, "claude"},
    {AiProvider::DeepSeek, "deepseek"},
    {AiProvider::Custom, "custom"},
})

void to_json(nlohmann::json& j, const NoteRecord& record);
/** @brief Missing flags take their defaults; deletedAt is normalized against isDeleted. */
void from_json(const nlohmann::json& j, NoteRecord& record);

void to_json(nlohmann::json& j, const NoteSummary& note);
void from_json(const nlohmann::json& j, NoteSummary& note);
void to_json(nlohmann::json& j, const TrashEntry& entry);
void from_json(const nlohmann::json& j, TrashEntry& entry);
void to_json(nlohmann::json& j, const SidebarState& sidebar);
void from_json(const nlohmann::json& j, SidebarState& sidebar);
void to_json(nlohmann::json& j, const WindowState& window);
void from_json(const nlohmann::json& j, WindowState& window);

void to_json(nlohmann::json& j, const WorkspaceSnapshot& snapshot);
/** @brief Keys absent from the file keep the values already held by @p snapshot. */
void from_json(const nlohmann::json& j, WorkspaceSnapshot& snapshot);

void to_json(nlohmann::json& j, const EditorPreferences& editor);
void from_json(const nlohmann::json& j, EditorPreferences& editor);
void to_json(nlohmann::json& j, const AiSettings& ai);
void from_json(const nlohmann::json& j, AiSettings& ai);
void to_json(nlohmann::json& j, const AppConfig& config);
void from_json(const nlohmann::json& j, AppConfig& config);

} // namespace dialog::domain

namespace dialog::infrastructure {

/// Indent used for every file the storage core writes.
constexpr int kJsonIndent = 2;

/**
 * @brief Pretty-prints a value the way it is stored on disk.
 * Invalid UTF-8 in strings is written as U+FFFD instead of failing the write.
 */
inline std::string toFileText(const nlohmann::json& j) {
    return j.dump(kJsonIndent, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace dialog::infrastructure
