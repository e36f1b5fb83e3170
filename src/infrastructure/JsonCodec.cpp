/**
 * @file JsonCodec.cpp
 * @brief Implementation of the domain JSON conversions.
 */

#include "infrastructure/JsonCodec.hpp"
#include <stdexcept>

namespace dialog::domain {

using json = nlohmann::json;

void to_json(json& j, const NoteRecord& record) {
    j = json{
        {"id", record.id},
        {"title", record.title},
        {"content", record.content},
        {"updatedAt", record.updatedAt},
        {"isFavorite", record.isFavorite},
        {"isDeleted", record.isDeleted},
    };
    if (record.deletedAt) {
        j["deletedAt"] = *record.deletedAt;
    }
}

void from_json(const json& j, NoteRecord& record) {
    record.id = j.at("id").get<std::string>();
    record.title = j.value("title", std::string(kUntitled));
    record.content = j.contains("content") ? j["content"] : json();
    record.updatedAt = j.value("updatedAt", Timestamp{0});
    record.isFavorite = j.value("isFavorite", false);
    record.isDeleted = j.value("isDeleted", false);

    record.deletedAt.reset();
    if (record.isDeleted) {
        // Older files may lack deletedAt; fall back to the last edit time.
        auto it = j.find("deletedAt");
        record.deletedAt = (it != j.end() && it->is_number()) ? it->get<Timestamp>() : record.updatedAt;
    }
}

void to_json(json& j, const NoteSummary& note) {
    j = json{{"id", note.id}, {"title", note.title}, {"updatedAt", note.updatedAt}};
}

void from_json(const json& j, NoteSummary& note) {
    note.id = j.at("id").get<std::string>();
    note.title = j.value("title", std::string(kUntitled));
    note.updatedAt = j.value("updatedAt", Timestamp{0});
}

void to_json(json& j, const TrashEntry& entry) {
    j = json{{"id", entry.id}, {"title", entry.title}, {"deletedAt", entry.deletedAt}};
}

void from_json(const json& j, TrashEntry& entry) {
    entry.id = j.at("id").get<std::string>();
    entry.title = j.value("title", std::string(kUntitled));
    entry.deletedAt = j.value("deletedAt", Timestamp{0});
}

void to_json(json& j, const SidebarState& sidebar) {
    j = json{{"collapsed", sidebar.collapsed}, {"width", sidebar.width}};
}

void from_json(const json& j, SidebarState& sidebar) {
    sidebar.collapsed = j.value("collapsed", sidebar.collapsed);
    sidebar.width = j.value("width", sidebar.width);
}

void to_json(json& j, const WindowState& window) {
    j = json{{"width", window.width}, {"height", window.height}, {"maximized", window.maximized}};
    if (window.x) j["x"] = *window.x;
    if (window.y) j["y"] = *window.y;
}

void from_json(const json& j, WindowState& window) {
    window.width = j.value("width", 0);
    window.height = j.value("height", 0);
    window.maximized = j.value("maximized", false);
    window.x = j.contains("x") ? std::optional<int>(j["x"].get<int>()) : std::nullopt;
    window.y = j.contains("y") ? std::optional<int>(j["y"].get<int>()) : std::nullopt;
}

void to_json(json& j, const WorkspaceSnapshot& snapshot) {
    j = json{
        {"activeRecordId", snapshot.activeRecordId ? json(*snapshot.activeRecordId) : json(nullptr)},
        {"sidebar", snapshot.sidebar},
        {"recentIds", snapshot.recentIds},
        {"notes", snapshot.notes},
        {"favorites", snapshot.favorites},
        {"trash", snapshot.trash},
    };
    if (snapshot.window) {
        j["window"] = *snapshot.window;
    }
}

void from_json(const json& j, WorkspaceSnapshot& snapshot) {
    if (!j.is_object()) {
        throw std::invalid_argument("workspace must be an object, got " + std::string(j.type_name()));
    }

    if (auto it = j.find("activeRecordId"); it != j.end()) {
        snapshot.activeRecordId = it->is_string() ? std::optional<std::string>(it->get<std::string>()) : std::nullopt;
    }
    if (auto it = j.find("sidebar"); it != j.end()) {
        it->get_to(snapshot.sidebar);
    }
    if (auto it = j.find("recentIds"); it != j.end()) {
        it->get_to(snapshot.recentIds);
    }
    if (auto it = j.find("notes"); it != j.end()) {
        it->get_to(snapshot.notes);
    }
    if (auto it = j.find("favorites"); it != j.end()) {
        it->get_to(snapshot.favorites);
    }
    if (auto it = j.find("trash"); it != j.end()) {
        it->get_to(snapshot.trash);
    }
    if (auto it = j.find("window"); it != j.end() && it->is_object()) {
        snapshot.window = it->get<WindowState>();
    }
}

void to_json(json& j, const EditorPreferences& editor) {
    j = json{{"fontSize", editor.fontSize}, {"lineHeight", editor.lineHeight}, {"spellcheck", editor.spellcheck}};
}

void from_json(const json& j, EditorPreferences& editor) {
    const EditorPreferences defaults;
    editor.fontSize = j.value("fontSize", defaults.fontSize);
    editor.lineHeight = j.value("lineHeight", defaults.lineHeight);
    editor.spellcheck = j.value("spellcheck", defaults.spellcheck);
}

void to_json(json& j, const AiSettings& ai) {
    j = json{{"provider", ai.provider}, {"baseUrl", ai.baseUrl}, {"apiKey", ai.apiKey}, {"model", ai.model}};
}

void from_json(const json& j, AiSettings& ai) {
    const AiSettings defaults;
    ai.provider = j.value("provider", defaults.provider);
    ai.baseUrl = j.value("baseUrl", defaults.baseUrl);
    ai.apiKey = j.value("apiKey", defaults.apiKey);
    ai.model = j.value("model", defaults.model);
}

void to_json(json& j, const AppConfig& config) {
    j = json{
        {"theme", config.theme},
        {"editor", config.editor},
        {"autoSaveInterval", config.autoSaveInterval},
        {"ai", config.ai},
    };
    if (config.accentColor) {
        j["accentColor"] = *config.accentColor;
    }
}

void from_json(const json& j, AppConfig& config) {
    const AppConfig defaults;
    config.theme = j.value("theme", defaults.theme);
    config.accentColor = j.contains("accentColor") && j["accentColor"].is_string()
        ? std::optional<std::string>(j["accentColor"].get<std::string>())
        : std::nullopt;
    config.editor = j.value("editor", defaults.editor);
    config.autoSaveInterval = j.value("autoSaveInterval", defaults.autoSaveInterval);
    config.ai = j.value("ai", defaults.ai);
}

} // namespace dialog::domain
