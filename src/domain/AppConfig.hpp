/**
 * @file AppConfig.hpp
 * @brief Application settings persisted in app.json.
 */

#pragma once
#include <optional>
#include <string>

namespace dialog::domain {

enum class Theme { Light, Dark };

enum class AiProvider { OpenAI, Gemini, Claude, DeepSeek, Custom };

struct EditorPreferences {
    int fontSize = 16;
    double lineHeight = 1.6;
    bool spellcheck = true;
};

/**
 * @struct AiSettings
 * @brief Connection settings for the AI block. Only stored here, never used to connect.
 */
struct AiSettings {
    AiProvider provider = AiProvider::OpenAI;
    std::string baseUrl = "https://api.openai.com/v1";
    std::string apiKey;
    std::string model = "gpt-4o";
};

struct AppConfig {
    Theme theme = Theme::Light;
    std::optional<std::string> accentColor;
    EditorPreferences editor;
    int autoSaveInterval = 1000; ///< Milliseconds.
    AiSettings ai;
};

} // namespace dialog::domain
