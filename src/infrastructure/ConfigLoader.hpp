/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving application configuration (settings.json).
 *
 * Every key is optional; anything missing or malformed keeps its built-in default.
 */

#pragma once

#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>
#include "domain/Plan.hpp"

namespace sortwell::infrastructure {

/**
 * @struct Settings
 * @brief Explicit configuration value threaded into the pipeline by the caller.
 */
struct Settings {
    // Classifier
    std::string provider = "none"; ///< "none", "ollama" or "openai".
    std::string ollamaHost = "localhost";
    int ollamaPort = 11434;
    std::string ollamaModel = "llama3.1";
    std::string openaiBaseUrl = "https://api.openai.com";
    std::string openaiModel = "gpt-4o-mini";
    std::string openaiApiKey; ///< Falls back to $OPENAI_API_KEY.
    int timeoutSeconds = 60;
    int retries = 2;
    int initialBackoffMs = 1000;
    int classifierConcurrency = 4;

    // Artifacts; empty means PathUtils::GetArtifactsDir().
    std::string outputDir;

    // Scan defaults
    int maxDepth = 10;
    bool includeHidden = false;
    bool extractMetadata = true;

    domain::UserPreferences preferences = domain::UserPreferences::Defaults();
};

class ConfigLoader {
public:
    /** @brief $XDG_CONFIG_HOME/sortwell/settings.json. */
    static std::filesystem::path GetDefaultSettingsPath();

    /**
     * @brief Reads settings.json; returns defaults when the file is absent or unreadable.
     * @param path Settings file.
     */
    static Settings Load(const std::filesystem::path& path);

    /** @brief Writes settings.json, creating its directory. The API key is never written. */
    static bool Save(const Settings& settings, const std::filesystem::path& path);

    static Settings FromJson(const nlohmann::json& j);
    static nlohmann::json ToJson(const Settings& settings);
};

} // namespace sortwell::infrastructure
