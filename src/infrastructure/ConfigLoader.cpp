/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/ArtifactSerializer.hpp"
#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>

namespace sortwell::infrastructure {

using json = nlohmann::json;

namespace {

template <typename T>
void ReadKey(const json& j, const char* key, T& out) {
    if (!j.contains(key)) return;
    try {
        out = j.at(key).get<T>();
    } catch (const json::exception& e) {
        std::cerr << "[ConfigLoader] Ignoring invalid value for '" << key << "': " << e.what() << std::endl;
    }
}

} // namespace

std::filesystem::path ConfigLoader::GetDefaultSettingsPath() {
    return PathUtils::GetConfigHome() / "sortwell" / "settings.json";
}

Settings ConfigLoader::Load(const std::filesystem::path& path) {
    Settings settings;

    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        try {
            std::ifstream f(path);
            json j;
            f >> j;
            settings = FromJson(j);
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Error reading " << path.string() << ": " << e.what() << std::endl;
        }
    }

    if (settings.openaiApiKey.empty()) {
        const char* envKey = std::getenv("OPENAI_API_KEY");
        if (envKey && *envKey) {
            settings.openaiApiKey = envKey;
        }
    }
    return settings;
}

bool ConfigLoader::Save(const Settings& settings, const std::filesystem::path& path) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            std::cerr << "[ConfigLoader] Cannot create " << path.parent_path().string() << ": " << ec.message()
                      << std::endl;
            return false;
        }
    }

    std::ofstream f(path);
    if (!f.is_open()) {
        std::cerr << "[ConfigLoader] Error writing " << path.string() << std::endl;
        return false;
    }
    f << ToJson(settings).dump(4, ' ', false, json::error_handler_t::replace);
    return !f.fail();
}

Settings ConfigLoader::FromJson(const json& j) {
    Settings s;
    if (!j.is_object()) return s;

    if (j.contains("classifier") && j["classifier"].is_object()) {
        const auto& c = j["classifier"];
        ReadKey(c, "provider", s.provider);
        ReadKey(c, "timeoutSeconds", s.timeoutSeconds);
        ReadKey(c, "retries", s.retries);
        ReadKey(c, "initialBackoffMs", s.initialBackoffMs);
        ReadKey(c, "concurrency", s.classifierConcurrency);
        if (c.contains("ollama") && c["ollama"].is_object()) {
            ReadKey(c["ollama"], "host", s.ollamaHost);
            ReadKey(c["ollama"], "port", s.ollamaPort);
            ReadKey(c["ollama"], "model", s.ollamaModel);
        }
        if (c.contains("openai") && c["openai"].is_object()) {
            ReadKey(c["openai"], "baseUrl", s.openaiBaseUrl);
            ReadKey(c["openai"], "model", s.openaiModel);
            ReadKey(c["openai"], "apiKey", s.openaiApiKey);
        }
    }

    ReadKey(j, "outputDir", s.outputDir);

    if (j.contains("scan") && j["scan"].is_object()) {
        ReadKey(j["scan"], "maxDepth", s.maxDepth);
        ReadKey(j["scan"], "includeHidden", s.includeHidden);
        ReadKey(j["scan"], "extractMetadata", s.extractMetadata);
    }

    if (j.contains("preferences") && j["preferences"].is_object()) {
        const auto& p = j["preferences"];
        if (p.contains("naming") && p["naming"].is_object()) {
            std::string style = domain::NamingStyleToString(s.preferences.naming.style);
            ReadKey(p["naming"], "style", style);
            s.preferences.naming.style = domain::NamingStyleFromString(style);
            ReadKey(p["naming"], "removeSpecialChars", s.preferences.naming.removeSpecialChars);
        }
        if (p.contains("confidenceThresholds") && p["confidenceThresholds"].is_object()) {
            ReadKey(p["confidenceThresholds"], "autoApprove", s.preferences.confidenceThresholds.autoApprove);
            ReadKey(p["confidenceThresholds"], "requireReview", s.preferences.confidenceThresholds.requireReview);
        }
        ReadKey(p, "defaultFolders", s.preferences.defaultFolders);
        ReadKey(p, "ignorePaths", s.preferences.ignorePaths);
    }
    return s;
}

json ConfigLoader::ToJson(const Settings& s) {
    return json{
        {"classifier", {
            {"provider", s.provider},
            {"timeoutSeconds", s.timeoutSeconds},
            {"retries", s.retries},
            {"initialBackoffMs", s.initialBackoffMs},
            {"concurrency", s.classifierConcurrency},
            {"ollama", {{"host", s.ollamaHost}, {"port", s.ollamaPort}, {"model", s.ollamaModel}}},
            {"openai", {{"baseUrl", s.openaiBaseUrl}, {"model", s.openaiModel}}}
        }},
        {"outputDir", s.outputDir},
        {"scan", {
            {"maxDepth", s.maxDepth},
            {"includeHidden", s.includeHidden},
            {"extractMetadata", s.extractMetadata}
        }},
        {"preferences", ArtifactSerializer::ToJson(s.preferences)}
    };
}

} // namespace sortwell::infrastructure
