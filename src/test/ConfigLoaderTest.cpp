#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

#include "infrastructure/ConfigLoader.hpp"

namespace fs = std::filesystem;
using namespace sortwell::infrastructure;

int main() {
    std::cout << "[Test] Starting ConfigLoader Test..." << std::endl;
    unsetenv("OPENAI_API_KEY");

    fs::path dir = fs::temp_directory_path() / "sortwell_config_test";
    fs::remove_all(dir);
    fs::create_directories(dir);

    // Missing file
    Settings defaults = ConfigLoader::Load(dir / "absent.json");
    assert(defaults.provider == "none");
    assert(defaults.ollamaPort == 11434);
    assert(defaults.maxDepth == 10);
    assert(defaults.preferences.defaultFolders.at("Unknown") == "Inbox");
    std::cout << "[PASS] Defaults without a file" << std::endl;

    // Partial file keeps the other defaults, bad values are ignored
    {
        std::ofstream f(dir / "partial.json");
        f << R"({
            "classifier": {"provider": "ollama", "retries": "many", "ollama": {"model": "mistral"}},
            "scan": {"maxDepth": 3},
            "preferences": {"naming": {"style": "titlecase"}, "confidenceThresholds": {"autoApprove": 0.9}}
        })";
    }
    Settings partial = ConfigLoader::Load(dir / "partial.json");
    assert(partial.provider == "ollama");
    assert(partial.ollamaModel == "mistral");
    assert(partial.ollamaHost == "localhost");
    assert(partial.retries == 2 && "Invalid value keeps the default.");
    assert(partial.maxDepth == 3);
    assert(partial.includeHidden == false);
    assert(partial.preferences.naming.style == sortwell::domain::NamingStyle::TitleCase);
    assert(partial.preferences.confidenceThresholds.autoApprove == 0.9);
    assert(partial.preferences.confidenceThresholds.requireReview == 0.5);
    std::cout << "[PASS] Partial settings" << std::endl;

    // Malformed file
    {
        std::ofstream f(dir / "broken.json");
        f << "{ provider: ";
    }
    Settings broken = ConfigLoader::Load(dir / "broken.json");
    assert(broken.provider == "none");
    std::cout << "[PASS] Malformed settings" << std::endl;

    // Round trip, without the API key
    Settings custom;
    custom.provider = "openai";
    custom.openaiModel = "gpt-test";
    custom.openaiApiKey = "sk-secret";
    custom.classifierConcurrency = 2;
    custom.outputDir = "/tmp/sortwell-out";
    custom.preferences.ignorePaths = {"*.bak"};
    fs::path saved = dir / "nested" / "settings.json";
    assert(ConfigLoader::Save(custom, saved));

    std::ifstream in(saved);
    std::stringstream content;
    content << in.rdbuf();
    assert(content.str().find("sk-secret") == std::string::npos);

    Settings reloaded = ConfigLoader::Load(saved);
    assert(reloaded.provider == "openai");
    assert(reloaded.openaiModel == "gpt-test");
    assert(reloaded.openaiApiKey.empty());
    assert(reloaded.classifierConcurrency == 2);
    assert(reloaded.outputDir == "/tmp/sortwell-out");
    assert(reloaded.preferences.ignorePaths.size() == 1 && reloaded.preferences.ignorePaths[0] == "*.bak");
    std::cout << "[PASS] Save and reload" << std::endl;

    // Environment key
    setenv("OPENAI_API_KEY", "sk-env", 1);
    assert(ConfigLoader::Load(saved).openaiApiKey == "sk-env");
    unsetenv("OPENAI_API_KEY");
    std::cout << "[PASS] API key from environment" << std::endl;

    assert(ConfigLoader::GetDefaultSettingsPath().filename() == "settings.json");

    fs::remove_all(dir);
    std::cout << "[PASS] ConfigLoader Test completed." << std::endl;
    return 0;
}
