/**
 * @file SortwellApp.cpp
 * @brief Implementation of the SortwellApp class.
 */
#include "app/SortwellApp.hpp"

#include "application/Executor.hpp"
#include "application/ManifestBuilder.hpp"
#include "application/PlanBuilder.hpp"
#include "infrastructure/ClassifierFactory.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/PdfMetadataExtractor.hpp"

#include <atomic>
#include <csignal>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>

namespace sortwell::app {

namespace {

std::atomic<bool> g_interrupted{false};

void OnInterrupt(int) {
    g_interrupted = true;
}

std::vector<std::string> SplitList(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) items.push_back(item);
    }
    return items;
}

// Removes "--flag value" from args; returns the value if present.
std::optional<std::string> TakeOption(std::vector<std::string>& args, const std::string& flag) {
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == flag && i + 1 < args.size()) {
            std::string value = args[i + 1];
            args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i) + 2);
            return value;
        }
    }
    return std::nullopt;
}

bool TakeFlag(std::vector<std::string>& args, const std::string& flag) {
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == flag) {
            args.erase(args.begin() + static_cast<long>(i));
            return true;
        }
    }
    return false;
}

void PrintStatus(const std::string& message) {
    std::cout << "  " << message << std::endl;
}

} // namespace

int SortwellApp::Run(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty() || args[0] == "-h" || args[0] == "--help") {
        PrintUsage();
        return args.empty() ? 2 : 0;
    }

    std::string command = args[0];
    args.erase(args.begin());

    std::string configPath = TakeOption(args, "--config").value_or("");
    std::string outputDir = TakeOption(args, "--output").value_or("");
    if (!Init(configPath, outputDir)) {
        return 1;
    }

    static const std::map<std::string, int (SortwellApp::*)(const std::vector<std::string>&)> kCommands = {
        {"scan", &SortwellApp::cmdScan},
        {"plan", &SortwellApp::cmdPlan},
        {"execute", &SortwellApp::cmdExecute},
        {"undo", &SortwellApp::cmdUndo},
        {"status", &SortwellApp::cmdStatus},
    };

    auto it = kCommands.find(command);
    if (it == kCommands.end()) {
        std::cerr << "[SortwellApp] Unknown command: " << command << std::endl;
        PrintUsage();
        return 2;
    }
    return (this->*(it->second))(args);
}

bool SortwellApp::Init(const std::string& configPath, const std::string& outputDir) {
    std::filesystem::path settingsPath =
        configPath.empty() ? infrastructure::ConfigLoader::GetDefaultSettingsPath() : std::filesystem::path(configPath);
    m_settings = infrastructure::ConfigLoader::Load(settingsPath);

    std::filesystem::path artifacts;
    if (!outputDir.empty()) {
        artifacts = outputDir;
    } else if (!m_settings.outputDir.empty()) {
        artifacts = m_settings.outputDir;
    } else {
        artifacts = infrastructure::PathUtils::GetArtifactsDir();
    }
    if (artifacts.empty()) {
        std::cerr << "[SortwellApp] No usable artifact directory" << std::endl;
        return false;
    }
    m_store = std::make_unique<infrastructure::ArtifactStore>(artifacts);
    std::cout << "[SortwellApp] Artifacts: " << artifacts.string() << std::endl;
    return true;
}

int SortwellApp::cmdScan(const std::vector<std::string>& input) {
    auto args = input;
    bool noClassifier = TakeFlag(args, "--no-classifier");
    bool includeHidden = TakeFlag(args, "--include-hidden");
    auto depth = TakeOption(args, "--max-depth");
    if (args.size() != 1) {
        std::cerr << "Usage: sortwell scan <root> [--no-classifier] [--include-hidden] [--max-depth N]" << std::endl;
        return 2;
    }

    domain::ScanOptions options;
    options.rootPath = args[0];
    options.ignorePatterns = m_settings.preferences.ignorePaths;
    options.includeHidden = includeHidden || m_settings.includeHidden;
    options.maxDepth = m_settings.maxDepth;
    if (depth) {
        try {
            options.maxDepth = std::stoi(*depth);
        } catch (const std::exception&) {
            std::cerr << "[SortwellApp] Invalid --max-depth: " << *depth << std::endl;
            return 2;
        }
    }
    options.extractMetadata = m_settings.extractMetadata;
    options.classifierConcurrency = m_settings.classifierConcurrency;
    options.reviewThreshold = m_settings.preferences.confidenceThresholds.requireReview;

    std::shared_ptr<domain::ClassifierService> classifier;
    if (!noClassifier) {
        classifier = infrastructure::ClassifierFactory::Create(m_settings);
        if (classifier && !classifier->checkConnection()) {
            std::cerr << "[SortwellApp] Classifier '" << classifier->providerName()
                      << "' is unreachable, continuing with extension heuristics" << std::endl;
            classifier.reset();
        }
    }
    options.useClassifier = classifier != nullptr;

    application::ManifestBuilder builder(classifier, std::make_shared<infrastructure::PdfMetadataExtractor>());
    auto manifest = builder.build(options, PrintStatus);

    const auto& s = manifest.summary;
    std::cout << "\nManifest " << manifest.id << "\n"
              << "  Items: " << s.totalItems << "\n"
              << "  Project roots: " << s.projectRoots << "\n"
              << "  Documents: " << s.documents << "  Media: " << s.media << "  Archives: " << s.archives
              << "  Code: " << s.code << "  Generated: " << s.generated << "  Unknown: " << s.unknown << "\n"
              << "  Confidence high/medium/low: " << s.highConfidence << "/" << s.mediumConfidence << "/"
              << s.lowConfidence << std::endl;

    auto path = m_store->saveManifest(manifest);
    if (!path) return 1;
    std::cout << path->string() << std::endl;
    return 0;
}

int SortwellApp::cmdPlan(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        std::cerr << "Usage: sortwell plan <manifest.json> <destRoot>" << std::endl;
        return 2;
    }
    auto manifest = infrastructure::ArtifactStore::LoadManifest(args[0]);
    if (!manifest) {
        std::cerr << "[SortwellApp] Cannot load manifest " << args[0] << std::endl;
        return 1;
    }

    application::PlanBuilder builder;
    auto result = builder.build(*manifest, args[1], m_settings.preferences, PrintStatus);
    const auto& plan = result.plan;

    std::cout << "\nPlan " << plan.id << "\n"
              << "  Actions: " << plan.summary.totalActions << " (moves " << plan.summary.moves << ", renames "
              << plan.summary.renames << ", skips " << plan.summary.skips << ")\n"
              << "  Collisions resolved: " << plan.safetyCheck.collisionsResolved << "\n"
              << "  Safety check: " << (plan.safetyCheck.passed ? "PASSED" : "FAILED") << std::endl;
    for (const auto& error : plan.safetyCheck.errors) {
        std::cout << "  ERROR: " << error << std::endl;
    }
    for (const auto& warning : plan.safetyCheck.warnings) {
        std::cout << "  WARNING: " << warning << std::endl;
    }

    auto planPath = m_store->savePlan(plan);
    if (!planPath || !m_store->saveRollback(result.rollback)) return 1;
    std::cout << planPath->string() << std::endl;
    return plan.safetyCheck.passed ? 0 : 1;
}

int SortwellApp::cmdExecute(const std::vector<std::string>& input) {
    auto args = input;
    application::ExecuteOptions options;
    options.dryRun = TakeFlag(args, "--dry-run");
    options.allowUnsafePlan = TakeFlag(args, "--allow-unsafe");
    if (auto select = TakeOption(args, "--select")) {
        options.selectedActionIds = SplitList(*select);
    }
    if (args.size() != 1) {
        std::cerr << "Usage: sortwell execute <plan.json> [--dry-run] [--select id,id] [--allow-unsafe]" << std::endl;
        return 2;
    }

    auto plan = infrastructure::ArtifactStore::LoadPlan(args[0]);
    if (!plan) {
        std::cerr << "[SortwellApp] Cannot load plan " << args[0] << std::endl;
        return 1;
    }

    g_interrupted = false;
    std::signal(SIGINT, OnInterrupt);
    options.shouldCancel = [] { return g_interrupted.load(); };

    application::Executor executor;
    auto report = executor.execute(*plan, options);
    std::signal(SIGINT, SIG_DFL);

    std::string rollbackFile;
    if (!options.dryRun) {
        if (!m_store->saveExecutionReport(report)) return 1;
        // One rollback per run, holding only the moves this run made.
        auto rollbackPath = m_store->saveExecutionRollback(report);
        if (!rollbackPath) return 1;
        rollbackFile = rollbackPath->filename().string();
        std::cout << "Rollback: " << rollbackPath->string() << std::endl;
    }
    if (!m_store->saveExecutionLog(report, *plan, rollbackFile)) return 1;

    return report.summary.failed == 0 ? 0 : 1;
}

int SortwellApp::cmdUndo(const std::vector<std::string>& input) {
    auto args = input;
    bool dryRun = TakeFlag(args, "--dry-run");
    if (args.size() != 1) {
        std::cerr << "Usage: sortwell undo <rollback.json> [--dry-run]" << std::endl;
        return 2;
    }

    auto rollback = infrastructure::ArtifactStore::LoadRollback(args[0]);
    if (!rollback) {
        std::cerr << "[SortwellApp] Cannot load rollback " << args[0] << std::endl;
        return 1;
    }

    application::Executor executor;
    auto report = executor.undo(*rollback, dryRun);
    if (!dryRun) {
        auto reportPath = m_store->saveUndoReport(report);
        if (!reportPath) return 1;
        std::cout << "Undo report: " << reportPath->string() << std::endl;
    }
    return report.summary.failed == 0 ? 0 : 1;
}

int SortwellApp::cmdStatus(const std::vector<std::string>& args) {
    if (!args.empty()) {
        std::cerr << "Usage: sortwell status" << std::endl;
        return 2;
    }

    std::cout << "Provider: " << m_settings.provider << std::endl;
    auto classifier = infrastructure::ClassifierFactory::Create(m_settings);
    if (!classifier) {
        std::cout << "Classification disabled; extension heuristics only." << std::endl;
        return 0;
    }

    std::string version;
    if (!classifier->checkConnection(&version)) {
        std::cout << "Status: unreachable" << std::endl;
        return 1;
    }
    std::cout << "Status: connected" << (version.empty() ? "" : " (" + version + ")") << std::endl;
    std::cout << "Model: " << classifier->getCurrentModel() << std::endl;
    auto models = classifier->getAvailableModels();
    if (!models.empty()) {
        std::cout << "Available models:" << std::endl;
        for (const auto& model : models) {
            std::cout << "  " << model << std::endl;
        }
    }
    return 0;
}

void SortwellApp::PrintUsage() {
    std::cout << "Usage: sortwell <command> [args] [--config settings.json] [--output dir]\n"
              << "\n"
              << "Commands:\n"
              << "  scan <root>                      Build a manifest of a directory tree\n"
              << "  plan <manifest.json> <destRoot>  Build a reviewable plan and its rollback\n"
              << "  execute <plan.json>              Move files [--dry-run] [--select id,id] [--allow-unsafe]\n"
              << "  undo <rollback.json>             Move files back [--dry-run]\n"
              << "  status                           Check the configured classifier\n";
}

} // namespace sortwell::app
