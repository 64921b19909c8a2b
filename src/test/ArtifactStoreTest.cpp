#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

#include "application/Executor.hpp"
#include "application/PlanBuilder.hpp"
#include "infrastructure/ArtifactSerializer.hpp"
#include "infrastructure/ArtifactStore.hpp"
#include "infrastructure/PathUtils.hpp"

namespace fs = std::filesystem;
using namespace sortwell;
using infrastructure::ArtifactSerializer;
using infrastructure::ArtifactStore;

namespace {

std::string ReadAll(const fs::path& path) {
    std::ifstream f(path);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

domain::Manifest SampleManifest() {
    domain::Manifest manifest;
    manifest.id = "m1";
    manifest.scanRoot = "/data/inbox";
    manifest.createdAt = "2026-01-02T03:04:05Z";
    manifest.scanOptions.rootPath = "/data/inbox";
    manifest.scanOptions.ignorePatterns = {"*.tmp"};
    manifest.scanOptions.maxDepth = 4;

    domain::ManifestEntry doc;
    doc.path = "/data/inbox/Biology - Cells.pdf";
    doc.relativePath = "Biology - Cells.pdf";
    doc.name = "Biology - Cells.pdf";
    doc.extension = ".pdf";
    doc.size = 2048;
    doc.kind = domain::ItemKind::Document;
    doc.confidence = 0.6;
    doc.signals = {"Extension match: Documents"};
    doc.suggestedCategory = "Documents";
    doc.documentMetadata = domain::DocumentMetadata{};
    doc.documentMetadata->title = "Cells";
    doc.documentMetadata->subject = "Biology";
    doc.documentMetadata->keywords = {"cells", "biology"};
    doc.documentMetadata->pageCount = 12;
    doc.documentMetadata->extractionMethod = "filename";
    manifest.entries.push_back(doc);

    domain::ManifestEntry project;
    project.path = "/data/inbox/webapp";
    project.relativePath = "webapp";
    project.name = "webapp";
    project.kind = domain::ItemKind::ProjectRoot;
    project.confidence = 1.0;
    project.projectRoot = domain::ProjectRootDetection{true, {".git", "package.json"}, domain::ProjectType::Node, 1.0};
    project.recommendedHandling = domain::RecommendedHandling::Keep;
    manifest.entries.push_back(project);

    manifest.summary.totalItems = 2;
    manifest.summary.documents = 1;
    manifest.summary.projectRoots = 1;
    return manifest;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ArtifactStore Test..." << std::endl;

    fs::path dir = infrastructure::PathUtils::Normalize(fs::temp_directory_path() / "sortwell_artifact_test");
    fs::remove_all(dir);
    ArtifactStore store(dir / "artifacts");

    // Manifest
    auto manifest = SampleManifest();
    auto manifestPath = store.saveManifest(manifest);
    assert(manifestPath && manifestPath->filename() == "manifest-m1.json");
    assert(ReadAll(*manifestPath).find("\"schemaVersion\": 1") != std::string::npos);

    auto loadedManifest = ArtifactStore::LoadManifest(*manifestPath);
    assert(loadedManifest && loadedManifest->id == "m1");
    assert(loadedManifest->entries.size() == 2);
    const auto& doc = loadedManifest->entries[0];
    assert(doc.kind == domain::ItemKind::Document && doc.size == 2048);
    assert(doc.documentMetadata && doc.documentMetadata->pageCount == std::optional<int>(12));
    assert(doc.documentMetadata->keywords.size() == 2);
    assert(!doc.documentMetadata->author && "Absent fields stay absent.");
    const auto& project = loadedManifest->entries[1];
    assert(project.projectRoot && project.projectRoot->projectType == domain::ProjectType::Node);
    assert(project.recommendedHandling == domain::RecommendedHandling::Keep);
    assert(loadedManifest->scanOptions.maxDepth == 4);
    std::cout << "[PASS] Manifest persistence" << std::endl;

    // Plan and rollback
    application::PlanBuilder builder;
    auto result = builder.build(manifest, "/data/organized", domain::UserPreferences::Defaults());
    auto planPath = store.savePlan(result.plan);
    auto rollbackPath = store.saveRollback(result.rollback);
    assert(planPath && planPath->filename() == "plan-" + result.plan.id + ".json");
    assert(rollbackPath && rollbackPath->filename() == "rollback-" + result.plan.id + ".json");

    auto loadedPlan = ArtifactStore::LoadPlan(*planPath);
    assert(loadedPlan && loadedPlan->actions.size() == result.plan.actions.size());
    assert(loadedPlan->safetyCheck.passed == result.plan.safetyCheck.passed);
    assert(loadedPlan->userPreferences.defaultFolders.at("Unknown") == "Inbox");
    for (size_t i = 0; i < loadedPlan->actions.size(); ++i) {
        assert(loadedPlan->actions[i].to == result.plan.actions[i].to);
        assert(loadedPlan->actions[i].actionType == result.plan.actions[i].actionType);
    }

    auto loadedRollback = ArtifactStore::LoadRollback(*rollbackPath);
    assert(loadedRollback && loadedRollback->entries.size() == result.rollback.entries.size());
    std::cout << "[PASS] Plan persistence" << std::endl;

    // Execution report and log
    domain::ExecutionReport report;
    report.planId = result.plan.id;
    report.executedAt = "2026-01-02T03:04:05Z";
    const auto& moved = result.plan.actions.front();
    domain::ExecutionResult completed;
    completed.actionId = moved.id;
    completed.status = domain::ExecutionStatus::Completed;
    completed.actualDestination = moved.to;
    report.results.push_back(completed);
    report.summary = {1, 1, 0, 0};
    report.rollback.planId = result.plan.id;
    report.rollback.entries.push_back({moved.to, moved.from, moved.id, report.executedAt});
    report.rollback.createdDirectories = {"/data/organized"};

    auto reportPath = store.saveExecutionReport(report);
    assert(reportPath && reportPath->filename() == "execution-" + result.plan.id + "-2026-01-02T03-04-05Z.json");
    auto loadedReport = ArtifactStore::LoadExecutionReport(*reportPath);
    assert(loadedReport && loadedReport->summary.completed == 1);
    assert(loadedReport->rollback.createdDirectories.size() == 1);

    auto logPath = store.saveExecutionLog(report, result.plan);
    assert(logPath && logPath->filename() == "execution-log-2026-01-02T03-04-05Z.txt");
    std::string log = ReadAll(*logPath);
    assert(log.find("FILE ORGANIZATION EXECUTION LOG") != std::string::npos);
    assert(log.find("Plan ID: " + result.plan.id) != std::string::npos);
    assert(log.find("[COMPLETED] " + domain::ActionTypeToString(moved.actionType)) != std::string::npos);
    assert(log.find("rollback-" + result.plan.id + ".json") != std::string::npos);
    std::cout << "[PASS] Execution report and log" << std::endl;

    // Runs in the same second keep separate artifacts
    {
        auto again = store.saveExecutionReport(report);
        assert(again && *again != *reportPath);
        assert(again->filename() == "execution-" + result.plan.id + "-2026-01-02T03-04-05Z-2.json");
        assert(ArtifactStore::LoadExecutionReport(*reportPath) && "The first report is untouched.");

        auto runRollback = store.saveExecutionRollback(report);
        assert(runRollback && runRollback->filename() == "rollback-" + result.plan.id + "-2026-01-02T03-04-05Z.json");
        assert(fs::exists(*rollbackPath) && "The planned rollback is kept.");
        auto loaded = ArtifactStore::LoadRollback(*runRollback);
        assert(loaded && loaded->planId == result.plan.id && loaded->entries.size() == 1);

        std::string customLog = ArtifactStore::FormatExecutionLog(report, result.plan, runRollback->filename().string());
        assert(customLog.find(runRollback->filename().string()) != std::string::npos);

        domain::ExecutionReport undoReport;
        undoReport.planId = result.plan.id;
        undoReport.executedAt = "2026-01-02T04:00:00Z";
        auto undoPath = store.saveUndoReport(undoReport);
        assert(undoPath && undoPath->filename() == "undo-" + result.plan.id + "-2026-01-02T04-00-00Z.json");
        assert(ArtifactStore::LoadExecutionReport(*undoPath));
        std::cout << "[PASS] Per-run artifacts" << std::endl;
    }

    // Two batches of one plan, each undone from its own rollback file
    {
        fs::path src = dir / "batches" / "src";
        fs::path dest = dir / "batches" / "organized";
        fs::create_directories(src);
        std::ofstream(src / "a.txt") << "A";
        std::ofstream(src / "b.txt") << "B";

        domain::Plan plan;
        plan.id = "batched";
        for (const char* name : {"a.txt", "b.txt"}) {
            domain::PlanAction action;
            action.id = name[0] == 'a' ? "a" : "b";
            action.from = (src / name).string();
            action.to = (dest / name).string();
            action.actionType = domain::ActionType::Move;
            action.approved = action.id == "a";
            plan.actions.push_back(action);
        }

        application::Executor executor;
        auto first = executor.execute(plan);
        application::ExecuteOptions selectB;
        selectB.selectedActionIds = std::vector<std::string>{"b"};
        auto second = executor.execute(plan, selectB);
        second.executedAt = first.executedAt; // same second as the first run
        assert(first.summary.completed == 1 && second.summary.completed == 1);

        auto firstPath = store.saveExecutionRollback(first);
        auto secondPath = store.saveExecutionRollback(second);
        assert(firstPath && secondPath && *firstPath != *secondPath);

        for (const auto& path : {*secondPath, *firstPath}) {
            auto rollback = ArtifactStore::LoadRollback(path);
            assert(rollback && rollback->entries.size() == 1);
            auto undone = executor.undo(*rollback);
            assert(undone.summary.failed == 0);
        }
        assert(ReadAll(src / "a.txt") == "A" && ReadAll(src / "b.txt") == "B");
        std::cout << "[PASS] Batched runs undo independently" << std::endl;
    }

    // Names that are not valid UTF-8
    {
        const std::string latin1 = "/data/inbox/caf\xe9.jpg";
        auto odd = SampleManifest();
        odd.id = "m-latin1";
        odd.entries[0].path = latin1;
        odd.entries[0].relativePath = "caf\xe9.jpg";
        odd.entries[0].name = "caf\xe9.jpg";
        odd.entries[0].documentMetadata->title = std::string("Caf\xe9 ") + "\xc3"; // cut mid-sequence

        auto path = store.saveManifest(odd);
        assert(path && "Saving never throws on foreign encodings.");
        auto loaded = ArtifactStore::LoadManifest(*path);
        assert(loaded && loaded->entries[0].path == latin1 && "Paths round-trip byte for byte.");
        assert(loaded->entries[0].name == "caf\xe9.jpg");
        assert(loaded->entries[1].path == "/data/inbox/webapp");

        assert(ArtifactSerializer::PathToJson("plain/caf\xc3\xa9.jpg").is_string());
        assert(ArtifactSerializer::PathToJson("\xff").is_object());
        assert(ArtifactSerializer::PathFromJson(ArtifactSerializer::PathToJson("a\x80")) == "a\x80");

        domain::Rollback rollback;
        rollback.planId = "latin1";
        rollback.entries.push_back({"/dest/caf\xe9.jpg", latin1, "x1", "2026-01-02T03:04:05Z"});
        rollback.createdDirectories = {"/dest/caf\xe9"};
        auto rollbackFile = store.saveRollback(rollback);
        assert(rollbackFile);
        auto loadedRollback = ArtifactStore::LoadRollback(*rollbackFile);
        assert(loadedRollback && loadedRollback->entries[0].to == latin1);
        assert(loadedRollback->createdDirectories.front() == "/dest/caf\xe9");

        std::ofstream(dir / "badhex.json") << R"({"planId": "x", "entries": [{"from": {"hex": "zz"}, "to": "/a"}]})";
        assert(!ArtifactStore::LoadRollback(dir / "badhex.json"));
        std::cout << "[PASS] Non-UTF-8 names" << std::endl;
    }

    // Broken files
    std::ofstream(dir / "broken.json") << "{ not json";
    assert(!ArtifactStore::LoadPlan(dir / "broken.json"));
    std::ofstream(dir / "wrong.json") << R"({"id": "x"})";
    assert(!ArtifactStore::LoadPlan(dir / "wrong.json") && "Missing required keys reject the artifact.");
    std::ofstream(dir / "future.json") << R"({"schemaVersion": 99, "planId": "x", "entries": []})";
    assert(!ArtifactStore::LoadRollback(dir / "future.json"));
    assert(!ArtifactStore::LoadManifest(dir / "missing.json"));
    std::cout << "[PASS] Malformed artifacts" << std::endl;

    // No temp files left behind
    for (const auto& entry : fs::directory_iterator(dir / "artifacts")) {
        assert(entry.path().extension() != ".tmp");
    }

    fs::remove_all(dir);
    std::cout << "[PASS] ArtifactStore Test completed." << std::endl;
    return 0;
}
