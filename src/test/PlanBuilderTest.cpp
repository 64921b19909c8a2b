#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>

#include "application/ManifestBuilder.hpp"
#include "application/PlanBuilder.hpp"
#include "infrastructure/PathUtils.hpp"

namespace fs = std::filesystem;
using namespace sortwell;
using application::PlanBuilder;

namespace {

fs::path g_root;

domain::ManifestEntry MakeEntry(const std::string& relativePath, domain::ItemKind kind, double confidence,
                                std::optional<std::string> category) {
    domain::ManifestEntry entry;
    entry.path = (g_root / "src" / relativePath).string();
    entry.relativePath = relativePath;
    entry.name = fs::path(relativePath).filename().string();
    entry.extension = fs::path(relativePath).extension().string();
    entry.kind = kind;
    entry.confidence = confidence;
    entry.suggestedCategory = std::move(category);
    entry.signals.push_back("Test signal");
    entry.recommendedHandling = application::ManifestBuilder::handlingFor(confidence, 0.5);
    return entry;
}

domain::Manifest MakeManifest(std::vector<domain::ManifestEntry> entries) {
    domain::Manifest manifest;
    manifest.id = "manifest-under-test";
    manifest.scanRoot = (g_root / "src").string();
    manifest.entries = std::move(entries);
    return manifest;
}

const domain::PlanAction& ActionFor(const domain::Plan& plan, const std::string& from) {
    for (const auto& action : plan.actions) {
        if (action.from == from) return action;
    }
    assert(false && "No action for source.");
    return plan.actions.front();
}

void CheckInvariants(const domain::Plan& plan) {
    std::set<std::string> destinations;
    for (const auto& action : plan.actions) {
        assert(!(action.movesInsideProjectRoot && action.actionType != domain::ActionType::Skip));
        if (action.actionType == domain::ActionType::Skip) continue;
        assert(destinations.insert(action.to).second && "Destinations are pairwise distinct.");
    }
    const auto& s = plan.summary;
    assert(s.moves + s.renames + s.skips == s.totalActions);
    assert(s.highConfidence + s.mediumConfidence + s.lowConfidence == s.totalActions);
}

} // namespace

int main() {
    std::cout << "[Test] Starting PlanBuilder Test..." << std::endl;

    g_root = infrastructure::PathUtils::Normalize(fs::temp_directory_path() / "sortwell_plan_test");
    fs::remove_all(g_root);
    fs::create_directories(g_root);
    const std::string dest = (g_root / "organized").string();
    const auto prefs = domain::UserPreferences::Defaults();
    PlanBuilder builder;

    // Two sources share one destination
    {
        auto a = MakeEntry("a/photo.jpg", domain::ItemKind::Media, 0.8, "Images");
        auto b = MakeEntry("b/photo.jpg", domain::ItemKind::Media, 0.8, "Images");
        auto result = builder.build(MakeManifest({a, b}), dest, prefs);
        const auto& plan = result.plan;

        const auto& first = ActionFor(plan, a.path);
        const auto& second = ActionFor(plan, b.path);
        assert(first.toRelative == "Images/photo.jpg");
        assert(second.toRelative == "Images/photo (2).jpg");
        assert(first.hasCollision && second.hasCollision);
        assert(first.actionType == domain::ActionType::Move);
        assert(first.approved && "0.8 meets the default auto-approve threshold.");
        assert(second.reason.find("Collision resolved with suffix") != std::string::npos);
        assert(plan.safetyCheck.passed);
        assert(plan.safetyCheck.collisionsResolved == 2);
        CheckInvariants(plan);

        // Resolving again changes nothing
        auto actions = plan.actions;
        assert(PlanBuilder::resolveCollisions(actions, plan.destRoot) == 0);
        for (size_t i = 0; i < actions.size(); ++i) {
            assert(actions[i].to == plan.actions[i].to);
        }

        assert(result.rollback.planId == plan.id);
        assert(result.rollback.entries.size() == 2);
        assert(result.rollback.entries[1].from == second.to && result.rollback.entries[1].to == b.path);
        std::cout << "[PASS] Collision suffixes" << std::endl;
    }

    // Three-way collision keeps suffixes distinct
    {
        auto a = MakeEntry("x/song.mp3", domain::ItemKind::Media, 0.8, "Audio");
        auto b = MakeEntry("y/song.mp3", domain::ItemKind::Media, 0.8, "Audio");
        auto c = MakeEntry("z/song.mp3", domain::ItemKind::Media, 0.8, "Audio");
        auto plan = builder.build(MakeManifest({a, b, c}), dest, prefs).plan;
        assert(ActionFor(plan, c.path).toRelative == "Audio/song (3).mp3");
        CheckInvariants(plan);
        std::cout << "[PASS] Three-way collision" << std::endl;
    }

    // Destination already on disk
    {
        fs::create_directories(g_root / "organized" / "Archives");
        std::ofstream(g_root / "organized" / "Archives" / "backup.zip") << "old";

        auto zip = MakeEntry("backup.zip", domain::ItemKind::Archive, 0.9, "Archives");
        auto plan = builder.build(MakeManifest({zip}), dest, prefs).plan;
        const auto& action = ActionFor(plan, zip.path);
        assert(action.toRelative == "Archives/backup (2).zip");
        assert(action.hasCollision);
        assert(action.reason.find("Existing file, added suffix") != std::string::npos);
        CheckInvariants(plan);
        std::cout << "[PASS] Existing destination" << std::endl;
    }

    // Low confidence goes to the Inbox untouched
    {
        auto odd = MakeEntry("Weird Name.xyz", domain::ItemKind::Unknown, 0.3, std::nullopt);
        auto tweaked = prefs;
        tweaked.naming.style = domain::NamingStyle::LowerCase;
        auto plan = builder.build(MakeManifest({odd}), dest, tweaked).plan;
        const auto& action = ActionFor(plan, odd.path);
        assert(action.toRelative == "Inbox/Weird Name.xyz");
        assert(!action.approved);
        assert(plan.safetyCheck.lowConfidenceActions == 1);
        assert(plan.safetyCheck.warnings.size() == 1);
        assert(plan.safetyCheck.passed && "Low confidence only warns.");
        std::cout << "[PASS] Inbox routing" << std::endl;
    }

    // Documents are renamed from their metadata
    {
        auto doc = MakeEntry("aow_final.pdf", domain::ItemKind::Document, 0.9, "History");
        doc.documentMetadata = domain::DocumentMetadata{};
        doc.documentMetadata->title = "the art of war";
        auto tweaked = prefs;
        tweaked.naming.style = domain::NamingStyle::LowerCase;
        auto plan = builder.build(MakeManifest({doc}), dest, tweaked).plan;
        const auto& action = ActionFor(plan, doc.path);
        assert(action.toRelative == "History/the art of war.pdf");
        assert(action.actionType == domain::ActionType::MoveRename);
        assert(action.reason.find("Category: History") == 0);
        assert(action.reason.find("Title: the art of war") != std::string::npos);
        assert(plan.summary.categoryCounts.at("History") == 1);
        std::cout << "[PASS] Document naming" << std::endl;
    }

    // Project roots: kept, and never entered
    {
        domain::ProjectRootDetection detection;
        detection.isProjectRoot = true;
        detection.projectType = domain::ProjectType::Node;
        detection.signals = {".git", "package.json"};
        detection.confidence = 1.0;

        auto project = MakeEntry("webapp", domain::ItemKind::ProjectRoot, 1.0, "Projects");
        project.projectRoot = detection;
        project.recommendedHandling = domain::RecommendedHandling::Keep;

        auto inside = MakeEntry("webapp/README.md", domain::ItemKind::Unknown, 1.0, std::nullopt);
        inside.insideProjectRoot = true;
        inside.parentProjectRoot = project.path;
        inside.recommendedHandling = domain::RecommendedHandling::Keep;

        // A stale entry that claims to be loose but lives inside the root.
        auto stale = MakeEntry("webapp/notes.txt", domain::ItemKind::Document, 0.9, "Notes");

        auto plan = builder.build(MakeManifest({project, inside, stale}), dest, prefs).plan;

        const auto& keep = ActionFor(plan, project.path);
        assert(keep.actionType == domain::ActionType::Skip && keep.isProjectRoot);
        assert(keep.reason == "Recommended to keep in place (project root or generated folder)");

        const auto& insideAction = ActionFor(plan, inside.path);
        assert(insideAction.actionType == domain::ActionType::Skip);
        assert(insideAction.reason == "Inside project root: " + project.path);

        const auto& violation = ActionFor(plan, stale.path);
        assert(violation.actionType == domain::ActionType::Skip);
        assert(violation.movesInsideProjectRoot);
        assert(violation.reason.find("Safety violation: Cannot move file") == 0);

        assert(!plan.safetyCheck.passed);
        assert(plan.safetyCheck.projectRootViolations == 1);
        assert(plan.safetyCheck.errors.size() == 1);
        CheckInvariants(plan);
        std::cout << "[PASS] Project root safety" << std::endl;
    }

    // Destination root inside a project
    {
        domain::ProjectRootDetection detection;
        detection.isProjectRoot = true;
        auto project = MakeEntry("webapp", domain::ItemKind::ProjectRoot, 1.0, "Projects");
        project.projectRoot = detection;
        project.recommendedHandling = domain::RecommendedHandling::Keep;
        auto photo = MakeEntry("photo.png", domain::ItemKind::Media, 0.8, "Images");

        auto plan = builder.build(MakeManifest({project, photo}), project.path, prefs).plan;
        const auto& action = ActionFor(plan, photo.path);
        assert(action.movesInsideProjectRoot && action.actionType == domain::ActionType::Skip);
        assert(action.reason.find("Cannot move file into project root") != std::string::npos);
        assert(!plan.safetyCheck.passed);
        std::cout << "[PASS] Destination inside project" << std::endl;
    }

    // Already organized
    {
        auto placed = MakeEntry("pic.png", domain::ItemKind::Media, 0.8, "Images");
        placed.path = (g_root / "organized" / "Images" / "pic.png").string();
        auto plan = builder.build(MakeManifest({placed}), dest, prefs).plan;
        const auto& action = ActionFor(plan, placed.path);
        assert(action.actionType == domain::ActionType::Skip);
        assert(action.reason == "Already in place");
        CheckInvariants(plan);
        std::cout << "[PASS] Already in place" << std::endl;
    }

    assert(PlanBuilder::suffixedPath("/a/b/report.final.pdf", 2) == "/a/b/report.final (2).pdf");
    assert(PlanBuilder::suffixedPath("/a/b/Makefile", 3) == "/a/b/Makefile (3)");
    assert(PlanBuilder::determineActionType("/a/x.txt", "/a/y.txt") == domain::ActionType::Rename);
    assert(PlanBuilder::determineActionType("/a/x.txt", "/b/x.txt") == domain::ActionType::Move);
    assert(PlanBuilder::determineActionType("/a/x.txt", "/a/x.txt") == domain::ActionType::Skip);

    fs::remove_all(g_root);
    std::cout << "[PASS] PlanBuilder Test completed." << std::endl;
    return 0;
}
