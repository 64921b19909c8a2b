#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

#include "application/Executor.hpp"
#include "infrastructure/PathUtils.hpp"

namespace fs = std::filesystem;
using namespace sortwell;
using application::ExecuteOptions;
using application::Executor;

namespace {

void Touch(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream(path) << content;
}

std::string ReadAll(const fs::path& path) {
    std::ifstream f(path);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

domain::PlanAction MakeAction(const std::string& id, const fs::path& from, const fs::path& to) {
    domain::PlanAction action;
    action.id = id;
    action.from = from.string();
    action.to = to.string();
    action.actionType = domain::ActionType::Move;
    action.confidence = 0.9;
    action.approved = true;
    action.reason = "Category: Test";
    return action;
}

domain::Plan MakePlan(std::vector<domain::PlanAction> actions) {
    domain::Plan plan;
    plan.id = "plan-under-test";
    plan.actions = std::move(actions);
    return plan;
}

const domain::ExecutionResult& ResultFor(const domain::ExecutionReport& report, const std::string& id) {
    for (const auto& result : report.results) {
        if (result.actionId == id) return result;
    }
    assert(false && "No result for action.");
    return report.results.front();
}

} // namespace

int main() {
    std::cout << "[Test] Starting Executor Test..." << std::endl;

    fs::path root = infrastructure::PathUtils::Normalize(fs::temp_directory_path() / "sortwell_executor_test");
    fs::remove_all(root);
    Executor executor;

    // Ten actions, the fifth source vanishes; then undo everything
    {
        fs::path src = root / "batch" / "src";
        fs::path dest = root / "batch" / "organized";
        std::vector<domain::PlanAction> actions;
        for (int i = 0; i < 10; ++i) {
            std::string name = "file" + std::to_string(i) + ".txt";
            Touch(src / name, "content " + std::to_string(i));
            actions.push_back(MakeAction("a" + std::to_string(i), src / name, dest / "Docs" / name));
        }
        fs::remove(src / "file4.txt");

        auto report = executor.execute(MakePlan(actions));
        assert(report.summary.total == 10);
        assert(report.summary.completed == 9);
        assert(report.summary.failed == 1);
        assert(report.rollback.entries.size() == 9);
        assert(report.rollback.planId == "plan-under-test");

        const auto& failed = ResultFor(report, "a4");
        assert(failed.status == domain::ExecutionStatus::Failed);
        assert(failed.error && failed.error->find("Source file not found") == 0);

        assert(fs::exists(dest / "Docs" / "file9.txt"));
        assert(!fs::exists(src / "file9.txt"));
        assert(report.rollback.createdDirectories.size() == 2 && "organized and organized/Docs were created.");
        assert(report.rollback.createdDirectories.front() == dest.string());

        auto undone = executor.undo(report.rollback);
        assert(undone.summary.completed == 9);
        assert(undone.summary.failed == 0);
        for (int i = 0; i < 10; ++i) {
            if (i == 4) continue;
            std::string name = "file" + std::to_string(i) + ".txt";
            assert(ReadAll(src / name) == "content " + std::to_string(i));
        }
        assert(!fs::exists(dest) && "Directories created by execution are removed again.");
        std::cout << "[PASS] Partial failure and round trip" << std::endl;
    }

    // Destination taken after planning
    {
        fs::path src = root / "late" / "src" / "a.jpg";
        fs::path dest = root / "late" / "Images" / "a.jpg";
        Touch(src, "new");
        auto plan = MakePlan({MakeAction("c1", src, dest)});
        Touch(dest, "occupant");

        auto report = executor.execute(plan);
        const auto& result = ResultFor(report, "c1");
        assert(result.status == domain::ExecutionStatus::Completed);
        std::string expected = (root / "late" / "Images" / "a (2).jpg").string();
        assert(result.actualDestination == std::optional<std::string>(expected));
        assert(ReadAll(dest) == "occupant" && "Existing files are never overwritten.");
        assert(ReadAll(expected) == "new");
        assert(report.rollback.entries.size() == 1 && report.rollback.entries[0].from == expected);
        assert(report.rollback.createdDirectories.empty());

        auto undone = executor.undo(report.rollback);
        assert(undone.summary.completed == 1);
        assert(ReadAll(src) == "new");
        assert(ReadAll(dest) == "occupant");
        std::cout << "[PASS] Destination taken at execution time" << std::endl;
    }

    // Renames never replace an existing file
    {
        fs::path dir = root / "noclobber";
        Touch(dir / "mover.txt", "mover");
        Touch(dir / "occupant.txt", "occupant");

        auto ec = infrastructure::PathUtils::RenameNoReplace(dir / "mover.txt", dir / "occupant.txt");
        assert(ec == std::errc::file_exists);
        assert(ReadAll(dir / "mover.txt") == "mover");
        assert(ReadAll(dir / "occupant.txt") == "occupant");

        ec = infrastructure::PathUtils::RenameNoReplace(dir / "mover.txt", dir / "free.txt");
        assert(!ec);
        assert(!fs::exists(dir / "mover.txt") && ReadAll(dir / "free.txt") == "mover");
        std::cout << "[PASS] No-clobber rename" << std::endl;
    }

    // Dry run touches nothing
    {
        fs::path src = root / "dry" / "a.txt";
        fs::path dest = root / "dry" / "out" / "a.txt";
        Touch(src, "x");
        ExecuteOptions options;
        options.dryRun = true;
        auto report = executor.execute(MakePlan({MakeAction("d1", src, dest)}), options);
        assert(report.dryRun);
        assert(report.summary.completed == 1);
        assert(report.rollback.entries.empty());
        assert(fs::exists(src));
        assert(!fs::exists(root / "dry" / "out"));
        std::cout << "[PASS] Dry run" << std::endl;
    }

    // Selection, approval and skip actions
    {
        fs::path dir = root / "select";
        Touch(dir / "a.txt", "a");
        Touch(dir / "b.txt", "b");
        Touch(dir / "c.txt", "c");
        auto a = MakeAction("s1", dir / "a.txt", dir / "out" / "a.txt");
        auto b = MakeAction("s2", dir / "b.txt", dir / "out" / "b.txt");
        b.approved = false;
        auto c = MakeAction("s3", dir / "c.txt", dir / "c.txt");
        c.actionType = domain::ActionType::Skip;
        auto plan = MakePlan({a, b, c});

        auto approvedOnly = executor.execute(plan);
        assert(ResultFor(approvedOnly, "s1").status == domain::ExecutionStatus::Completed);
        assert(ResultFor(approvedOnly, "s2").status == domain::ExecutionStatus::Skipped);
        assert(ResultFor(approvedOnly, "s2").error == std::optional<std::string>("Not selected"));
        assert(ResultFor(approvedOnly, "s3").status == domain::ExecutionStatus::Skipped);
        assert(!ResultFor(approvedOnly, "s3").error);
        executor.undo(approvedOnly.rollback);

        ExecuteOptions options;
        options.selectedActionIds = std::vector<std::string>{"s2"};
        auto explicitOnly = executor.execute(plan, options);
        assert(ResultFor(explicitOnly, "s1").status == domain::ExecutionStatus::Skipped);
        assert(ResultFor(explicitOnly, "s2").status == domain::ExecutionStatus::Completed);
        assert(fs::exists(dir / "a.txt") && fs::exists(dir / "out" / "b.txt"));
        std::cout << "[PASS] Selection" << std::endl;
    }

    // Unsafe plans
    {
        fs::path dir = root / "unsafe";
        Touch(dir / "a.txt", "a");
        Touch(dir / "b.txt", "b");
        auto a = MakeAction("u1", dir / "a.txt", dir / "out" / "a.txt");
        auto b = MakeAction("u2", dir / "b.txt", dir / "project" / "b.txt");
        b.movesInsideProjectRoot = true;
        auto plan = MakePlan({a, b});
        plan.safetyCheck.passed = false;

        auto refused = executor.execute(plan);
        assert(refused.summary.skipped == 2 && refused.summary.completed == 0);
        assert(fs::exists(dir / "a.txt") && fs::exists(dir / "b.txt"));

        ExecuteOptions options;
        options.allowUnsafePlan = true;
        auto forced = executor.execute(plan, options);
        assert(ResultFor(forced, "u1").status == domain::ExecutionStatus::Completed);
        assert(ResultFor(forced, "u2").status == domain::ExecutionStatus::Skipped &&
               "Actions into a project root never run.");
        assert(fs::exists(dir / "b.txt"));
        std::cout << "[PASS] Unsafe plan guard" << std::endl;
    }

    // Progress and cancellation
    {
        fs::path dir = root / "cancel";
        std::vector<domain::PlanAction> actions;
        for (int i = 0; i < 5; ++i) {
            std::string name = "f" + std::to_string(i) + ".txt";
            Touch(dir / name, name);
            actions.push_back(MakeAction("k" + std::to_string(i), dir / name, dir / "out" / name));
        }

        int progressCalls = 0;
        int reportedTotal = 0;
        ExecuteOptions options;
        options.progressCallback = [&](int, int total, const domain::PlanAction&) {
            progressCalls++;
            reportedTotal = total;
        };
        options.shouldCancel = [&] { return progressCalls >= 2; };

        auto report = executor.execute(MakePlan(actions), options);
        assert(reportedTotal == 5);
        assert(report.summary.completed == 2);
        assert(report.summary.skipped == 3);
        assert(ResultFor(report, "k4").error == std::optional<std::string>("Cancelled"));
        assert(report.rollback.entries.size() == 2 && "Completed moves stay undoable.");
        std::cout << "[PASS] Cancellation" << std::endl;
    }

    // Undo never overwrites and keeps going
    {
        fs::path dir = root / "undo";
        Touch(dir / "moved" / "ok.txt", "ok");
        Touch(dir / "moved" / "blocked.txt", "moved");
        Touch(dir / "orig" / "blocked.txt", "someone else");

        domain::Rollback rollback;
        rollback.planId = "p";
        rollback.entries.push_back({(dir / "moved" / "gone.txt").string(), (dir / "orig" / "gone.txt").string(), "r1", ""});
        rollback.entries.push_back({(dir / "moved" / "blocked.txt").string(), (dir / "orig" / "blocked.txt").string(), "r2", ""});
        rollback.entries.push_back({(dir / "moved" / "ok.txt").string(), (dir / "orig" / "ok.txt").string(), "r3", ""});

        auto report = executor.undo(rollback);
        assert(report.summary.completed == 1);
        assert(report.summary.failed == 2);
        assert(report.results.front().actionId == "r3" && "Entries are replayed in reverse order.");
        assert(ResultFor(report, "r1").error->find("Source file not found") == 0);
        assert(ResultFor(report, "r2").error->find("Original location is occupied") == 0);
        assert(ReadAll(dir / "orig" / "blocked.txt") == "someone else");
        assert(ReadAll(dir / "orig" / "ok.txt") == "ok");
        std::cout << "[PASS] Undo safety" << std::endl;
    }

    assert(Executor::uniqueDestination((root / "free.txt").string()) ==
           std::optional<std::string>((root / "free.txt").string()));

    fs::remove_all(root);
    std::cout << "[PASS] Executor Test completed." << std::endl;
    return 0;
}
