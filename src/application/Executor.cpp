/**
 * @file Executor.cpp
 * @brief Implementation of Executor.
 */

#include "application/Executor.hpp"
#include "application/PlanBuilder.hpp"
#include "domain/Timestamp.hpp"
#include "infrastructure/PathUtils.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <set>

namespace fs = std::filesystem;

namespace sortwell::application {

namespace {

constexpr int kMaxSuffix = 10000;
constexpr int kMaxRenameAttempts = 5;

bool ExistsOnDisk(const fs::path& path) {
    std::error_code ec;
    return fs::exists(fs::symlink_status(path, ec));
}

size_t Depth(const std::string& path) {
    fs::path p(path);
    return static_cast<size_t>(std::distance(p.begin(), p.end()));
}

domain::ExecutionResult MakeResult(const std::string& actionId, domain::ExecutionStatus status,
                                   std::optional<std::string> error = std::nullopt) {
    domain::ExecutionResult result;
    result.actionId = actionId;
    result.status = status;
    result.error = std::move(error);
    result.timestamp = domain::NowIso8601();
    return result;
}

void Tally(domain::ExecutionSummary& summary, const domain::ExecutionResult& result) {
    summary.total++;
    switch (result.status) {
        case domain::ExecutionStatus::Completed: summary.completed++; break;
        case domain::ExecutionStatus::Failed: summary.failed++; break;
        case domain::ExecutionStatus::Skipped: summary.skipped++; break;
    }
}

/**
 * Creates the missing ancestors of dir, recording each one it created
 * (shallowest first) so undo can remove them again.
 */
bool EnsureDirectory(const fs::path& dir, std::vector<std::string>& created, std::string& error) {
    std::vector<fs::path> missing;
    for (fs::path p = dir; !p.empty() && !ExistsOnDisk(p); p = p.parent_path()) {
        missing.push_back(p);
        if (p == p.parent_path()) break;
    }

    std::error_code ec;
    for (auto it = missing.rbegin(); it != missing.rend(); ++it) {
        fs::create_directory(*it, ec);
        if (ec) {
            error = "Cannot create directory " + it->string() + ": " + ec.message();
            return false;
        }
        if (std::find(created.begin(), created.end(), it->string()) == created.end()) {
            created.push_back(it->string());
        }
    }

    if (!fs::is_directory(dir, ec)) {
        error = "Destination parent is not a directory: " + dir.string();
        return false;
    }
    return true;
}

} // namespace

domain::ExecutionReport Executor::execute(const domain::Plan& plan, const ExecuteOptions& options) const {
    domain::ExecutionReport report;
    report.planId = plan.id;
    report.executedAt = domain::NowIso8601();
    report.dryRun = options.dryRun;
    report.rollback.planId = plan.id;
    report.rollback.createdAt = report.executedAt;

    std::cout << "[Executor] Starting execution of plan " << plan.id << std::endl;
    std::cout << "[Executor] Dry run: " << (options.dryRun ? "YES" : "NO") << std::endl;

    if (!plan.safetyCheck.passed && !options.allowUnsafePlan) {
        std::cerr << "[Executor] Refusing to execute plan " << plan.id << ": safety check failed" << std::endl;
        for (const auto& action : plan.actions) {
            auto result = MakeResult(action.id, domain::ExecutionStatus::Skipped,
                                     std::string("Plan failed its safety check"));
            Tally(report.summary, result);
            report.results.push_back(std::move(result));
        }
        return report;
    }

    std::set<std::string> selection;
    if (options.selectedActionIds) {
        selection.insert(options.selectedActionIds->begin(), options.selectedActionIds->end());
    }
    auto isSelected = [&](const domain::PlanAction& action) {
        if (action.actionType == domain::ActionType::Skip || action.movesInsideProjectRoot) return false;
        if (options.selectedActionIds) return selection.count(action.id) > 0;
        return action.approved;
    };

    int total = static_cast<int>(std::count_if(plan.actions.begin(), plan.actions.end(), isSelected));
    std::cout << "[Executor] Executing " << total << " actions" << std::endl;

    int current = 0;
    bool cancelled = false;
    for (const auto& action : plan.actions) {
        if (action.actionType == domain::ActionType::Skip) {
            auto result = MakeResult(action.id, domain::ExecutionStatus::Skipped);
            Tally(report.summary, result);
            report.results.push_back(std::move(result));
            continue;
        }
        if (!isSelected(action)) {
            auto result = MakeResult(action.id, domain::ExecutionStatus::Skipped, std::string("Not selected"));
            Tally(report.summary, result);
            report.results.push_back(std::move(result));
            continue;
        }

        if (!cancelled && options.shouldCancel && options.shouldCancel()) {
            std::cout << "[Executor] Cancelled after " << current << " of " << total << " actions" << std::endl;
            cancelled = true;
        }
        if (cancelled) {
            auto result = MakeResult(action.id, domain::ExecutionStatus::Skipped, std::string("Cancelled"));
            Tally(report.summary, result);
            report.results.push_back(std::move(result));
            continue;
        }

        ++current;
        if (options.progressCallback) {
            options.progressCallback(current, total, action);
        }
        std::cout << "[Executor] [" << current << "/" << total << "] " << action.from << " -> " << action.to
                  << std::endl;

        auto result = runAction(action, options.dryRun, report.rollback);
        Tally(report.summary, result);
        report.results.push_back(std::move(result));
    }

    std::cout << "[Executor] Execution complete" << std::endl;
    std::cout << "  - Completed: " << report.summary.completed << std::endl;
    std::cout << "  - Failed: " << report.summary.failed << std::endl;
    std::cout << "  - Skipped: " << report.summary.skipped << std::endl;

    return report;
}

domain::ExecutionResult Executor::runAction(const domain::PlanAction& action, bool dryRun,
                                            domain::Rollback& rollback) const {
    if (!ExistsOnDisk(action.from)) {
        std::cerr << "[Executor] Failed: source file not found: " << action.from << std::endl;
        return MakeResult(action.id, domain::ExecutionStatus::Failed, "Source file not found: " + action.from);
    }

    fs::path destination(action.to);

    if (!dryRun) {
        std::string error;
        if (!EnsureDirectory(destination.parent_path(), rollback.createdDirectories, error)) {
            std::cerr << "[Executor] Failed: " << error << std::endl;
            return MakeResult(action.id, domain::ExecutionStatus::Failed, error);
        }
    }

    // The plan may be stale: check again right before the move.
    auto finalDestination = uniqueDestination(action.to);
    if (!finalDestination) {
        std::cerr << "[Executor] Failed: no free destination near " << action.to << std::endl;
        return MakeResult(action.id, domain::ExecutionStatus::Failed, "No free destination near " + action.to);
    }
    if (*finalDestination != action.to) {
        std::cout << "[Executor] Destination exists, using " << *finalDestination << std::endl;
    }

    if (!dryRun) {
        auto ec = infrastructure::PathUtils::RenameNoReplace(action.from, *finalDestination);
        // Something else took the destination since the check; pick the next free one.
        for (int attempt = 1; ec == std::errc::file_exists && attempt < kMaxRenameAttempts; ++attempt) {
            finalDestination = uniqueDestination(action.to);
            if (!finalDestination) break;
            std::cout << "[Executor] Destination taken during the move, using " << *finalDestination << std::endl;
            ec = infrastructure::PathUtils::RenameNoReplace(action.from, *finalDestination);
        }
        if (!finalDestination) {
            std::cerr << "[Executor] Failed: no free destination near " << action.to << std::endl;
            return MakeResult(action.id, domain::ExecutionStatus::Failed, "No free destination near " + action.to);
        }
        if (ec) {
            std::cerr << "[Executor] Failed: " << ec.message() << std::endl;
            return MakeResult(action.id, domain::ExecutionStatus::Failed,
                              "Cannot move " + action.from + ": " + ec.message());
        }
        rollback.entries.push_back(
            domain::RollbackEntry{*finalDestination, action.from, action.id, domain::NowIso8601()});
    }

    auto result = MakeResult(action.id, domain::ExecutionStatus::Completed);
    result.actualDestination = *finalDestination;
    return result;
}

domain::ExecutionReport Executor::undo(const domain::Rollback& rollback, bool dryRun) const {
    domain::ExecutionReport report;
    report.planId = rollback.planId;
    report.executedAt = domain::NowIso8601();
    report.dryRun = dryRun;
    report.rollback.planId = rollback.planId;
    report.rollback.createdAt = rollback.createdAt;

    std::cout << "[Executor] Starting rollback for plan " << rollback.planId << std::endl;
    std::cout << "[Executor] Rolling back " << rollback.entries.size() << " actions" << std::endl;

    // Directories recreated here are original locations and stay afterwards.
    std::vector<std::string> recreated;
    int position = 0;
    int total = static_cast<int>(rollback.entries.size());

    for (auto it = rollback.entries.rbegin(); it != rollback.entries.rend(); ++it) {
        const auto& entry = *it;
        ++position;
        std::cout << "[Executor] [undo " << position << "/" << total << "] " << entry.from << " -> " << entry.to
                  << std::endl;

        domain::ExecutionResult result;
        if (!ExistsOnDisk(entry.from)) {
            result = MakeResult(entry.actionId, domain::ExecutionStatus::Failed,
                                "Source file not found: " + entry.from);
        } else if (ExistsOnDisk(entry.to)) {
            result = MakeResult(entry.actionId, domain::ExecutionStatus::Failed,
                                "Original location is occupied: " + entry.to);
        } else if (dryRun) {
            result = MakeResult(entry.actionId, domain::ExecutionStatus::Completed);
            result.actualDestination = entry.to;
        } else {
            std::string error;
            if (!EnsureDirectory(fs::path(entry.to).parent_path(), recreated, error)) {
                result = MakeResult(entry.actionId, domain::ExecutionStatus::Failed, error);
            } else {
                auto ec = infrastructure::PathUtils::RenameNoReplace(entry.from, entry.to);
                if (ec == std::errc::file_exists) {
                    result = MakeResult(entry.actionId, domain::ExecutionStatus::Failed,
                                        "Original location is occupied: " + entry.to);
                } else if (ec) {
                    result = MakeResult(entry.actionId, domain::ExecutionStatus::Failed,
                                        "Cannot move " + entry.from + " back: " + ec.message());
                } else {
                    result = MakeResult(entry.actionId, domain::ExecutionStatus::Completed);
                    result.actualDestination = entry.to;
                }
            }
        }

        if (result.status == domain::ExecutionStatus::Failed) {
            std::cerr << "[Executor] Rollback failed: " << result.error.value_or("") << std::endl;
        }
        Tally(report.summary, result);
        report.results.push_back(std::move(result));
    }

    if (!dryRun) {
        // Deepest first, so parents empty out before they are checked.
        std::vector<std::string> created = rollback.createdDirectories;
        std::sort(created.begin(), created.end(), [](const std::string& a, const std::string& b) {
            return Depth(a) > Depth(b);
        });
        for (const auto& dir : created) {
            std::error_code ec;
            if (!fs::is_directory(dir, ec) || !fs::is_empty(dir, ec) || ec) continue;
            fs::remove(dir, ec);
            if (ec) {
                std::cerr << "[Executor] Could not remove created directory " << dir << ": " << ec.message()
                          << std::endl;
            }
        }
    }

    std::cout << "[Executor] Rollback complete" << std::endl;
    std::cout << "  - Completed: " << report.summary.completed << std::endl;
    std::cout << "  - Failed: " << report.summary.failed << std::endl;

    return report;
}

std::optional<std::string> Executor::uniqueDestination(const std::string& path) {
    if (!ExistsOnDisk(path)) return path;
    for (int counter = 2; counter <= kMaxSuffix; ++counter) {
        std::string candidate = PlanBuilder::suffixedPath(path, counter);
        if (!ExistsOnDisk(candidate)) return candidate;
    }
    return std::nullopt;
}

} // namespace sortwell::application
