/**
 * @file PlanBuilder.cpp
 * @brief Implementation of PlanBuilder.
 */

#include "application/PlanBuilder.hpp"
#include "application/IdGenerator.hpp"
#include "application/Naming.hpp"
#include "domain/Timestamp.hpp"
#include "infrastructure/PathUtils.hpp"
#include <filesystem>
#include <iostream>
#include <map>
#include <set>
#include <sstream>

namespace fs = std::filesystem;

namespace sortwell::application {

namespace {

constexpr int kMaxSuffix = 10000;
constexpr double kLowConfidence = 0.5;

bool ExistsOnDisk(const std::string& path) {
    std::error_code ec;
    return fs::exists(fs::symlink_status(path, ec));
}

// Category -> destination folder, through the user's default-folder table.
std::string FolderFor(const std::string& category, const domain::UserPreferences& preferences) {
    auto it = preferences.defaultFolders.find(category);
    const std::string& folder = (it != preferences.defaultFolders.end() && !it->second.empty()) ? it->second : category;
    return Naming::SanitizeFolderName(folder);
}

std::string BuildReason(const domain::ManifestEntry& entry) {
    std::vector<std::string> parts;
    if (entry.suggestedCategory) parts.push_back("Category: " + *entry.suggestedCategory);
    if (entry.documentMetadata && entry.documentMetadata->hasTitle()) {
        parts.push_back("Title: " + *entry.documentMetadata->title);
    }
    if (entry.documentMetadata && entry.documentMetadata->hasSubject()) {
        parts.push_back("Subject: " + *entry.documentMetadata->subject);
    }
    if (!entry.signals.empty()) parts.push_back(entry.signals.front());

    std::string reason;
    for (const auto& part : parts) {
        if (!reason.empty()) reason += " | ";
        reason += part;
    }
    return reason;
}

void Retarget(domain::PlanAction& action, const std::string& to, const std::string& destRoot) {
    action.to = to;
    action.toRelative = infrastructure::PathUtils::RelativeTo(to, destRoot);
    action.actionType = PlanBuilder::determineActionType(action.from, action.to);
}

// First " (n)" variant of dest, n >= 2, that is neither claimed nor on disk.
std::optional<std::string> NextFreeDestination(const std::string& dest, const std::set<std::string>& claimed) {
    for (int counter = 2; counter <= kMaxSuffix; ++counter) {
        std::string candidate = PlanBuilder::suffixedPath(dest, counter);
        if (claimed.count(candidate) == 0 && !ExistsOnDisk(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

void GiveUp(domain::PlanAction& action) {
    std::cerr << "[PlanBuilder] No free destination near " << action.to << ", skipping" << std::endl;
    action.to = action.from;
    action.toRelative = action.fromRelative;
    action.actionType = domain::ActionType::Skip;
    action.approved = false;
    action.reason += " | No free destination found";
}

} // namespace

PlanResult PlanBuilder::build(const domain::Manifest& manifest,
                              const std::string& destRoot,
                              const domain::UserPreferences& preferences,
                              std::function<void(std::string)> statusCallback) const {
    domain::Plan plan;
    plan.id = GenerateId();
    plan.manifestId = manifest.id;
    plan.createdAt = domain::NowIso8601();
    plan.destRoot = infrastructure::PathUtils::Normalize(destRoot).string();
    plan.userPreferences = preferences;

    std::cout << "[PlanBuilder] Generating plan " << plan.id << " for manifest " << manifest.id << std::endl;
    if (statusCallback) statusCallback("Computing destinations...");

    auto roots = projectRootsOf(manifest);
    for (const auto& entry : manifest.entries) {
        plan.actions.push_back(createAction(entry, plan.destRoot, preferences, roots));
    }
    std::cout << "[PlanBuilder] Created " << plan.actions.size() << " initial actions" << std::endl;

    if (statusCallback) statusCallback("Resolving collisions...");
    int resolved = resolveCollisions(plan.actions, plan.destRoot);
    if (resolved > 0) {
        std::cout << "[PlanBuilder] Resolved " << resolved << " destination collisions" << std::endl;
    }

    if (statusCallback) statusCallback("Running safety checks...");
    plan.safetyCheck = performSafetyCheck(plan.actions);
    if (!plan.safetyCheck.passed) {
        std::cerr << "[PlanBuilder] Safety check failed!" << std::endl;
        for (const auto& error : plan.safetyCheck.errors) {
            std::cerr << "  - " << error << std::endl;
        }
    }

    plan.summary = summarize(plan.actions);
    auto rollback = buildRollback(plan);

    std::cout << "[PlanBuilder] Plan complete: " << plan.summary.totalActions << " actions" << std::endl;
    std::cout << "  - High confidence: " << plan.summary.highConfidence << std::endl;
    std::cout << "  - Medium confidence: " << plan.summary.mediumConfidence << std::endl;
    std::cout << "  - Low confidence: " << plan.summary.lowConfidence << std::endl;

    return PlanResult{std::move(plan), std::move(rollback)};
}

domain::PlanAction PlanBuilder::createAction(const domain::ManifestEntry& entry,
                                             const std::string& destRoot,
                                             const domain::UserPreferences& preferences,
                                             const ProjectRootDetector::ProjectRootMap& roots) const {
    domain::PlanAction action;
    action.id = GenerateId();
    action.from = entry.path;
    action.fromRelative = entry.relativePath;
    action.to = entry.path;
    action.toRelative = entry.relativePath;
    action.actionType = domain::ActionType::Skip;
    action.category = entry.suggestedCategory;
    action.tags = entry.suggestedTags;
    action.isProjectRoot = entry.kind == domain::ItemKind::ProjectRoot;

    if (entry.insideProjectRoot) {
        action.reason = "Inside project root: " + entry.parentProjectRoot.value_or("");
        action.confidence = 1.0;
        return action;
    }
    if (entry.recommendedHandling == domain::RecommendedHandling::Keep) {
        action.reason = "Recommended to keep in place (project root or generated folder)";
        action.confidence = 1.0;
        return action;
    }

    std::string destination = determineDestination(entry, destRoot, preferences);

    auto violation = ProjectRootDetector::validateMove(entry.path, destination, roots);
    if (violation) {
        std::cerr << "[PlanBuilder] " << *violation << std::endl;
        action.reason = "Safety violation: " + *violation;
        action.confidence = 1.0;
        action.movesInsideProjectRoot = true;
        return action;
    }

    action.confidence = entry.confidence;
    action.actionType = determineActionType(entry.path, destination);
    if (action.actionType == domain::ActionType::Skip) {
        action.reason = "Already in place";
        return action;
    }

    action.to = destination;
    action.toRelative = infrastructure::PathUtils::RelativeTo(destination, destRoot);
    action.reason = BuildReason(entry);
    action.approved = entry.confidence >= preferences.confidenceThresholds.autoApprove;
    return action;
}

std::string PlanBuilder::determineDestination(const domain::ManifestEntry& entry,
                                              const std::string& destRoot,
                                              const domain::UserPreferences& preferences) const {
    fs::path root(destRoot);
    const auto& naming = preferences.naming;

    // Uncertain items go to the Inbox untouched, whatever their type.
    if (entry.confidence < preferences.confidenceThresholds.requireReview) {
        return (root / FolderFor("Unknown", preferences) / entry.name).string();
    }

    switch (entry.kind) {
        case domain::ItemKind::Document:
            if (entry.documentMetadata) {
                const auto& metadata = *entry.documentMetadata;
                std::string title = Naming::GenerateCleanTitle(metadata, entry.name);
                std::string subject = entry.suggestedCategory.value_or(metadata.subject.value_or("Documents"));
                std::string filename = Naming::ApplyNamingPreferences(
                    title + Naming::SplitExtension(entry.name).second, naming);
                return (root / FolderFor(subject, preferences) / filename).string();
            }
            break;
        case domain::ItemKind::Media:
            return (root / FolderFor(entry.suggestedCategory.value_or("Media"), preferences) /
                    Naming::ApplyNamingPreferences(entry.name, naming)).string();
        case domain::ItemKind::Archive:
            return (root / FolderFor("Archives", preferences) /
                    Naming::ApplyNamingPreferences(entry.name, naming)).string();
        case domain::ItemKind::Code:
            return (root / FolderFor("Code", preferences) /
                    Naming::ApplyNamingPreferences(entry.name, naming)).string();
        default:
            break;
    }

    return (root / FolderFor(entry.suggestedCategory.value_or("Other"), preferences) /
            Naming::ApplyNamingPreferences(entry.name, naming)).string();
}

int PlanBuilder::resolveCollisions(std::vector<domain::PlanAction>& actions, const std::string& destRoot) {
    int changed = 0;

    // Pass 1: destinations shared by several actions.
    std::vector<std::string> order;
    std::map<std::string, std::vector<size_t>> groups;
    std::set<std::string> claimed;
    for (size_t i = 0; i < actions.size(); ++i) {
        if (actions[i].actionType == domain::ActionType::Skip) continue;
        auto& members = groups[actions[i].to];
        if (members.empty()) order.push_back(actions[i].to);
        members.push_back(i);
        claimed.insert(actions[i].to);
    }

    for (const auto& dest : order) {
        const auto& members = groups[dest];
        if (members.size() < 2) continue;

        std::cout << "[PlanBuilder] Collision detected at " << dest << ": " << members.size() << " files" << std::endl;
        for (size_t k = 0; k < members.size(); ++k) {
            auto& action = actions[members[k]];
            action.hasCollision = true;
            if (k == 0) continue;

            auto candidate = NextFreeDestination(dest, claimed);
            if (!candidate) {
                GiveUp(action);
                continue;
            }
            claimed.insert(*candidate);
            Retarget(action, *candidate, destRoot);
            action.reason += " | Collision resolved with suffix";
            ++changed;
        }
    }

    // Pass 2: destinations already occupied on disk.
    for (auto& action : actions) {
        if (action.actionType == domain::ActionType::Skip) continue;
        if (!ExistsOnDisk(action.to)) continue;

        auto candidate = NextFreeDestination(action.to, claimed);
        action.hasCollision = true;
        if (!candidate) {
            GiveUp(action);
            continue;
        }
        claimed.insert(*candidate);
        Retarget(action, *candidate, destRoot);
        action.reason += " | Existing file, added suffix";
        ++changed;
    }

    return changed;
}

domain::ActionType PlanBuilder::determineActionType(const std::string& from, const std::string& to) {
    fs::path fromPath = fs::path(from).lexically_normal();
    fs::path toPath = fs::path(to).lexically_normal();
    if (fromPath == toPath) {
        return domain::ActionType::Skip;
    }

    bool sameDir = fromPath.parent_path() == toPath.parent_path();
    bool sameName = fromPath.filename() == toPath.filename();

    if (sameDir && !sameName) return domain::ActionType::Rename;
    if (!sameDir && sameName) return domain::ActionType::Move;
    return domain::ActionType::MoveRename;
}

std::string PlanBuilder::suffixedPath(const std::string& path, int counter) {
    fs::path p(path);
    auto [base, ext] = Naming::SplitExtension(p.filename().string());
    std::string name = base + " (" + std::to_string(counter) + ")" + ext;
    return (p.parent_path() / name).string();
}

domain::SafetyCheck PlanBuilder::performSafetyCheck(const std::vector<domain::PlanAction>& actions) {
    domain::SafetyCheck check;

    for (const auto& action : actions) {
        if (action.movesInsideProjectRoot) {
            check.projectRootViolations++;
            check.errors.push_back("Action " + action.id + ": " + action.reason);
        }
        if (action.actionType == domain::ActionType::Skip) {
            check.skippedItems++;
        } else if (action.confidence < kLowConfidence) {
            check.lowConfidenceActions++;
        }
        if (action.hasCollision) {
            check.collisionsResolved++;
            check.collisionDestinations.push_back(action.to);
        }
    }

    if (check.lowConfidenceActions > 0) {
        std::ostringstream ss;
        ss << check.lowConfidenceActions << " action(s) have low confidence (< " << kLowConfidence
           << ") and should be reviewed";
        check.warnings.push_back(ss.str());
    }

    check.passed = check.projectRootViolations == 0;
    return check;
}

domain::PlanSummary PlanBuilder::summarize(const std::vector<domain::PlanAction>& actions) {
    domain::PlanSummary summary;
    summary.totalActions = static_cast<int>(actions.size());

    for (const auto& action : actions) {
        switch (action.actionType) {
            case domain::ActionType::Move:
            case domain::ActionType::MoveRename: summary.moves++; break;
            case domain::ActionType::Rename: summary.renames++; break;
            case domain::ActionType::Skip: summary.skips++; break;
        }

        if (action.category) {
            summary.categoryCounts[*action.category]++;
        }

        if (action.confidence >= 0.7) {
            summary.highConfidence++;
        } else if (action.confidence >= 0.4) {
            summary.mediumConfidence++;
        } else {
            summary.lowConfidence++;
        }
    }
    return summary;
}

domain::Rollback PlanBuilder::buildRollback(const domain::Plan& plan) {
    domain::Rollback rollback;
    rollback.planId = plan.id;
    rollback.createdAt = plan.createdAt;

    for (const auto& action : plan.actions) {
        if (action.actionType == domain::ActionType::Skip) continue;
        rollback.entries.push_back(domain::RollbackEntry{action.to, action.from, action.id, plan.createdAt});
    }
    return rollback;
}

ProjectRootDetector::ProjectRootMap PlanBuilder::projectRootsOf(const domain::Manifest& manifest) {
    ProjectRootDetector::ProjectRootMap roots;
    for (const auto& entry : manifest.entries) {
        if (entry.kind == domain::ItemKind::ProjectRoot && entry.projectRoot) {
            roots.emplace(entry.path, *entry.projectRoot);
        }
        if (entry.parentProjectRoot && roots.count(*entry.parentProjectRoot) == 0) {
            domain::ProjectRootDetection detection;
            detection.isProjectRoot = true;
            roots.emplace(*entry.parentProjectRoot, detection);
        }
    }
    return roots;
}

} // namespace sortwell::application
