/**
 * @file PlanBuilder.hpp
 * @brief Turns a manifest into a reviewable, reversible reorganization plan.
 */

#pragma once
#include <functional>
#include <string>
#include <vector>
#include "application/ProjectRootDetector.hpp"
#include "domain/Execution.hpp"
#include "domain/Manifest.hpp"
#include "domain/Plan.hpp"

namespace sortwell::application {

/**
 * @struct PlanResult
 * @brief A plan together with the rollback mapping built eagerly for it.
 */
struct PlanResult {
    domain::Plan plan;
    domain::Rollback rollback;
};

/**
 * @class PlanBuilder
 * @brief Computes destinations, validates them against project roots and resolves collisions.
 *
 * Reads the filesystem only to look for existing destinations; never mutates it.
 */
class PlanBuilder {
public:
    /**
     * @brief Builds the plan for every manifest entry.
     * @param manifest Source manifest.
     * @param destRoot Root of the organized tree.
     * @param preferences Naming, routing and threshold preferences.
     * @param statusCallback UI feedback.
     */
    PlanResult build(const domain::Manifest& manifest,
                     const std::string& destRoot,
                     const domain::UserPreferences& preferences,
                     std::function<void(std::string)> statusCallback = nullptr) const;

    /**
     * @brief Makes the destinations of all non-skip actions pairwise distinct and free on disk.
     *
     * Within a group sharing a destination the first member keeps it and every
     * later member gets " (n)" before the extension; all members are flagged.
     * A destination that already exists on disk is moved to the next free suffix.
     * Running it again on its own output changes nothing.
     * @return Number of actions whose destination changed.
     */
    static int resolveCollisions(std::vector<domain::PlanAction>& actions, const std::string& destRoot);

    /** @brief Move, Rename, MoveRename or Skip by comparing parent directories and names. */
    static domain::ActionType determineActionType(const std::string& from, const std::string& to);

    /** @brief "dir/name.ext" -> "dir/name (n).ext". */
    static std::string suffixedPath(const std::string& path, int counter);

    static domain::SafetyCheck performSafetyCheck(const std::vector<domain::PlanAction>& actions);
    static domain::PlanSummary summarize(const std::vector<domain::PlanAction>& actions);

    /** @brief Reverse mapping of every non-skip action. */
    static domain::Rollback buildRollback(const domain::Plan& plan);

private:
    domain::PlanAction createAction(const domain::ManifestEntry& entry,
                                    const std::string& destRoot,
                                    const domain::UserPreferences& preferences,
                                    const ProjectRootDetector::ProjectRootMap& roots) const;

    std::string determineDestination(const domain::ManifestEntry& entry,
                                     const std::string& destRoot,
                                     const domain::UserPreferences& preferences) const;

    static ProjectRootDetector::ProjectRootMap projectRootsOf(const domain::Manifest& manifest);
};

} // namespace sortwell::application
