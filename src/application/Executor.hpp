/**
 * @file Executor.hpp
 * @brief Applies plan actions to the filesystem and undoes them.
 */

#pragma once
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "domain/Execution.hpp"
#include "domain/Plan.hpp"

namespace sortwell::application {

/**
 * @struct ExecuteOptions
 * @brief Per-run options of Executor::execute.
 */
struct ExecuteOptions {
    bool dryRun = false;

    /** @brief Explicit selection; when absent only approved actions run. */
    std::optional<std::vector<std::string>> selectedActionIds;

    /** @brief Runs a plan whose safety check failed. Violating actions still never run. */
    bool allowUnsafePlan = false;

    /** @brief Called before each selected action with its 1-based position. */
    std::function<void(int current, int total, const domain::PlanAction& action)> progressCallback;

    /** @brief Polled before each selected action; true stops the batch. */
    std::function<bool()> shouldCancel;
};

/**
 * @class Executor
 * @brief Performs moves one at a time, in plan order.
 *
 * Every action gets exactly one result. A failing action is recorded and the
 * batch continues. Nothing is ever deleted or overwritten.
 */
class Executor {
public:
    /**
     * @brief Executes the selected actions of a plan.
     * @return Report whose rollback covers exactly the completed moves.
     */
    domain::ExecutionReport execute(const domain::Plan& plan, const ExecuteOptions& options = {}) const;

    /**
     * @brief Replays a rollback in reverse order.
     *
     * An entry fails (and the rest continue) when its source is gone or its
     * original location is occupied. Directories listed in
     * rollback.createdDirectories are removed afterwards if empty.
     */
    domain::ExecutionReport undo(const domain::Rollback& rollback, bool dryRun = false) const;

    /** @brief path itself if free, else the first free " (n)" variant with n >= 2. */
    static std::optional<std::string> uniqueDestination(const std::string& path);

private:
    domain::ExecutionResult runAction(const domain::PlanAction& action, bool dryRun,
                                      domain::Rollback& rollback) const;
};

} // namespace sortwell::application
