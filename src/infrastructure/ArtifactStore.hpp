/**
 * @file ArtifactStore.hpp
 * @brief Persists pipeline artifacts as JSON files in one output directory.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "domain/Execution.hpp"
#include "domain/Manifest.hpp"
#include "domain/Plan.hpp"

namespace sortwell::infrastructure {

/**
 * @class ArtifactStore
 * @brief Writes manifest-, plan-, rollback- and execution- files atomically (temp file + rename).
 *
 * Artifacts of a single run (execution report, the rollback of the moves it made,
 * undo report, log) are named after the plan and the run timestamp and never
 * replace an earlier run's file.
 *
 * Save functions return the written path, or nullopt on failure (already logged).
 * Load functions return nullopt for missing or malformed files.
 */
class ArtifactStore {
public:
    explicit ArtifactStore(std::filesystem::path directory);

    const std::filesystem::path& directory() const { return m_directory; }

    std::optional<std::filesystem::path> saveManifest(const domain::Manifest& manifest) const;
    std::optional<std::filesystem::path> savePlan(const domain::Plan& plan) const;

    /** @brief Writes the planned rollback-<planId>.json. */
    std::optional<std::filesystem::path> saveRollback(const domain::Rollback& rollback) const;

    /** @brief Writes execution-<planId>-<timestamp>.json. */
    std::optional<std::filesystem::path> saveExecutionReport(const domain::ExecutionReport& report) const;

    /** @brief Writes the moves one run actually made to rollback-<planId>-<timestamp>.json. */
    std::optional<std::filesystem::path> saveExecutionRollback(const domain::ExecutionReport& report) const;

    /** @brief Writes undo-<planId>-<timestamp>.json. */
    std::optional<std::filesystem::path> saveUndoReport(const domain::ExecutionReport& report) const;

    /**
     * @brief Writes the human-readable execution-log-<timestamp>.txt.
     * @param rollbackFile Rollback file named in the log; the planned one when empty.
     */
    std::optional<std::filesystem::path> saveExecutionLog(const domain::ExecutionReport& report,
                                                          const domain::Plan& plan,
                                                          const std::string& rollbackFile = "") const;

    static std::optional<domain::Manifest> LoadManifest(const std::filesystem::path& path);
    static std::optional<domain::Plan> LoadPlan(const std::filesystem::path& path);
    static std::optional<domain::Rollback> LoadRollback(const std::filesystem::path& path);
    static std::optional<domain::ExecutionReport> LoadExecutionReport(const std::filesystem::path& path);

    static std::string FormatExecutionLog(const domain::ExecutionReport& report, const domain::Plan& plan,
                                          const std::string& rollbackFile = "");

    /** @brief Writes content next to path, then renames it over path. */
    static bool WriteAtomically(const std::filesystem::path& path, const std::string& content);

private:
    /** @brief m_directory/<prefix>-<planId>-<timestamp><extension>, suffixed -2, -3... when taken. */
    std::filesystem::path runArtifactPath(const std::string& prefix, const std::string& planId,
                                          const std::string& timestamp, const std::string& extension) const;

    /** @brief Serializes j and writes it; json errors are logged and reported as nullopt. */
    std::optional<std::filesystem::path> saveJson(const std::filesystem::path& path, const nlohmann::json& j,
                                                  const std::string& what) const;

    std::filesystem::path m_directory;
};

} // namespace sortwell::infrastructure
