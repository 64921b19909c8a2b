/**
 * @file ArtifactSerializer.hpp
 * @brief JSON mapping of manifests, plans, rollbacks and execution reports.
 */

#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "domain/Execution.hpp"
#include "domain/Manifest.hpp"
#include "domain/Plan.hpp"

namespace sortwell::infrastructure {

/**
 * @class ArtifactSerializer
 * @brief Manual JSON mapping of every persisted artifact.
 *
 * The FromJson functions throw nlohmann::json::exception on missing or mistyped
 * required keys; optional keys fall back to the entity defaults.
 *
 * Filesystem paths are stored as plain strings when they are valid UTF-8 and as
 * {"hex": "<bytes>"} otherwise, so names in any encoding survive a round trip.
 */
class ArtifactSerializer {
public:
    static constexpr int SchemaVersion = 1;

    static nlohmann::json ToJson(const domain::Manifest& manifest);
    static nlohmann::json ToJson(const domain::Plan& plan);
    static nlohmann::json ToJson(const domain::Rollback& rollback);
    static nlohmann::json ToJson(const domain::ExecutionReport& report);

    static domain::Manifest ManifestFromJson(const nlohmann::json& j);
    static domain::Plan PlanFromJson(const nlohmann::json& j);
    static domain::Rollback RollbackFromJson(const nlohmann::json& j);
    static domain::ExecutionReport ExecutionReportFromJson(const nlohmann::json& j);

    static nlohmann::json ToJson(const domain::UserPreferences& prefs);
    static domain::UserPreferences PreferencesFromJson(const nlohmann::json& j);

    static nlohmann::json PathToJson(const std::string& path);
    /** @throws std::invalid_argument on a malformed hex payload. */
    static std::string PathFromJson(const nlohmann::json& j);

    /** @brief Pretty-prints j; invalid UTF-8 in free text is replaced instead of throwing. */
    static std::string Dump(const nlohmann::json& j);
};

} // namespace sortwell::infrastructure
