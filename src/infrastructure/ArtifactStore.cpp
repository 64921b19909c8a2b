/**
 * @file ArtifactStore.cpp
 * @brief Implementation of ArtifactStore.
 */

#include "infrastructure/ArtifactStore.hpp"
#include "infrastructure/ArtifactSerializer.hpp"
#include "domain/Timestamp.hpp"
#include <cctype>
#include <chrono>
#include <cmath>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace sortwell::infrastructure {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

const std::string kRule(80, '=');

std::optional<json> ReadJson(const fs::path& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        std::cerr << "[ArtifactStore] Cannot open " << path.string() << std::endl;
        return std::nullopt;
    }
    try {
        json j;
        f >> j;
        if (!j.is_object()) {
            std::cerr << "[ArtifactStore] " << path.string() << " is not a JSON object" << std::endl;
            return std::nullopt;
        }
        int version = j.value("schemaVersion", ArtifactSerializer::SchemaVersion);
        if (version > ArtifactSerializer::SchemaVersion) {
            std::cerr << "[ArtifactStore] " << path.string() << " has unsupported schemaVersion " << version
                      << std::endl;
            return std::nullopt;
        }
        return j;
    } catch (const json::exception& e) {
        std::cerr << "[ArtifactStore] Malformed JSON in " << path.string() << ": " << e.what() << std::endl;
        return std::nullopt;
    }
}

template <typename T, typename Parse>
std::optional<T> LoadWith(const fs::path& path, Parse parse) {
    auto j = ReadJson(path);
    if (!j) return std::nullopt;
    try {
        return parse(*j);
    } catch (const json::exception& e) {
        std::cerr << "[ArtifactStore] Invalid artifact " << path.string() << ": " << e.what() << std::endl;
        return std::nullopt;
    } catch (const std::invalid_argument& e) {
        std::cerr << "[ArtifactStore] Invalid path in " << path.string() << ": " << e.what() << std::endl;
        return std::nullopt;
    }
}

std::string StatusSymbol(domain::ExecutionStatus status) {
    switch (status) {
        case domain::ExecutionStatus::Completed: return "✓";
        case domain::ExecutionStatus::Failed: return "✗";
        case domain::ExecutionStatus::Skipped: return "-";
    }
    return "-";
}

/** @brief ISO-8601 timestamp with ':' and '.' replaced, usable in a file name. */
std::string FileStamp(const std::string& timestamp) {
    std::string stamp = timestamp.empty() ? domain::NowIso8601() : timestamp;
    for (auto& c : stamp) {
        if (c == ':' || c == '.') c = '-';
    }
    return stamp;
}

std::string ToUpper(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

} // namespace

ArtifactStore::ArtifactStore(fs::path directory) : m_directory(std::move(directory)) {}

std::optional<fs::path> ArtifactStore::saveJson(const fs::path& path, const json& j, const std::string& what) const {
    std::string content;
    try {
        content = ArtifactSerializer::Dump(j);
    } catch (const json::exception& e) {
        std::cerr << "[ArtifactStore] Cannot serialize " << what << ": " << e.what() << std::endl;
        return std::nullopt;
    }
    if (!WriteAtomically(path, content)) return std::nullopt;
    std::cout << "[ArtifactStore] " << what << " saved to " << path.string() << std::endl;
    return path;
}

fs::path ArtifactStore::runArtifactPath(const std::string& prefix, const std::string& planId,
                                        const std::string& timestamp, const std::string& extension) const {
    std::string stem = prefix;
    if (!planId.empty()) stem += "-" + planId;
    stem += "-" + FileStamp(timestamp);

    fs::path path = m_directory / (stem + extension);
    std::error_code ec;
    for (int n = 2; fs::exists(path, ec); ++n) {
        path = m_directory / (stem + "-" + std::to_string(n) + extension);
    }
    return path;
}

std::optional<fs::path> ArtifactStore::saveManifest(const domain::Manifest& manifest) const {
    return saveJson(m_directory / ("manifest-" + manifest.id + ".json"), ArtifactSerializer::ToJson(manifest),
                    "Manifest");
}

std::optional<fs::path> ArtifactStore::savePlan(const domain::Plan& plan) const {
    return saveJson(m_directory / ("plan-" + plan.id + ".json"), ArtifactSerializer::ToJson(plan), "Plan");
}

std::optional<fs::path> ArtifactStore::saveRollback(const domain::Rollback& rollback) const {
    return saveJson(m_directory / ("rollback-" + rollback.planId + ".json"), ArtifactSerializer::ToJson(rollback),
                    "Rollback");
}

std::optional<fs::path> ArtifactStore::saveExecutionReport(const domain::ExecutionReport& report) const {
    return saveJson(runArtifactPath("execution", report.planId, report.executedAt, ".json"),
                    ArtifactSerializer::ToJson(report), "Execution report");
}

std::optional<fs::path> ArtifactStore::saveExecutionRollback(const domain::ExecutionReport& report) const {
    return saveJson(runArtifactPath("rollback", report.planId, report.executedAt, ".json"),
                    ArtifactSerializer::ToJson(report.rollback), "Rollback");
}

std::optional<fs::path> ArtifactStore::saveUndoReport(const domain::ExecutionReport& report) const {
    return saveJson(runArtifactPath("undo", report.planId, report.executedAt, ".json"),
                    ArtifactSerializer::ToJson(report), "Undo report");
}

std::optional<fs::path> ArtifactStore::saveExecutionLog(const domain::ExecutionReport& report,
                                                        const domain::Plan& plan,
                                                        const std::string& rollbackFile) const {
    fs::path path = runArtifactPath("execution-log", "", report.executedAt, ".txt");
    if (!WriteAtomically(path, FormatExecutionLog(report, plan, rollbackFile))) return std::nullopt;
    std::cout << "[ArtifactStore] Log saved to " << path.string() << std::endl;
    return path;
}

std::optional<domain::Manifest> ArtifactStore::LoadManifest(const fs::path& path) {
    return LoadWith<domain::Manifest>(path, ArtifactSerializer::ManifestFromJson);
}

std::optional<domain::Plan> ArtifactStore::LoadPlan(const fs::path& path) {
    return LoadWith<domain::Plan>(path, ArtifactSerializer::PlanFromJson);
}

std::optional<domain::Rollback> ArtifactStore::LoadRollback(const fs::path& path) {
    return LoadWith<domain::Rollback>(path, ArtifactSerializer::RollbackFromJson);
}

std::optional<domain::ExecutionReport> ArtifactStore::LoadExecutionReport(const fs::path& path) {
    return LoadWith<domain::ExecutionReport>(path, ArtifactSerializer::ExecutionReportFromJson);
}

std::string ArtifactStore::FormatExecutionLog(const domain::ExecutionReport& report, const domain::Plan& plan,
                                              const std::string& rollbackFile) {
    std::ostringstream ss;
    ss << kRule << "\n"
       << "FILE ORGANIZATION EXECUTION LOG\n"
       << kRule << "\n\n"
       << "Plan ID: " << report.planId << "\n"
       << "Executed: " << report.executedAt << "\n";
    if (report.dryRun) {
        ss << "Mode: DRY RUN (no files were moved)\n";
    }
    ss << "\n"
       << "Summary:\n"
       << "  Total actions: " << report.summary.total << "\n"
       << "  Completed: " << report.summary.completed << "\n"
       << "  Failed: " << report.summary.failed << "\n"
       << "  Skipped: " << report.summary.skipped << "\n\n"
       << kRule << "\n"
       << "ACTIONS\n"
       << kRule << "\n\n";

    for (const auto& result : report.results) {
        const auto* action = plan.findAction(result.actionId);
        if (!action) continue;

        ss << StatusSymbol(result.status) << " [" << ToUpper(domain::ExecutionStatusToString(result.status)) << "] "
           << domain::ActionTypeToString(action->actionType) << "\n"
           << "  From: " << action->from << "\n"
           << "  To:   " << result.actualDestination.value_or(action->to) << "\n"
           << "  Reason: " << action->reason << "\n"
           << "  Confidence: " << static_cast<int>(std::lround(action->confidence * 100.0)) << "%\n";
        if (result.error) {
            ss << "  ERROR: " << *result.error << "\n";
        }
        ss << "\n";
    }

    if (!report.rollback.entries.empty()) {
        ss << kRule << "\n"
           << "ROLLBACK INFORMATION\n"
           << kRule << "\n\n"
           << "To undo these changes, use the rollback file:\n"
           << "  " << (rollbackFile.empty() ? "rollback-" + report.planId + ".json" : rollbackFile) << "\n";
    }
    return ss.str();
}

bool ArtifactStore::WriteAtomically(const fs::path& path, const std::string& content) {
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = path;
    tempPath += "." + std::to_string(stamp) + ".tmp";

    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            std::cerr << "[ArtifactStore] Error creating directories: " << ec.message() << std::endl;
            return false;
        }
    }

    {
        std::ofstream ofs(tempPath, std::ios::binary);
        if (!ofs.is_open()) {
            std::cerr << "[ArtifactStore] Failed to open temp file: " << tempPath.string() << std::endl;
            return false;
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            std::cerr << "[ArtifactStore] Write failed: " << tempPath.string() << std::endl;
            ofs.close();
            fs::remove(tempPath, ec);
            return false;
        }
    }

    fs::rename(tempPath, path, ec);
    if (ec) {
        std::cerr << "[ArtifactStore] Rename failed: " << ec.message() << std::endl;
        std::error_code cleanup;
        fs::remove(tempPath, cleanup);
        return false;
    }
    return true;
}

} // namespace sortwell::infrastructure
