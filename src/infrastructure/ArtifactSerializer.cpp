/**
 * @file ArtifactSerializer.cpp
 * @brief Implementation of ArtifactSerializer.
 */

#include "infrastructure/ArtifactSerializer.hpp"
#include "infrastructure/Utf8.hpp"
#include <stdexcept>

namespace sortwell::infrastructure {

using json = nlohmann::json;

namespace {

template <typename T>
void PutOptional(json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    } else {
        j[key] = nullptr;
    }
}

template <typename T>
std::optional<T> GetOptional(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    return j[key].get<T>();
}

void PutOptionalPath(json& j, const char* key, const std::optional<std::string>& value) {
    j[key] = value ? ArtifactSerializer::PathToJson(*value) : json(nullptr);
}

std::optional<std::string> GetOptionalPath(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    return ArtifactSerializer::PathFromJson(j[key]);
}

json PathsToJson(const std::vector<std::string>& paths) {
    json j = json::array();
    for (const auto& path : paths) {
        j.push_back(ArtifactSerializer::PathToJson(path));
    }
    return j;
}

std::vector<std::string> PathsFromJson(const json& j, const char* key) {
    std::vector<std::string> paths;
    if (!j.contains(key)) return paths;
    for (const auto& item : j.at(key)) {
        paths.push_back(ArtifactSerializer::PathFromJson(item));
    }
    return paths;
}

int HexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

json MetadataToJson(const domain::DocumentMetadata& m) {
    json j;
    PutOptional(j, "title", m.title);
    PutOptional(j, "author", m.author);
    PutOptional(j, "subject", m.subject);
    j["keywords"] = m.keywords;
    PutOptional(j, "creationDate", m.creationDate);
    PutOptional(j, "pageCount", m.pageCount);
    PutOptional(j, "firstPageSnippet", m.firstPageSnippet);
    j["extractionMethod"] = m.extractionMethod;
    return j;
}

domain::DocumentMetadata MetadataFromJson(const json& j) {
    domain::DocumentMetadata m;
    m.title = GetOptional<std::string>(j, "title");
    m.author = GetOptional<std::string>(j, "author");
    m.subject = GetOptional<std::string>(j, "subject");
    m.keywords = j.value("keywords", std::vector<std::string>{});
    m.creationDate = GetOptional<std::string>(j, "creationDate");
    m.pageCount = GetOptional<int>(j, "pageCount");
    m.firstPageSnippet = GetOptional<std::string>(j, "firstPageSnippet");
    m.extractionMethod = j.value("extractionMethod", "none");
    return m;
}

json DetectionToJson(const domain::ProjectRootDetection& d) {
    json j = {
        {"isProjectRoot", d.isProjectRoot},
        {"signals", d.signals},
        {"confidence", d.confidence}
    };
    if (d.projectType) {
        j["projectType"] = domain::ProjectTypeToString(*d.projectType);
    } else {
        j["projectType"] = nullptr;
    }
    return j;
}

domain::ProjectRootDetection DetectionFromJson(const json& j) {
    domain::ProjectRootDetection d;
    d.isProjectRoot = j.at("isProjectRoot").get<bool>();
    d.signals = j.value("signals", std::set<std::string>{});
    d.confidence = j.value("confidence", 0.0);
    if (auto type = GetOptional<std::string>(j, "projectType")) {
        d.projectType = domain::ProjectTypeFromString(*type);
    }
    return d;
}

json EntryToJson(const domain::ManifestEntry& e) {
    json j = {
        {"path", ArtifactSerializer::PathToJson(e.path)},
        {"relativePath", ArtifactSerializer::PathToJson(e.relativePath)},
        {"name", ArtifactSerializer::PathToJson(e.name)},
        {"extension", ArtifactSerializer::PathToJson(e.extension)},
        {"size", e.size},
        {"modifiedAt", e.modifiedAt},
        {"kind", domain::ItemKindToString(e.kind)},
        {"confidence", e.confidence},
        {"signals", e.signals},
        {"suggestedTags", e.suggestedTags},
        {"insideProjectRoot", e.insideProjectRoot},
        {"recommendedHandling", domain::HandlingToString(e.recommendedHandling)}
    };
    PutOptional(j, "suggestedCategory", e.suggestedCategory);
    PutOptionalPath(j, "parentProjectRoot", e.parentProjectRoot);
    j["documentMetadata"] = e.documentMetadata ? MetadataToJson(*e.documentMetadata) : json(nullptr);
    j["projectRoot"] = e.projectRoot ? DetectionToJson(*e.projectRoot) : json(nullptr);
    return j;
}

domain::ManifestEntry EntryFromJson(const json& j) {
    domain::ManifestEntry e;
    e.path = ArtifactSerializer::PathFromJson(j.at("path"));
    e.relativePath = ArtifactSerializer::PathFromJson(j.at("relativePath"));
    e.name = ArtifactSerializer::PathFromJson(j.at("name"));
    e.extension = j.contains("extension") ? ArtifactSerializer::PathFromJson(j["extension"]) : "";
    e.size = j.value("size", std::uintmax_t{0});
    e.modifiedAt = j.value("modifiedAt", "");
    e.kind = domain::ItemKindFromString(j.at("kind").get<std::string>());
    e.confidence = j.at("confidence").get<double>();
    e.signals = j.value("signals", std::vector<std::string>{});
    e.suggestedTags = j.value("suggestedTags", std::vector<std::string>{});
    e.insideProjectRoot = j.value("insideProjectRoot", false);
    e.recommendedHandling = domain::HandlingFromString(j.value("recommendedHandling", "review"));
    e.suggestedCategory = GetOptional<std::string>(j, "suggestedCategory");
    e.parentProjectRoot = GetOptionalPath(j, "parentProjectRoot");
    if (j.contains("documentMetadata") && j["documentMetadata"].is_object()) {
        e.documentMetadata = MetadataFromJson(j["documentMetadata"]);
    }
    if (j.contains("projectRoot") && j["projectRoot"].is_object()) {
        e.projectRoot = DetectionFromJson(j["projectRoot"]);
    }
    return e;
}

json ActionToJson(const domain::PlanAction& a) {
    json j = {
        {"id", a.id},
        {"from", ArtifactSerializer::PathToJson(a.from)},
        {"fromRelative", ArtifactSerializer::PathToJson(a.fromRelative)},
        {"to", ArtifactSerializer::PathToJson(a.to)},
        {"toRelative", ArtifactSerializer::PathToJson(a.toRelative)},
        {"actionType", domain::ActionTypeToString(a.actionType)},
        {"reason", a.reason},
        {"confidence", a.confidence},
        {"tags", a.tags},
        {"isProjectRoot", a.isProjectRoot},
        {"movesInsideProjectRoot", a.movesInsideProjectRoot},
        {"hasCollision", a.hasCollision},
        {"approved", a.approved}
    };
    PutOptional(j, "category", a.category);
    return j;
}

domain::PlanAction ActionFromJson(const json& j) {
    domain::PlanAction a;
    a.id = j.at("id").get<std::string>();
    a.from = ArtifactSerializer::PathFromJson(j.at("from"));
    a.fromRelative = j.contains("fromRelative") ? ArtifactSerializer::PathFromJson(j["fromRelative"]) : "";
    a.to = ArtifactSerializer::PathFromJson(j.at("to"));
    a.toRelative = j.contains("toRelative") ? ArtifactSerializer::PathFromJson(j["toRelative"]) : "";
    a.actionType = domain::ActionTypeFromString(j.at("actionType").get<std::string>());
    a.reason = j.value("reason", "");
    a.confidence = j.value("confidence", 0.0);
    a.tags = j.value("tags", std::vector<std::string>{});
    a.isProjectRoot = j.value("isProjectRoot", false);
    a.movesInsideProjectRoot = j.value("movesInsideProjectRoot", false);
    a.hasCollision = j.value("hasCollision", false);
    a.approved = j.value("approved", false);
    a.category = GetOptional<std::string>(j, "category");
    return a;
}

json ResultToJson(const domain::ExecutionResult& r) {
    json j = {
        {"actionId", r.actionId},
        {"status", domain::ExecutionStatusToString(r.status)},
        {"timestamp", r.timestamp}
    };
    PutOptional(j, "error", r.error);
    PutOptionalPath(j, "actualDestination", r.actualDestination);
    return j;
}

domain::ExecutionResult ResultFromJson(const json& j) {
    domain::ExecutionResult r;
    r.actionId = j.at("actionId").get<std::string>();
    r.status = domain::ExecutionStatusFromString(j.at("status").get<std::string>());
    r.timestamp = j.value("timestamp", "");
    r.error = GetOptional<std::string>(j, "error");
    r.actualDestination = GetOptionalPath(j, "actualDestination");
    return r;
}

} // namespace

json ArtifactSerializer::PathToJson(const std::string& path) {
    if (IsValidUtf8(path)) return path;

    static const char* kDigits = "0123456789abcdef";
    std::string hex;
    hex.reserve(path.size() * 2);
    for (unsigned char c : path) {
        hex.push_back(kDigits[c >> 4]);
        hex.push_back(kDigits[c & 0x0F]);
    }
    return json{{"hex", hex}};
}

std::string ArtifactSerializer::PathFromJson(const json& j) {
    if (!j.is_object()) return j.get<std::string>();

    std::string hex = j.at("hex").get<std::string>();
    if (hex.size() % 2 != 0) {
        throw std::invalid_argument("odd-length hex path");
    }
    std::string path;
    path.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int high = HexValue(hex[i]);
        int low = HexValue(hex[i + 1]);
        if (high < 0 || low < 0) {
            throw std::invalid_argument("invalid hex digit in path");
        }
        path.push_back(static_cast<char>((high << 4) | low));
    }
    return path;
}

std::string ArtifactSerializer::Dump(const json& j) {
    return j.dump(2, ' ', false, json::error_handler_t::replace);
}

json ArtifactSerializer::ToJson(const domain::UserPreferences& prefs) {
    return json{
        {"naming", {
            {"style", domain::NamingStyleToString(prefs.naming.style)},
            {"removeSpecialChars", prefs.naming.removeSpecialChars}
        }},
        {"confidenceThresholds", {
            {"autoApprove", prefs.confidenceThresholds.autoApprove},
            {"requireReview", prefs.confidenceThresholds.requireReview}
        }},
        {"defaultFolders", prefs.defaultFolders},
        {"ignorePaths", prefs.ignorePaths}
    };
}

domain::UserPreferences ArtifactSerializer::PreferencesFromJson(const json& j) {
    auto prefs = domain::UserPreferences::Defaults();
    if (j.contains("naming")) {
        prefs.naming.style = domain::NamingStyleFromString(j["naming"].value("style", "original"));
        prefs.naming.removeSpecialChars = j["naming"].value("removeSpecialChars", false);
    }
    if (j.contains("confidenceThresholds")) {
        const auto& t = j["confidenceThresholds"];
        prefs.confidenceThresholds.autoApprove = t.value("autoApprove", prefs.confidenceThresholds.autoApprove);
        prefs.confidenceThresholds.requireReview = t.value("requireReview", prefs.confidenceThresholds.requireReview);
    }
    if (j.contains("defaultFolders")) {
        prefs.defaultFolders = j["defaultFolders"].get<std::map<std::string, std::string>>();
    }
    if (j.contains("ignorePaths")) {
        prefs.ignorePaths = j["ignorePaths"].get<std::vector<std::string>>();
    }
    return prefs;
}

json ArtifactSerializer::ToJson(const domain::Manifest& manifest) {
    const auto& o = manifest.scanOptions;
    const auto& s = manifest.summary;
    json entries = json::array();
    for (const auto& entry : manifest.entries) {
        entries.push_back(EntryToJson(entry));
    }
    return json{
        {"schemaVersion", SchemaVersion},
        {"id", manifest.id},
        {"scanRoot", PathToJson(manifest.scanRoot)},
        {"createdAt", manifest.createdAt},
        {"scanOptions", {
            {"rootPath", PathToJson(o.rootPath)},
            {"ignorePatterns", o.ignorePatterns},
            {"includeHidden", o.includeHidden},
            {"maxDepth", o.maxDepth},
            {"useClassifier", o.useClassifier},
            {"classifierConcurrency", o.classifierConcurrency},
            {"extractMetadata", o.extractMetadata},
            {"reviewThreshold", o.reviewThreshold}
        }},
        {"entries", entries},
        {"summary", {
            {"totalItems", s.totalItems},
            {"projectRoots", s.projectRoots},
            {"documents", s.documents},
            {"media", s.media},
            {"archives", s.archives},
            {"code", s.code},
            {"generated", s.generated},
            {"unknown", s.unknown},
            {"highConfidence", s.highConfidence},
            {"mediumConfidence", s.mediumConfidence},
            {"lowConfidence", s.lowConfidence}
        }}
    };
}

domain::Manifest ArtifactSerializer::ManifestFromJson(const json& j) {
    domain::Manifest manifest;
    manifest.id = j.at("id").get<std::string>();
    manifest.scanRoot = PathFromJson(j.at("scanRoot"));
    manifest.createdAt = j.value("createdAt", "");

    if (j.contains("scanOptions")) {
        const auto& o = j["scanOptions"];
        manifest.scanOptions.rootPath = o.contains("rootPath") ? PathFromJson(o["rootPath"]) : manifest.scanRoot;
        manifest.scanOptions.ignorePatterns = o.value("ignorePatterns", std::vector<std::string>{});
        manifest.scanOptions.includeHidden = o.value("includeHidden", false);
        manifest.scanOptions.maxDepth = o.value("maxDepth", 10);
        manifest.scanOptions.useClassifier = o.value("useClassifier", false);
        manifest.scanOptions.classifierConcurrency = o.value("classifierConcurrency", 1);
        manifest.scanOptions.extractMetadata = o.value("extractMetadata", true);
        manifest.scanOptions.reviewThreshold = o.value("reviewThreshold", 0.5);
    }

    for (const auto& entry : j.at("entries")) {
        manifest.entries.push_back(EntryFromJson(entry));
    }

    if (j.contains("summary")) {
        const auto& s = j["summary"];
        manifest.summary.totalItems = s.value("totalItems", 0);
        manifest.summary.projectRoots = s.value("projectRoots", 0);
        manifest.summary.documents = s.value("documents", 0);
        manifest.summary.media = s.value("media", 0);
        manifest.summary.archives = s.value("archives", 0);
        manifest.summary.code = s.value("code", 0);
        manifest.summary.generated = s.value("generated", 0);
        manifest.summary.unknown = s.value("unknown", 0);
        manifest.summary.highConfidence = s.value("highConfidence", 0);
        manifest.summary.mediumConfidence = s.value("mediumConfidence", 0);
        manifest.summary.lowConfidence = s.value("lowConfidence", 0);
    }
    return manifest;
}

json ArtifactSerializer::ToJson(const domain::Plan& plan) {
    const auto& c = plan.safetyCheck;
    const auto& s = plan.summary;
    json actions = json::array();
    for (const auto& action : plan.actions) {
        actions.push_back(ActionToJson(action));
    }
    return json{
        {"schemaVersion", SchemaVersion},
        {"id", plan.id},
        {"manifestId", plan.manifestId},
        {"createdAt", plan.createdAt},
        {"destRoot", PathToJson(plan.destRoot)},
        {"actions", actions},
        {"safetyCheck", {
            {"passed", c.passed},
            {"errors", c.errors},
            {"warnings", c.warnings},
            {"collisionsResolved", c.collisionsResolved},
            {"collisionDestinations", PathsToJson(c.collisionDestinations)},
            {"lowConfidenceActions", c.lowConfidenceActions},
            {"skippedItems", c.skippedItems},
            {"projectRootViolations", c.projectRootViolations}
        }},
        {"summary", {
            {"totalActions", s.totalActions},
            {"moves", s.moves},
            {"renames", s.renames},
            {"skips", s.skips},
            {"categoryCounts", s.categoryCounts},
            {"highConfidence", s.highConfidence},
            {"mediumConfidence", s.mediumConfidence},
            {"lowConfidence", s.lowConfidence}
        }},
        {"userPreferences", ToJson(plan.userPreferences)}
    };
}

domain::Plan ArtifactSerializer::PlanFromJson(const json& j) {
    domain::Plan plan;
    plan.id = j.at("id").get<std::string>();
    plan.manifestId = j.value("manifestId", "");
    plan.createdAt = j.value("createdAt", "");
    plan.destRoot = PathFromJson(j.at("destRoot"));

    for (const auto& action : j.at("actions")) {
        plan.actions.push_back(ActionFromJson(action));
    }

    const auto& c = j.at("safetyCheck");
    plan.safetyCheck.passed = c.at("passed").get<bool>();
    plan.safetyCheck.errors = c.value("errors", std::vector<std::string>{});
    plan.safetyCheck.warnings = c.value("warnings", std::vector<std::string>{});
    plan.safetyCheck.collisionsResolved = c.value("collisionsResolved", 0);
    plan.safetyCheck.collisionDestinations = PathsFromJson(c, "collisionDestinations");
    plan.safetyCheck.lowConfidenceActions = c.value("lowConfidenceActions", 0);
    plan.safetyCheck.skippedItems = c.value("skippedItems", 0);
    plan.safetyCheck.projectRootViolations = c.value("projectRootViolations", 0);

    if (j.contains("summary")) {
        const auto& s = j["summary"];
        plan.summary.totalActions = s.value("totalActions", 0);
        plan.summary.moves = s.value("moves", 0);
        plan.summary.renames = s.value("renames", 0);
        plan.summary.skips = s.value("skips", 0);
        plan.summary.categoryCounts = s.value("categoryCounts", std::map<std::string, int>{});
        plan.summary.highConfidence = s.value("highConfidence", 0);
        plan.summary.mediumConfidence = s.value("mediumConfidence", 0);
        plan.summary.lowConfidence = s.value("lowConfidence", 0);
    }

    if (j.contains("userPreferences")) {
        plan.userPreferences = PreferencesFromJson(j["userPreferences"]);
    }
    return plan;
}

json ArtifactSerializer::ToJson(const domain::Rollback& rollback) {
    json entries = json::array();
    for (const auto& e : rollback.entries) {
        entries.push_back({{"from", PathToJson(e.from)},
                           {"to", PathToJson(e.to)},
                           {"actionId", e.actionId},
                           {"timestamp", e.timestamp}});
    }
    return json{
        {"schemaVersion", SchemaVersion},
        {"planId", rollback.planId},
        {"createdAt", rollback.createdAt},
        {"entries", entries},
        {"createdDirectories", PathsToJson(rollback.createdDirectories)}
    };
}

domain::Rollback ArtifactSerializer::RollbackFromJson(const json& j) {
    domain::Rollback rollback;
    rollback.planId = j.at("planId").get<std::string>();
    rollback.createdAt = j.value("createdAt", "");
    for (const auto& e : j.at("entries")) {
        rollback.entries.push_back(domain::RollbackEntry{
            PathFromJson(e.at("from")),
            PathFromJson(e.at("to")),
            e.value("actionId", ""),
            e.value("timestamp", "")
        });
    }
    rollback.createdDirectories = PathsFromJson(j, "createdDirectories");
    return rollback;
}

json ArtifactSerializer::ToJson(const domain::ExecutionReport& report) {
    json results = json::array();
    for (const auto& r : report.results) {
        results.push_back(ResultToJson(r));
    }
    json rollback = ToJson(report.rollback);
    rollback.erase("schemaVersion");
    return json{
        {"schemaVersion", SchemaVersion},
        {"planId", report.planId},
        {"executedAt", report.executedAt},
        {"dryRun", report.dryRun},
        {"results", results},
        {"summary", {
            {"total", report.summary.total},
            {"completed", report.summary.completed},
            {"failed", report.summary.failed},
            {"skipped", report.summary.skipped}
        }},
        {"rollback", rollback}
    };
}

domain::ExecutionReport ArtifactSerializer::ExecutionReportFromJson(const json& j) {
    domain::ExecutionReport report;
    report.planId = j.at("planId").get<std::string>();
    report.executedAt = j.value("executedAt", "");
    report.dryRun = j.value("dryRun", false);
    for (const auto& r : j.at("results")) {
        report.results.push_back(ResultFromJson(r));
    }
    if (j.contains("summary")) {
        const auto& s = j["summary"];
        report.summary.total = s.value("total", 0);
        report.summary.completed = s.value("completed", 0);
        report.summary.failed = s.value("failed", 0);
        report.summary.skipped = s.value("skipped", 0);
    }
    if (j.contains("rollback")) {
        report.rollback = RollbackFromJson(j["rollback"]);
    }
    return report;
}

} // namespace sortwell::infrastructure
