// PathUtils Header
#pragma once
#include <string>
#include <filesystem>
#include <system_error>

namespace sortwell::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();
    /** @brief Default directory for manifests, plans, rollbacks and execution logs. */
    static std::filesystem::path GetArtifactsDir();

    /** @brief Absolute, lexically normal form without a trailing separator. */
    static std::filesystem::path Normalize(const std::filesystem::path& path);

    /** @brief True if path equals ancestor or lies below it (lexical comparison). */
    static bool IsSameOrInside(const std::filesystem::path& path, const std::filesystem::path& ancestor);

    /** @brief Path of target relative to base with '/' separators, or target itself if unrelated. */
    static std::string RelativeTo(const std::filesystem::path& target, const std::filesystem::path& base);

    /**
     * @brief Renames from to to, failing with std::errc::file_exists instead of replacing an existing to.
     *
     * Atomic on Linux (renameat2 with RENAME_NOREPLACE). Filesystems without that flag
     * get an existence check followed by a plain rename.
     */
    static std::error_code RenameNoReplace(const std::filesystem::path& from, const std::filesystem::path& to);
};

} // namespace sortwell::infrastructure
