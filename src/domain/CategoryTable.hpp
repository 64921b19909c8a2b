/**
 * @file CategoryTable.hpp
 * @brief Fixed extension-to-category table used for first-pass classification.
 */

#pragma once
#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sortwell::domain {

/** @brief Ordered (category, extensions) pairs. Extensions have no leading dot. */
inline const std::vector<std::pair<std::string, std::vector<std::string>>>& CategoryTable() {
    static const std::vector<std::pair<std::string, std::vector<std::string>>> kTable = {
        {"Images", {"png", "jpg", "jpeg", "heic", "gif", "webp"}},
        {"Documents", {"pdf", "doc", "docx", "ppt", "pptx", "txt", "md"}},
        {"Spreadsheets", {"xls", "xlsx", "csv"}},
        {"Audio", {"mp3", "wav", "m4a", "flac"}},
        {"Video", {"mp4", "mov", "mkv", "avi"}},
        {"Apps", {"dmg", "pkg"}},
        {"Archives", {"zip", "rar", "7z", "tar", "gz"}},
        {"Code", {"py", "js", "ts", "json", "html", "css", "ipynb", "java", "cpp", "c", "h"}}
    };
    return kTable;
}

inline std::string NormalizeExtension(const std::string& extension) {
    std::string ext = extension;
    if (!ext.empty() && ext.front() == '.') ext.erase(0, 1);
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
    return ext;
}

/**
 * @brief Looks up the category of an extension.
 * @param extension With or without leading dot, any case.
 */
inline std::optional<std::string> CategoryFromExtension(const std::string& extension) {
    std::string ext = NormalizeExtension(extension);
    if (ext.empty()) return std::nullopt;
    for (const auto& [category, extensions] : CategoryTable()) {
        if (std::find(extensions.begin(), extensions.end(), ext) != extensions.end()) {
            return category;
        }
    }
    return std::nullopt;
}

/** @brief True if the name is one of the meaningless names browsers and cameras hand out. */
inline bool IsGenericFilename(const std::string& filename) {
    static const std::vector<std::string> kGeneric = {
        "download", "file", "document", "untitled", "final", "new",
        "temp", "copy", "image", "photo", "video", "audio"
    };
    std::string lower = filename;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
    for (const auto& generic : kGeneric) {
        if (lower.find(generic) != std::string::npos) return true;
    }
    return false;
}

} // namespace sortwell::domain
