/**
 * @file Naming.cpp
 * @brief Implementation of Naming.
 */

#include "application/Naming.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <regex>
#include <vector>

namespace sortwell::application {

namespace {

bool IsWordChar(unsigned char c) {
    return std::isalnum(c) || c == '_';
}

std::string Trim(const std::string& s) {
    auto first = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto last = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return first < last ? std::string(first, last) : std::string();
}

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

std::string StripSpecialChars(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if (IsWordChar(c) || std::isspace(c) || c == '-') out += static_cast<char>(c);
    }
    return out;
}

// Upper-cases the first character of every word.
std::string TitleCaseWords(std::string s) {
    bool atBoundary = true;
    for (auto& ch : s) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (IsWordChar(c)) {
            if (atBoundary) ch = static_cast<char>(std::toupper(c));
            atBoundary = false;
        } else {
            atBoundary = true;
        }
    }
    return s;
}

// "my file-name" -> "myFileName"; a trailing run of separators is left alone.
std::string CamelCaseWords(const std::string& s) {
    std::string out;
    size_t i = 0;
    while (i < s.size()) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (std::isspace(c) || c == '-') {
            size_t j = i;
            while (j < s.size() && (std::isspace(static_cast<unsigned char>(s[j])) || s[j] == '-')) ++j;
            if (j == s.size()) {
                out.append(s, i, std::string::npos);
                break;
            }
            out += static_cast<char>(std::toupper(static_cast<unsigned char>(s[j])));
            i = j + 1;
            continue;
        }
        out += s[i];
        ++i;
    }
    return out;
}

std::string CollapseSeparators(const std::string& s) {
    std::string out;
    bool lastSpace = false;
    for (char ch : s) {
        char c = (ch == '_' || ch == '-') ? ' ' : ch;
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!lastSpace) out += ' ';
            lastSpace = true;
        } else {
            out += c;
            lastSpace = false;
        }
    }
    return Trim(out);
}

} // namespace

std::pair<std::string, std::string> Naming::SplitExtension(const std::string& filename) {
    auto dot = filename.find_last_of('.');
    if (dot == std::string::npos || dot == 0) {
        return {filename, ""};
    }
    return {filename.substr(0, dot), filename.substr(dot)};
}

std::string Naming::ApplyNamingPreferences(const std::string& filename, const domain::NamingPreference& naming) {
    auto [base, ext] = SplitExtension(filename);

    if (naming.removeSpecialChars) {
        base = StripSpecialChars(base);
    }

    switch (naming.style) {
        case domain::NamingStyle::LowerCase:
            base = ToLower(base);
            break;
        case domain::NamingStyle::TitleCase:
            base = TitleCaseWords(base);
            break;
        case domain::NamingStyle::CamelCase:
            base = CamelCaseWords(base);
            break;
        case domain::NamingStyle::Original:
            break;
    }

    // Never produce an empty or hidden name.
    if (Trim(base).empty()) {
        base = SplitExtension(filename).first;
    }
    return base + ext;
}

std::string Naming::CleanTitle(const std::string& title) {
    return TitleCaseWords(Trim(StripSpecialChars(CollapseSeparators(title))));
}

domain::DocumentMetadata Naming::MetadataFromFilename(const std::string& filename) {
    static const std::regex kDateTitle(R"(^(\d{4}-\d{2}-\d{2})\s+(.+)$)");
    static const std::regex kSubjectTitle(R"(^([^-]+?)\s*-\s*(.+)$)");
    static const std::regex kTitleAuthor(R"(^(.+?)\s*\(([^)]+)\)$)");

    domain::DocumentMetadata metadata;
    metadata.extractionMethod = "filename";

    std::string base = SplitExtension(filename).first;
    std::smatch match;

    if (std::regex_match(base, match, kDateTitle)) {
        metadata.creationDate = match[1].str() + "T00:00:00Z";
        metadata.title = Trim(match[2].str());
    } else if (std::regex_match(base, match, kSubjectTitle)) {
        metadata.subject = Trim(match[1].str());
        metadata.title = Trim(match[2].str());
    } else if (std::regex_match(base, match, kTitleAuthor)) {
        metadata.title = Trim(match[1].str());
        metadata.author = Trim(match[2].str());
    }

    if (metadata.subject && metadata.subject->empty()) metadata.subject.reset();
    if (!metadata.hasTitle()) {
        std::string plain = CollapseSeparators(base);
        if (plain.empty()) {
            metadata.title.reset();
        } else {
            metadata.title = plain;
        }
    }
    return metadata;
}

std::string Naming::GenerateCleanTitle(const domain::DocumentMetadata& metadata, const std::string& filename) {
    if (metadata.title && metadata.title->size() > 3) {
        std::string cleaned = CleanTitle(*metadata.title);
        if (!cleaned.empty()) return cleaned;
    }

    auto fromName = MetadataFromFilename(filename);
    if (fromName.hasTitle()) {
        std::string cleaned = CleanTitle(*fromName.title);
        if (!cleaned.empty()) return cleaned;
    }

    std::string cleaned = CleanTitle(SplitExtension(filename).first);
    return cleaned.empty() ? SplitExtension(filename).first : cleaned;
}

std::optional<std::string> Naming::FolderContext(const std::string& path) {
    static const std::vector<std::string> kGeneric = {"downloads", "documents", "files", "desktop", "home"};

    std::vector<std::string> parents;
    for (const auto& part : std::filesystem::path(path).parent_path()) {
        std::string name = part.string();
        if (name.empty() || name == "/") continue;
        parents.push_back(name);
    }

    size_t start = parents.size() > 3 ? parents.size() - 3 : 0;
    std::string context;
    for (size_t i = start; i < parents.size(); ++i) {
        if (std::find(kGeneric.begin(), kGeneric.end(), ToLower(parents[i])) != kGeneric.end()) continue;
        if (!context.empty()) context += " / ";
        context += parents[i];
    }

    if (context.empty()) return std::nullopt;
    return context;
}

std::string Naming::SanitizeFolderName(const std::string& name) {
    std::string out;
    for (unsigned char c : name) {
        if (c == '/' || c == '\\' || c == ':' || std::iscntrl(c)) {
            out += ' ';
        } else {
            out += static_cast<char>(c);
        }
    }
    out = Trim(out);
    while (!out.empty() && out.front() == '.') out.erase(0, 1);
    out = Trim(out);
    return out.empty() ? "Other" : out;
}

} // namespace sortwell::application
