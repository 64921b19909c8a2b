/**
 * @file PdfMetadataExtractor.cpp
 * @brief Implementation of PdfMetadataExtractor.
 */

#include "infrastructure/PdfMetadataExtractor.hpp"
#include "infrastructure/Utf8.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

namespace sortwell::infrastructure {

namespace {

constexpr std::size_t kScanBytes = 50 * 1024;
constexpr std::size_t kSnippetLength = 500;

std::string Trim(const std::string& s) {
    auto start = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return start < end ? std::string(start, end) : std::string();
}

std::string CollapseWhitespace(const std::string& s) {
    std::string out;
    bool pendingSpace = false;
    for (char c : s) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) out += ' ';
        pendingSpace = false;
        out += c;
    }
    return out;
}

std::vector<std::string> SplitKeywords(const std::string& value) {
    std::vector<std::string> keywords;
    std::string current;
    for (char c : value) {
        if (c == ',' || c == ';') {
            auto k = Trim(current);
            if (!k.empty()) keywords.push_back(k);
            current.clear();
        } else {
            current += c;
        }
    }
    auto k = Trim(current);
    if (!k.empty()) keywords.push_back(k);
    return keywords;
}

// Returns the body of the balanced literal string starting at raw[open] == '('.
std::optional<std::string> ReadLiteral(const std::string& raw, std::size_t open) {
    int depth = 0;
    for (std::size_t i = open; i < raw.size(); ++i) {
        char c = raw[i];
        if (c == '\\') {
            ++i;
            continue;
        }
        if (c == '(') {
            ++depth;
        } else if (c == ')') {
            if (--depth == 0) return raw.substr(open + 1, i - open - 1);
        }
    }
    return std::nullopt;
}

std::optional<std::string> ReadKey(const std::string& raw, const std::string& key) {
    std::size_t pos = 0;
    while ((pos = raw.find(key, pos)) != std::string::npos) {
        std::size_t i = pos + key.size();
        // "/Title" must not match "/TitleFoo".
        if (i < raw.size() && std::isalnum(static_cast<unsigned char>(raw[i]))) {
            pos = i;
            continue;
        }
        while (i < raw.size() && std::isspace(static_cast<unsigned char>(raw[i]))) ++i;
        if (i < raw.size() && raw[i] == '(') {
            auto body = ReadLiteral(raw, i);
            if (body) {
                auto value = Trim(PdfMetadataExtractor::DecodeLiteral(*body));
                if (!value.empty()) return value;
            }
        }
        pos = i;
    }
    return std::nullopt;
}

// "D:20230415..." -> "2023-04-15T00:00:00Z"
std::optional<std::string> ParsePdfDate(const std::string& value) {
    std::string v = value;
    if (v.rfind("D:", 0) == 0) v = v.substr(2);
    if (v.size() < 8 || !std::all_of(v.begin(), v.begin() + 8, [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    return v.substr(0, 4) + "-" + v.substr(4, 2) + "-" + v.substr(6, 2) + "T00:00:00Z";
}

// Counts "/Type /Page" objects, not "/Type /Pages".
int CountPageObjects(const std::string& raw) {
    int count = 0;
    for (std::size_t pos = raw.find("/Type"); pos != std::string::npos; pos = raw.find("/Type", pos + 5)) {
        std::size_t i = pos + 5;
        while (i < raw.size() && std::isspace(static_cast<unsigned char>(raw[i]))) ++i;
        if (raw.compare(i, 5, "/Page") != 0) continue;
        i += 5;
        if (i < raw.size() && std::isalnum(static_cast<unsigned char>(raw[i]))) continue;
        ++count;
    }
    return count;
}

// True when the literal ending before `pos` is shown with Tj, or sits in a TJ array.
bool IsShownText(const std::string& raw, std::size_t pos) {
    std::size_t i = pos;
    bool inArray = false;
    while (i < raw.size()) {
        unsigned char c = static_cast<unsigned char>(raw[i]);
        if (std::isspace(c)) {
            ++i;
        } else if (std::isdigit(c) || c == '-' || c == '.') {
            ++i;
        } else if (c == '(') {
            auto body = ReadLiteral(raw, i);
            if (!body) return false;
            i += body->size() + 2;
            inArray = true;
        } else if (c == ']') {
            ++i;
            while (i < raw.size() && std::isspace(static_cast<unsigned char>(raw[i]))) ++i;
            return raw.compare(i, 2, "TJ") == 0;
        } else {
            return !inArray && raw.compare(i, 2, "Tj") == 0;
        }
    }
    return false;
}

} // namespace

PdfMetadataExtractor::PdfMetadataExtractor() {
    m_hasPdfInfo = HasTool("pdfinfo");
    m_hasPdfToText = HasTool("pdftotext");
    if (!m_hasPdfInfo) {
        std::cout << "[PdfMetadataExtractor] pdfinfo not found, using dictionary scan" << std::endl;
    }
}

bool PdfMetadataExtractor::supports(const std::string& extension) const {
    return extension == ".pdf";
}

std::optional<domain::DocumentMetadata> PdfMetadataExtractor::extract(const std::string& path) {
    try {
        if (m_hasPdfInfo) {
            auto metadata = extractWithPoppler(path);
            if (metadata) return metadata;
        }
        return extractFromDictionary(path);
    } catch (const std::exception& e) {
        std::cerr << "[PdfMetadataExtractor] Failed on " << path << ": " << e.what() << std::endl;
        return std::nullopt;
    }
}

std::optional<domain::DocumentMetadata> PdfMetadataExtractor::extractWithPoppler(const std::string& path) const {
    std::string info = RunCommand("pdfinfo " + ShellQuote(path) + " 2>/dev/null");
    if (Trim(info).empty()) return std::nullopt;

    auto metadata = ParsePdfInfo(info);
    metadata.extractionMethod = "pdfinfo";

    if (m_hasPdfToText) {
        std::string text = RunCommand("pdftotext -l 1 " + ShellQuote(path) + " - 2>/dev/null");
        text = CollapseWhitespace(text);
        if (!text.empty()) {
            metadata.firstPageSnippet = TruncateUtf8(text, kSnippetLength);
        }
    }
    return metadata;
}

std::optional<domain::DocumentMetadata> PdfMetadataExtractor::extractFromDictionary(const std::string& path) const {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        std::cerr << "[PdfMetadataExtractor] Cannot open " << path << std::endl;
        return std::nullopt;
    }
    std::string raw(kScanBytes, '\0');
    file.read(&raw[0], static_cast<std::streamsize>(raw.size()));
    raw.resize(static_cast<std::size_t>(file.gcount()));
    if (raw.empty()) return std::nullopt;

    auto metadata = ParseDictionary(raw);
    metadata.extractionMethod = "pdf-dictionary";
    return metadata;
}

domain::DocumentMetadata PdfMetadataExtractor::ParseDictionary(const std::string& raw) {
    domain::DocumentMetadata metadata;
    metadata.title = ReadKey(raw, "/Title");
    metadata.author = ReadKey(raw, "/Author");
    metadata.subject = ReadKey(raw, "/Subject");
    if (auto keywords = ReadKey(raw, "/Keywords")) {
        metadata.keywords = SplitKeywords(*keywords);
    }
    if (auto date = ReadKey(raw, "/CreationDate")) {
        metadata.creationDate = ParsePdfDate(*date);
    }

    int pages = CountPageObjects(raw);
    if (pages > 0) metadata.pageCount = pages;

    // Uncompressed content streams only; compressed text is out of reach here.
    std::string text;
    for (std::size_t pos = raw.find('('); pos != std::string::npos && text.size() < kSnippetLength;
         pos = raw.find('(', pos + 1)) {
        auto body = ReadLiteral(raw, pos);
        if (!body) break;
        std::size_t after = pos + body->size() + 2;
        if (IsShownText(raw, after)) {
            if (!text.empty()) text += ' ';
            text += DecodeLiteral(*body);
        }
        pos = after - 1;
    }
    text = CollapseWhitespace(text);
    if (!text.empty()) metadata.firstPageSnippet = TruncateUtf8(text, kSnippetLength);
    return metadata;
}

domain::DocumentMetadata PdfMetadataExtractor::ParsePdfInfo(const std::string& output) {
    domain::DocumentMetadata metadata;
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        std::string key = Trim(line.substr(0, colon));
        std::string value = Trim(line.substr(colon + 1));
        if (value.empty()) continue;

        if (key == "Title") metadata.title = value;
        else if (key == "Author") metadata.author = value;
        else if (key == "Subject") metadata.subject = value;
        else if (key == "Keywords") metadata.keywords = SplitKeywords(value);
        else if (key == "Pages") {
            try {
                metadata.pageCount = std::stoi(value);
            } catch (const std::exception&) {
                std::cerr << "[PdfMetadataExtractor] Bad page count: " << value << std::endl;
            }
        }
    }
    return metadata;
}

std::string PdfMetadataExtractor::DecodeLiteral(const std::string& body) {
    std::string out;
    for (std::size_t i = 0; i < body.size(); ++i) {
        char c = body[i];
        if (c != '\\' || i + 1 >= body.size()) {
            out += c;
            continue;
        }
        char next = body[++i];
        switch (next) {
            case 'n': out += '\n'; break;
            case 'r': out += '\r'; break;
            case 't': out += '\t'; break;
            case 'b': out += '\b'; break;
            case 'f': out += '\f'; break;
            case '\n': break; // line continuation
            default:
                if (next >= '0' && next <= '7') {
                    int value = next - '0';
                    for (int k = 0; k < 2 && i + 1 < body.size() && body[i + 1] >= '0' && body[i + 1] <= '7'; ++k) {
                        value = value * 8 + (body[++i] - '0');
                    }
                    out += static_cast<char>(value & 0xFF);
                } else {
                    out += next; // \( \) \\ and unknown escapes
                }
        }
    }
    return out;
}

std::string PdfMetadataExtractor::RunCommand(const std::string& cmd) {
    std::string output;
    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) return output;
    char buffer[256];
    while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
        output.append(buffer);
    }
    pclose(pipe);
    return output;
}

bool PdfMetadataExtractor::HasTool(const std::string& tool) {
    std::string cmd = "command -v " + tool + " >/dev/null 2>&1";
    return std::system(cmd.c_str()) == 0;
}

std::string PdfMetadataExtractor::ShellQuote(const std::string& path) {
    std::string quoted = "'";
    for (char c : path) {
        if (c == '\'') quoted += "'\\''";
        else quoted += c;
    }
    quoted += "'";
    return quoted;
}

} // namespace sortwell::infrastructure
