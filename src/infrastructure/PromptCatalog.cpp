/**
 * @file PromptCatalog.cpp
 * @brief Implementation of PromptCatalog.
 */

#include "infrastructure/PromptCatalog.hpp"
#include "infrastructure/Utf8.hpp"
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>

using json = nlohmann::json;

namespace sortwell::infrastructure {

std::string PromptCatalog::GetClassificationSystemPrompt() {
    return
        "You are a file classification assistant. Analyze the provided information and classify the document.\n\n"
        "Return a JSON object with:\n"
        "- category: string (e.g., \"Chemistry Notes\", \"Personal Finance\", \"Work Documents\")\n"
        "- subject: string (broader subject area)\n"
        "- title: string (clean, descriptive title)\n"
        "- confidence: number (0.0 to 1.0)\n"
        "- reasoning: string (brief explanation)\n\n"
        "Be specific with categories. For academic documents, include the subject "
        "(e.g., \"Chemistry Notes\" not just \"Notes\").\n"
        "For personal documents, be descriptive (e.g., \"Tax Documents 2024\" not just \"Documents\").";
}

std::string PromptCatalog::BuildClassificationPrompt(const domain::ClassificationRequest& request) {
    std::ostringstream ss;
    ss << "Filename: " << request.filename << "\n";
    ss << "Extension: " << request.extension << "\n";
    ss << "Size: " << FormatFileSize(request.size);

    if (request.folderContext) {
        ss << "\nFolder context: " << *request.folderContext;
    }

    if (request.metadata) {
        const auto& meta = *request.metadata;
        if (meta.title) ss << "\nPDF Title: " << *meta.title;
        if (meta.author) ss << "\nAuthor: " << *meta.author;
        if (meta.subject) ss << "\nSubject: " << *meta.subject;
        if (!meta.keywords.empty()) {
            ss << "\nKeywords: ";
            for (size_t i = 0; i < meta.keywords.size(); ++i) {
                if (i > 0) ss << ", ";
                ss << meta.keywords[i];
            }
        }
        if (meta.firstPageSnippet) {
            ss << "\n\nFirst page text:\n" << TruncateUtf8(*meta.firstPageSnippet, 300);
        }
    }
    return ss.str();
}

std::optional<domain::ClassificationResponse> PromptCatalog::ParseClassification(const std::string& content) {
    try {
        auto j = json::parse(content);
        if (!j.is_object()) {
            std::cerr << "[PromptCatalog] Classification is not a JSON object" << std::endl;
            return std::nullopt;
        }

        domain::ClassificationResponse response;
        if (j.contains("category") && j["category"].is_string()) {
            response.category = j["category"].get<std::string>();
        }
        if (j.contains("subject") && j["subject"].is_string()) {
            response.subject = j["subject"].get<std::string>();
        }
        if (j.contains("title") && j["title"].is_string()) {
            response.title = j["title"].get<std::string>();
        }
        if (j.contains("confidence") && j["confidence"].is_number()) {
            response.confidence = j["confidence"].get<double>();
        } else {
            // No usable confidence: treat like a missing category.
            response.confidence = domain::kUnclassifiedConfidence;
            response.category.clear();
        }
        if (j.contains("reasoning") && j["reasoning"].is_string()) {
            response.reasoning = j["reasoning"].get<std::string>();
        }
        return response;
    } catch (const json::exception& e) {
        std::cerr << "[PromptCatalog] JSON Parse Error: " << e.what() << std::endl;
    }
    return std::nullopt;
}

std::string PromptCatalog::FormatFileSize(std::uintmax_t bytes) {
    static const char* kUnits[] = {"B", "KB", "MB", "GB", "TB"};
    double size = static_cast<double>(bytes);
    int unit = 0;
    while (size >= 1024.0 && unit < 4) {
        size /= 1024.0;
        ++unit;
    }

    std::ostringstream ss;
    if (unit == 0) {
        ss << bytes << " B";
    } else {
        ss << std::fixed << std::setprecision(1) << size << " " << kUnits[unit];
    }
    return ss.str();
}

int PromptCatalog::BackoffMs(const RetryPolicy& policy, int attempt) {
    int delay = policy.initialBackoffMs;
    for (int i = 0; i < attempt && delay < 60000; ++i) {
        delay *= 2;
    }
    return delay;
}

} // namespace sortwell::infrastructure
