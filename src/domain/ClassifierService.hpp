/**
 * @file ClassifierService.hpp
 * @brief Interface for external document classifiers (local or hosted language models).
 */

#pragma once
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "Manifest.hpp"

namespace sortwell::domain {

/**
 * @struct ClassificationRequest
 * @brief Everything a classifier is told about one document.
 */
struct ClassificationRequest {
    std::string filename;
    std::string extension;
    std::uintmax_t size = 0;
    std::optional<DocumentMetadata> metadata;
    std::optional<std::string> folderContext;
};

/**
 * @struct ClassificationResponse
 * @brief A classifier's opinion. Untrusted until passed through SanitizeClassification.
 */
struct ClassificationResponse {
    std::string category;
    std::optional<std::string> subject;
    std::optional<std::string> title;
    double confidence = 0.0;
    std::string reasoning;
};

/** @brief Confidence given to a response that named no usable category. */
constexpr double kUnclassifiedConfidence = 0.1;

/**
 * @brief Clamps confidence into [0,1] and degrades a missing category to a low-confidence "Unknown".
 */
inline ClassificationResponse SanitizeClassification(ClassificationResponse response) {
    if (!std::isfinite(response.confidence)) {
        response.confidence = kUnclassifiedConfidence;
    }
    response.confidence = std::clamp(response.confidence, 0.0, 1.0);

    bool blank = std::all_of(response.category.begin(), response.category.end(),
                             [](unsigned char c) { return std::isspace(c); });
    if (blank) {
        response.category = "Unknown";
        response.confidence = std::min(response.confidence, kUnclassifiedConfidence);
    }
    if (response.subject && response.subject->empty()) response.subject.reset();
    if (response.title && response.title->empty()) response.title.reset();
    return response;
}

/**
 * @class ClassifierService
 * @brief Abstract classification capability. The pipeline never branches on the provider behind it.
 */
class ClassifierService {
public:
    virtual ~ClassifierService() = default;

    /**
     * @brief Classifies one document.
     * @param request Filename, size, optional metadata and folder context.
     * @return The provider's response, or nullopt when the provider was unreachable,
     *         timed out after all retries, or returned something unparseable.
     */
    virtual std::optional<ClassificationResponse> classify(const ClassificationRequest& request) = 0;

    /**
     * @brief Checks that the provider answers.
     * @param outVersion Receives a version string when the provider reports one.
     * @return True if reachable.
     */
    virtual bool checkConnection(std::string* outVersion = nullptr) = 0;

    /** @brief Retrieves available model names from the provider. */
    virtual std::vector<std::string> getAvailableModels() = 0;

    /** @brief Selects the model used for future requests. */
    virtual void setModel(const std::string& modelName) = 0;

    /** @brief Gets the currently selected model. */
    virtual std::string getCurrentModel() const = 0;

    /** @brief Short provider name for logs ("ollama", "openai"). */
    virtual std::string providerName() const = 0;
};

} // namespace sortwell::domain
