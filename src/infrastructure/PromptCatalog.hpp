/**
 * @file PromptCatalog.hpp
 * @brief Classification prompts and response parsing shared by all classifier adapters.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include "domain/ClassifierService.hpp"

namespace sortwell::infrastructure {

/**
 * @struct RetryPolicy
 * @brief Timeout and retry budget of one classification request.
 */
struct RetryPolicy {
    int timeoutSeconds = 60;
    int retries = 2;             ///< Extra attempts after the first one.
    int initialBackoffMs = 1000; ///< Delay before retry n is initialBackoffMs * 2^n.
};

class PromptCatalog {
public:
    /** @brief System prompt asking for a JSON classification object. */
    static std::string GetClassificationSystemPrompt();

    /** @brief User prompt describing one document. */
    static std::string BuildClassificationPrompt(const domain::ClassificationRequest& request);

    /**
     * @brief Parses the model's JSON answer.
     * @return nullopt if content is not a JSON object. Missing fields are left
     *         empty for domain::SanitizeClassification to degrade.
     */
    static std::optional<domain::ClassificationResponse> ParseClassification(const std::string& content);

    /** @brief "512 B", "1.5 KB", "3.2 MB". */
    static std::string FormatFileSize(std::uintmax_t bytes);

    /** @brief Delay before the retry that follows attempt (0-based). */
    static int BackoffMs(const RetryPolicy& policy, int attempt);
};

} // namespace sortwell::infrastructure
