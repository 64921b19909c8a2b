/**
 * @file OpenAIClassifier.hpp
 * @brief Classifier backed by an OpenAI-compatible chat completions endpoint.
 */

#pragma once
#include "domain/ClassifierService.hpp"
#include "infrastructure/PromptCatalog.hpp"
#include <string>

namespace sortwell::infrastructure {

/**
 * @class OpenAIClassifier
 * @brief Implements ClassifierService over /v1/chat/completions with a JSON response format.
 *
 * Without an API key every call fails fast and the scan falls back to
 * extension-based classification.
 */
class OpenAIClassifier : public domain::ClassifierService {
public:
    /**
     * @param baseUrl Scheme, host and optional port, e.g. "https://api.openai.com".
     * @param apiKey Bearer token.
     * @param model Model used for classification.
     * @param policy Timeout and retry budget per request.
     */
    OpenAIClassifier(const std::string& baseUrl, const std::string& apiKey, const std::string& model,
                     RetryPolicy policy = {});

    std::optional<domain::ClassificationResponse> classify(const domain::ClassificationRequest& request) override;
    bool checkConnection(std::string* outVersion = nullptr) override;
    std::vector<std::string> getAvailableModels() override;
    void setModel(const std::string& modelName) override { m_model = modelName; }
    std::string getCurrentModel() const override { return m_model; }
    std::string providerName() const override { return "openai"; }

private:
    std::optional<std::string> complete(const std::string& userPrompt);

    std::string m_baseUrl;
    std::string m_apiKey;
    std::string m_model;
    RetryPolicy m_policy;
};

} // namespace sortwell::infrastructure
