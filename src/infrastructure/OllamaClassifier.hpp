/**
 * @file OllamaClassifier.hpp
 * @brief Classifier backed by a local Ollama server.
 */

#pragma once
#include "domain/ClassifierService.hpp"
#include "infrastructure/OllamaClient.hpp"
#include "infrastructure/PromptCatalog.hpp"
#include <string>

namespace sortwell::infrastructure {

/**
 * @class OllamaClassifier
 * @brief Implements ClassifierService using the Ollama chat API in JSON mode.
 */
class OllamaClassifier : public domain::ClassifierService {
public:
    /**
     * @param host Server hostname or IP.
     * @param port Server port.
     * @param model Model used for classification.
     * @param policy Timeout and retry budget per request.
     */
    OllamaClassifier(const std::string& host, int port, const std::string& model, RetryPolicy policy = {});

    /** @see domain::ClassifierService::classify */
    std::optional<domain::ClassificationResponse> classify(const domain::ClassificationRequest& request) override;

    /** @see domain::ClassifierService::checkConnection */
    bool checkConnection(std::string* outVersion = nullptr) override;

    std::vector<std::string> getAvailableModels() override;
    void setModel(const std::string& modelName) override { m_model = modelName; }
    std::string getCurrentModel() const override { return m_model; }
    std::string providerName() const override { return "ollama"; }

private:
    OllamaClient m_client;
    std::string m_model; ///< Target model name.
    RetryPolicy m_policy;
};

} // namespace sortwell::infrastructure
