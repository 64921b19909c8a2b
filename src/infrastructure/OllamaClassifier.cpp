/**
 * @file OllamaClassifier.cpp
 * @brief Implementation of the OllamaClassifier class.
 */
#include "infrastructure/OllamaClassifier.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <iostream>
#include <thread>

using json = nlohmann::json;

namespace sortwell::infrastructure {

OllamaClassifier::OllamaClassifier(const std::string& host, int port, const std::string& model, RetryPolicy policy)
    : m_client(host, port, policy.timeoutSeconds), m_model(model), m_policy(policy) {}

std::optional<domain::ClassificationResponse> OllamaClassifier::classify(const domain::ClassificationRequest& request) {
    json messages = json::array({
        {{"role", "system"}, {"content", PromptCatalog::GetClassificationSystemPrompt()}},
        {{"role", "user"}, {"content", PromptCatalog::BuildClassificationPrompt(request)}}
    });

    for (int attempt = 0; attempt <= m_policy.retries; ++attempt) {
        auto content = m_client.chat(m_model, messages, true);
        if (content) {
            auto parsed = PromptCatalog::ParseClassification(*content);
            if (!parsed) {
                // The model answered; asking again will not fix its output.
                std::cerr << "[OllamaClassifier] Unparseable classification for " << request.filename << std::endl;
                return std::nullopt;
            }
            return domain::SanitizeClassification(*parsed);
        }

        std::cerr << "[OllamaClassifier] Request failed (attempt " << (attempt + 1) << "/" << (m_policy.retries + 1)
                  << ") for " << request.filename << std::endl;
        if (attempt < m_policy.retries) {
            std::this_thread::sleep_for(std::chrono::milliseconds(PromptCatalog::BackoffMs(m_policy, attempt)));
        }
    }
    return std::nullopt;
}

bool OllamaClassifier::checkConnection(std::string* outVersion) {
    auto version = m_client.getVersion();
    if (!version) {
        std::cerr << "[OllamaClassifier] Ollama not reachable at " << m_client.host() << ":" << m_client.port()
                  << std::endl;
        return false;
    }
    if (outVersion) *outVersion = *version;
    return true;
}

std::vector<std::string> OllamaClassifier::getAvailableModels() {
    return m_client.getAvailableModels();
}

} // namespace sortwell::infrastructure
