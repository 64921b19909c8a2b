#include "infrastructure/ClassifierFactory.hpp"
#include "infrastructure/OllamaClassifier.hpp"
#include "infrastructure/OpenAIClassifier.hpp"
#include <iostream>

namespace sortwell::infrastructure {

std::shared_ptr<domain::ClassifierService> ClassifierFactory::Create(const Settings& settings) {
    RetryPolicy policy;
    policy.timeoutSeconds = settings.timeoutSeconds;
    policy.retries = settings.retries;
    policy.initialBackoffMs = settings.initialBackoffMs;

    if (settings.provider == "ollama") {
        return std::make_shared<OllamaClassifier>(settings.ollamaHost, settings.ollamaPort, settings.ollamaModel,
                                                  policy);
    }
    if (settings.provider == "openai") {
        return std::make_shared<OpenAIClassifier>(settings.openaiBaseUrl, settings.openaiApiKey,
                                                  settings.openaiModel, policy);
    }
    if (settings.provider != "none" && !settings.provider.empty()) {
        std::cerr << "[ClassifierFactory] Unknown provider '" << settings.provider
                  << "', classification disabled" << std::endl;
    }
    return nullptr;
}

} // namespace sortwell::infrastructure
