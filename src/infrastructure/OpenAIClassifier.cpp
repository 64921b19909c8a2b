/**
 * @file OpenAIClassifier.cpp
 * @brief Implementation of the OpenAIClassifier class.
 */
#include "infrastructure/OpenAIClassifier.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <chrono>
#include <iostream>
#include <thread>

using json = nlohmann::json;

namespace sortwell::infrastructure {

namespace {
constexpr double kTemperature = 0.3;
constexpr int kShortTimeoutSeconds = 10;
}

OpenAIClassifier::OpenAIClassifier(const std::string& baseUrl, const std::string& apiKey, const std::string& model,
                                   RetryPolicy policy)
    : m_baseUrl(baseUrl), m_apiKey(apiKey), m_model(model), m_policy(policy) {}

std::optional<std::string> OpenAIClassifier::complete(const std::string& userPrompt) {
    httplib::Client cli(m_baseUrl);
    cli.set_connection_timeout(kShortTimeoutSeconds);
    cli.set_read_timeout(m_policy.timeoutSeconds);
    cli.set_write_timeout(m_policy.timeoutSeconds);
    cli.set_bearer_token_auth(m_apiKey);

    json requestData = {
        {"model", m_model},
        {"messages", json::array({
            {{"role", "system"}, {"content", PromptCatalog::GetClassificationSystemPrompt() +
                                             "\n\nRespond only with valid JSON matching the requested schema."}},
            {{"role", "user"}, {"content", userPrompt}}
        })},
        {"temperature", kTemperature},
        {"response_format", {{"type", "json_object"}}}
    };

    auto res = cli.Post("/v1/chat/completions", requestData.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
    if (res && res->status == 200) {
        try {
            auto body = json::parse(res->body);
            if (body.contains("choices") && body["choices"].is_array() && !body["choices"].empty()) {
                const auto& message = body["choices"][0]["message"];
                if (message.contains("content") && message["content"].is_string()) {
                    return message["content"].get<std::string>();
                }
            }
            std::cerr << "[OpenAIClassifier] Empty response" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[OpenAIClassifier] JSON Parse Error: " << e.what() << std::endl;
        }
    } else if (res) {
        std::cerr << "[OpenAIClassifier] HTTP Error " << res->status << std::endl;
    } else {
        std::cerr << "[OpenAIClassifier] Connection failed: " << static_cast<int>(res.error()) << std::endl;
    }
    return std::nullopt;
}

std::optional<domain::ClassificationResponse> OpenAIClassifier::classify(const domain::ClassificationRequest& request) {
    if (m_apiKey.empty()) {
        std::cerr << "[OpenAIClassifier] OpenAI API key not configured" << std::endl;
        return std::nullopt;
    }

    std::string prompt = PromptCatalog::BuildClassificationPrompt(request);
    for (int attempt = 0; attempt <= m_policy.retries; ++attempt) {
        auto content = complete(prompt);
        if (content) {
            auto parsed = PromptCatalog::ParseClassification(*content);
            if (!parsed) {
                std::cerr << "[OpenAIClassifier] Unparseable classification for " << request.filename << std::endl;
                return std::nullopt;
            }
            return domain::SanitizeClassification(*parsed);
        }

        std::cerr << "[OpenAIClassifier] Request failed (attempt " << (attempt + 1) << "/" << (m_policy.retries + 1)
                  << ") for " << request.filename << std::endl;
        if (attempt < m_policy.retries) {
            std::this_thread::sleep_for(std::chrono::milliseconds(PromptCatalog::BackoffMs(m_policy, attempt)));
        }
    }
    return std::nullopt;
}

bool OpenAIClassifier::checkConnection(std::string* outVersion) {
    if (m_apiKey.empty()) {
        std::cerr << "[OpenAIClassifier] OpenAI API key not configured" << std::endl;
        return false;
    }

    httplib::Client cli(m_baseUrl);
    cli.set_connection_timeout(kShortTimeoutSeconds);
    cli.set_read_timeout(kShortTimeoutSeconds);
    cli.set_bearer_token_auth(m_apiKey);

    auto res = cli.Get("/v1/models");
    if (!res || res->status != 200) {
        std::cerr << "[OpenAIClassifier] Not reachable at " << m_baseUrl << std::endl;
        return false;
    }
    if (outVersion) *outVersion = "OpenAI API";
    return true;
}

std::vector<std::string> OpenAIClassifier::getAvailableModels() {
    std::vector<std::string> models;
    if (m_apiKey.empty()) return models;

    httplib::Client cli(m_baseUrl);
    cli.set_connection_timeout(kShortTimeoutSeconds);
    cli.set_read_timeout(kShortTimeoutSeconds);
    cli.set_bearer_token_auth(m_apiKey);

    auto res = cli.Get("/v1/models");
    if (res && res->status == 200) {
        try {
            auto body = json::parse(res->body);
            if (body.contains("data") && body["data"].is_array()) {
                for (const auto& item : body["data"]) {
                    std::string id = item.value("id", std::string());
                    if (id.find("gpt") != std::string::npos) {
                        models.push_back(id);
                    }
                }
            }
        } catch (const std::exception& e) {
            std::cerr << "[OpenAIClassifier] Error parsing models: " << e.what() << std::endl;
        }
    }
    std::sort(models.begin(), models.end());
    return models;
}

} // namespace sortwell::infrastructure
