#include "infrastructure/OllamaClient.hpp"
#include <httplib.h>
#include <iostream>

namespace sortwell::infrastructure {

using json = nlohmann::json;

namespace {
constexpr double kDeterministicTemperature = 0.0;
constexpr double kDeterministicTopP = 1.0;
constexpr int kDeterministicSeed = 42;
constexpr int kShortTimeoutSeconds = 5;
}

OllamaClient::OllamaClient(const std::string& host, int port, int timeoutSeconds)
    : m_host(host), m_port(port), m_timeoutSeconds(timeoutSeconds) {}

std::optional<std::string> OllamaClient::chat(const std::string& model,
                                              const nlohmann::json& messages,
                                              bool forceJson) {
    httplib::Client cli(m_host, m_port);
    cli.set_connection_timeout(kShortTimeoutSeconds);
    cli.set_read_timeout(m_timeoutSeconds);
    cli.set_write_timeout(m_timeoutSeconds);

    json requestData = {
        {"model", model},
        {"messages", messages},
        {"stream", false},
        {"options", {
            {"temperature", kDeterministicTemperature},
            {"top_p", kDeterministicTopP},
            {"seed", kDeterministicSeed}
        }}
    };
    if (forceJson) {
        requestData["format"] = "json";
    }

    auto res = cli.Post("/api/chat", requestData.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
    if (res && res->status == 200) {
        try {
            auto body = json::parse(res->body);
            if (body.contains("message") && body["message"].contains("content")) {
                return body["message"]["content"].get<std::string>();
            }
            std::cerr << "[OllamaClient] No content in chat response" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[OllamaClient] Chat JSON Parse Error: " << e.what() << std::endl;
        }
    } else {
        if (res) {
            std::cerr << "[OllamaClient] HTTP Error " << res->status << ": " << res->body << std::endl;
        } else {
            std::cerr << "[OllamaClient] Connection failed: " << static_cast<int>(res.error()) << std::endl;
        }
    }
    return std::nullopt;
}

std::vector<std::string> OllamaClient::getAvailableModels() {
    httplib::Client cli(m_host, m_port);
    cli.set_connection_timeout(kShortTimeoutSeconds);
    cli.set_read_timeout(kShortTimeoutSeconds);

    auto res = cli.Get("/api/tags");
    std::vector<std::string> models;
    if (res && res->status == 200) {
        try {
            auto body = json::parse(res->body);
            if (body.contains("models") && body["models"].is_array()) {
                for (const auto& item : body["models"]) {
                    if (item.contains("name")) {
                        models.push_back(item["name"].get<std::string>());
                    }
                }
            }
        } catch (const std::exception& e) {
            std::cerr << "[OllamaClient] Error parsing models: " << e.what() << std::endl;
        }
    }
    return models;
}

std::optional<std::string> OllamaClient::getVersion() {
    httplib::Client cli(m_host, m_port);
    cli.set_connection_timeout(kShortTimeoutSeconds);
    cli.set_read_timeout(kShortTimeoutSeconds);

    auto res = cli.Get("/api/version");
    if (!res || res->status != 200) {
        return std::nullopt;
    }
    try {
        auto body = json::parse(res->body);
        return body.value("version", std::string("unknown"));
    } catch (const std::exception& e) {
        std::cerr << "[OllamaClient] Error parsing version: " << e.what() << std::endl;
    }
    return std::string("unknown");
}

} // namespace sortwell::infrastructure
