/**
 * @file OllamaClient.hpp
 * @brief Low-level HTTP client for the Ollama REST API.
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace sortwell::infrastructure {

class OllamaClient {
public:
    OllamaClient(const std::string& host = "localhost", int port = 11434, int timeoutSeconds = 60);

    /** @brief Sends a POST request to /api/chat and returns the message content. */
    std::optional<std::string> chat(const std::string& model,
                                    const nlohmann::json& messages,
                                    bool forceJson = false);

    /** @brief Fetches available models from /api/tags. */
    std::vector<std::string> getAvailableModels();

    /** @brief Fetches the server version from /api/version. */
    std::optional<std::string> getVersion();

    const std::string& host() const { return m_host; }
    int port() const { return m_port; }

private:
    std::string m_host;
    int m_port;
    int m_timeoutSeconds;
};

} // namespace sortwell::infrastructure
