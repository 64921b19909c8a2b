#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

#include <httplib.h>

#include "infrastructure/OllamaClassifier.hpp"

using namespace sortwell;
using infrastructure::OllamaClassifier;

namespace {

// Local stand-in for an Ollama server: the first `failures` chat requests get a 500,
// later ones get `answer` as the message content.
class ScriptedServer {
public:
    ScriptedServer() {
        m_server.Post("/api/chat", [this](const httplib::Request&, httplib::Response& res) {
            int index = requests++;
            if (index < failures.load()) {
                res.status = 500;
                res.set_content("model crashed", "text/plain");
                return;
            }
            std::string body = R"({"message": {"role": "assistant", "content": )" + Quote(answer) + "}}";
            res.set_content(body, "application/json");
        });
        port = m_server.bind_to_any_port("127.0.0.1");
        m_thread = std::thread([this] { m_server.listen_after_bind(); });
        while (!m_server.is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

    ~ScriptedServer() {
        m_server.stop();
        m_thread.join();
    }

    void reset(int failing, const std::string& content) {
        requests = 0;
        failures = failing;
        answer = content;
    }

    int port = 0;
    std::atomic<int> requests{0};
    std::atomic<int> failures{0};
    std::string answer;

private:
    static std::string Quote(const std::string& text) {
        std::string quoted = "\"";
        for (char c : text) {
            if (c == '"' || c == '\\') quoted += '\\';
            quoted += c;
        }
        return quoted + "\"";
    }

    httplib::Server m_server;
    std::thread m_thread;
};

domain::ClassificationRequest Request() {
    domain::ClassificationRequest request;
    request.filename = "cells.pdf";
    request.extension = ".pdf";
    request.size = 2048;
    return request;
}

} // namespace

int main() {
    std::cout << "[Test] Starting OllamaClassifier Test..." << std::endl;

    ScriptedServer server;
    assert(server.port > 0);

    infrastructure::RetryPolicy policy;
    policy.timeoutSeconds = 5;
    policy.retries = 2;
    policy.initialBackoffMs = 1;
    OllamaClassifier classifier("127.0.0.1", server.port, "test-model", policy);

    // Server errors are retried, up to the budget
    {
        server.reset(100, "");
        auto response = classifier.classify(Request());
        assert(!response);
        assert(server.requests == 3 && "One attempt plus two retries.");
        std::cout << "[PASS] Bounded retries" << std::endl;
    }

    // An answer that is not JSON ends the loop at once
    {
        server.reset(1, "Sure! The category is Biology.");
        auto response = classifier.classify(Request());
        assert(!response);
        assert(server.requests == 2 && "The failed request is retried, the garbage answer is not.");
        std::cout << "[PASS] No retry on unparseable output" << std::endl;
    }

    // Recovery after a transient error
    {
        server.reset(1, R"({"category": "Biology", "subject": "Cells", "confidence": 1.4})");
        auto response = classifier.classify(Request());
        assert(response && response->category == "Biology");
        assert(response->confidence == 1.0 && "Answers are sanitized.");
        assert(server.requests == 2);
        std::cout << "[PASS] Retry then success" << std::endl;
    }

    std::cout << "[PASS] OllamaClassifier Test completed." << std::endl;
    return 0;
}
