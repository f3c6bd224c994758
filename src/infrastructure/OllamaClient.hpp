/**
 * @file OllamaClient.hpp
 * @brief Low-level HTTP client for the Ollama REST API.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace trialguard::infrastructure {

class OllamaClient {
public:
    OllamaClient(const std::string& host = "localhost", int port = 11434, int readTimeoutSeconds = 10);

    /** @brief Sends a POST request to /api/generate with deterministic sampling. */
    std::optional<std::string> generate(const std::string& model,
                                        const std::string& prompt,
                                        bool forceJson = false);

    /** @brief Fetches available models from /api/tags. */
    std::vector<std::string> getAvailableModels();

private:
    std::string m_host;
    int m_port;
    int m_readTimeoutSeconds;
};

} // namespace trialguard::infrastructure
