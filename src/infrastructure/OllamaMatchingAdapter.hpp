/**
 * @file OllamaMatchingAdapter.hpp
 * @brief MatchingAIService backed by a local Ollama server.
 */

#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "domain/MatchingAIService.hpp"
#include "infrastructure/OllamaClient.hpp"

namespace trialguard::infrastructure {

/**
 * @class OllamaMatchingAdapter
 * @brief Implements MatchingAIService using the Ollama REST API.
 *
 * Every call opens its own HTTP client, so assessments may run concurrently.
 */
class OllamaMatchingAdapter : public domain::MatchingAIService {
public:
    /** @brief Number of trials a generation call must return. */
    static constexpr size_t kExpectedTrialCount = 3;

    OllamaMatchingAdapter(const std::string& host, int port, const std::string& model, int readTimeoutSeconds);

    /** @brief Warns when the configured model is not served by Ollama. */
    void initialize();

    std::optional<domain::clinical::PatientProfile> extractProfile(const std::string& freeText) override;
    std::optional<std::vector<domain::clinical::TrialRecord>> generateTrials(const std::string& patientText) override;
    std::optional<domain::clinical::AIVerdict> assessTrial(const domain::clinical::PatientProfile& profile,
                                                           const domain::clinical::TrialRecord& trial) override;
    std::string getCurrentModel() const override { return m_model; }

private:
    /** @brief Generates and parses JSON, re-asking once with a stricter suffix on parse failure. */
    std::optional<nlohmann::ordered_json> generateJsonWithRetry(const std::string& prompt);

    OllamaClient m_client;
    std::string m_model;
};

} // namespace trialguard::infrastructure
