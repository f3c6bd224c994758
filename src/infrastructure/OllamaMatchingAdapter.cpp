/**
 * @file OllamaMatchingAdapter.cpp
 * @brief Implementation of OllamaMatchingAdapter.
 */

#include "infrastructure/OllamaMatchingAdapter.hpp"
#include "infrastructure/JsonMapping.hpp"
#include "infrastructure/PromptCatalog.hpp"

#include <algorithm>
#include <iostream>

namespace trialguard::infrastructure {

using json = nlohmann::ordered_json;
using namespace domain::clinical;

OllamaMatchingAdapter::OllamaMatchingAdapter(const std::string& host, int port, const std::string& model, int readTimeoutSeconds)
    : m_client(host, port, readTimeoutSeconds), m_model(model) {}

void OllamaMatchingAdapter::initialize() {
    const auto models = m_client.getAvailableModels();
    if (models.empty()) {
        std::cerr << "[OllamaMatchingAdapter] Failed to list models. Is Ollama running? Keeping: " << m_model << std::endl;
        return;
    }
    const bool served = std::any_of(models.begin(), models.end(), [this](const std::string& name) {
        return name.find(m_model) != std::string::npos;
    });
    if (served) {
        std::cout << "[OllamaMatchingAdapter] Using model: " << m_model << std::endl;
    } else {
        std::cerr << "[OllamaMatchingAdapter] Model " << m_model << " not found on server" << std::endl;
    }
}

std::optional<json> OllamaMatchingAdapter::generateJsonWithRetry(const std::string& prompt) {
    auto response = m_client.generate(m_model, prompt, true);
    if (!response) return std::nullopt;

    if (auto parsed = JsonMapping::ParseModelOutput(*response)) {
        return parsed;
    }

    std::cerr << "[OllamaMatchingAdapter] JSON parse failed on first attempt, retrying" << std::endl;
    auto retry = m_client.generate(m_model, prompt + PromptCatalog::kJsonRetrySuffix, true);
    if (!retry) return std::nullopt;

    auto parsed = JsonMapping::ParseModelOutput(*retry);
    if (!parsed) {
        std::cerr << "[OllamaMatchingAdapter] JSON parse failed on retry" << std::endl;
    }
    return parsed;
}

std::optional<PatientProfile> OllamaMatchingAdapter::extractProfile(const std::string& freeText) {
    auto parsed = generateJsonWithRetry(PromptCatalog::BuildExtractionPrompt(freeText));
    if (!parsed || !parsed->is_object()) return std::nullopt;
    return JsonMapping::ProfileFromJson(*parsed);
}

std::optional<std::vector<TrialRecord>> OllamaMatchingAdapter::generateTrials(const std::string& patientText) {
    auto parsed = generateJsonWithRetry(PromptCatalog::BuildTrialGenerationPrompt(patientText));
    if (!parsed) return std::nullopt;

    auto trials = JsonMapping::TrialsFromJson(*parsed);
    if (trials.size() != kExpectedTrialCount) {
        std::cerr << "[OllamaMatchingAdapter] Expected " << kExpectedTrialCount << " trials, got "
                  << trials.size() << std::endl;
        return std::nullopt;
    }
    return trials;
}

std::optional<AIVerdict> OllamaMatchingAdapter::assessTrial(const PatientProfile& profile, const TrialRecord& trial) {
    auto parsed = generateJsonWithRetry(PromptCatalog::BuildAssessmentPrompt(profile, trial));
    if (!parsed || !parsed->is_object()) return std::nullopt;
    return JsonMapping::VerdictFromJson(*parsed);
}

} // namespace trialguard::infrastructure
