/**
 * @file PromptCatalog.hpp
 * @brief Central storage for the matching prompts.
 */

#pragma once

#include <string>

#include "domain/clinical/entities/PatientProfile.hpp"
#include "domain/clinical/entities/TrialRecord.hpp"

namespace trialguard::infrastructure {

class PromptCatalog {
public:
    /** @brief Suffix appended when the first response was not valid JSON. */
    static constexpr const char* kJsonRetrySuffix = "\n\nReturn valid JSON only. No markdown, no explanations.";

    /** @brief Prompt turning free-text notes into a PatientProfile JSON object. */
    static std::string BuildExtractionPrompt(const std::string& freeText);

    /** @brief Prompt scoring one patient against one trial's criteria. */
    static std::string BuildAssessmentPrompt(const domain::clinical::PatientProfile& profile,
                                             const domain::clinical::TrialRecord& trial);

    /** @brief Prompt generating three demo trials for the patient description. */
    static std::string BuildTrialGenerationPrompt(const std::string& patientText);
};

} // namespace trialguard::infrastructure
