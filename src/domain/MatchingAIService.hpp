/**
 * @file MatchingAIService.hpp
 * @brief Interface for the language-model collaborators of the matching pipeline.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/clinical/entities/AIVerdict.hpp"
#include "domain/clinical/entities/PatientProfile.hpp"
#include "domain/clinical/entities/TrialRecord.hpp"

namespace trialguard::domain {

/**
 * @class MatchingAIService
 * @brief Abstract provider of extraction, trial generation and assessment.
 *
 * Implementations report failure with std::nullopt; the caller decides on
 * fallbacks. Output is untrusted and goes through the guardrail core.
 */
class MatchingAIService {
public:
    virtual ~MatchingAIService() = default;

    /**
     * @brief Extracts a structured profile from free-text clinical notes.
     * @param freeText Clinician input.
     * @return Profile, possibly with missing fields, or nullopt on failure.
     */
    virtual std::optional<clinical::PatientProfile> extractProfile(const std::string& freeText) = 0;

    /**
     * @brief Produces candidate trials tailored to the patient description.
     */
    virtual std::optional<std::vector<clinical::TrialRecord>> generateTrials(const std::string& patientText) = 0;

    /**
     * @brief Assesses how well the patient fits the trial's criteria.
     */
    virtual std::optional<clinical::AIVerdict> assessTrial(const clinical::PatientProfile& profile,
                                                           const clinical::TrialRecord& trial) = 0;

    /** @brief Name of the backing model, for attribution. */
    virtual std::string getCurrentModel() const = 0;
};

} // namespace trialguard::domain
