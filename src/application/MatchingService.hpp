/**
 * @file MatchingService.hpp
 * @brief Application service orchestrating extraction, assessment and guardrails.
 */

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "domain/MatchingAIService.hpp"
#include "domain/clinical/entities/GuardrailVerdict.hpp"
#include "domain/clinical/services/GuardrailEngine.hpp"
#include "domain/clinical/value_objects/ValidationOutcome.hpp"

namespace trialguard::application {

/**
 * @struct TrialMatch
 * @brief One assessed trial after the guardrail verdict has been merged.
 */
struct TrialMatch {
    domain::clinical::TrialRecord trial;
    domain::clinical::AIVerdict assessment;      ///< As returned by the AI, untouched.
    domain::clinical::GuardrailVerdict guardrail;
    int finalScore = 0;                          ///< Override score when overridden, else AI score.
    std::optional<domain::clinical::OverrideStatus> finalStatus; ///< Set only when overridden.
    int rank = 0;                                ///< 1-based, by finalScore descending.
};

/**
 * @struct MatchReport
 * @brief Everything the caller surfaces for one patient description.
 */
struct MatchReport {
    domain::clinical::PatientProfile profile;
    domain::clinical::ValidationOutcome profileValidation;
    domain::clinical::ValidationOutcome trialValidation;
    std::vector<TrialMatch> matches;
};

struct MatchingOptions {
    domain::clinical::GuardrailConfig guardrails;
    bool parallelAssessment = true;
};

/**
 * @class MatchingService
 * @brief Runs the end-to-end pipeline for one patient description.
 */
class MatchingService {
public:
    /**
     * @brief Constructor for MatchingService.
     * @param ai Language-model collaborator.
     * @param options Guardrail policy and concurrency settings.
     */
    MatchingService(std::shared_ptr<domain::MatchingAIService> ai, MatchingOptions options = MatchingOptions{});

    /**
     * @brief Extracts, normalizes, validates, assesses and ranks.
     * @param patientText Free-text patient description (non-empty).
     * @param statusCallback Optional callback for progress lines.
     */
    MatchReport match(const std::string& patientText, std::function<void(std::string)> statusCallback = nullptr);

    /**
     * @brief Merges a guardrail verdict into an AI assessment.
     */
    static TrialMatch merge(domain::clinical::TrialRecord trial,
                            domain::clinical::AIVerdict assessment,
                            domain::clinical::GuardrailVerdict guardrail);

    /** @brief Sorts by final score descending (stable) and assigns ranks from 1. */
    static void rank(std::vector<TrialMatch>& matches);

    const domain::clinical::GuardrailEngine& engine() const { return m_engine; }

private:
    TrialMatch assessOne(const domain::clinical::PatientProfile& profile, const domain::clinical::TrialRecord& trial);

    std::shared_ptr<domain::MatchingAIService> m_ai;
    MatchingOptions m_options;
    domain::clinical::GuardrailEngine m_engine;
};

} // namespace trialguard::application
