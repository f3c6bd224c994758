/**
 * @file ProfileValidator.hpp
 * @brief Plausibility and consistency checks for a structured patient profile.
 */

#pragma once

#include <string>
#include <vector>

#include "domain/clinical/entities/PatientProfile.hpp"
#include "domain/clinical/value_objects/ValidationOutcome.hpp"

namespace trialguard::domain::clinical {

/**
 * @class ProfileValidator
 * @brief Advisory gate: errors mean the profile cannot be trusted, warnings never block.
 */
class ProfileValidator {
public:
    /** @brief Closed stage vocabulary, matched as prefixes of the normalized token. */
    static const std::vector<std::string>& StageVocabulary();

    /** @brief Validates profile without modifying it. */
    static ValidationOutcome validate(const PatientProfile& profile);

    /** @brief Upper-cased stage with the "STAGE" word and surrounding spaces removed. */
    static std::string stageToken(const std::string& stage);

private:
    static void checkAge(const PatientProfile& profile, std::vector<std::string>& errors, std::vector<std::string>& warnings);
    static void checkStage(const PatientProfile& profile, std::vector<std::string>& errors);
    static void checkPerformanceStatus(const PatientProfile& profile, std::vector<std::string>& errors);
    static void checkTripleNegativeConsistency(const PatientProfile& profile, std::vector<std::string>& errors);
    static void checkCompleteness(const PatientProfile& profile, std::vector<std::string>& warnings);
};

} // namespace trialguard::domain::clinical
