/**
 * @file TrialValidator.hpp
 * @brief Structural completeness checks over a trial catalog.
 */

#pragma once

#include <string>
#include <vector>

#include "domain/clinical/entities/TrialRecord.hpp"
#include "domain/clinical/value_objects/ValidationOutcome.hpp"

namespace trialguard::domain::clinical {

/**
 * @class TrialValidator
 * @brief Produces one aggregated outcome; each message names its record as "Trial <n>" (1-based).
 */
class TrialValidator {
public:
    static const std::vector<std::string>& ValidPhases();
    static const std::vector<std::string>& ValidCancerTypes();

    static ValidationOutcome validate(const std::vector<TrialRecord>& trials);

    /** @brief True iff id is "NCT" followed by exactly eight digits. */
    static bool isValidNctId(const std::string& id);

private:
    static void validateRecord(const TrialRecord& trial, size_t ordinal,
                               std::vector<std::string>& errors, std::vector<std::string>& warnings);
};

} // namespace trialguard::domain::clinical
