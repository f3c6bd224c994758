/**
 * @file ValidationOutcome.hpp
 * @brief Result of a profile or trial-catalog validation pass.
 */

#pragma once

#include <string>
#include <vector>

namespace trialguard::domain::clinical {

/**
 * @struct ValidationOutcome
 * @brief Errors block trusting the record, warnings only degrade confidence.
 */
struct ValidationOutcome {
    bool isValid = true; ///< True iff errors is empty.
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    static ValidationOutcome From(std::vector<std::string> errors, std::vector<std::string> warnings) {
        ValidationOutcome outcome;
        outcome.isValid = errors.empty();
        outcome.errors = std::move(errors);
        outcome.warnings = std::move(warnings);
        return outcome;
    }
};

} // namespace trialguard::domain::clinical
