/**
 * @file TrialValidator.cpp
 * @brief Implementation of TrialValidator.
 */

#include "domain/clinical/services/TrialValidator.hpp"

#include <algorithm>
#include <cctype>

namespace trialguard::domain::clinical {

namespace {

constexpr size_t kNctDigits = 8;
constexpr size_t kMinTitleLength = 10;
constexpr size_t kMinSummaryLength = 20;
constexpr size_t kMinInclusionCriteria = 3;
constexpr size_t kMinExclusionCriteria = 2;

bool IsOneOf(const std::string& value, const std::vector<std::string>& allowed) {
    return std::find(allowed.begin(), allowed.end(), value) != allowed.end();
}

} // namespace

const std::vector<std::string>& TrialValidator::ValidPhases() {
    static const std::vector<std::string> phases = {"Phase 1", "Phase 2", "Phase 3"};
    return phases;
}

const std::vector<std::string>& TrialValidator::ValidCancerTypes() {
    static const std::vector<std::string> types = {"breast", "lung", "colorectal", "prostate", "other"};
    return types;
}

bool TrialValidator::isValidNctId(const std::string& id) {
    if (id.size() != 3 + kNctDigits || id.compare(0, 3, "NCT") != 0) return false;
    return std::all_of(id.begin() + 3, id.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

ValidationOutcome TrialValidator::validate(const std::vector<TrialRecord>& trials) {
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    for (size_t i = 0; i < trials.size(); ++i) {
        validateRecord(trials[i], i + 1, errors, warnings);
    }

    return ValidationOutcome::From(std::move(errors), std::move(warnings));
}

void TrialValidator::validateRecord(const TrialRecord& trial, size_t ordinal,
                                    std::vector<std::string>& errors, std::vector<std::string>& warnings) {
    const std::string prefix = "Trial " + std::to_string(ordinal) + ": ";

    if (!isValidNctId(trial.nctId)) {
        errors.push_back(prefix + "Invalid NCT ID format \"" + trial.nctId + "\". Must be NCT + 8 digits");
    }
    if (trial.title.size() < kMinTitleLength) {
        errors.push_back(prefix + "Title missing or too short");
    }
    if (!IsOneOf(trial.phase, ValidPhases())) {
        errors.push_back(prefix + "Invalid phase \"" + trial.phase + "\". Must be Phase 1, 2, or 3");
    }
    if (trial.briefSummary.size() < kMinSummaryLength) {
        errors.push_back(prefix + "Brief summary missing or too short");
    }
    if (trial.inclusionCriteria.size() < kMinInclusionCriteria) {
        errors.push_back(prefix + "Must have at least 3 inclusion criteria");
    }
    if (trial.exclusionCriteria.size() < kMinExclusionCriteria) {
        errors.push_back(prefix + "Must have at least 2 exclusion criteria");
    }
    if (!IsOneOf(trial.cancerType, ValidCancerTypes())) {
        warnings.push_back(prefix + "Invalid or missing cancerType \"" + trial.cancerType + "\"");
    }
}

} // namespace trialguard::domain::clinical
