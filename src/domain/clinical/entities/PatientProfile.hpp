/**
 * @file PatientProfile.hpp
 * @brief Structured patient data as produced by the extraction collaborator.
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "domain/clinical/value_objects/BiomarkerPanel.hpp"

namespace trialguard::domain::clinical {

/**
 * @enum Gender
 */
enum class Gender {
    Male,
    Female,
    Other,
    Unknown
};

inline std::string GenderToString(Gender gender) {
    switch (gender) {
        case Gender::Male: return "male";
        case Gender::Female: return "female";
        case Gender::Other: return "other";
        case Gender::Unknown: return "unknown";
    }
    return "unknown";
}

inline Gender GenderFromString(const std::string& value) {
    if (value == "male") return Gender::Male;
    if (value == "female") return Gender::Female;
    if (value == "other") return Gender::Other;
    return Gender::Unknown;
}

/**
 * @struct PatientProfile
 * @brief Value object describing one patient. May arrive empty but is always well-typed.
 *
 * After normalization: age is in [0,120], biomarker keys are uppercase
 * alphanumeric and stage (when present) reads "Stage <token>".
 */
struct PatientProfile {
    int age = 0;
    Gender gender = Gender::Unknown;
    std::vector<std::string> conditions;    ///< Free-text diagnoses, in extraction order.
    std::vector<std::string> medications;
    std::vector<std::string> allergies;
    BiomarkerPanel biomarkers; ///< In extraction order.
    std::optional<std::string> stage;
    std::vector<std::string> priorTreatments;
    std::optional<std::string> performanceStatus; ///< e.g. "ECOG 1".
    std::map<std::string, std::string> labValues;

    bool operator==(const PatientProfile& other) const {
        return age == other.age && gender == other.gender && conditions == other.conditions &&
               medications == other.medications && allergies == other.allergies &&
               biomarkers == other.biomarkers && stage == other.stage &&
               priorTreatments == other.priorTreatments &&
               performanceStatus == other.performanceStatus && labValues == other.labValues;
    }
    bool operator!=(const PatientProfile& other) const { return !(*this == other); }
};

} // namespace trialguard::domain::clinical
