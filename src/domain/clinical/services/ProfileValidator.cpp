/**
 * @file ProfileValidator.cpp
 * @brief Implementation of ProfileValidator.
 */

#include "domain/clinical/services/ProfileValidator.hpp"
#include "domain/clinical/services/ClinicalText.hpp"

#include <algorithm>

namespace trialguard::domain::clinical {

namespace {

constexpr int kMinAdultAge = 18;
constexpr int kMaxAge = 120;
constexpr int kMaxEcog = 5;

const std::vector<std::string> kTripleNegative = {"triple negative", "tnbc"};
const std::vector<std::string> kReceptorKeys = {"her2", "er", "pr"};

bool IndicatesPositive(const std::string& value) {
    return text::ContainsAny(text::ToLower(value), {"positive", "+"});
}

} // namespace

const std::vector<std::string>& ProfileValidator::StageVocabulary() {
    static const std::vector<std::string> stages = {
        "I", "IA", "IB", "II", "IIA", "IIB", "III", "IIIA", "IIIB", "IIIC", "IV", "IVA", "IVB"
    };
    return stages;
}

std::string ProfileValidator::stageToken(const std::string& stage) {
    std::string token = text::ToUpper(stage);
    const size_t pos = token.find("STAGE");
    if (pos != std::string::npos) {
        size_t end = pos + 5;
        while (end < token.size() && (token[end] == ' ' || token[end] == '\t')) ++end;
        token.erase(pos, end - pos);
    }
    return text::CollapseWhitespace(token);
}

ValidationOutcome ProfileValidator::validate(const PatientProfile& profile) {
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    checkAge(profile, errors, warnings);
    checkStage(profile, errors);
    checkPerformanceStatus(profile, errors);
    checkTripleNegativeConsistency(profile, errors);
    checkCompleteness(profile, warnings);

    return ValidationOutcome::From(std::move(errors), std::move(warnings));
}

void ProfileValidator::checkAge(const PatientProfile& profile, std::vector<std::string>& errors, std::vector<std::string>& warnings) {
    // 0 is what the extractor returns when no age was found.
    if (profile.age == 0) {
        warnings.push_back("Age not extracted, defaulting to unknown");
    } else if (profile.age < kMinAdultAge) {
        errors.push_back("Age " + std::to_string(profile.age) + " is below minimum (18 years)");
    } else if (profile.age > kMaxAge) {
        errors.push_back("Age " + std::to_string(profile.age) + " is unrealistic (max 120 years)");
    }
}

void ProfileValidator::checkStage(const PatientProfile& profile, std::vector<std::string>& errors) {
    if (!profile.stage || profile.stage->empty()) return;

    const std::string token = stageToken(*profile.stage);
    const auto& vocabulary = StageVocabulary();
    const bool known = std::any_of(vocabulary.begin(), vocabulary.end(), [&](const std::string& valid) {
        return token.rfind(valid, 0) == 0;
    });
    if (!known) {
        errors.push_back("Invalid cancer stage: \"" + *profile.stage + "\". Must be I, II, III, or IV");
    }

    if (token == "0" && text::AnyItemContains(profile.conditions, {"metastatic"})) {
        errors.push_back("Impossible combination: Stage 0 cannot be metastatic");
    }
}

void ProfileValidator::checkPerformanceStatus(const PatientProfile& profile, std::vector<std::string>& errors) {
    if (!profile.performanceStatus) return;

    const auto ecog = text::ParseEcogScore(*profile.performanceStatus);
    if (ecog && (*ecog < 0 || *ecog > kMaxEcog)) {
        errors.push_back("Invalid ECOG score: " + std::to_string(*ecog) + ". Must be 0-5");
    }
}

void ProfileValidator::checkTripleNegativeConsistency(const PatientProfile& profile, std::vector<std::string>& errors) {
    if (!text::AnyItemContains(profile.conditions, kTripleNegative)) return;

    const bool receptorPositive = std::any_of(profile.biomarkers.begin(), profile.biomarkers.end(), [](const auto& entry) {
        const std::string key = text::ToLower(entry.first);
        return std::find(kReceptorKeys.begin(), kReceptorKeys.end(), key) != kReceptorKeys.end() &&
               IndicatesPositive(entry.second);
    });
    if (receptorPositive) {
        errors.push_back("Biomarker contradiction: Triple Negative Breast Cancer cannot be HER2+, ER+, or PR+");
    }
}

void ProfileValidator::checkCompleteness(const PatientProfile& profile, std::vector<std::string>& warnings) {
    if (profile.conditions.empty()) {
        warnings.push_back("No conditions/diagnoses extracted from patient notes");
    }

    const bool hasStage = profile.stage && !profile.stage->empty();
    if (!hasStage && text::AnyItemContains(profile.conditions, {"cancer"})) {
        warnings.push_back("Cancer stage not specified - may limit trial matching accuracy");
    }

    if (profile.biomarkers.empty() && text::AnyItemContains(profile.conditions, {"breast cancer"})) {
        warnings.push_back("No biomarkers (HER2, ER, PR) extracted - critical for breast cancer trial matching");
    }
}

} // namespace trialguard::domain::clinical
