#include <algorithm>
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "domain/clinical/services/ProfileValidator.hpp"

using namespace trialguard::domain::clinical;

namespace {

bool Has(const std::vector<std::string>& messages, const std::string& expected) {
    return std::find(messages.begin(), messages.end(), expected) != messages.end();
}

PatientProfile CompleteProfile() {
    PatientProfile p;
    p.age = 54;
    p.gender = Gender::Female;
    p.conditions = {"Breast cancer"};
    p.stage = "Stage IIA";
    p.biomarkers = {{"HER2", "positive"}};
    p.performanceStatus = "ECOG 1";
    return p;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ProfileValidator Test..." << std::endl;

    {
        const auto outcome = ProfileValidator::validate(CompleteProfile());
        assert(outcome.isValid);
        assert(outcome.errors.empty());
        assert(outcome.warnings.empty());
    }
    std::cout << "[PASS] Complete profile accepted." << std::endl;

    // Age
    {
        auto p = CompleteProfile();
        p.age = 0;
        auto outcome = ProfileValidator::validate(p);
        assert(outcome.isValid);
        assert(Has(outcome.warnings, "Age not extracted, defaulting to unknown"));

        p.age = 16;
        outcome = ProfileValidator::validate(p);
        assert(!outcome.isValid);
        assert(Has(outcome.errors, "Age 16 is below minimum (18 years)"));

        p.age = 130;
        outcome = ProfileValidator::validate(p);
        assert(Has(outcome.errors, "Age 130 is unrealistic (max 120 years)"));
    }
    std::cout << "[PASS] Age checks." << std::endl;

    // Stage
    {
        auto p = CompleteProfile();
        p.stage = "Stage V";
        auto outcome = ProfileValidator::validate(p);
        assert(Has(outcome.errors, "Invalid cancer stage: \"Stage V\". Must be I, II, III, or IV"));

        p.stage = "Stage 0";
        p.conditions = {"Metastatic breast cancer"};
        outcome = ProfileValidator::validate(p);
        assert(Has(outcome.errors, "Impossible combination: Stage 0 cannot be metastatic"));

        assert(ProfileValidator::stageToken("stage  iiib") == "IIIB");
    }
    std::cout << "[PASS] Stage checks." << std::endl;

    // ECOG
    {
        auto p = CompleteProfile();
        p.performanceStatus = "ECOG 7";
        const auto outcome = ProfileValidator::validate(p);
        assert(Has(outcome.errors, "Invalid ECOG score: 7. Must be 0-5"));
    }
    std::cout << "[PASS] ECOG range." << std::endl;

    // TNBC contradiction
    {
        auto p = CompleteProfile();
        p.conditions = {"Triple negative breast cancer"};
        p.biomarkers = {{"HER2", "positive"}};
        const auto outcome = ProfileValidator::validate(p);
        assert(!outcome.isValid);
        assert(Has(outcome.errors,
                   "Biomarker contradiction: Triple Negative Breast Cancer cannot be HER2+, ER+, or PR+"));

        // Only HER2/ER/PR values count.
        p.biomarkers = {{"HER2", "negative"}, {"PDL1", "positive"}};
        assert(ProfileValidator::validate(p).isValid);
    }
    std::cout << "[PASS] TNBC contradiction." << std::endl;

    // Completeness warnings never block
    {
        PatientProfile p;
        p.age = 60;
        p.conditions = {"Breast cancer"};
        const auto outcome = ProfileValidator::validate(p);
        assert(outcome.isValid);
        assert(Has(outcome.warnings, "Cancer stage not specified - may limit trial matching accuracy"));
        assert(Has(outcome.warnings, "No biomarkers (HER2, ER, PR) extracted - critical for breast cancer trial matching"));

        const auto empty = ProfileValidator::validate(PatientProfile{});
        assert(empty.isValid);
        assert(Has(empty.warnings, "No conditions/diagnoses extracted from patient notes"));
    }
    std::cout << "[PASS] Completeness warnings." << std::endl;

    std::cout << "[Test] ProfileValidator Test Completed Successfully." << std::endl;
    return 0;
}
