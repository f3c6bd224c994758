#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "domain/clinical/services/GuardrailEngine.hpp"

using namespace trialguard::domain::clinical;

namespace {

TrialRecord MakeTrial(const std::string& title,
                      std::vector<std::string> inclusion,
                      std::vector<std::string> exclusion = {"Pregnancy", "Uncontrolled infection"}) {
    TrialRecord t;
    t.nctId = "NCT01234567";
    t.title = title;
    t.phase = "Phase 2";
    t.briefSummary = "Open-label study in breast cancer.";
    t.inclusionCriteria = std::move(inclusion);
    t.exclusionCriteria = std::move(exclusion);
    t.cancerType = "breast";
    return t;
}

AIVerdict MakeVerdict(int score, const std::string& explanation = "") {
    AIVerdict v;
    v.matchScore = score;
    v.confidenceLevel = ConfidenceLevel::High;
    v.explanation = explanation;
    return v;
}

} // namespace

int main() {
    std::cout << "[Test] Starting GuardrailEngine Test..." << std::endl;
    const GuardrailEngine engine;

    // 1. HER2 requirement
    {
        PatientProfile p;
        p.biomarkers = {{"HER2", "negative"}};
        const auto trial = MakeTrial("Targeted therapy study", {"HER2-positive breast cancer"});
        const auto verdict = MakeVerdict(88);

        const auto result = engine.apply(p, trial, verdict);
        assert(result.shouldOverride);
        assert(result.overrideStatus == OverrideStatus::Exclude);
        assert(result.overrideScore == 15);
        assert(result.flags.size() == 1);
        assert(result.flags[0] == "HER2 status mismatch: Trial requires HER2+, patient is HER2-");
        assert(result.decidingRule == "her2-requirement");
        assert(verdict.matchScore == 88);
    }
    {
        PatientProfile unknown;
        const auto result = engine.apply(unknown, MakeTrial("Targeted therapy study", {"HER2-positive disease"}), MakeVerdict(70));
        assert(result.overrideStatus == OverrideStatus::Uncertain);
        assert(result.overrideScore == 45);
    }
    {
        PatientProfile p;
        p.biomarkers = {{"HER2", "3+"}};
        const auto result = engine.apply(p, MakeTrial("Endocrine therapy study", {"HER2-negative disease"}), MakeVerdict(70));
        assert(result.overrideStatus == OverrideStatus::Exclude);
        assert(result.flags[0] == "HER2 status mismatch: Trial requires HER2-, patient is HER2+");

        // HER2-low trials do not require HER2-negative status.
        const auto low = engine.apply(p, MakeTrial("HER2-low study", {"HER2-low or HER2-negative disease"}), MakeVerdict(70));
        assert(!low.shouldOverride);
    }
    {
        // The qualifier may run straight into the rest of the word.
        PatientProfile negative;
        negative.biomarkers = {{"HER2", "negative"}};
        auto result = engine.apply(negative,
            MakeTrial("Targeted therapy study", {"HER2 positiveness confirmed by central lab"}), MakeVerdict(85));
        assert(result.shouldOverride);
        assert(result.overrideStatus == OverrideStatus::Exclude);
        assert(result.overrideScore == 15);
        assert(result.decidingRule == "her2-requirement");

        PatientProfile positive;
        positive.biomarkers = {{"HER2", "positive"}};
        result = engine.apply(positive,
            MakeTrial("Endocrine therapy study", {"HER2  negatives only"}), MakeVerdict(85));
        assert(result.overrideScore == 15);
        assert(result.flags[0] == "HER2 status mismatch: Trial requires HER2-, patient is HER2+");

        result = engine.apply(positive, MakeTrial("Targeted therapy study", {"Measurable disease"}),
                              MakeVerdict(85, "Documented HER2 negativeness on biopsy."));
        assert(!result.shouldOverride);
        assert(result.flags.size() == 1);
    }
    std::cout << "[PASS] HER2 requirement." << std::endl;

    // 2. Stage mismatch
    {
        PatientProfile early;
        early.stage = "Stage II";
        early.conditions = {"Breast cancer"};
        auto result = engine.apply(early, MakeTrial("Study in metastatic disease", {"Measurable lesion"}), MakeVerdict(80));
        assert(result.overrideScore == 20);
        assert(result.flags[0] == "Stage mismatch: Trial for metastatic disease, patient has early-stage cancer");

        PatientProfile metastatic;
        metastatic.conditions = {"Metastatic breast cancer"};
        result = engine.apply(metastatic, MakeTrial("Adjuvant therapy study", {"Resected tumor"}), MakeVerdict(80));
        assert(result.overrideScore == 20);
        assert(result.decidingRule == "stage-mismatch");

        // Stage IV starts with "I" but is never early-stage.
        PatientProfile stageFour;
        stageFour.stage = "Stage IV";
        result = engine.apply(stageFour, MakeTrial("Study in metastatic disease", {"Measurable lesion"}), MakeVerdict(80));
        assert(!result.shouldOverride);
    }
    std::cout << "[PASS] Stage mismatch." << std::endl;

    // 3. Prior treatment
    {
        PatientProfile naive;
        const auto result = engine.apply(naive,
            MakeTrial("Second-line study", {"Prior trastuzumab required", "Prior taxane required"}), MakeVerdict(75));
        assert(result.flags.size() == 2);
        assert(result.overrideScore == 25);
        assert(result.decidingRule == "prior-treatment");

        PatientProfile treated;
        treated.priorTreatments = {"Kadcyla (T-DM1)"};
        const auto tdm1 = engine.apply(treated,
            MakeTrial("Second-line study", {"Measurable disease"}, {"Prior T-DM1 therapy", "Pregnancy"}), MakeVerdict(75));
        assert(tdm1.overrideScore == 15);
        assert(tdm1.flags[0] == "Prior treatment exclusion: Trial excludes prior T-DM1, patient has received it");
    }
    std::cout << "[PASS] Prior treatment." << std::endl;

    // 4. ECOG requirement
    {
        PatientProfile p;
        p.performanceStatus = "ECOG 2";
        const auto trial = MakeTrial("Phase 2 study", {"ECOG performance status 0-1"});
        auto result = engine.apply(p, trial, MakeVerdict(90));
        assert(result.overrideStatus == OverrideStatus::Exclude);
        assert(result.overrideScore == 30);
        assert(result.flags[0] == "ECOG performance status: Trial requires ECOG 0-1, patient is ECOG 2");

        p.performanceStatus = "ECOG 1";
        result = engine.apply(p, trial, MakeVerdict(90));
        assert(!result.shouldOverride);
    }
    std::cout << "[PASS] ECOG requirement." << std::endl;

    // 6. Brain metastases
    {
        PatientProfile p;
        p.priorTreatments = {"Whole brain radiotherapy"};
        const auto result = engine.apply(p,
            MakeTrial("Study in breast cancer", {"Measurable disease"}, {"Active brain metastases", "Pregnancy"}), MakeVerdict(85));
        assert(result.overrideScore == 20);
        assert(result.decidingRule == "brain-metastases");
    }
    std::cout << "[PASS] Brain metastases." << std::endl;

    // 7. AI consistency raises flags only
    {
        PatientProfile p;
        p.stage = "Stage IV";
        p.biomarkers = {{"HER2", "positive"}};
        const auto result = engine.apply(p, MakeTrial("Study in breast cancer", {"Measurable disease"}),
                                         MakeVerdict(85, "Patient appears HER2-negative with early-stage disease."));
        assert(!result.shouldOverride);
        assert(!result.overrideScore);
        assert(!result.overrideStatus);
        assert(result.flags.size() == 2);
        assert(result.reasoning == GuardrailVerdict::kNoOverrideReasoning);
    }
    std::cout << "[PASS] AI consistency flags." << std::endl;

    // No trigger
    {
        PatientProfile p;
        p.stage = "Stage IV";
        p.conditions = {"Metastatic breast cancer"};
        p.biomarkers = {{"HER2", "positive"}};
        p.priorTreatments = {"Trastuzumab", "Paclitaxel"};
        p.performanceStatus = "ECOG 1";
        const auto trial = MakeTrial("Trastuzumab deruxtecan in HER2-positive metastatic breast cancer",
                                     {"Prior trastuzumab", "Prior taxane", "ECOG 0-1"},
                                     {"Brain metastases", "Prior T-DM1"});
        const auto result = engine.apply(p, trial, MakeVerdict(92, "Patient is HER2-positive with metastatic disease."));
        assert(!result.shouldOverride);
        assert(result.flags.empty());
        assert(result.reasoning == "No guardrail overrides applied");
        assert(result.decidingRule.empty());
    }
    std::cout << "[PASS] Eligible patient untouched." << std::endl;

    // Later rule overrides earlier one; flags keep rule order.
    {
        PatientProfile p;
        p.stage = "Stage II";
        p.conditions = {"Breast cancer"};
        p.biomarkers = {{"HER2", "positive"}};
        const auto trial = MakeTrial("Pembrolizumab in metastatic TNBC",
                                     {"Metastatic triple negative breast cancer", "HER2+ tumors in expansion cohort"});
        const auto result = engine.apply(p, trial, MakeVerdict(80));
        assert(result.flags.size() == 2);
        assert(result.flags[0] == "Stage mismatch: Trial for metastatic disease, patient has early-stage cancer");
        assert(result.flags[1] == "Subtype mismatch: Trial for TNBC, patient is HER2+");
        assert(result.overrideScore == 15);
        assert(result.decidingRule == "tnbc-subtype");
        assert(result.reasoning == "Hard exclusion: Trial is for triple-negative breast cancer, but patient is HER2-positive.");
    }
    std::cout << "[PASS] Rule order." << std::endl;

    // Policy toggle
    {
        PatientProfile p;
        p.biomarkers = {{"HER2", "negative"}};
        p.performanceStatus = "ECOG 3";
        const auto trial = MakeTrial("HER2 targeted study", {"HER2-positive breast cancer", "ECOG 0-1"});

        const auto last = engine.apply(p, trial, MakeVerdict(60));
        assert(last.overrideScore == 30);
        assert(last.decidingRule == "ecog-requirement");

        const GuardrailEngine strictest(GuardrailConfig{OverridePolicy::StrictestWins});
        const auto strict = strictest.apply(p, trial, MakeVerdict(60));
        assert(strict.overrideScore == 15);
        assert(strict.decidingRule == "her2-requirement");
        assert(strict.flags == last.flags);

        assert(OverridePolicyFromString("Strictest") == OverridePolicy::StrictestWins);
        assert(OverridePolicyFromString("last-triggered") == OverridePolicy::LastTriggeredWins);
        assert(!OverridePolicyFromString("min-score"));
    }
    std::cout << "[PASS] Override policy." << std::endl;

    // Deterministic
    {
        PatientProfile p;
        p.biomarkers = {{"HER2", "negative"}};
        const auto trial = MakeTrial("Targeted therapy study", {"HER2-positive breast cancer"});
        const auto a = engine.apply(p, trial, MakeVerdict(50));
        const auto b = engine.apply(p, trial, MakeVerdict(50));
        assert(a.flags == b.flags && a.overrideScore == b.overrideScore && a.reasoning == b.reasoning);
        assert(GuardrailEngine::Rules().size() == 7);
    }
    std::cout << "[PASS] Deterministic evaluation." << std::endl;

    std::cout << "[Test] GuardrailEngine Test Completed Successfully." << std::endl;
    return 0;
}
