/**
 * @file FallbackCatalog.cpp
 * @brief Implementation of FallbackCatalog.
 */

#include "application/FallbackCatalog.hpp"

namespace trialguard::application {

using namespace domain::clinical;

PatientProfile FallbackCatalog::EmptyProfile() {
    return PatientProfile{};
}

AIVerdict FallbackCatalog::FailedAssessment() {
    AIVerdict verdict;
    verdict.matchScore = 0;
    verdict.confidenceLevel = ConfidenceLevel::Low;
    verdict.exclusionFlags = {"Unable to assess criteria due to processing error"};
    verdict.uncertainFactors = {"All criteria require manual review"};
    verdict.explanation = "Assessment failed. Please review trial criteria manually.";
    verdict.questionsToAsk = {"Verify all eligibility criteria with trial coordinator"};
    return verdict;
}

std::vector<TrialRecord> FallbackCatalog::DemoTrials() {
    TrialRecord deruxtecan;
    deruxtecan.nctId = "NCT05123456";
    deruxtecan.title = "Study of Trastuzumab Deruxtecan in HER2+ Breast Cancer After Prior Therapy";
    deruxtecan.phase = "Phase 3";
    deruxtecan.briefSummary = "Evaluates trastuzumab deruxtecan in patients with HER2-positive breast cancer who "
                              "progressed on prior anti-HER2 therapy. Primary endpoint is progression-free survival.";
    deruxtecan.inclusionCriteria = {
        "Age 18 years or older",
        "HER2-positive breast cancer (IHC 3+ or FISH+)",
        "Stage III or IV disease",
        "Prior trastuzumab allowed and progression documented",
        "ECOG performance status 0-2",
    };
    deruxtecan.exclusionCriteria = {
        "Active brain metastases requiring immediate treatment",
        "LVEF <50%",
        "Uncontrolled intercurrent illness",
    };
    deruxtecan.cancerType = "breast";
    deruxtecan.matchType = "perfect";
    deruxtecan.matchScore = 92;

    TrialRecord tucatinib;
    tucatinib.nctId = "NCT05234567";
    tucatinib.title = "First-Line Tucatinib Plus Trastuzumab in Treatment-Naive HER2+ Breast Cancer";
    tucatinib.phase = "Phase 2";
    tucatinib.briefSummary = "Investigates tucatinib combination therapy in treatment-naive HER2-positive breast "
                             "cancer patients. Requires no prior systemic anti-HER2 therapy.";
    tucatinib.inclusionCriteria = {
        "Age 18-75 years",
        "HER2-positive breast cancer",
        "Stage II-IV disease",
        "No prior systemic therapy for breast cancer",
        "ECOG performance status 0-1",
    };
    tucatinib.exclusionCriteria = {
        "Prior anti-HER2 therapy (trastuzumab, pertuzumab, etc.)",
        "Prior chemotherapy for breast cancer",
        "Cardiac dysfunction",
    };
    tucatinib.cancerType = "breast";
    tucatinib.matchType = "excluded";
    tucatinib.matchScore = 20;

    TrialRecord neratinib;
    neratinib.nctId = "NCT05345678";
    neratinib.title = "Neratinib Maintenance Therapy in High-Risk HER2+ Breast Cancer";
    neratinib.phase = "Phase 3";
    neratinib.briefSummary = "Studies neratinib as maintenance therapy after standard treatment in high-risk "
                             "HER2-positive breast cancer. Requires excellent performance status.";
    neratinib.inclusionCriteria = {
        "Age 18-70 years",
        "HER2-positive breast cancer",
        "Stage III disease",
        "Completed prior trastuzumab-based therapy",
        "ECOG performance status 0 (fully active)",
    };
    neratinib.exclusionCriteria = {
        "Metastatic disease",
        "Severe diarrhea or GI disorders",
        "Inadequate organ function",
    };
    neratinib.cancerType = "breast";
    neratinib.matchType = "uncertain";
    neratinib.matchScore = 62;

    return {deruxtecan, tucatinib, neratinib};
}

} // namespace trialguard::application
