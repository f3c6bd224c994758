/**
 * @file GuardrailEngine.cpp
 * @brief Rule catalog and fold for the guardrail engine.
 */

#include "domain/clinical/services/GuardrailEngine.hpp"
#include "domain/clinical/services/BiomarkerResolver.hpp"
#include "domain/clinical/services/ClinicalText.hpp"
#include "domain/clinical/services/ProfileValidator.hpp"

namespace trialguard::domain::clinical {

namespace {

constexpr int kHardExclusionScore = 15;
constexpr int kUnknownBiomarkerScore = 45;
constexpr int kStageMismatchScore = 20;
constexpr int kMissingPriorTherapyScore = 25;
constexpr int kEcogMismatchScore = 30;
constexpr int kBrainMetastasesScore = 20;

RuleFinding Exclude(const std::string& flag, int score, const std::string& reasoning) {
    return {flag, OverrideDecision{score, OverrideStatus::Exclude, reasoning}};
}

RuleFinding Uncertain(const std::string& flag, int score, const std::string& reasoning) {
    return {flag, OverrideDecision{score, OverrideStatus::Uncertain, reasoning}};
}

bool MentionsHer2(const std::string& text, const char* qualifier) {
    return text::Contains(text, std::string("her2-") + qualifier) ||
           text::ContainsQualifiedMarker(text, "her2", qualifier);
}

// ---------------------------------------------------------------------------
// 1. HER2 requirement
// ---------------------------------------------------------------------------
std::vector<RuleFinding> Her2RequirementRule(const EvaluationFacts& f) {
    std::vector<RuleFinding> findings;

    if (f.trialRequiresHer2Positive) {
        if (f.her2Status == BiomarkerStatus::Negative) {
            findings.push_back(Exclude(
                "HER2 status mismatch: Trial requires HER2+, patient is HER2-", kHardExclusionScore,
                "Hard exclusion: Patient is HER2-negative but trial requires HER2-positive status. "
                "This is a fundamental eligibility criterion."));
        } else if (f.her2Status == BiomarkerStatus::Unknown) {
            findings.push_back(Uncertain(
                "HER2 status unknown: Trial requires HER2+, patient status not documented", kUnknownBiomarkerScore,
                "Uncertain match: HER2 status not documented. Additional testing required to determine "
                "eligibility for this HER2-positive trial."));
        }
    }

    if (f.trialRequiresHer2Negative) {
        if (f.her2Status == BiomarkerStatus::Positive) {
            findings.push_back(Exclude(
                "HER2 status mismatch: Trial requires HER2-, patient is HER2+", kHardExclusionScore,
                "Hard exclusion: Patient is HER2-positive but trial requires HER2-negative status."));
        } else if (f.her2Status == BiomarkerStatus::Unknown) {
            findings.push_back(Uncertain(
                "HER2 status unknown: Trial requires HER2-, patient status not documented", kUnknownBiomarkerScore,
                "Uncertain match: HER2 status not documented. Additional testing required to determine "
                "eligibility for this HER2-negative trial."));
        }
    }

    return findings;
}

// ---------------------------------------------------------------------------
// 2. Metastatic vs early-stage
// ---------------------------------------------------------------------------
std::vector<RuleFinding> StageMismatchRule(const EvaluationFacts& f) {
    std::vector<RuleFinding> findings;

    if (text::ContainsAny(f.trialText, {"metastatic", "stage iv", "advanced"}) && f.patientEarlyStage) {
        findings.push_back(Exclude(
            "Stage mismatch: Trial for metastatic disease, patient has early-stage cancer", kStageMismatchScore,
            "Hard exclusion: Trial is for metastatic/advanced breast cancer, but patient has early-stage disease."));
    }

    if (text::ContainsAny(f.trialText, {"early", "adjuvant", "neoadjuvant"}) && f.patientMetastatic) {
        findings.push_back(Exclude(
            "Stage mismatch: Trial for early-stage disease, patient has metastatic cancer", kStageMismatchScore,
            "Hard exclusion: Trial is for early-stage breast cancer, but patient has metastatic disease."));
    }

    return findings;
}

// ---------------------------------------------------------------------------
// 3. Prior treatment requirements
// ---------------------------------------------------------------------------
std::vector<RuleFinding> PriorTreatmentRule(const EvaluationFacts& f) {
    std::vector<RuleFinding> findings;

    const bool hadTrastuzumab = text::ContainsAny(f.treatmentText, {"trastuzumab", "herceptin"});
    const bool hadTaxane = text::ContainsAny(f.treatmentText, {"taxane", "paclitaxel", "docetaxel"});
    const bool hadTdm1 = text::ContainsAny(f.treatmentText, {"t-dm1", "kadcyla", "trastuzumab emtansine"});

    if (text::ContainsAny(f.trialText, {"prior trastuzumab", "previous trastuzumab"}) && !hadTrastuzumab) {
        findings.push_back(Exclude(
            "Prior treatment requirement: Trial requires prior trastuzumab, patient has not received it",
            kMissingPriorTherapyScore,
            "Hard exclusion: Trial requires prior trastuzumab therapy, but patient treatment history does not include it."));
    }

    if (text::ContainsAny(f.trialText, {"prior taxane", "previous taxane"}) && !hadTaxane) {
        findings.push_back(Exclude(
            "Prior treatment requirement: Trial requires prior taxane, patient has not received it",
            kMissingPriorTherapyScore,
            "Hard exclusion: Trial requires prior taxane-based therapy, but patient treatment history does not include it."));
    }

    if (text::ContainsAny(f.exclusionText, {"t-dm1", "trastuzumab emtansine"}) && hadTdm1) {
        findings.push_back(Exclude(
            "Prior treatment exclusion: Trial excludes prior T-DM1, patient has received it", kHardExclusionScore,
            "Hard exclusion: Trial excludes patients with prior T-DM1 therapy, but patient has received it."));
    }

    return findings;
}

// ---------------------------------------------------------------------------
// 4. ECOG performance status
// ---------------------------------------------------------------------------
std::vector<RuleFinding> EcogRequirementRule(const EvaluationFacts& f) {
    if (!f.patientEcog) return {};
    if (!text::ContainsAny(f.trialText, {"ecog 0-1", "ecog performance status 0-1"})) return {};
    if (*f.patientEcog <= 1) return {};

    const std::string ecog = std::to_string(*f.patientEcog);
    return {Exclude(
        "ECOG performance status: Trial requires ECOG 0-1, patient is ECOG " + ecog, kEcogMismatchScore,
        "Hard exclusion: Trial requires ECOG performance status 0-1, but patient has ECOG " + ecog + ".")};
}

// ---------------------------------------------------------------------------
// 5. TNBC subtype consistency
// ---------------------------------------------------------------------------
std::vector<RuleFinding> TripleNegativeSubtypeRule(const EvaluationFacts& f) {
    const bool trialForTnbc = text::ContainsAny(f.trialText, {"triple negative", "tnbc"});
    if (!trialForTnbc || f.patientTripleNegative || f.her2Status != BiomarkerStatus::Positive) return {};

    return {Exclude(
        "Subtype mismatch: Trial for TNBC, patient is HER2+", kHardExclusionScore,
        "Hard exclusion: Trial is for triple-negative breast cancer, but patient is HER2-positive.")};
}

// ---------------------------------------------------------------------------
// 6. Brain metastases
// ---------------------------------------------------------------------------
std::vector<RuleFinding> BrainMetastasesRule(const EvaluationFacts& f) {
    if (!text::ContainsAny(f.exclusionText, {"brain metastases", "cns metastases"})) return {};
    if (!f.patientBrainMetastases) return {};

    return {Exclude(
        "Brain metastases: Trial excludes brain/CNS metastases, patient has them", kBrainMetastasesScore,
        "Hard exclusion: Trial excludes patients with brain metastases, but patient has documented CNS involvement.")};
}

// ---------------------------------------------------------------------------
// 7. AI consistency (flags only)
// ---------------------------------------------------------------------------
std::vector<RuleFinding> AiConsistencyRule(const EvaluationFacts& f) {
    std::vector<RuleFinding> findings;

    if (f.her2Status == BiomarkerStatus::Positive && MentionsHer2(f.explanationText, "negative")) {
        findings.push_back({"AI consistency error: Assessment mentions HER2-negative but patient is HER2-positive", std::nullopt});
    }
    if (f.her2Status == BiomarkerStatus::Negative && MentionsHer2(f.explanationText, "positive")) {
        findings.push_back({"AI consistency error: Assessment mentions HER2-positive but patient is HER2-negative", std::nullopt});
    }
    if (f.patientMetastatic && text::Contains(f.explanationText, "early-stage")) {
        findings.push_back({"AI consistency error: Assessment mentions early-stage but patient has metastatic disease", std::nullopt});
    }

    return findings;
}

} // namespace

std::string OverridePolicyToString(OverridePolicy policy) {
    switch (policy) {
        case OverridePolicy::LastTriggeredWins: return "last-triggered";
        case OverridePolicy::StrictestWins: return "strictest";
    }
    return "last-triggered";
}

std::optional<OverridePolicy> OverridePolicyFromString(const std::string& value) {
    const std::string lowered = text::ToLower(value);
    if (lowered == "last-triggered") return OverridePolicy::LastTriggeredWins;
    if (lowered == "strictest") return OverridePolicy::StrictestWins;
    return std::nullopt;
}

GuardrailEngine::GuardrailEngine(GuardrailConfig config)
    : m_config(config) {}

const std::vector<GuardrailRule>& GuardrailEngine::Rules() {
    // Order matters: under LastTriggeredWins a later rule overwrites an earlier override.
    static const std::vector<GuardrailRule> rules = {
        {"her2-requirement", &Her2RequirementRule},
        {"stage-mismatch", &StageMismatchRule},
        {"prior-treatment", &PriorTreatmentRule},
        {"ecog-requirement", &EcogRequirementRule},
        {"tnbc-subtype", &TripleNegativeSubtypeRule},
        {"brain-metastases", &BrainMetastasesRule},
        {"ai-consistency", &AiConsistencyRule},
    };
    return rules;
}

EvaluationFacts GuardrailEngine::deriveFacts(const PatientProfile& patient, const TrialRecord& trial, const AIVerdict& verdict) {
    EvaluationFacts f;

    f.her2Status = BiomarkerResolver::resolve(patient.biomarkers, "HER2");

    std::vector<std::string> trialParts = {trial.title, trial.briefSummary};
    trialParts.insert(trialParts.end(), trial.inclusionCriteria.begin(), trial.inclusionCriteria.end());
    f.trialText = text::JoinLower(trialParts);
    f.exclusionText = text::JoinLower(trial.exclusionCriteria);
    f.treatmentText = text::JoinLower(patient.priorTreatments);
    f.explanationText = text::ToLower(verdict.explanation);

    f.trialRequiresHer2Positive = text::Contains(f.trialText, "her2+") || MentionsHer2(f.trialText, "positive");
    f.trialRequiresHer2Negative =
        (MentionsHer2(f.trialText, "negative") || text::ContainsAny(f.trialText, {"triple negative", "tnbc"})) &&
        !f.trialRequiresHer2Positive &&
        !text::Contains(f.trialText, "her2-low");

    const std::string stage = patient.stage ? text::ToLower(*patient.stage) : std::string();
    f.patientMetastatic = text::ContainsAny(stage, {"iv", "metastatic"}) ||
                          text::AnyItemContains(patient.conditions, {"metastatic"});
    const std::string stageToken = patient.stage ? ProfileValidator::stageToken(*patient.stage) : std::string();
    f.patientEarlyStage = !stageToken.empty() && stageToken.front() == 'I' && !f.patientMetastatic;

    f.patientTripleNegative = text::AnyItemContains(patient.conditions, {"triple negative", "tnbc"});
    f.patientBrainMetastases = text::AnyItemContains(patient.conditions, {"brain met"}) ||
                               text::ContainsAny(f.treatmentText, {"brain", "cranial"});
    if (patient.performanceStatus) {
        f.patientEcog = text::ParseEcogScore(*patient.performanceStatus);
    }

    return f;
}

bool GuardrailEngine::supersedes(const std::optional<OverrideDecision>& current, const OverrideDecision& candidate) const {
    if (!current || m_config.policy == OverridePolicy::LastTriggeredWins) return true;

    const int currentSeverity = OverrideSeverity(current->status);
    const int candidateSeverity = OverrideSeverity(candidate.status);
    if (candidateSeverity != currentSeverity) return candidateSeverity > currentSeverity;
    return candidate.score < current->score;
}

GuardrailVerdict GuardrailEngine::apply(const PatientProfile& patient, const TrialRecord& trial, const AIVerdict& verdict) const {
    const EvaluationFacts facts = deriveFacts(patient, trial, verdict);

    GuardrailVerdict result;
    std::optional<OverrideDecision> active;

    for (const auto& rule : Rules()) {
        for (auto& finding : rule.evaluate(facts)) {
            result.flags.push_back(std::move(finding.flag));
            if (finding.decision && supersedes(active, *finding.decision)) {
                active = std::move(finding.decision);
                result.decidingRule = rule.name;
            }
        }
    }

    if (active) {
        result.shouldOverride = true;
        result.overrideScore = active->score;
        result.overrideStatus = active->status;
        result.reasoning = active->reasoning;
    }
    return result;
}

} // namespace trialguard::domain::clinical
