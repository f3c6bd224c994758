/**
 * @file GuardrailEngine.hpp
 * @brief Deterministic clinical rules that can override a probabilistic AI verdict.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/clinical/entities/AIVerdict.hpp"
#include "domain/clinical/entities/GuardrailVerdict.hpp"
#include "domain/clinical/entities/PatientProfile.hpp"
#include "domain/clinical/entities/TrialRecord.hpp"
#include "domain/clinical/value_objects/BiomarkerStatus.hpp"

namespace trialguard::domain::clinical {

/**
 * @enum OverridePolicy
 * @brief How overrides from several triggered rules combine.
 */
enum class OverridePolicy {
    LastTriggeredWins, ///< Each triggered rule overwrites earlier overrides.
    StrictestWins      ///< exclude > uncertain > match, then lower score, then earlier rule.
};

std::string OverridePolicyToString(OverridePolicy policy);

/** @brief Accepts "last-triggered" and "strictest"; anything else yields nullopt. */
std::optional<OverridePolicy> OverridePolicyFromString(const std::string& value);

struct GuardrailConfig {
    OverridePolicy policy = OverridePolicy::LastTriggeredWins;
};

/**
 * @struct OverrideDecision
 * @brief Replacement score/status proposed by one triggered rule.
 */
struct OverrideDecision {
    int score = 0;
    OverrideStatus status = OverrideStatus::Exclude;
    std::string reasoning;
};

/**
 * @struct RuleFinding
 * @brief One flag raised by a rule, optionally carrying an override.
 */
struct RuleFinding {
    std::string flag;
    std::optional<OverrideDecision> decision;
};

/**
 * @struct EvaluationFacts
 * @brief Facts derived once per evaluation and shared by every rule.
 */
struct EvaluationFacts {
    BiomarkerStatus her2Status = BiomarkerStatus::Unknown;

    std::string trialText;      ///< title + summary + inclusion criteria, lower-cased.
    std::string exclusionText;  ///< exclusion criteria, lower-cased.
    std::string treatmentText;  ///< prior treatments, lower-cased.
    std::string explanationText;

    bool trialRequiresHer2Positive = false;
    bool trialRequiresHer2Negative = false;

    bool patientMetastatic = false;
    bool patientEarlyStage = false;
    bool patientTripleNegative = false;
    bool patientBrainMetastases = false;
    std::optional<int> patientEcog;
};

/**
 * @struct GuardrailRule
 * @brief A named entry in the fixed rule sequence.
 */
struct GuardrailRule {
    const char* name;
    std::vector<RuleFinding> (*evaluate)(const EvaluationFacts& facts);
};

/**
 * @class GuardrailEngine
 * @brief Runs the seven guardrail rules in fixed order over one patient/trial/verdict triple.
 *
 * Every rule runs on every call. Flags accumulate in rule order whether or
 * not the rule overrides; override fields are combined according to the
 * configured OverridePolicy. The engine is pure and never throws, so one
 * instance can be shared across threads.
 */
class GuardrailEngine {
public:
    explicit GuardrailEngine(GuardrailConfig config = GuardrailConfig{});

    /** @brief The rule sequence, in evaluation order. */
    static const std::vector<GuardrailRule>& Rules();

    /** @brief Derives the facts every rule inspects. */
    static EvaluationFacts deriveFacts(const PatientProfile& patient, const TrialRecord& trial, const AIVerdict& verdict);

    /**
     * @brief Evaluates all rules and returns a fresh verdict.
     * @param patient Normalized patient profile.
     * @param trial Trial record under consideration.
     * @param verdict Upstream AI assessment of this pair, read only.
     */
    GuardrailVerdict apply(const PatientProfile& patient, const TrialRecord& trial, const AIVerdict& verdict) const;

    const GuardrailConfig& config() const { return m_config; }

private:
    bool supersedes(const std::optional<OverrideDecision>& current, const OverrideDecision& candidate) const;

    GuardrailConfig m_config;
};

} // namespace trialguard::domain::clinical
