/**
 * @file GuardrailVerdict.hpp
 * @brief Output of the guardrail engine for one (patient, trial, AI verdict) triple.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace trialguard::domain::clinical {

/**
 * @enum OverrideStatus
 * @brief Clinically mandated status replacing the AI outcome.
 */
enum class OverrideStatus {
    Match,
    Uncertain,
    Exclude
};

inline std::string OverrideStatusToString(OverrideStatus status) {
    switch (status) {
        case OverrideStatus::Match: return "match";
        case OverrideStatus::Uncertain: return "uncertain";
        case OverrideStatus::Exclude: return "exclude";
    }
    return "uncertain";
}

/** @brief Higher is stricter: exclude > uncertain > match. */
inline int OverrideSeverity(OverrideStatus status) {
    switch (status) {
        case OverrideStatus::Match: return 0;
        case OverrideStatus::Uncertain: return 1;
        case OverrideStatus::Exclude: return 2;
    }
    return 0;
}

/**
 * @struct GuardrailVerdict
 * @brief Created fresh per evaluation and never mutated after return.
 */
struct GuardrailVerdict {
    static constexpr const char* kNoOverrideReasoning = "No guardrail overrides applied";

    bool shouldOverride = false;
    std::optional<int> overrideScore;             ///< 0..100
    std::optional<OverrideStatus> overrideStatus;
    std::vector<std::string> flags;               ///< In rule evaluation order.
    std::string reasoning = kNoOverrideReasoning;
    std::string decidingRule;                     ///< Rule whose override is in effect, empty if none.
};

} // namespace trialguard::domain::clinical
