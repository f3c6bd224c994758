/**
 * @file AIVerdict.hpp
 * @brief Upstream (LLM) eligibility assessment for one patient/trial pair.
 */

#pragma once

#include <string>
#include <vector>

namespace trialguard::domain::clinical {

enum class ConfidenceLevel {
    High,
    Medium,
    Low
};

inline std::string ConfidenceToString(ConfidenceLevel level) {
    switch (level) {
        case ConfidenceLevel::High: return "high";
        case ConfidenceLevel::Medium: return "medium";
        case ConfidenceLevel::Low: return "low";
    }
    return "low";
}

inline ConfidenceLevel ConfidenceFromString(const std::string& value) {
    if (value == "high") return ConfidenceLevel::High;
    if (value == "medium") return ConfidenceLevel::Medium;
    return ConfidenceLevel::Low;
}

/**
 * @struct AIVerdict
 * @brief Untrusted advisory input to the guardrail engine. Never modified by the core.
 */
struct AIVerdict {
    int matchScore = 0; ///< 0..100
    ConfidenceLevel confidenceLevel = ConfidenceLevel::Low;
    std::vector<std::string> inclusionMatches;
    std::vector<std::string> exclusionFlags;
    std::vector<std::string> uncertainFactors;
    std::string explanation;
    std::vector<std::string> questionsToAsk;
};

} // namespace trialguard::domain::clinical
