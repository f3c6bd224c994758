/**
 * @file TrialRecord.hpp
 * @brief Clinical trial record supplied by the trial-catalog collaborator.
 */

#pragma once

#include <string>
#include <vector>

namespace trialguard::domain::clinical {

/**
 * @struct TrialRecord
 * @brief Textual fields are present but not necessarily well-formed.
 *
 * phase and cancerType are kept as text so that malformed upstream values
 * can be reported by TrialValidator instead of being lost on parse.
 */
struct TrialRecord {
    std::string nctId;       ///< "NCT" + 8 digits.
    std::string title;
    std::string phase;       ///< "Phase 1" | "Phase 2" | "Phase 3".
    std::string briefSummary;
    std::vector<std::string> inclusionCriteria;
    std::vector<std::string> exclusionCriteria;
    std::string cancerType;  ///< breast | lung | colorectal | prostate | other.

    // Provenance from the generator, not guardrail output.
    std::string matchType;   ///< perfect | excluded | uncertain.
    int matchScore = 0;
};

} // namespace trialguard::domain::clinical
