/**
 * @file FallbackCatalog.hpp
 * @brief Deterministic stand-ins used when an AI collaborator fails.
 */

#pragma once

#include <vector>

#include "domain/clinical/entities/AIVerdict.hpp"
#include "domain/clinical/entities/PatientProfile.hpp"
#include "domain/clinical/entities/TrialRecord.hpp"

namespace trialguard::application {

class FallbackCatalog {
public:
    /** @brief Empty but well-typed profile (age 0 reads as "not extracted"). */
    static domain::clinical::PatientProfile EmptyProfile();

    /** @brief Low-confidence verdict asking for manual review. */
    static domain::clinical::AIVerdict FailedAssessment();

    /** @brief Fixed demo catalog: one perfect match, one hard exclusion, one uncertain. */
    static std::vector<domain::clinical::TrialRecord> DemoTrials();
};

} // namespace trialguard::application
