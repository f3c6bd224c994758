/**
 * @file BiomarkerStatus.hpp
 * @brief Value Object for the tri-state status of a named biomarker.
 */

#pragma once

#include <string>

namespace trialguard::domain::clinical {

/**
 * @enum BiomarkerStatus
 * @brief Resolved status of a biomarker such as HER2, ER or PR.
 */
enum class BiomarkerStatus {
    Positive,
    Negative,
    Unknown ///< Marker absent or value not recognized.
};

inline std::string BiomarkerStatusToString(BiomarkerStatus status) {
    switch (status) {
        case BiomarkerStatus::Positive: return "positive";
        case BiomarkerStatus::Negative: return "negative";
        case BiomarkerStatus::Unknown: return "unknown";
    }
    return "unknown";
}

} // namespace trialguard::domain::clinical
