/**
 * @file BiomarkerResolver.cpp
 * @brief Implementation of BiomarkerResolver.
 */

#include "domain/clinical/services/BiomarkerResolver.hpp"
#include "domain/clinical/services/ClinicalText.hpp"

namespace trialguard::domain::clinical {

BiomarkerStatus BiomarkerResolver::resolve(const BiomarkerPanel& biomarkers, const std::string& marker) {
    const std::string wanted = text::ToLower(marker);
    for (const auto& [key, value] : biomarkers) {
        if (text::Contains(text::ToLower(key), wanted)) {
            return classifyValue(value);
        }
    }
    return BiomarkerStatus::Unknown;
}

BiomarkerStatus BiomarkerResolver::classifyValue(const std::string& value) {
    const std::string lowered = text::ToLower(value);

    if (text::ContainsAny(lowered, {"positive", "+"}) || lowered == "3+" || lowered == "2+") {
        return BiomarkerStatus::Positive;
    }
    if (text::ContainsAny(lowered, {"negative", "-"}) || lowered == "0" || lowered == "1+") {
        return BiomarkerStatus::Negative;
    }
    return BiomarkerStatus::Unknown;
}

} // namespace trialguard::domain::clinical
