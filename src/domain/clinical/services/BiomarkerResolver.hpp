/**
 * @file BiomarkerResolver.hpp
 * @brief Derives a tri-state status for a named biomarker from free-form values.
 */

#pragma once

#include <string>

#include "domain/clinical/value_objects/BiomarkerPanel.hpp"
#include "domain/clinical/value_objects/BiomarkerStatus.hpp"

namespace trialguard::domain::clinical {

/**
 * @class BiomarkerResolver
 * @brief Pure, total lookup: every input yields exactly one BiomarkerStatus.
 */
class BiomarkerResolver {
public:
    /**
     * @brief Resolves the status of marker within biomarkers.
     *
     * The first key (in reporting order) whose lower-cased form contains the
     * lower-cased marker name is used. Positive phrasing is tested before
     * negative phrasing, so a value carrying both resolves to Positive.
     *
     * @param biomarkers Marker name -> free-text value.
     * @param marker Marker to look up, e.g. "HER2".
     */
    static BiomarkerStatus resolve(const BiomarkerPanel& biomarkers, const std::string& marker);

    /** @brief Classifies a single free-text biomarker value. */
    static BiomarkerStatus classifyValue(const std::string& value);
};

} // namespace trialguard::domain::clinical
