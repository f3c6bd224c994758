/**
 * @file ProfileNormalizer.hpp
 * @brief Canonicalizes extracted patient profiles and infers missing biomarkers.
 */

#pragma once

#include <functional>
#include <optional>
#include <string>

#include "domain/clinical/entities/PatientProfile.hpp"

namespace trialguard::domain::clinical {

/**
 * @class ProfileNormalizer
 * @brief Fixes common extraction errors. Never throws and is idempotent.
 */
class ProfileNormalizer {
public:
    /** @brief Receives one human-readable line per inferred biomarker. */
    using InferenceCallback = std::function<void(const std::string&)>;

    /**
     * @brief Returns a corrected copy of profile.
     *
     * Clamps age to [0,120], rewrites stage as "Stage <token>", rewrites a bare
     * performance digit as "ECOG <digit>", re-keys biomarkers to uppercase
     * alphanumerics, then infers HER2/ER/PR from the combined text of
     * conditions, medications, prior treatments and rawText when absent.
     *
     * @param profile Profile as extracted upstream.
     * @param rawText Optional original free text, added to the inference corpus.
     * @param onInference Optional sink for inference notes.
     */
    static PatientProfile normalizeAndInfer(const PatientProfile& profile,
                                            const std::optional<std::string>& rawText = std::nullopt,
                                            InferenceCallback onInference = nullptr);

    static std::optional<std::string> normalizeStage(const std::optional<std::string>& stage);
    static std::optional<std::string> normalizePerformanceStatus(const std::optional<std::string>& status);

    /** @brief Uppercases and strips everything but A-Z and 0-9. */
    static std::string normalizeBiomarkerKey(const std::string& key);

private:
    static void inferBiomarkers(PatientProfile& profile, const std::string& corpus, const InferenceCallback& onInference);
};

} // namespace trialguard::domain::clinical
