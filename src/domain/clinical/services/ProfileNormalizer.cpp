/**
 * @file ProfileNormalizer.cpp
 * @brief Implementation of ProfileNormalizer.
 */

#include "domain/clinical/services/ProfileNormalizer.hpp"
#include "domain/clinical/services/ClinicalText.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

namespace trialguard::domain::clinical {

namespace {

constexpr int kMinAge = 0;
constexpr int kMaxAge = 120;

/**
 * One inference branch: if any needle matches, the marker takes value.
 * Branches are tried in declaration order and the first match wins.
 */
struct InferenceBranch {
    std::vector<std::string> needles;
    const char* value;
    const char* source;
};

struct MarkerInference {
    const char* key;
    std::vector<InferenceBranch> branches;
};

std::vector<std::string> PositiveVariants(const std::string& m) {
    return {m + "+", m + "-positive", m + " positive", m + "pos"};
}

std::vector<std::string> NegativeVariants(const std::string& m) {
    return {m + "-", m + "-negative", m + " negative", m + "neg"};
}

const std::vector<std::string> kTripleNegative = {"triple negative", "tnbc"};
const std::vector<std::string> kHormoneReceptorPositive = {"hr+", "hr-positive", "hormone receptor positive"};

const std::vector<MarkerInference>& InferenceTable() {
    static const std::vector<MarkerInference> table = {
        {"HER2", {
            {PositiveVariants("her2"), "positive", "patient text"},
            {NegativeVariants("her2"), "negative", "patient text"},
            {kTripleNegative, "negative", "TNBC"},
        }},
        {"ER", {
            {PositiveVariants("er"), "positive", "patient text"},
            {NegativeVariants("er"), "negative", "patient text"},
            {kTripleNegative, "negative", "TNBC"},
            {kHormoneReceptorPositive, "positive", "HR+ status"},
        }},
        {"PR", {
            {PositiveVariants("pr"), "positive", "patient text"},
            {NegativeVariants("pr"), "negative", "patient text"},
            {kTripleNegative, "negative", "TNBC"},
            {kHormoneReceptorPositive, "positive", "HR+ status"},
        }},
    };
    return table;
}

bool StartsWithCaseInsensitive(const std::string& value, const std::string& prefix) {
    return text::ToUpper(value).rfind(text::ToUpper(prefix), 0) == 0;
}

} // namespace

PatientProfile ProfileNormalizer::normalizeAndInfer(const PatientProfile& profile,
                                                    const std::optional<std::string>& rawText,
                                                    InferenceCallback onInference) {
    PatientProfile out = profile;

    out.age = std::clamp(out.age, kMinAge, kMaxAge);
    out.stage = normalizeStage(out.stage);
    out.performanceStatus = normalizePerformanceStatus(out.performanceStatus);

    // Re-keying may collide ("her-2" and "HER2"); the value reported last wins.
    BiomarkerPanel rekeyed;
    for (const auto& [key, value] : profile.biomarkers) {
        const std::string normalizedKey = normalizeBiomarkerKey(key);
        if (normalizedKey.empty()) continue;
        rekeyed.set(normalizedKey, value);
    }
    out.biomarkers = std::move(rekeyed);

    std::vector<std::string> corpusParts;
    corpusParts.insert(corpusParts.end(), out.conditions.begin(), out.conditions.end());
    corpusParts.insert(corpusParts.end(), out.medications.begin(), out.medications.end());
    corpusParts.insert(corpusParts.end(), out.priorTreatments.begin(), out.priorTreatments.end());
    corpusParts.push_back(rawText.value_or(""));

    inferBiomarkers(out, text::JoinLower(corpusParts), onInference);
    return out;
}

std::optional<std::string> ProfileNormalizer::normalizeStage(const std::optional<std::string>& stage) {
    if (!stage) return std::nullopt;

    std::string token = text::CollapseWhitespace(*stage);
    if (token.empty()) return std::nullopt;

    const size_t pos = text::ToLower(token).find("stage");
    if (pos != std::string::npos) {
        token = token.substr(0, pos) + token.substr(pos + 5);
        token = text::CollapseWhitespace(token);
    }
    if (token.empty()) return std::nullopt;
    return "Stage " + token;
}

std::optional<std::string> ProfileNormalizer::normalizePerformanceStatus(const std::optional<std::string>& status) {
    if (!status) return std::nullopt;
    if (StartsWithCaseInsensitive(*status, "ECOG")) return status;

    // Karnofsky scores are not ECOG digits; leave them for the clinician.
    const std::string lowered = text::ToLower(*status);
    if (text::ContainsAny(lowered, {"karnofsky", "kps"})) return status;

    auto digit = std::find_if(status->begin(), status->end(),
                              [](unsigned char c) { return std::isdigit(c) != 0; });
    if (digit == status->end()) return status;
    return std::string("ECOG ") + *digit;
}

std::string ProfileNormalizer::normalizeBiomarkerKey(const std::string& key) {
    std::string out;
    out.reserve(key.size());
    for (unsigned char c : key) {
        const char upper = static_cast<char>(std::toupper(c));
        if ((upper >= 'A' && upper <= 'Z') || (upper >= '0' && upper <= '9')) {
            out.push_back(upper);
        }
    }
    return out;
}

void ProfileNormalizer::inferBiomarkers(PatientProfile& profile, const std::string& corpus, const InferenceCallback& onInference) {
    for (const auto& marker : InferenceTable()) {
        if (profile.biomarkers.count(marker.key) > 0) continue;

        for (const auto& branch : marker.branches) {
            if (!text::ContainsAnyWord(corpus, branch.needles)) continue;

            profile.biomarkers.set(marker.key, branch.value);
            if (onInference) {
                onInference(std::string("Inferred ") + marker.key + ": " + branch.value + " from " + branch.source);
            }
            break;
        }
    }
}

} // namespace trialguard::domain::clinical
