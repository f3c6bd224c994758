/**
 * @file JsonMapping.cpp
 * @brief Implementation of JsonMapping.
 */

#include "infrastructure/JsonMapping.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>

namespace trialguard::infrastructure {

using json = nlohmann::ordered_json;
using namespace domain::clinical;

namespace {

std::string GetString(const json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
    return {};
}

std::optional<std::string> GetOptionalString(const json& j, const char* key) {
    if (j.contains(key) && j[key].is_string() && !j[key].get<std::string>().empty()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

constexpr int kIntMin = std::numeric_limits<int>::min();
constexpr int kIntMax = std::numeric_limits<int>::max();

/**
 * @brief Accepts integers, floats (rounded) and numeric strings.
 *
 * Values outside the int range saturate at its bounds.
 */
int GetInt(const json& j, const char* key, int fallback = 0) {
    if (!j.contains(key)) return fallback;
    const json& v = j[key];
    if (v.is_number_unsigned()) {
        const std::uint64_t u = v.get<std::uint64_t>();
        return u > static_cast<std::uint64_t>(kIntMax) ? kIntMax : static_cast<int>(u);
    }
    if (v.is_number_integer()) {
        const std::int64_t i = v.get<std::int64_t>();
        return static_cast<int>(std::clamp<std::int64_t>(i, kIntMin, kIntMax));
    }
    if (v.is_number_float()) {
        const double d = v.get<double>();
        if (!std::isfinite(d)) return fallback;
        return static_cast<int>(std::lround(std::clamp(d, static_cast<double>(kIntMin), static_cast<double>(kIntMax))));
    }
    if (v.is_string()) {
        try {
            const long long parsed = std::stoll(v.get<std::string>());
            return static_cast<int>(std::clamp<long long>(parsed, kIntMin, kIntMax));
        } catch (const std::exception&) {
            return fallback;
        }
    }
    return fallback;
}

std::vector<std::string> GetStringArray(const json& j, const char* key) {
    std::vector<std::string> out;
    if (!j.contains(key) || !j[key].is_array()) return out;
    for (const auto& item : j[key]) {
        if (item.is_string()) out.push_back(item.get<std::string>());
    }
    return out;
}

/** @brief String values are kept; numbers and booleans are stringified. */
std::map<std::string, std::string> GetStringMap(const json& j, const char* key) {
    std::map<std::string, std::string> out;
    if (!j.contains(key) || !j[key].is_object()) return out;
    for (const auto& [k, v] : j[key].items()) {
        if (v.is_string()) {
            out[k] = v.get<std::string>();
        } else if (v.is_number() || v.is_boolean()) {
            out[k] = v.dump();
        }
    }
    return out;
}

/** @brief Same value rules as GetStringMap, keeping document order. */
BiomarkerPanel GetBiomarkers(const json& j, const char* key) {
    BiomarkerPanel out;
    if (!j.contains(key) || !j[key].is_object()) return out;
    for (const auto& [k, v] : j[key].items()) {
        if (v.is_string()) {
            out.set(k, v.get<std::string>());
        } else if (v.is_number() || v.is_boolean()) {
            out.set(k, v.dump());
        }
    }
    return out;
}

json BiomarkersToJson(const BiomarkerPanel& biomarkers) {
    json out = json::object();
    for (const auto& [name, value] : biomarkers) {
        out[name] = value;
    }
    return out;
}

json OptionalToJson(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

} // namespace

PatientProfile JsonMapping::ProfileFromJson(const json& j) {
    PatientProfile profile;
    if (!j.is_object()) return profile;

    profile.age = GetInt(j, "age");
    profile.gender = GenderFromString(GetString(j, "gender"));
    profile.conditions = GetStringArray(j, "conditions");
    profile.medications = GetStringArray(j, "medications");
    profile.allergies = GetStringArray(j, "allergies");
    profile.biomarkers = GetBiomarkers(j, "biomarkers");
    profile.stage = GetOptionalString(j, "stage");
    profile.priorTreatments = GetStringArray(j, "priorTreatments");
    profile.performanceStatus = GetOptionalString(j, "performanceStatus");
    profile.labValues = GetStringMap(j, "labValues");
    return profile;
}

json JsonMapping::ProfileToJson(const PatientProfile& profile) {
    return {
        {"age", profile.age},
        {"gender", GenderToString(profile.gender)},
        {"conditions", profile.conditions},
        {"medications", profile.medications},
        {"allergies", profile.allergies},
        {"biomarkers", BiomarkersToJson(profile.biomarkers)},
        {"stage", OptionalToJson(profile.stage)},
        {"priorTreatments", profile.priorTreatments},
        {"performanceStatus", OptionalToJson(profile.performanceStatus)},
        {"labValues", profile.labValues}
    };
}

TrialRecord JsonMapping::TrialFromJson(const json& j) {
    TrialRecord trial;
    if (!j.is_object()) return trial;

    trial.nctId = GetString(j, "nctId");
    trial.title = GetString(j, "title");
    trial.phase = GetString(j, "phase");
    trial.briefSummary = GetString(j, "briefSummary");
    trial.inclusionCriteria = GetStringArray(j, "inclusionCriteria");
    trial.exclusionCriteria = GetStringArray(j, "exclusionCriteria");
    trial.cancerType = GetString(j, "cancerType");
    trial.matchType = GetString(j, "matchType");
    trial.matchScore = GetInt(j, "matchScore");
    return trial;
}

json JsonMapping::TrialToJson(const TrialRecord& trial) {
    return {
        {"nctId", trial.nctId},
        {"title", trial.title},
        {"phase", trial.phase},
        {"briefSummary", trial.briefSummary},
        {"inclusionCriteria", trial.inclusionCriteria},
        {"exclusionCriteria", trial.exclusionCriteria},
        {"cancerType", trial.cancerType},
        {"matchType", trial.matchType},
        {"matchScore", trial.matchScore}
    };
}

std::vector<TrialRecord> JsonMapping::TrialsFromJson(const json& j) {
    const json* array = nullptr;
    if (j.is_array()) {
        array = &j;
    } else if (j.is_object() && j.contains("trials") && j["trials"].is_array()) {
        array = &j["trials"];
    }

    std::vector<TrialRecord> trials;
    if (!array) return trials;
    for (const auto& item : *array) {
        trials.push_back(TrialFromJson(item));
    }
    return trials;
}

AIVerdict JsonMapping::VerdictFromJson(const json& j) {
    AIVerdict verdict;
    if (!j.is_object()) return verdict;

    verdict.matchScore = std::clamp(GetInt(j, "matchScore"), 0, 100);
    verdict.confidenceLevel = ConfidenceFromString(GetString(j, "confidenceLevel"));
    verdict.inclusionMatches = GetStringArray(j, "inclusionMatches");
    verdict.exclusionFlags = GetStringArray(j, "exclusionFlags");
    verdict.uncertainFactors = GetStringArray(j, "uncertainFactors");
    verdict.explanation = GetString(j, "explanation");
    verdict.questionsToAsk = GetStringArray(j, "questionsToAsk");
    return verdict;
}

json JsonMapping::VerdictToJson(const AIVerdict& verdict) {
    return {
        {"matchScore", verdict.matchScore},
        {"confidenceLevel", ConfidenceToString(verdict.confidenceLevel)},
        {"inclusionMatches", verdict.inclusionMatches},
        {"exclusionFlags", verdict.exclusionFlags},
        {"uncertainFactors", verdict.uncertainFactors},
        {"explanation", verdict.explanation},
        {"questionsToAsk", verdict.questionsToAsk}
    };
}

json JsonMapping::GuardrailToJson(const GuardrailVerdict& verdict) {
    json j = {
        {"shouldOverride", verdict.shouldOverride},
        {"overrideScore", nullptr},
        {"overrideStatus", nullptr},
        {"flags", verdict.flags},
        {"reasoning", verdict.reasoning},
        {"decidingRule", verdict.decidingRule}
    };
    if (verdict.overrideScore) j["overrideScore"] = *verdict.overrideScore;
    if (verdict.overrideStatus) j["overrideStatus"] = OverrideStatusToString(*verdict.overrideStatus);
    return j;
}

json JsonMapping::ValidationToJson(const ValidationOutcome& outcome) {
    return {
        {"isValid", outcome.isValid},
        {"errors", outcome.errors},
        {"warnings", outcome.warnings}
    };
}

json JsonMapping::MatchReportToJson(const application::MatchReport& report) {
    json matches = json::array();
    for (const auto& match : report.matches) {
        matches.push_back({
            {"rank", match.rank},
            {"trial", TrialToJson(match.trial)},
            {"result", VerdictToJson(match.assessment)},
            {"guardrail", GuardrailToJson(match.guardrail)},
            {"finalScore", match.finalScore},
            {"finalStatus", match.finalStatus ? json(OverrideStatusToString(*match.finalStatus)) : json(nullptr)}
        });
    }

    return {
        {"profile", ProfileToJson(report.profile)},
        {"profileValidation", ValidationToJson(report.profileValidation)},
        {"trialValidation", ValidationToJson(report.trialValidation)},
        {"matches", matches}
    };
}

std::optional<json> JsonMapping::ParseModelOutput(const std::string& text) {
    std::string body = text;

    // Models often wrap JSON in ```json ... ``` despite instructions.
    const size_t fence = body.find("```");
    if (fence != std::string::npos) {
        const size_t start = body.find('\n', fence);
        const size_t end = body.rfind("```");
        if (start != std::string::npos && end != std::string::npos && end > start) {
            body = body.substr(start + 1, end - start - 1);
        }
    }

    try {
        return json::parse(body);
    } catch (const std::exception& e) {
        std::cerr << "[JsonMapping] JSON Parse Error: " << e.what() << std::endl;
    }
    return std::nullopt;
}

std::optional<json> JsonMapping::ReadFile(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        std::cerr << "[JsonMapping] File not found: " << path << std::endl;
        return std::nullopt;
    }

    try {
        std::ifstream f(path);
        json j;
        f >> j;
        return j;
    } catch (const std::exception& e) {
        std::cerr << "[JsonMapping] Error reading " << path << ": " << e.what() << std::endl;
    }
    return std::nullopt;
}

} // namespace trialguard::infrastructure
