/**
 * @file JsonMapping.hpp
 * @brief nlohmann/json mapping for clinical entities and match reports.
 *
 * Readers are tolerant: upstream JSON comes from a language model, so
 * missing keys fall back to defaults and values of the wrong type are
 * ignored rather than rejected. Documents are ordered_json so that object
 * keys keep the order the producer wrote them in.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "application/MatchingService.hpp"
#include "domain/clinical/entities/AIVerdict.hpp"
#include "domain/clinical/entities/GuardrailVerdict.hpp"
#include "domain/clinical/entities/PatientProfile.hpp"
#include "domain/clinical/entities/TrialRecord.hpp"
#include "domain/clinical/value_objects/ValidationOutcome.hpp"

namespace trialguard::infrastructure {

class JsonMapping {
public:
    static domain::clinical::PatientProfile ProfileFromJson(const nlohmann::ordered_json& j);
    static nlohmann::ordered_json ProfileToJson(const domain::clinical::PatientProfile& profile);

    static domain::clinical::TrialRecord TrialFromJson(const nlohmann::ordered_json& j);
    static nlohmann::ordered_json TrialToJson(const domain::clinical::TrialRecord& trial);

    /** @brief Accepts a bare array or an object carrying a "trials" array. */
    static std::vector<domain::clinical::TrialRecord> TrialsFromJson(const nlohmann::ordered_json& j);

    static domain::clinical::AIVerdict VerdictFromJson(const nlohmann::ordered_json& j);
    static nlohmann::ordered_json VerdictToJson(const domain::clinical::AIVerdict& verdict);

    static nlohmann::ordered_json GuardrailToJson(const domain::clinical::GuardrailVerdict& verdict);
    static nlohmann::ordered_json ValidationToJson(const domain::clinical::ValidationOutcome& outcome);
    static nlohmann::ordered_json MatchReportToJson(const application::MatchReport& report);

    /**
     * @brief Parses LLM output, tolerating surrounding markdown code fences.
     * @return nullopt when the text is not valid JSON.
     */
    static std::optional<nlohmann::ordered_json> ParseModelOutput(const std::string& text);

    /** @brief Reads and parses a JSON file; logs and returns nullopt on failure. */
    static std::optional<nlohmann::ordered_json> ReadFile(const std::string& path);
};

} // namespace trialguard::infrastructure
