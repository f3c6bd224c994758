#include <cassert>
#include <iostream>
#include <stdexcept>

#include "app/MatchServer.hpp"

using namespace trialguard::domain::clinical;
using trialguard::app::MatchServer;
using json = nlohmann::ordered_json;

// AI that never answers
class OfflineAIService : public trialguard::domain::MatchingAIService {
public:
    std::optional<PatientProfile> extractProfile(const std::string&) override { return std::nullopt; }
    std::optional<std::vector<TrialRecord>> generateTrials(const std::string&) override { return std::nullopt; }
    std::optional<AIVerdict> assessTrial(const PatientProfile&, const TrialRecord&) override { return std::nullopt; }
    std::string getCurrentModel() const override { return "offline"; }
};

// AI whose transport fails hard
class CrashingAIService : public OfflineAIService {
public:
    std::optional<PatientProfile> extractProfile(const std::string&) override {
        throw std::runtime_error("model crashed");
    }
};

int main() {
    std::cout << "[Test] Starting MatchServer Test..." << std::endl;

    MatchServer server(std::make_shared<trialguard::application::MatchingService>(std::make_shared<OfflineAIService>()));

    // /api/match
    {
        auto reply = server.handleMatch("{not json");
        assert(reply.status == 400);
        assert(reply.body["success"] == false);

        reply = server.handleMatch(R"({"patientText": ""})");
        assert(reply.status == 400);
        assert(reply.body["error"] == "patientText is required");

        reply = server.handleMatch(R"({"patientText": "58F with HER2-positive breast cancer"})");
        assert(reply.status == 200);
        assert(reply.body["success"] == true);
        assert(reply.body["matches"].size() == 3);
        assert(reply.body["matches"][0]["rank"] == 1);
        assert(reply.body["profile"]["biomarkers"]["HER2"] == "positive");
        assert(reply.body.contains("profileValidation"));
        assert(reply.body.contains("trialValidation"));
    }
    std::cout << "[PASS] Match endpoint." << std::endl;

    {
        MatchServer failing(std::make_shared<trialguard::application::MatchingService>(std::make_shared<CrashingAIService>()));
        const auto reply = failing.handleMatch(R"({"patientText": "anything"})");
        assert(reply.status == 500);
        assert(reply.body["error"] == "model crashed");
    }
    std::cout << "[PASS] Pipeline failure reported as 500." << std::endl;

    // /api/guardrails
    {
        const json request = {
            {"profile", {{"age", 61}, {"conditions", {"Breast cancer"}}, {"biomarkers", {{"her-2", "negative"}}}}},
            {"trial", {{"nctId", "NCT01234567"}, {"title", "Targeted study"},
                       {"inclusionCriteria", {"HER2-positive breast cancer"}}}},
            {"verdict", {{"matchScore", 88}, {"confidenceLevel", "high"}, {"explanation", "Strong match."}}}
        };
        auto reply = server.handleGuardrails(request.dump());
        assert(reply.status == 200);
        assert(reply.body["guardrail"]["shouldOverride"] == true);
        assert(reply.body["guardrail"]["overrideScore"] == 15);
        assert(reply.body["guardrail"]["overrideStatus"] == "exclude");
        assert(reply.body["profile"]["biomarkers"].contains("HER2"));

        reply = server.handleGuardrails(R"({"profile": {}})");
        assert(reply.status == 400);
    }
    std::cout << "[PASS] Guardrail endpoint." << std::endl;

    // /api/trials/validate
    {
        auto reply = server.handleValidateTrials(R"([{"nctId": "NCT123"}])");
        assert(reply.status == 200);
        assert(reply.body["isValid"] == false);
        assert(reply.body["errors"][0] == "Trial 1: Invalid NCT ID format \"NCT123\". Must be NCT + 8 digits");

        reply = server.handleValidateTrials(R"({"name": "not a catalog"})");
        assert(reply.status == 400);
    }
    std::cout << "[PASS] Trial validation endpoint." << std::endl;

    {
        const auto reply = server.handleHealth();
        assert(reply.status == 200);
        assert(reply.body["guardrailPolicy"] == "last-triggered");
    }
    std::cout << "[PASS] Health endpoint." << std::endl;

    std::cout << "[Test] MatchServer Test Completed Successfully." << std::endl;
    return 0;
}
