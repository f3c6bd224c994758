#include <cassert>
#include <iostream>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "application/FallbackCatalog.hpp"
#include "application/MatchingService.hpp"

using namespace trialguard::domain::clinical;
using trialguard::application::FallbackCatalog;
using trialguard::application::MatchingOptions;
using trialguard::application::MatchingService;

// AI that never answers
class OfflineAIService : public trialguard::domain::MatchingAIService {
public:
    std::optional<PatientProfile> extractProfile(const std::string&) override { return std::nullopt; }
    std::optional<std::vector<TrialRecord>> generateTrials(const std::string&) override { return std::nullopt; }
    std::optional<AIVerdict> assessTrial(const PatientProfile&, const TrialRecord&) override { return std::nullopt; }
    std::string getCurrentModel() const override { return "offline"; }
};

// AI that returns a fixed profile and scores each demo trial optimistically
class ScriptedAIService : public trialguard::domain::MatchingAIService {
public:
    std::optional<PatientProfile> extractProfile(const std::string&) override {
        PatientProfile p;
        p.age = 52;
        p.gender = Gender::Female;
        p.conditions = {"Metastatic breast cancer"};
        p.stage = "IV";
        p.biomarkers = {{"her-2", "positive"}};
        p.priorTreatments = {"Trastuzumab", "Pertuzumab", "Docetaxel"};
        p.performanceStatus = "1";
        return p;
    }

    std::optional<std::vector<TrialRecord>> generateTrials(const std::string&) override {
        TrialRecord adjuvant;
        adjuvant.nctId = "NCT05400001";
        adjuvant.title = "Adjuvant Pembrolizumab After Surgery in Breast Cancer";
        adjuvant.phase = "Phase 3";
        adjuvant.briefSummary = "Evaluates pembrolizumab following curative-intent surgery.";
        adjuvant.inclusionCriteria = {"Early-stage breast cancer", "Completed surgery", "ECOG 0-1"};
        adjuvant.exclusionCriteria = {"Metastatic disease", "Pregnancy"};
        adjuvant.cancerType = "breast";

        TrialRecord tnbc;
        tnbc.nctId = "NCT05400002";
        tnbc.title = "Sacituzumab Govitecan in Triple Negative Breast Cancer";
        tnbc.phase = "Phase 2";
        tnbc.briefSummary = "Evaluates sacituzumab govitecan in previously treated TNBC patients.";
        tnbc.inclusionCriteria = {"Triple negative breast cancer", "At least one prior chemotherapy", "Measurable disease"};
        tnbc.exclusionCriteria = {"Active hepatitis", "Pregnancy"};
        tnbc.cancerType = "breast";

        return std::vector<TrialRecord>{adjuvant, FallbackCatalog::DemoTrials().front(), tnbc};
    }

    std::optional<AIVerdict> assessTrial(const PatientProfile&, const TrialRecord& trial) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_assessed;
        AIVerdict v;
        v.matchScore = m_scores.at(trial.nctId);
        v.confidenceLevel = ConfidenceLevel::Medium;
        v.explanation = "Looks eligible.";
        return v;
    }

    std::string getCurrentModel() const override { return "scripted"; }

    int assessed() const { return m_assessed; }

private:
    std::map<std::string, int> m_scores = {{"NCT05400001", 95}, {"NCT05123456", 90}, {"NCT05400002", 80}};
    std::mutex m_mutex;
    int m_assessed = 0;
};

int main() {
    std::cout << "[Test] Starting MatchingService Test..." << std::endl;

    // Fallbacks when the AI is unavailable
    {
        MatchingService service(std::make_shared<OfflineAIService>());
        const auto report = service.match("62 year old woman, HER2-negative breast cancer");

        assert(report.profile.age == 0);
        assert(report.profile.biomarkers.at("HER2") == "negative");
        assert(report.profileValidation.isValid);
        assert(report.trialValidation.isValid);
        assert(report.matches.size() == 3);
        for (const auto& match : report.matches) {
            assert(match.assessment.matchScore == 0);
            assert(match.assessment.confidenceLevel == ConfidenceLevel::Low);
        }
    }
    std::cout << "[PASS] Fallbacks used when AI is offline." << std::endl;

    // Override merge and ranking
    for (bool parallel : {true, false}) {
        auto ai = std::make_shared<ScriptedAIService>();
        MatchingOptions options;
        options.parallelAssessment = parallel;
        MatchingService service(ai, options);

        std::vector<std::string> status;
        const auto report = service.match("52F metastatic HER2+ breast cancer",
                                          [&status](std::string line) { status.push_back(std::move(line)); });

        assert(ai->assessed() == 3);
        assert(!status.empty());
        assert(report.profile.biomarkers.count("HER2") == 1);
        assert(report.profile.stage == std::optional<std::string>("Stage IV"));
        assert(report.matches.size() == 3);

        // Deruxtecan keeps its AI score; the adjuvant trial is excluded for a metastatic
        // patient and the TNBC trial for a HER2-positive one.
        const auto& top = report.matches[0];
        assert(top.rank == 1);
        assert(top.trial.nctId == "NCT05123456");
        assert(top.finalScore == 90);
        assert(!top.guardrail.shouldOverride);

        assert(report.matches[1].trial.nctId == "NCT05400001");
        assert(report.matches[1].rank == 2);
        assert(report.matches[1].finalScore == 20);
        assert(report.matches[1].assessment.matchScore == 95);
        assert(report.matches[1].guardrail.decidingRule == "stage-mismatch");

        assert(report.matches[2].trial.nctId == "NCT05400002");
        assert(report.matches[2].rank == 3);
        assert(report.matches[2].finalScore == 15);
        assert(report.matches[2].finalStatus == OverrideStatus::Exclude);
        assert(report.matches[2].guardrail.decidingRule == "tnbc-subtype");
        assert(report.matches[2].guardrail.flags.size() == 2);

        for (const auto& match : report.matches) {
            if (match.guardrail.shouldOverride) {
                assert(match.finalScore == *match.guardrail.overrideScore);
                assert(match.finalStatus == match.guardrail.overrideStatus);
            } else {
                assert(match.finalScore == match.assessment.matchScore);
                assert(!match.finalStatus);
            }
        }
    }
    std::cout << "[PASS] Guardrail merge and ranking." << std::endl;

    // Merge keeps the AI assessment untouched
    {
        AIVerdict v;
        v.matchScore = 88;
        GuardrailVerdict g;
        g.shouldOverride = true;
        g.overrideScore = 15;
        g.overrideStatus = OverrideStatus::Exclude;

        const auto merged = MatchingService::merge(TrialRecord{}, v, g);
        assert(merged.finalScore == 15);
        assert(merged.finalStatus == OverrideStatus::Exclude);
        assert(merged.assessment.matchScore == 88);
    }
    std::cout << "[PASS] Merge preserves assessment." << std::endl;

    // Stable ranking on ties
    {
        std::vector<trialguard::application::TrialMatch> matches(3);
        matches[0].trial.nctId = "A";
        matches[0].finalScore = 50;
        matches[1].trial.nctId = "B";
        matches[1].finalScore = 80;
        matches[2].trial.nctId = "C";
        matches[2].finalScore = 50;
        MatchingService::rank(matches);
        assert(matches[0].trial.nctId == "B" && matches[0].rank == 1);
        assert(matches[1].trial.nctId == "A" && matches[1].rank == 2);
        assert(matches[2].trial.nctId == "C" && matches[2].rank == 3);
    }
    std::cout << "[PASS] Stable ranking." << std::endl;

    std::cout << "[Test] MatchingService Test Completed Successfully." << std::endl;
    return 0;
}
