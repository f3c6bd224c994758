/**
 * @file MatchingService.cpp
 * @brief Implementation of MatchingService.
 */

#include "application/MatchingService.hpp"
#include "application/FallbackCatalog.hpp"
#include "domain/clinical/services/ProfileNormalizer.hpp"
#include "domain/clinical/services/ProfileValidator.hpp"
#include "domain/clinical/services/TrialValidator.hpp"

#include <algorithm>
#include <future>
#include <iostream>

namespace trialguard::application {

using namespace domain::clinical;

namespace {

constexpr size_t kLoggedTextLength = 50;

} // namespace

MatchingService::MatchingService(std::shared_ptr<domain::MatchingAIService> ai, MatchingOptions options)
    : m_ai(std::move(ai)), m_options(options), m_engine(options.guardrails) {}

MatchReport MatchingService::match(const std::string& patientText, std::function<void(std::string)> statusCallback) {
    auto report = [&](const std::string& line) {
        std::cout << "[MatchingService] " << line << std::endl;
        if (statusCallback) statusCallback(line);
    };

    report("Matching patient: " + patientText.substr(0, kLoggedTextLength));

    MatchReport result;

    auto extracted = m_ai->extractProfile(patientText);
    if (!extracted) {
        std::cerr << "[MatchingService] Failed to extract patient profile, using empty fallback" << std::endl;
    }
    result.profile = ProfileNormalizer::normalizeAndInfer(
        extracted.value_or(FallbackCatalog::EmptyProfile()), patientText, report);

    result.profileValidation = ProfileValidator::validate(result.profile);
    for (const auto& error : result.profileValidation.errors) {
        std::cerr << "[MatchingService] Profile error: " << error << std::endl;
    }

    auto generated = m_ai->generateTrials(patientText);
    if (!generated) {
        std::cerr << "[MatchingService] Failed to generate trials, using demo catalog" << std::endl;
    }
    const std::vector<TrialRecord> trials = generated ? std::move(*generated) : FallbackCatalog::DemoTrials();

    result.trialValidation = TrialValidator::validate(trials);
    for (const auto& error : result.trialValidation.errors) {
        std::cerr << "[MatchingService] Trial error: " << error << std::endl;
    }

    // Each evaluation depends only on its own trial, so the order of completion is irrelevant;
    // results are collected in catalog order before ranking.
    if (m_options.parallelAssessment && trials.size() > 1) {
        std::vector<std::future<TrialMatch>> pending;
        pending.reserve(trials.size());
        for (const auto& trial : trials) {
            pending.push_back(std::async(std::launch::async, [this, &result, &trial]() {
                return assessOne(result.profile, trial);
            }));
        }
        for (auto& future : pending) {
            result.matches.push_back(future.get());
        }
    } else {
        for (const auto& trial : trials) {
            result.matches.push_back(assessOne(result.profile, trial));
        }
    }

    rank(result.matches);

    const auto overridden = std::count_if(result.matches.begin(), result.matches.end(),
                                          [](const TrialMatch& m) { return m.guardrail.shouldOverride; });
    report("Assessed " + std::to_string(result.matches.size()) + " trials, " +
           std::to_string(overridden) + " overridden by guardrails");
    return result;
}

TrialMatch MatchingService::assessOne(const PatientProfile& profile, const TrialRecord& trial) {
    auto assessment = m_ai->assessTrial(profile, trial);
    if (!assessment) {
        std::cerr << "[MatchingService] Assessment failed for " << trial.nctId << ", using fallback verdict" << std::endl;
        assessment = FallbackCatalog::FailedAssessment();
    }

    GuardrailVerdict guardrail = m_engine.apply(profile, trial, *assessment);
    return merge(trial, std::move(*assessment), std::move(guardrail));
}

TrialMatch MatchingService::merge(TrialRecord trial, AIVerdict assessment, GuardrailVerdict guardrail) {
    TrialMatch match;
    match.finalScore = assessment.matchScore;
    if (guardrail.shouldOverride && guardrail.overrideScore) {
        match.finalScore = *guardrail.overrideScore;
        match.finalStatus = guardrail.overrideStatus;
    }
    match.trial = std::move(trial);
    match.assessment = std::move(assessment);
    match.guardrail = std::move(guardrail);
    return match;
}

void MatchingService::rank(std::vector<TrialMatch>& matches) {
    std::stable_sort(matches.begin(), matches.end(), [](const TrialMatch& a, const TrialMatch& b) {
        return a.finalScore > b.finalScore;
    });
    for (size_t i = 0; i < matches.size(); ++i) {
        matches[i].rank = static_cast<int>(i + 1);
    }
}

} // namespace trialguard::application
