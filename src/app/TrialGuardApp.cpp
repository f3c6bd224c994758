/**
 * @file TrialGuardApp.cpp
 * @brief Implementation of the TrialGuard command line.
 */

#include "app/TrialGuardApp.hpp"
#include "app/MatchServer.hpp"
#include "application/MatchingService.hpp"
#include "domain/clinical/services/ProfileNormalizer.hpp"
#include "domain/clinical/services/ProfileValidator.hpp"
#include "domain/clinical/services/TrialValidator.hpp"
#include "infrastructure/JsonMapping.hpp"
#include "infrastructure/OllamaMatchingAdapter.hpp"

#include <iostream>
#include <memory>

#include <nlohmann/json.hpp>

namespace trialguard::app {

using json = nlohmann::ordered_json;
using infrastructure::JsonMapping;
using namespace domain::clinical;

namespace {

std::shared_ptr<application::MatchingService> BuildMatchingService(const infrastructure::AppConfig& config) {
    auto adapter = std::make_shared<infrastructure::OllamaMatchingAdapter>(
        config.ollamaHost, config.ollamaPort, config.model, config.requestTimeoutSeconds);
    adapter->initialize();

    application::MatchingOptions options;
    options.guardrails = config.guardrails;
    options.parallelAssessment = config.parallelAssessment;
    return std::make_shared<application::MatchingService>(adapter, options);
}

} // namespace

int TrialGuardApp::Run(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return Run(args);
}

int TrialGuardApp::Run(const std::vector<std::string>& args) {
    std::vector<std::string> positional;
    std::string configPath = "settings.json";

    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--config") {
            if (i + 1 >= args.size()) {
                std::cerr << "[TrialGuard] --config requires a path" << std::endl;
                return kExitUsage;
            }
            configPath = args[++i];
        } else if (args[i] == "--help" || args[i] == "-h") {
            PrintUsage();
            return kExitOk;
        } else {
            positional.push_back(args[i]);
        }
    }

    if (positional.empty()) {
        PrintUsage();
        return kExitUsage;
    }

    m_config = infrastructure::ConfigLoader::Load(configPath);

    const std::string& command = positional[0];
    if (command == "serve" && positional.size() == 1) {
        return Serve();
    }
    if (command == "match" && positional.size() == 2) {
        return Match(positional[1]);
    }
    if (command == "check" && positional.size() == 2) {
        return Check(positional[1]);
    }
    if (command == "validate-trials" && positional.size() == 2) {
        return ValidateTrials(positional[1]);
    }

    std::cerr << "[TrialGuard] Unknown command or wrong arguments: " << command << std::endl;
    PrintUsage();
    return kExitUsage;
}

int TrialGuardApp::Serve() {
    MatchServerConfig serverConfig;
    serverConfig.bindAddress = m_config.bindAddress;
    serverConfig.port = m_config.port;

    MatchServer server(BuildMatchingService(m_config), serverConfig);
    return server.listen() ? kExitOk : kExitUsage;
}

int TrialGuardApp::Match(const std::string& patientText) {
    if (patientText.empty()) {
        std::cerr << "[TrialGuard] patient text is required" << std::endl;
        return kExitUsage;
    }

    auto service = BuildMatchingService(m_config);
    const auto report = service->match(patientText, [](const std::string& status) {
        std::cerr << "[TrialGuard] " << status << std::endl;
    });

    std::cout << JsonMapping::MatchReportToJson(report).dump(2) << std::endl;
    return kExitOk;
}

int TrialGuardApp::Check(const std::string& casePath) {
    const auto doc = JsonMapping::ReadFile(casePath);
    if (!doc || !doc->is_object() || !doc->contains("profile") || !doc->contains("trial") ||
        !doc->contains("verdict")) {
        std::cerr << "[TrialGuard] Case file must contain profile, trial and verdict: " << casePath << std::endl;
        return kExitUsage;
    }

    std::optional<std::string> rawText;
    if (doc->contains("rawText") && (*doc)["rawText"].is_string()) {
        rawText = (*doc)["rawText"].get<std::string>();
    }

    const PatientProfile profile = ProfileNormalizer::normalizeAndInfer(
        JsonMapping::ProfileFromJson((*doc)["profile"]), rawText,
        [](const std::string& message) { std::cerr << "[ProfileNormalizer] " << message << std::endl; });
    const TrialRecord trial = JsonMapping::TrialFromJson((*doc)["trial"]);
    const AIVerdict verdict = JsonMapping::VerdictFromJson((*doc)["verdict"]);

    const GuardrailEngine engine(m_config.guardrails);
    const GuardrailVerdict guardrail = engine.apply(profile, trial, verdict);
    const ValidationOutcome validation = ProfileValidator::validate(profile);

    json out = {
        {"profile", JsonMapping::ProfileToJson(profile)},
        {"profileValidation", JsonMapping::ValidationToJson(validation)},
        {"guardrail", JsonMapping::GuardrailToJson(guardrail)}
    };
    std::cout << out.dump(2) << std::endl;
    return validation.isValid ? kExitOk : kExitInvalid;
}

int TrialGuardApp::ValidateTrials(const std::string& trialsPath) {
    const auto doc = JsonMapping::ReadFile(trialsPath);
    if (!doc || !(doc->is_array() || (doc->is_object() && doc->contains("trials")))) {
        std::cerr << "[TrialGuard] Expected an array of trials in " << trialsPath << std::endl;
        return kExitUsage;
    }

    const ValidationOutcome outcome = TrialValidator::validate(JsonMapping::TrialsFromJson(*doc));
    std::cout << JsonMapping::ValidationToJson(outcome).dump(2) << std::endl;
    return outcome.isValid ? kExitOk : kExitInvalid;
}

void TrialGuardApp::PrintUsage() {
    std::cerr << "Usage: trialguard <command> [--config settings.json]\n"
              << "  serve                      Start the HTTP API\n"
              << "  match \"<patient text>\"     Run the full matching pipeline\n"
              << "  check <case.json>          Apply guardrails to {profile, trial, verdict, rawText?}\n"
              << "  validate-trials <file>     Validate an array of trial records\n";
}

} // namespace trialguard::app
