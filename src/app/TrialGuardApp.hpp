/**
 * @file TrialGuardApp.hpp
 * @brief Command-line entry point for TrialGuard.
 */

#pragma once

#include <string>
#include <vector>

#include "infrastructure/ConfigLoader.hpp"

namespace trialguard::app {

/**
 * @class TrialGuardApp
 * @brief Parses the command line and dispatches to serve, match, check or validate-trials.
 */
class TrialGuardApp {
public:
    static constexpr int kExitOk = 0;
    static constexpr int kExitUsage = 1;
    static constexpr int kExitInvalid = 2;

    /**
     * @brief Runs one command.
     * @return Exit code (0 success, 1 usage or input error, 2 validation errors reported).
     */
    int Run(int argc, char** argv);

    /** @brief Same as Run, with arguments already split (argv[0] excluded). */
    int Run(const std::vector<std::string>& args);

private:
    int Serve();
    int Match(const std::string& patientText);
    int Check(const std::string& casePath);
    int ValidateTrials(const std::string& trialsPath);

    static void PrintUsage();

    infrastructure::AppConfig m_config;
};

} // namespace trialguard::app
