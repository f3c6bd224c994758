/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading application configuration (settings.json).
 *
 * Provides a unified way to access server, model and guardrail settings
 * without scattering JSON parsing logic throughout the codebase.
 */

#pragma once

#include <string>

#include "domain/clinical/services/GuardrailEngine.hpp"

namespace trialguard::infrastructure {

/**
 * @struct AppConfig
 * @brief Settings with their defaults. Any key missing from settings.json keeps its default.
 */
struct AppConfig {
    std::string ollamaHost = "localhost";
    int ollamaPort = 11434;
    std::string model = "llama3.1";
    int requestTimeoutSeconds = 10;

    std::string bindAddress = "0.0.0.0";
    int port = 8080;

    domain::clinical::GuardrailConfig guardrails;
    bool parallelAssessment = true;
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings from a JSON file.
     * @param path Path to settings.json.
     * @return Loaded configuration; defaults when the file is absent or unreadable.
     */
    static AppConfig Load(const std::string& path);

    /**
     * @brief Applies the keys present in json text on top of base.
     * @return base unchanged (and a logged error) when text is not a JSON object.
     */
    static AppConfig FromJsonText(const std::string& text, AppConfig base = AppConfig{});
};

} // namespace trialguard::infrastructure
