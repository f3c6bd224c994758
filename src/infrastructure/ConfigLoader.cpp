/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace trialguard::infrastructure {

namespace {

template <typename T>
void ReadKey(const nlohmann::json& j, const char* key, T& target) {
    if (!j.contains(key)) return;
    try {
        target = j[key].get<T>();
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Ignoring invalid value for '" << key << "': " << e.what() << std::endl;
    }
}

} // namespace

AppConfig ConfigLoader::Load(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        std::cout << "[ConfigLoader] " << path << " not found, using defaults" << std::endl;
        return AppConfig{};
    }

    std::ifstream f(path);
    if (!f) {
        std::cerr << "[ConfigLoader] Error opening " << path << ", using defaults" << std::endl;
        return AppConfig{};
    }
    std::stringstream buffer;
    buffer << f.rdbuf();
    return FromJsonText(buffer.str());
}

AppConfig ConfigLoader::FromJsonText(const std::string& text, AppConfig base) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading settings.json: " << e.what() << std::endl;
        return base;
    }
    if (!j.is_object()) {
        std::cerr << "[ConfigLoader] settings.json must contain an object" << std::endl;
        return base;
    }

    AppConfig config = base;
    ReadKey(j, "ollama_host", config.ollamaHost);
    ReadKey(j, "ollama_port", config.ollamaPort);
    ReadKey(j, "model", config.model);
    ReadKey(j, "request_timeout_s", config.requestTimeoutSeconds);
    ReadKey(j, "bind_address", config.bindAddress);
    ReadKey(j, "port", config.port);
    ReadKey(j, "parallel_assessment", config.parallelAssessment);

    std::string policy;
    ReadKey(j, "guardrail_policy", policy);
    if (!policy.empty()) {
        if (auto parsed = domain::clinical::OverridePolicyFromString(policy)) {
            config.guardrails.policy = *parsed;
        } else {
            std::cerr << "[ConfigLoader] Unknown guardrail_policy '" << policy << "', keeping "
                      << domain::clinical::OverridePolicyToString(config.guardrails.policy) << std::endl;
        }
    }

    return config;
}

} // namespace trialguard::infrastructure
