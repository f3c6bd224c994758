/**
 * @file MatchServer.cpp
 * @brief Implementation of MatchServer.
 */

#include "app/MatchServer.hpp"
#include "domain/clinical/services/ProfileNormalizer.hpp"
#include "domain/clinical/services/ProfileValidator.hpp"
#include "domain/clinical/services/TrialValidator.hpp"
#include "infrastructure/JsonMapping.hpp"

#include <httplib.h>
#include <iostream>

namespace trialguard::app {

using json = nlohmann::ordered_json;
using infrastructure::JsonMapping;
using namespace domain::clinical;

namespace {

void ApplyCors(httplib::Response& res) {
    res.set_header("Access-Control-Allow-Origin", "*");
    res.set_header("Access-Control-Allow-Methods", "POST, OPTIONS");
    res.set_header("Access-Control-Allow-Headers", "Content-Type");
}

void Send(httplib::Response& res, const MatchServer::Reply& reply) {
    ApplyCors(res);
    res.status = reply.status;
    res.set_content(reply.body.dump(), "application/json");
}

} // namespace

MatchServer::MatchServer(std::shared_ptr<application::MatchingService> service, MatchServerConfig config)
    : m_service(std::move(service)), m_config(std::move(config)), m_server(std::make_unique<httplib::Server>()) {}

MatchServer::~MatchServer() {
    stop();
}

MatchServer::Reply MatchServer::Error(int status, const std::string& message) {
    return {status, json{{"success", false}, {"error", message}}};
}

bool MatchServer::listen() {
    m_server->Post("/api/match", [this](const httplib::Request& req, httplib::Response& res) {
        Send(res, handleMatch(req.body));
    });
    m_server->Post("/api/guardrails", [this](const httplib::Request& req, httplib::Response& res) {
        Send(res, handleGuardrails(req.body));
    });
    m_server->Post("/api/trials/validate", [this](const httplib::Request& req, httplib::Response& res) {
        Send(res, handleValidateTrials(req.body));
    });
    m_server->Get("/api/health", [this](const httplib::Request&, httplib::Response& res) {
        Send(res, handleHealth());
    });
    m_server->Options(R"(/api/.*)", [](const httplib::Request&, httplib::Response& res) {
        Send(res, Reply{200, json::object()});
    });

    std::cout << "[MatchServer] Listening on " << m_config.bindAddress << ":" << m_config.port << std::endl;
    m_running = true;
    const bool ok = m_server->listen(m_config.bindAddress.c_str(), m_config.port);
    m_running = false;
    if (!ok) {
        std::cerr << "[MatchServer] Failed to bind " << m_config.bindAddress << ":" << m_config.port << std::endl;
    }
    return ok;
}

void MatchServer::stop() {
    if (m_server && m_server->is_running()) {
        m_server->stop();
    }
}

MatchServer::Reply MatchServer::handleMatch(const std::string& requestBody) const {
    json body;
    try {
        body = json::parse(requestBody);
    } catch (const std::exception& e) {
        return Error(400, std::string("Invalid JSON: ") + e.what());
    }

    if (!body.is_object() || !body.contains("patientText") || !body["patientText"].is_string() ||
        body["patientText"].get<std::string>().empty()) {
        return Error(400, "patientText is required");
    }

    try {
        const auto report = m_service->match(body["patientText"].get<std::string>());
        json out = JsonMapping::MatchReportToJson(report);
        out["success"] = true;
        return {200, out};
    } catch (const std::exception& e) {
        std::cerr << "[MatchServer] Match API error: " << e.what() << std::endl;
        return Error(500, e.what());
    }
}

MatchServer::Reply MatchServer::handleGuardrails(const std::string& requestBody) const {
    json body;
    try {
        body = json::parse(requestBody);
    } catch (const std::exception& e) {
        return Error(400, std::string("Invalid JSON: ") + e.what());
    }

    if (!body.is_object() || !body.contains("profile") || !body.contains("trial") || !body.contains("verdict")) {
        return Error(400, "profile, trial and verdict are required");
    }

    std::optional<std::string> rawText;
    if (body.contains("rawText") && body["rawText"].is_string()) {
        rawText = body["rawText"].get<std::string>();
    }

    const PatientProfile profile = ProfileNormalizer::normalizeAndInfer(
        JsonMapping::ProfileFromJson(body["profile"]), rawText);
    const TrialRecord trial = JsonMapping::TrialFromJson(body["trial"]);
    const AIVerdict verdict = JsonMapping::VerdictFromJson(body["verdict"]);

    const GuardrailVerdict guardrail = m_service->engine().apply(profile, trial, verdict);

    return {200, json{
        {"success", true},
        {"profile", JsonMapping::ProfileToJson(profile)},
        {"profileValidation", JsonMapping::ValidationToJson(ProfileValidator::validate(profile))},
        {"guardrail", JsonMapping::GuardrailToJson(guardrail)}
    }};
}

MatchServer::Reply MatchServer::handleValidateTrials(const std::string& requestBody) const {
    json body;
    try {
        body = json::parse(requestBody);
    } catch (const std::exception& e) {
        return Error(400, std::string("Invalid JSON: ") + e.what());
    }

    if (!body.is_array() && !(body.is_object() && body.contains("trials"))) {
        return Error(400, "an array of trials is required");
    }

    const auto outcome = TrialValidator::validate(JsonMapping::TrialsFromJson(body));
    json out = JsonMapping::ValidationToJson(outcome);
    out["success"] = true;
    return {200, out};
}

MatchServer::Reply MatchServer::handleHealth() const {
    return {200, json{
        {"success", true},
        {"status", "ok"},
        {"guardrailPolicy", OverridePolicyToString(m_service->engine().config().policy)}
    }};
}

} // namespace trialguard::app
