/**
 * @file MatchServer.hpp
 * @brief HTTP/JSON front end for matching and guardrail checks.
 *
 * Endpoints:
 *   POST /api/match            {"patientText": "..."} -> ranked matches
 *   POST /api/guardrails       {"profile", "trial", "verdict", "rawText"?} -> guardrail verdict
 *   POST /api/trials/validate  [trial, ...] -> validation outcome
 *   GET  /api/health
 */

#pragma once

#include <atomic>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "application/MatchingService.hpp"

namespace httplib {
class Server;
}

namespace trialguard::app {

struct MatchServerConfig {
    std::string bindAddress = "0.0.0.0";
    int port = 8080;
};

/**
 * @class MatchServer
 * @brief Routes requests to MatchingService and the guardrail core.
 *
 * Handlers are exposed as plain functions returning status + JSON body so
 * they can be exercised without opening a socket.
 */
class MatchServer {
public:
    struct Reply {
        int status = 200;
        nlohmann::ordered_json body;
    };

    MatchServer(std::shared_ptr<application::MatchingService> service, MatchServerConfig config = MatchServerConfig{});
    ~MatchServer();

    /** @brief Binds and serves until stop() is called. Returns false if binding failed. */
    bool listen();

    void stop();

    bool isRunning() const { return m_running.load(); }

    Reply handleMatch(const std::string& requestBody) const;
    Reply handleGuardrails(const std::string& requestBody) const;
    Reply handleValidateTrials(const std::string& requestBody) const;
    Reply handleHealth() const;

private:
    static Reply Error(int status, const std::string& message);

    std::shared_ptr<application::MatchingService> m_service;
    MatchServerConfig m_config;
    std::unique_ptr<httplib::Server> m_server;
    std::atomic<bool> m_running{false};
};

} // namespace trialguard::app
