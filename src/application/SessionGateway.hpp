/**
 * @file SessionGateway.hpp
 * @brief Transport-independent session protocol: commands in, ordered events out.
 */

#pragma once

#include <atomic>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "application/ClientCommand.hpp"
#include "application/PipelineOrchestrator.hpp"
#include "domain/PipelineEvent.hpp"
#include "domain/ProjectRepository.hpp"

namespace webforge::application {

/**
 * @class SessionGateway
 * @brief Routes every event of a run to the session that started it.
 *
 * Each session has an ordered outbox drained by the transport. The wake
 * handler is called (outside the gateway lock) whenever an outbox grows,
 * possibly from a run thread.
 */
class SessionGateway {
public:
    using WakeHandler = std::function<void(const std::string& sessionId)>;

    SessionGateway(PipelineOrchestrator& orchestrator,
                   std::shared_ptr<domain::ProjectRepository> repository,
                   bool cancelOnDisconnect);

    std::string OpenSession();

    /** @brief Drops the session; cancels its runs when cancelOnDisconnect is set. */
    void CloseSession(const std::string& sessionId);

    void HandleCommand(const std::string& sessionId, const ClientCommand& command);

    /** @brief Answers a command the transport could not parse. */
    void RejectMalformed(const std::string& sessionId, const std::string& detail);

    /** @brief Takes every pending event of a session, in emission order. */
    std::vector<domain::PipelineEvent> Drain(const std::string& sessionId);

    void SetWakeHandler(WakeHandler handler);

    bool HasSession(const std::string& sessionId) const;

    /** @brief Runs of the session that have not reached a terminal event yet. */
    std::vector<std::string> OpenRuns(const std::string& sessionId) const;

private:
    struct Session {
        std::deque<domain::PipelineEvent> outbox;
        std::set<std::string> runs;
    };

    void Dispatch(const std::string& sessionId, const ClientCommand& command);
    void Deliver(const std::string& sessionId, const domain::PipelineEvent& event);
    domain::EventSink SinkFor(const std::string& sessionId);

    PipelineOrchestrator& m_orchestrator;
    std::shared_ptr<domain::ProjectRepository> m_repository;
    bool m_cancelOnDisconnect;

    mutable std::mutex m_mutex;
    std::map<std::string, Session> m_sessions;
    WakeHandler m_wake;
    std::atomic<unsigned long long> m_nextSession{0};
};

} // namespace webforge::application
