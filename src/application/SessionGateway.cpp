#include "application/SessionGateway.hpp"

#include "application/ProjectExportService.hpp"

#include <iostream>

namespace webforge::application {

using namespace webforge::domain;

SessionGateway::SessionGateway(PipelineOrchestrator& orchestrator,
                               std::shared_ptr<ProjectRepository> repository,
                               bool cancelOnDisconnect)
    : m_orchestrator(orchestrator),
      m_repository(std::move(repository)),
      m_cancelOnDisconnect(cancelOnDisconnect) {}

std::string SessionGateway::OpenSession() {
    const std::string id = "session-" + std::to_string(++m_nextSession);
    std::lock_guard<std::mutex> lock(m_mutex);
    m_sessions[id];
    return id;
}

void SessionGateway::CloseSession(const std::string& sessionId) {
    std::set<std::string> runs;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_sessions.find(sessionId);
        if (it == m_sessions.end()) return;
        runs = std::move(it->second.runs);
        m_sessions.erase(it);
    }

    if (m_cancelOnDisconnect) {
        for (const auto& runId : runs) m_orchestrator.Cancel(runId);
    } else if (!runs.empty()) {
        std::cout << "[Gateway] " << sessionId << " disconnected, " << runs.size()
                  << " run(s) keep going" << std::endl;
    }
}

void SessionGateway::SetWakeHandler(WakeHandler handler) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_wake = std::move(handler);
}

bool SessionGateway::HasSession(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sessions.count(sessionId) > 0;
}

std::vector<std::string> SessionGateway::OpenRuns(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_sessions.find(sessionId);
    if (it == m_sessions.end()) return {};
    return {it->second.runs.begin(), it->second.runs.end()};
}

void SessionGateway::Deliver(const std::string& sessionId, const PipelineEvent& event) {
    WakeHandler wake;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_sessions.find(sessionId);
        if (it == m_sessions.end()) return;

        Session& session = it->second;
        if (const auto* accepted = std::get_if<AcceptedEvent>(&event)) {
            session.runs.insert(accepted->runId);
        } else if (IsTerminalEvent(event)) {
            std::visit([&session](const auto& e) {
                using T = std::decay_t<decltype(e)>;
                if constexpr (std::is_same_v<T, DoneEvent> || std::is_same_v<T, ErrorEvent> ||
                              std::is_same_v<T, CancelledEvent>) {
                    session.runs.erase(e.runId);
                }
            }, event);
        }
        session.outbox.push_back(event);
        wake = m_wake;
    }
    if (wake) wake(sessionId);
}

EventSink SessionGateway::SinkFor(const std::string& sessionId) {
    return [this, sessionId](const PipelineEvent& event) { Deliver(sessionId, event); };
}

std::vector<PipelineEvent> SessionGateway::Drain(const std::string& sessionId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_sessions.find(sessionId);
    if (it == m_sessions.end()) return {};
    std::vector<PipelineEvent> events(it->second.outbox.begin(), it->second.outbox.end());
    it->second.outbox.clear();
    return events;
}

void SessionGateway::RejectMalformed(const std::string& sessionId, const std::string& detail) {
    ErrorEvent error;
    error.reason = FailureReason::UserInput;
    error.text = detail;
    Deliver(sessionId, error);
}

void SessionGateway::HandleCommand(const std::string& sessionId, const ClientCommand& command) {
    if (!HasSession(sessionId)) return;

    try {
        Dispatch(sessionId, command);
    } catch (const std::exception& e) {
        std::cerr << "[Gateway] Command failed: " << e.what() << std::endl;
        ErrorEvent error;
        error.project = command.project;
        error.reason = FailureReason::Internal;
        error.text = e.what();
        Deliver(sessionId, error);
    }
}

void SessionGateway::Dispatch(const std::string& sessionId, const ClientCommand& command) {
    switch (command.type) {
        case CommandType::Build: {
            BuildRequest request;
            request.idea = command.prompt;
            request.refineModel = command.refineModel;
            request.buildModel = command.buildModel;
            if (!command.project.empty()) request.targetProject = command.project;
            m_orchestrator.SubmitBuild(request, SinkFor(sessionId));
            break;
        }
        case CommandType::Update: {
            RepromptRequest request;
            request.project = command.project;
            request.instruction = command.prompt;
            request.buildModel = command.buildModel;
            request.intent = command.intent;
            request.componentHint = command.component;
            m_orchestrator.SubmitUpdate(request, SinkFor(sessionId));
            break;
        }
        case CommandType::Cancel: {
            bool cancelled = false;
            if (!command.runId.empty()) {
                cancelled = m_orchestrator.Cancel(command.runId);
            } else if (!command.project.empty()) {
                cancelled = m_orchestrator.CancelProject(command.project);
            } else {
                for (const auto& runId : OpenRuns(sessionId)) cancelled = m_orchestrator.Cancel(runId) || cancelled;
            }
            if (cancelled) {
                Deliver(sessionId, LogEvent{"INFO", "Cancellation requested"});
            } else {
                ErrorEvent error;
                error.project = command.project;
                error.reason = FailureReason::UserInput;
                error.text = "No active run to cancel";
                Deliver(sessionId, error);
            }
            break;
        }
        case CommandType::Export: {
            std::optional<Project> project;
            if (!command.project.empty()) project = m_repository->load(command.project);
            if (!project) {
                ErrorEvent error;
                error.project = command.project;
                error.reason = FailureReason::UserInput;
                error.text = "Project not found: " + command.project;
                Deliver(sessionId, error);
                break;
            }
            Deliver(sessionId, ExportEvent{project->getName(), ProjectExportService::ToArchive(*project)});
            break;
        }
        case CommandType::Status: {
            std::optional<StatusEvent> status;
            if (!command.project.empty()) status = m_orchestrator.Status(command.project);
            if (!status) {
                ErrorEvent error;
                error.project = command.project;
                error.reason = FailureReason::UserInput;
                error.text = "Project not found: " + command.project;
                Deliver(sessionId, error);
                break;
            }
            Deliver(sessionId, *status);
            break;
        }
        case CommandType::Projects:
            Deliver(sessionId, ProjectsEvent{m_repository->list()});
            break;
    }
}

} // namespace webforge::application
