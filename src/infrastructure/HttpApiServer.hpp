/**
 * @file HttpApiServer.hpp
 * @brief REST surface: project listing, file retrieval, import, export and run triggers.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <nlohmann/json.hpp>

#include "application/PipelineOrchestrator.hpp"
#include "domain/ProjectRepository.hpp"

namespace httplib { class Server; }

namespace webforge::infrastructure {

/**
 * @class HttpApiServer
 * @brief cpp-httplib server on its own thread.
 *
 * Runs triggered over REST have no session; their events are logged and
 * their outcome is read back with `GET /status/<project>`.
 */
class HttpApiServer {
public:
    HttpApiServer(application::PipelineOrchestrator& orchestrator,
                  std::shared_ptr<domain::ProjectRepository> repository,
                  std::string host, int port);
    ~HttpApiServer();

    HttpApiServer(const HttpApiServer&) = delete;
    HttpApiServer& operator=(const HttpApiServer&) = delete;

    /** @brief Binds the port and starts serving. False if the port cannot be bound. */
    bool start();
    void stop();

    int port() const { return m_port; }

    /**
     * @brief Writes an uploaded file map into a project.
     * @return The project name, or nullopt with `status`/`error` describing the rejection.
     */
    std::optional<std::string> ImportProject(const nlohmann::json& body, int& status, std::string& error);

    /** @brief `{path: content}` in display order; nullopt for an unknown project. */
    std::optional<nlohmann::json> ProjectFiles(const std::string& name);

private:
    void RegisterRoutes();
    static domain::EventSink LoggingSink();

    application::PipelineOrchestrator& m_orchestrator;
    std::shared_ptr<domain::ProjectRepository> m_repository;
    std::string m_host;
    int m_port;

    std::unique_ptr<httplib::Server> m_server;
    std::thread m_thread;
};

} // namespace webforge::infrastructure
