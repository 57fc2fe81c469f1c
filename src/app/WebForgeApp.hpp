/**
 * @file WebForgeApp.hpp
 * @brief Main application class for the WebForge engine.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>

#include "application/PipelineOrchestrator.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace webforge::application { class SessionGateway; }
namespace webforge::infrastructure {
class HttpApiServer;
class WebSocketGateway;
}

namespace webforge::app {

/**
 * @class WebForgeApp
 * @brief Composition root: wires adapters into the orchestrator, runs the
 * network surfaces until a termination signal and shuts everything down.
 */
class WebForgeApp {
public:
    WebForgeApp();
    ~WebForgeApp();

    /**
     * @brief Parses the command line, then serves until SIGINT or SIGTERM.
     * @return Process exit code.
     */
    int Run(int argc, char** argv);

    /** @brief Maps the loaded configuration onto the pipeline tunables. */
    static application::OrchestratorSettings ToSettings(const infrastructure::AppConfig& config);

    /** @brief Asks a running instance to stop (async-signal-safe). */
    static void RequestStop();

private:
    bool Init();
    void Shutdown();

    infrastructure::AppConfig m_config;
    std::optional<std::string> m_configPath;

    std::shared_ptr<domain::ProjectRepository> m_repository;
    std::shared_ptr<domain::ProcessSupervisor> m_supervisor;
    std::unique_ptr<application::PipelineOrchestrator> m_orchestrator;
    std::unique_ptr<application::SessionGateway> m_sessions;
    std::unique_ptr<infrastructure::WebSocketGateway> m_gateway;
    std::unique_ptr<infrastructure::HttpApiServer> m_http;
};

} // namespace webforge::app
