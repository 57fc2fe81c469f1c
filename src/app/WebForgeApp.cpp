/**
 * @file WebForgeApp.cpp
 * @brief Implementation of the WebForgeApp class.
 */
#include "app/WebForgeApp.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>
#include <thread>

#include "application/SessionGateway.hpp"
#include "infrastructure/CommandTestService.hpp"
#include "infrastructure/HttpApiServer.hpp"
#include "infrastructure/ModelManager.hpp"
#include "infrastructure/OllamaClient.hpp"
#include "infrastructure/OllamaEnrichmentService.hpp"
#include "infrastructure/OllamaGenerationService.hpp"
#include "infrastructure/PosixProcessSupervisor.hpp"
#include "infrastructure/ProjectRepositoryFs.hpp"
#include "infrastructure/WebSocketGateway.hpp"

namespace webforge::app {

namespace {

volatile std::sig_atomic_t g_stopRequested = 0;

void HandleSignal(int) {
    WebForgeApp::RequestStop();
}

void PrintUsage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [--config <settings.json>]\n"
              << "  --config <path>  Read settings from <path> instead of the default location\n"
              << "  --help           Show this message" << std::endl;
}

} // namespace

WebForgeApp::WebForgeApp() = default;

WebForgeApp::~WebForgeApp() {
    Shutdown();
}

void WebForgeApp::RequestStop() {
    g_stopRequested = 1;
}

application::OrchestratorSettings WebForgeApp::ToSettings(const infrastructure::AppConfig& config) {
    application::OrchestratorSettings settings;
    settings.defaultRefineModel = config.refineModel;
    settings.defaultBuildModel = config.buildModel;
    settings.devServerHost = config.devServerHost;
    settings.devServerPort = config.devServerPort;
    settings.installCommand = config.installCommand;
    settings.serveCommand = config.serveCommand;
    settings.maxFixAttempts = config.maxFixAttempts;
    settings.maxConcurrentRuns = config.maxConcurrentRuns;
    settings.installTimeout = std::chrono::seconds(config.installTimeoutSeconds);
    settings.portWait = std::chrono::seconds(config.portWaitSeconds);
    settings.keepServerAfterRun = config.keepServerAfterRun;
    if (!config.errorSignals.empty()) settings.errorFilter.signals = config.errorSignals;
    if (!config.errorNoise.empty()) settings.errorFilter.noise = config.errorNoise;
    return settings;
}

bool WebForgeApp::Init() {
    m_config = infrastructure::ConfigLoader::Load(m_configPath);

    // Dependency Injection / Composition Root
    m_repository = std::make_shared<infrastructure::ProjectRepositoryFs>(m_config.projectsDir);
    m_supervisor = std::make_shared<infrastructure::PosixProcessSupervisor>(
        std::chrono::milliseconds(m_config.stopGraceMillis));

    auto client = std::make_shared<infrastructure::OllamaClient>(m_config.ollamaHost, m_config.ollamaPort);
    auto models = std::make_shared<infrastructure::ModelManager>(client, m_config.unloadModelsBetweenStages);
    auto enrichment = std::make_shared<infrastructure::OllamaEnrichmentService>(client, models);
    auto generation = std::make_shared<infrastructure::OllamaGenerationService>(client, models);
    auto tester = std::make_shared<infrastructure::CommandTestService>(
        m_supervisor, m_config.testCommand, std::chrono::seconds(m_config.testTimeoutSeconds));

    if (!client->getAvailableModels()) {
        std::cerr << "[WebForgeApp] Ollama is not reachable at " << m_config.ollamaHost << ":"
                  << m_config.ollamaPort << "; runs will fail until it is started" << std::endl;
    }

    m_orchestrator = std::make_unique<application::PipelineOrchestrator>(
        m_repository, enrichment, generation, tester, m_supervisor, ToSettings(m_config));
    m_sessions = std::make_unique<application::SessionGateway>(*m_orchestrator, m_repository,
                                                               m_config.cancelOnDisconnect);

    m_gateway = std::make_unique<infrastructure::WebSocketGateway>(*m_sessions, m_config.gatewayPort);
    if (!m_gateway->start()) return false;

    m_http = std::make_unique<infrastructure::HttpApiServer>(*m_orchestrator, m_repository, "127.0.0.1",
                                                             m_config.httpPort);
    if (!m_http->start()) return false;

    std::cout << "[WebForgeApp] Projects  : " << m_config.projectsDir << "\n"
              << "[WebForgeApp] Refine    : " << m_config.refineModel << "\n"
              << "[WebForgeApp] Build     : " << m_config.buildModel << std::endl;
    return true;
}

void WebForgeApp::Shutdown() {
    // Surfaces first so no new run is admitted, then the runs, then the gateway they report to.
    if (m_http) {
        m_http->stop();
        m_http.reset();
    }
    if (m_orchestrator) m_orchestrator->Shutdown();
    if (m_gateway) {
        m_gateway->stop();
        m_gateway.reset();
    }
    m_sessions.reset();
    m_orchestrator.reset();
    if (m_supervisor) m_supervisor->shutdown();
}

int WebForgeApp::Run(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            m_configPath = argv[++i];
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            PrintUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << argv[i] << std::endl;
            PrintUsage(argv[0]);
            return 2;
        }
    }

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);
    std::signal(SIGPIPE, SIG_IGN);

    if (!Init()) {
        Shutdown();
        return 1;
    }

    while (!g_stopRequested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    std::cout << "[WebForgeApp] Shutting down..." << std::endl;
    Shutdown();
    return 0;
}

} // namespace webforge::app
