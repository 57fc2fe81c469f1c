/**
 * @file PipelineOrchestrator.hpp
 * @brief Top-level build/update state machine with per-project admission control.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "application/AsyncTaskManager.hpp"
#include "application/ErrorFilter.hpp"
#include "application/IntentClassifier.hpp"
#include "application/RunRegistry.hpp"
#include "domain/EnrichmentService.hpp"
#include "domain/GenerationService.hpp"
#include "domain/PipelineEvent.hpp"
#include "domain/ProcessSupervisor.hpp"
#include "domain/ProjectRepository.hpp"
#include "domain/Requests.hpp"
#include "domain/TestService.hpp"

namespace webforge::application {

class RunProcessScope;
class RunEmitter;

/**
 * @struct OrchestratorSettings
 * @brief Tunables of the pipeline, filled from the application config.
 */
struct OrchestratorSettings {
    std::string defaultRefineModel = "llama3.1:8b";
    std::string defaultBuildModel = "qwen2.5-coder:14b";

    std::string devServerHost = "localhost";
    int devServerPort = 5173;  ///< First port handed out to projects.
    int devServerPortSpan = 20;

    std::string installCommand = "npm install";
    std::string serveCommand = "npm run dev -- --port {port} --strictPort --host {host}";

    int maxFixAttempts = 3;
    int maxConcurrentRuns = 2;
    int enrichmentAttempts = 2; ///< First try plus one retry.

    std::chrono::milliseconds installTimeout{std::chrono::seconds(300)};
    std::chrono::milliseconds portWait{std::chrono::seconds(35)};

    bool keepServerAfterRun = true;
    ErrorFilterPolicy errorFilter = ErrorFilterPolicy::Default();
};

/**
 * @struct SubmitResult
 * @brief Outcome of admission. Rejections are also emitted as an error event.
 */
struct SubmitResult {
    bool accepted = false;
    std::string runId;
    std::string project;
    domain::FailureReason reason = domain::FailureReason::Internal;
    std::string detail;
    std::optional<domain::Intent> intent;
};

/**
 * @class PipelineOrchestrator
 * @brief Admits build and update requests and drives each run on its own thread.
 *
 * Received -> Enriching -> Generating -> Installing -> Serving -> FixLoop ->
 * Done | Failed, plus Cancelled. Every process a run starts is stopped before
 * the run turns terminal; on Done the dev server may be handed over to the
 * project's serving slot instead (see `keepServerAfterRun`).
 */
class PipelineOrchestrator {
public:
    PipelineOrchestrator(std::shared_ptr<domain::ProjectRepository> repository,
                         std::shared_ptr<domain::EnrichmentService> enrichment,
                         std::shared_ptr<domain::GenerationService> generation,
                         std::shared_ptr<domain::TestService> tester,
                         std::shared_ptr<domain::ProcessSupervisor> supervisor,
                         OrchestratorSettings settings);
    ~PipelineOrchestrator();

    PipelineOrchestrator(const PipelineOrchestrator&) = delete;
    PipelineOrchestrator& operator=(const PipelineOrchestrator&) = delete;

    /** @brief Validates and admits a fresh build. `sink` receives every event of the run. */
    SubmitResult SubmitBuild(domain::BuildRequest request, domain::EventSink sink);

    /** @brief Validates, classifies and admits a reprompt on an existing project. */
    SubmitResult SubmitUpdate(domain::RepromptRequest request, domain::EventSink sink);

    /** @brief Requests cancellation of an active run. */
    bool Cancel(const std::string& runId);
    bool CancelProject(const std::string& project);

    std::optional<domain::PipelineRun> GetRun(const std::string& runId) const;

    /** @brief Last-known state of a project; nullopt for an unknown project. */
    std::optional<domain::StatusEvent> Status(const std::string& project) const;

    /** @brief The dev server currently owned by the project's serving slot. */
    std::optional<domain::ProcessHandle> ProjectServer(const std::string& project) const;

    size_t ActiveRuns() const { return m_registry.ActiveCount(); }

    /** @brief True while a run holds the project lock. */
    bool IsBusy(const std::string& project) const { return m_registry.IsLocked(project); }

    /**
     * @brief Locks a project for file changes made outside any run.
     * @return Token for ReturnProject; empty when a run or another lease holds the project.
     */
    std::string LeaseProject(const std::string& project);
    void ReturnProject(const std::string& project, const std::string& token);

    /** @brief Blocks until no run is executing. */
    void WaitIdle();

    /** @brief Cancels all runs, waits for them and stops every process. Idempotent. */
    void Shutdown();

    /** @brief Project directory name for a fresh build. */
    static std::string SlugFor(const domain::SiteSpecification& spec, const std::string& idea);

    /** @brief Substitutes {port}, {host} and {url} in a command template. */
    static std::string ExpandTemplate(std::string command, const std::map<std::string, std::string>& values);

private:
    struct RunContext;

    void ExecuteBuild(const std::shared_ptr<RunContext>& ctx, const domain::BuildRequest& request);
    void ExecuteUpdate(const std::shared_ptr<RunContext>& ctx, const domain::RepromptRequest& request,
                       domain::Project project, const Classification& classification);

    domain::SiteSpecification Enrich(RunContext& ctx, const domain::BuildRequest& request);
    void EnsureDependencies(RunContext& ctx, domain::Project& project);
    domain::ProcessHandle StartDevServer(RunContext& ctx, const domain::Project& project, std::string& url);
    void RunFixLoop(RunContext& ctx, domain::Project& project, const domain::ProcessHandle& server,
                    const std::string& url, const std::string& buildModel);
    void WriteFile(RunContext& ctx, domain::Project& project, const std::string& path, const std::string& content);
    void Finish(RunContext& ctx, domain::RunOutcome outcome);

    void SetStage(RunContext& ctx, domain::PipelineStage stage);
    void Publish(RunContext& ctx);
    domain::StreamObserver ObserverFor(const std::shared_ptr<RunEmitter>& emitter) const;

    void StopProjectServer(const std::string& project);
    int PortFor(const std::string& project);
    std::string NewRunId();

    SubmitResult Reject(const domain::EventSink& sink, const std::string& project,
                        domain::FailureReason reason, const std::string& detail) const;

    std::shared_ptr<domain::ProjectRepository> m_repository;
    std::shared_ptr<domain::EnrichmentService> m_enrichment;
    std::shared_ptr<domain::GenerationService> m_generation;
    std::shared_ptr<domain::TestService> m_tester;
    std::shared_ptr<domain::ProcessSupervisor> m_supervisor;
    OrchestratorSettings m_settings;
    ErrorFilter m_errorFilter;

    RunRegistry m_registry;

    mutable std::mutex m_serversMutex;
    std::map<std::string, domain::ProcessHandle> m_projectServers;
    std::map<std::string, int> m_ports;

    std::atomic<bool> m_shutdown{false};
    std::atomic<unsigned long long> m_runCounter{0};

    AsyncTaskManager m_tasks; // last: joined before the members above go away
};

} // namespace webforge::application
