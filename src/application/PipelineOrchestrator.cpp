#include "application/PipelineOrchestrator.hpp"

#include "application/ComponentInjector.hpp"
#include "application/FixLoopController.hpp"
#include "application/RepairContext.hpp"
#include "application/RunProcessScope.hpp"

#include <algorithm>
#include <cctype>
#include <functional>
#include <iostream>
#include <set>
#include <sstream>
#include <system_error>

namespace webforge::application {

using namespace webforge::domain;

/**
 * @class RunEmitter
 * @brief Serializes the events of one run and drops everything after the terminal event.
 */
class RunEmitter {
public:
    explicit RunEmitter(EventSink sink) : m_sink(std::move(sink)) {}

    void operator()(const PipelineEvent& event) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed || !m_sink) return;
        m_sink(event);
        if (IsTerminalEvent(event)) m_closed = true;
    }

    void Close() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_closed = true;
    }

private:
    std::mutex m_mutex;
    EventSink m_sink;
    bool m_closed = false;
};

struct PipelineOrchestrator::RunContext {
    std::shared_ptr<RunRecord> record;
    PipelineRun run; ///< Working copy owned by the run thread, published to `record`.
    std::shared_ptr<RunEmitter> emit;
    RunProcessScope* scope = nullptr;
    std::optional<Project> project;
    ProjectState priorState = ProjectState::New;
    std::optional<ProcessHandle> server; ///< Dev server started by this run.
    std::string servingUrl;
    std::string currentStep;

    const CancellationToken& cancel() const { return record->cancel; }

    void ThrowIfCancelled() const {
        if (record->cancel.isCancelled()) throw RunCancelled();
    }

    void Log(const std::string& level, const std::string& text) { (*emit)(LogEvent{level, text}); }
    void Step(const std::string& step, const std::string& status) {
        if (status == "active") currentStep = step;
        (*emit)(StepEvent{step, status});
    }
    void Progress(const std::string& label, int pct) { (*emit)(ProgressEvent{label, pct}); }
};

namespace {

/** Terminal failure with an explicit reason code. */
class RunFailure : public std::runtime_error {
public:
    RunFailure(FailureReason reason, const std::string& detail, std::vector<std::string> errors = {})
        : std::runtime_error(detail), m_reason(reason), m_errors(std::move(errors)) {}

    FailureReason reason() const { return m_reason; }
    const std::vector<std::string>& errors() const { return m_errors; }

private:
    FailureReason m_reason;
    std::vector<std::string> m_errors;
};

std::string Trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

std::string Tail(const std::vector<std::string>& lines, size_t count) {
    std::string out;
    const size_t start = lines.size() > count ? lines.size() - count : 0;
    for (size_t i = start; i < lines.size(); ++i) out += "\n" + lines[i];
    return out;
}

/** Runs a stage body and maps whatever escapes it onto a run outcome. */
RunOutcome Guard(const CancellationToken& cancel, const std::function<void(RunOutcome&)>& body) {
    RunOutcome outcome;
    auto fail = [&](FailureReason reason, const std::string& detail) {
        outcome.success = false;
        outcome.reason = cancel.isCancelled() ? FailureReason::Cancelled : reason;
        outcome.detail = cancel.isCancelled() ? "Run cancelled" : detail;
    };

    try {
        body(outcome);
    } catch (const RunCancelled&) {
        fail(FailureReason::Cancelled, "Run cancelled");
    } catch (const RunFailure& e) {
        fail(e.reason(), e.what());
        outcome.lastErrors = e.errors();
    } catch (const CollaboratorError& e) {
        fail(FailureReason::Collaborator, e.what());
    } catch (const InfrastructureError& e) {
        fail(FailureReason::Infrastructure, e.what());
    } catch (const std::exception& e) {
        fail(FailureReason::Internal, std::string("Pipeline error: ") + e.what());
    }
    return outcome;
}

std::function<void(const std::string&)> OutputListener(const std::shared_ptr<RunEmitter>& emitter,
                                                       const std::string& tag) {
    return [emitter, tag](const std::string& line) {
        (*emitter)(LogEvent{"INFO", "[" + tag + "] " + line});
    };
}

std::string Readme(const SiteSpecification& spec, const std::string& idea, const std::string& name) {
    std::ostringstream ss;
    ss << "# " << (spec.title.empty() ? name : spec.title) << "\n\n";
    if (!spec.tagline.empty()) ss << spec.tagline << "\n\n";
    ss << "> Generated from the idea: \"" << idea << "\"\n\n";
    ss << "Site type: " << spec.siteType << " (" << spec.strategy << ")\n\n";
    ss << "## Run locally\n\n";
    ss << "```\nnpm install\nnpm run dev\n```\n";
    return ss.str();
}

} // namespace

PipelineOrchestrator::PipelineOrchestrator(std::shared_ptr<ProjectRepository> repository,
                                           std::shared_ptr<EnrichmentService> enrichment,
                                           std::shared_ptr<GenerationService> generation,
                                           std::shared_ptr<TestService> tester,
                                           std::shared_ptr<ProcessSupervisor> supervisor,
                                           OrchestratorSettings settings)
    : m_repository(std::move(repository)),
      m_enrichment(std::move(enrichment)),
      m_generation(std::move(generation)),
      m_tester(std::move(tester)),
      m_supervisor(std::move(supervisor)),
      m_settings(std::move(settings)),
      m_errorFilter(m_settings.errorFilter),
      m_registry(m_settings.maxConcurrentRuns) {}

PipelineOrchestrator::~PipelineOrchestrator() {
    Shutdown();
}

// --- Admission ---------------------------------------------------------------

SubmitResult PipelineOrchestrator::Reject(const EventSink& sink, const std::string& project,
                                          FailureReason reason, const std::string& detail) const {
    std::cerr << "[Orchestrator] Rejected (" << FailureReasonToString(reason) << "): " << detail << std::endl;
    if (sink) {
        ErrorEvent event;
        event.project = project;
        event.reason = reason;
        event.text = detail;
        sink(event);
    }
    SubmitResult result;
    result.project = project;
    result.reason = reason;
    result.detail = detail;
    return result;
}

std::string PipelineOrchestrator::NewRunId() {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return "run-" + std::to_string(ms) + "-" + std::to_string(++m_runCounter);
}

SubmitResult PipelineOrchestrator::SubmitBuild(BuildRequest request, EventSink sink) {
    if (m_shutdown) return Reject(sink, "", FailureReason::Internal, "Engine is shutting down");
    if (Trim(request.idea).empty()) return Reject(sink, "", FailureReason::UserInput, "Idea text is empty");
    if (request.refineModel.empty()) request.refineModel = m_settings.defaultRefineModel;
    if (request.buildModel.empty()) request.buildModel = m_settings.defaultBuildModel;

    std::optional<std::string> lockProject;
    if (request.targetProject && !request.targetProject->empty()) {
        if (!m_repository->exists(*request.targetProject)) {
            return Reject(sink, *request.targetProject, FailureReason::UserInput,
                          "Project not found: " + *request.targetProject);
        }
        lockProject = request.targetProject;
    } else {
        request.targetProject.reset();
    }

    auto ctx = std::make_shared<RunContext>();
    ctx->record = std::make_shared<RunRecord>();
    ctx->run.id = NewRunId();
    ctx->run.kind = RunKind::Build;
    ctx->run.project = lockProject.value_or("");
    ctx->record->run = ctx->run;

    const std::string project = ctx->run.project;
    switch (m_registry.Admit(ctx->record, lockProject)) {
        case Admission::Busy:
            return Reject(sink, project, FailureReason::Busy, "Project " + project + " already has an active run");
        case Admission::AtCapacity:
            return Reject(sink, project, FailureReason::AtCapacity,
                          std::to_string(m_registry.maxConcurrentRuns()) + " runs already active, try again later");
        case Admission::Admitted:
            break;
    }

    ctx->emit = std::make_shared<RunEmitter>(std::move(sink));
    (*ctx->emit)(AcceptedEvent{ctx->run.id, project, RunKindToString(RunKind::Build), ""});
    std::cout << "[Orchestrator] Build " << ctx->run.id << " accepted" << std::endl;

    try {
        m_tasks.SubmitTask(TaskType::Build, "build " + ctx->run.id,
                           [this, ctx, request](std::shared_ptr<TaskStatus>) { ExecuteBuild(ctx, request); });
    } catch (const std::system_error& e) {
        RunOutcome outcome;
        outcome.reason = FailureReason::Internal;
        outcome.detail = std::string("Could not start run: ") + e.what();
        Finish(*ctx, outcome);
        return Reject(EventSink(), project, FailureReason::Internal, outcome.detail);
    }

    SubmitResult result;
    result.accepted = true;
    result.runId = ctx->run.id;
    result.project = project;
    return result;
}

SubmitResult PipelineOrchestrator::SubmitUpdate(RepromptRequest request, EventSink sink) {
    if (m_shutdown) return Reject(sink, request.project, FailureReason::Internal, "Engine is shutting down");
    if (Trim(request.project).empty()) return Reject(sink, "", FailureReason::UserInput, "Project name is required");
    if (Trim(request.instruction).empty()) {
        return Reject(sink, request.project, FailureReason::UserInput, "Instruction is empty");
    }
    if (!m_repository->exists(request.project)) {
        return Reject(sink, request.project, FailureReason::UserInput, "Project not found: " + request.project);
    }
    if (request.buildModel.empty()) request.buildModel = m_settings.defaultBuildModel;

    auto ctx = std::make_shared<RunContext>();
    ctx->record = std::make_shared<RunRecord>();
    ctx->run.id = NewRunId();
    ctx->run.kind = RunKind::Update;
    ctx->run.project = request.project;
    ctx->record->run = ctx->run;

    switch (m_registry.Admit(ctx->record, request.project)) {
        case Admission::Busy:
            return Reject(sink, request.project, FailureReason::Busy,
                          "Project " + request.project + " already has an active run");
        case Admission::AtCapacity:
            return Reject(sink, request.project, FailureReason::AtCapacity,
                          std::to_string(m_registry.maxConcurrentRuns()) + " runs already active, try again later");
        case Admission::Admitted:
            break;
    }

    std::optional<Project> project;
    Classification classification;
    try {
        project = m_repository->load(request.project);
        if (project) {
            IntentClassifier::ComponentMap components;
            for (const auto& name : project->ComponentNames()) {
                components[name] = project->getFileContent(Project::ComponentPath(name)).value_or("");
            }
            if (request.intent) {
                classification = IntentClassifier::ResolveFor(*request.intent, request.instruction,
                                                              components, request.componentHint);
            } else if (auto classified = IntentClassifier::Classify(request.instruction, components,
                                                                    request.componentHint)) {
                classification = *classified;
            }
        }
    } catch (const std::exception& e) {
        m_registry.Release(ctx->run.id);
        return Reject(sink, request.project, FailureReason::Internal,
                      std::string("Could not load project: ") + e.what());
    }
    if (!project) {
        m_registry.Release(ctx->run.id);
        return Reject(sink, request.project, FailureReason::UserInput, "Project not found: " + request.project);
    }
    if (classification.targetComponent.empty()) {
        m_registry.Release(ctx->run.id);
        return Reject(sink, request.project, FailureReason::UserInput, "No components found in project");
    }

    ctx->run.intent = classification.intent;
    ctx->record->run = ctx->run;

    ctx->emit = std::make_shared<RunEmitter>(std::move(sink));
    (*ctx->emit)(AcceptedEvent{ctx->run.id, request.project, RunKindToString(RunKind::Update),
                               IntentToString(classification.intent)});
    std::cout << "[Orchestrator] Update " << ctx->run.id << " accepted for " << request.project
              << " (intent=" << IntentToString(classification.intent)
              << ", target=" << classification.targetComponent << ")" << std::endl;

    try {
        m_tasks.SubmitTask(TaskType::Update, "update " + ctx->run.id,
                           [this, ctx, request, loaded = std::move(*project), classification](std::shared_ptr<TaskStatus>) {
                               ExecuteUpdate(ctx, request, loaded, classification);
                           });
    } catch (const std::system_error& e) {
        RunOutcome outcome;
        outcome.reason = FailureReason::Internal;
        outcome.detail = std::string("Could not start run: ") + e.what();
        Finish(*ctx, outcome);
        return Reject(EventSink(), request.project, FailureReason::Internal, outcome.detail);
    }

    SubmitResult result;
    result.accepted = true;
    result.runId = ctx->run.id;
    result.project = request.project;
    result.intent = classification.intent;
    return result;
}

bool PipelineOrchestrator::Cancel(const std::string& runId) {
    auto record = m_registry.Find(runId);
    if (!record || IsTerminal(record->snapshot().stage)) return false;
    record->cancel.cancel();
    std::cout << "[Orchestrator] Cancellation requested for " << runId << std::endl;
    return true;
}

bool PipelineOrchestrator::CancelProject(const std::string& project) {
    auto record = m_registry.ActiveFor(project);
    if (!record) return false;
    return Cancel(record->snapshot().id);
}

std::optional<PipelineRun> PipelineOrchestrator::GetRun(const std::string& runId) const {
    auto record = m_registry.Find(runId);
    if (!record) return std::nullopt;
    return record->snapshot();
}

std::optional<StatusEvent> PipelineOrchestrator::Status(const std::string& project) const {
    auto record = m_registry.LastFor(project);
    if (!record && !m_repository->exists(project)) return std::nullopt;

    StatusEvent status;
    status.project = project;
    if (record) {
        const auto run = record->snapshot();
        status.runId = run.id;
        status.stage = StageToString(run.stage);
        status.fixAttempts = run.fixAttempts;
        if (run.outcome) status.detail = run.outcome->detail;
    }

    if (m_registry.IsLocked(project)) {
        status.state = ProjectStateToString(ProjectState::Building);
    } else if (auto loaded = m_repository->load(project)) {
        status.state = ProjectStateToString(loaded->getState());
    } else {
        status.state = "unknown";
    }

    if (auto server = ProjectServer(project); server && server->port) {
        status.url = "http://" + m_settings.devServerHost + ":" + std::to_string(*server->port);
    }
    return status;
}

std::optional<ProcessHandle> PipelineOrchestrator::ProjectServer(const std::string& project) const {
    std::lock_guard<std::mutex> lock(m_serversMutex);
    auto it = m_projectServers.find(project);
    if (it == m_projectServers.end() || !m_supervisor->isAlive(it->second)) return std::nullopt;
    return it->second;
}

std::string PipelineOrchestrator::LeaseProject(const std::string& project) {
    const std::string token = "lease-" + std::to_string(++m_runCounter);
    return m_registry.LockProject(project, token) ? token : std::string();
}

void PipelineOrchestrator::ReturnProject(const std::string& project, const std::string& token) {
    m_registry.UnlockProject(project, token);
}

void PipelineOrchestrator::WaitIdle() {
    m_tasks.WaitAll();
}

void PipelineOrchestrator::Shutdown() {
    bool expected = false;
    if (!m_shutdown.compare_exchange_strong(expected, true)) {
        m_tasks.WaitAll();
        return;
    }

    std::cout << "[Orchestrator] Shutting down..." << std::endl;
    for (const auto& record : m_registry.Active()) record->cancel.cancel();
    m_tasks.WaitAll();

    std::map<std::string, ProcessHandle> servers;
    {
        std::lock_guard<std::mutex> lock(m_serversMutex);
        servers.swap(m_projectServers);
    }
    for (const auto& [project, handle] : servers) {
        (void)project;
        try {
            m_supervisor->stop(handle);
        } catch (const std::exception& e) {
            std::cerr << "[Orchestrator] Failed to stop dev server: " << e.what() << std::endl;
        }
    }
    m_supervisor->shutdown();
}

// --- Helpers -----------------------------------------------------------------

std::string PipelineOrchestrator::SlugFor(const SiteSpecification& spec, const std::string& idea) {
    std::string raw = spec.projectName;
    if (Trim(raw).empty()) {
        for (char c : idea.substr(0, 15)) {
            if (std::isalpha(static_cast<unsigned char>(c))) raw += c;
        }
    }

    std::string slug;
    for (char c : raw) {
        const unsigned char uc = static_cast<unsigned char>(std::tolower(static_cast<unsigned char>(c)));
        if ((uc >= 'a' && uc <= 'z') || (uc >= '0' && uc <= '9')) slug += static_cast<char>(uc);
        if (slug.size() == 20) break;
    }
    return slug.empty() ? "project" : slug;
}

std::string PipelineOrchestrator::ExpandTemplate(std::string command,
                                                 const std::map<std::string, std::string>& values) {
    for (const auto& [key, value] : values) {
        const std::string token = "{" + key + "}";
        for (auto pos = command.find(token); pos != std::string::npos; pos = command.find(token, pos + value.size())) {
            command.replace(pos, token.size(), value);
        }
    }
    return command;
}

void PipelineOrchestrator::SetStage(RunContext& ctx, PipelineStage stage) {
    ctx.ThrowIfCancelled();
    ctx.run.stage = stage;
    Publish(ctx);
    std::cout << "[Orchestrator] " << ctx.run.id << " -> " << StageToString(stage) << std::endl;
}

void PipelineOrchestrator::Publish(RunContext& ctx) {
    std::lock_guard<std::mutex> lock(ctx.record->mutex);
    ctx.record->run = ctx.run;
}

StreamObserver PipelineOrchestrator::ObserverFor(const std::shared_ptr<RunEmitter>& emitter) const {
    StreamObserver observer;
    observer.onStart = [emitter](const std::string& file) { (*emitter)(StreamStartEvent{file}); };
    observer.onToken = [emitter](const std::string& file, const std::string& token) {
        (*emitter)(StreamTokenEvent{file, token});
    };
    observer.onEnd = [emitter](const std::string& file, const std::string& content) {
        (*emitter)(StreamEndEvent{file, content});
    };
    return observer;
}

void PipelineOrchestrator::WriteFile(RunContext& ctx, Project& project,
                                     const std::string& path, const std::string& content) {
    try {
        m_repository->writeFile(project, path, content);
    } catch (const InfrastructureError&) {
        throw;
    } catch (const std::exception& e) {
        throw InfrastructureError("Failed to write " + path + ": " + e.what());
    }
    ProjectFile file{content};
    (*ctx.emit)(FileEvent{path, file.DisplaySize(), content});
}

void PipelineOrchestrator::StopProjectServer(const std::string& project) {
    std::optional<ProcessHandle> handle;
    {
        std::lock_guard<std::mutex> lock(m_serversMutex);
        auto it = m_projectServers.find(project);
        if (it != m_projectServers.end()) {
            handle = it->second;
            m_projectServers.erase(it);
        }
    }
    if (!handle) handle = m_supervisor->find(project, ProcessKind::Serve);
    if (handle) {
        std::cout << "[Orchestrator] Stopping dev server of " << project << std::endl;
        m_supervisor->stop(*handle);
    }
}

int PipelineOrchestrator::PortFor(const std::string& project) {
    std::lock_guard<std::mutex> lock(m_serversMutex);
    auto it = m_ports.find(project);
    if (it != m_ports.end()) return it->second;

    std::set<int> used;
    for (const auto& [name, port] : m_ports) {
        (void)name;
        used.insert(port);
    }
    for (int port = m_settings.devServerPort; port < m_settings.devServerPort + m_settings.devServerPortSpan; ++port) {
        if (!used.count(port)) {
            m_ports[project] = port;
            return port;
        }
    }
    throw InfrastructureError("No free dev server port left for " + project);
}

// --- Stages ------------------------------------------------------------------

SiteSpecification PipelineOrchestrator::Enrich(RunContext& ctx, const BuildRequest& request) {
    const int attempts = std::max(1, m_settings.enrichmentAttempts);
    for (int attempt = 1;; ++attempt) {
        ctx.ThrowIfCancelled();
        try {
            return m_enrichment->enrich(request.idea, request.refineModel);
        } catch (const CollaboratorError& e) {
            if (attempt >= attempts || ctx.cancel().isCancelled()) throw;
            ctx.Log("WARN", std::string("Enrichment output unusable, retrying: ") + e.what());
        }
    }
}

void PipelineOrchestrator::EnsureDependencies(RunContext& ctx, Project& project) {
    if (m_repository->hasInstalledDependencies(project)) {
        ctx.Log("INFO", "Dependencies already installed");
        return;
    }

    ctx.Step("install", "active");
    ctx.Progress("Installing dependencies...", 62);
    ctx.Log("INFO", "Installing dependencies: " + m_settings.installCommand);

    ProcessSpec spec;
    spec.project = project.getName();
    spec.kind = ProcessKind::Install;
    spec.command = m_settings.installCommand;
    spec.workingDir = project.getRoot();
    spec.onLine = OutputListener(ctx.emit, "install");

    const ProcessHandle handle = ctx.scope->Start(spec);
    const auto exitCode = m_supervisor->waitForExit(handle, m_settings.installTimeout, &ctx.cancel());
    const std::string tail = Tail(m_supervisor->captureOutput(handle), 5);
    ctx.scope->Stop(handle);

    if (!exitCode) {
        ctx.ThrowIfCancelled();
        throw InfrastructureError("Dependency install timed out after " +
                                  std::to_string(m_settings.installTimeout.count() / 1000) + "s");
    }
    if (*exitCode != 0) {
        throw InfrastructureError("Dependency install failed (exit " + std::to_string(*exitCode) + ")" + tail);
    }
    ctx.Step("install", "done");
}

ProcessHandle PipelineOrchestrator::StartDevServer(RunContext& ctx, const Project& project, std::string& url) {
    ctx.Step("serve", "active");
    ctx.Progress("Starting dev server...", 72);

    const int port = PortFor(project.getName());
    const std::string& host = m_settings.devServerHost;

    ProcessSpec spec;
    spec.project = project.getName();
    spec.kind = ProcessKind::Serve;
    spec.command = ExpandTemplate(m_settings.serveCommand,
                                  {{"port", std::to_string(port)}, {"host", host}});
    spec.workingDir = project.getRoot();
    spec.env = {{"BROWSER", "none"}, {"PORT", std::to_string(port)}};
    spec.port = port;
    spec.onLine = OutputListener(ctx.emit, "serve");

    ctx.Log("INFO", "Starting dev server on :" + std::to_string(port));
    const ProcessHandle handle = ctx.scope->Start(spec);
    ctx.server = handle;

    switch (m_supervisor->waitForPort(host, port, m_settings.portWait, &handle, &ctx.cancel())) {
        case PortWaitResult::Ready:
            break;
        case PortWaitResult::Cancelled:
            throw RunCancelled();
        case PortWaitResult::Timeout:
            throw InfrastructureError("Dev server did not open port " + std::to_string(port) + " within " +
                                      std::to_string(m_settings.portWait.count() / 1000) + "s");
        case PortWaitResult::ProcessExited:
            throw InfrastructureError("Dev server exited before opening port " + std::to_string(port) +
                                      Tail(m_supervisor->captureOutput(handle), 5));
    }

    url = "http://" + host + ":" + std::to_string(port);
    ctx.Log("INFO", "Dev server ready at " + url);
    return handle;
}

void PipelineOrchestrator::RunFixLoop(RunContext& ctx, Project& project, const ProcessHandle& server,
                                      const std::string& url, const std::string& buildModel) {
    ctx.Step("test", "active");
    ctx.Progress("Running tests...", 80);

    auto emitter = ctx.emit;
    FixLoopEnvironment env;
    env.emit = [emitter](const PipelineEvent& event) { (*emitter)(event); };
    env.writeFile = [this, &ctx](Project& p, const std::string& path, const std::string& content) {
        WriteFile(ctx, p, path, content);
    };
    env.serverAlive = [this, server] { return m_supervisor->isAlive(server); };
    env.diagnostics = [this, server] {
        return RepairContext::ErrorLines(m_supervisor->captureOutput(server));
    };
    env.observer = ObserverFor(emitter);

    FixLoopSettings settings;
    settings.maxAttempts = m_settings.maxFixAttempts;
    settings.modelId = buildModel;

    FixLoopController loop(*m_tester, *m_generation, m_errorFilter, settings, env);
    while (!IsFinal(loop.Step(ctx.run, project, url, &ctx.cancel()))) {
        Publish(ctx);
    }
    Publish(ctx);

    switch (loop.state()) {
        case FixLoopState::Passed:
            ctx.Step("test", "done");
            return;
        case FixLoopState::GaveUp:
            throw RunFailure(FailureReason::CodeQuality,
                             "Tests still failing after " + std::to_string(ctx.run.fixAttempts) + " repair attempts",
                             loop.lastErrorMessages());
        default:
            throw RunFailure(loop.abortReason(), loop.abortDetail(), loop.lastErrorMessages());
    }
}

void PipelineOrchestrator::ExecuteBuild(const std::shared_ptr<RunContext>& ctxPtr, const BuildRequest& request) {
    RunContext& ctx = *ctxPtr;
    RunProcessScope scope(*m_supervisor);
    ctx.scope = &scope;

    RunOutcome outcome = Guard(ctx.cancel(), [&](RunOutcome& result) {
        ctx.Log("INFO", "Idea: " + request.idea.substr(0, 90));
        ctx.Log("INFO", "Refine: " + request.refineModel + "   Build: " + request.buildModel);

        SetStage(ctx, PipelineStage::Enriching);
        ctx.Step("refine", "active");
        ctx.Progress("Refining idea...", 8);
        const SiteSpecification spec = Enrich(ctx, request);
        (*ctx.emit)(DetectedEvent{spec.siteType, spec.strategy});
        ctx.Log("INFO", "type=" + spec.siteType + "  strategy=" + spec.strategy);
        ctx.Step("refine", "done");
        ctx.Progress("Specification ready", 18);

        SetStage(ctx, PipelineStage::Generating);
        if (request.targetProject) {
            auto existing = m_repository->load(*request.targetProject);
            if (!existing) throw RunFailure(FailureReason::UserInput, "Project not found: " + *request.targetProject);
            ctx.project = std::move(*existing);
        } else {
            ctx.project = m_repository->create(SlugFor(spec, request.idea));
            if (!m_registry.BindProject(ctx.run.id, ctx.project->getName())) {
                throw RunFailure(FailureReason::Busy, "Project " + ctx.project->getName() + " is locked by another run");
            }
        }
        Project& project = *ctx.project;
        ctx.run.project = project.getName();
        Publish(ctx);

        ctx.priorState = project.getState();
        project.setState(ProjectState::Building);
        m_repository->saveMetadata(project);
        ctx.Log("INFO", "Project directory: " + project.getRoot());

        ctx.Step("build", "active");
        ctx.Progress("Generating components...", 22);
        GenerationContext gen;
        gen.modelId = request.buildModel;
        gen.observer = ObserverFor(ctx.emit);
        gen.cancel = &ctx.cancel();

        auto stream = m_generation->generate(spec, gen);
        while (auto file = stream->next()) {
            ctx.ThrowIfCancelled();
            WriteFile(ctx, project, file->path, file->content);
        }
        ctx.ThrowIfCancelled();
        ctx.run.tokens += stream->usage();
        if (project.getFiles().empty()) throw CollaboratorError("Generation produced no files");
        ctx.Step("build", "done");
        ctx.Progress("Components ready", 55);

        StopProjectServer(project.getName());
        SetStage(ctx, PipelineStage::Installing);
        EnsureDependencies(ctx, project);

        SetStage(ctx, PipelineStage::Serving);
        std::string url;
        const ProcessHandle server = StartDevServer(ctx, project, url);

        SetStage(ctx, PipelineStage::FixLoop);
        RunFixLoop(ctx, project, server, url, request.buildModel);

        try {
            WriteFile(ctx, project, "README.md", Readme(spec, request.idea, project.getName()));
        } catch (const InfrastructureError& e) {
            ctx.Log("WARN", e.what());
        }

        result.success = true;
        result.servingUrl = url;
    });

    Finish(ctx, outcome);
}

void PipelineOrchestrator::ExecuteUpdate(const std::shared_ptr<RunContext>& ctxPtr, const RepromptRequest& request,
                                         Project loaded, const Classification& classification) {
    RunContext& ctx = *ctxPtr;
    RunProcessScope scope(*m_supervisor);
    ctx.scope = &scope;
    ctx.project = std::move(loaded);

    RunOutcome outcome = Guard(ctx.cancel(), [&](RunOutcome& result) {
        Project& project = *ctx.project;
        const Intent intent = classification.intent;

        ctx.Log("INFO", "Updating: " + project.getName());
        ctx.Log("INFO", "Request: " + request.instruction.substr(0, 80));
        ctx.Log("INFO", "Model: " + request.buildModel);
        ctx.Log("INFO", "Intent: " + IntentToString(intent) + " -> " + classification.targetComponent);

        ctx.priorState = project.getState();
        project.setState(ProjectState::Building);
        m_repository->saveMetadata(project);

        SetStage(ctx, PipelineStage::Generating);
        ctx.Step("refine", "active");
        ctx.Progress("Loading project...", 5);
        for (const auto& [path, file] : project.getFiles()) {
            (*ctx.emit)(FileEvent{path, file.DisplaySize(), file.content});
        }
        const auto components = project.ComponentNames();
        ctx.Log("INFO", "Loaded " + std::to_string(project.getFiles().size()) + " files | " +
                        std::to_string(components.size()) + " components");
        ctx.Step("refine", "done");
        ctx.Progress("Analysing request...", 15);

        const std::string& target = classification.targetComponent;
        const std::string path = Project::ComponentPath(target);
        const bool isNew = !project.hasFile(path);

        ctx.Step("build", "active");
        ctx.Progress("Generating " + target + "...", 25);
        ctx.Log("INFO", (isNew ? "Creating new component: " : "Updating: ") + path);

        ComponentRequest component;
        component.componentName = target;
        component.instruction = request.instruction;
        component.existingCode = project.getFileContent(path).value_or("");
        component.codebaseContext = RepairContext::CodebaseSummary(project);
        component.intent = intent;
        component.isNew = isNew;

        GenerationContext gen;
        gen.modelId = request.buildModel;
        gen.observer = ObserverFor(ctx.emit);
        gen.cancel = &ctx.cancel();

        const GenerationResult generated = m_generation->generateComponent(component, gen);
        ctx.ThrowIfCancelled();
        ctx.run.tokens += generated.usage;
        WriteFile(ctx, project, path, generated.content);

        if (isNew) {
            const auto app = project.getFileContent(Project::kCompositionRoot);
            if (!app) {
                ctx.Log("WARN", std::string(Project::kCompositionRoot) + " missing, " + target + " not mounted");
            } else if (auto injected = ComponentInjector::Inject(*app, target)) {
                WriteFile(ctx, project, Project::kCompositionRoot, *injected);
                ctx.Log("INFO", "Mounted " + target + " in " + Project::kCompositionRoot);
            }
        }
        ctx.Step("build", "done");
        ctx.Progress("Components updated", 58);

        if (intent == Intent::Patch) {
            if (auto live = ProjectServer(project.getName()); live && live->port) {
                SetStage(ctx, PipelineStage::Serving);
                result.servingUrl = "http://" + m_settings.devServerHost + ":" + std::to_string(*live->port);
                ctx.Log("INFO", "Patch applied, live reload picks it up");
            } else {
                SetStage(ctx, PipelineStage::Installing);
                EnsureDependencies(ctx, project);
                SetStage(ctx, PipelineStage::Serving);
                StartDevServer(ctx, project, result.servingUrl);
            }
            ctx.Step("serve", "done");
            ctx.Step("test", "done");
            result.success = true;
            return;
        }

        StopProjectServer(project.getName());
        SetStage(ctx, PipelineStage::Installing);
        EnsureDependencies(ctx, project);

        SetStage(ctx, PipelineStage::Serving);
        std::string url;
        const ProcessHandle server = StartDevServer(ctx, project, url);

        SetStage(ctx, PipelineStage::FixLoop);
        RunFixLoop(ctx, project, server, url, request.buildModel);

        result.success = true;
        result.servingUrl = url;
    });

    Finish(ctx, outcome);
}

void PipelineOrchestrator::Finish(RunContext& ctx, RunOutcome outcome) {
    const bool cancelled = !outcome.success && outcome.reason == FailureReason::Cancelled;

    if (outcome.success && ctx.server && ctx.scope && m_settings.keepServerAfterRun &&
        m_supervisor->isAlive(*ctx.server)) {
        m_supervisor->detachListener(*ctx.server);
        ctx.scope->Release(*ctx.server);
        std::lock_guard<std::mutex> lock(m_serversMutex);
        m_projectServers[ctx.project->getName()] = *ctx.server;
    }
    if (ctx.scope) ctx.scope->StopAll();

    if (ctx.project) {
        Project& project = *ctx.project;
        if (outcome.success) {
            project.setState(ProjectState::Ready);
            project.markSuccessfulBuild(std::chrono::system_clock::now());
        } else if (cancelled && ctx.priorState != ProjectState::New) {
            project.setState(ctx.priorState);
        } else {
            project.setState(ProjectState::Failed);
        }
        try {
            m_repository->saveMetadata(project);
        } catch (const std::exception& e) {
            std::cerr << "[Orchestrator] Failed to save metadata of " << project.getName() << ": " << e.what() << std::endl;
        }
    }

    if (outcome.success) {
        ctx.Step("serve", "done");
        ctx.Progress("Done!", 100);
        ctx.Log("INFO", "Live at " + outcome.servingUrl);
    } else if (!cancelled) {
        if (!ctx.currentStep.empty()) ctx.Step(ctx.currentStep, "error");
        ctx.Log("ERROR", outcome.detail);
    }

    ctx.run.stage = outcome.success ? PipelineStage::Done
                                    : (cancelled ? PipelineStage::Cancelled : PipelineStage::Failed);
    ctx.run.outcome = outcome;
    Publish(ctx);
    m_registry.Release(ctx.run.id);

    std::cout << "[Orchestrator] " << ctx.run.id << " finished: " << StageToString(ctx.run.stage)
              << (outcome.success ? "" : " (" + FailureReasonToString(outcome.reason) + ": " + outcome.detail + ")")
              << std::endl;

    if (outcome.success) {
        (*ctx.emit)(DoneEvent{ctx.run.id, ctx.run.project, outcome.servingUrl, ctx.run.fixAttempts});
    } else if (cancelled) {
        (*ctx.emit)(CancelledEvent{ctx.run.id, ctx.run.project});
    } else {
        ErrorEvent error;
        error.runId = ctx.run.id;
        error.project = ctx.run.project;
        error.reason = outcome.reason;
        error.text = outcome.detail;
        error.errors = outcome.lastErrors;
        (*ctx.emit)(error);
    }
    ctx.emit->Close();
}

} // namespace webforge::application
