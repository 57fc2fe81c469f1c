#include "application/FixLoopController.hpp"

#include "application/RepairContext.hpp"

#include <iostream>
#include <utility>

namespace webforge::application {

using namespace webforge::domain;

std::string FixLoopStateToString(FixLoopState state) {
    switch (state) {
        case FixLoopState::Testing: return "testing";
        case FixLoopState::Failed: return "failed";
        case FixLoopState::Repairing: return "repairing";
        case FixLoopState::Passed: return "passed";
        case FixLoopState::GaveUp: return "gave_up";
        case FixLoopState::Aborted: return "aborted";
    }
    return "testing";
}

FixLoopController::FixLoopController(TestService& tester,
                                     GenerationService& generator,
                                     const ErrorFilter& filter,
                                     FixLoopSettings settings,
                                     FixLoopEnvironment env)
    : m_tester(tester),
      m_generator(generator),
      m_filter(filter),
      m_settings(std::move(settings)),
      m_env(std::move(env)) {}

std::vector<std::string> FixLoopController::lastErrorMessages() const {
    std::vector<std::string> messages;
    for (const auto& e : m_lastErrors) messages.push_back(e.message);
    return messages;
}

void FixLoopController::Log(const std::string& level, const std::string& text) {
    if (m_env.emit) m_env.emit(LogEvent{level, text});
}

FixLoopState FixLoopController::Abort(FailureReason reason, const std::string& detail) {
    m_abortReason = reason;
    m_abortDetail = detail;
    std::cerr << "[FixLoop] Aborted: " << detail << std::endl;
    return FixLoopState::Aborted;
}

FixLoopState FixLoopController::Step(PipelineRun& run, Project& project,
                                     const std::string& servingUrl,
                                     const CancellationToken* cancel) {
    if (cancel && cancel->isCancelled()) throw RunCancelled();

    switch (m_state) {
        case FixLoopState::Testing:
            m_state = DoTest(run, project, servingUrl, cancel);
            break;
        case FixLoopState::Failed:
            if (run.fixAttempts >= m_settings.maxAttempts) {
                Log("WARN", "Max fix attempts (" + std::to_string(m_settings.maxAttempts) + ") reached");
                m_state = FixLoopState::GaveUp;
            } else {
                m_state = FixLoopState::Repairing;
            }
            break;
        case FixLoopState::Repairing:
            m_state = DoRepair(run, project, cancel);
            break;
        case FixLoopState::Passed:
        case FixLoopState::GaveUp:
        case FixLoopState::Aborted:
            break;
    }
    return m_state;
}

FixLoopState FixLoopController::Run(PipelineRun& run, Project& project,
                                    const std::string& servingUrl,
                                    const CancellationToken* cancel) {
    while (!IsFinal(m_state)) {
        Step(run, project, servingUrl, cancel);
    }
    return m_state;
}

FixLoopState FixLoopController::DoTest(PipelineRun& run, Project& project,
                                       const std::string& servingUrl,
                                       const CancellationToken* cancel) {
    if (m_env.serverAlive && !m_env.serverAlive()) {
        return Abort(FailureReason::Infrastructure, "Dev server exited during the test loop");
    }

    const int testRun = run.fixAttempts + 1;
    if (m_env.emit) m_env.emit(TestRunEvent{testRun});
    Log("INFO", "Test run #" + std::to_string(testRun));

    TestReport report;
    try {
        TestTarget target;
        target.servingUrl = servingUrl;
        target.project = project.getName();
        target.projectRoot = project.getRoot();
        target.cancel = cancel;
        report = m_tester.runTests(target);
    } catch (const InfrastructureError& e) {
        if (cancel && cancel->isCancelled()) throw RunCancelled();
        return Abort(FailureReason::Infrastructure, std::string("Test runner failed: ") + e.what());
    }
    if (cancel && cancel->isCancelled()) throw RunCancelled();

    auto actionable = m_filter.Filter(report);
    if (actionable.empty()) {
        if (!report.passed) {
            Log("INFO", "Only non-blocking console noise reported (" +
                        std::to_string(report.errors.size()) + " ignored)");
        }
        Log("INFO", "All tests passed");
        m_lastErrors.clear();
        return FixLoopState::Passed;
    }

    m_lastErrors = std::move(actionable);
    for (const auto& e : m_lastErrors) {
        Log("WARN", "JS error: " + e.message.substr(0, 160));
    }
    return FixLoopState::Failed;
}

FixLoopState FixLoopController::DoRepair(PipelineRun& run, Project& project,
                                         const CancellationToken* cancel) {
    ++run.fixAttempts;

    std::vector<std::string> shown;
    for (size_t i = 0; i < m_lastErrors.size() && i < 5; ++i) shown.push_back(m_lastErrors[i].message);
    if (m_env.emit) m_env.emit(TestFixingEvent{run.fixAttempts, shown});
    Log("INFO", "Fixing (attempt " + std::to_string(run.fixAttempts) + "/" +
                std::to_string(m_settings.maxAttempts) + ")");

    std::vector<std::string> diagnostics;
    if (m_env.diagnostics) diagnostics = m_env.diagnostics();
    const std::string errorText = RepairContext::Compose(m_lastErrors, diagnostics);

    auto broken = RepairContext::LocateBrokenFiles(errorText, project);
    if (broken.empty()) {
        broken = RepairContext::AllComponentFiles(project);
        Log("INFO", "No specific file found, repairing all " + std::to_string(broken.size()) + " components");
    }

    const std::string codebase = RepairContext::CodebaseSummary(project);

    for (const auto& path : broken) {
        if (cancel && cancel->isCancelled()) throw RunCancelled();

        RepairRequest request;
        request.filePath = path;
        request.currentContent = project.getFileContent(path).value_or("");
        request.errorContext = RepairContext::ErrorsForFile(errorText, path);
        request.codebaseContext = codebase;

        GenerationContext ctx;
        ctx.modelId = m_settings.modelId;
        ctx.observer = m_env.observer;
        ctx.cancel = cancel;

        GenerationResult result;
        try {
            result = m_generator.repair(request, ctx);
        } catch (const CollaboratorError& e) {
            if (cancel && cancel->isCancelled()) throw RunCancelled();
            return Abort(FailureReason::Collaborator, std::string("Repair of ") + path + " failed: " + e.what());
        } catch (const InfrastructureError& e) {
            if (cancel && cancel->isCancelled()) throw RunCancelled();
            return Abort(FailureReason::Infrastructure, std::string("Repair of ") + path + " failed: " + e.what());
        }
        run.tokens += result.usage;

        if (m_env.writeFile) m_env.writeFile(project, path, result.content);
        Log("INFO", "Saved " + path + " (" + std::to_string(result.content.size()) + "B)");
    }

    return FixLoopState::Testing;
}

} // namespace webforge::application
