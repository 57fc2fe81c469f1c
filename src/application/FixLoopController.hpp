/**
 * @file FixLoopController.hpp
 * @brief Bounded test/repair state machine run after a project is served.
 */

#pragma once

#include <functional>
#include <string>
#include <vector>

#include "application/ErrorFilter.hpp"
#include "domain/CancellationToken.hpp"
#include "domain/GenerationService.hpp"
#include "domain/PipelineEvent.hpp"
#include "domain/PipelineRun.hpp"
#include "domain/Project.hpp"
#include "domain/TestService.hpp"

namespace webforge::application {

/**
 * @enum FixLoopState
 * @brief Testing -> Passed | Failed -> Repairing -> Testing ... -> GaveUp, or Aborted.
 */
enum class FixLoopState {
    Testing,
    Failed,
    Repairing,
    Passed,
    GaveUp,
    Aborted
};

std::string FixLoopStateToString(FixLoopState state);

inline bool IsFinal(FixLoopState state) {
    return state == FixLoopState::Passed || state == FixLoopState::GaveUp ||
           state == FixLoopState::Aborted;
}

struct FixLoopSettings {
    int maxAttempts = 3;
    std::string modelId;
};

/**
 * @struct FixLoopEnvironment
 * @brief Callbacks into the run that owns the loop.
 */
struct FixLoopEnvironment {
    domain::EventSink emit;
    /** Writes a repaired file to disk and into the project. */
    std::function<void(domain::Project&, const std::string& path, const std::string& content)> writeFile;
    /** False once the dev server died; checked before every test run. */
    std::function<bool()> serverAlive;
    /** Extra diagnostics (dev server error output) appended to repair context. */
    std::function<std::vector<std::string>()> diagnostics;
    domain::StreamObserver observer;
};

/**
 * @class FixLoopController
 * @brief Explicit state machine; `Step()` advances exactly one transition.
 *
 * The attempt counter is the owning run's `fixAttempts` and never exceeds
 * `maxAttempts`. Collaborator errors during a repair abort the loop with
 * reason `Collaborator`; runner or server failures abort with `Infrastructure`
 * without consuming an attempt.
 */
class FixLoopController {
public:
    FixLoopController(domain::TestService& tester,
                      domain::GenerationService& generator,
                      const ErrorFilter& filter,
                      FixLoopSettings settings,
                      FixLoopEnvironment env);

    /**
     * @brief Performs one transition.
     * @throws domain::RunCancelled when the token is set.
     */
    FixLoopState Step(domain::PipelineRun& run, domain::Project& project,
                      const std::string& servingUrl, const domain::CancellationToken* cancel);

    /** @brief Steps until a final state. */
    FixLoopState Run(domain::PipelineRun& run, domain::Project& project,
                     const std::string& servingUrl, const domain::CancellationToken* cancel);

    FixLoopState state() const { return m_state; }
    const std::vector<domain::TestError>& lastErrors() const { return m_lastErrors; }
    std::vector<std::string> lastErrorMessages() const;

    /** @brief Failure reason of an Aborted loop. */
    domain::FailureReason abortReason() const { return m_abortReason; }
    const std::string& abortDetail() const { return m_abortDetail; }

private:
    FixLoopState DoTest(domain::PipelineRun& run, domain::Project& project,
                        const std::string& servingUrl, const domain::CancellationToken* cancel);
    FixLoopState DoRepair(domain::PipelineRun& run, domain::Project& project,
                          const domain::CancellationToken* cancel);
    FixLoopState Abort(domain::FailureReason reason, const std::string& detail);
    void Log(const std::string& level, const std::string& text);

    domain::TestService& m_tester;
    domain::GenerationService& m_generator;
    const ErrorFilter& m_filter;
    FixLoopSettings m_settings;
    FixLoopEnvironment m_env;

    FixLoopState m_state = FixLoopState::Testing;
    std::vector<domain::TestError> m_lastErrors;
    domain::FailureReason m_abortReason = domain::FailureReason::Infrastructure;
    std::string m_abortDetail;
};

} // namespace webforge::application
