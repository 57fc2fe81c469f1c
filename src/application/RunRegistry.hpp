/**
 * @file RunRegistry.hpp
 * @brief Admission control: per-project locks and the global run limit.
 */

#pragma once

#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "domain/CancellationToken.hpp"
#include "domain/PipelineRun.hpp"

namespace webforge::application {

/**
 * @struct RunRecord
 * @brief Shared state of one run: the run itself and its cancellation token.
 *
 * The run thread mutates `run` under `mutex`; readers take snapshots.
 */
struct RunRecord {
    mutable std::mutex mutex;
    domain::PipelineRun run;
    domain::CancellationToken cancel;

    domain::PipelineRun snapshot() const {
        std::lock_guard<std::mutex> lock(mutex);
        return run;
    }
};

enum class Admission {
    Admitted,
    Busy,       ///< The project already has an active run.
    AtCapacity  ///< maxConcurrentRuns active runs.
};

/**
 * @class RunRegistry
 * @brief Registry of active runs keyed by run id and by project.
 *
 * A project is locked from admission (or binding, for fresh builds whose
 * name is only known after enrichment) until `Release`.
 */
class RunRegistry {
public:
    explicit RunRegistry(int maxConcurrentRuns);

    /**
     * @brief Admits a run atomically.
     * @param project Project to lock now; nullopt for a fresh build.
     */
    Admission Admit(const std::shared_ptr<RunRecord>& record, const std::optional<std::string>& project);

    /** @brief Locks a project for an already admitted run. False if another run holds it. */
    bool BindProject(const std::string& runId, const std::string& project);

    /**
     * @brief Locks a project for work that is not a run (an import).
     * The holder takes no run slot. False if the project is already locked.
     */
    bool LockProject(const std::string& project, const std::string& holder);
    void UnlockProject(const std::string& project, const std::string& holder);

    /** @brief Frees the run's slot and project lock; the record stays queryable. */
    void Release(const std::string& runId);

    std::shared_ptr<RunRecord> Find(const std::string& runId) const;
    std::shared_ptr<RunRecord> ActiveFor(const std::string& project) const;
    /** @brief Active run of the project, else the most recent finished one. */
    std::shared_ptr<RunRecord> LastFor(const std::string& project) const;

    std::vector<std::shared_ptr<RunRecord>> Active() const;
    size_t ActiveCount() const;
    bool IsLocked(const std::string& project) const;

    int maxConcurrentRuns() const { return m_maxConcurrentRuns; }

private:
    static constexpr size_t kFinishedHistory = 64;

    int m_maxConcurrentRuns;
    mutable std::mutex m_mutex;
    std::map<std::string, std::shared_ptr<RunRecord>> m_active;   // runId -> record
    std::map<std::string, std::string> m_projectLocks;            // project -> runId
    std::map<std::string, std::shared_ptr<RunRecord>> m_lastByProject;
    std::deque<std::shared_ptr<RunRecord>> m_finished;
};

} // namespace webforge::application
