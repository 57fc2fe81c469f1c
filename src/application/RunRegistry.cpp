#include "application/RunRegistry.hpp"

#include <algorithm>

namespace webforge::application {

RunRegistry::RunRegistry(int maxConcurrentRuns)
    : m_maxConcurrentRuns(std::max(1, maxConcurrentRuns)) {}

Admission RunRegistry::Admit(const std::shared_ptr<RunRecord>& record,
                             const std::optional<std::string>& project) {
    const std::string runId = record->snapshot().id;

    std::lock_guard<std::mutex> lock(m_mutex);
    if (project && m_projectLocks.count(*project)) {
        return Admission::Busy;
    }
    if (m_active.size() >= static_cast<size_t>(m_maxConcurrentRuns)) {
        return Admission::AtCapacity;
    }
    m_active[runId] = record;
    if (project) {
        m_projectLocks[*project] = runId;
        m_lastByProject[*project] = record;
    }
    return Admission::Admitted;
}

bool RunRegistry::BindProject(const std::string& runId, const std::string& project) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto active = m_active.find(runId);
    if (active == m_active.end()) return false;

    auto it = m_projectLocks.find(project);
    if (it != m_projectLocks.end()) return it->second == runId;

    m_projectLocks[project] = runId;
    m_lastByProject[project] = active->second;
    return true;
}

bool RunRegistry::LockProject(const std::string& project, const std::string& holder) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_projectLocks.emplace(project, holder).second;
}

void RunRegistry::UnlockProject(const std::string& project, const std::string& holder) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_projectLocks.find(project);
    if (it != m_projectLocks.end() && it->second == holder) m_projectLocks.erase(it);
}

void RunRegistry::Release(const std::string& runId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_active.find(runId);
    if (it == m_active.end()) return;

    m_finished.push_back(it->second);
    if (m_finished.size() > kFinishedHistory) m_finished.pop_front();
    m_active.erase(it);

    for (auto lockIt = m_projectLocks.begin(); lockIt != m_projectLocks.end();) {
        if (lockIt->second == runId) {
            lockIt = m_projectLocks.erase(lockIt);
        } else {
            ++lockIt;
        }
    }
}

std::shared_ptr<RunRecord> RunRegistry::Find(const std::string& runId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_active.find(runId);
    if (it != m_active.end()) return it->second;
    for (const auto& record : m_finished) {
        if (record->snapshot().id == runId) return record;
    }
    return nullptr;
}

std::shared_ptr<RunRecord> RunRegistry::ActiveFor(const std::string& project) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_projectLocks.find(project);
    if (it == m_projectLocks.end()) return nullptr;
    auto active = m_active.find(it->second);
    return active == m_active.end() ? nullptr : active->second;
}

std::shared_ptr<RunRecord> RunRegistry::LastFor(const std::string& project) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_lastByProject.find(project);
    return it == m_lastByProject.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<RunRecord>> RunRegistry::Active() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::shared_ptr<RunRecord>> out;
    for (const auto& [id, record] : m_active) {
        (void)id;
        out.push_back(record);
    }
    return out;
}

size_t RunRegistry::ActiveCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_active.size();
}

bool RunRegistry::IsLocked(const std::string& project) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_projectLocks.count(project) > 0;
}

} // namespace webforge::application
