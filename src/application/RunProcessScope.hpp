/**
 * @file RunProcessScope.hpp
 * @brief RAII ownership of the processes a pipeline run starts.
 */

#pragma once

#include <algorithm>
#include <iostream>
#include <vector>

#include "domain/ProcessSupervisor.hpp"

namespace webforge::application {

/**
 * @class RunProcessScope
 * @brief Stops every owned handle on `StopAll()` or destruction.
 *
 * `Release` removes a handle from the scope (dev-server hand-over on success).
 */
class RunProcessScope {
public:
    explicit RunProcessScope(domain::ProcessSupervisor& supervisor)
        : m_supervisor(supervisor) {}

    ~RunProcessScope() { StopAll(); }

    RunProcessScope(const RunProcessScope&) = delete;
    RunProcessScope& operator=(const RunProcessScope&) = delete;

    domain::ProcessHandle Start(const domain::ProcessSpec& spec) {
        auto handle = m_supervisor.start(spec);
        m_owned.push_back(handle);
        m_started.push_back(handle);
        return handle;
    }

    /** @brief Stops one owned handle now. */
    void Stop(const domain::ProcessHandle& handle) {
        StopQuietly(handle);
        Release(handle);
    }

    void Release(const domain::ProcessHandle& handle) {
        m_owned.erase(std::remove(m_owned.begin(), m_owned.end(), handle), m_owned.end());
    }

    void StopAll() {
        for (const auto& handle : m_owned) StopQuietly(handle);
        m_owned.clear();
    }

    const std::vector<domain::ProcessHandle>& owned() const { return m_owned; }
    const std::vector<domain::ProcessHandle>& started() const { return m_started; }

private:
    void StopQuietly(const domain::ProcessHandle& handle) {
        try {
            m_supervisor.stop(handle);
        } catch (const std::exception& e) {
            std::cerr << "[RunProcessScope] Failed to stop pid " << handle.pid << ": " << e.what() << std::endl;
        }
    }

    domain::ProcessSupervisor& m_supervisor;
    std::vector<domain::ProcessHandle> m_owned;
    std::vector<domain::ProcessHandle> m_started;
};

} // namespace webforge::application
