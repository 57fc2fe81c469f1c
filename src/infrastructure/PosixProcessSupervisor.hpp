/**
 * @file PosixProcessSupervisor.hpp
 * @brief fork/exec implementation of the ProcessSupervisor interface.
 */

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

#include "domain/ProcessSupervisor.hpp"

namespace webforge::infrastructure {

/**
 * @class PosixProcessSupervisor
 * @brief Runs each command through /bin/sh -c in its own process group.
 *
 * Stdout and stderr are merged into one pipe drained by a reader thread per
 * process. The reader keeps the last lines in a ring buffer, forwards them to
 * the optional listener and reaps the child when it exits.
 *
 * Children are not tied to the thread that started them: a dev server handed
 * over after its run keeps serving until stop() or shutdown(). stop() signals
 * the whole process group, including members left behind by a dead leader.
 */
class PosixProcessSupervisor : public domain::ProcessSupervisor {
public:
    explicit PosixProcessSupervisor(Duration stopGrace = std::chrono::milliseconds(3000),
                                    size_t ringCapacity = 200);
    ~PosixProcessSupervisor() override;

    PosixProcessSupervisor(const PosixProcessSupervisor&) = delete;
    PosixProcessSupervisor& operator=(const PosixProcessSupervisor&) = delete;

    domain::ProcessHandle start(const domain::ProcessSpec& spec) override;

    domain::PortWaitResult waitForPort(const std::string& host, int port, Duration timeout,
                                       const domain::ProcessHandle* watch = nullptr,
                                       const domain::CancellationToken* cancel = nullptr) override;

    std::optional<int> waitForExit(const domain::ProcessHandle& handle, Duration timeout,
                                   const domain::CancellationToken* cancel = nullptr) override;

    void stop(const domain::ProcessHandle& handle) override;

    std::vector<std::string> captureOutput(const domain::ProcessHandle& handle) const override;

    domain::ProcessStatus status(const domain::ProcessHandle& handle) const override;

    std::optional<domain::ProcessHandle> find(const std::string& project,
                                              domain::ProcessKind kind) const override;

    void detachListener(const domain::ProcessHandle& handle) override;

    void shutdown() override;

    /** @brief True when a TCP connection to host:port succeeds right now. */
    static bool ProbePort(const std::string& host, int port);

private:
    struct Entry {
        domain::ProcessHandle handle;

        mutable std::mutex mutex;
        std::condition_variable exited;
        std::deque<std::string> ring;
        bool alive = true;          ///< The group leader has not been reaped yet.
        bool groupReleased = false; ///< stop() saw the whole group gone; its pgid may be reused.
        std::optional<int> exitCode;

        std::mutex listenerMutex;
        std::function<void(const std::string&)> listener;

        std::thread reader;
    };

    void ReadLoop(std::shared_ptr<Entry> entry, int fd);
    void PushLine(Entry& entry, const std::string& line);
    std::shared_ptr<Entry> Lookup(const domain::ProcessHandle& handle) const;
    /** @brief Waits until the leader is reaped and no group member is left. */
    static bool WaitGroupExit(Entry& entry, std::unique_lock<std::mutex>& lock, Duration grace);
    void PruneFinished();
    static void JoinReader(Entry& entry);
    static std::string SlotKey(const std::string& project, domain::ProcessKind kind);

    Duration m_stopGrace;
    size_t m_ringCapacity;

    mutable std::mutex m_mutex;
    std::map<std::uint64_t, std::shared_ptr<Entry>> m_entries;
    std::map<std::string, std::uint64_t> m_slots;
    std::uint64_t m_nextId = 0;
    bool m_shutdown = false;
};

} // namespace webforge::infrastructure
