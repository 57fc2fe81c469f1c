/**
 * @file ProcessSupervisor.hpp
 * @brief Interface for supervising long-running child processes.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "domain/CancellationToken.hpp"
#include "domain/Errors.hpp"

namespace webforge::domain {

/**
 * @enum ProcessKind
 * @brief What a supervised process does for its project.
 */
enum class ProcessKind {
    Install,
    Serve,
    Test
};

inline std::string ProcessKindToString(ProcessKind kind) {
    switch (kind) {
        case ProcessKind::Install: return "install";
        case ProcessKind::Serve: return "serve";
        case ProcessKind::Test: return "test";
    }
    return "install";
}

/** @brief Everything needed to launch a process. */
struct ProcessSpec {
    std::string project;
    ProcessKind kind = ProcessKind::Install;
    std::string command;       ///< Shell command line, run through /bin/sh -c.
    std::string workingDir;
    std::map<std::string, std::string> env; ///< Added to the inherited environment.
    std::optional<int> port;
    std::function<void(const std::string& line)> onLine; ///< Optional output listener.
};

/**
 * @struct ProcessHandle
 * @brief Caller-side token for a supervised process.
 *
 * The supervisor owns the process state; the handle only identifies it.
 */
struct ProcessHandle {
    std::uint64_t id = 0;
    std::string project;
    ProcessKind kind = ProcessKind::Install;
    int pid = -1;
    std::optional<int> port;

    bool operator==(const ProcessHandle& other) const { return id == other.id; }
};

enum class PortWaitResult {
    Ready,
    Timeout,        ///< Recoverable; the process may still come up.
    ProcessExited,  ///< Fatal for the run.
    Cancelled
};

/** @brief Observable state of a handle (alive flag, exit code). */
struct ProcessStatus {
    bool alive = false;
    std::optional<int> exitCode;
};

/** @brief Raised when a project+kind slot is already occupied. */
class ProcessAlreadyRunning : public InfrastructureError {
public:
    using InfrastructureError::InfrastructureError;
};

/**
 * @class ProcessSupervisor
 * @brief Starts, watches and terminates child processes keyed by project+kind.
 *
 * Implementations must be safe under concurrent calls for different projects.
 */
class ProcessSupervisor {
public:
    using Duration = std::chrono::milliseconds;

    virtual ~ProcessSupervisor() = default;

    /**
     * @brief Launches a process.
     * @throws ProcessAlreadyRunning if the project+kind slot is live.
     * @throws InfrastructureError if the process could not be spawned.
     */
    virtual ProcessHandle start(const ProcessSpec& spec) = 0;

    /**
     * @brief Polls a TCP port with bounded backoff until it accepts connections.
     * @param watch When set, a dead process short-circuits to ProcessExited.
     */
    virtual PortWaitResult waitForPort(const std::string& host, int port, Duration timeout,
                                       const ProcessHandle* watch = nullptr,
                                       const CancellationToken* cancel = nullptr) = 0;

    /** @brief Waits for exit; nullopt on timeout or cancellation. */
    virtual std::optional<int> waitForExit(const ProcessHandle& handle, Duration timeout,
                                           const CancellationToken* cancel = nullptr) = 0;

    /** @brief Graceful then forced termination. Idempotent. */
    virtual void stop(const ProcessHandle& handle) = 0;

    /** @brief Recent output lines, oldest first. */
    virtual std::vector<std::string> captureOutput(const ProcessHandle& handle) const = 0;

    virtual ProcessStatus status(const ProcessHandle& handle) const = 0;

    bool isAlive(const ProcessHandle& handle) const { return status(handle).alive; }

    /** @brief The live process of a project+kind slot, if any. */
    virtual std::optional<ProcessHandle> find(const std::string& project, ProcessKind kind) const = 0;

    /** @brief Drops the output listener of a handle (used on ownership hand-over). */
    virtual void detachListener(const ProcessHandle& handle) = 0;

    /** @brief Force-terminates every tracked process. */
    virtual void shutdown() = 0;
};

} // namespace webforge::domain
