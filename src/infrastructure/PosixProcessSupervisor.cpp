/**
 * @file PosixProcessSupervisor.cpp
 * @brief Implementation of PosixProcessSupervisor.
 */

#include "infrastructure/PosixProcessSupervisor.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <iostream>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace webforge::infrastructure {

using namespace webforge::domain;

namespace {

constexpr size_t kMaxLineLength = 4096;
constexpr size_t kPruneThreshold = 128;
constexpr auto kPollInterval = std::chrono::milliseconds(100);
constexpr auto kKillWait = std::chrono::seconds(5);
constexpr auto kGroupPollInterval = std::chrono::milliseconds(20);
constexpr auto kBackoffStart = std::chrono::milliseconds(100);
constexpr auto kBackoffCap = std::chrono::milliseconds(1000);

std::vector<std::string> BuildEnvironment(const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> env;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string item(*entry);
        const auto eq = item.find('=');
        if (eq != std::string::npos && overrides.count(item.substr(0, eq))) continue;
        env.push_back(std::move(item));
    }
    for (const auto& [key, value] : overrides) {
        env.push_back(key + "=" + value);
    }
    return env;
}

int DecodeWaitStatus(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

// Members of the group may outlive the leader; zombies still count until reaped.
bool GroupAlive(pid_t pgid) {
    return ::killpg(pgid, 0) == 0;
}

} // namespace

PosixProcessSupervisor::PosixProcessSupervisor(Duration stopGrace, size_t ringCapacity)
    : m_stopGrace(stopGrace), m_ringCapacity(ringCapacity) {}

PosixProcessSupervisor::~PosixProcessSupervisor() {
    shutdown();
    std::map<std::uint64_t, std::shared_ptr<Entry>> entries;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        entries = m_entries;
    }
    for (auto& [id, entry] : entries) {
        JoinReader(*entry);
    }
}

std::string PosixProcessSupervisor::SlotKey(const std::string& project, ProcessKind kind) {
    return project + "#" + ProcessKindToString(kind);
}

ProcessHandle PosixProcessSupervisor::start(const ProcessSpec& spec) {
    if (spec.command.empty()) {
        throw InfrastructureError("Empty command for " + ProcessKindToString(spec.kind) +
                                  " of " + spec.project);
    }
    PruneFinished();

    // Prepared before fork; the child must not allocate.
    std::vector<std::string> envStrings = BuildEnvironment(spec.env);
    std::vector<char*> envp;
    envp.reserve(envStrings.size() + 1);
    for (auto& item : envStrings) envp.push_back(item.data());
    envp.push_back(nullptr);

    std::string shell = "/bin/sh";
    std::string dashC = "-c";
    std::string command = spec.command;
    char* argv[] = {shell.data(), dashC.data(), command.data(), nullptr};
    const std::string workingDir = spec.workingDir;

    const std::string key = SlotKey(spec.project, spec.kind);
    auto entry = std::make_shared<Entry>();
    int readFd = -1;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutdown) {
            throw InfrastructureError("Process supervisor is shut down");
        }
        auto slot = m_slots.find(key);
        if (slot != m_slots.end()) {
            auto existing = m_entries.find(slot->second);
            if (existing != m_entries.end()) {
                std::lock_guard<std::mutex> entryLock(existing->second->mutex);
                if (existing->second->alive) {
                    throw ProcessAlreadyRunning("A " + ProcessKindToString(spec.kind) +
                                                " process is already running for " + spec.project);
                }
            }
        }

        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) != 0) {
            throw InfrastructureError(std::string("pipe() failed: ") + std::strerror(errno));
        }

        const pid_t pid = ::fork();
        if (pid < 0) {
            const int err = errno;
            ::close(fds[0]);
            ::close(fds[1]);
            throw InfrastructureError(std::string("fork() failed: ") + std::strerror(err));
        }

        if (pid == 0) {
            ::setpgid(0, 0);
            const int devNull = ::open("/dev/null", O_RDONLY);
            if (devNull >= 0) ::dup2(devNull, STDIN_FILENO);
            ::dup2(fds[1], STDOUT_FILENO);
            ::dup2(fds[1], STDERR_FILENO);
            if (!workingDir.empty() && ::chdir(workingDir.c_str()) != 0) {
                _exit(127);
            }
            ::execve("/bin/sh", argv, envp.data());
            _exit(127);
        }

        ::setpgid(pid, pid);
        ::close(fds[1]);
        readFd = fds[0];

        entry->handle.id = ++m_nextId;
        entry->handle.project = spec.project;
        entry->handle.kind = spec.kind;
        entry->handle.pid = pid;
        entry->handle.port = spec.port;
        entry->listener = spec.onLine;

        m_entries[entry->handle.id] = entry;
        m_slots[key] = entry->handle.id;
    }

    entry->reader = std::thread(&PosixProcessSupervisor::ReadLoop, this, entry, readFd);

    std::cout << "[ProcessSupervisor] Started " << ProcessKindToString(spec.kind)
              << " for " << spec.project << " (pid " << entry->handle.pid << "): "
              << spec.command << std::endl;
    return entry->handle;
}

void PosixProcessSupervisor::PushLine(Entry& entry, const std::string& raw) {
    std::string line = raw;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    {
        std::lock_guard<std::mutex> lock(entry.mutex);
        entry.ring.push_back(line);
        while (entry.ring.size() > m_ringCapacity) entry.ring.pop_front();
    }
    std::lock_guard<std::mutex> lock(entry.listenerMutex);
    if (entry.listener) {
        try {
            entry.listener(line);
        } catch (const std::exception& e) {
            std::cerr << "[ProcessSupervisor] Output listener failed: " << e.what() << std::endl;
        }
    }
}

void PosixProcessSupervisor::ReadLoop(std::shared_ptr<Entry> entry, int fd) {
    const pid_t pid = entry->handle.pid;
    std::string pending;
    char buffer[4096];
    bool eof = false;

    auto consume = [&](const char* data, size_t size) {
        pending.append(data, size);
        size_t pos;
        while ((pos = pending.find('\n')) != std::string::npos) {
            PushLine(*entry, pending.substr(0, pos));
            pending.erase(0, pos + 1);
        }
        if (pending.size() > kMaxLineLength) {
            PushLine(*entry, pending);
            pending.clear();
        }
    };

    auto readOnce = [&](int timeoutMs) {
        pollfd pfd{fd, POLLIN, 0};
        const int ready = ::poll(&pfd, 1, timeoutMs);
        if (ready <= 0) return false;
        const ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            consume(buffer, static_cast<size_t>(n));
            return true;
        }
        if (n == 0 || errno != EINTR) eof = true;
        return false;
    };

    int exitCode = -1;
    while (true) {
        if (!eof) {
            readOnce(static_cast<int>(kPollInterval.count()));
        } else {
            std::this_thread::sleep_for(kPollInterval);
        }

        int status = 0;
        const pid_t reaped = ::waitpid(pid, &status, WNOHANG);
        if (reaped == pid) {
            exitCode = DecodeWaitStatus(status);
            break;
        }
        if (reaped < 0 && errno != EINTR) {
            break;
        }
    }

    // Drain what is buffered; descendants may still hold the write end.
    while (!eof && readOnce(0)) {
    }
    if (!pending.empty()) PushLine(*entry, pending);
    ::close(fd);

    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        entry->alive = false;
        entry->exitCode = exitCode;
    }
    entry->exited.notify_all();

    std::cout << "[ProcessSupervisor] " << ProcessKindToString(entry->handle.kind) << " for "
              << entry->handle.project << " exited with code " << exitCode << std::endl;
}

std::shared_ptr<PosixProcessSupervisor::Entry>
PosixProcessSupervisor::Lookup(const ProcessHandle& handle) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(handle.id);
    if (it == m_entries.end()) return nullptr;
    return it->second;
}

void PosixProcessSupervisor::JoinReader(Entry& entry) {
    std::thread reader;
    {
        std::lock_guard<std::mutex> lock(entry.mutex);
        if (entry.alive) return;
        reader = std::move(entry.reader);
    }
    if (reader.joinable() && reader.get_id() != std::this_thread::get_id()) {
        reader.join();
    } else if (reader.joinable()) {
        reader.detach();
    }
}

void PosixProcessSupervisor::PruneFinished() {
    std::vector<std::shared_ptr<Entry>> finished;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_entries.size() < kPruneThreshold) return;

        for (auto it = m_entries.begin(); it != m_entries.end();) {
            bool alive;
            {
                std::lock_guard<std::mutex> entryLock(it->second->mutex);
                alive = it->second->alive;
            }
            const std::string key = SlotKey(it->second->handle.project, it->second->handle.kind);
            auto slot = m_slots.find(key);
            const bool slotted = slot != m_slots.end() && slot->second == it->first;
            if (!alive && !slotted) {
                finished.push_back(it->second);
                it = m_entries.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& entry : finished) JoinReader(*entry);
}

PortWaitResult PosixProcessSupervisor::waitForPort(const std::string& host, int port, Duration timeout,
                                                   const ProcessHandle* watch,
                                                   const CancellationToken* cancel) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    auto backoff = std::chrono::duration_cast<Duration>(kBackoffStart);

    while (true) {
        if (cancel && cancel->isCancelled()) return PortWaitResult::Cancelled;
        if (watch && !isAlive(*watch)) return PortWaitResult::ProcessExited;
        if (ProbePort(host, port)) return PortWaitResult::Ready;

        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return PortWaitResult::Timeout;

        const auto remaining = std::chrono::duration_cast<Duration>(deadline - now);
        const auto pause = std::min(backoff, remaining);
        if (cancel) {
            if (cancel->waitFor(pause)) return PortWaitResult::Cancelled;
        } else {
            std::this_thread::sleep_for(pause);
        }
        backoff = std::min(backoff * 2, std::chrono::duration_cast<Duration>(kBackoffCap));
    }
}

bool PosixProcessSupervisor::ProbePort(const std::string& host, int port) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* results = nullptr;
    if (::getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &results) != 0) {
        return false;
    }

    bool connected = false;
    for (addrinfo* ai = results; ai && !connected; ai = ai->ai_next) {
        const int sock = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (sock < 0) continue;
        timeval tv{1, 0};
        ::setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
        connected = ::connect(sock, ai->ai_addr, ai->ai_addrlen) == 0;
        ::close(sock);
    }
    ::freeaddrinfo(results);
    return connected;
}

std::optional<int> PosixProcessSupervisor::waitForExit(const ProcessHandle& handle, Duration timeout,
                                                       const CancellationToken* cancel) {
    auto entry = Lookup(handle);
    if (!entry) return std::nullopt;

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::unique_lock<std::mutex> lock(entry->mutex);
    while (entry->alive) {
        if (cancel && cancel->isCancelled()) return std::nullopt;
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return std::nullopt;
        const auto slice = std::min(std::chrono::duration_cast<Duration>(deadline - now),
                                    std::chrono::duration_cast<Duration>(kPollInterval));
        entry->exited.wait_for(lock, slice);
    }
    return entry->exitCode;
}

bool PosixProcessSupervisor::WaitGroupExit(Entry& entry, std::unique_lock<std::mutex>& lock, Duration grace) {
    const pid_t pgid = entry.handle.pid;
    const auto deadline = std::chrono::steady_clock::now() + grace;
    while (entry.alive || GroupAlive(pgid)) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return false;
        const auto slice = std::min(std::chrono::duration_cast<Duration>(deadline - now),
                                    std::chrono::duration_cast<Duration>(kGroupPollInterval));
        entry.exited.wait_for(lock, slice);
    }
    return true;
}

void PosixProcessSupervisor::stop(const ProcessHandle& handle) {
    auto entry = Lookup(handle);
    if (!entry) return;

    const pid_t pgid = entry->handle.pid;
    {
        std::unique_lock<std::mutex> lock(entry->mutex);
        if (entry->alive || (!entry->groupReleased && GroupAlive(pgid))) {
            lock.unlock();
            ::killpg(pgid, SIGTERM);
            lock.lock();
            if (!WaitGroupExit(*entry, lock, m_stopGrace)) {
                lock.unlock();
                std::cerr << "[ProcessSupervisor] " << ProcessKindToString(handle.kind) << " for "
                          << handle.project << " ignored SIGTERM, sending SIGKILL" << std::endl;
                ::killpg(pgid, SIGKILL);
                lock.lock();
                if (!entry->exited.wait_for(lock, kKillWait, [&] { return !entry->alive; })) {
                    std::cerr << "[ProcessSupervisor] pid " << pgid << " did not exit after SIGKILL" << std::endl;
                }
            }
        }
        entry->groupReleased = true;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto slot = m_slots.find(SlotKey(handle.project, handle.kind));
        if (slot != m_slots.end() && slot->second == handle.id) m_slots.erase(slot);
    }
    {
        std::lock_guard<std::mutex> lock(entry->listenerMutex);
        entry->listener = nullptr;
    }
    JoinReader(*entry);
}

std::vector<std::string> PosixProcessSupervisor::captureOutput(const ProcessHandle& handle) const {
    auto entry = Lookup(handle);
    if (!entry) return {};
    std::lock_guard<std::mutex> lock(entry->mutex);
    return {entry->ring.begin(), entry->ring.end()};
}

ProcessStatus PosixProcessSupervisor::status(const ProcessHandle& handle) const {
    auto entry = Lookup(handle);
    if (!entry) return {};
    std::lock_guard<std::mutex> lock(entry->mutex);
    return {entry->alive, entry->exitCode};
}

std::optional<ProcessHandle> PosixProcessSupervisor::find(const std::string& project, ProcessKind kind) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto slot = m_slots.find(SlotKey(project, kind));
    if (slot == m_slots.end()) return std::nullopt;
    auto it = m_entries.find(slot->second);
    if (it == m_entries.end()) return std::nullopt;
    std::lock_guard<std::mutex> entryLock(it->second->mutex);
    if (!it->second->alive) return std::nullopt;
    return it->second->handle;
}

void PosixProcessSupervisor::detachListener(const ProcessHandle& handle) {
    auto entry = Lookup(handle);
    if (!entry) return;
    std::lock_guard<std::mutex> lock(entry->listenerMutex);
    entry->listener = nullptr;
}

void PosixProcessSupervisor::shutdown() {
    std::vector<ProcessHandle> live;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_shutdown = true;
        for (const auto& [id, entry] : m_entries) {
            std::lock_guard<std::mutex> entryLock(entry->mutex);
            if (entry->alive || (!entry->groupReleased && GroupAlive(entry->handle.pid))) {
                live.push_back(entry->handle);
            }
        }
    }
    if (!live.empty()) {
        std::cout << "[ProcessSupervisor] Shutting down " << live.size() << " process(es)" << std::endl;
    }
    for (const auto& handle : live) stop(handle);
}

} // namespace webforge::infrastructure
