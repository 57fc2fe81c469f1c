#include <cassert>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include "infrastructure/PosixProcessSupervisor.hpp"

using namespace webforge::domain;
using webforge::infrastructure::PosixProcessSupervisor;
using namespace std::chrono_literals;

namespace {

ProcessSpec Spec(const std::string& project, ProcessKind kind, const std::string& command) {
    ProcessSpec spec;
    spec.project = project;
    spec.kind = kind;
    spec.command = command;
    return spec;
}

// Listening socket on an ephemeral loopback port; returns the fd and fills port.
int ListenOnLoopback(int& port) {
    const int sock = ::socket(AF_INET, SOCK_STREAM, 0);
    assert(sock >= 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    assert(::bind(sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
    assert(::listen(sock, 4) == 0);
    socklen_t len = sizeof(addr);
    assert(::getsockname(sock, reinterpret_cast<sockaddr*>(&addr), &len) == 0);
    port = ntohs(addr.sin_port);
    return sock;
}

// Pid printed by the command as "member <pid>".
pid_t WaitForMemberPid(PosixProcessSupervisor& supervisor, const ProcessHandle& handle) {
    for (int i = 0; i < 500; ++i) {
        for (const auto& line : supervisor.captureOutput(handle)) {
            if (line.rfind("member ", 0) == 0) return static_cast<pid_t>(std::stoi(line.substr(7)));
        }
        std::this_thread::sleep_for(10ms);
    }
    return -1;
}

// Gone or a zombie waiting for its new parent to reap it.
bool ProcessGone(pid_t pid) {
    for (int i = 0; i < 200; ++i) {
        if (::kill(pid, 0) != 0) return true;
        std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
        std::string content;
        std::getline(stat, content);
        const auto close = content.rfind(')');
        if (close != std::string::npos && close + 2 < content.size() && content[close + 2] == 'Z') return true;
        std::this_thread::sleep_for(10ms);
    }
    return false;
}

void TestOutlivesStartingThread() {
    std::cout << "[Test] A server outlives the thread that started it..." << std::endl;
    PosixProcessSupervisor supervisor(500ms);
    ProcessHandle handle;
    std::thread starter([&]() { handle = supervisor.start(Spec("kept", ProcessKind::Serve, "exec sleep 30")); });
    starter.join();

    std::this_thread::sleep_for(300ms);
    assert(supervisor.isAlive(handle));
    assert(supervisor.find("kept", ProcessKind::Serve));

    supervisor.stop(handle);
    assert(!supervisor.isAlive(handle));
    std::cout << "[PASS] Only stop() ends a handed-over server." << std::endl;
}

void TestStopReachesWholeGroup() {
    std::cout << "[Test] Stop reaches every member of the process group..." << std::endl;
    PosixProcessSupervisor supervisor(300ms);

    const auto running = supervisor.start(
        Spec("grouped", ProcessKind::Serve, "(trap '' TERM; exec sleep 30) & echo member $!; sleep 30"));
    const pid_t member = WaitForMemberPid(supervisor, running);
    assert(member > 0);
    supervisor.stop(running);
    assert(!supervisor.isAlive(running));
    assert(ProcessGone(member));

    // The leader is gone before stop(); its group is not.
    const auto orphaning = supervisor.start(
        Spec("orphaning", ProcessKind::Serve, "(trap '' TERM; exec sleep 30) & echo member $!; exit 0"));
    const pid_t orphan = WaitForMemberPid(supervisor, orphaning);
    assert(orphan > 0);
    assert(supervisor.waitForExit(orphaning, 5000ms) == 0);
    assert(!ProcessGone(orphan));
    supervisor.stop(orphaning);
    assert(ProcessGone(orphan));

    const auto leftBehind = supervisor.start(
        Spec("leftover", ProcessKind::Test, "(trap '' TERM; exec sleep 30) & echo member $!; exit 0"));
    const pid_t leftover = WaitForMemberPid(supervisor, leftBehind);
    assert(leftover > 0);
    assert(supervisor.waitForExit(leftBehind, 5000ms) == 0);
    supervisor.shutdown();
    assert(ProcessGone(leftover));
    std::cout << "[PASS] No group member survives stop() or shutdown()." << std::endl;
}

void TestOutputAndExitCode() {
    std::cout << "[Test] Output capture and exit codes..." << std::endl;
    PosixProcessSupervisor supervisor;

    std::string streamed;
    auto spec = Spec("alpha", ProcessKind::Install, "echo first; echo second 1>&2; exit 3");
    spec.onLine = [&](const std::string& line) { streamed += line + "|"; };
    const auto handle = supervisor.start(spec);
    assert(handle.pid > 0);

    const auto code = supervisor.waitForExit(handle, 5000ms);
    assert(code.has_value() && *code == 3);
    assert(!supervisor.isAlive(handle));

    const auto lines = supervisor.captureOutput(handle);
    assert(lines.size() == 2);
    assert(lines[0] == "first");
    assert(lines[1] == "second");
    assert(streamed == "first|second|");

    const auto status = supervisor.status(handle);
    assert(!status.alive && status.exitCode == 3);
    std::cout << "[PASS] Output was captured in order and the exit code reported." << std::endl;
}

void TestEnvironmentAndWorkingDir() {
    std::cout << "[Test] Environment and working directory..." << std::endl;
    PosixProcessSupervisor supervisor;
    auto spec = Spec("env", ProcessKind::Install, "echo \"$WEBFORGE_PROBE\"; pwd");
    spec.env["WEBFORGE_PROBE"] = "probe-value";
    spec.workingDir = "/tmp";
    const auto handle = supervisor.start(spec);
    assert(supervisor.waitForExit(handle, 5000ms) == 0);
    const auto lines = supervisor.captureOutput(handle);
    assert(lines.size() == 2);
    assert(lines[0] == "probe-value");
    assert(lines[1] == "/tmp");
    std::cout << "[PASS] Extra env vars and cwd reach the child." << std::endl;
}

void TestRingBufferBound() {
    std::cout << "[Test] Output ring buffer..." << std::endl;
    PosixProcessSupervisor supervisor(1000ms, 5);
    const auto handle = supervisor.start(
        Spec("ring", ProcessKind::Install, "i=0; while [ $i -lt 20 ]; do echo line$i; i=$((i+1)); done"));
    assert(supervisor.waitForExit(handle, 5000ms) == 0);
    const auto lines = supervisor.captureOutput(handle);
    assert(lines.size() == 5);
    assert(lines.front() == "line15");
    assert(lines.back() == "line19");
    std::cout << "[PASS] Only the most recent lines are kept." << std::endl;
}

void TestWaitTimeoutAndStop() {
    std::cout << "[Test] Exit timeout, slot exclusivity and stop..." << std::endl;
    PosixProcessSupervisor supervisor(500ms);
    const auto handle = supervisor.start(Spec("beta", ProcessKind::Serve, "sleep 30"));

    assert(!supervisor.waitForExit(handle, 100ms).has_value());
    assert(supervisor.isAlive(handle));

    bool rejected = false;
    try {
        supervisor.start(Spec("beta", ProcessKind::Serve, "sleep 30"));
    } catch (const ProcessAlreadyRunning&) {
        rejected = true;
    }
    assert(rejected);

    // A different kind or project is a different slot.
    const auto other = supervisor.start(Spec("beta", ProcessKind::Install, "true"));
    assert(supervisor.waitForExit(other, 5000ms) == 0);

    const auto found = supervisor.find("beta", ProcessKind::Serve);
    assert(found.has_value() && *found == handle);

    const auto started = std::chrono::steady_clock::now();
    supervisor.stop(handle);
    assert(std::chrono::steady_clock::now() - started < 5s);
    assert(!supervisor.isAlive(handle));
    assert(!supervisor.find("beta", ProcessKind::Serve).has_value());

    // Idempotent, and the slot is free again.
    supervisor.stop(handle);
    const auto again = supervisor.start(Spec("beta", ProcessKind::Serve, "exit 0"));
    assert(supervisor.waitForExit(again, 5000ms) == 0);
    std::cout << "[PASS] Slots are exclusive and stop frees them." << std::endl;
}

void TestStopEscalatesToKill() {
    std::cout << "[Test] SIGTERM is ignored..." << std::endl;
    PosixProcessSupervisor supervisor(200ms);
    const auto handle = supervisor.start(
        Spec("stubborn", ProcessKind::Serve, "trap '' TERM; while true; do sleep 1; done"));
    std::this_thread::sleep_for(100ms);
    supervisor.stop(handle);
    const auto status = supervisor.status(handle);
    assert(!status.alive);
    assert(status.exitCode == 128 + SIGKILL);
    std::cout << "[PASS] Stop escalated to SIGKILL." << std::endl;
}

void TestWaitForPort() {
    std::cout << "[Test] Port readiness..." << std::endl;
    PosixProcessSupervisor supervisor;

    int openPort = 0;
    const int listener = ListenOnLoopback(openPort);
    assert(supervisor.waitForPort("127.0.0.1", openPort, 2000ms) == PortWaitResult::Ready);
    assert(PosixProcessSupervisor::ProbePort("127.0.0.1", openPort));
    ::close(listener);

    int closedPort = 0;
    ::close(ListenOnLoopback(closedPort));
    assert(supervisor.waitForPort("127.0.0.1", closedPort, 300ms) == PortWaitResult::Timeout);

    const auto dead = supervisor.start(Spec("gamma", ProcessKind::Serve, "exit 1"));
    assert(supervisor.waitForExit(dead, 5000ms) == 1);
    assert(supervisor.waitForPort("127.0.0.1", closedPort, 5000ms, &dead) == PortWaitResult::ProcessExited);

    CancellationToken cancel;
    cancel.cancel();
    assert(supervisor.waitForPort("127.0.0.1", closedPort, 5000ms, nullptr, &cancel) ==
           PortWaitResult::Cancelled);
    std::cout << "[PASS] Ready, Timeout, ProcessExited and Cancelled are distinguished." << std::endl;
}

void TestShutdown() {
    std::cout << "[Test] Shutdown..." << std::endl;
    PosixProcessSupervisor supervisor(300ms);
    const auto a = supervisor.start(Spec("one", ProcessKind::Serve, "sleep 30"));
    const auto b = supervisor.start(Spec("two", ProcessKind::Serve, "sleep 30"));
    supervisor.shutdown();
    assert(!supervisor.isAlive(a));
    assert(!supervisor.isAlive(b));

    bool refused = false;
    try {
        supervisor.start(Spec("three", ProcessKind::Serve, "true"));
    } catch (const InfrastructureError&) {
        refused = true;
    }
    assert(refused);
    std::cout << "[PASS] Every process was terminated and new starts are refused." << std::endl;
}

} // namespace

int main() {
    TestOutputAndExitCode();
    TestEnvironmentAndWorkingDir();
    TestRingBufferBound();
    TestWaitTimeoutAndStop();
    TestStopEscalatesToKill();
    TestWaitForPort();
    TestShutdown();
    TestOutlivesStartingThread();
    TestStopReachesWholeGroup();
    std::cout << "All process supervisor tests passed." << std::endl;
    return 0;
}
