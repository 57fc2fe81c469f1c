#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <set>
#include <thread>
#include <vector>

#include "application/SessionGateway.hpp"
#include "test/FakeCollaborators.hpp"

using namespace webforge::application;
using namespace webforge::test;

namespace {

OrchestratorSettings StressSettings() {
    OrchestratorSettings settings;
    settings.maxConcurrentRuns = 2;
    settings.keepServerAfterRun = false;
    return settings;
}

void TestConcurrentBuilds() {
    std::cout << "[Test] Starting concurrent build submissions..." << std::endl;
    auto repo = std::make_shared<InMemoryProjectRepository>();
    auto supervisor = std::make_shared<FakeProcessSupervisor>();
    PipelineOrchestrator orchestrator(repo, std::make_shared<FakeEnrichmentService>(),
                                      std::make_shared<FakeGenerationService>(),
                                      std::make_shared<ScriptedTestService>(), supervisor, StressSettings());

    const int kSubmitters = 16;
    std::vector<EventRecorder> recorders(kSubmitters);
    std::vector<SubmitResult> results(kSubmitters);
    std::vector<std::thread> threads;

    const auto startTime = std::chrono::steady_clock::now();
    for (int i = 0; i < kSubmitters; ++i) {
        threads.emplace_back([&, i]() {
            BuildRequest request;
            request.idea = "Bakery site number " + std::to_string(i);
            results[i] = orchestrator.SubmitBuild(request, recorders[i].Sink());
        });
    }
    for (auto& t : threads) t.join();
    orchestrator.WaitIdle();
    const auto elapsed = std::chrono::steady_clock::now() - startTime;

    int accepted = 0;
    std::set<std::string> projects;
    std::set<std::string> runIds;
    for (int i = 0; i < kSubmitters; ++i) {
        const auto& result = results[i];
        if (result.accepted) {
            ++accepted;
            runIds.insert(result.runId);
            assert(recorders[i].TerminalCount() == 1);
            const auto done = recorders[i].Of<DoneEvent>();
            assert(done.size() == 1);
            projects.insert(done.front().project);
        } else {
            assert(result.reason == FailureReason::AtCapacity);
            assert(recorders[i].Count<AcceptedEvent>() == 0);
            const auto errors = recorders[i].Of<ErrorEvent>();
            assert(errors.size() == 1 && errors.front().runId.empty());
        }
    }

    assert(accepted >= 1);
    assert(runIds.size() == static_cast<size_t>(accepted));
    // Every admitted build landed in its own project directory.
    assert(projects.size() == static_cast<size_t>(accepted));
    assert(orchestrator.ActiveRuns() == 0);
    assert(supervisor->LiveCount() == 0);
    orchestrator.Shutdown();

    std::cout << "[PASS] " << accepted << " of " << kSubmitters << " builds admitted in "
              << std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() << "ms." << std::endl;
}

void TestConcurrentUpdatesOnOneProject() {
    std::cout << "[Test] Concurrent updates on one project..." << std::endl;
    auto repo = std::make_shared<InMemoryProjectRepository>();
    repo->Seed("bakery");
    auto supervisor = std::make_shared<FakeProcessSupervisor>();
    auto settings = StressSettings();
    settings.maxConcurrentRuns = 8;
    PipelineOrchestrator orchestrator(repo, std::make_shared<FakeEnrichmentService>(),
                                      std::make_shared<FakeGenerationService>(),
                                      std::make_shared<ScriptedTestService>(), supervisor, settings);

    const int kSubmitters = 8;
    std::vector<SubmitResult> results(kSubmitters);
    std::vector<std::thread> threads;
    for (int i = 0; i < kSubmitters; ++i) {
        threads.emplace_back([&, i]() {
            RepromptRequest request;
            request.project = "bakery";
            request.instruction = "Make the hero title bigger";
            results[i] = orchestrator.SubmitUpdate(request, EventSink());
        });
    }
    for (auto& t : threads) t.join();
    orchestrator.WaitIdle();

    int accepted = 0;
    for (const auto& result : results) {
        if (result.accepted) {
            ++accepted;
        } else {
            assert(result.reason == FailureReason::Busy);
        }
    }
    assert(accepted >= 1);
    assert(!orchestrator.IsBusy("bakery"));
    assert(supervisor->LiveCount() == 0);
    orchestrator.Shutdown();
    std::cout << "[PASS] The project lock admitted " << accepted << " serialized update(s)." << std::endl;
}

void TestConcurrentSessions() {
    std::cout << "[Test] Sessions opening, commanding and closing concurrently..." << std::endl;
    auto repo = std::make_shared<InMemoryProjectRepository>();
    repo->Seed("bakery");
    PipelineOrchestrator orchestrator(repo, std::make_shared<FakeEnrichmentService>(),
                                      std::make_shared<FakeGenerationService>(),
                                      std::make_shared<ScriptedTestService>(),
                                      std::make_shared<FakeProcessSupervisor>(), StressSettings());
    SessionGateway gateway(orchestrator, repo, true);

    std::atomic<int> wakes{0};
    gateway.SetWakeHandler([&](const std::string&) { ++wakes; });

    const int kClients = 12;
    std::atomic<int> answered{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < kClients; ++i) {
        threads.emplace_back([&, i]() {
            const std::string session = gateway.OpenSession();
            ClientCommand build;
            build.type = CommandType::Build;
            build.prompt = "Client site " + std::to_string(i);
            gateway.HandleCommand(session, build);

            ClientCommand status;
            status.type = CommandType::Status;
            status.project = "bakery";
            gateway.HandleCommand(session, status);

            ClientCommand listing;
            listing.type = CommandType::Projects;
            gateway.HandleCommand(session, listing);

            const auto events = gateway.Drain(session);
            if (!events.empty()) ++answered;
            // Half the clients drop mid-run; their runs are cancelled.
            if (i % 2 == 0) gateway.CloseSession(session);
        });
    }
    for (auto& t : threads) t.join();
    orchestrator.WaitIdle();

    assert(answered == kClients);
    assert(wakes > 0);
    assert(orchestrator.ActiveRuns() == 0);
    orchestrator.Shutdown();
    std::cout << "[PASS] Every client was answered and no run was left behind." << std::endl;
}

} // namespace

int main() {
    TestConcurrentBuilds();
    TestConcurrentUpdatesOnOneProject();
    TestConcurrentSessions();
    std::cout << "[PASS] Concurrency stress test finished." << std::endl;
    return 0;
}
