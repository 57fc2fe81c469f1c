#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <httplib.h>

#include "infrastructure/CommandTestService.hpp"
#include "infrastructure/PosixProcessSupervisor.hpp"

using namespace webforge::domain;
using webforge::infrastructure::CommandTestService;
using webforge::infrastructure::PosixProcessSupervisor;
using namespace std::chrono_literals;

namespace {

/** Serves "/" on a loopback port with a fixed status until destroyed. */
struct StubSite {
    httplib::Server server;
    std::thread thread;
    int port = 0;

    explicit StubSite(int status) {
        server.Get("/", [status](const httplib::Request&, httplib::Response& res) {
            res.status = status;
            res.set_content("<html><div id=\"root\"></div></html>", "text/html");
        });
        port = server.bind_to_any_port("127.0.0.1");
        assert(port > 0);
        thread = std::thread([this]() { server.listen_after_bind(); });
    }

    ~StubSite() {
        server.stop();
        if (thread.joinable()) thread.join();
    }

    std::string Url() const { return "http://127.0.0.1:" + std::to_string(port); }
};

TestTarget Target(const std::string& url) {
    TestTarget target;
    target.servingUrl = url;
    target.project = "bakery";
    target.projectRoot = "/tmp";
    return target;
}

void TestParseReport() {
    std::cout << "[Test] Report parsing..." << std::endl;
    auto report = CommandTestService::ParseReport({
        "launching browser",
        R"(report: {"passed": false, "errors": [{"message": "ReferenceError: cart", "sourceHint": "Hero"}, "plain"]})",
        "browser closed",
    });
    assert(report && !report->passed);
    assert(report->errors.size() == 2);
    assert(report->errors[0].sourceHint == "Hero");
    assert(report->errors[1].message == "plain");

    // The last report wins.
    report = CommandTestService::ParseReport({R"({"passed": false})", R"({"passed": true})"});
    assert(report && report->passed);

    assert(!CommandTestService::ParseReport({"no json here", "{broken", R"({"other": 1})"}));
    std::cout << "[PASS] Reports are found in noisy output." << std::endl;
}

void TestRunnerReport() {
    std::cout << "[Test] Runner report through the supervisor..." << std::endl;
    StubSite site(200);
    auto supervisor = std::make_shared<PosixProcessSupervisor>();
    CommandTestService tester(
        supervisor,
        R"(echo checking {url}; echo '{"passed": false, "errors": [{"message": "TypeError: x is undefined", "sourceHint": "Hero"}]}')",
        10000ms);

    const auto report = tester.runTests(Target(site.Url()));
    assert(!report.passed);
    assert(report.errors.size() == 1);
    assert(report.errors[0].message == "TypeError: x is undefined");
    assert(!supervisor->find("bakery", ProcessKind::Test));
    std::cout << "[PASS] The runner's JSON report is returned." << std::endl;
}

void TestRunnerFallbacks() {
    std::cout << "[Test] Runner without a report..." << std::endl;
    StubSite site(200);
    auto supervisor = std::make_shared<PosixProcessSupervisor>();

    CommandTestService quiet(supervisor, "true", 10000ms);
    assert(quiet.runTests(Target(site.Url())).passed);

    auto runnerFails = [&](const std::string& command) {
        CommandTestService runner(supervisor, command, 10000ms);
        try {
            runner.runTests(Target(site.Url()));
        } catch (const InfrastructureError& e) {
            std::cout << "  " << e.what() << std::endl;
            return true;
        }
        return false;
    };
    assert(runnerFails("echo 'Error: build exploded'; exit 1"));
    assert(runnerFails("/nonexistent/webforge-runner"));
    // A missing script behind an existing interpreter exits 1 or 2, not 127.
    assert(runnerFails("sh /nonexistent/webforge-smoke.sh {url}"));
    assert(runnerFails("echo \"Error: Cannot find module '/nonexistent/webforge-smoke.mjs'\" 1>&2; exit 1"));

    CommandTestService slow(supervisor, "sleep 10", 200ms);
    bool timedOut = false;
    try {
        slow.runTests(Target(site.Url()));
    } catch (const InfrastructureError&) {
        timedOut = true;
    }
    assert(timedOut);
    assert(!supervisor->find("bakery", ProcessKind::Test));
    std::cout << "[PASS] A runner without a report is an infrastructure failure." << std::endl;
}

void TestHttpCheck() {
    std::cout << "[Test] HTTP smoke check..." << std::endl;
    StubSite broken(500);
    auto supervisor = std::make_shared<PosixProcessSupervisor>();
    CommandTestService tester(supervisor, "true", 10000ms);

    const auto report = tester.runTests(Target(broken.Url()));
    assert(!report.passed);
    assert(report.errors.size() == 1);
    assert(report.errors[0].message == "Page returned HTTP 500");

    bool unreachable = false;
    try {
        tester.runTests(Target("http://127.0.0.1:1"));
    } catch (const InfrastructureError&) {
        unreachable = true;
    }
    assert(unreachable);
    std::cout << "[PASS] Server errors are reported; a dead server is infrastructure." << std::endl;
}

} // namespace

int main() {
    TestParseReport();
    TestRunnerReport();
    TestRunnerFallbacks();
    TestHttpCheck();
    std::cout << "All test runner tests passed." << std::endl;
    return 0;
}
