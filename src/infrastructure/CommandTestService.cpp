#include "infrastructure/CommandTestService.hpp"

#include "domain/Errors.hpp"

#include <httplib.h>
#include <iostream>
#include <map>
#include <nlohmann/json.hpp>

namespace webforge::infrastructure {

using json = nlohmann::json;
using namespace webforge::domain;

namespace {

constexpr size_t kFailureTailLines = 3;
constexpr int kRunnerMissingExitCode = 127;

std::string Expand(std::string command, const std::map<std::string, std::string>& values) {
    for (const auto& [key, value] : values) {
        const std::string token = "{" + key + "}";
        for (auto pos = command.find(token); pos != std::string::npos; pos = command.find(token, pos + value.size())) {
            command.replace(pos, token.size(), value);
        }
    }
    return command;
}

} // namespace

CommandTestService::CommandTestService(std::shared_ptr<ProcessSupervisor> supervisor,
                                       std::string testCommand,
                                       std::chrono::milliseconds timeout)
    : m_supervisor(std::move(supervisor)),
      m_testCommand(std::move(testCommand)),
      m_timeout(timeout) {}

std::optional<TestError> CommandTestService::CheckHttp(const std::string& url) {
    httplib::Client cli(url);
    cli.set_connection_timeout(5);
    cli.set_read_timeout(30);

    auto res = cli.Get("/");
    if (!res) {
        throw InfrastructureError("Dev server at " + url + " is not reachable (error " +
                                  std::to_string(static_cast<int>(res.error())) + ")");
    }
    if (res->status >= 400) {
        return TestError{"Page returned HTTP " + std::to_string(res->status), ""};
    }
    return std::nullopt;
}

std::optional<TestReport> CommandTestService::ParseReport(const std::vector<std::string>& output) {
    for (auto it = output.rbegin(); it != output.rend(); ++it) {
        const auto start = it->find('{');
        if (start == std::string::npos) continue;

        json body;
        try {
            body = json::parse(it->substr(start));
        } catch (const json::parse_error&) {
            continue;
        }
        if (!body.is_object() || !body.contains("passed")) continue;

        TestReport report;
        report.passed = body.value("passed", false);
        if (body.contains("errors") && body["errors"].is_array()) {
            for (const auto& item : body["errors"]) {
                if (item.is_string()) {
                    report.errors.push_back({item.get<std::string>(), ""});
                } else if (item.is_object()) {
                    report.errors.push_back({item.value("message", ""), item.value("sourceHint", "")});
                }
            }
        }
        return report;
    }
    return std::nullopt;
}

TestReport CommandTestService::runTests(const TestTarget& target) {
    if (auto httpError = CheckHttp(target.servingUrl)) {
        TestReport report;
        report.errors.push_back(*httpError);
        return report;
    }
    if (m_testCommand.empty()) {
        return TestReport{true, {}};
    }

    ProcessSpec spec;
    spec.project = target.project;
    spec.kind = ProcessKind::Test;
    spec.workingDir = target.projectRoot;
    spec.command = Expand(m_testCommand, {{"url", target.servingUrl},
                                          {"project", target.project},
                                          {"root", target.projectRoot}});

    const ProcessHandle handle = m_supervisor->start(spec);
    std::optional<int> exitCode;
    try {
        exitCode = m_supervisor->waitForExit(handle, m_timeout, target.cancel);
    } catch (...) {
        m_supervisor->stop(handle);
        throw;
    }
    const auto output = m_supervisor->captureOutput(handle);
    m_supervisor->stop(handle);

    if (target.cancel && target.cancel->isCancelled()) {
        throw RunCancelled();
    }
    if (!exitCode) {
        throw InfrastructureError("Test runner timed out after " +
                                  std::to_string(m_timeout.count() / 1000) + "s");
    }

    if (auto report = ParseReport(output)) {
        std::cout << "[TestRunner] " << target.project << ": " << (report->passed ? "passed" : "failed")
                  << " with " << report->errors.size() << " error(s)" << std::endl;
        return *report;
    }

    if (*exitCode == kRunnerMissingExitCode) {
        throw InfrastructureError("Test runner could not be started: " + spec.command);
    }
    if (*exitCode == 0) {
        return TestReport{true, {}};
    }

    // A runner that fails without a report is broken itself, not the page it tested.
    std::string tail;
    const size_t first = output.size() > kFailureTailLines ? output.size() - kFailureTailLines : 0;
    for (size_t i = first; i < output.size(); ++i) {
        if (output[i].empty()) continue;
        if (!tail.empty()) tail += " | ";
        tail += output[i];
    }
    throw InfrastructureError("Test runner exited with code " + std::to_string(*exitCode) +
                              " without a report" + (tail.empty() ? "" : ": " + tail));
}

} // namespace webforge::infrastructure
