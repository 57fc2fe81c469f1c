/**
 * @file CommandTestService.hpp
 * @brief Test collaborator: an HTTP smoke check plus an external browser runner.
 */

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "domain/ProcessSupervisor.hpp"
#include "domain/TestService.hpp"

namespace webforge::infrastructure {

/**
 * @class CommandTestService
 * @brief Runs the configured test command under the process supervisor.
 *
 * The runner prints a JSON report as its last JSON line:
 * `{"passed": bool, "errors": [{"message": "...", "sourceHint": "..."}]}`
 * (plain strings are accepted as error entries too). Without a report, exit
 * code 0 passes and any other exit code is an InfrastructureError.
 */
class CommandTestService : public domain::TestService {
public:
    CommandTestService(std::shared_ptr<domain::ProcessSupervisor> supervisor,
                       std::string testCommand,
                       std::chrono::milliseconds timeout);

    domain::TestReport runTests(const domain::TestTarget& target) override;

    /** @brief Parses the runner output; nullopt when it holds no report line. */
    static std::optional<domain::TestReport> ParseReport(const std::vector<std::string>& output);

    /** @brief GET on the serving URL; an error entry for HTTP >= 400. */
    static std::optional<domain::TestError> CheckHttp(const std::string& url);

private:
    std::shared_ptr<domain::ProcessSupervisor> m_supervisor;
    std::string m_testCommand;
    std::chrono::milliseconds m_timeout;
};

} // namespace webforge::infrastructure
