/**
 * @file TestService.hpp
 * @brief Interface for the headless-browser test collaborator.
 */

#pragma once

#include <string>
#include <vector>

#include "domain/CancellationToken.hpp"

namespace webforge::domain {

struct TestError {
    std::string message;
    std::string sourceHint; ///< File or component the runner blamed, if any.
};

struct TestReport {
    bool passed = false;
    std::vector<TestError> errors;
};

/** @brief What to test and where the project lives. */
struct TestTarget {
    std::string servingUrl;
    std::string project;
    std::string projectRoot;
    const CancellationToken* cancel = nullptr;
};

/**
 * @class TestService
 * @brief Abstract test collaborator.
 */
class TestService {
public:
    virtual ~TestService() = default;

    /**
     * @brief Runs the browser tests against a live dev server.
     * @return Raw report; errors are filtered by the caller.
     * @throws InfrastructureError when the runner itself cannot run or times out.
     */
    virtual TestReport runTests(const TestTarget& target) = 0;
};

} // namespace webforge::domain
