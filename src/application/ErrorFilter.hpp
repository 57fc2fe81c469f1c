/**
 * @file ErrorFilter.hpp
 * @brief Actionable-error policy applied to test reports.
 */

#pragma once

#include <string>
#include <vector>

#include "domain/TestService.hpp"

namespace webforge::application {

/**
 * @struct ErrorFilterPolicy
 * @brief Allow-list of real error signatures and deny-list of console noise.
 *
 * Signals are matched case-sensitively, noise case-insensitively. A message
 * starting with a structural prefix is always actionable.
 */
struct ErrorFilterPolicy {
    std::vector<std::string> signals;
    std::vector<std::string> noise;
    std::vector<std::string> structural;

    static ErrorFilterPolicy Default();
};

/**
 * @class ErrorFilter
 * @brief Decides which test failures are worth a repair attempt.
 */
class ErrorFilter {
public:
    explicit ErrorFilter(ErrorFilterPolicy policy = ErrorFilterPolicy::Default());

    /** @brief Structural, or not noise and matching at least one signal. */
    bool IsActionable(const domain::TestError& error) const;

    /** @brief Actionable errors of a report; empty for a passing report. */
    std::vector<domain::TestError> Filter(const domain::TestReport& report) const;

    const ErrorFilterPolicy& policy() const { return m_policy; }

private:
    ErrorFilterPolicy m_policy;
    std::vector<std::string> m_noiseLowered;
};

} // namespace webforge::application
