#include "application/ErrorFilter.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace webforge::application {

namespace {

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

ErrorFilterPolicy ErrorFilterPolicy::Default() {
    ErrorFilterPolicy policy;
    policy.signals = {
        "is not defined", "is not a function",
        "Cannot read prop", "Cannot read properties",
        "SyntaxError", "ReferenceError", "TypeError",
        "Failed to resolve import", "does not provide an export",
        "Element type is invalid", "[plugin:vite"
    };
    // Findings of the runner's own page checks, as opposed to console output.
    policy.structural = {
        "Vite compile error", "App never rendered",
        "Page appears completely blank", "Page returned HTTP"
    };
    policy.noise = {
        "favicon", "Warning:", "DevTools", "Download the React",
        "ReactDOM.render", "StrictMode", "[HMR]", "[vite]",
        "hot update", "server connection lost", "react-refresh",
        "net::ERR_", "Failed to load resource",
        "Cross-Origin", "Content-Security-Policy"
    };
    return policy;
}

ErrorFilter::ErrorFilter(ErrorFilterPolicy policy)
    : m_policy(std::move(policy)) {
    for (const auto& n : m_policy.noise) {
        m_noiseLowered.push_back(ToLower(n));
    }
}

bool ErrorFilter::IsActionable(const domain::TestError& error) const {
    for (const auto& prefix : m_policy.structural) {
        if (!prefix.empty() && error.message.rfind(prefix, 0) == 0) return true;
    }
    const std::string lowered = ToLower(error.message);
    for (const auto& n : m_noiseLowered) {
        if (!n.empty() && lowered.find(n) != std::string::npos) return false;
    }
    for (const auto& s : m_policy.signals) {
        if (!s.empty() && error.message.find(s) != std::string::npos) return true;
    }
    return false;
}

std::vector<domain::TestError> ErrorFilter::Filter(const domain::TestReport& report) const {
    std::vector<domain::TestError> actionable;
    if (report.passed) return actionable;
    for (const auto& error : report.errors) {
        if (IsActionable(error)) actionable.push_back(error);
    }
    return actionable;
}

} // namespace webforge::application
