#include <cassert>
#include <iostream>

#include "application/ErrorFilter.hpp"
#include "application/RepairContext.hpp"

using namespace webforge::application;
using webforge::domain::Project;
using webforge::domain::TestError;
using webforge::domain::TestReport;

namespace {

void TestSignalsAndNoise() {
    std::cout << "[Test] Allow-list and deny-list..." << std::endl;
    ErrorFilter filter;
    assert(filter.IsActionable({"ReferenceError: cart is not defined", ""}));
    assert(filter.IsActionable({"Uncaught TypeError: items.map is not a function", ""}));
    assert(filter.IsActionable({"[plugin:vite:react-babel] /src/components/Hero.jsx: Unexpected token", ""}));
    assert(filter.IsActionable({"Page returned HTTP 500", ""}));

    assert(!filter.IsActionable({"GET /favicon.ico 404 (Not Found)", ""}));
    assert(!filter.IsActionable({"Warning: Each child in a list should have a unique key prop", ""}));
    assert(!filter.IsActionable({"[vite] connecting... TypeError in hot update", ""}));
    assert(!filter.IsActionable({"Download the React DevTools for a better experience", ""}));
    assert(!filter.IsActionable({"Something odd happened", ""}));
    std::cout << "[PASS] Only real failures are actionable." << std::endl;
}

void TestStructuralFailures() {
    std::cout << "[Test] Page-level failures skip the noise list..." << std::endl;
    ErrorFilter filter;
    assert(filter.IsActionable({"Vite compile error: [vite] Internal server error: Failed to resolve import "
                                "\"./components/Pricing\" from \"src/App.jsx\"", ""}));
    assert(filter.IsActionable({"App never rendered, likely a compile or runtime error", ""}));
    assert(filter.IsActionable({"Page appears completely blank, nothing rendered", ""}));

    // The same text from the console is still noise.
    assert(!filter.IsActionable({"Console error: [vite] Internal server error: Failed to resolve import", ""}));

    TestReport report;
    report.errors = {{"Vite compile error: [plugin:vite:import-analysis] Failed to load resource", ""}};
    assert(filter.Filter(report).size() == 1);
    std::cout << "[PASS] Structural failures are always actionable." << std::endl;
}

void TestReportFiltering() {
    std::cout << "[Test] Filtering a report..." << std::endl;
    ErrorFilter filter;
    TestReport report;
    report.passed = false;
    report.errors = {{"net::ERR_ABORTED 404", ""}, {"SyntaxError: Unexpected token '<'", "Hero"}};
    const auto actionable = filter.Filter(report);
    assert(actionable.size() == 1);
    assert(actionable.front().sourceHint == "Hero");

    report.passed = true;
    assert(filter.Filter(report).empty());
    std::cout << "[PASS] Report filtered." << std::endl;
}

void TestCustomPolicy() {
    std::cout << "[Test] Configured policy replaces the defaults..." << std::endl;
    ErrorFilterPolicy policy;
    policy.signals = {"BOOM"};
    policy.noise = {"ignore me"};
    ErrorFilter filter(policy);
    assert(filter.IsActionable({"BOOM in render", ""}));
    assert(!filter.IsActionable({"BOOM but IGNORE ME", ""}));
    assert(!filter.IsActionable({"ReferenceError: x is not defined", ""}));
    std::cout << "[PASS] Custom policy applied." << std::endl;
}

void TestRepairContext() {
    std::cout << "[Test] Locating broken files..." << std::endl;
    Project project("shop", "/tmp/shop");
    project.setFile("src/App.jsx", "export default function App() {}");
    project.setFile("src/components/Hero.jsx", "export default function Hero() {}");
    project.setFile("src/components/Footer.jsx", "export default function Footer() {}");

    auto compile = RepairContext::LocateBrokenFiles(
        "[plugin:vite:react-babel] /home/u/shop/src/components/Footer.jsx: Unexpected token (3:4)\n"
        "ReferenceError at /src/components/Hero.jsx", project);
    assert(compile.size() == 1 && compile.front() == "src/components/Footer.jsx");

    auto runtime = RepairContext::LocateBrokenFiles(
        "The above error occurred in the <Hero> component:\n    at Hero (http://localhost:5173/src/components/Hero.jsx)",
        project);
    assert(runtime.size() == 1 && runtime.front() == "src/components/Hero.jsx");

    auto foreign = RepairContext::LocateBrokenFiles("Error in /src/components/Missing.jsx", project);
    assert(foreign.empty());
    assert(RepairContext::AllComponentFiles(project).size() == 2);

    const std::string text = "line about Hero.jsx\nunrelated line\n";
    assert(RepairContext::ErrorsForFile(text, "src/components/Hero.jsx") == "line about Hero.jsx\n");

    const auto lines = RepairContext::ErrorLines({"ready in 300ms", "Error: Failed to resolve import", "hmr update"});
    assert(lines.size() == 1);

    const std::string summary = RepairContext::CodebaseSummary(project, 120);
    assert(summary.rfind("-- src/App.jsx --", 0) == 0);
    assert(summary.size() <= 120);
    std::cout << "[PASS] Broken files located." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] ErrorFilter" << std::endl;
    TestSignalsAndNoise();
    TestStructuralFailures();
    TestReportFiltering();
    TestCustomPolicy();
    TestRepairContext();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
