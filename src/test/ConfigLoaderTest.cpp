#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include <unistd.h>

#include "infrastructure/ConfigLoader.hpp"

using webforge::infrastructure::AppConfig;
using webforge::infrastructure::ConfigLoader;
namespace fs = std::filesystem;

namespace {

fs::path WriteTemp(const std::string& name, const std::string& content) {
    const fs::path path = fs::temp_directory_path() / ("webforge-config-" + std::to_string(::getpid()) + "-" + name);
    std::ofstream out(path);
    out << content;
    return path;
}

void TestDefaults() {
    std::cout << "[Test] Defaults..." << std::endl;
    AppConfig config;
    assert(config.devServerPort == 5173);
    assert(config.maxFixAttempts == 3);
    assert(config.maxConcurrentRuns == 2);
    assert(config.refineModel == "llama3.1:8b");
    assert(config.serveCommand.find("{port}") != std::string::npos);
    assert(config.errorSignals.empty() && config.errorNoise.empty());
    assert(config.testCommand.find("{url}") != std::string::npos);
    assert(config.testCommand.find(WEBFORGE_RUNNER_SCRIPT) != std::string::npos);
    assert(fs::exists(WEBFORGE_RUNNER_SCRIPT));
    std::cout << "[PASS] Defaults are in place." << std::endl;
}

void TestFileOverrides() {
    std::cout << "[Test] settings.json overrides..." << std::endl;
    const auto path = WriteTemp("ok.json", R"({
        "httpPort": 9000,
        "devServerPort": 6000,
        "buildModel": "codellama:13b",
        "maxFixAttempts": 5,
        "keepServerAfterRun": false,
        "errorFilter": {"signals": ["FatalThing"], "noise": ["chatter"]}
    })");

    AppConfig config;
    assert(ConfigLoader::ApplyFile(path.string(), config));
    assert(config.httpPort == 9000);
    assert(config.devServerPort == 6000);
    assert(config.buildModel == "codellama:13b");
    assert(config.maxFixAttempts == 5);
    assert(!config.keepServerAfterRun);
    assert(config.errorSignals.size() == 1 && config.errorSignals[0] == "FatalThing");
    assert(config.errorNoise.size() == 1 && config.errorNoise[0] == "chatter");
    // Untouched keys keep their defaults.
    assert(config.refineModel == "llama3.1:8b");
    fs::remove(path);
    std::cout << "[PASS] File values override defaults." << std::endl;
}

void TestMalformedFile() {
    std::cout << "[Test] Malformed settings.json..." << std::endl;
    const auto path = WriteTemp("bad.json", R"({"httpPort": 9000, "maxFixAttempts": "many")");
    AppConfig config;
    assert(!ConfigLoader::ApplyFile(path.string(), config));
    assert(config.httpPort == 7824);

    // A type mismatch is rejected as a whole too.
    const auto mistyped = WriteTemp("typed.json", R"({"httpPort": 9000, "maxFixAttempts": "many"})");
    assert(!ConfigLoader::ApplyFile(mistyped.string(), config));
    assert(config.httpPort == 7824);
    assert(config.maxFixAttempts == 3);
    fs::remove(path);
    fs::remove(mistyped);
    std::cout << "[PASS] Bad files leave the configuration untouched." << std::endl;
}

void TestEnvironmentOverrides() {
    std::cout << "[Test] WEBFORGE_* overrides..." << std::endl;
    ::setenv("WEBFORGE_DEV_SERVER_PORT", "6100", 1);
    ::setenv("WEBFORGE_MAX_CONCURRENT_RUNS", "oops", 1);
    ::setenv("WEBFORGE_CANCEL_ON_DISCONNECT", "true", 1);
    ::setenv("WEBFORGE_PROJECTS_DIR", "/tmp/webforge-projects", 1);

    const auto path = WriteTemp("env.json", R"({"devServerPort": 6000, "maxConcurrentRuns": 4})");
    const AppConfig config = ConfigLoader::Load(path.string());
    assert(config.devServerPort == 6100);
    assert(config.maxConcurrentRuns == 4);
    assert(config.cancelOnDisconnect);
    assert(config.projectsDir == "/tmp/webforge-projects");

    ::unsetenv("WEBFORGE_DEV_SERVER_PORT");
    ::unsetenv("WEBFORGE_MAX_CONCURRENT_RUNS");
    ::unsetenv("WEBFORGE_CANCEL_ON_DISCONNECT");
    ::unsetenv("WEBFORGE_PROJECTS_DIR");
    fs::remove(path);
    std::cout << "[PASS] Environment wins over the file; bad numbers are ignored." << std::endl;
}

void TestMissingExplicitFile() {
    std::cout << "[Test] Missing --config file..." << std::endl;
    const AppConfig config = ConfigLoader::Load(std::string("/nonexistent/webforge/settings.json"));
    assert(config.httpPort == 7824);
    assert(!config.projectsDir.empty());
    std::cout << "[PASS] Defaults are used and a projects dir is resolved." << std::endl;
}

} // namespace

int main() {
    TestDefaults();
    TestFileOverrides();
    TestMalformedFile();
    TestEnvironmentOverrides();
    TestMissingExplicitFile();
    std::cout << "All config loader tests passed." << std::endl;
    return 0;
}
