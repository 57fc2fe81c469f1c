/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace webforge::infrastructure {

namespace {

std::optional<std::string> Env(const char* name) {
    const char* value = std::getenv(name);
    if (value && *value) return std::string(value);
    return std::nullopt;
}

void EnvInt(const char* name, int& target) {
    if (auto value = Env(name)) {
        try {
            target = std::stoi(*value);
        } catch (const std::exception&) {
            std::cerr << "[ConfigLoader] Ignoring non-numeric " << name << "=" << *value << std::endl;
        }
    }
}

void EnvBool(const char* name, bool& target) {
    if (auto value = Env(name)) {
        target = (*value == "1" || *value == "true" || *value == "yes");
    }
}

void EnvString(const char* name, std::string& target) {
    if (auto value = Env(name)) target = *value;
}

} // namespace

AppConfig ConfigLoader::Load(const std::optional<std::string>& path) {
    AppConfig config;
    const std::string file = path ? *path : PathUtils::GetSettingsFile().string();

    if (std::filesystem::exists(file)) {
        ApplyFile(file, config);
    } else if (path) {
        std::cerr << "[ConfigLoader] Config file not found: " << file << std::endl;
    }

    ApplyEnvironment(config);
    if (config.projectsDir.empty()) {
        config.projectsDir = PathUtils::GetProjectsDir().string();
    }
    return config;
}

bool ConfigLoader::ApplyFile(const std::string& path, AppConfig& config) {
    try {
        std::ifstream f(path);
        nlohmann::json j;
        f >> j;

        AppConfig next = config;
        next.httpPort = j.value("httpPort", next.httpPort);
        next.gatewayPort = j.value("gatewayPort", next.gatewayPort);
        next.devServerHost = j.value("devServerHost", next.devServerHost);
        next.devServerPort = j.value("devServerPort", next.devServerPort);
        next.ollamaHost = j.value("ollamaHost", next.ollamaHost);
        next.ollamaPort = j.value("ollamaPort", next.ollamaPort);
        next.refineModel = j.value("refineModel", next.refineModel);
        next.buildModel = j.value("buildModel", next.buildModel);
        next.unloadModelsBetweenStages = j.value("unloadModelsBetweenStages", next.unloadModelsBetweenStages);
        next.maxFixAttempts = j.value("maxFixAttempts", next.maxFixAttempts);
        next.maxConcurrentRuns = j.value("maxConcurrentRuns", next.maxConcurrentRuns);
        next.projectsDir = j.value("projectsDir", next.projectsDir);
        next.installCommand = j.value("installCommand", next.installCommand);
        next.serveCommand = j.value("serveCommand", next.serveCommand);
        next.testCommand = j.value("testCommand", next.testCommand);
        next.installTimeoutSeconds = j.value("installTimeoutSeconds", next.installTimeoutSeconds);
        next.portWaitSeconds = j.value("portWaitSeconds", next.portWaitSeconds);
        next.testTimeoutSeconds = j.value("testTimeoutSeconds", next.testTimeoutSeconds);
        next.stopGraceMillis = j.value("stopGraceMillis", next.stopGraceMillis);
        next.cancelOnDisconnect = j.value("cancelOnDisconnect", next.cancelOnDisconnect);
        next.keepServerAfterRun = j.value("keepServerAfterRun", next.keepServerAfterRun);

        if (j.contains("errorFilter") && j["errorFilter"].is_object()) {
            const auto& filter = j["errorFilter"];
            if (filter.contains("signals")) next.errorSignals = filter["signals"].get<std::vector<std::string>>();
            if (filter.contains("noise")) next.errorNoise = filter["noise"].get<std::vector<std::string>>();
        }

        config = next;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << path << ": " << e.what() << std::endl;
        return false;
    }
}

void ConfigLoader::ApplyEnvironment(AppConfig& config) {
    EnvInt("WEBFORGE_HTTP_PORT", config.httpPort);
    EnvInt("WEBFORGE_GATEWAY_PORT", config.gatewayPort);
    EnvString("WEBFORGE_DEV_SERVER_HOST", config.devServerHost);
    EnvInt("WEBFORGE_DEV_SERVER_PORT", config.devServerPort);
    EnvString("WEBFORGE_OLLAMA_HOST", config.ollamaHost);
    EnvInt("WEBFORGE_OLLAMA_PORT", config.ollamaPort);
    EnvString("WEBFORGE_REFINE_MODEL", config.refineModel);
    EnvString("WEBFORGE_BUILD_MODEL", config.buildModel);
    EnvInt("WEBFORGE_MAX_FIX_ATTEMPTS", config.maxFixAttempts);
    EnvInt("WEBFORGE_MAX_CONCURRENT_RUNS", config.maxConcurrentRuns);
    EnvString("WEBFORGE_PROJECTS_DIR", config.projectsDir);
    EnvString("WEBFORGE_INSTALL_COMMAND", config.installCommand);
    EnvString("WEBFORGE_SERVE_COMMAND", config.serveCommand);
    EnvString("WEBFORGE_TEST_COMMAND", config.testCommand);
    EnvBool("WEBFORGE_CANCEL_ON_DISCONNECT", config.cancelOnDisconnect);
    EnvBool("WEBFORGE_KEEP_SERVER_AFTER_RUN", config.keepServerAfterRun);
}

} // namespace webforge::infrastructure
