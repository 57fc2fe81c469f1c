/**
 * @file ConfigLoader.hpp
 * @brief Loads the engine configuration (settings.json plus WEBFORGE_* overrides).
 *
 * Keeps JSON parsing of the settings file in one place instead of scattering
 * it through the composition root.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

// Browser check shipped in tools/; the build points this at its absolute path.
#ifndef WEBFORGE_RUNNER_SCRIPT
#define WEBFORGE_RUNNER_SCRIPT "/usr/local/share/webforge/webforge-smoke.mjs"
#endif

namespace webforge::infrastructure {

/**
 * @struct AppConfig
 * @brief Every tunable of the engine with its default value.
 */
struct AppConfig {
    int httpPort = 7824;
    int gatewayPort = 7825;

    std::string devServerHost = "localhost";
    int devServerPort = 5173;

    std::string ollamaHost = "localhost";
    int ollamaPort = 11434;
    std::string refineModel = "llama3.1:8b";
    std::string buildModel = "qwen2.5-coder:14b";
    bool unloadModelsBetweenStages = true;

    int maxFixAttempts = 3;
    int maxConcurrentRuns = 2;

    std::string projectsDir; ///< Empty means $XDG_DATA_HOME/WebForge/projects.
    std::string installCommand = "npm install";
    std::string serveCommand = "npm run dev -- --port {port} --strictPort --host {host}";
    std::string testCommand = "node '" WEBFORGE_RUNNER_SCRIPT "' {url}";

    int installTimeoutSeconds = 300;
    int portWaitSeconds = 35;
    int testTimeoutSeconds = 120;
    int stopGraceMillis = 3000;

    bool cancelOnDisconnect = false;
    bool keepServerAfterRun = true;

    std::vector<std::string> errorSignals; ///< Empty keeps the built-in allow-list.
    std::vector<std::string> errorNoise;   ///< Empty keeps the built-in deny-list.
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json (default location unless `path` is given), then env overrides.
     * Missing or malformed files fall back to defaults with a logged error.
     */
    static AppConfig Load(const std::optional<std::string>& path = std::nullopt);

    /** @brief Applies a settings.json document on top of `config`. Returns false on parse errors. */
    static bool ApplyFile(const std::string& path, AppConfig& config);

    /** @brief Applies WEBFORGE_* environment variables. */
    static void ApplyEnvironment(AppConfig& config);
};

} // namespace webforge::infrastructure
