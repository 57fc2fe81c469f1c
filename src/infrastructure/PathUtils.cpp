#include "infrastructure/PathUtils.hpp"

#include <cstdlib>

namespace webforge::infrastructure {

namespace fs = std::filesystem;

namespace {

constexpr const char* kAppDir = "WebForge";

fs::path XdgDir(const char* variable, const fs::path& homeRelative) {
    const char* value = std::getenv(variable);
    if (value && *value) return fs::path(value);
    const char* home = std::getenv("HOME");
    if (home && *home) return fs::path(home) / homeRelative;
    return fs::current_path();
}

} // namespace

fs::path PathUtils::GetDataHome() {
    return XdgDir("XDG_DATA_HOME", fs::path(".local") / "share");
}

fs::path PathUtils::GetConfigHome() {
    return XdgDir("XDG_CONFIG_HOME", ".config");
}

fs::path PathUtils::GetProjectsDir() {
    return GetDataHome() / kAppDir / "projects";
}

fs::path PathUtils::GetSettingsFile() {
    return GetConfigHome() / kAppDir / "settings.json";
}

} // namespace webforge::infrastructure
