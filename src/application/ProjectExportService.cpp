#include "application/ProjectExportService.hpp"

#include <algorithm>
#include <ctime>
#include <nlohmann/json.hpp>

namespace webforge::application {

using json = nlohmann::json;

namespace {
const std::vector<std::string> kImportantFiles = {
    "src/App.jsx", "src/main.jsx", "src/index.css", "index.html",
    "package.json", "vite.config.js", "tailwind.config.js"
};
}

std::vector<std::pair<std::string, const domain::ProjectFile*>>
ProjectExportService::OrderedFiles(const domain::Project& project) {
    std::vector<std::pair<std::string, const domain::ProjectFile*>> ordered;
    const auto& files = project.getFiles();

    for (const auto& path : kImportantFiles) {
        auto it = files.find(path);
        if (it != files.end()) ordered.emplace_back(it->first, &it->second);
    }
    for (const auto& [path, file] : files) {
        if (std::find(kImportantFiles.begin(), kImportantFiles.end(), path) != kImportantFiles.end()) continue;
        ordered.emplace_back(path, &file);
    }
    return ordered;
}

std::string ProjectExportService::ToArchive(const domain::Project& project) {
    std::time_t now = std::time(nullptr);
    char dateBuf[64];
    std::strftime(dateBuf, sizeof(dateBuf), "%Y-%m-%dT%H:%M:%SZ", std::gmtime(&now));

    json files = json::object();
    for (const auto& [path, file] : OrderedFiles(project)) {
        files[path] = {
            {"content", file->content},
            {"size", file->size()}
        };
    }

    json archive = {
        {"project", project.getName()},
        {"exportedAt", dateBuf},
        {"state", domain::ProjectStateToString(project.getState())},
        {"files", files}
    };
    return archive.dump();
}

} // namespace webforge::application
