/**
 * @file Project.cpp
 * @brief Implementation of the Project entity.
 */

#include "domain/Project.hpp"

#include <cstdio>

namespace webforge::domain {

namespace {
constexpr const char* kComponentDir = "src/components/";
constexpr const char* kComponentExt = ".jsx";
}

std::string ProjectFile::DisplaySize() const {
    const size_t bytes = content.size();
    if (bytes < 1024) {
        return std::to_string(bytes) + "B";
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1fKB", static_cast<double>(bytes) / 1024.0);
    return buf;
}

Project::Project(std::string name, std::string root)
    : m_name(std::move(name)), m_root(std::move(root)) {}

void Project::setFile(const std::string& relPath, const std::string& content) {
    m_files[relPath].content = content;
}

bool Project::hasFile(const std::string& relPath) const {
    return m_files.count(relPath) > 0;
}

std::optional<std::string> Project::getFileContent(const std::string& relPath) const {
    auto it = m_files.find(relPath);
    if (it == m_files.end()) return std::nullopt;
    return it->second.content;
}

std::vector<std::string> Project::ComponentNames() const {
    const std::string dir = kComponentDir;
    const std::string ext = kComponentExt;
    std::vector<std::string> names;
    for (const auto& [path, file] : m_files) {
        if (path.rfind(dir, 0) != 0) continue;
        if (path.size() <= dir.size() + ext.size()) continue;
        if (path.compare(path.size() - ext.size(), ext.size(), ext) != 0) continue;
        std::string stem = path.substr(dir.size(), path.size() - dir.size() - ext.size());
        if (stem.find('/') != std::string::npos) continue;
        names.push_back(stem);
    }
    // std::map iteration keeps them sorted already
    return names;
}

std::string Project::ComponentPath(const std::string& componentName) {
    return std::string(kComponentDir) + componentName + kComponentExt;
}

} // namespace webforge::domain
