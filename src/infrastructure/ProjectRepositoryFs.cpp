/**
 * @file ProjectRepositoryFs.cpp
 * @brief Implementation of ProjectRepositoryFs.
 */

#include "infrastructure/ProjectRepositoryFs.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <regex>
#include <set>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace webforge::infrastructure {

using json = nlohmann::json;
using namespace webforge::domain;

namespace {

constexpr const char* kMetaDir = ".webforge";
constexpr const char* kMetaFile = "project.json";
constexpr std::uintmax_t kMaxLoadedFileSize = 512 * 1024;

const std::set<std::string> kSkippedDirs = {"node_modules", ".webforge", "dist", ".git", ".vite"};

long long ToEpochSeconds(Project::Clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

Project::Clock::time_point FromEpochSeconds(long long seconds) {
    return Project::Clock::time_point(std::chrono::seconds(seconds));
}

long long FileTimeToEpoch(fs::file_time_type ftime) {
    const auto sctp = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        ftime - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
    return ToEpochSeconds(sctp);
}

std::string ReadAll(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

bool IsSkipped(const fs::path& relative) {
    for (const auto& part : relative) {
        if (kSkippedDirs.count(part.string())) return true;
    }
    return false;
}

std::string TitleFromHtml(const std::string& html) {
    static const std::regex titleRe("<title>([^<]*)</title>", std::regex::icase);
    std::smatch match;
    if (std::regex_search(html, match, titleRe)) return match[1].str();
    return "";
}

} // namespace

ProjectRepositoryFs::ProjectRepositoryFs(const std::string& rootPath) : m_root(rootPath) {
    if (!fs::exists(m_root)) fs::create_directories(m_root);
}

std::string ProjectRepositoryFs::SanitizeName(const std::string& name) {
    std::string out;
    for (char c : name) {
        const unsigned char uc = static_cast<unsigned char>(std::tolower(static_cast<unsigned char>(c)));
        if ((uc >= 'a' && uc <= 'z') || (uc >= '0' && uc <= '9')) out += static_cast<char>(uc);
        if (out.size() == 20) break;
    }
    return out;
}

bool ProjectRepositoryFs::IsValidName(const std::string& name) {
    if (name.empty() || name.size() > 64 || name[0] == '.') return false;
    return std::all_of(name.begin(), name.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
    });
}

bool ProjectRepositoryFs::IsSafeRelativePath(const std::string& relPath) {
    if (relPath.empty() || relPath.size() > 240) return false;
    const fs::path path(relPath);
    if (path.is_absolute() || path.has_root_name()) return false;
    for (const auto& part : path) {
        const std::string p = part.string();
        if (p == ".." || p == "." || p.empty()) return false;
    }
    return !IsSkipped(path);
}

fs::path ProjectRepositoryFs::ProjectDir(const std::string& name) const {
    return m_root / name;
}

bool ProjectRepositoryFs::exists(const std::string& name) {
    if (!IsValidName(name)) return false;
    std::error_code ec;
    return fs::is_directory(ProjectDir(name), ec);
}

std::optional<Project> ProjectRepositoryFs::load(const std::string& name) {
    if (!exists(name)) return std::nullopt;

    const fs::path dir = ProjectDir(name);
    Project project(name, dir.string());

    const fs::path metaPath = dir / kMetaDir / kMetaFile;
    if (fs::exists(metaPath)) {
        try {
            const json meta = json::parse(ReadAll(metaPath));
            project.setState(ProjectStateFromString(meta.value("state", "new")));
            if (meta.contains("createdAt")) {
                project.setCreatedAt(FromEpochSeconds(meta["createdAt"].get<long long>()));
            }
            if (meta.contains("lastSuccessfulBuild") && !meta["lastSuccessfulBuild"].is_null()) {
                project.markSuccessfulBuild(FromEpochSeconds(meta["lastSuccessfulBuild"].get<long long>()));
            }
        } catch (const std::exception& e) {
            std::cerr << "[ProjectRepository] Bad metadata for " << name << ": " << e.what() << std::endl;
        }
    }

    try {
        for (auto it = fs::recursive_directory_iterator(dir); it != fs::recursive_directory_iterator(); ++it) {
            const fs::path relative = fs::relative(it->path(), dir);
            if (it->is_directory() && kSkippedDirs.count(it->path().filename().string())) {
                it.disable_recursion_pending();
                continue;
            }
            if (!it->is_regular_file() || IsSkipped(relative)) continue;
            if (it->path().extension() == ".tmp" || it->file_size() > kMaxLoadedFileSize) continue;
            project.setFile(relative.generic_string(), ReadAll(it->path()));
        }
    } catch (const fs::filesystem_error& e) {
        std::cerr << "[ProjectRepository] Error reading " << name << ": " << e.what() << std::endl;
        return std::nullopt;
    }
    return project;
}

Project ProjectRepositoryFs::create(const std::string& slug) {
    std::string base = SanitizeName(slug);
    if (base.empty()) base = "project";

    std::lock_guard<std::mutex> lock(m_createMutex);
    std::string name = base;
    for (int suffix = 2; ; ++suffix) {
        std::error_code ec;
        if (fs::create_directory(ProjectDir(name), ec)) break;
        if (ec) {
            throw std::runtime_error("Cannot create project directory " + ProjectDir(name).string() +
                                     ": " + ec.message());
        }
        name = base + "-" + std::to_string(suffix);
    }

    Project project(name, ProjectDir(name).string());
    project.setState(ProjectState::New);
    saveMetadata(project);
    std::cout << "[ProjectRepository] Created project " << name << std::endl;
    return project;
}

void ProjectRepositoryFs::AtomicWrite(const fs::path& finalPath, const std::string& content) {
    const auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    if (finalPath.has_parent_path()) {
        fs::create_directories(finalPath.parent_path());
    }

    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            throw std::runtime_error("Failed to open temp file: " + tempPath.string());
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            ofs.close();
            std::error_code ec;
            fs::remove(tempPath, ec);
            throw std::runtime_error("Write failed: " + tempPath.string());
        }
    }

    try {
        fs::rename(tempPath, finalPath);
    } catch (const fs::filesystem_error& e) {
        std::error_code ec;
        fs::remove(tempPath, ec);
        throw std::runtime_error(std::string("Rename failed: ") + e.what());
    }
}

void ProjectRepositoryFs::writeFile(Project& project, const std::string& relPath, const std::string& content) {
    if (!IsSafeRelativePath(relPath)) {
        throw std::runtime_error("Refusing to write outside the project: " + relPath);
    }
    AtomicWrite(fs::path(project.getRoot()) / relPath, content);
    project.setFile(relPath, content);
}

void ProjectRepositoryFs::saveMetadata(const Project& project) {
    json meta = {
        {"name", project.getName()},
        {"state", ProjectStateToString(project.getState())},
        {"createdAt", ToEpochSeconds(project.getCreatedAt())},
        {"updatedAt", ToEpochSeconds(Project::Clock::now())},
        {"lastSuccessfulBuild", nullptr}
    };
    if (auto last = project.getLastSuccessfulBuild()) {
        meta["lastSuccessfulBuild"] = ToEpochSeconds(*last);
    }
    AtomicWrite(fs::path(project.getRoot()) / kMetaDir / kMetaFile, meta.dump(2));
}

std::vector<ProjectSummary> ProjectRepositoryFs::list() {
    std::vector<ProjectSummary> projects;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(m_root, ec)) {
        if (!entry.is_directory()) continue;
        const std::string name = entry.path().filename().string();
        if (!IsValidName(name)) continue;

        ProjectSummary summary;
        summary.name = name;
        summary.mtime = FileTimeToEpoch(entry.last_write_time());

        const fs::path metaPath = entry.path() / kMetaDir / kMetaFile;
        if (fs::exists(metaPath)) {
            try {
                const json meta = json::parse(ReadAll(metaPath));
                summary.state = ProjectStateFromString(meta.value("state", "new"));
                summary.mtime = std::max(summary.mtime, meta.value("updatedAt", 0LL));
            } catch (const std::exception& e) {
                std::cerr << "[ProjectRepository] Bad metadata for " << name << ": " << e.what() << std::endl;
            }
        }

        std::error_code walkEc;
        for (auto it = fs::recursive_directory_iterator(entry.path(), walkEc);
             !walkEc && it != fs::recursive_directory_iterator(); it.increment(walkEc)) {
            if (it->is_directory() && kSkippedDirs.count(it->path().filename().string())) {
                it.disable_recursion_pending();
                continue;
            }
            if (it->is_regular_file()) ++summary.fileCount;
        }

        const fs::path html = entry.path() / "index.html";
        if (fs::exists(html)) summary.title = TitleFromHtml(ReadAll(html));
        if (summary.title.empty()) summary.title = name;

        projects.push_back(summary);
    }

    std::sort(projects.begin(), projects.end(),
              [](const ProjectSummary& a, const ProjectSummary& b) { return a.mtime > b.mtime; });
    return projects;
}

bool ProjectRepositoryFs::hasInstalledDependencies(const Project& project) {
    std::error_code ec;
    return fs::exists(fs::path(project.getRoot()) / "node_modules" / ".bin" / "vite", ec);
}

} // namespace webforge::infrastructure
