/**
 * @file Project.hpp
 * @brief Project entity: a generated front-end project on disk.
 */

#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace webforge::domain {

/**
 * @enum ProjectState
 * @brief Lifecycle state of a project.
 */
enum class ProjectState {
    New,        ///< Created, no build finished yet.
    Building,   ///< A pipeline run currently owns the project.
    Ready,      ///< Last run finished successfully.
    Failed      ///< Last run failed; partial files are kept for inspection.
};

inline std::string ProjectStateToString(ProjectState state) {
    switch (state) {
        case ProjectState::New: return "new";
        case ProjectState::Building: return "building";
        case ProjectState::Ready: return "ready";
        case ProjectState::Failed: return "failed";
    }
    return "new";
}

inline ProjectState ProjectStateFromString(const std::string& value) {
    if (value == "building") return ProjectState::Building;
    if (value == "ready") return ProjectState::Ready;
    if (value == "failed") return ProjectState::Failed;
    return ProjectState::New;
}

/**
 * @struct ProjectFile
 * @brief One generated file of a project.
 */
struct ProjectFile {
    std::string content;

    size_t size() const { return content.size(); }

    /** @brief Human-readable size ("512B", "1.4KB"). */
    std::string DisplaySize() const;
};

/**
 * @class Project
 * @brief Identity, on-disk root and current file set of a generated project.
 *
 * Mutated only by the pipeline run that holds the project lock.
 */
class Project {
public:
    using Clock = std::chrono::system_clock;

    Project() = default;
    Project(std::string name, std::string root);

    const std::string& getName() const { return m_name; }
    const std::string& getRoot() const { return m_root; }

    ProjectState getState() const { return m_state; }
    void setState(ProjectState state) { m_state = state; }

    Clock::time_point getCreatedAt() const { return m_createdAt; }
    void setCreatedAt(Clock::time_point tp) { m_createdAt = tp; }

    std::optional<Clock::time_point> getLastSuccessfulBuild() const { return m_lastSuccessfulBuild; }
    void markSuccessfulBuild(Clock::time_point tp) { m_lastSuccessfulBuild = tp; }

    const std::map<std::string, ProjectFile>& getFiles() const { return m_files; }
    void setFile(const std::string& relPath, const std::string& content);
    bool hasFile(const std::string& relPath) const;
    std::optional<std::string> getFileContent(const std::string& relPath) const;

    /** @brief Component names (stems of src/components/*.jsx), sorted. */
    std::vector<std::string> ComponentNames() const;

    /** @brief Relative path of a component file. */
    static std::string ComponentPath(const std::string& componentName);

    /** @brief Relative path of the composition root. */
    static constexpr const char* kCompositionRoot = "src/App.jsx";

private:
    std::string m_name;
    std::string m_root;
    ProjectState m_state = ProjectState::New;
    Clock::time_point m_createdAt = Clock::now();
    std::optional<Clock::time_point> m_lastSuccessfulBuild;
    std::map<std::string, ProjectFile> m_files;
};

/**
 * @struct ProjectSummary
 * @brief Listing entry for the project browser.
 */
struct ProjectSummary {
    std::string name;
    std::string title;
    long long mtime = 0;
    size_t fileCount = 0;
    ProjectState state = ProjectState::New;
};

} // namespace webforge::domain
