/**
 * @file ProjectRepository.hpp
 * @brief Interface for persistence of generated projects.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/Project.hpp"

namespace webforge::domain {

/**
 * @class ProjectRepository
 * @brief Abstract storage of projects, their files and metadata.
 */
class ProjectRepository {
public:
    virtual ~ProjectRepository() = default;

    /** @brief Loads a project with its full file set. */
    virtual std::optional<Project> load(const std::string& name) = 0;

    virtual bool exists(const std::string& name) = 0;

    /**
     * @brief Reserves a new project directory.
     * @param slug Preferred name; a numeric suffix is added when it is taken.
     */
    virtual Project create(const std::string& slug) = 0;

    /**
     * @brief Writes one file to disk and records it in the project.
     * @throws std::runtime_error when the write fails.
     */
    virtual void writeFile(Project& project, const std::string& relPath, const std::string& content) = 0;

    /** @brief Persists lifecycle state and timestamps. */
    virtual void saveMetadata(const Project& project) = 0;

    /** @brief All projects, most recently modified first. */
    virtual std::vector<ProjectSummary> list() = 0;

    /** @brief True when the dependency install step can be skipped. */
    virtual bool hasInstalledDependencies(const Project& project) = 0;
};

} // namespace webforge::domain
