/**
 * @file ProjectRepositoryFs.hpp
 * @brief Project storage on the local filesystem.
 */

#pragma once

#include <filesystem>
#include <mutex>
#include <string>

#include "domain/ProjectRepository.hpp"

namespace webforge::infrastructure {

/**
 * @class ProjectRepositoryFs
 * @brief One directory per project under a root; metadata in `.webforge/project.json`.
 *
 * Files are written atomically (temp file + rename) so a crash mid-write never
 * leaves a half-written source file for the dev server to pick up.
 */
class ProjectRepositoryFs : public domain::ProjectRepository {
public:
    explicit ProjectRepositoryFs(const std::string& rootPath);

    std::optional<domain::Project> load(const std::string& name) override;
    bool exists(const std::string& name) override;
    domain::Project create(const std::string& slug) override;
    void writeFile(domain::Project& project, const std::string& relPath, const std::string& content) override;
    void saveMetadata(const domain::Project& project) override;
    std::vector<domain::ProjectSummary> list() override;
    bool hasInstalledDependencies(const domain::Project& project) override;

    const std::filesystem::path& root() const { return m_root; }

    /** @brief Lowercase alphanumerics, at most 20 characters; empty if nothing is left. */
    static std::string SanitizeName(const std::string& name);

    /** @brief True for a relative path that stays inside the project. */
    static bool IsSafeRelativePath(const std::string& relPath);

private:
    std::filesystem::path ProjectDir(const std::string& name) const;
    static bool IsValidName(const std::string& name);
    static void AtomicWrite(const std::filesystem::path& finalPath, const std::string& content);

    std::filesystem::path m_root;
    std::mutex m_createMutex;
};

} // namespace webforge::infrastructure
