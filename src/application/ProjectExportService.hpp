/**
 * @file ProjectExportService.hpp
 * @brief Read-only views of a project's file set (export archive, file listing).
 */

#pragma once

#include <string>
#include <utility>
#include <vector>

#include "domain/Project.hpp"

namespace webforge::application {

class ProjectExportService {
public:
    /**
     * @brief Serializes the file set as `{project, exportedAt, files: {path: {content, size}}}`.
     */
    static std::string ToArchive(const domain::Project& project);

    /**
     * @brief Files with the entry points first (App, main, styles, html, configs), then the rest sorted.
     */
    static std::vector<std::pair<std::string, const domain::ProjectFile*>> OrderedFiles(const domain::Project& project);
};

} // namespace webforge::application
