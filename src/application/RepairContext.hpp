/**
 * @file RepairContext.hpp
 * @brief Helpers that turn test failures into targeted repair requests.
 */

#pragma once

#include <string>
#include <vector>

#include "domain/Project.hpp"
#include "domain/TestService.hpp"

namespace webforge::application {

class RepairContext {
public:
    /**
     * @brief Files implicated by the error text, restricted to files the project owns.
     *
     * Priority: compile-overlay file, then the component named by a React
     * runtime error, then component paths in non-stack-trace lines.
     */
    static std::vector<std::string> LocateBrokenFiles(const std::string& errorText,
                                                      const domain::Project& project);

    /** @brief Every component file of the project (used when nothing could be located). */
    static std::vector<std::string> AllComponentFiles(const domain::Project& project);

    /** @brief Lines of the error text that mention the file; a prefix of the whole text otherwise. */
    static std::string ErrorsForFile(const std::string& errorText, const std::string& filePath);

    /** @brief Truncated listing of the project's files for the model. */
    static std::string CodebaseSummary(const domain::Project& project, size_t maxChars = 6000);

    /** @brief Joins error messages with diagnostics lines into one context block. */
    static std::string Compose(const std::vector<domain::TestError>& errors,
                               const std::vector<std::string>& diagnostics);

    /** @brief Output lines that look like errors (used on dev server output). */
    static std::vector<std::string> ErrorLines(const std::vector<std::string>& lines, size_t maxLines = 40);
};

} // namespace webforge::application
