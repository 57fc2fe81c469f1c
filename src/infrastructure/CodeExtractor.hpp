/**
 * @file CodeExtractor.hpp
 * @brief Pulls usable JSX out of raw model output and strips imports that cannot resolve.
 */

#pragma once

#include <string>
#include <vector>

namespace webforge::infrastructure {

class CodeExtractor {
public:
    /**
     * @brief Returns the code inside the first fenced block, or the raw text when it
     *        already looks like code. Empty when nothing usable was produced.
     */
    static std::string Extract(const std::string& text);

    /**
     * @brief Deterministic clean-up applied to every generated component:
     *        `react-icons/all` becomes `react-icons/fi`, imports of packages
     *        that are not installed are removed.
     */
    static std::string Sanitize(const std::string& code, std::vector<std::string>* changes = nullptr);

    /** @brief True when the code declares a default export. */
    static bool HasDefaultExport(const std::string& code);

    /** @brief Packages whose imports are removed by Sanitize. */
    static const std::vector<std::string>& BannedPackages();
};

} // namespace webforge::infrastructure
