/**
 * @file SiteSpecification.hpp
 * @brief Structured specification produced by the enrichment stage.
 */

#pragma once

#include <string>
#include <vector>

namespace webforge::domain {

/**
 * @struct SiteSpecification
 * @brief What the generation stage builds: sections, style and features.
 */
struct SiteSpecification {
    std::string projectName;
    std::string siteType = "general";
    std::string strategy = "react-sections"; ///< "react-sections" or "react-app".
    std::string title;
    std::string tagline;
    std::string description;
    std::string colorScheme;
    std::string style = "modern";
    std::string brandName;
    std::string targetAudience;
    std::string specialInstructions;
    std::vector<std::string> features;
    std::vector<std::string> sections;

    bool isSingleApp() const { return strategy == "react-app"; }
};

} // namespace webforge::domain
