/**
 * @file PromptCatalog.hpp
 * @brief Central storage for the system and user prompts sent to the models.
 */

#pragma once

#include <string>

#include "domain/GenerationService.hpp"
#include "domain/SiteSpecification.hpp"

namespace webforge::infrastructure {

class PromptCatalog {
public:
    /** @brief System prompt of the enrichment stage (strict JSON output). */
    static std::string GetEnrichmentPrompt();

    /** @brief System prompt shared by every code-writing call. */
    static std::string GetBuilderSystemPrompt();

    /** @brief Single-component application ("react-app" strategy). */
    static std::string GetAppPrompt(const domain::SiteSpecification& spec);

    static std::string GetNavbarPrompt(const domain::SiteSpecification& spec);

    static std::string GetSectionPrompt(const std::string& section, const domain::SiteSpecification& spec);

    /** @brief Targeted fix of one broken component. */
    static std::string GetRepairPrompt(const std::string& componentName, const domain::RepairRequest& request);

    /** @brief Modify or create a component on the update path. */
    static std::string GetComponentPrompt(const domain::ComponentRequest& request);
};

} // namespace webforge::infrastructure
