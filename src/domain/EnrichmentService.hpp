/**
 * @file EnrichmentService.hpp
 * @brief Interface for turning a raw idea into a structured site specification.
 */

#pragma once

#include <string>

#include "domain/SiteSpecification.hpp"

namespace webforge::domain {

/**
 * @class EnrichmentService
 * @brief Abstract enrichment collaborator.
 */
class EnrichmentService {
public:
    virtual ~EnrichmentService() = default;

    /**
     * @brief Enriches a free-text idea into a specification.
     * @param ideaText The user's idea, already validated as non-empty.
     * @param modelId Model used for the enrichment call.
     * @throws CollaboratorError on malformed or empty model output.
     * @throws InfrastructureError when the model server is unreachable.
     *
     * Safe to call twice with the same arguments.
     */
    virtual SiteSpecification enrich(const std::string& ideaText, const std::string& modelId) = 0;
};

} // namespace webforge::domain
