/**
 * @file OllamaEnrichmentService.hpp
 * @brief Enrichment collaborator backed by an Ollama chat model.
 */

#pragma once

#include <memory>
#include <string>

#include "domain/EnrichmentService.hpp"
#include "infrastructure/ModelManager.hpp"
#include "infrastructure/OllamaClient.hpp"

namespace webforge::infrastructure {

/**
 * @class OllamaEnrichmentService
 * @brief Classifies the idea with the model and completes it with the site catalog.
 *
 * The model picks site type, copy and style; sections and build strategy come
 * from a fixed catalog keyed by site type so generation always gets a known
 * component layout.
 */
class OllamaEnrichmentService : public domain::EnrichmentService {
public:
    OllamaEnrichmentService(std::shared_ptr<OllamaClient> client, std::shared_ptr<ModelManager> models);

    domain::SiteSpecification enrich(const std::string& ideaText, const std::string& modelId) override;

    /** @brief Keyword-based site type, used when the model's answer is not in the catalog. */
    static std::string DetectSiteType(const std::string& ideaText);

    /**
     * @brief Builds the specification from the model's JSON answer.
     * @throws domain::CollaboratorError when the answer holds no JSON object.
     */
    static domain::SiteSpecification ParseSpecification(const std::string& ideaText, const std::string& modelOutput);

private:
    std::shared_ptr<OllamaClient> m_client;
    std::shared_ptr<ModelManager> m_models;
};

} // namespace webforge::infrastructure
