/**
 * @file OllamaGenerationService.hpp
 * @brief Generation collaborator: scaffold templates plus model-written components.
 */

#pragma once

#include <memory>
#include <string>

#include "domain/GenerationService.hpp"
#include "infrastructure/ModelManager.hpp"
#include "infrastructure/OllamaClient.hpp"

namespace webforge::infrastructure {

/**
 * @class OllamaGenerationService
 * @brief Streams component code from an Ollama chat model.
 *
 * Boilerplate files come from ScaffoldTemplates; only components go through the
 * model. Every component is extracted and sanitized before it is returned.
 */
class OllamaGenerationService : public domain::GenerationService {
public:
    OllamaGenerationService(std::shared_ptr<OllamaClient> client, std::shared_ptr<ModelManager> models);

    std::unique_ptr<domain::FileStream> generate(const domain::SiteSpecification& spec,
                                                 const domain::GenerationContext& ctx) override;

    domain::GenerationResult repair(const domain::RepairRequest& request,
                                    const domain::GenerationContext& ctx) override;

    domain::GenerationResult generateComponent(const domain::ComponentRequest& request,
                                               const domain::GenerationContext& ctx) override;

    /** @brief Relative paths and contents of the files that need no model. */
    static std::vector<domain::GeneratedFile> ScaffoldFiles(const domain::SiteSpecification& spec);

    /** @brief Streams one chat completion and returns the raw text. */
    static ChatResponse StreamCompletion(OllamaClient& client, const std::string& label,
                                         const std::string& userPrompt, double temperature,
                                         const domain::GenerationContext& ctx);

    /** @brief Extract + sanitize; empty when the output has no default export. */
    static std::string CleanComponent(const std::string& raw, const std::string& label);

private:
    domain::GenerationResult GenerateChecked(const std::string& label, const std::string& prompt,
                                             double temperature, const domain::GenerationContext& ctx);

    std::shared_ptr<OllamaClient> m_client;
    std::shared_ptr<ModelManager> m_models;
};

} // namespace webforge::infrastructure
