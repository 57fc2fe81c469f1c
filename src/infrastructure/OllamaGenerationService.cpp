#include "infrastructure/OllamaGenerationService.hpp"

#include "domain/Errors.hpp"
#include "domain/Project.hpp"
#include "infrastructure/CodeExtractor.hpp"
#include "infrastructure/PromptCatalog.hpp"
#include "infrastructure/ScaffoldTemplates.hpp"

#include <deque>
#include <filesystem>
#include <iostream>

namespace webforge::infrastructure {

using json = nlohmann::json;
using namespace webforge::domain;

namespace {

constexpr double kGenerateTemperature = 0.15;
constexpr double kRepairTemperature = 0.05;

std::string StemOf(const std::string& path) {
    return std::filesystem::path(path).stem().string();
}

void ThrowIfCancelled(const GenerationContext& ctx) {
    if (ctx.cancel && ctx.cancel->isCancelled()) throw RunCancelled();
}

/**
 * Scaffold files first (instant), then one model call per component. The
 * model is held loaded for the lifetime of the stream.
 */
class OllamaFileStream : public FileStream {
public:
    struct Planned {
        std::string name;
        std::string prompt;
        std::string fallback;
    };

    OllamaFileStream(std::shared_ptr<OllamaClient> client, std::shared_ptr<ModelManager> models,
                     GenerationContext ctx, std::deque<GeneratedFile> scaffold, std::deque<Planned> components)
        : m_client(std::move(client)),
          m_models(std::move(models)),
          m_lease(std::make_unique<ModelManager::Lease>(*m_models, ctx.modelId)),
          m_ctx(std::move(ctx)),
          m_scaffold(std::move(scaffold)),
          m_components(std::move(components)) {}

    std::optional<GeneratedFile> next() override {
        ThrowIfCancelled(m_ctx);
        if (!m_scaffold.empty()) {
            GeneratedFile file = std::move(m_scaffold.front());
            m_scaffold.pop_front();
            return file;
        }
        if (m_components.empty()) {
            m_lease.reset();
            return std::nullopt;
        }

        Planned planned = std::move(m_components.front());
        m_components.pop_front();
        const std::string path = Project::ComponentPath(planned.name);

        std::cout << "[Generation] Generating " << planned.name << "..." << std::endl;
        auto response = OllamaGenerationService::StreamCompletion(*m_client, path, planned.prompt,
                                                                  kGenerateTemperature, m_ctx);
        ThrowIfCancelled(m_ctx);
        m_usage += response.usage;

        std::string code = OllamaGenerationService::CleanComponent(response.content, planned.name);
        if (code.empty()) {
            std::cerr << "[Generation] Unusable output for " << planned.name << ", using fallback" << std::endl;
            code = planned.fallback;
        }
        return GeneratedFile{path, code};
    }

    TokenUsage usage() const override { return m_usage; }

private:
    std::shared_ptr<OllamaClient> m_client;
    std::shared_ptr<ModelManager> m_models;
    std::unique_ptr<ModelManager::Lease> m_lease;
    GenerationContext m_ctx;
    std::deque<GeneratedFile> m_scaffold;
    std::deque<Planned> m_components;
    TokenUsage m_usage;
};

} // namespace

OllamaGenerationService::OllamaGenerationService(std::shared_ptr<OllamaClient> client,
                                                 std::shared_ptr<ModelManager> models)
    : m_client(std::move(client)), m_models(std::move(models)) {}

std::vector<GeneratedFile> OllamaGenerationService::ScaffoldFiles(const SiteSpecification& spec) {
    std::vector<GeneratedFile> files = {
        {"package.json", ScaffoldTemplates::PackageJson(spec.title)},
        {"vite.config.js", ScaffoldTemplates::ViteConfig()},
        {"tailwind.config.js", ScaffoldTemplates::TailwindConfig()},
        {"postcss.config.js", ScaffoldTemplates::PostcssConfig()},
        {"index.html", ScaffoldTemplates::IndexHtml(spec.title)},
        {"src/main.jsx", ScaffoldTemplates::MainJsx()},
        {"src/index.css", ScaffoldTemplates::IndexCss(spec.colorScheme)},
    };
    files.push_back({Project::kCompositionRoot, spec.isSingleApp()
                                                    ? ScaffoldTemplates::SingleAppShell()
                                                    : ScaffoldTemplates::AppShell(spec.title, spec.sections)});
    return files;
}

std::unique_ptr<FileStream> OllamaGenerationService::generate(const SiteSpecification& spec,
                                                              const GenerationContext& ctx) {
    auto scaffold = ScaffoldFiles(spec);
    std::deque<OllamaFileStream::Planned> components;

    if (spec.isSingleApp()) {
        components.push_back({"App", PromptCatalog::GetAppPrompt(spec), ScaffoldTemplates::SafeComponent("App")});
    } else {
        components.push_back({"Navbar", PromptCatalog::GetNavbarPrompt(spec),
                              ScaffoldTemplates::FallbackNavbar(spec.title, spec.sections)});
        for (const auto& section : spec.sections) {
            if (section == "Navbar") continue;
            components.push_back({section, PromptCatalog::GetSectionPrompt(section, spec),
                                  ScaffoldTemplates::SafeComponent(section)});
        }
    }

    std::cout << "[Generation] Strategy " << spec.strategy << ", " << components.size()
              << " component(s) with " << ctx.modelId << std::endl;
    return std::make_unique<OllamaFileStream>(m_client, m_models, ctx,
                                              std::deque<GeneratedFile>(scaffold.begin(), scaffold.end()),
                                              std::move(components));
}

ChatResponse OllamaGenerationService::StreamCompletion(OllamaClient& client, const std::string& label,
                                                       const std::string& userPrompt, double temperature,
                                                       const GenerationContext& ctx) {
    json messages = json::array({
        {{"role", "system"}, {"content", PromptCatalog::GetBuilderSystemPrompt()}},
        {{"role", "user"}, {"content", userPrompt}}
    });

    ChatOptions options;
    options.temperature = temperature;

    const auto& observer = ctx.observer;
    if (observer.onStart) observer.onStart(label);
    auto response = client.chatStream(ctx.modelId, messages, [&](const std::string& token) {
        if (observer.onToken) observer.onToken(label, token);
    }, ctx.cancel, options);

    ChatResponse result = response.value_or(ChatResponse{});
    if (observer.onEnd) observer.onEnd(label, result.content);
    return result;
}

std::string OllamaGenerationService::CleanComponent(const std::string& raw, const std::string& label) {
    std::string code = CodeExtractor::Extract(raw);
    if (code.empty() || !CodeExtractor::HasDefaultExport(code)) return "";

    std::vector<std::string> changes;
    code = CodeExtractor::Sanitize(code, &changes);
    for (const auto& change : changes) {
        std::cout << "[Generation] " << label << ": " << change << std::endl;
    }
    if (code.back() != '\n') code += '\n';
    return code;
}

GenerationResult OllamaGenerationService::GenerateChecked(const std::string& label, const std::string& prompt,
                                                          double temperature, const GenerationContext& ctx) {
    ThrowIfCancelled(ctx);
    ModelManager::Lease lease(*m_models, ctx.modelId);
    auto response = StreamCompletion(*m_client, label, prompt, temperature, ctx);
    ThrowIfCancelled(ctx);

    std::string code = CleanComponent(response.content, StemOf(label));
    if (code.empty()) {
        throw CollaboratorError("Model produced no usable component for " + label);
    }
    return {code, response.usage};
}

GenerationResult OllamaGenerationService::repair(const RepairRequest& request, const GenerationContext& ctx) {
    const std::string name = StemOf(request.filePath);
    std::cout << "[Generation] Repairing " << request.filePath << std::endl;
    return GenerateChecked(request.filePath, PromptCatalog::GetRepairPrompt(name, request), kRepairTemperature, ctx);
}

GenerationResult OllamaGenerationService::generateComponent(const ComponentRequest& request,
                                                            const GenerationContext& ctx) {
    std::cout << "[Generation] " << (request.isNew ? "Creating " : "Updating ") << request.componentName
              << " (" << IntentToString(request.intent) << ")" << std::endl;
    return GenerateChecked(Project::ComponentPath(request.componentName), PromptCatalog::GetComponentPrompt(request),
                           request.intent == Intent::Patch ? kRepairTemperature : kGenerateTemperature, ctx);
}

} // namespace webforge::infrastructure
