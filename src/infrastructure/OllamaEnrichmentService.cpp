#include "infrastructure/OllamaEnrichmentService.hpp"

#include "domain/Errors.hpp"
#include "infrastructure/PromptCatalog.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <map>
#include <sstream>
#include <utility>
#include <vector>

namespace webforge::infrastructure {

using json = nlohmann::json;

namespace {

// Ordered: the first matching type wins.
const std::vector<std::pair<std::string, std::vector<std::string>>> kSiteKeywords = {
    {"ecommerce", {"shop", "store", "ecommerce", "e-commerce", "product", "cart", "retail", "marketplace"}},
    {"portfolio", {"portfolio", "personal", "resume", "cv", "my work"}},
    {"saas", {"saas", "platform", "subscription", "b2b", "crm"}},
    {"restaurant", {"restaurant", "food", "cafe", "menu", "dining", "bistro", "coffee shop"}},
    {"blog", {"blog", "article", "news", "magazine", "journal", "posts"}},
    {"agency", {"agency", "studio", "creative", "marketing", "branding"}},
    {"startup", {"startup", "launch", "mvp", "venture"}},
    {"corporate", {"corporate", "enterprise", "consulting", "firm"}},
    {"landing", {"landing page", "waitlist", "coming soon", "pre-launch"}},
    {"tool", {"calculator", "converter", "timer", "clock", "weather", "currency", "generator", "checker"}},
    {"game", {"game", "quiz", "puzzle", "trivia", "arcade", "score", "player"}},
    {"app", {"app", "application", "tracker", "manager", "planner", "organizer", "notes", "todo", "habit"}},
    {"dashboard", {"dashboard", "admin", "analytics", "stats", "metrics", "monitor", "chart"}},
    {"social", {"social", "community", "forum", "chat", "messaging", "feed"}},
};

const std::map<std::string, std::vector<std::string>> kSections = {
    {"ecommerce", {"Hero", "FeaturedProducts", "Categories", "Testimonials", "Newsletter"}},
    {"portfolio", {"Hero", "About", "Skills", "Projects", "Contact"}},
    {"saas", {"Hero", "Features", "HowItWorks", "Pricing", "Testimonials", "CTA"}},
    {"restaurant", {"Hero", "Menu", "About", "Gallery", "Reservations"}},
    {"blog", {"Hero", "FeaturedPosts", "Categories", "Newsletter", "Contact"}},
    {"agency", {"Hero", "Services", "Work", "Team", "Contact"}},
    {"startup", {"Hero", "Problem", "Solution", "Features", "Pricing", "Contact"}},
    {"corporate", {"Hero", "About", "Services", "Team", "Contact"}},
    {"landing", {"Hero", "Features", "HowItWorks", "Testimonials", "CTA"}},
    {"tool", {"App"}},
    {"game", {"App"}},
    {"app", {"App"}},
    {"dashboard", {"App"}},
    {"social", {"Hero", "Feed", "Profiles", "Contact"}},
    {"general", {"Hero", "Features", "About", "Contact"}},
};

std::string Lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

std::string StringField(const json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_string()) return "";
    return j[key].get<std::string>();
}

std::vector<std::string> ListField(const json& j, const char* key) {
    std::vector<std::string> out;
    if (!j.contains(key) || !j[key].is_array()) return out;
    for (const auto& item : j[key]) {
        if (item.is_string()) out.push_back(item.get<std::string>());
    }
    return out;
}

std::string NameFromIdea(const std::string& idea) {
    static const std::vector<std::string> stop = {
        "a", "an", "the", "build", "create", "make", "i", "want", "need", "with", "for",
        "and", "or", "of", "website", "site", "page", "web", "app"
    };
    std::istringstream in(idea);
    std::string word;
    std::string name;
    int taken = 0;
    while (in >> word && taken < 3) {
        word.erase(std::remove_if(word.begin(), word.end(),
                                  [](unsigned char c) { return c == '.' || c == ',' || c == '!' || c == '?'; }),
                   word.end());
        if (word.empty() || std::find(stop.begin(), stop.end(), Lower(word)) != stop.end()) continue;
        word = Lower(word);
        word[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(word[0])));
        if (!name.empty()) name += " ";
        name += word;
        ++taken;
    }
    return name.empty() ? "My App" : name;
}

std::string Kebab(const std::string& text) {
    std::string out;
    bool dash = false;
    for (char c : Lower(text)) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            if (dash && !out.empty()) out += '-';
            out += c;
            dash = false;
        } else {
            dash = true;
        }
        if (out.size() >= 30) break;
    }
    return out;
}

} // namespace

OllamaEnrichmentService::OllamaEnrichmentService(std::shared_ptr<OllamaClient> client,
                                                 std::shared_ptr<ModelManager> models)
    : m_client(std::move(client)), m_models(std::move(models)) {}

std::string OllamaEnrichmentService::DetectSiteType(const std::string& ideaText) {
    const std::string lowered = Lower(ideaText);
    for (const auto& [type, keywords] : kSiteKeywords) {
        for (const auto& keyword : keywords) {
            if (lowered.find(keyword) != std::string::npos) return type;
        }
    }
    return "general";
}

domain::SiteSpecification OllamaEnrichmentService::ParseSpecification(const std::string& ideaText,
                                                                      const std::string& modelOutput) {
    const auto start = modelOutput.find('{');
    const auto end = modelOutput.rfind('}');
    if (start == std::string::npos || end == std::string::npos || end < start) {
        throw domain::CollaboratorError("Enrichment output holds no JSON object");
    }

    json data;
    try {
        data = json::parse(modelOutput.substr(start, end - start + 1));
    } catch (const json::parse_error& e) {
        throw domain::CollaboratorError(std::string("Enrichment output is not valid JSON: ") + e.what());
    }
    if (!data.is_object()) {
        throw domain::CollaboratorError("Enrichment output is not a JSON object");
    }

    domain::SiteSpecification spec;
    const std::string modelType = StringField(data, "site_type");
    spec.siteType = kSections.count(modelType) ? modelType : DetectSiteType(ideaText);
    spec.sections = kSections.at(spec.siteType);
    spec.strategy = (spec.sections.size() == 1 && spec.sections.front() == "App") ? "react-app" : "react-sections";

    spec.brandName = StringField(data, "brand_name");
    if (spec.brandName.empty()) spec.brandName = StringField(data, "title");
    if (spec.brandName.empty()) spec.brandName = NameFromIdea(ideaText);

    spec.title = StringField(data, "title");
    if (spec.title.empty()) spec.title = spec.brandName;

    spec.projectName = StringField(data, "project_name");
    if (spec.projectName.empty()) spec.projectName = Kebab(spec.brandName);

    spec.tagline = StringField(data, "tagline");
    if (spec.tagline.empty()) spec.tagline = "Welcome to " + spec.brandName;
    spec.description = StringField(data, "description");
    if (spec.description.empty()) spec.description = ideaText.substr(0, 300);
    spec.colorScheme = StringField(data, "color_scheme");
    if (spec.colorScheme.empty()) spec.colorScheme = "dark with cyan and purple accents";
    const std::string style = StringField(data, "style");
    if (!style.empty()) spec.style = style;
    spec.targetAudience = StringField(data, "target_audience");
    if (spec.targetAudience.empty()) spec.targetAudience = "Everyone";
    spec.specialInstructions = StringField(data, "special_instructions");
    if (spec.specialInstructions.empty()) spec.specialInstructions = ideaText;
    spec.features = ListField(data, "key_features");
    if (spec.features.empty()) spec.features = ListField(data, "features");
    return spec;
}

domain::SiteSpecification OllamaEnrichmentService::enrich(const std::string& ideaText, const std::string& modelId) {
    std::cout << "[Enrichment] Refining idea with " << modelId << "..." << std::endl;
    ModelManager::Lease lease(*m_models, modelId);

    json messages = json::array({
        {{"role", "system"}, {"content", PromptCatalog::GetEnrichmentPrompt()}},
        {{"role", "user"}, {"content", "Idea: " + ideaText + "\n\nJSON only:"}}
    });

    ChatOptions options;
    options.temperature = 0.1;
    options.numPredict = 500;
    options.forceJson = true;
    options.timeoutSeconds = 60;

    auto response = m_client->chat(modelId, messages, options);
    if (!response || response->content.empty()) {
        throw domain::CollaboratorError("Enrichment model " + modelId + " returned no content");
    }

    auto spec = ParseSpecification(ideaText, response->content);
    std::cout << "[Enrichment] '" << spec.title << "' type=" << spec.siteType
              << " strategy=" << spec.strategy << std::endl;
    return spec;
}

} // namespace webforge::infrastructure
