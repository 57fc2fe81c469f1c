#include "infrastructure/PromptCatalog.hpp"

#include <sstream>

namespace webforge::infrastructure {

namespace {

constexpr const char* kAllowedPackages =
    "ONLY import from: react, react-dom, framer-motion, react-icons/* (for example 'react-icons/fi').\n"
    "Packages such as react-router-dom, react-leaflet, axios, lodash, chart.js, d3, three, "
    "@mui/material, styled-components and lucide-react are NOT installed and crash the dev server.\n";

std::string Clip(const std::string& text, size_t max) {
    return text.size() <= max ? text : text.substr(0, max);
}

std::string JoinList(const std::vector<std::string>& items, size_t max) {
    std::string out;
    for (size_t i = 0; i < items.size() && i < max; ++i) {
        if (i) out += ", ";
        out += items[i];
    }
    return out;
}

} // namespace

std::string PromptCatalog::GetEnrichmentPrompt() {
    return
        "You are a JSON API. Output ONLY a raw JSON object. No markdown, no explanation.\n\n"
        "Given a website or app idea, classify it and return exactly:\n"
        "{\"project_name\":\"kebab-case\",\"site_type\":\"ecommerce|portfolio|saas|restaurant|blog|agency|"
        "startup|corporate|landing|tool|game|app|dashboard|social|general\","
        "\"title\":\"Title\",\"tagline\":\"Catchphrase\",\"description\":\"2-3 sentences\","
        "\"color_scheme\":\"colors and theme\",\"style\":\"modern|minimal|bold|playful|retro|corporate|luxury\","
        "\"brand_name\":\"Brand or App Name\",\"target_audience\":\"who this is for\","
        "\"key_features\":[\"feature1\",\"feature2\",\"feature3\"],"
        "\"special_instructions\":\"design, animation and content requirements\"}\n\n"
        "site_type MUST be one of the listed values. Output ONLY JSON starting with {.\n"
        "Never suggest third-party packages in special_instructions.";
}

std::string PromptCatalog::GetBuilderSystemPrompt() {
    return std::string(
        "You are an expert React + Tailwind developer.\n"
        "Output ONLY complete, valid JSX code. No markdown fences, no explanation, no preamble.\n\n"
        "MANDATORY RULES:\n"
        "1. Imports first, then immediately `export default function Name()`. Nothing in between.\n"
        "2. All data arrays, constants and state live INSIDE the function body.\n"
        "3. Arrow-function components are not allowed. Never split the UI into several named components.\n") +
        "4. " + kAllowedPackages +
        "5. Self-close void elements: <br />, <img />, <input />, <hr />.\n"
        "6. The outermost element MUST have an explicit dark background (bg-gray-900, bg-slate-950 or bg-black).\n"
        "7. Only use icon names that exist (FiHome, FiX, FiCircle, FiStar, FiMenu, FiGrid, FiArrowRight, "
        "FiPhone, FiMail, FiUser, FiSettings, FiCode, FiHeart, FiPlus, FiTrash2, FiEdit).\n"
        "8. Never write /regex/ literals or divisions inside JSX braces; hoist them to a const above return().\n";
}

std::string PromptCatalog::GetAppPrompt(const domain::SiteSpecification& spec) {
    std::ostringstream ss;
    ss << "Build a complete, fully functional React single-page " << spec.siteType << " for:\n"
       << "Title: " << spec.title << "\n"
       << "Style: " << spec.style << " | Colors: " << spec.colorScheme << "\n"
       << "Description: " << Clip(spec.description, 250) << "\n"
       << "Key features: " << (spec.features.empty() ? "standard features for this type" : JoinList(spec.features, 6)) << "\n"
       << "Instructions: " << Clip(spec.specialInstructions, 250) << "\n\n"
       << "Requirements:\n"
       << "- All interactive logic with useState/useEffect\n"
       << "- Tailwind CSS, framer-motion animations and react-icons\n"
       << "- Real content, no placeholders\n"
       << "- export default function App()\n\n"
       << "Output ONLY the JSX starting with imports.";
    return ss.str();
}

std::string PromptCatalog::GetNavbarPrompt(const domain::SiteSpecification& spec) {
    std::ostringstream ss;
    ss << "Write a React Navbar component for '" << spec.title << "'.\n"
       << "Navigation links:";
    for (const auto& section : spec.sections) {
        if (section == "Navbar") continue;
        ss << " " << section << " (#" << section << ")";
    }
    ss << "\n\nRequirements:\n"
       << "- Fixed top position, z-50\n"
       << "- Glass background that appears on scroll (useEffect + useState)\n"
       << "- Smooth scroll to the section on link click\n"
       << "- Mobile hamburger menu\n"
       << "- export default function Navbar()\n\n"
       << "Output ONLY the JSX starting with imports.";
    return ss.str();
}

std::string PromptCatalog::GetSectionPrompt(const std::string& section, const domain::SiteSpecification& spec) {
    std::ostringstream ss;
    ss << "Write a complete React '" << section << "' section component.\n"
       << "Website: " << spec.title << " (" << spec.siteType << ")\n"
       << "Style: " << spec.style << " | Colors: " << spec.colorScheme << "\n"
       << "Description: " << Clip(spec.description, 180) << "\n"
       << "Instructions: " << Clip(spec.specialInstructions, 180) << "\n\n"
       << "Requirements:\n"
       << "- framer-motion whileInView animations\n"
       << "- Tailwind CSS with dark backgrounds and gradients\n"
       << "- Real, specific content matching the website theme\n"
       << "- Responsive, mobile first\n"
       << "- export default function " << section << "()\n\n"
       << "Output ONLY the JSX starting with imports.";
    return ss.str();
}

std::string PromptCatalog::GetRepairPrompt(const std::string& componentName, const domain::RepairRequest& request) {
    std::ostringstream ss;
    ss << "Fix the broken React component below.\n\n"
       << "=== ERRORS ===\n" << Clip(request.errorContext, 1200) << "\n\n"
       << "=== CODEBASE CONTEXT ===\n" << Clip(request.codebaseContext, 1800) << "\n\n"
       << "=== BROKEN FILE: " << request.filePath << " ===\n" << Clip(request.currentContent, 2500) << "\n\n"
       << "=== INSTRUCTIONS ===\n"
       << "- Fix EVERY error listed above; browser console errors are the real cause\n"
       << "- " << kAllowedPackages
       << "- Do not invent icon names; use FiBox or FiSquare when unsure\n"
       << "- All logic inside the single export default function " << componentName << "()\n"
       << "- Keep the same visual design and structure\n"
       << "- Output ONLY the complete fixed JSX, starting with imports";
    return ss.str();
}

std::string PromptCatalog::GetComponentPrompt(const domain::ComponentRequest& request) {
    std::ostringstream ss;
    if (request.isNew || request.existingCode.empty()) {
        ss << "Create a NEW React component named " << request.componentName << ".\n"
           << "Request: " << request.instruction << "\n\n"
           << "=== EXISTING PROJECT ===\n" << Clip(request.codebaseContext, 1800) << "\n\n"
           << "Match the visual style of the existing project.\n";
    } else {
        ss << (request.intent == domain::Intent::Patch
                   ? "Apply a SMALL, surgical edit to the component below. Change only what is asked.\n"
                   : "Rework the component below according to the request.\n")
           << "Request: " << request.instruction << "\n\n"
           << "=== CODEBASE CONTEXT ===\n" << Clip(request.codebaseContext, 1800) << "\n\n"
           << "=== CURRENT " << request.componentName << " ===\n" << Clip(request.existingCode, 4000) << "\n\n";
    }
    ss << "- " << kAllowedPackages
       << "- export default function " << request.componentName << "()\n"
       << "- Output ONLY the complete JSX of the component, starting with imports";
    return ss.str();
}

} // namespace webforge::infrastructure
