/**
 * @file ScaffoldTemplates.hpp
 * @brief Static project files that are generated without a model.
 */

#pragma once

#include <string>
#include <vector>

namespace webforge::infrastructure {

/**
 * @class ScaffoldTemplates
 * @brief Vite + React + Tailwind boilerplate; always valid, never streamed.
 */
class ScaffoldTemplates {
public:
    static std::string PackageJson(const std::string& title);
    static std::string ViteConfig();
    static std::string TailwindConfig();
    static std::string PostcssConfig();
    static std::string IndexHtml(const std::string& title);
    static std::string MainJsx();

    /** @brief Base stylesheet; accent colors follow the color scheme wording. */
    static std::string IndexCss(const std::string& colorScheme);

    /** @brief App.jsx for multi-section sites: Navbar plus one animated block per section. */
    static std::string AppShell(const std::string& title, const std::vector<std::string>& sections);

    /** @brief App.jsx for single-component apps, mounting components/App. */
    static std::string SingleAppShell();

    /** @brief Minimal renderable component used when generation produced nothing usable. */
    static std::string SafeComponent(const std::string& name);

    static std::string FallbackNavbar(const std::string& title, const std::vector<std::string>& sections);
};

} // namespace webforge::infrastructure
