/**
 * @file ComponentInjector.hpp
 * @brief Mounts a new component into the composition root.
 */

#pragma once

#include <optional>
#include <string>

namespace webforge::application {

class ComponentInjector {
public:
    /**
     * @brief Adds `import Name from './components/Name'` after the last import
     * and `<Name />` before the last closing wrapper of the root element.
     * @return The updated source, or nullopt when the component is already imported.
     */
    static std::optional<std::string> Inject(const std::string& appSource, const std::string& componentName);

    static bool IsImported(const std::string& appSource, const std::string& componentName);
};

} // namespace webforge::application
