#include "application/ComponentInjector.hpp"

#include <cstddef>
#include <sstream>
#include <vector>

namespace webforge::application {

bool ComponentInjector::IsImported(const std::string& appSource, const std::string& componentName) {
    return appSource.find("import " + componentName + " ") != std::string::npos ||
           appSource.find("import " + componentName + "\n") != std::string::npos;
}

std::optional<std::string> ComponentInjector::Inject(const std::string& appSource,
                                                     const std::string& componentName) {
    if (IsImported(appSource, componentName)) return std::nullopt;

    std::vector<std::string> lines;
    {
        std::istringstream in(appSource);
        std::string line;
        while (std::getline(in, line)) lines.push_back(line);
    }

    size_t lastImport = 0;
    bool sawImport = false;
    for (size_t i = 0; i < lines.size(); ++i) {
        const auto first = lines[i].find_first_not_of(" \t");
        if (first != std::string::npos && lines[i].compare(first, 6, "import") == 0) {
            lastImport = i;
            sawImport = true;
        }
    }
    const std::string importLine = "import " + componentName + " from './components/" + componentName + "'";
    lines.insert(lines.begin() + static_cast<std::ptrdiff_t>(sawImport ? lastImport + 1 : 0), importLine);

    std::string updated;
    for (size_t i = 0; i < lines.size(); ++i) {
        updated += lines[i];
        if (i + 1 < lines.size() || (!appSource.empty() && appSource.back() == '\n')) updated += "\n";
    }

    const std::string tag = "      <" + componentName + " />\n";
    for (const char* closing : {"</div>", "</main>", "</>"}) {
        const auto pos = updated.rfind(closing);
        if (pos != std::string::npos) {
            updated.insert(pos, tag);
            break;
        }
    }
    return updated;
}

} // namespace webforge::application
