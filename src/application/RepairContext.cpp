#include "application/RepairContext.hpp"

#include <algorithm>
#include <cstddef>
#include <regex>
#include <sstream>

namespace webforge::application {

namespace {

const std::regex kCompileError(
    R"(\[plugin:vite[^\]]*\][^\n]*/src/components/(\w{1,50})\.(?:jsx?|tsx?))",
    std::regex::icase);
const std::regex kReactRuntimeError(
    R"(The above error occurred in the <(\w{1,50})> component)",
    std::regex::icase);
const std::regex kStackTraceLine(R"(at \w+ \(http)");
const std::regex kComponentPath(
    R"([/\\]src[/\\]components[/\\](\w{1,50})\.(?:jsx?|tsx?))",
    std::regex::icase);
const std::regex kLooseComponentRef(R"(components?[/\\](\w{1,50})['".:])");

const std::vector<std::string> kErrorKeywords = {
    "error", "Error", "failed", "Failed", "Cannot", "not defined", "Unexpected"
};

void AddOwned(const domain::Project& project, const std::string& path, std::vector<std::string>& out) {
    if (path.size() > 120) return;
    if (!project.hasFile(path)) return;
    if (std::find(out.begin(), out.end(), path) == out.end()) out.push_back(path);
}

std::vector<std::string> SplitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    return lines;
}

} // namespace

std::vector<std::string> RepairContext::LocateBrokenFiles(const std::string& errorText,
                                                          const domain::Project& project) {
    std::vector<std::string> found;
    std::smatch m;

    if (std::regex_search(errorText, m, kCompileError)) {
        AddOwned(project, domain::Project::ComponentPath(m[1].str()), found);
        return found;
    }
    if (std::regex_search(errorText, m, kReactRuntimeError)) {
        AddOwned(project, domain::Project::ComponentPath(m[1].str()), found);
        return found;
    }

    const auto lines = SplitLines(errorText);
    for (const auto& line : lines) {
        if (line.size() > 300 || std::regex_search(line, kStackTraceLine)) continue;
        for (std::sregex_iterator it(line.begin(), line.end(), kComponentPath), end; it != end; ++it) {
            AddOwned(project, domain::Project::ComponentPath((*it)[1].str()), found);
        }
    }
    if (!found.empty()) return found;

    for (const auto& line : lines) {
        if (std::regex_search(line, kStackTraceLine)) continue;
        for (std::sregex_iterator it(line.begin(), line.end(), kLooseComponentRef), end; it != end; ++it) {
            AddOwned(project, domain::Project::ComponentPath((*it)[1].str()), found);
        }
    }
    return found;
}

std::vector<std::string> RepairContext::AllComponentFiles(const domain::Project& project) {
    std::vector<std::string> files;
    for (const auto& name : project.ComponentNames()) {
        files.push_back(domain::Project::ComponentPath(name));
    }
    return files;
}

std::string RepairContext::ErrorsForFile(const std::string& errorText, const std::string& filePath) {
    const auto slash = filePath.find_last_of('/');
    const std::string fileName = slash == std::string::npos ? filePath : filePath.substr(slash + 1);
    const auto dot = fileName.find_last_of('.');
    const std::string stem = dot == std::string::npos ? fileName : fileName.substr(0, dot);

    std::string relevant;
    for (const auto& line : SplitLines(errorText)) {
        if (line.find(stem) != std::string::npos || line.find(filePath) != std::string::npos) {
            relevant += line + "\n";
        }
    }
    if (!relevant.empty()) return relevant;
    return errorText.substr(0, 600);
}

std::string RepairContext::CodebaseSummary(const domain::Project& project, size_t maxChars) {
    static const std::vector<std::string> kPriority = {
        "src/App.jsx", "src/main.jsx", "src/index.css"
    };

    std::vector<std::string> order = kPriority;
    for (const auto& [path, file] : project.getFiles()) {
        (void)file;
        if (std::find(order.begin(), order.end(), path) == order.end()) order.push_back(path);
    }

    std::ostringstream ss;
    for (const auto& path : order) {
        auto content = project.getFileContent(path);
        if (!content || content->empty()) continue;
        if (path == "package.json" || path.rfind("README", 0) == 0) continue;

        const size_t limit = path.rfind("src/components/", 0) == 0 ? 800 : 400;
        ss << "-- " << path << " --\n" << content->substr(0, limit);
        if (content->size() > limit) ss << " ...[truncated]";
        ss << "\n\n";
        if (static_cast<size_t>(ss.tellp()) > maxChars) break;
    }
    std::string out = ss.str();
    if (out.size() > maxChars) out.resize(maxChars);
    return out;
}

std::string RepairContext::Compose(const std::vector<domain::TestError>& errors,
                                   const std::vector<std::string>& diagnostics) {
    std::ostringstream ss;
    for (const auto& error : errors) {
        ss << error.message;
        if (!error.sourceHint.empty()) ss << " (source: " << error.sourceHint << ")";
        ss << "\n";
    }
    if (!diagnostics.empty()) {
        ss << "\nDev server output:\n";
        for (const auto& line : diagnostics) ss << line << "\n";
    }
    return ss.str();
}

std::vector<std::string> RepairContext::ErrorLines(const std::vector<std::string>& lines, size_t maxLines) {
    std::vector<std::string> matched;
    for (const auto& line : lines) {
        for (const auto& keyword : kErrorKeywords) {
            if (line.find(keyword) != std::string::npos) {
                matched.push_back(line);
                break;
            }
        }
    }
    if (matched.size() > maxLines) {
        matched.erase(matched.begin(), matched.end() - static_cast<std::ptrdiff_t>(maxLines));
    }
    return matched;
}

} // namespace webforge::application
