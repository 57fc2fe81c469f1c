#include "infrastructure/CodeExtractor.hpp"

#include <regex>

namespace webforge::infrastructure {

namespace {

std::string Trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::string EscapeRegex(const std::string& text) {
    static const std::regex special(R"([.^$|()\[\]{}*+?\\/])");
    return std::regex_replace(text, special, R"(\$&)");
}

} // namespace

const std::vector<std::string>& CodeExtractor::BannedPackages() {
    static const std::vector<std::string> banned = {
        "react-leaflet", "leaflet", "react-router-dom", "react-router",
        "axios", "lodash", "lodash-es", "chart.js", "react-chartjs-2",
        "d3", "three", "@react-three/fiber", "@react-three/drei",
        "@mui/material", "@mui/icons-material", "@chakra-ui/react",
        "react-query", "@tanstack/react-query", "zustand", "jotai", "recoil",
        "styled-components", "@emotion/react", "@emotion/styled",
        "classnames", "clsx", "react-spring", "@react-spring/web", "react-use",
        "react-helmet", "react-helmet-async", "react-hot-toast", "react-toastify",
        "react-scroll", "lucide-react", "date-fns", "dayjs", "moment", "uuid", "nanoid"
    };
    return banned;
}

std::string CodeExtractor::Extract(const std::string& text) {
    if (text.empty()) return "";

    static const std::regex fenced(R"(```[A-Za-z]*[ \t]*\r?\n([\s\S]*?)```)");
    std::smatch match;
    if (std::regex_search(text, match, fenced)) {
        return Trim(match[1].str());
    }

    const std::string trimmed = Trim(text);
    for (const char* marker : {"import ", "export default", "function ", "const ", "return ("}) {
        if (trimmed.find(marker) != std::string::npos) return trimmed;
    }
    return "";
}

std::string CodeExtractor::Sanitize(const std::string& input, std::vector<std::string>* changes) {
    std::string code = input;

    static const std::regex iconsAll(R"(from\s*['"]react-icons/all['"])");
    if (std::regex_search(code, iconsAll)) {
        code = std::regex_replace(code, iconsAll, "from 'react-icons/fi'");
        if (changes) changes->push_back("react-icons/all -> react-icons/fi");
    }

    for (const auto& pkg : BannedPackages()) {
        if (code.find(pkg) == std::string::npos) continue;
        const std::regex importLine("(^|\\n)[ \\t]*import\\b[^\\n]*from\\s+['\"]" + EscapeRegex(pkg) +
                                    "(/[^'\"]*)?['\"][^\\n]*");
        const std::string before = code;
        code = std::regex_replace(code, importLine, "$1");
        if (code != before && changes) changes->push_back("removed import of " + pkg);
    }
    return code;
}

bool CodeExtractor::HasDefaultExport(const std::string& code) {
    return code.find("export default") != std::string::npos;
}

} // namespace webforge::infrastructure
