#include "application/IntentClassifier.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace webforge::application {

using domain::Intent;

namespace {

const std::vector<std::string> kFeaturePhrases = {
    "add a ", "add an ", "add new ", "create a ", "create an ",
    "new section", "new feature", "new component", "new page",
    "new tab", "new button", "new card", "new block",
    "include a ", "build a ", "implement a ", "introduce a "
};

const std::vector<std::string> kPatchPhrases = {
    "change the text", "change the color", "change the colour",
    "change the title", "change the heading", "change the label",
    "change the button text", "change the background",
    "update the text", "update the color", "update the colour",
    "rename ", "make it ", "set the color", "set background",
    "font size", "font color", "change font",
    "replace the text", "fix the text", "fix typo",
    "spelling", "lighter", "darker", "bigger text", "smaller text",
    "make the text", "make the color", "make the background"
};

const std::vector<std::string> kEditVerbs = {
    "change", "update", "set", "make", "replace", "fix", "rename", "turn", "swap", "edit"
};

const std::vector<std::string> kSurfaceNouns = {
    "color", "colour", "text", "copy", "title", "heading", "subtitle", "label",
    "font", "wording", "typo", "spelling", "background", "caption", "price",
    "phone", "email", "number"
};

// Keyword (substring of the lowered instruction) -> candidate component names.
const std::vector<std::pair<std::string, std::vector<std::string>>> kSemanticMap = {
    {"hero", {"Hero", "Banner", "Header"}},
    {"banner", {"Banner", "Hero"}},
    {"header", {"Header", "Navbar", "Hero"}},
    {"nav", {"Navbar", "Nav", "Navigation", "Header"}},
    {"menu", {"Navbar", "Menu", "Header"}},
    {"feature", {"Features", "Feature"}},
    {"about", {"About"}},
    {"pric", {"Pricing", "PricingTable"}},
    {"plan", {"Pricing", "Plans"}},
    {"contact", {"Contact", "ContactForm"}},
    {"footer", {"Footer"}},
    {"testimonial", {"Testimonials", "Testimonial"}},
    {"review", {"Testimonials", "Reviews"}},
    {"gallery", {"Gallery"}},
    {"faq", {"FAQ", "Faq"}},
    {"team", {"Team"}},
    {"blog", {"Blog"}}
};

// UI element noun -> markers that indicate a component renders it.
const std::vector<std::pair<std::string, std::vector<std::string>>> kElementMarkers = {
    {"button", {"<button"}},
    {"link", {"<a ", "href="}},
    {"image", {"<img"}},
    {"logo", {"logo"}},
    {"form", {"<form"}},
    {"input", {"<input"}},
    {"heading", {"<h1", "<h2"}},
    {"title", {"<h1", "<h2"}},
    {"icon", {"icon"}},
    {"checkbox", {"checkbox"}},
    {"list", {"<ul", "<li"}},
    {"table", {"<table"}}
};

const std::vector<std::string> kNameStopWords = {
    "new", "a", "an", "the", "simple", "small", "nice", "cool", "beautiful", "modern", "another"
};

const std::vector<std::string> kNameTerminators = {
    "section", "component", "block", "area", "part", "to", "with", "for", "that",
    "below", "above", "on", "in", "at", "under", "after", "before", "which", "where",
    "and", "showing", "listing"
};

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string Trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

bool Contains(const std::vector<std::string>& list, const std::string& value) {
    return std::find(list.begin(), list.end(), value) != list.end();
}

/** Splits on anything that is not alphanumeric; keeps original case. */
std::vector<std::string> Words(const std::string& text) {
    std::vector<std::string> words;
    std::string current;
    for (char ch : text) {
        if (std::isalnum(static_cast<unsigned char>(ch))) {
            current += ch;
        } else if (!current.empty()) {
            words.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) words.push_back(current);
    return words;
}

bool IsMultiHumpPascal(const std::string& word) {
    if (word.size() < 3 || !std::isupper(static_cast<unsigned char>(word[0]))) return false;
    int humps = 0;
    bool sawLower = false;
    for (size_t i = 0; i < word.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(word[i]);
        if (std::isupper(c)) {
            if (i > 0 && !sawLower) return false;
            ++humps;
            sawLower = false;
        } else if (std::islower(c)) {
            sawLower = true;
        }
    }
    return humps >= 2 && sawLower;
}

std::optional<std::string> FindComponent(const IntentClassifier::ComponentMap& components,
                                         const std::string& name) {
    const std::string lowered = ToLower(name);
    for (const auto& [existing, source] : components) {
        (void)source;
        if (ToLower(existing) == lowered) return existing;
    }
    return std::nullopt;
}

std::optional<std::string> MatchByName(const std::string& instruction,
                                       const IntentClassifier::ComponentMap& components) {
    std::vector<std::string> tokens;
    for (const auto& w : Words(instruction)) tokens.push_back(ToLower(w));

    std::optional<std::string> best;
    for (const auto& [name, source] : components) {
        (void)source;
        const std::string lowered = ToLower(name);
        bool hit = false;
        for (size_t i = 0; i < tokens.size() && !hit; ++i) {
            if (tokens[i] == lowered) hit = true;
            if (i + 1 < tokens.size() && tokens[i] + tokens[i + 1] == lowered) hit = true;
        }
        if (hit && (!best || name.size() > best->size())) best = name;
    }
    return best;
}

std::optional<std::string> MatchBySemanticKeyword(const std::string& lowered,
                                                  const IntentClassifier::ComponentMap& components) {
    for (const auto& [keyword, candidates] : kSemanticMap) {
        if (lowered.find(keyword) == std::string::npos) continue;
        for (const auto& candidate : candidates) {
            if (auto found = FindComponent(components, candidate)) return found;
        }
    }
    return std::nullopt;
}

size_t CountOccurrences(const std::string& haystack, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos;
         pos = haystack.find(needle, pos + needle.size())) {
        ++count;
    }
    return count;
}

std::optional<std::string> MatchByContent(const std::string& lowered,
                                          const IntentClassifier::ComponentMap& components) {
    const auto tokens = Words(lowered);
    std::optional<std::string> best;
    size_t bestCount = 0;
    for (const auto& [noun, markers] : kElementMarkers) {
        if (!Contains(tokens, noun) && !Contains(tokens, noun + "s")) continue;
        for (const auto& [name, source] : components) {
            const std::string code = ToLower(source);
            size_t count = 0;
            for (const auto& marker : markers) count += CountOccurrences(code, marker);
            if (count > bestCount) {
                bestCount = count;
                best = name;
            }
        }
        if (best) return best;
    }
    return std::nullopt;
}

std::string PascalCase(const std::vector<std::string>& words) {
    std::string out;
    for (const auto& word : words) {
        if (word.empty()) continue;
        out += static_cast<char>(std::toupper(static_cast<unsigned char>(word[0])));
        out += word.substr(1);
    }
    return out;
}

} // namespace

bool IntentClassifier::HasFeatureSignal(const std::string& lowered) {
    for (const auto& phrase : kFeaturePhrases) {
        if (lowered.find(phrase) != std::string::npos) return true;
    }
    return false;
}

bool IntentClassifier::HasPatchSignal(const std::string& lowered) {
    for (const auto& phrase : kPatchPhrases) {
        if (lowered.find(phrase) != std::string::npos) return true;
    }

    const auto tokens = Words(lowered);
    bool verb = false;
    for (const auto& v : kEditVerbs) {
        if (Contains(tokens, v)) { verb = true; break; }
    }
    if (!verb) return false;

    for (const auto& noun : kSurfaceNouns) {
        if (Contains(tokens, noun)) return true;
    }
    // "set the padding to 24", "change #333 to #111"
    for (const auto& token : tokens) {
        if (std::isdigit(static_cast<unsigned char>(token[0]))) return true;
    }
    return lowered.find('#') != std::string::npos;
}

std::vector<std::string> IntentClassifier::ReferencedComponentNames(const std::string& instruction) {
    const auto words = Words(instruction);
    std::vector<std::string> names;
    for (size_t i = 0; i < words.size(); ++i) {
        const std::string& word = words[i];
        bool isName = IsMultiHumpPascal(word);
        if (!isName && i > 0 && i + 1 < words.size() &&
            std::isupper(static_cast<unsigned char>(word[0]))) {
            const std::string next = ToLower(words[i + 1]);
            isName = next == "component" || next == "section";
        }
        if (isName && !Contains(names, word)) names.push_back(word);
    }
    return names;
}

std::optional<std::string> IntentClassifier::MatchExistingComponent(const std::string& instruction,
                                                                    const ComponentMap& components) {
    if (components.empty()) return std::nullopt;
    if (auto byName = MatchByName(instruction, components)) return byName;

    const std::string lowered = ToLower(instruction);
    if (auto bySemantic = MatchBySemanticKeyword(lowered, components)) return bySemantic;
    return MatchByContent(lowered, components);
}

std::string IntentClassifier::DeriveNewComponentName(const std::string& instruction) {
    static const std::vector<std::string> kLeadIns = {
        "add a ", "add an ", "add new ", "add ", "create a ", "create an ", "create ",
        "include a ", "build a ", "implement a ", "introduce a ", "new "
    };

    const std::string lowered = ToLower(instruction);
    size_t start = std::string::npos;
    for (const auto& leadIn : kLeadIns) {
        const auto pos = lowered.find(leadIn);
        if (pos != std::string::npos) {
            start = pos + leadIn.size();
            break;
        }
    }
    if (start == std::string::npos) return "NewSection";

    std::vector<std::string> picked;
    for (const auto& word : Words(lowered.substr(start))) {
        if (Contains(kNameTerminators, word)) break;
        if (Contains(kNameStopWords, word)) continue;
        if (!std::isalpha(static_cast<unsigned char>(word[0]))) continue;
        picked.push_back(word);
        if (picked.size() == 2) break;
    }
    if (picked.empty()) return "NewSection";
    return PascalCase(picked);
}

Classification IntentClassifier::ResolveFor(Intent intent,
                                            const std::string& instruction,
                                            const ComponentMap& components,
                                            const std::optional<std::string>& componentHint) {
    Classification result;
    result.intent = intent;

    if (componentHint && !Trim(*componentHint).empty()) {
        const std::string hint = Trim(*componentHint);
        if (auto existing = FindComponent(components, hint)) {
            result.targetComponent = *existing;
            return result;
        }
        if (intent == Intent::Feature) {
            result.targetComponent = hint;
            result.targetIsNew = true;
            return result;
        }
    }

    if (intent == Intent::Feature) {
        for (const auto& ref : ReferencedComponentNames(instruction)) {
            if (!FindComponent(components, ref)) {
                result.targetComponent = ref;
                result.targetIsNew = true;
                return result;
            }
        }
        if (auto named = MatchByName(instruction, components)) {
            result.targetComponent = *named;
            return result;
        }
        if (auto semantic = MatchBySemanticKeyword(ToLower(instruction), components)) {
            result.targetComponent = *semantic;
            return result;
        }
        const std::string derived = DeriveNewComponentName(instruction);
        if (auto existing = FindComponent(components, derived)) {
            result.targetComponent = *existing;
        } else {
            result.targetComponent = derived;
            result.targetIsNew = true;
        }
        return result;
    }

    if (auto match = MatchExistingComponent(instruction, components)) {
        result.targetComponent = *match;
    } else if (!components.empty()) {
        result.targetComponent = components.begin()->first;
    }
    return result;
}

std::optional<Classification> IntentClassifier::Classify(const std::string& instruction,
                                                         const ComponentMap& components,
                                                         const std::optional<std::string>& componentHint) {
    if (Trim(instruction).empty()) return std::nullopt;

    const std::string lowered = ToLower(instruction);

    bool unknownReference = false;
    for (const auto& ref : ReferencedComponentNames(instruction)) {
        if (!FindComponent(components, ref)) {
            unknownReference = true;
            break;
        }
    }

    if (HasFeatureSignal(lowered) || unknownReference) {
        return ResolveFor(Intent::Feature, instruction, components, componentHint);
    }

    if (HasPatchSignal(lowered)) {
        std::optional<std::string> target;
        if (componentHint) target = FindComponent(components, Trim(*componentHint));
        if (!target) target = MatchExistingComponent(instruction, components);
        if (target) {
            Classification result;
            result.intent = Intent::Patch;
            result.targetComponent = *target;
            return result;
        }
    }

    return ResolveFor(Intent::Modify, instruction, components, componentHint);
}

} // namespace webforge::application
