/**
 * @file IntentClassifier.hpp
 * @brief Keyword-based classification of follow-up instructions.
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "domain/Requests.hpp"

namespace webforge::application {

/**
 * @struct Classification
 * @brief Intent of an instruction and the component it targets.
 */
struct Classification {
    domain::Intent intent = domain::Intent::Modify;
    std::string targetComponent; ///< Empty when the project has no components.
    bool targetIsNew = false;    ///< True when the target does not exist yet.
};

/**
 * @class IntentClassifier
 * @brief Pure, synchronous mapping of (instruction, project components) to an intent.
 *
 * `components` maps component name to its current source. No I/O; the same
 * inputs always produce the same output.
 */
class IntentClassifier {
public:
    using ComponentMap = std::map<std::string, std::string>;

    /**
     * @brief Classifies an instruction.
     * @param componentHint Explicit target chosen by the client, if any.
     * @return nullopt when the instruction is empty or whitespace only.
     */
    static std::optional<Classification> Classify(const std::string& instruction,
                                                  const ComponentMap& components,
                                                  const std::optional<std::string>& componentHint = std::nullopt);

    /**
     * @brief Resolves only the target for an intent chosen elsewhere (client override).
     */
    static Classification ResolveFor(domain::Intent intent,
                                     const std::string& instruction,
                                     const ComponentMap& components,
                                     const std::optional<std::string>& componentHint = std::nullopt);

    static bool HasFeatureSignal(const std::string& lowered);
    static bool HasPatchSignal(const std::string& lowered);

    /** @brief PascalCase names the instruction refers to as components. */
    static std::vector<std::string> ReferencedComponentNames(const std::string& instruction);

    /**
     * @brief Existing component the instruction points at (name, keyword map, content).
     */
    static std::optional<std::string> MatchExistingComponent(const std::string& instruction,
                                                             const ComponentMap& components);

    /** @brief New component name derived from an addition request ("NewSection" fallback). */
    static std::string DeriveNewComponentName(const std::string& instruction);
};

} // namespace webforge::application
