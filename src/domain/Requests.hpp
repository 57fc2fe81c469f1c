/**
 * @file Requests.hpp
 * @brief Immutable requests admitted by the pipeline orchestrator.
 */

#pragma once

#include <optional>
#include <string>

namespace webforge::domain {

/**
 * @enum Intent
 * @brief Classified scope of a reprompt request.
 */
enum class Intent {
    Patch,    ///< Surgical single-file edit, no test loop.
    Modify,   ///< Regenerate an existing component, then test.
    Feature   ///< Create a new component and mount it, then test.
};

inline std::string IntentToString(Intent intent) {
    switch (intent) {
        case Intent::Patch: return "patch";
        case Intent::Modify: return "modify";
        case Intent::Feature: return "feature";
    }
    return "modify";
}

inline std::optional<Intent> IntentFromString(const std::string& value) {
    if (value == "patch") return Intent::Patch;
    if (value == "modify") return Intent::Modify;
    if (value == "feature") return Intent::Feature;
    return std::nullopt;
}

/**
 * @struct BuildRequest
 * @brief A fresh build from a free-text idea.
 */
struct BuildRequest {
    std::string idea;
    std::string refineModel;                  ///< Model for the enrichment stage.
    std::string buildModel;                   ///< Model for the generation stage.
    std::optional<std::string> targetProject; ///< Rebuild into an existing project.
};

/**
 * @struct RepromptRequest
 * @brief A follow-up instruction against an existing project.
 *
 * `intent` is empty until the classifier (or a client override) assigns it.
 */
struct RepromptRequest {
    std::string project;
    std::string instruction;
    std::string buildModel;
    std::optional<Intent> intent;
    std::optional<std::string> componentHint;
};

} // namespace webforge::domain
