/**
 * @file ClientCommand.hpp
 * @brief Commands a session sends to the gateway, independent of the wire format.
 */

#pragma once

#include <optional>
#include <string>

#include "domain/Requests.hpp"

namespace webforge::application {

enum class CommandType {
    Build,
    Update,
    Cancel,
    Export,
    Status,
    Projects
};

struct ClientCommand {
    CommandType type = CommandType::Build;
    std::string prompt;       ///< Idea (build) or instruction (update).
    std::string refineModel;
    std::string buildModel;
    std::string project;
    std::string runId;        ///< cancel only.
    std::optional<domain::Intent> intent;
    std::optional<std::string> component;
};

} // namespace webforge::application
