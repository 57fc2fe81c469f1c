/**
 * @file EventCodec.hpp
 * @brief JSON wire format of pipeline events and client commands.
 */

#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

#include "application/ClientCommand.hpp"
#include "domain/PipelineEvent.hpp"

namespace webforge::infrastructure {

class EventCodec {
public:
    /** @brief `{type: ..., ...fields}` with snake_case keys. */
    static nlohmann::json ToJson(const domain::PipelineEvent& event);

    static std::string Encode(const domain::PipelineEvent& event);

    /**
     * @brief Parses one client command.
     * @param error Receives a human-readable reason when nullopt is returned.
     */
    static std::optional<application::ClientCommand> DecodeCommand(const std::string& text, std::string& error);

    /** @brief Same, from an already parsed object (REST bodies). */
    static std::optional<application::ClientCommand> CommandFromJson(const nlohmann::json& body,
                                                                     application::CommandType type,
                                                                     std::string& error);

    static nlohmann::json ToJson(const domain::ProjectSummary& summary);
};

} // namespace webforge::infrastructure
