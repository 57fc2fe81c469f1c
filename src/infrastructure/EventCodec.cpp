#include "infrastructure/EventCodec.hpp"

#include <map>
#include <type_traits>

namespace webforge::infrastructure {

using json = nlohmann::json;
using namespace webforge::domain;
using application::ClientCommand;
using application::CommandType;

namespace {

const std::map<std::string, CommandType> kCommandTypes = {
    {"build", CommandType::Build},
    {"update", CommandType::Update},
    {"cancel", CommandType::Cancel},
    {"export", CommandType::Export},
    {"status", CommandType::Status},
    {"projects", CommandType::Projects},
};

std::string Str(const json& body, const char* key) {
    if (!body.contains(key) || !body[key].is_string()) return "";
    return body[key].get<std::string>();
}

json Fields(const LogEvent& e) { return {{"level", e.level}, {"text", e.text}}; }
json Fields(const StepEvent& e) { return {{"step", e.step}, {"status", e.status}}; }
json Fields(const ProgressEvent& e) { return {{"step", e.label}, {"pct", e.pct}}; }
json Fields(const FileEvent& e) { return {{"name", e.path}, {"size", e.size}, {"content", e.content}}; }
json Fields(const DetectedEvent& e) { return {{"site_type", e.siteType}, {"strategy", e.strategy}}; }
json Fields(const StreamStartEvent& e) { return {{"file", e.file}}; }
json Fields(const StreamTokenEvent& e) { return {{"file", e.file}, {"token", e.token}}; }
json Fields(const StreamEndEvent& e) { return {{"file", e.file}, {"content", e.content}}; }
json Fields(const TestRunEvent& e) { return {{"attempt", e.attempt}}; }
json Fields(const TestFixingEvent& e) { return {{"attempt", e.attempt}, {"errors", e.errors}}; }

json Fields(const DoneEvent& e) {
    return {{"run_id", e.runId}, {"project", e.project}, {"url", e.url}, {"fix_attempts", e.fixAttempts}};
}

json Fields(const ErrorEvent& e) {
    json j = {{"project", e.project}, {"reason", FailureReasonToString(e.reason)}, {"text", e.text}};
    if (!e.runId.empty()) j["run_id"] = e.runId;
    if (!e.errors.empty()) j["errors"] = e.errors;
    return j;
}

json Fields(const CancelledEvent& e) { return {{"run_id", e.runId}, {"project", e.project}}; }

json Fields(const AcceptedEvent& e) {
    json j = {{"run_id", e.runId}, {"project", e.project}, {"kind", e.kind}};
    if (!e.intent.empty()) j["intent"] = e.intent;
    return j;
}

json Fields(const ExportEvent& e) {
    json archive = json::parse(e.archive, nullptr, false);
    if (archive.is_discarded()) archive = e.archive;
    return {{"project", e.project}, {"archive", archive}};
}

json Fields(const StatusEvent& e) {
    return {{"project", e.project}, {"state", e.state}, {"run_id", e.runId}, {"stage", e.stage},
            {"fix_attempts", e.fixAttempts}, {"url", e.url}, {"detail", e.detail}};
}

json Fields(const ProjectsEvent& e) {
    json list = json::array();
    for (const auto& summary : e.projects) list.push_back(EventCodec::ToJson(summary));
    return {{"projects", list}};
}

} // namespace

json EventCodec::ToJson(const ProjectSummary& summary) {
    return {{"name", summary.name}, {"title", summary.title}, {"mtime", summary.mtime},
            {"files", summary.fileCount}, {"state", ProjectStateToString(summary.state)}};
}

json EventCodec::ToJson(const PipelineEvent& event) {
    return std::visit([](const auto& e) {
        json j = Fields(e);
        j["type"] = std::decay_t<decltype(e)>::Type;
        return j;
    }, event);
}

std::string EventCodec::Encode(const PipelineEvent& event) {
    // Model output can hold invalid UTF-8; replace instead of throwing.
    return ToJson(event).dump(-1, ' ', false, json::error_handler_t::replace);
}

std::optional<ClientCommand> EventCodec::DecodeCommand(const std::string& text, std::string& error) {
    json body;
    try {
        body = json::parse(text);
    } catch (const json::parse_error& e) {
        error = std::string("Malformed command: ") + e.what();
        return std::nullopt;
    }
    if (!body.is_object()) {
        error = "Malformed command: expected a JSON object";
        return std::nullopt;
    }

    const std::string type = Str(body, "type");
    auto it = kCommandTypes.find(type);
    if (it == kCommandTypes.end()) {
        error = "Unknown command type: '" + type + "'";
        return std::nullopt;
    }
    return CommandFromJson(body, it->second, error);
}

std::optional<ClientCommand> EventCodec::CommandFromJson(const json& body, CommandType type, std::string& error) {
    if (!body.is_object()) {
        error = "Malformed command: expected a JSON object";
        return std::nullopt;
    }

    ClientCommand command;
    command.type = type;
    command.prompt = Str(body, "prompt");
    if (command.prompt.empty()) command.prompt = Str(body, type == CommandType::Build ? "idea" : "instruction");
    command.refineModel = Str(body, "refine_model");
    command.buildModel = Str(body, "build_model");
    command.project = Str(body, "project");
    command.runId = Str(body, "run_id");

    const std::string intent = Str(body, "intent");
    if (!intent.empty()) {
        command.intent = IntentFromString(intent);
        if (!command.intent) {
            error = "Unknown intent: '" + intent + "'";
            return std::nullopt;
        }
    }
    const std::string component = Str(body, "component");
    if (!component.empty()) command.component = component;
    return command;
}

} // namespace webforge::infrastructure
