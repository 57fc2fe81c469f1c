/**
 * @file PipelineEvent.hpp
 * @brief Typed events emitted to the session that originated a request.
 */

#pragma once

#include <functional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include "domain/Errors.hpp"
#include "domain/Project.hpp"

namespace webforge::domain {

struct LogEvent {
    static constexpr const char* Type = "log";
    std::string level; ///< "INFO", "WARN", "ERROR".
    std::string text;
};

struct StepEvent {
    static constexpr const char* Type = "step";
    std::string step;   ///< "refine", "build", "install", "serve", "test".
    std::string status; ///< "active", "done", "error".
};

struct ProgressEvent {
    static constexpr const char* Type = "progress";
    std::string label;
    int pct = 0;
};

struct FileEvent {
    static constexpr const char* Type = "file";
    std::string path;
    std::string size;
    std::string content;
};

struct DetectedEvent {
    static constexpr const char* Type = "detected";
    std::string siteType;
    std::string strategy;
};

struct StreamStartEvent {
    static constexpr const char* Type = "stream_start";
    std::string file;
};

struct StreamTokenEvent {
    static constexpr const char* Type = "stream";
    std::string file;
    std::string token;
};

struct StreamEndEvent {
    static constexpr const char* Type = "stream_end";
    std::string file;
    std::string content;
};

struct TestRunEvent {
    static constexpr const char* Type = "test_run";
    int attempt = 0;
};

struct TestFixingEvent {
    static constexpr const char* Type = "test_fixing";
    int attempt = 0;
    std::vector<std::string> errors;
};

struct DoneEvent {
    static constexpr const char* Type = "done";
    std::string runId;
    std::string project;
    std::string url;
    int fixAttempts = 0;
};

struct ErrorEvent {
    static constexpr const char* Type = "error";
    std::string runId; ///< Empty when the request was rejected before admission.
    std::string project;
    FailureReason reason = FailureReason::Internal;
    std::string text;
    std::vector<std::string> errors;
};

struct CancelledEvent {
    static constexpr const char* Type = "cancelled";
    std::string runId;
    std::string project;
};

struct AcceptedEvent {
    static constexpr const char* Type = "accepted";
    std::string runId;
    std::string project;
    std::string kind;
    std::string intent; ///< Update runs only.
};

struct ExportEvent {
    static constexpr const char* Type = "export";
    std::string project;
    std::string archive; ///< JSON bundle of the file set.
};

struct StatusEvent {
    static constexpr const char* Type = "status";
    std::string project;
    std::string state;
    std::string runId;
    std::string stage;
    int fixAttempts = 0;
    std::string url;
    std::string detail;
};

struct ProjectsEvent {
    static constexpr const char* Type = "projects";
    std::vector<ProjectSummary> projects;
};

using PipelineEvent = std::variant<
    LogEvent,
    StepEvent,
    ProgressEvent,
    FileEvent,
    DetectedEvent,
    StreamStartEvent,
    StreamTokenEvent,
    StreamEndEvent,
    TestRunEvent,
    TestFixingEvent,
    DoneEvent,
    ErrorEvent,
    CancelledEvent,
    AcceptedEvent,
    ExportEvent,
    StatusEvent,
    ProjectsEvent
>;

/** @brief Returns the wire type name of an event. */
inline const char* EventTypeName(const PipelineEvent& event) {
    return std::visit([](const auto& e) { return std::decay_t<decltype(e)>::Type; }, event);
}

/** @brief True for events that end a run from the client's point of view. */
inline bool IsTerminalEvent(const PipelineEvent& event) {
    return std::holds_alternative<DoneEvent>(event) ||
           std::holds_alternative<CancelledEvent>(event) ||
           (std::holds_alternative<ErrorEvent>(event) && !std::get<ErrorEvent>(event).runId.empty());
}

/** @brief Receives the events of one run, in emission order. */
using EventSink = std::function<void(const PipelineEvent&)>;

} // namespace webforge::domain
