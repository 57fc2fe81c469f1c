/**
 * @file PipelineRun.hpp
 * @brief State of one execution of the orchestration state machine.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "domain/Errors.hpp"
#include "domain/Requests.hpp"

namespace webforge::domain {

/**
 * @enum PipelineStage
 * @brief Stages of a run. Transitions are strictly sequential.
 */
enum class PipelineStage {
    Received,
    Enriching,
    Generating,
    Installing,
    Serving,
    FixLoop,
    Done,
    Failed,
    Cancelled
};

inline std::string StageToString(PipelineStage stage) {
    switch (stage) {
        case PipelineStage::Received: return "received";
        case PipelineStage::Enriching: return "enriching";
        case PipelineStage::Generating: return "generating";
        case PipelineStage::Installing: return "installing";
        case PipelineStage::Serving: return "serving";
        case PipelineStage::FixLoop: return "fix_loop";
        case PipelineStage::Done: return "done";
        case PipelineStage::Failed: return "failed";
        case PipelineStage::Cancelled: return "cancelled";
    }
    return "received";
}

inline bool IsTerminal(PipelineStage stage) {
    return stage == PipelineStage::Done || stage == PipelineStage::Failed ||
           stage == PipelineStage::Cancelled;
}

enum class RunKind { Build, Update };

inline std::string RunKindToString(RunKind kind) {
    return kind == RunKind::Build ? "build" : "update";
}

/** @brief Token counters reported by the model server. */
struct TokenUsage {
    long long promptTokens = 0;
    long long completionTokens = 0;

    TokenUsage& operator+=(const TokenUsage& other) {
        promptTokens += other.promptTokens;
        completionTokens += other.completionTokens;
        return *this;
    }
};

/**
 * @struct RunOutcome
 * @brief Terminal result of a run.
 */
struct RunOutcome {
    bool success = false;
    std::string servingUrl;            ///< Set on success.
    FailureReason reason = FailureReason::Internal;
    std::string detail;
    std::vector<std::string> lastErrors; ///< Last filtered test errors, if any.
};

/**
 * @struct PipelineRun
 * @brief One run: current stage, fix-loop attempt counter, counters and result.
 */
struct PipelineRun {
    std::string id;
    RunKind kind = RunKind::Build;
    std::string project;
    PipelineStage stage = PipelineStage::Received;
    std::optional<Intent> intent;
    int fixAttempts = 0;
    TokenUsage tokens;
    std::optional<RunOutcome> outcome;
    std::chrono::system_clock::time_point startedAt = std::chrono::system_clock::now();
};

} // namespace webforge::domain
