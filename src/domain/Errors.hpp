/**
 * @file Errors.hpp
 * @brief Failure taxonomy and the exceptions collaborators raise.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace webforge::domain {

/**
 * @enum FailureReason
 * @brief Reason code carried by every terminal failure.
 */
enum class FailureReason {
    UserInput,       ///< Empty idea/instruction, unknown project. Nothing touched.
    Collaborator,    ///< Enrichment or generation returned malformed output.
    Infrastructure,  ///< Install failure, port timeout, process crash.
    CodeQuality,     ///< Fix-loop budget exhausted.
    Busy,            ///< Project already has an active run.
    AtCapacity,      ///< Global concurrent run limit reached.
    Cancelled,
    Internal
};

inline std::string FailureReasonToString(FailureReason reason) {
    switch (reason) {
        case FailureReason::UserInput: return "user_input";
        case FailureReason::Collaborator: return "collaborator";
        case FailureReason::Infrastructure: return "infrastructure";
        case FailureReason::CodeQuality: return "code_quality";
        case FailureReason::Busy: return "busy";
        case FailureReason::AtCapacity: return "at_capacity";
        case FailureReason::Cancelled: return "cancelled";
        case FailureReason::Internal: return "internal";
    }
    return "internal";
}

/** @brief Raised by enrichment/generation adapters on malformed or missing output. */
class CollaboratorError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/** @brief Raised when a tool or server the pipeline depends on is unusable. */
class InfrastructureError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/** @brief Raised inside a run when cancellation was requested. */
class RunCancelled : public std::runtime_error {
public:
    RunCancelled() : std::runtime_error("run cancelled") {}
};

} // namespace webforge::domain
