/**
 * @file GenerationService.hpp
 * @brief Interface for generating and repairing project files with a model.
 */

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "domain/CancellationToken.hpp"
#include "domain/PipelineRun.hpp"
#include "domain/Requests.hpp"
#include "domain/SiteSpecification.hpp"

namespace webforge::domain {

/** @brief One file produced by the generation collaborator. */
struct GeneratedFile {
    std::string path;
    std::string content;
};

/**
 * @struct StreamObserver
 * @brief Optional hooks for raw token streaming while a file is generated.
 *
 * Hooks must not call back into the orchestrator; they only forward events.
 */
struct StreamObserver {
    std::function<void(const std::string& file)> onStart;
    std::function<void(const std::string& file, const std::string& token)> onToken;
    std::function<void(const std::string& file, const std::string& content)> onEnd;
};

/** @brief Per-call settings for a generation request. */
struct GenerationContext {
    std::string modelId;
    StreamObserver observer;
    const CancellationToken* cancel = nullptr;
};

/**
 * @class FileStream
 * @brief Finite, non-restartable sequence of generated files.
 *
 * Files are returned in completion order. Once `next()` returned nullopt the
 * stream is exhausted.
 */
class FileStream {
public:
    virtual ~FileStream() = default;

    /**
     * @brief Produces the next completed file.
     * @throws CollaboratorError when generation fails mid-stream.
     */
    virtual std::optional<GeneratedFile> next() = 0;

    /** @brief Tokens consumed so far. */
    virtual TokenUsage usage() const { return {}; }
};

/** @brief Input of a targeted repair. */
struct RepairRequest {
    std::string filePath;
    std::string currentContent;
    std::string errorContext;    ///< Filtered errors relevant to this file.
    std::string codebaseContext; ///< Short summary of the other project files.
};

/** @brief Input of a component (re)generation on the update path. */
struct ComponentRequest {
    std::string componentName;
    std::string instruction;
    std::string existingCode;    ///< Empty for a new component.
    std::string codebaseContext;
    Intent intent = Intent::Modify;
    bool isNew = false;
};

/** @brief Content plus token accounting for single-file calls. */
struct GenerationResult {
    std::string content;
    TokenUsage usage;
};

/**
 * @class GenerationService
 * @brief Abstract generation collaborator.
 */
class GenerationService {
public:
    virtual ~GenerationService() = default;

    /** @brief Starts generating a full project for the specification. */
    virtual std::unique_ptr<FileStream> generate(const SiteSpecification& spec,
                                                 const GenerationContext& ctx) = 0;

    /**
     * @brief Rewrites a single broken file given its error context.
     * @throws CollaboratorError when no usable content was produced.
     */
    virtual GenerationResult repair(const RepairRequest& request, const GenerationContext& ctx) = 0;

    /**
     * @brief Generates one component for the update path.
     * @throws CollaboratorError when no usable content was produced.
     */
    virtual GenerationResult generateComponent(const ComponentRequest& request,
                                               const GenerationContext& ctx) = 0;
};

} // namespace webforge::domain
