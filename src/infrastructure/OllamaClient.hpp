/**
 * @file OllamaClient.hpp
 * @brief Low-level HTTP client for the Ollama REST API.
 */

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "domain/CancellationToken.hpp"
#include "domain/PipelineRun.hpp"

namespace webforge::infrastructure {

/** @brief Sampling options sent with a chat request. */
struct ChatOptions {
    double temperature = 0.15;
    int numPredict = 4096;
    bool forceJson = false;
    int timeoutSeconds = 240;
};

/** @brief Final content of a chat call plus the server's token counters. */
struct ChatResponse {
    std::string content;
    domain::TokenUsage usage;
};

class OllamaClient {
public:
    using TokenCallback = std::function<void(const std::string& token)>;

    OllamaClient(const std::string& host = "localhost", int port = 11434);

    /**
     * @brief Sends a non-streaming POST request to /api/chat.
     * @return nullopt on an HTTP or parse error (logged).
     * @throws domain::InfrastructureError when the server cannot be reached.
     */
    std::optional<ChatResponse> chat(const std::string& model,
                                     const nlohmann::json& messages,
                                     const ChatOptions& options = {});

    /**
     * @brief Streams /api/chat, calling `onToken` for every content chunk.
     * @return nullopt on an HTTP error or when cancelled.
     * @throws domain::InfrastructureError when the server cannot be reached.
     */
    std::optional<ChatResponse> chatStream(const std::string& model,
                                           const nlohmann::json& messages,
                                           const TokenCallback& onToken,
                                           const domain::CancellationToken* cancel = nullptr,
                                           const ChatOptions& options = {});

    /** @brief Fetches available models from /api/tags. nullopt when unreachable. */
    std::optional<std::vector<std::string>> getAvailableModels();

    /** @brief Downloads a model through /api/pull (blocking). */
    bool pullModel(const std::string& model);

    /** @brief Evicts a model from memory (`keep_alive: 0`). */
    bool unloadModel(const std::string& model);

    const std::string& host() const { return m_host; }
    int port() const { return m_port; }

private:
    nlohmann::json ChatBody(const std::string& model, const nlohmann::json& messages,
                            bool stream, const ChatOptions& options) const;

    std::string m_host;
    int m_port;
};

} // namespace webforge::infrastructure
