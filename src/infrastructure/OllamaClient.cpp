#include "infrastructure/OllamaClient.hpp"
#include "domain/Errors.hpp"
#include <httplib.h>
#include <iostream>

namespace webforge::infrastructure {

using json = nlohmann::json;

namespace {
constexpr double kDeterministicTopP = 1.0;
constexpr int kDeterministicSeed = 42;

domain::TokenUsage UsageFrom(const json& body) {
    domain::TokenUsage usage;
    usage.promptTokens = body.value("prompt_eval_count", 0LL);
    usage.completionTokens = body.value("eval_count", 0LL);
    return usage;
}

[[noreturn]] void ThrowUnreachable(const std::string& host, int port, httplib::Error error) {
    throw domain::InfrastructureError("Ollama unreachable at " + host + ":" + std::to_string(port) +
                                      " (error " + std::to_string(static_cast<int>(error)) + ")");
}
}

OllamaClient::OllamaClient(const std::string& host, int port)
    : m_host(host), m_port(port) {}

json OllamaClient::ChatBody(const std::string& model, const json& messages,
                            bool stream, const ChatOptions& options) const {
    json requestData = {
        {"model", model},
        {"messages", messages},
        {"stream", stream},
        {"options", {
            {"temperature", options.temperature},
            {"top_p", kDeterministicTopP},
            {"seed", kDeterministicSeed},
            {"num_predict", options.numPredict}
        }}
    };
    if (options.forceJson) {
        requestData["format"] = "json";
    }
    return requestData;
}

std::optional<ChatResponse> OllamaClient::chat(const std::string& model,
                                               const json& messages,
                                               const ChatOptions& options) {
    httplib::Client cli(m_host, m_port);
    cli.set_read_timeout(options.timeoutSeconds);

    auto res = cli.Post("/api/chat", ChatBody(model, messages, false, options).dump(), "application/json");
    if (!res) {
        ThrowUnreachable(m_host, m_port, res.error());
    }
    if (res->status != 200) {
        std::cerr << "[OllamaClient] HTTP Error " << res->status << ": " << res->body << std::endl;
        return std::nullopt;
    }

    try {
        auto body = json::parse(res->body);
        if (body.contains("message") && body["message"].contains("content")) {
            return ChatResponse{body["message"]["content"].get<std::string>(), UsageFrom(body)};
        }
    } catch (const std::exception& e) {
        std::cerr << "[OllamaClient] Chat JSON Parse Error: " << e.what() << std::endl;
    }
    return std::nullopt;
}

std::optional<ChatResponse> OllamaClient::chatStream(const std::string& model,
                                                     const json& messages,
                                                     const TokenCallback& onToken,
                                                     const domain::CancellationToken* cancel,
                                                     const ChatOptions& options) {
    httplib::Client cli(m_host, m_port);
    cli.set_read_timeout(options.timeoutSeconds);

    ChatResponse response;
    std::string pending;

    auto handleLine = [&](const std::string& line) {
        if (line.empty()) return;
        try {
            auto chunk = json::parse(line);
            if (chunk.contains("message") && chunk["message"].contains("content")) {
                const std::string token = chunk["message"]["content"].get<std::string>();
                if (!token.empty()) {
                    response.content += token;
                    if (onToken) onToken(token);
                }
            }
            if (chunk.value("done", false)) {
                response.usage = UsageFrom(chunk);
            }
        } catch (const json::exception& e) {
            std::cerr << "[OllamaClient] Skipping malformed stream chunk: " << e.what() << std::endl;
        }
    };

    httplib::Request req;
    req.method = "POST";
    req.path = "/api/chat";
    req.headers.emplace("Content-Type", "application/json");
    req.body = ChatBody(model, messages, true, options).dump();
    req.content_receiver = [&](const char* data, size_t length, uint64_t, uint64_t) {
        if (cancel && cancel->isCancelled()) return false;
        pending.append(data, length);
        size_t pos;
        while ((pos = pending.find('\n')) != std::string::npos) {
            handleLine(pending.substr(0, pos));
            pending.erase(0, pos + 1);
        }
        return true;
    };

    auto res = cli.send(req);
    if (cancel && cancel->isCancelled()) {
        return std::nullopt;
    }
    if (!res) {
        ThrowUnreachable(m_host, m_port, res.error());
    }
    if (res->status != 200) {
        std::cerr << "[OllamaClient] HTTP Error " << res->status << " while streaming from " << model << std::endl;
        return std::nullopt;
    }
    handleLine(pending);
    return response;
}

std::optional<std::vector<std::string>> OllamaClient::getAvailableModels() {
    httplib::Client cli(m_host, m_port);
    cli.set_read_timeout(5);

    auto res = cli.Get("/api/tags");
    if (!res || res->status != 200) {
        std::cerr << "[OllamaClient] Could not list models" << std::endl;
        return std::nullopt;
    }

    std::vector<std::string> models;
    try {
        auto body = json::parse(res->body);
        if (body.contains("models") && body["models"].is_array()) {
            for (const auto& item : body["models"]) {
                if (item.contains("name")) {
                    models.push_back(item["name"].get<std::string>());
                }
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[OllamaClient] Tags JSON Parse Error: " << e.what() << std::endl;
        return std::nullopt;
    }
    return models;
}

bool OllamaClient::pullModel(const std::string& model) {
    httplib::Client cli(m_host, m_port);
    cli.set_read_timeout(1800); // large models take a while

    json requestData = {{"name", model}, {"stream", false}};
    auto res = cli.Post("/api/pull", requestData.dump(), "application/json");
    if (res && res->status == 200) {
        return true;
    }
    if (res) {
        std::cerr << "[OllamaClient] Pull of " << model << " failed: HTTP " << res->status << std::endl;
    } else {
        std::cerr << "[OllamaClient] Pull of " << model << " failed: " << static_cast<int>(res.error()) << std::endl;
    }
    return false;
}

bool OllamaClient::unloadModel(const std::string& model) {
    httplib::Client cli(m_host, m_port);
    cli.set_read_timeout(8);

    json requestData = {{"model", model}, {"keep_alive", 0}};
    auto res = cli.Post("/api/generate", requestData.dump(), "application/json");
    return res && res->status == 200;
}

} // namespace webforge::infrastructure
