#include "infrastructure/HttpApiServer.hpp"
#include "infrastructure/EventCodec.hpp"
#include "infrastructure/ProjectRepositoryFs.hpp"
#include "application/ProjectExportService.hpp"

#include <iostream>
#include <httplib.h>

namespace webforge::infrastructure {

using json = nlohmann::json;
using namespace webforge::domain;
using application::CommandType;
using application::ProjectExportService;
using application::SubmitResult;

namespace {

constexpr size_t kMaxUploadFiles = 500;

void SendJson(httplib::Response& res, const json& body, int status = 200) {
    res.status = status;
    res.set_header("Access-Control-Allow-Origin", "*");
    res.set_content(body.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
}

void SendError(httplib::Response& res, int status, const std::string& text,
               FailureReason reason = FailureReason::UserInput) {
    SendJson(res, {{"ok", false}, {"reason", FailureReasonToString(reason)}, {"text", text}}, status);
}

int StatusFor(FailureReason reason) {
    switch (reason) {
        case FailureReason::UserInput: return 400;
        case FailureReason::Busy: return 409;
        case FailureReason::AtCapacity: return 503;
        default: return 500;
    }
}

std::optional<json> ParseBody(const httplib::Request& req, httplib::Response& res) {
    json body = json::parse(req.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        SendError(res, 400, "Request body must be a JSON object");
        return std::nullopt;
    }
    return body;
}

void SendSubmitResult(httplib::Response& res, const SubmitResult& result) {
    if (!result.accepted) {
        SendError(res, StatusFor(result.reason), result.detail, result.reason);
        return;
    }
    json body = {{"ok", true}, {"run_id", result.runId}, {"project", result.project}};
    if (result.intent) body["intent"] = IntentToString(*result.intent);
    SendJson(res, body);
}

// Holds a project lock for the lifetime of an import.
class ImportLease {
public:
    ImportLease(application::PipelineOrchestrator& orchestrator, std::string project)
        : m_orchestrator(orchestrator), m_project(std::move(project)),
          m_token(m_orchestrator.LeaseProject(m_project)) {}
    ~ImportLease() {
        if (!m_token.empty()) m_orchestrator.ReturnProject(m_project, m_token);
    }

    ImportLease(const ImportLease&) = delete;
    ImportLease& operator=(const ImportLease&) = delete;

    bool held() const { return !m_token.empty(); }

private:
    application::PipelineOrchestrator& m_orchestrator;
    std::string m_project;
    std::string m_token;
};

} // namespace

HttpApiServer::HttpApiServer(application::PipelineOrchestrator& orchestrator,
                             std::shared_ptr<ProjectRepository> repository,
                             std::string host, int port)
    : m_orchestrator(orchestrator), m_repository(std::move(repository)),
      m_host(std::move(host)), m_port(port) {}

HttpApiServer::~HttpApiServer() {
    stop();
}

EventSink HttpApiServer::LoggingSink() {
    return [](const PipelineEvent& event) {
        if (const auto* done = std::get_if<DoneEvent>(&event)) {
            std::cout << "[HttpApi] Run " << done->runId << " done: " << done->url << std::endl;
        } else if (const auto* error = std::get_if<ErrorEvent>(&event)) {
            std::cerr << "[HttpApi] Run " << error->runId << " failed ("
                      << FailureReasonToString(error->reason) << "): " << error->text << std::endl;
        } else if (const auto* cancelled = std::get_if<CancelledEvent>(&event)) {
            std::cout << "[HttpApi] Run " << cancelled->runId << " cancelled" << std::endl;
        }
    };
}

std::optional<json> HttpApiServer::ProjectFiles(const std::string& name) {
    auto project = m_repository->load(name);
    if (!project) return std::nullopt;
    json files = json::object();
    for (const auto& [path, file] : ProjectExportService::OrderedFiles(*project)) {
        files[path] = file->content;
    }
    return files;
}

std::optional<std::string> HttpApiServer::ImportProject(const json& body, int& status, std::string& error) {
    std::string name = ProjectRepositoryFs::SanitizeName(body.value("name", std::string("imported")));
    if (name.empty()) name = "imported";

    if (!body.contains("files") || !body["files"].is_object()) {
        status = 400;
        error = "'files' must be an object of path to content";
        return std::nullopt;
    }
    const json& files = body["files"];
    if (files.size() > kMaxUploadFiles) {
        status = 400;
        error = "Too many files (" + std::to_string(files.size()) + ")";
        return std::nullopt;
    }
    ImportLease lease(m_orchestrator, name);
    if (!lease.held()) {
        status = 409;
        error = "A run is already in progress for '" + name + "'";
        return std::nullopt;
    }

    auto existing = m_repository->load(name);
    Project project = existing ? *existing : m_repository->create(name);
    std::optional<ImportLease> renamed;
    if (project.getName() != name) {
        renamed.emplace(m_orchestrator, project.getName());
        if (!renamed->held()) {
            status = 409;
            error = "A run is already in progress for '" + project.getName() + "'";
            return std::nullopt;
        }
    }

    size_t written = 0;
    for (const auto& [relPath, content] : files.items()) {
        if (!content.is_string()) {
            std::cerr << "[HttpApi] Skipping " << relPath << ": content is not a string" << std::endl;
            continue;
        }
        try {
            m_repository->writeFile(project, relPath, content.get<std::string>());
            ++written;
        } catch (const std::exception& e) {
            std::cerr << "[HttpApi] Failed to write " << relPath << ": " << e.what() << std::endl;
        }
    }
    m_repository->saveMetadata(project);
    std::cout << "[HttpApi] Imported " << written << " file(s) into " << project.getName() << std::endl;
    status = 200;
    return project.getName();
}

void HttpApiServer::RegisterRoutes() {
    m_server->Options(".*", [](const httplib::Request&, httplib::Response& res) {
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
        res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        res.status = 204;
    });

    m_server->Get("/projects", [this](const httplib::Request&, httplib::Response& res) {
        json list = json::array();
        for (const auto& summary : m_repository->list()) list.push_back(EventCodec::ToJson(summary));
        SendJson(res, list);
    });

    m_server->Get(R"(/files/([A-Za-z0-9_\-]+)/?)", [this](const httplib::Request& req, httplib::Response& res) {
        auto files = ProjectFiles(req.matches[1]);
        // An unknown project reads as an empty file map.
        SendJson(res, files ? *files : json::object());
    });

    m_server->Get(R"(/export/([A-Za-z0-9_\-]+)/?)", [this](const httplib::Request& req, httplib::Response& res) {
        auto project = m_repository->load(req.matches[1]);
        if (!project) {
            SendError(res, 404, "Project not found: " + req.matches[1].str());
            return;
        }
        res.set_header("Content-Disposition", "attachment; filename=\"" + project->getName() + ".json\"");
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_content(ProjectExportService::ToArchive(*project), "application/json");
    });

    m_server->Get(R"(/status/([A-Za-z0-9_\-]+)/?)", [this](const httplib::Request& req, httplib::Response& res) {
        auto status = m_orchestrator.Status(req.matches[1]);
        if (!status) {
            SendError(res, 404, "Project not found: " + req.matches[1].str());
            return;
        }
        SendJson(res, EventCodec::ToJson(PipelineEvent{*status}));
    });

    m_server->Post("/build", [this](const httplib::Request& req, httplib::Response& res) {
        auto body = ParseBody(req, res);
        if (!body) return;
        std::string error;
        auto command = EventCodec::CommandFromJson(*body, CommandType::Build, error);
        if (!command) {
            SendError(res, 400, error);
            return;
        }
        BuildRequest request;
        request.idea = command->prompt;
        request.refineModel = command->refineModel;
        request.buildModel = command->buildModel;
        if (!command->project.empty()) request.targetProject = command->project;
        SendSubmitResult(res, m_orchestrator.SubmitBuild(request, LoggingSink()));
    });

    m_server->Post("/update", [this](const httplib::Request& req, httplib::Response& res) {
        auto body = ParseBody(req, res);
        if (!body) return;
        std::string error;
        auto command = EventCodec::CommandFromJson(*body, CommandType::Update, error);
        if (!command) {
            SendError(res, 400, error);
            return;
        }
        RepromptRequest request;
        request.project = command->project;
        request.instruction = command->prompt;
        request.buildModel = command->buildModel;
        request.intent = command->intent;
        request.componentHint = command->component;
        SendSubmitResult(res, m_orchestrator.SubmitUpdate(request, LoggingSink()));
    });

    m_server->Post("/upload-project", [this](const httplib::Request& req, httplib::Response& res) {
        auto body = ParseBody(req, res);
        if (!body) return;
        int status = 500;
        std::string error;
        try {
            auto name = ImportProject(*body, status, error);
            if (!name) {
                SendError(res, status, error, status == 409 ? FailureReason::Busy : FailureReason::UserInput);
                return;
            }
            SendJson(res, {{"ok", true}, {"project", *name}});
        } catch (const std::exception& e) {
            SendError(res, 500, e.what(), FailureReason::Infrastructure);
        }
    });

    m_server->Post(R"(/cancel/([A-Za-z0-9_\-]+)/?)", [this](const httplib::Request& req, httplib::Response& res) {
        const bool cancelled = m_orchestrator.CancelProject(req.matches[1]);
        SendJson(res, {{"ok", cancelled}}, cancelled ? 200 : 404);
    });
}

bool HttpApiServer::start() {
    if (m_server) return false;
    m_server = std::make_unique<httplib::Server>();
    m_server->set_payload_max_length(64 * 1024 * 1024);
    RegisterRoutes();

    if (!m_server->bind_to_port(m_host, m_port)) {
        std::cerr << "[HttpApi] Cannot bind " << m_host << ":" << m_port << std::endl;
        m_server.reset();
        return false;
    }
    m_thread = std::thread([this]() { m_server->listen_after_bind(); });
    std::cout << "[HttpApi] Listening on http://" << m_host << ":" << m_port << std::endl;
    return true;
}

void HttpApiServer::stop() {
    if (!m_server) return;
    m_server->stop();
    if (m_thread.joinable()) m_thread.join();
    m_server.reset();
    std::cout << "[HttpApi] Stopped" << std::endl;
}

} // namespace webforge::infrastructure
