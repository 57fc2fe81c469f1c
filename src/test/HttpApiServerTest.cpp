#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "infrastructure/HttpApiServer.hpp"
#include "test/FakeCollaborators.hpp"

using namespace webforge::application;
using namespace webforge::test;
using webforge::infrastructure::HttpApiServer;
using json = nlohmann::json;

namespace {

struct ApiHarness {
    std::shared_ptr<InMemoryProjectRepository> repo = std::make_shared<InMemoryProjectRepository>();
    std::shared_ptr<FakeProcessSupervisor> supervisor = std::make_shared<FakeProcessSupervisor>();
    PipelineOrchestrator orchestrator;
    HttpApiServer server;

    explicit ApiHarness(int port = 0)
        : orchestrator(repo, std::make_shared<FakeEnrichmentService>(), std::make_shared<FakeGenerationService>(),
                       std::make_shared<ScriptedTestService>(), supervisor, Settings()),
          server(orchestrator, repo, "127.0.0.1", port) {}

    ~ApiHarness() {
        server.stop();
        orchestrator.Shutdown();
    }

    static OrchestratorSettings Settings() {
        OrchestratorSettings settings;
        settings.keepServerAfterRun = false;
        return settings;
    }
};

// Reserves and releases an ephemeral loopback port for the server to bind.
int FreePort() {
    const int sock = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    assert(::bind(sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
    socklen_t len = sizeof(addr);
    assert(::getsockname(sock, reinterpret_cast<sockaddr*>(&addr), &len) == 0);
    ::close(sock);
    return ntohs(addr.sin_port);
}

void TestImport() {
    std::cout << "[Test] Project import..." << std::endl;
    ApiHarness h;
    int status = 0;
    std::string error;

    auto name = h.server.ImportProject(
        {{"name", "My Shop!"},
         {"files", {{"src/App.jsx", "export default function App() {}"}, {"package.json", "{}"}, {"bad", 42}}}},
        status, error);
    assert(name && *name == "myshop");
    assert(status == 200);
    auto project = h.repo->load("myshop");
    assert(project && project->getFiles().size() == 2);

    name = h.server.ImportProject({{"files", {{"index.html", "<html></html>"}}}}, status, error);
    assert(name && *name == "imported");

    assert(!h.server.ImportProject({{"name", "x"}, {"files", json::array()}}, status, error));
    assert(status == 400);

    json many = json::object();
    for (int i = 0; i < 501; ++i) many["src/f" + std::to_string(i) + ".js"] = "x";
    assert(!h.server.ImportProject({{"name", "big"}, {"files", many}}, status, error));
    assert(status == 400);
    assert(!h.repo->exists("big"));
    std::cout << "[PASS] Uploads are sanitized, bounded and written." << std::endl;
}

void TestImportWhileBusy() {
    std::cout << "[Test] Import into a busy project..." << std::endl;
    ApiHarness h;
    h.repo->Seed("bakery");
    h.supervisor->blockOnPort = true;

    BuildRequest rebuild;
    rebuild.idea = "A bakery with a large hero photo";
    rebuild.targetProject = "bakery";
    auto run = h.orchestrator.SubmitBuild(rebuild, EventSink());
    assert(run.accepted && run.project == "bakery");
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (h.supervisor->portWaits.load() == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    assert(h.orchestrator.IsBusy("bakery"));

    int status = 0;
    std::string error;
    assert(!h.server.ImportProject({{"name", "bakery"}, {"files", {{"src/App.jsx", "x"}}}}, status, error));
    assert(status == 409);

    h.orchestrator.Cancel(run.runId);
    h.orchestrator.WaitIdle();
    assert(h.server.ImportProject({{"name", "bakery"}, {"files", {{"src/App.jsx", "x"}}}}, status, error));
    std::cout << "[PASS] Busy projects refuse imports until the run ends." << std::endl;
}

void TestImportHoldsProjectLock() {
    std::cout << "[Test] Runs cannot start while an import writes..." << std::endl;
    ApiHarness h;
    h.repo->Seed("bakery");

    std::vector<FailureReason> refusals;
    bool busyDuringWrite = false;
    h.repo->beforeWrite = [&](const std::string& project) {
        if (project != "bakery" || !refusals.empty()) return;
        busyDuringWrite = h.orchestrator.IsBusy("bakery");

        RepromptRequest update;
        update.project = "bakery";
        update.instruction = "Change the hero title to Fresh Loaves";
        auto result = h.orchestrator.SubmitUpdate(update, EventSink());
        assert(!result.accepted);
        refusals.push_back(result.reason);

        BuildRequest rebuild;
        rebuild.idea = "A bakery with a large hero photo";
        rebuild.targetProject = "bakery";
        result = h.orchestrator.SubmitBuild(rebuild, EventSink());
        assert(!result.accepted);
        refusals.push_back(result.reason);
    };

    int status = 0;
    std::string error;
    auto name = h.server.ImportProject(
        {{"name", "bakery"}, {"files", {{"src/App.jsx", "x"}, {"src/components/Hero.jsx", "y"}}}}, status, error);
    assert(name && *name == "bakery" && status == 200);
    assert(busyDuringWrite);
    assert(refusals.size() == 2);
    for (auto reason : refusals) assert(reason == FailureReason::Busy);
    assert(h.orchestrator.ActiveRuns() == 0);

    h.repo->beforeWrite = nullptr;
    assert(!h.orchestrator.IsBusy("bakery"));
    RepromptRequest update;
    update.project = "bakery";
    update.instruction = "Change the hero title to Fresh Loaves";
    assert(h.orchestrator.SubmitUpdate(update, EventSink()).accepted);
    h.orchestrator.WaitIdle();
    std::cout << "[PASS] The import owns the project until it is written." << std::endl;
}

void TestFileListing() {
    std::cout << "[Test] File listing order..." << std::endl;
    ApiHarness h;
    h.repo->Seed("bakery");
    auto files = h.server.ProjectFiles("bakery");
    assert(files && files->size() == 3);
    assert(files->begin().key() == "src/App.jsx");
    assert(!h.server.ProjectFiles("missing"));
    std::cout << "[PASS] The composition root comes first." << std::endl;
}

void TestRoutes() {
    std::cout << "[Test] REST routes over HTTP..." << std::endl;
    const int port = FreePort();
    ApiHarness h(port);
    h.repo->Seed("bakery");
    assert(h.server.start());

    httplib::Client cli("127.0.0.1", port);
    cli.set_connection_timeout(5);

    auto res = cli.Get("/projects");
    assert(res && res->status == 200);
    assert(json::parse(res->body).size() == 1);
    assert(res->get_header_value("Access-Control-Allow-Origin") == "*");

    res = cli.Get("/files/nothing");
    assert(res && res->status == 200 && res->body == "{}");

    res = cli.Get("/export/bakery");
    assert(res && res->status == 200);
    assert(res->get_header_value("Content-Disposition").find("bakery.json") != std::string::npos);
    assert(cli.Get("/export/nothing")->status == 404);

    res = cli.Post("/build", R"({"prompt": "   "})", "application/json");
    assert(res && res->status == 400);
    assert(json::parse(res->body)["reason"] == "user_input");

    res = cli.Post("/build", "not json", "application/json");
    assert(res && res->status == 400);

    res = cli.Post("/build", R"({"idea": "A bakery site"})", "application/json");
    assert(res && res->status == 200);
    const json accepted = json::parse(res->body);
    assert(accepted["ok"] == true);
    assert(!accepted["run_id"].get<std::string>().empty());
    h.orchestrator.WaitIdle();

    res = cli.Post("/update", R"({"project": "bakery", "instruction": "Add a gallery section"})",
                   "application/json");
    assert(res && res->status == 200);
    assert(json::parse(res->body)["intent"] == "feature");
    h.orchestrator.WaitIdle();

    res = cli.Get("/status/bakery");
    assert(res && res->status == 200);
    const json status = json::parse(res->body);
    assert(status["type"] == "status");
    assert(status["state"] == "ready");

    res = cli.Post("/cancel/bakery", "", "application/json");
    assert(res && res->status == 404);

    h.server.stop();
    std::cout << "[PASS] Routes answer with the documented status codes." << std::endl;
}

} // namespace

int main() {
    TestImport();
    TestImportWhileBusy();
    TestImportHoldsProjectLock();
    TestFileListing();
    TestRoutes();
    std::cout << "All HTTP API tests passed." << std::endl;
    return 0;
}
