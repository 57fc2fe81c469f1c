/**
 * @file FakeCollaborators.hpp
 * @brief In-memory stand-ins for the domain interfaces, shared by the tests.
 */

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "domain/EnrichmentService.hpp"
#include "domain/GenerationService.hpp"
#include "domain/PipelineEvent.hpp"
#include "domain/ProcessSupervisor.hpp"
#include "domain/ProjectRepository.hpp"
#include "domain/TestService.hpp"

namespace webforge::test {

using namespace webforge::domain;

inline const char* kAppSource =
    "import Navbar from './components/Navbar'\n"
    "import Hero from './components/Hero'\n"
    "\n"
    "export default function App() {\n"
    "  return (\n"
    "    <div className=\"min-h-screen\">\n"
    "      <Navbar />\n"
    "      <Hero />\n"
    "    </div>\n"
    "  )\n"
    "}\n";

inline const char* kHeroSource =
    "export default function Hero() {\n"
    "  return <section><h1>Fresh bread</h1><button>Order</button><button>Menu</button></section>\n"
    "}\n";

inline const char* kNavbarSource =
    "export default function Navbar() {\n"
    "  return <nav><a href=\"#hero\">Home</a><button>Call</button></nav>\n"
    "}\n";

class InMemoryProjectRepository : public ProjectRepository {
public:
    std::optional<Project> load(const std::string& name) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_projects.find(name);
        if (it == m_projects.end()) return std::nullopt;
        return it->second;
    }

    bool exists(const std::string& name) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_projects.count(name) > 0;
    }

    Project create(const std::string& slug) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::string name = slug;
        for (int suffix = 2; m_projects.count(name); ++suffix) name = slug + "-" + std::to_string(suffix);
        Project project(name, "/tmp/webforge-fake/" + name);
        m_projects[name] = project;
        return project;
    }

    void writeFile(Project& project, const std::string& relPath, const std::string& content) override {
        if (beforeWrite) beforeWrite(project.getName());
        std::lock_guard<std::mutex> lock(m_mutex);
        if (failWrites) throw std::runtime_error("disk full");
        project.setFile(relPath, content);
        m_projects[project.getName()].setFile(relPath, content);
        ++writes;
    }

    void saveMetadata(const Project& project) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto& stored = m_projects[project.getName()];
        stored.setState(project.getState());
        if (auto last = project.getLastSuccessfulBuild()) stored.markSuccessfulBuild(*last);
    }

    std::vector<ProjectSummary> list() override {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<ProjectSummary> out;
        for (const auto& [name, project] : m_projects) {
            ProjectSummary summary;
            summary.name = name;
            summary.title = name;
            summary.fileCount = project.getFiles().size();
            summary.state = project.getState();
            out.push_back(summary);
        }
        return out;
    }

    bool hasInstalledDependencies(const Project&) override { return depsInstalled; }

    /** @brief Adds a ready project with an App, a Navbar and a Hero. */
    void Seed(const std::string& name) {
        std::lock_guard<std::mutex> lock(m_mutex);
        Project project(name, "/tmp/webforge-fake/" + name);
        project.setFile("src/App.jsx", kAppSource);
        project.setFile("src/components/Hero.jsx", kHeroSource);
        project.setFile("src/components/Navbar.jsx", kNavbarSource);
        project.setState(ProjectState::Ready);
        m_projects[name] = project;
    }

    std::atomic<bool> depsInstalled{false};
    std::atomic<bool> failWrites{false};
    std::function<void(const std::string&)> beforeWrite; ///< Runs on the writing thread, unlocked.
    std::atomic<int> writes{0};

private:
    std::mutex m_mutex;
    std::map<std::string, Project> m_projects;
};

class FakeEnrichmentService : public EnrichmentService {
public:
    FakeEnrichmentService() {
        spec.projectName = "Bakery";
        spec.siteType = "restaurant";
        spec.title = "Corner Bakery";
        spec.sections = {"Navbar", "Hero"};
    }

    SiteSpecification enrich(const std::string&, const std::string& modelId) override {
        ++calls;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            lastModel = modelId;
        }
        if (malformedResponses > 0) {
            --malformedResponses;
            throw CollaboratorError("model returned no JSON object");
        }
        if (unreachable) throw InfrastructureError("Ollama unreachable at localhost:11434");
        return spec;
    }

    SiteSpecification spec;
    std::atomic<int> calls{0};
    std::atomic<int> malformedResponses{0};
    std::atomic<bool> unreachable{false};
    std::string lastModel;

private:
    std::mutex m_mutex;
};

class VectorFileStream : public FileStream {
public:
    explicit VectorFileStream(std::vector<GeneratedFile> files) : m_files(std::move(files)) {}

    std::optional<GeneratedFile> next() override {
        if (m_index >= m_files.size()) return std::nullopt;
        return m_files[m_index++];
    }

    TokenUsage usage() const override {
        TokenUsage usage;
        usage.completionTokens = static_cast<long long>(m_index) * 100;
        return usage;
    }

private:
    std::vector<GeneratedFile> m_files;
    size_t m_index = 0;
};

class FakeGenerationService : public GenerationService {
public:
    FakeGenerationService() {
        files = {
            {"package.json", "{\"name\":\"bakery\"}"},
            {"src/App.jsx", kAppSource},
            {"src/components/Navbar.jsx", kNavbarSource},
            {"src/components/Hero.jsx", kHeroSource},
        };
    }

    std::unique_ptr<FileStream> generate(const SiteSpecification&, const GenerationContext& ctx) override {
        ++generations;
        for (const auto& file : files) {
            if (ctx.observer.onStart) ctx.observer.onStart(file.path);
            if (ctx.observer.onToken) ctx.observer.onToken(file.path, "export");
            if (ctx.observer.onEnd) ctx.observer.onEnd(file.path, file.content);
        }
        return std::make_unique<VectorFileStream>(files);
    }

    GenerationResult repair(const RepairRequest& request, const GenerationContext&) override {
        ++repairs;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            repairedPaths.push_back(request.filePath);
        }
        if (repairFails) throw CollaboratorError("model returned an empty component");
        GenerationResult result;
        result.content = request.currentContent + "\n// repaired\n";
        return result;
    }

    GenerationResult generateComponent(const ComponentRequest& request, const GenerationContext&) override {
        ++components;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            lastComponent = request;
        }
        GenerationResult result;
        result.content = "export default function " + request.componentName + "() {\n"
                         "  return <section>" + request.componentName + "</section>\n}\n";
        return result;
    }

    ComponentRequest LastComponent() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return lastComponent;
    }

    std::vector<GeneratedFile> files;
    std::atomic<int> generations{0};
    std::atomic<int> repairs{0};
    std::atomic<int> components{0};
    std::atomic<bool> repairFails{false};
    std::vector<std::string> repairedPaths;

private:
    std::mutex m_mutex;
    ComponentRequest lastComponent;
};

/** Plays back queued reports; passes once the queue is empty. */
class ScriptedTestService : public TestService {
public:
    TestReport runTests(const TestTarget& target) override {
        ++calls;
        std::lock_guard<std::mutex> lock(m_mutex);
        lastUrl = target.servingUrl;
        if (runnerBroken) throw InfrastructureError("test runner not found");
        if (alwaysFail) return Failing(alwaysFailMessage);
        if (m_reports.empty()) return TestReport{true, {}};
        TestReport report = m_reports.front();
        m_reports.pop_front();
        return report;
    }

    void Queue(TestReport report) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_reports.push_back(std::move(report));
    }

    static TestReport Failing(const std::string& message) {
        TestReport report;
        report.passed = false;
        report.errors.push_back(TestError{message, ""});
        return report;
    }

    std::atomic<int> calls{0};
    std::atomic<bool> alwaysFail{false};
    std::atomic<bool> runnerBroken{false};
    std::string alwaysFailMessage = "ReferenceError: cart is not defined at /src/components/Hero.jsx:4:9";
    std::string lastUrl;

private:
    std::mutex m_mutex;
    std::deque<TestReport> m_reports;
};

/** Tracks handles without spawning anything. Install exits at once with `installExit`. */
class FakeProcessSupervisor : public ProcessSupervisor {
public:
    ProcessHandle start(const ProcessSpec& spec) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& [id, entry] : m_entries) {
            if (entry.alive && entry.handle.project == spec.project && entry.handle.kind == spec.kind) {
                throw ProcessAlreadyRunning(spec.project + " already has a " + ProcessKindToString(spec.kind));
            }
        }
        Entry entry;
        entry.handle.id = ++m_nextId;
        entry.handle.project = spec.project;
        entry.handle.kind = spec.kind;
        entry.handle.pid = 1000 + static_cast<int>(entry.handle.id);
        entry.handle.port = spec.port;
        entry.alive = true;
        entry.command = spec.command;
        m_entries[entry.handle.id] = entry;
        started.push_back(entry.handle);
        return entry.handle;
    }

    PortWaitResult waitForPort(const std::string&, int, Duration, const ProcessHandle*,
                               const CancellationToken* cancel) override {
        ++portWaits;
        if (blockOnPort && cancel) {
            return cancel->waitFor(std::chrono::seconds(10)) ? PortWaitResult::Cancelled : PortWaitResult::Timeout;
        }
        return portResult;
    }

    std::optional<int> waitForExit(const ProcessHandle& handle, Duration, const CancellationToken*) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_entries.find(handle.id);
        if (it == m_entries.end()) return std::nullopt;
        it->second.alive = false;
        it->second.exitCode = installExit.load();
        return it->second.exitCode;
    }

    void stop(const ProcessHandle& handle) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_entries.find(handle.id);
        if (it == m_entries.end()) return;
        if (it->second.alive) ++stops;
        it->second.alive = false;
    }

    std::vector<std::string> captureOutput(const ProcessHandle&) const override {
        return {"  VITE v5.0.0  ready in 300 ms", "Error: Failed to resolve import \"./Missing\""};
    }

    ProcessStatus status(const ProcessHandle& handle) const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_entries.find(handle.id);
        if (it == m_entries.end()) return {};
        return {it->second.alive, it->second.exitCode};
    }

    std::optional<ProcessHandle> find(const std::string& project, ProcessKind kind) const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& [id, entry] : m_entries) {
            if (entry.alive && entry.handle.project == project && entry.handle.kind == kind) return entry.handle;
        }
        return std::nullopt;
    }

    void detachListener(const ProcessHandle&) override { ++detaches; }

    void shutdown() override {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& [id, entry] : m_entries) entry.alive = false;
    }

    size_t LiveCount() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return static_cast<size_t>(std::count_if(m_entries.begin(), m_entries.end(),
                                                 [](const auto& e) { return e.second.alive; }));
    }

    size_t StartedOf(ProcessKind kind) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return static_cast<size_t>(std::count_if(started.begin(), started.end(),
                                                 [kind](const ProcessHandle& h) { return h.kind == kind; }));
    }

    std::string CommandOf(const ProcessHandle& handle) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_entries.find(handle.id);
        return it == m_entries.end() ? "" : it->second.command;
    }

    std::vector<ProcessHandle> started;
    std::atomic<int> installExit{0};
    std::atomic<bool> blockOnPort{false};
    std::atomic<int> portWaits{0};
    std::atomic<int> stops{0};
    std::atomic<int> detaches{0};
    PortWaitResult portResult = PortWaitResult::Ready;

private:
    struct Entry {
        ProcessHandle handle;
        bool alive = false;
        std::optional<int> exitCode;
        std::string command;
    };

    mutable std::mutex m_mutex;
    std::map<std::uint64_t, Entry> m_entries;
    std::uint64_t m_nextId = 0;
};

/** Collects the events of a run in order. */
class EventRecorder {
public:
    EventSink Sink() {
        return [this](const PipelineEvent& event) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_events.push_back(event);
        };
    }

    std::vector<PipelineEvent> Events() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_events;
    }

    template <typename T>
    std::vector<T> Of() const {
        std::vector<T> out;
        for (const auto& e : Events()) {
            if (const auto* typed = std::get_if<T>(&e)) out.push_back(*typed);
        }
        return out;
    }

    template <typename T>
    size_t Count() const { return Of<T>().size(); }

    size_t TerminalCount() const {
        size_t n = 0;
        for (const auto& e : Events()) {
            if (IsTerminalEvent(e)) ++n;
        }
        return n;
    }

    /** @brief Polls until a predicate over the events holds or the timeout passes. */
    template <typename Pred>
    bool WaitFor(Pred pred, std::chrono::milliseconds timeout = std::chrono::seconds(5)) const {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (pred(Events())) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return pred(Events());
    }

private:
    mutable std::mutex m_mutex;
    std::vector<PipelineEvent> m_events;
};

} // namespace webforge::test
