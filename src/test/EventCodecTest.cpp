#include <cassert>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include "infrastructure/EventCodec.hpp"

using namespace webforge::domain;
using webforge::application::CommandType;
using webforge::infrastructure::EventCodec;
using json = nlohmann::json;

namespace {

void TestEventEncoding() {
    std::cout << "[Test] Event encoding..." << std::endl;

    auto file = EventCodec::ToJson(FileEvent{"src/App.jsx", "1.2 KB", "export default App;"});
    assert(file["type"] == "file");
    assert(file["name"] == "src/App.jsx");
    assert(file["size"] == "1.2 KB");

    auto progress = EventCodec::ToJson(ProgressEvent{"Generating Hero.jsx", 40});
    assert(progress["type"] == "progress");
    assert(progress["step"] == "Generating Hero.jsx");
    assert(progress["pct"] == 40);

    auto done = EventCodec::ToJson(DoneEvent{"run-1", "bakery", "http://localhost:5173", 2});
    assert(done["type"] == "done");
    assert(done["run_id"] == "run-1");
    assert(done["fix_attempts"] == 2);

    auto stream = EventCodec::ToJson(StreamTokenEvent{"src/App.jsx", "<div>"});
    assert(stream["type"] == "stream");
    assert(stream["token"] == "<div>");
    std::cout << "[PASS] Event fields use the snake_case wire names." << std::endl;
}

void TestErrorEncoding() {
    std::cout << "[Test] Error events..." << std::endl;
    ErrorEvent rejected;
    rejected.project = "bakery";
    rejected.reason = FailureReason::Busy;
    rejected.text = "Project bakery already has an active run";
    auto j = EventCodec::ToJson(rejected);
    assert(j["reason"] == "busy");
    assert(!j.contains("run_id"));
    assert(!j.contains("errors"));

    ErrorEvent failed = rejected;
    failed.runId = "run-7";
    failed.reason = FailureReason::CodeQuality;
    failed.errors = {"ReferenceError: cart is not defined"};
    j = EventCodec::ToJson(failed);
    assert(j["run_id"] == "run-7");
    assert(j["reason"] == "code_quality");
    assert(j["errors"].size() == 1);
    std::cout << "[PASS] Rejections omit the run id; failures carry errors." << std::endl;
}

void TestExportAndProjects() {
    std::cout << "[Test] Export and project listing..." << std::endl;
    auto exported = EventCodec::ToJson(ExportEvent{"bakery", R"({"files":{"src/App.jsx":"x"}})"});
    assert(exported["archive"].is_object());
    assert(exported["archive"]["files"]["src/App.jsx"] == "x");

    ProjectsEvent listing;
    ProjectSummary summary;
    summary.name = "bakery";
    summary.title = "Corner Bakery";
    summary.mtime = 1700000000;
    summary.fileCount = 4;
    summary.state = ProjectState::Ready;
    listing.projects.push_back(summary);
    auto j = EventCodec::ToJson(listing);
    assert(j["type"] == "projects");
    assert(j["projects"].size() == 1);
    assert(j["projects"][0]["files"] == 4);
    assert(j["projects"][0]["state"] == "ready");
    std::cout << "[PASS] Archives are embedded and summaries listed." << std::endl;
}

void TestEncodeInvalidUtf8() {
    std::cout << "[Test] Invalid UTF-8 in model output..." << std::endl;
    const std::string text = EventCodec::Encode(LogEvent{"INFO", std::string("bad \xff byte")});
    auto parsed = json::parse(text);
    assert(parsed["type"] == "log");
    assert(parsed["text"].get<std::string>().find("bad") == 0);
    std::cout << "[PASS] Encoding never throws on bad bytes." << std::endl;
}

void TestDecodeCommands() {
    std::cout << "[Test] Command decoding..." << std::endl;
    std::string error;

    auto build = EventCodec::DecodeCommand(
        R"({"type":"build","prompt":"A bakery site","refine_model":"llama3.1:8b","build_model":"qwen"})", error);
    assert(build && build->type == CommandType::Build);
    assert(build->prompt == "A bakery site");
    assert(build->refineModel == "llama3.1:8b");
    assert(build->buildModel == "qwen");

    auto aliased = EventCodec::DecodeCommand(R"({"type":"build","idea":"A gym site"})", error);
    assert(aliased && aliased->prompt == "A gym site");

    auto update = EventCodec::DecodeCommand(
        R"({"type":"update","project":"bakery","instruction":"Make the hero blue","intent":"patch","component":"Hero"})",
        error);
    assert(update && update->type == CommandType::Update);
    assert(update->project == "bakery");
    assert(update->prompt == "Make the hero blue");
    assert(update->intent == Intent::Patch);
    assert(update->component == std::string("Hero"));

    auto cancel = EventCodec::DecodeCommand(R"({"type":"cancel","run_id":"run-3"})", error);
    assert(cancel && cancel->type == CommandType::Cancel && cancel->runId == "run-3");

    auto status = EventCodec::DecodeCommand(R"({"type":"status","project":"bakery"})", error);
    assert(status && status->type == CommandType::Status);
    std::cout << "[PASS] Commands and their aliases decode." << std::endl;
}

void TestDecodeFailures() {
    std::cout << "[Test] Malformed commands..." << std::endl;
    std::string error;

    assert(!EventCodec::DecodeCommand("{not json", error));
    assert(error.rfind("Malformed command", 0) == 0);

    assert(!EventCodec::DecodeCommand("[1,2]", error));
    assert(error.rfind("Malformed command", 0) == 0);

    assert(!EventCodec::DecodeCommand(R"({"type":"deploy"})", error));
    assert(error == "Unknown command type: 'deploy'");

    assert(!EventCodec::DecodeCommand(R"({"prompt":"no type"})", error));
    assert(error == "Unknown command type: ''");

    assert(!EventCodec::DecodeCommand(R"({"type":"update","project":"p","intent":"rewrite"})", error));
    assert(error == "Unknown intent: 'rewrite'");

    // Non-string fields are treated as absent.
    auto loose = EventCodec::DecodeCommand(R"({"type":"build","prompt":42})", error);
    assert(loose && loose->prompt.empty());
    std::cout << "[PASS] Bad input is reported, never thrown." << std::endl;
}

} // namespace

int main() {
    TestEventEncoding();
    TestErrorEncoding();
    TestExportAndProjects();
    TestEncodeInvalidUtf8();
    TestDecodeCommands();
    TestDecodeFailures();
    std::cout << "All event codec tests passed." << std::endl;
    return 0;
}
