#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "infrastructure/AnalysisParser.hpp"
#include "infrastructure/Base64.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/HttpGenerationClient.hpp"
#include "infrastructure/PromptCatalog.hpp"

using namespace dreadloom::infrastructure;
using dreadloom::domain::TensionSeverity;
using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

bool Near(float a, float b, float eps = 1e-4f) {
    return std::fabs(a - b) <= eps;
}

bool Contains(const std::string& text, const std::string& part) {
    return text.find(part) != std::string::npos;
}

void TestAnalysisParser() {
    std::cout << "[Test] Analysis replies..." << std::endl;
    auto plain = AnalysisParser::Parse(R"({"fear": 0.9, "obsession": 0.1, "aggression": 0.0, "notes": "jumpy"})");
    assert(plain);
    assert(Near(*plain->fear, 0.9f));
    assert(Near(*plain->obsession, 0.1f));
    assert(Near(*plain->aggression, 0.0f));
    assert(plain->notes == "jumpy");

    auto fenced = AnalysisParser::Parse("Here you go:\n```json\n{\"fear\": 1, \"obsession\": 0.5, \"aggression\": 0.25}\n```");
    assert(fenced);
    assert(Near(*fenced->fear, 1.0f));
    assert(fenced->notes.empty());

    std::vector<std::string> errors;
    assert(!AnalysisParser::Parse("The player seems scared.", &errors));
    assert(errors.size() == 1 && errors[0] == "no JSON object in response");

    errors.clear();
    assert(!AnalysisParser::Parse("{\"fear\": 0.2, \"obsession\": }", &errors));
    assert(errors.size() == 1 && errors[0].rfind("invalid JSON", 0) == 0);

    errors.clear();
    assert(!AnalysisParser::Parse(R"({"fear": "high", "obsession": 0.5})", &errors));
    assert(errors.size() == 2);
    assert(errors[0] == "'fear' is not a number");
    assert(errors[1] == "missing 'aggression'");

    // Range checks belong to the profile.
    auto outOfRange = AnalysisParser::Parse(R"({"fear": 3, "obsession": 0, "aggression": 0})");
    assert(outOfRange && Near(*outOfRange->fear, 3.0f));

    assert(AnalysisParser::ExtractJsonObject("x } {").empty());
    assert(AnalysisParser::ExtractJsonObject("a {b} c") == "{b}");
}

void TestBase64() {
    std::cout << "[Test] Base64 image payloads..." << std::endl;
    auto hello = Base64Decode("aGVsbG8=");
    assert(hello);
    assert(std::string(hello->begin(), hello->end()) == "hello");

    auto wrapped = Base64Decode("aGVs\nbG8h");
    assert(wrapped && std::string(wrapped->begin(), wrapped->end()) == "hello!");

    assert(!Base64Decode("aGV*bG8="));
    assert(!Base64Decode("aGVsb"));
    auto empty = Base64Decode("");
    assert(empty && empty->empty());

    auto png = Base64Decode("iVBORw0KGgo=");
    assert(png && png->size() == 8);
    assert(DetectImageMimeType(*png) == "image/png");
    assert(DetectImageMimeType({0xFF, 0xD8, 0xFF}) == "image/jpeg");
    assert(DetectImageMimeType({0x00, 0x01}) == "application/octet-stream");
}

void TestResponseExtraction() {
    std::cout << "[Test] Completion reply shapes..." << std::endl;
    assert(*HttpGenerationClient::ExtractText(json::parse(R"({"choices": [{"text": "a"}]})")) == "a");
    assert(*HttpGenerationClient::ExtractText(
        json::parse(R"({"choices": [{"message": {"role": "assistant", "content": "b"}}]})")) == "b");
    assert(*HttpGenerationClient::ExtractText(json::parse(R"({"response": "c"})")) == "c");
    assert(*HttpGenerationClient::ExtractText(json::parse(R"([{"generated_text": "d"}])")) == "d");
    assert(!HttpGenerationClient::ExtractText(json::parse(R"({"choices": []})")));
    assert(!HttpGenerationClient::ExtractText(json::parse(R"({"error": "overloaded"})")));

    assert(*HttpGenerationClient::ExtractImagePayload(json::parse(R"({"data": [{"b64_json": "aGk="}]})")) == "aGk=");
    assert(*HttpGenerationClient::ExtractImagePayload(json::parse(R"({"images": ["aGk="]})")) == "aGk=");
    assert(!HttpGenerationClient::ExtractImagePayload(json::parse(R"({"data": [{"url": "http://x"}]})")));

    auto names = HttpGenerationClient::ExtractModelNames(
        json::parse(R"({"data": [{"id": "mistral-7b"}, {"object": "model"}], "models": [{"name": "llama3:8b"}]})"));
    assert(names.size() == 2 && names[0] == "mistral-7b" && names[1] == "llama3:8b");

    dreadloom::domain::GenerationRequest request;
    request.prompt = "Describe";
    request.temperature = 0.75f;
    request.maxTokens = 16;
    json body = HttpGenerationClient::BuildCompletionBody(request, "");
    assert(body["prompt"] == "Describe");
    assert(body["max_tokens"] == 16);
    assert(Near(body["temperature"].get<float>(), 0.75f));
    assert(!body.contains("model"));
    assert(HttpGenerationClient::BuildCompletionBody(request, "llama3")["model"] == "llama3");
}

void TestModelSelection() {
    std::cout << "[Test] Model selection..." << std::endl;
    assert(HttpGenerationClient::PickServedModel({}, "custom") == "custom");
    assert(HttpGenerationClient::PickServedModel({"phi3:mini", "custom"}, "custom") == "custom");
    // An untagged configured name matches its tagged variant.
    assert(HttpGenerationClient::PickServedModel({"llama3:8b", "mistral:7b"}, "mistral") == "mistral:7b");
    assert(HttpGenerationClient::PickServedModel({"phi3:mini", "mistral:7b", "llama3:8b"}, "") == "llama3:8b");
    assert(HttpGenerationClient::PickServedModel({"phi3:mini", "gemma:2b"}, "missing") == "gemma:2b");
    assert(HttpGenerationClient::PickServedModel({"tinyllm"}, "") == "tinyllm");
}

void TestConfigLoader() {
    std::cout << "[Test] director.json loading..." << std::endl;
    auto defaults = ConfigLoader::FromJson(json::object());
    assert(defaults.backend.host == "localhost");
    assert(defaults.backend.port == 8080);
    assert(defaults.tickHz == 30);
    assert(!defaults.seed);

    auto config = ConfigLoader::FromJson(json::parse(R"({
        "backend": {"host": "gen.local", "port": 443, "use_tls": true, "models_path": "/models"},
        "models": {"default": "llama3", "psychological_analysis": "mistral"},
        "temperatures": {"room_description": 0.9},
        "tension": {"decay_rate": 0.05, "seed": 42},
        "memory": {"max_relevant": 5},
        "tick_hz": -4,
        "ui": {"theme": "dark"}
    })"));
    assert(config.backend.host == "gen.local");
    assert(config.backend.port == 443);
    assert(config.backend.useTls);
    assert(config.backend.modelsPath == "/models");
    assert(config.backend.path == "/v1/completions");
    assert(config.defaultModel == "llama3");
    assert(config.models.size() == 1 && config.models.at("psychological_analysis") == "mistral");
    assert(Near(config.temperatures.at("room_description"), 0.9f));
    assert(Near(config.decayRate, 0.05f));
    assert(config.seed && *config.seed == 42u);
    assert(config.maxRelevantMemories == 5);
    assert(config.tickHz == 30);

    fs::path dir = fs::temp_directory_path() / "dreadloom_config_test";
    fs::remove_all(dir);
    fs::path file = dir / "nested" / "director.json";

    auto missing = ConfigLoader::Load(file);
    assert(missing.backend.port == 8080);

    fs::create_directories(file.parent_path());
    {
        std::ofstream out(file);
        out << R"({"ui": {"theme": "dark"}, "tick_hz": 10})";
    }
    assert(ConfigLoader::Load(file).tickHz == 10);

    config.tickHz = 60;
    assert(ConfigLoader::Save(config, file));
    auto reloaded = ConfigLoader::Load(file);
    assert(reloaded.backend.host == "gen.local");
    assert(reloaded.defaultModel == "llama3");
    assert(reloaded.seed && *reloaded.seed == 42u);
    assert(reloaded.tickHz == 60);

    json onDisk;
    {
        std::ifstream in(file);
        in >> onDisk;
    }
    assert(onDisk["ui"]["theme"] == "dark");

    {
        std::ofstream out(file);
        out << "{ not json";
    }
    assert(ConfigLoader::Load(file).backend.host == "localhost");

    fs::remove_all(dir);
}

void TestPromptCatalog() {
    std::cout << "[Test] Prompt catalog..." << std::endl;
    assert(PromptCatalog::GetEventContextType(TensionSeverity::Subtle) == "event_generation");
    assert(PromptCatalog::GetEventContextType(TensionSeverity::Moderate) == "psychological_impact");
    assert(PromptCatalog::GetEventContextType(TensionSeverity::Intense) == "manifestation");

    dreadloom::domain::PsychologicalProfile profile;
    profile.setFear(0.6f);
    profile.setObsession(0.2f);
    auto fearful = PromptCatalog::GetEventPrompt(TensionSeverity::Moderate, profile, 0.45f);
    assert(Contains(fearful, "The atmosphere grows heavy"));
    assert(Contains(fearful, "Current tension: 0.45"));

    profile.setObsession(0.9f);
    profile.setActiveObsessions({"mirror"});
    auto obsessed = PromptCatalog::GetEventPrompt(TensionSeverity::Moderate, profile, 0.5f);
    assert(Contains(obsessed, "Reality begins to waver"));
    assert(Contains(obsessed, "The player keeps returning to: mirror."));

    auto room = PromptCatalog::GetRoomPrompt("corridor", 2, "decay");
    assert(Contains(room, "'corridor'") && Contains(room, "'decay'") && Contains(room, "level 2"));

    dreadloom::domain::BehaviorSnapshot snapshot;
    snapshot.action = "run";
    snapshot.context = "stairs";
    auto analysis = PromptCatalog::GetAnalysisPrompt({snapshot});
    assert(Contains(analysis, "- run -> stairs (fear 0.00"));
    assert(Contains(analysis, "REPLY WITH JSON ONLY"));
    assert(Contains(PromptCatalog::GetAnalysisPrompt({}), "- (none)"));

    assert(Contains(PromptCatalog::GetImagePrompt("a stair", 0.9f), "Distorted perspective"));
    assert(Contains(PromptCatalog::GetImagePrompt("a stair", 0.1f), "Muted colors"));
}

} // namespace

int main() {
    std::cout << "[Test] Starting Infrastructure Tests..." << std::endl;

    TestAnalysisParser();
    TestBase64();
    TestResponseExtraction();
    TestModelSelection();
    TestConfigLoader();
    TestPromptCatalog();

    std::cout << "[PASS] Infrastructure Tests." << std::endl;
    return 0;
}
