#include <atomic>
#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "application/Director.hpp"
#include "domain/GenerationBackend.hpp"

using dreadloom::application::BuildDirectorContext;
using dreadloom::application::Director;
using dreadloom::domain::DirectorConfig;
using dreadloom::domain::GenerationError;
using dreadloom::domain::GenerationRequest;
using dreadloom::domain::GenerationResult;
using dreadloom::domain::GenerationStatus;
using dreadloom::domain::TensionSeverity;

namespace {

// Answers by context type. An empty optional simulates an unreachable service.
class ContextBackend : public dreadloom::domain::GenerationBackend {
public:
    std::optional<std::string> complete(const GenerationRequest& request) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_contexts.push_back(request.contextType);
        if (request.contextType == "psychological_analysis") return m_analysisReply;
        if (request.contextType == "room_description") return std::string("The corridor smells of decay.");
        return m_eventReply;
    }

    std::optional<std::string> m_analysisReply =
        std::string(R"({"fear": 0.9, "obsession": 0.0, "aggression": 0.0, "notes": "startled"})");
    std::optional<std::string> m_eventReply = std::string("A drip echoes somewhere below.");

    std::vector<std::string> contexts() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_contexts;
    }

private:
    std::mutex m_mutex;
    std::vector<std::string> m_contexts;
};

DirectorConfig SeededConfig() {
    DirectorConfig config;
    config.seed = 2024u;
    return config;
}

bool Near(float a, float b, float eps = 1e-3f) {
    return std::fabs(a - b) <= eps;
}

void TestPlayerActionFeedsTension() {
    std::cout << "[Test] Paranoia rises feed tension..." << std::endl;
    auto backend = std::make_shared<ContextBackend>();
    Director director(BuildDirectorContext(SeededConfig(), backend));

    director.onPlayerAction("observe", "shadow");
    const auto& context = director.context();
    assert(context.profile->getParanoiaIndex() > 0.0f);
    assert(context.tensionDirector->sourceContribution("paranoia") > 0.0f);

    director.onPlayerAction("attack", "door");
    assert(context.profile->getAggression() > 0.0f);
    assert(context.profile->getRecentChoices().size() == 2);

    auto snap = director.snapshot();
    assert(snap.profileSummary.find("Psychological State:") == 0);
    assert(snap.tensionValue >= 0.0f && snap.tensionValue <= 1.0f);
}

void TestHighTensionRaisesFear() {
    std::cout << "[Test] Tension changes above 0.8 raise fear..." << std::endl;
    auto backend = std::make_shared<ContextBackend>();
    Director director(BuildDirectorContext(SeededConfig(), backend));
    const auto& context = director.context();

    context.tensionDirector->modifyTension(1.0f, "a");
    context.tensionDirector->modifyTension(1.0f, "b");
    assert(context.profile->getFear() == 0.0f);

    // Ten seconds stays ahead of the first scheduled event.
    for (int i = 0; i < 100; ++i) {
        director.tick(0.1f);
    }
    assert(context.tensionDirector->getCurrentTension() > 0.8f);

    const float fearBefore = context.profile->getFear();
    director.onPlayerAction("observe_x", "door");
    assert(Near(context.profile->getFear(), fearBefore + 0.1f));

    director.onPlayerAction("observe_x", "door");
    assert(Near(context.profile->getFear(), fearBefore + 0.2f));

    context.taskManager->waitForIdle();
}

void TestDescribeRoom() {
    std::cout << "[Test] Room descriptions require archetype and theme..." << std::endl;
    auto backend = std::make_shared<ContextBackend>();
    Director director(BuildDirectorContext(SeededConfig(), backend));

    GenerationResult result = director.describeRoom("Corridor", 2, "Decay").get();
    assert(result.ok());
    assert(result.attempts == 1);
    assert(result.text.find("corridor") != std::string::npos);
    assert(backend->contexts().back() == "room_description");
}

void TestAnalysisShiftsTension() {
    std::cout << "[Test] A significant analysis shift raises tension..." << std::endl;
    auto backend = std::make_shared<ContextBackend>();
    Director director(BuildDirectorContext(SeededConfig(), backend));

    auto status = director.requestAnalysis();
    director.context().taskManager->waitForIdle();
    assert(status->isCompleted);
    assert(!status->failed);
    assert(status->progress == 1.0f);
    assert(director.context().taskManager->GetActiveTasks().empty());

    const auto& context = director.context();
    assert(Near(context.profile->getFear(), 0.27f));
    assert(Near(context.tensionDirector->sourceContribution("psychological_shift"), 0.27f));
}

void TestMalformedAnalysisIsRejected() {
    std::cout << "[Test] Malformed analysis leaves the profile alone..." << std::endl;
    auto backend = std::make_shared<ContextBackend>();
    backend->m_analysisReply = std::string("The player is clearly terrified.");
    Director director(BuildDirectorContext(SeededConfig(), backend));

    auto status = director.requestAnalysis();
    director.context().taskManager->waitForIdle();
    assert(status->isCompleted);
    assert(status->failed);
    assert(!status->errorMessage.empty());

    const auto& context = director.context();
    assert(context.profile->getFear() == 0.0f);
    assert(context.tensionDirector->sourceContribution("psychological_shift") == 0.0f);

    // Out-of-range values parse but are refused as a whole.
    context.orchestrator->clearCache();
    backend->m_analysisReply = std::string(R"({"fear": 0.5, "obsession": 2.0, "aggression": 0.1})");
    auto rejected = director.requestAnalysis();
    director.context().taskManager->waitForIdle();
    assert(rejected->failed);
    assert(context.profile->getFear() == 0.0f);
}

void TestSchedulerDeliversContent() {
    std::cout << "[Test] Scheduled events reach both consumers..." << std::endl;
    auto backend = std::make_shared<ContextBackend>();
    Director director(BuildDirectorContext(SeededConfig(), backend));

    std::atomic<int> severities{0};
    std::mutex deliveredMutex;
    std::vector<GenerationResult> delivered;

    director.setSeverityConsumer([&severities](TensionSeverity, float tension) {
        assert(tension >= 0.0f && tension <= 1.0f);
        ++severities;
    });
    director.setContentConsumer([&](TensionSeverity, float, const GenerationResult& result) {
        std::lock_guard<std::mutex> lock(deliveredMutex);
        delivered.push_back(result);
    });

    // The first event is due within 54 seconds.
    for (int i = 0; i < 60; ++i) {
        director.tick(1.0f);
    }
    director.context().taskManager->waitForIdle();

    assert(severities >= 1);
    std::lock_guard<std::mutex> lock(deliveredMutex);
    assert(static_cast<int>(delivered.size()) == severities.load());
    for (const auto& result : delivered) {
        assert(result.ok());
        assert(result.text == "A drip echoes somewhere below.");
    }
}

void TestBackendFailureIsDelivered() {
    std::cout << "[Test] Unreachable backend yields a BackendFailed delivery..." << std::endl;
    auto backend = std::make_shared<ContextBackend>();
    backend->m_eventReply = std::nullopt;
    Director director(BuildDirectorContext(SeededConfig(), backend));

    std::mutex deliveredMutex;
    std::vector<GenerationStatus> statuses;
    director.setContentConsumer([&](TensionSeverity, float, const GenerationResult& result) {
        std::lock_guard<std::mutex> lock(deliveredMutex);
        statuses.push_back(result.status);
    });

    for (int i = 0; i < 60; ++i) {
        director.tick(1.0f);
    }
    director.context().taskManager->waitForIdle();

    std::lock_guard<std::mutex> lock(deliveredMutex);
    assert(!statuses.empty());
    for (auto status : statuses) {
        assert(status == GenerationStatus::BackendFailed);
    }
}

void TestShutdown() {
    std::cout << "[Test] Shutdown refuses further generation..." << std::endl;
    auto backend = std::make_shared<ContextBackend>();
    Director director(BuildDirectorContext(SeededConfig(), backend));

    director.shutdown();
    director.shutdown();

    bool threw = false;
    try {
        director.describeRoom("Cellar", 1, "Flood").get();
    } catch (const GenerationError&) {
        threw = true;
    }
    assert(threw);
    assert(backend->contexts().empty());

    // Actions are still recorded; only generation stops.
    director.onPlayerAction("observe", "window");
    director.tick(0.5f);
    assert(director.context().profile->getParanoiaIndex() > 0.0f);
}

void TestIncompleteContextIsRejected() {
    std::cout << "[Test] Director requires a wired context..." << std::endl;
    bool threw = false;
    try {
        Director director{dreadloom::application::DirectorContext()};
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

} // namespace

int main() {
    std::cout << "[Test] Starting Director Tests..." << std::endl;

    TestPlayerActionFeedsTension();
    TestHighTensionRaisesFear();
    TestDescribeRoom();
    TestAnalysisShiftsTension();
    TestMalformedAnalysisIsRejected();
    TestSchedulerDeliversContent();
    TestBackendFailureIsDelivered();
    TestShutdown();
    TestIncompleteContextIsRejected();

    std::cout << "[PASS] Director Tests." << std::endl;
    return 0;
}
