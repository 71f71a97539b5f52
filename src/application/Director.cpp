/**
 * @file Director.cpp
 * @brief Implementation of the Director.
 */

#include "application/Director.hpp"
#include "domain/MathUtils.hpp"
#include "infrastructure/AnalysisParser.hpp"
#include "infrastructure/PromptCatalog.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace dreadloom::application {

using domain::GenerationError;
using domain::GenerationResult;
using domain::TensionSeverity;

Director::Director(DirectorContext context)
    : m_context(std::move(context)) {
    if (!m_context.profile || !m_context.tensionDirector || !m_context.orchestrator || !m_context.taskManager) {
        throw std::invalid_argument("Director requires a fully wired DirectorContext");
    }

    for (auto severity : {TensionSeverity::Subtle, TensionSeverity::Moderate, TensionSeverity::Intense}) {
        m_context.tensionDirector->setSeverityHandler(severity, [this](TensionSeverity s, float tension) {
            onSeverity(s, tension);
        });
    }

    // modifyTension is only called with the session mutex held.
    m_context.tensionDirector->setHighTensionHandler([this](const std::string& source, float tension) {
        std::cout << "[Director] High tension (" << tension << ") after '" << source << "'" << std::endl;
        m_context.profile->setFear(m_context.profile->getFear() + kHighTensionFearRise);
    });

    m_context.orchestrator->setProfileSummaryProvider([this]() {
        std::lock_guard<std::mutex> lock(m_sessionMutex);
        return m_context.profile->summary();
    });
}

Director::~Director() {
    shutdown();
}

void Director::shutdown() {
    if (!m_accepting.exchange(false)) return;

    m_context.orchestrator->clearQueue();
    m_context.orchestrator->stop();
    m_context.taskManager->waitForIdle();
    std::cout << "[Director] Session closed." << std::endl;
}

void Director::onPlayerAction(const std::string& choiceType, const std::string& target) {
    std::lock_guard<std::mutex> lock(m_sessionMutex);
    auto& profile = *m_context.profile;
    auto& tension = *m_context.tensionDirector;

    float paranoiaBefore = profile.getParanoiaIndex();
    profile.recordChoice(choiceType, target);
    tension.adjustPacing();

    float paranoiaRise = profile.getParanoiaIndex() - paranoiaBefore;
    if (paranoiaRise > 0.0f) {
        tension.modifyTension(paranoiaRise, "paranoia");
    }
}

void Director::tick(float deltaTime) {
    if (!(deltaTime > 0.0f)) return;

    std::lock_guard<std::mutex> lock(m_sessionMutex);
    m_context.profile->decay(deltaTime);
    m_context.profile->decayTraits(deltaTime);
    m_context.tensionDirector->tick(deltaTime);
}

// Runs inside TensionDirector::tick, so the session mutex is already held.
void Director::onSeverity(TensionSeverity severity, float tension) {
    if (!m_accepting) return;

    SeverityConsumer severityConsumer;
    {
        std::lock_guard<std::mutex> lock(m_consumerMutex);
        severityConsumer = m_severityConsumer;
    }
    if (severityConsumer) {
        severityConsumer(severity, tension);
    }

    std::string prompt = infrastructure::PromptCatalog::GetEventPrompt(severity, *m_context.profile, tension);
    std::string contextType = infrastructure::PromptCatalog::GetEventContextType(severity);

    std::shared_future<GenerationResult> pending = m_context.orchestrator->generate(prompt, contextType).share();

    m_context.taskManager->SubmitTask(TaskType::ContentDelivery,
        std::string("Deliver ") + domain::SeverityToString(severity) + " event",
        [this, severity, tension, pending](std::shared_ptr<TaskStatus> status) {
            (void)status;
            deliverContent(severity, tension, pending);
        });
}

void Director::deliverContent(TensionSeverity severity, float tension,
                              std::shared_future<GenerationResult> pending) {
    GenerationResult result;
    try {
        result = pending.get();
    } catch (const GenerationError& e) {
        std::cerr << "[Director] " << domain::SeverityToString(severity) << " event failed: " << e.what() << std::endl;
        result.status = domain::GenerationStatus::BackendFailed;
        result.valid = false;
    }

    if (!m_accepting) return;

    if (severity == TensionSeverity::Intense) {
        std::lock_guard<std::mutex> lock(m_sessionMutex);
        m_context.tensionDirector->modifyTension(kPostIntenseRelief, "post_intense_event");
    }

    ContentConsumer consumer;
    {
        std::lock_guard<std::mutex> lock(m_consumerMutex);
        consumer = m_contentConsumer;
    }
    if (consumer) {
        consumer(severity, tension, result);
    }
}

std::future<GenerationResult> Director::describeRoom(const std::string& roomArchetype,
                                                     int levelNumber,
                                                     const std::string& theme) {
    std::string prompt = infrastructure::PromptCatalog::GetRoomPrompt(roomArchetype, levelNumber, theme);
    std::vector<std::string> required = {domain::ToLower(roomArchetype), domain::ToLower(theme)};
    return m_context.orchestrator->generate(prompt, "room_description", required);
}

std::shared_ptr<TaskStatus> Director::requestAnalysis() {
    std::string prompt;
    {
        std::lock_guard<std::mutex> lock(m_sessionMutex);
        prompt = infrastructure::PromptCatalog::GetAnalysisPrompt(m_context.profile->recentBehavior());
    }

    std::shared_future<GenerationResult> pending =
        m_context.orchestrator->generate(prompt, "psychological_analysis").share();

    return m_context.taskManager->SubmitTask(TaskType::Analysis, "Apply psychological analysis",
        [this, pending](std::shared_ptr<TaskStatus> status) {
            status->progress = 0.1f;
            GenerationResult result = pending.get();
            status->progress = 0.5f;
            if (!m_accepting) return;
            applyAnalysisReply(result.text);
        });
}

void Director::applyAnalysisReply(const std::string& reply) {
    std::vector<std::string> errors;
    auto analysis = infrastructure::AnalysisParser::Parse(reply, &errors);
    if (!analysis) {
        std::string detail = errors.empty() ? "unknown shape" : errors.front();
        std::cerr << "[Director] Malformed analysis reply: " << detail << std::endl;
        throw std::runtime_error("Malformed analysis reply: " + detail);
    }

    std::lock_guard<std::mutex> lock(m_sessionMutex);
    auto& profile = *m_context.profile;

    const float fearBefore = profile.getFear();
    const float obsessionBefore = profile.getObsession();
    const float aggressionBefore = profile.getAggression();

    if (!profile.applyAnalysis(*analysis)) {
        throw std::runtime_error("Analysis rejected by profile");
    }

    float shift = std::max({std::fabs(profile.getFear() - fearBefore),
                            std::fabs(profile.getObsession() - obsessionBefore),
                            std::fabs(profile.getAggression() - aggressionBefore)});
    if (shift > kSignificantShift) {
        std::cout << "[Director] Significant psychological shift: " << shift << std::endl;
        m_context.tensionDirector->modifyTension(shift, "psychological_shift");
    }
}

std::future<domain::ImageResult> Director::requestImage(const std::string& description) {
    float tension;
    {
        std::lock_guard<std::mutex> lock(m_sessionMutex);
        tension = m_context.tensionDirector->getCurrentTension();
    }
    return m_context.orchestrator->generateImage(infrastructure::PromptCatalog::GetImagePrompt(description, tension));
}

Director::Snapshot Director::snapshot() const {
    std::lock_guard<std::mutex> lock(m_sessionMutex);
    Snapshot snap;
    snap.profileSummary = m_context.profile->summary();
    snap.tensionValue = m_context.tensionDirector->getCurrentTension();
    return snap;
}

void Director::setContentConsumer(ContentConsumer consumer) {
    std::lock_guard<std::mutex> lock(m_consumerMutex);
    m_contentConsumer = std::move(consumer);
}

void Director::setSeverityConsumer(SeverityConsumer consumer) {
    std::lock_guard<std::mutex> lock(m_consumerMutex);
    m_severityConsumer = std::move(consumer);
}

} // namespace dreadloom::application
