/**
 * @file DirectorContext.hpp
 * @brief Container for session-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include <random>
#include "application/AsyncTaskManager.hpp"
#include "application/GenerationOrchestrator.hpp"
#include "application/TemperatureTable.hpp"
#include "application/TensionDirector.hpp"
#include "domain/DirectorConfig.hpp"
#include "domain/GenerationBackend.hpp"
#include "domain/PsychologicalProfile.hpp"

namespace dreadloom::application {

/**
 * @struct DirectorContext
 * @brief One session's object graph. Members are destroyed bottom-up, so the
 * profile outlives the tension director that reads it.
 */
struct DirectorContext {
    domain::DirectorConfig config;
    std::unique_ptr<domain::PsychologicalProfile> profile;
    std::unique_ptr<TensionDirector> tensionDirector;
    std::unique_ptr<GenerationOrchestrator> orchestrator;
    std::shared_ptr<AsyncTaskManager> taskManager;
};

/** @brief Wires a context from configuration around an existing backend. */
inline DirectorContext BuildDirectorContext(const domain::DirectorConfig& config,
                                            std::shared_ptr<domain::GenerationBackend> backend) {
    DirectorContext context;
    context.config = config;
    context.profile = std::make_unique<domain::PsychologicalProfile>();

    unsigned int seed = config.seed ? *config.seed : std::random_device{}();
    context.tensionDirector = std::make_unique<TensionDirector>(*context.profile, seed);
    context.tensionDirector->setDecayRate(config.decayRate);

    TemperatureTable temperatures;
    for (const auto& [contextType, value] : config.temperatures) {
        temperatures.setTemperature(contextType, value);
    }

    OrchestratorOptions options;
    options.maxRelevantMemories = config.maxRelevantMemories;
    options.defaultModel = config.defaultModel;
    options.models = config.models;
    context.orchestrator = std::make_unique<GenerationOrchestrator>(std::move(backend), temperatures, options);

    context.taskManager = std::make_shared<AsyncTaskManager>();
    return context;
}

} // namespace dreadloom::application
