/**
 * @file PromptCatalog.hpp
 * @brief Central storage for the director's generation prompts.
 */

#pragma once

#include <string>
#include <vector>
#include "domain/PsychologicalProfile.hpp"
#include "domain/TensionState.hpp"

namespace dreadloom::infrastructure {

class PromptCatalog {
public:
    /** @brief Context type the orchestrator uses for a severity's content. */
    static std::string GetEventContextType(domain::TensionSeverity severity);

    /** @brief Prompt for a scheduler-triggered event of the given severity. */
    static std::string GetEventPrompt(domain::TensionSeverity severity,
                                      const domain::PsychologicalProfile& profile,
                                      float tension);

    /** @brief Prompt for a room description; mentions archetype and theme verbatim. */
    static std::string GetRoomPrompt(const std::string& archetype, int levelNumber, const std::string& theme);

    /** @brief Prompt asking for the JSON trait analysis of recent behavior. */
    static std::string GetAnalysisPrompt(const std::vector<domain::BehaviorSnapshot>& recent);

    /** @brief Prompt for a still image of a described scene. */
    static std::string GetImagePrompt(const std::string& description, float tension);
};

} // namespace dreadloom::infrastructure
