/**
 * @file PromptContext.hpp
 * @brief Value object assembling the labeled context blocks appended to a prompt.
 */

#pragma once
#include <sstream>
#include <string>
#include <vector>
#include "domain/Generation.hpp"

namespace dreadloom::application {

/**
 * @struct PromptContext
 * @brief Caller prompt plus contextual memories and the profile summary.
 */
struct PromptContext {
    std::string basePrompt;
    std::vector<domain::ContextualMemory> memories;
    std::string profileSummary;

    /** @brief Renders the enhanced prompt sent to the backend. */
    std::string render() const {
        std::ostringstream ss;
        ss << basePrompt;
        if (!basePrompt.empty() && basePrompt.back() != '\n') {
            ss << "\n";
        }

        if (!memories.empty()) {
            ss << "\nRelevant Context:\n";
            for (const auto& memory : memories) {
                ss << "- " << memory.content << "\n";
            }
        }

        if (!profileSummary.empty()) {
            ss << "\n" << profileSummary;
        }

        return ss.str();
    }
};

} // namespace dreadloom::application
