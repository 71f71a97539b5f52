/**
 * @file AnalysisParser.hpp
 * @brief Parses the model's psychological-analysis reply into a TraitAnalysis.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include "domain/PsychologicalProfile.hpp"

namespace dreadloom::infrastructure {

/**
 * @class AnalysisParser
 * @brief Strict reader for {"fear": n, "obsession": n, "aggression": n, "notes"?: s}.
 *
 * Markdown code fences and prose around the object are tolerated. Range checks
 * are left to PsychologicalProfile::applyAnalysis.
 */
class AnalysisParser {
public:
    /**
     * @param response Raw model output.
     * @param errors Receives one message per schema violation when not null.
     * @return The analysis, or std::nullopt if the reply does not match the schema.
     */
    static std::optional<domain::TraitAnalysis> Parse(const std::string& response,
                                                      std::vector<std::string>* errors = nullptr);

    /** @brief The first '{' to the last '}', or empty if there is no object. */
    static std::string ExtractJsonObject(const std::string& response);
};

} // namespace dreadloom::infrastructure
