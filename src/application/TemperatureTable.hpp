/**
 * @file TemperatureTable.hpp
 * @brief Per-context sampling temperatures for generation requests.
 */

#pragma once

#include <map>
#include <string>

namespace dreadloom::application {

/**
 * @class TemperatureTable
 * @brief Lower temperatures for analytical contexts, higher for descriptive ones.
 */
class TemperatureTable {
public:
    static constexpr float kDefaultTemperature = 0.7f;

    TemperatureTable() {
        // Creative / descriptive
        m_values["event_generation"] = 0.8f;
        m_values["manifestation"] = 0.85f;
        m_values["pattern_recognition"] = 0.7f;
        m_values["emotional_filter"] = 0.75f;
        m_values["style_generation"] = 0.8f;
        m_values["room_description"] = 0.75f;
        m_values["character_dialogue"] = 0.8f;

        // Analytical
        m_values["analysis"] = 0.5f;
        m_values["psychological_analysis"] = 0.5f;
        m_values["parameter_generation"] = 0.4f;
        m_values["psychological_impact"] = 0.6f;
        m_values["validation"] = 0.3f;
        m_values["coherence_check"] = 0.4f;
    }

    float temperatureFor(const std::string& contextType) const {
        auto it = m_values.find(contextType);
        return it != m_values.end() ? it->second : kDefaultTemperature;
    }

    /** @brief Replaces the temperature of one context (values outside [0,1] are clamped). */
    void setTemperature(const std::string& contextType, float value) {
        if (value < 0.0f) value = 0.0f;
        if (value > 1.0f) value = 1.0f;
        m_values[contextType] = value;
    }

private:
    std::map<std::string, float> m_values;
};

} // namespace dreadloom::application
