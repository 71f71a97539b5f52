/**
 * @file TensionDirector.hpp
 * @brief Pacing controller converting the psychological profile into a tension signal.
 */

#pragma once

#include <functional>
#include <map>
#include <random>
#include <string>
#include <vector>
#include "domain/PsychologicalProfile.hpp"
#include "domain/TensionState.hpp"

namespace dreadloom::application {

/**
 * @class TensionDirector
 * @brief Maintains a smoothed tension value and schedules severity-classified content events.
 *
 * Must be ticked once per fixed step by the host loop. Not thread-safe on its own;
 * the Director serializes access with its session mutex.
 */
class TensionDirector {
public:
    using SeverityHandler = std::function<void(domain::TensionSeverity severity, float tension)>;
    using HighTensionHandler = std::function<void(const std::string& source, float tension)>;

    static constexpr float kMinTension = 0.1f;
    static constexpr float kSmoothTime = 2.0f;
    static constexpr float kDefaultDecayRate = 0.02f;

    /**
     * @param profile Profile read for the trait multiplier and pacing adjustments.
     * @param seed Seed for the scheduler jitter.
     */
    explicit TensionDirector(const domain::PsychologicalProfile& profile,
                             unsigned int seed = std::random_device{}());

    /**
     * @brief Adds a shaped, time-bounded tension event and bumps the source's contribution.
     * @param amount Positive for dread, negative for relief.
     * @param source Identifier of the contributing system.
     */
    void modifyTension(float amount, const std::string& source);

    /** @brief Advances decay, events, smoothing, peak tracking and the scheduler. */
    void tick(float deltaTime);

    /** @brief Re-targets the intensity multiplier toward the profile's ideal tension. */
    void adjustPacing();

    /** @brief Returns to the initial state. */
    void reset();

    /** @brief Sets the per-second source decay, clamped to [0.01, 0.1]. */
    void setDecayRate(float rate);

    /** @brief Registers the content path for one severity. */
    void setSeverityHandler(domain::TensionSeverity severity, SeverityHandler handler);

    /** @brief Called from modifyTension while current tension is above 0.8. */
    void setHighTensionHandler(HighTensionHandler handler) { m_highTensionHandler = std::move(handler); }

    float getCurrentTension() const { return m_state.current; }
    float getTargetTension() const { return m_state.target; }
    float getIntensityMultiplier() const { return m_intensityMultiplier; }
    float getDecayRate() const { return m_decayRate; }
    float getClock() const { return m_clock; }
    float timeUntilNextEvent() const;
    const domain::TensionState& getState() const { return m_state; }

    float sourceContribution(const std::string& source) const;
    std::vector<domain::TensionEvent> activeEvents() const { return m_state.activeEvents; }

    /** @brief Recorded peaks, oldest first. */
    std::vector<float> peaks() const;

    /** @brief Mean of the sample history, kMinTension when empty. */
    float averageTension() const;

    /** @brief Desired tension for the current profile, within [0.2, 0.8]. */
    float idealTension() const;

    /** @brief Severity the scheduler would select for @p tension. */
    static domain::TensionSeverity SeverityFor(float tension);

private:
    float calculateEventTension();
    void smoothTowardTarget(float deltaTime);
    void updateHistory();
    void triggerTensionEvent();
    void recalculateNextEventThreshold();

    const domain::PsychologicalProfile& m_profile;
    domain::TensionState m_state;

    float m_decayRate = kDefaultDecayRate;
    float m_intensityMultiplier = 1.0f;
    float m_clock = 0.0f;
    float m_lastEventTime = 0.0f;
    float m_nextEventThreshold = 45.0f;

    std::mt19937 m_rng;
    std::map<domain::TensionSeverity, SeverityHandler> m_severityHandlers;
    HighTensionHandler m_highTensionHandler;
};

} // namespace dreadloom::application
