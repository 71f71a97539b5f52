/**
 * @file TensionDirector.cpp
 * @brief Implementation of the TensionDirector pacing loop.
 */

#include "application/TensionDirector.hpp"
#include "domain/MathUtils.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <numeric>

namespace dreadloom::application {

using domain::Clamp01;
using domain::Lerp;
using domain::TensionSeverity;

namespace {
constexpr float kHighTension = 0.8f;
constexpr float kPeakMargin = 0.2f;
constexpr float kSlowestInterval = 45.0f;
constexpr float kFastestInterval = 15.0f;
constexpr float kJitterMin = 0.8f;
constexpr float kJitterMax = 1.2f;
} // namespace

TensionDirector::TensionDirector(const domain::PsychologicalProfile& profile, unsigned int seed)
    : m_profile(profile), m_rng(seed) {
    m_state.current = kMinTension;
    m_state.target = kMinTension;
    recalculateNextEventThreshold();
}

void TensionDirector::modifyTension(float amount, const std::string& source) {
    if (!std::isfinite(amount)) {
        std::cerr << "[Tension] Ignoring non-finite amount from " << source << std::endl;
        return;
    }

    domain::TensionEvent event;
    event.source = source;
    event.amount = amount * m_intensityMultiplier;
    event.startTime = m_clock;
    event.duration = Lerp(5.0f, 15.0f, std::fabs(amount));
    event.shapeCurve = domain::ShapeCurve::ForAmount(amount);

    m_state.activeEvents.push_back(std::move(event));
    if (m_state.activeEvents.size() > domain::TensionState::kMaxActiveEvents) {
        m_state.activeEvents.erase(m_state.activeEvents.begin());
    }

    float& contribution = m_state.sourceContributions[source];
    contribution = Clamp01(contribution + amount);

    if (m_state.current > kHighTension && m_highTensionHandler) {
        try {
            m_highTensionHandler(source, m_state.current);
        } catch (const std::exception& e) {
            std::cerr << "[Tension] High tension handler failed: " << e.what() << std::endl;
        }
    }
}

void TensionDirector::tick(float deltaTime) {
    if (!(deltaTime > 0.0f)) return;
    m_clock += deltaTime;

    float sourceTotal = 0.0f;
    for (auto& [source, contribution] : m_state.sourceContributions) {
        contribution = std::max(0.0f, contribution - m_decayRate * deltaTime);
        sourceTotal += contribution;
    }

    bool eventsHealthy = true;
    float eventTension = 0.0f;
    try {
        eventTension = calculateEventTension();
    } catch (const std::exception& e) {
        std::cerr << "[Tension] Event evaluation failed, skipping events this tick: " << e.what() << std::endl;
        eventsHealthy = false;
        eventTension = 0.0f;
    }

    float multiplier = 1.0f + 0.5f * m_profile.dominantTraitLevel();
    m_state.target = Clamp01((sourceTotal + eventTension) * multiplier);

    smoothTowardTarget(deltaTime);
    updateHistory();

    if (eventsHealthy && m_clock - m_lastEventTime >= m_nextEventThreshold) {
        triggerTensionEvent();
        recalculateNextEventThreshold();
        m_lastEventTime = m_clock;
    }
}

float TensionDirector::calculateEventTension() {
    float total = 0.0f;
    auto& events = m_state.activeEvents;
    events.erase(std::remove_if(events.begin(), events.end(),
                                [this](const domain::TensionEvent& evt) {
                                    return m_clock - evt.startTime > evt.duration;
                                }),
                 events.end());

    for (const auto& evt : events) {
        float normalized = evt.duration > 0.0f ? (m_clock - evt.startTime) / evt.duration : 1.0f;
        total += evt.shapeCurve.evaluate(normalized) * evt.amount;
    }
    return total;
}

// Critically damped spring (Game Programming Gems 4, 1.10); never passes the target.
void TensionDirector::smoothTowardTarget(float deltaTime) {
    const float omega = 2.0f / kSmoothTime;
    const float x = omega * deltaTime;
    const float exp = 1.0f / (1.0f + x + 0.48f * x * x + 0.235f * x * x * x);

    const float target = m_state.target;
    const float change = m_state.current - target;
    const float temp = (m_state.velocity + omega * change) * deltaTime;

    m_state.velocity = (m_state.velocity - omega * temp) * exp;
    float output = target + (change + temp) * exp;

    if ((target - m_state.current > 0.0f) == (output > target)) {
        output = target;
        m_state.velocity = 0.0f;
    }

    m_state.current = Clamp01(output);
}

void TensionDirector::updateHistory() {
    const float sample = m_state.current;
    if (!m_state.history.empty()) {
        float average = averageTension();
        if (sample > average + kPeakMargin) {
            m_state.peaks[m_state.nextPeakIndex] = sample;
            m_state.nextPeakIndex = (m_state.nextPeakIndex + 1) % domain::TensionState::kPeakCount;
            m_state.peakCount = std::min(m_state.peakCount + 1, domain::TensionState::kPeakCount);
            std::cout << "[Tension] Peak recorded at " << sample << std::endl;
        }
    }

    m_state.history.push_back(sample);
    while (m_state.history.size() > domain::TensionState::kHistoryLength) {
        m_state.history.pop_front();
    }
}

void TensionDirector::triggerTensionEvent() {
    const float tension = m_state.current;
    const TensionSeverity severity = SeverityFor(tension);
    std::cout << "[Tension] Scheduler fired: " << domain::SeverityToString(severity)
              << " (tension " << tension << ")" << std::endl;

    auto it = m_severityHandlers.find(severity);
    if (it == m_severityHandlers.end() || !it->second) return;

    try {
        it->second(severity, tension);
    } catch (const std::exception& e) {
        std::cerr << "[Tension] " << domain::SeverityToString(severity)
                  << " content path failed: " << e.what() << std::endl;
    }
}

void TensionDirector::recalculateNextEventThreshold() {
    std::uniform_real_distribution<float> jitter(kJitterMin, kJitterMax);
    float base = Lerp(kSlowestInterval, kFastestInterval, m_state.current);
    m_nextEventThreshold = base * jitter(m_rng);
}

void TensionDirector::adjustPacing() {
    float ideal = idealTension();
    float diff = std::fabs(m_state.current - ideal);
    if (diff > 0.3f) {
        m_intensityMultiplier = m_state.current < ideal ? 1.5f : 0.7f;
    } else {
        m_intensityMultiplier = 1.0f;
    }
    recalculateNextEventThreshold();
}

float TensionDirector::idealTension() const {
    float ideal = m_profile.getFear() * 0.4f +
                  m_profile.getObsession() * 0.3f +
                  m_profile.getAggression() * 0.3f;
    return std::clamp(ideal, 0.2f, 0.8f);
}

void TensionDirector::reset() {
    m_state = domain::TensionState{};
    m_state.current = kMinTension;
    m_state.target = kMinTension;
    m_intensityMultiplier = 1.0f;
    m_lastEventTime = m_clock;
    recalculateNextEventThreshold();
}

void TensionDirector::setDecayRate(float rate) {
    m_decayRate = std::clamp(rate, 0.01f, 0.1f);
}

void TensionDirector::setSeverityHandler(TensionSeverity severity, SeverityHandler handler) {
    m_severityHandlers[severity] = std::move(handler);
}

float TensionDirector::timeUntilNextEvent() const {
    return std::max(0.0f, m_nextEventThreshold - (m_clock - m_lastEventTime));
}

float TensionDirector::sourceContribution(const std::string& source) const {
    auto it = m_state.sourceContributions.find(source);
    return it != m_state.sourceContributions.end() ? it->second : 0.0f;
}

std::vector<float> TensionDirector::peaks() const {
    std::vector<float> out;
    const std::size_t capacity = domain::TensionState::kPeakCount;
    std::size_t start = m_state.peakCount < capacity ? 0 : m_state.nextPeakIndex;
    for (std::size_t i = 0; i < m_state.peakCount; ++i) {
        out.push_back(m_state.peaks[(start + i) % capacity]);
    }
    return out;
}

float TensionDirector::averageTension() const {
    if (m_state.history.empty()) return kMinTension;
    float sum = std::accumulate(m_state.history.begin(), m_state.history.end(), 0.0f);
    return sum / static_cast<float>(m_state.history.size());
}

TensionSeverity TensionDirector::SeverityFor(float tension) {
    if (tension < 0.3f) return TensionSeverity::Subtle;
    if (tension < 0.7f) return TensionSeverity::Moderate;
    return TensionSeverity::Intense;
}

} // namespace dreadloom::application
