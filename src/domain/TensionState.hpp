/**
 * @file TensionState.hpp
 * @brief Value types describing the session's pacing pressure.
 */

#pragma once
#include <array>
#include <deque>
#include <map>
#include <string>
#include <vector>
#include "domain/ShapeCurve.hpp"

namespace dreadloom::domain {

/**
 * @enum TensionSeverity
 * @brief Content intensity chosen when the pacing scheduler fires.
 */
enum class TensionSeverity {
    Subtle,   ///< current < 0.3
    Moderate, ///< current < 0.7
    Intense   ///< otherwise
};

inline const char* SeverityToString(TensionSeverity severity) {
    switch (severity) {
        case TensionSeverity::Subtle: return "subtle";
        case TensionSeverity::Moderate: return "moderate";
        case TensionSeverity::Intense: return "intense";
    }
    return "subtle";
}

/**
 * @struct TensionEvent
 * @brief A time-bounded contribution to tension shaped by a curve.
 */
struct TensionEvent {
    std::string source;
    float amount = 0.0f;
    float startTime = 0.0f; ///< Session clock, seconds.
    float duration = 0.0f;  ///< Seconds.
    ShapeCurve shapeCurve;
};

/**
 * @struct TensionState
 * @brief Running tension for one play session.
 */
struct TensionState {
    static constexpr std::size_t kHistoryLength = 10;
    static constexpr std::size_t kPeakCount = 3;
    static constexpr std::size_t kMaxActiveEvents = 5;

    float current = 0.1f;
    float target = 0.1f;
    float velocity = 0.0f;

    std::map<std::string, float> sourceContributions;
    std::vector<TensionEvent> activeEvents;
    std::deque<float> history;
    std::array<float, kPeakCount> peaks{};
    std::size_t nextPeakIndex = 0;
    std::size_t peakCount = 0;
};

} // namespace dreadloom::domain
