/**
 * @file PsychologicalProfile.hpp
 * @brief Domain entity tracking the player's evolving psychological state.
 */

#pragma once
#include <chrono>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace dreadloom::domain {

/**
 * @struct BehaviorSnapshot
 * @brief Immutable record of a single player action and the state it happened in.
 */
struct BehaviorSnapshot {
    std::string action;
    std::string context;
    float fear = 0.0f;
    float obsession = 0.0f;
    float aggression = 0.0f;
    float paranoia = 0.0f;
    float realityDistortion = 0.0f;
    float emotionalInstability = 0.0f;
    std::chrono::system_clock::time_point timestamp;
};

/**
 * @struct EmotionalTrigger
 * @brief Running record of how a named trigger has affected the player.
 */
struct EmotionalTrigger {
    std::string trigger;
    float intensity = 0.0f;
    int occurrences = 0;
    std::chrono::system_clock::time_point lastTriggered;
};

/**
 * @struct TraitAnalysis
 * @brief Externally produced trait estimate (e.g. parsed from a model response).
 *
 * A missing field makes the whole analysis invalid.
 */
struct TraitAnalysis {
    std::optional<float> fear;
    std::optional<float> obsession;
    std::optional<float> aggression;
    std::string notes;
};

/**
 * @class PsychologicalProfile
 * @brief Bounded trait vector, derived indices and trigger distribution.
 *
 * All values live in [0,1]. Trigger weights always form a distribution that
 * sums to 1. Updates are all-or-nothing.
 */
class PsychologicalProfile {
public:
    static constexpr std::size_t kMaxBehaviorHistory = 20;
    static constexpr std::size_t kMaxRecentChoices = 10;
    static constexpr int kObsessionThreshold = 3;

    PsychologicalProfile();

    /**
     * @brief Records a player choice and recomputes derived indices and traits.
     * @param choiceType Action verb class (e.g. "observe_shadow").
     * @param target Free-text target of the action.
     */
    void recordChoice(const std::string& choiceType, const std::string& target);

    /**
     * @brief Blends a trigger weight toward @p intensity and renormalizes.
     * @param trigger Trigger name; created if unknown.
     * @param intensity Observed intensity, clamped to [0,1].
     */
    void recordTrigger(const std::string& trigger, float intensity);

    /** @brief Pulls derived indices toward 0 and trigger weights toward their floor. */
    void decay(float deltaTime);

    /** @brief Natural decay of the primary traits (fear, aggression, curiosity). */
    void decayTraits(float deltaTime);

    /**
     * @brief Blends fear/obsession/aggression toward an external analysis.
     * @return False (and no change) when the analysis is incomplete or out of range.
     */
    bool applyAnalysis(const TraitAnalysis& analysis);

    /** @brief Restores the initial vector. */
    void reset();

    // Primary traits
    float getFear() const { return m_fear; }
    float getObsession() const { return m_obsession; }
    float getAggression() const { return m_aggression; }
    float getCuriosity() const { return m_curiosity; }
    void setFear(float value);
    void setObsession(float value);
    void setAggression(float value);
    void setCuriosity(float value);

    // Derived indices
    float getParanoiaIndex() const { return m_paranoiaIndex; }
    float getRealityDistortion() const { return m_realityDistortion; }
    float getEmotionalInstability() const { return m_emotionalInstability; }

    /** @brief Current trigger distribution (sums to 1). */
    const std::map<std::string, float>& getTriggerWeights() const { return m_triggerWeights; }

    /** @brief Weight of a single trigger, 0 if unknown. */
    float triggerSensitivity(const std::string& trigger) const;

    const std::map<std::string, int>& getChoiceFrequencies() const { return m_choiceFrequencies; }
    /** @brief Replaces the frequency table with externally persisted values. */
    void setChoiceFrequencies(const std::map<std::string, int>& frequencies);

    /** @brief Keywords seen at least kObsessionThreshold times. */
    std::vector<std::string> getActiveObsessions() const;
    /** @brief Replaces the active obsessions with @p keywords. */
    void setActiveObsessions(const std::vector<std::string>& keywords);

    const std::map<std::string, int>& getBehaviorPatterns() const { return m_behaviorPatterns; }
    const std::map<std::string, EmotionalTrigger>& getEmotionalTriggers() const { return m_emotionalTriggers; }
    const std::deque<BehaviorSnapshot>& getBehaviorHistory() const { return m_behaviorHistory; }
    const std::deque<std::string>& getRecentChoices() const { return m_recentChoices; }

    /** @brief The last @p count snapshots, oldest first. */
    std::vector<BehaviorSnapshot> recentBehavior(std::size_t count = 5) const;

    /** @brief Names of traits above 0.5, strongest first. */
    std::vector<std::string> dominantTraits() const;

    /** @brief max(fear, obsession, aggression). */
    float dominantTraitLevel() const;

    /** @brief Plain-text block describing the current state, used in prompts. */
    std::string summary() const;

private:
    void initializeTriggers();
    void recordSnapshot(const std::string& action, const std::string& context);
    void updateDerivedIndices(const std::string& choiceType, const std::string& target);
    void updateTraitsFromChoices();
    void analyzeChoicePatterns();
    void normalizeTriggers();

    float m_fear = 0.0f;
    float m_obsession = 0.0f;
    float m_aggression = 0.0f;
    float m_curiosity = 0.0f;

    float m_paranoiaIndex = 0.0f;
    float m_realityDistortion = 0.0f;
    float m_emotionalInstability = 0.0f;

    std::map<std::string, float> m_triggerWeights;
    std::map<std::string, int> m_choiceFrequencies;
    std::map<std::string, int> m_keywordOccurrences;
    std::map<std::string, int> m_behaviorPatterns;
    std::map<std::string, EmotionalTrigger> m_emotionalTriggers;
    std::deque<BehaviorSnapshot> m_behaviorHistory;
    std::deque<std::string> m_recentChoices;
};

} // namespace dreadloom::domain
