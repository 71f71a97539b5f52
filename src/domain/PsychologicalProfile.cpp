/**
 * @file PsychologicalProfile.cpp
 * @brief Implementation of the PsychologicalProfile update rules.
 */

#include "domain/PsychologicalProfile.hpp"
#include "domain/MathUtils.hpp"
#include <algorithm>
#include <cassert>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <numeric>
#include <set>
#include <sstream>

namespace dreadloom::domain {

namespace {

constexpr float kTriggerBlend = 0.3f;
constexpr float kTriggerFloor = 0.1f;
constexpr float kTriggerDecayRate = 0.02f;
constexpr float kParanoiaDecayRate = 0.05f;
constexpr float kDistortionDecayRate = 0.03f;
constexpr float kInstabilityDecayRate = 0.04f;
constexpr float kParanoiaThreshold = 0.6f;
constexpr float kDistortionThreshold = 0.8f;
constexpr float kAnalysisBlend = 0.3f;
constexpr float kWeightSumTolerance = 1e-3f;

struct LexicalClass {
    const char* const* words;
    std::size_t count;
    float weight;
};

constexpr const char* kAggressiveActions[] = {"attack", "break", "destroy", "kill", "fight"};
constexpr const char* kCuriousActions[] = {"examine", "look", "inspect", "investigate", "search"};
constexpr const char* kFearfulActions[] = {"run", "hide", "flee", "escape", "avoid"};

// Returns nullopt when none of the class words has been recorded yet.
std::optional<float> ScoreClass(const std::map<std::string, int>& frequencies, const LexicalClass& cls) {
    bool seen = false;
    float score = 0.0f;
    for (std::size_t i = 0; i < cls.count; ++i) {
        auto it = frequencies.find(cls.words[i]);
        if (it != frequencies.end()) {
            seen = true;
            score += static_cast<float>(it->second) * cls.weight;
        }
    }
    if (!seen) return std::nullopt;
    return std::min(1.0f, score);
}

bool Contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

bool InUnitRange(const std::optional<float>& value) {
    return value && std::isfinite(*value) && *value >= 0.0f && *value <= 1.0f;
}

} // namespace

PsychologicalProfile::PsychologicalProfile() {
    initializeTriggers();
}

void PsychologicalProfile::initializeTriggers() {
    m_triggerWeights.clear();
    m_triggerWeights["isolation"] = 0.3f;
    m_triggerWeights["paranoia"] = 0.3f;
    m_triggerWeights["unreality"] = 0.2f;
    m_triggerWeights["observation"] = 0.4f;
    m_triggerWeights["reflection"] = 0.3f;
    normalizeTriggers();
}

void PsychologicalProfile::reset() {
    m_fear = m_obsession = m_aggression = m_curiosity = 0.0f;
    m_paranoiaIndex = m_realityDistortion = m_emotionalInstability = 0.0f;
    m_choiceFrequencies.clear();
    m_keywordOccurrences.clear();
    m_behaviorPatterns.clear();
    m_emotionalTriggers.clear();
    m_behaviorHistory.clear();
    m_recentChoices.clear();
    initializeTriggers();
}

void PsychologicalProfile::recordChoice(const std::string& choiceType, const std::string& target) {
    const std::string type = ToLower(choiceType);
    const std::string keyword = ToLower(target);

    m_choiceFrequencies[type]++;

    m_recentChoices.push_back(choiceType + ":" + target);
    while (m_recentChoices.size() > kMaxRecentChoices) {
        m_recentChoices.pop_front();
    }

    if (!keyword.empty()) {
        m_keywordOccurrences[keyword]++;
    }

    recordSnapshot(choiceType, target);
    updateDerivedIndices(type, keyword);
    updateTraitsFromChoices();
}

void PsychologicalProfile::recordSnapshot(const std::string& action, const std::string& context) {
    BehaviorSnapshot snapshot;
    snapshot.action = action;
    snapshot.context = context;
    snapshot.fear = m_fear;
    snapshot.obsession = m_obsession;
    snapshot.aggression = m_aggression;
    snapshot.paranoia = m_paranoiaIndex;
    snapshot.realityDistortion = m_realityDistortion;
    snapshot.emotionalInstability = m_emotionalInstability;
    snapshot.timestamp = std::chrono::system_clock::now();

    m_behaviorHistory.push_back(std::move(snapshot));
    while (m_behaviorHistory.size() > kMaxBehaviorHistory) {
        m_behaviorHistory.pop_front();
    }
}

void PsychologicalProfile::updateDerivedIndices(const std::string& choiceType, const std::string& target) {
    if (Contains(choiceType, "observe") || Contains(choiceType, "caution")) {
        m_paranoiaIndex = Clamp01(Lerp(m_paranoiaIndex, m_paranoiaIndex + 0.1f, 0.3f));
        if (m_paranoiaIndex > kParanoiaThreshold) {
            m_triggerWeights["paranoia"] += 0.1f;
        }
    }

    if (Contains(target, "impossible") || Contains(target, "unreal")) {
        m_realityDistortion = Clamp01(Lerp(m_realityDistortion, m_realityDistortion + 0.15f, 0.4f));
        if (m_realityDistortion > kDistortionThreshold) {
            m_triggerWeights["unreality"] += 0.15f;
        }
    }

    // Volatility between the two most recent snapshots, not magnitude.
    if (m_behaviorHistory.size() >= 2) {
        const auto& previous = m_behaviorHistory[m_behaviorHistory.size() - 2];
        const auto& latest = m_behaviorHistory.back();
        float variance = (std::fabs(latest.fear - previous.fear) +
                          std::fabs(latest.obsession - previous.obsession) +
                          std::fabs(latest.aggression - previous.aggression)) / 3.0f;
        m_emotionalInstability = Clamp01(Lerp(m_emotionalInstability, variance, 0.2f));
    }

    normalizeTriggers();
}

void PsychologicalProfile::updateTraitsFromChoices() {
    const LexicalClass aggressive{kAggressiveActions, std::size(kAggressiveActions), 0.2f};
    const LexicalClass curious{kCuriousActions, std::size(kCuriousActions), 0.15f};
    const LexicalClass fearful{kFearfulActions, std::size(kFearfulActions), 0.25f};

    if (auto score = ScoreClass(m_choiceFrequencies, aggressive)) m_aggression = *score;
    if (auto score = ScoreClass(m_choiceFrequencies, curious)) m_curiosity = *score;
    if (auto score = ScoreClass(m_choiceFrequencies, fearful)) m_fear = *score;

    analyzeChoicePatterns();

    int obsessivePatterns = 0;
    for (const auto& [pattern, count] : m_behaviorPatterns) {
        if (count > kObsessionThreshold) obsessivePatterns++;
    }
    if (obsessivePatterns > 0) {
        m_obsession = std::min(1.0f, 0.2f * static_cast<float>(obsessivePatterns));
    }
}

void PsychologicalProfile::analyzeChoicePatterns() {
    std::map<std::string, int> repetitions;
    for (const auto& choice : m_recentChoices) {
        repetitions[choice]++;
    }

    for (const auto& [choice, count] : repetitions) {
        if (count <= 2) continue;
        m_behaviorPatterns[choice] += count;
        if (count > kObsessionThreshold) {
            m_keywordOccurrences[ToLower(choice)]++;
        }
    }

    if (m_recentChoices.size() < 3) return;
    for (std::size_t i = 0; i + 2 < m_recentChoices.size(); ++i) {
        std::string sequence = m_recentChoices[i] + ">" + m_recentChoices[i + 1] + ">" + m_recentChoices[i + 2];
        m_behaviorPatterns[sequence]++;
    }
}

void PsychologicalProfile::recordTrigger(const std::string& trigger, float intensity) {
    intensity = Clamp01(intensity);

    auto it = m_triggerWeights.find(trigger);
    if (it == m_triggerWeights.end()) {
        m_triggerWeights[trigger] = intensity;
    } else {
        it->second = Lerp(it->second, intensity, kTriggerBlend);
    }

    auto now = std::chrono::system_clock::now();
    auto record = m_emotionalTriggers.find(trigger);
    if (record == m_emotionalTriggers.end()) {
        m_emotionalTriggers[trigger] = EmotionalTrigger{trigger, intensity, 1, now};
    } else {
        record->second.intensity = Lerp(record->second.intensity, intensity, kTriggerBlend);
        record->second.occurrences++;
        record->second.lastTriggered = now;
    }

    normalizeTriggers();
}

void PsychologicalProfile::decay(float deltaTime) {
    if (!(deltaTime > 0.0f)) return;

    m_paranoiaIndex = std::max(0.0f, m_paranoiaIndex - kParanoiaDecayRate * deltaTime);
    m_realityDistortion = std::max(0.0f, m_realityDistortion - kDistortionDecayRate * deltaTime);
    m_emotionalInstability = std::max(0.0f, m_emotionalInstability - kInstabilityDecayRate * deltaTime);

    for (auto& [name, weight] : m_triggerWeights) {
        weight = std::max(kTriggerFloor, weight - kTriggerDecayRate * deltaTime);
    }
    normalizeTriggers();
}

void PsychologicalProfile::decayTraits(float deltaTime) {
    if (!(deltaTime > 0.0f)) return;
    m_fear = std::max(0.0f, m_fear - 0.05f * deltaTime);
    m_aggression = std::max(0.0f, m_aggression - 0.03f * deltaTime);
    m_curiosity = std::max(0.0f, m_curiosity - 0.02f * deltaTime);
}

bool PsychologicalProfile::applyAnalysis(const TraitAnalysis& analysis) {
    if (!InUnitRange(analysis.fear) || !InUnitRange(analysis.obsession) || !InUnitRange(analysis.aggression)) {
        std::cerr << "[Profile] Rejected malformed analysis; profile left unchanged." << std::endl;
        return false;
    }

    m_fear = Clamp01(Lerp(m_fear, *analysis.fear, kAnalysisBlend));
    m_obsession = Clamp01(Lerp(m_obsession, *analysis.obsession, kAnalysisBlend));
    m_aggression = Clamp01(Lerp(m_aggression, *analysis.aggression, kAnalysisBlend));
    return true;
}

void PsychologicalProfile::normalizeTriggers() {
    float total = 0.0f;
    for (auto& [name, weight] : m_triggerWeights) {
        weight = std::isfinite(weight) ? std::max(0.0f, weight) : 0.0f;
        total += weight;
    }

    if (total > 0.0f) {
        for (auto& [name, weight] : m_triggerWeights) {
            weight /= total;
        }
    } else if (!m_triggerWeights.empty()) {
        const float uniform = 1.0f / static_cast<float>(m_triggerWeights.size());
        for (auto& [name, weight] : m_triggerWeights) {
            weight = uniform;
        }
    }

    float sum = std::accumulate(m_triggerWeights.begin(), m_triggerWeights.end(), 0.0f,
                                [](float acc, const auto& entry) { return acc + entry.second; });
    assert(m_triggerWeights.empty() || std::fabs(sum - 1.0f) < kWeightSumTolerance);
    (void)sum;
}

void PsychologicalProfile::setFear(float value) { m_fear = Clamp01(value); }
void PsychologicalProfile::setObsession(float value) { m_obsession = Clamp01(value); }
void PsychologicalProfile::setAggression(float value) { m_aggression = Clamp01(value); }
void PsychologicalProfile::setCuriosity(float value) { m_curiosity = Clamp01(value); }

float PsychologicalProfile::triggerSensitivity(const std::string& trigger) const {
    auto it = m_triggerWeights.find(trigger);
    return it != m_triggerWeights.end() ? it->second : 0.0f;
}

void PsychologicalProfile::setChoiceFrequencies(const std::map<std::string, int>& frequencies) {
    m_choiceFrequencies.clear();
    for (const auto& [choice, count] : frequencies) {
        if (count > 0) {
            m_choiceFrequencies[ToLower(choice)] = count;
        }
    }
}

std::vector<std::string> PsychologicalProfile::getActiveObsessions() const {
    std::vector<std::string> active;
    for (const auto& [keyword, count] : m_keywordOccurrences) {
        if (count >= kObsessionThreshold) {
            active.push_back(keyword);
        }
    }
    return active;
}

void PsychologicalProfile::setActiveObsessions(const std::vector<std::string>& keywords) {
    std::set<std::string> wanted;
    for (const auto& keyword : keywords) {
        if (!keyword.empty()) wanted.insert(ToLower(keyword));
    }

    for (auto& [keyword, count] : m_keywordOccurrences) {
        if (count >= kObsessionThreshold && wanted.count(keyword) == 0) {
            count = kObsessionThreshold - 1;
        }
    }
    for (const auto& keyword : wanted) {
        int& count = m_keywordOccurrences[keyword];
        count = std::max(count, kObsessionThreshold);
    }
}

std::vector<BehaviorSnapshot> PsychologicalProfile::recentBehavior(std::size_t count) const {
    std::size_t start = m_behaviorHistory.size() > count ? m_behaviorHistory.size() - count : 0;
    return std::vector<BehaviorSnapshot>(m_behaviorHistory.begin() + static_cast<std::ptrdiff_t>(start),
                                         m_behaviorHistory.end());
}

std::vector<std::string> PsychologicalProfile::dominantTraits() const {
    std::vector<std::pair<std::string, float>> traits = {
        {"Aggression", m_aggression},
        {"Curiosity", m_curiosity},
        {"Fear", m_fear},
        {"Obsession", m_obsession}
    };
    std::stable_sort(traits.begin(), traits.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });

    std::vector<std::string> names;
    for (const auto& [name, value] : traits) {
        if (value > 0.5f) names.push_back(name);
    }
    return names;
}

float PsychologicalProfile::dominantTraitLevel() const {
    return std::max({m_fear, m_obsession, m_aggression});
}

std::string PsychologicalProfile::summary() const {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2);
    ss << "Psychological State:\n"
       << "Fear Level: " << m_fear << "\n"
       << "Obsession Level: " << m_obsession << "\n"
       << "Aggression Level: " << m_aggression << "\n"
       << "Curiosity Level: " << m_curiosity << "\n"
       << "Paranoia: " << m_paranoiaIndex << "\n"
       << "Reality Distortion: " << m_realityDistortion << "\n"
       << "Emotional Instability: " << m_emotionalInstability << "\n";

    auto obsessions = getActiveObsessions();
    if (!obsessions.empty()) {
        ss << "Obsessions:";
        for (const auto& keyword : obsessions) ss << " " << keyword;
        ss << "\n";
    }

    std::vector<std::pair<std::string, float>> weights(m_triggerWeights.begin(), m_triggerWeights.end());
    std::sort(weights.begin(), weights.end(), [](const auto& a, const auto& b) { return a.second > b.second; });
    if (!weights.empty()) {
        ss << "Dominant Triggers:";
        for (std::size_t i = 0; i < weights.size() && i < 2; ++i) {
            ss << " " << weights[i].first;
        }
        ss << "\n";
    }
    return ss.str();
}

} // namespace dreadloom::domain
