/**
 * @file ContextualMemoryStore.cpp
 * @brief Implementation of ContextualMemoryStore.
 */

#include "application/ContextualMemoryStore.hpp"
#include "domain/MathUtils.hpp"
#include <utility>

namespace dreadloom::application {

namespace {

bool Mentions(const std::string& text, const char* keyword) {
    return text.find(keyword) != std::string::npos;
}

} // namespace

bool ContextualMemoryStore::IsSignificant(const std::string& response) {
    if (response.empty()) return false;
    if (response.size() > 100) return true;

    static const char* const kKeywords[] = {"significant", "important", "crucial", "vital", "key", "critical"};
    for (const char* keyword : kKeywords) {
        if (Mentions(response, keyword)) return true;
    }
    return false;
}

float ContextualMemoryStore::CalculateRelevance(const std::string& response) {
    if (response.empty()) return 0.0f;

    float relevance = 0.5f;
    if (response.size() > 200) relevance += 0.2f;
    if (Mentions(response, "psychological")) relevance += 0.1f;
    if (Mentions(response, "horror")) relevance += 0.1f;
    return domain::Clamp01(relevance);
}

float ContextualMemoryStore::CalculateEmotionalImpact(const std::string& response) {
    if (response.empty()) return 0.0f;

    static const std::pair<const char*, float> kWeights[] = {
        {"fear", 0.2f},
        {"terror", 0.3f},
        {"dread", 0.25f},
        {"horror", 0.2f},
        {"panic", 0.25f},
        {"anxiety", 0.15f}
    };

    float impact = 0.5f;
    for (const auto& [keyword, weight] : kWeights) {
        if (Mentions(response, keyword)) impact += weight;
    }
    return domain::Clamp01(impact);
}

bool ContextualMemoryStore::remember(const std::string& contextType, const std::string& content) {
    if (!IsSignificant(content)) return false;

    domain::ContextualMemory memory;
    memory.contextType = contextType;
    memory.content = content;
    memory.relevance = CalculateRelevance(content);
    memory.emotionalImpact = CalculateEmotionalImpact(content);
    memory.timestamp = std::chrono::system_clock::now();

    m_entries.push_back(std::move(memory));
    while (m_entries.size() > kCapacity) {
        m_entries.pop_front();
    }
    return true;
}

std::vector<domain::ContextualMemory> ContextualMemoryStore::relevantFor(const std::string& contextType,
                                                                         std::size_t maxEntries) {
    std::vector<domain::ContextualMemory> selected;
    for (auto it = m_entries.rbegin(); it != m_entries.rend() && selected.size() < maxEntries; ++it) {
        // Scores are derived from content, refreshed on every lookup.
        it->relevance = CalculateRelevance(it->content);
        it->emotionalImpact = CalculateEmotionalImpact(it->content);

        if (it->contextType == contextType || it->relevance > kHighScore || it->emotionalImpact > kHighScore) {
            selected.push_back(*it);
        }
    }
    return selected;
}

} // namespace dreadloom::application
