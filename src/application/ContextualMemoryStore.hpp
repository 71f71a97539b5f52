/**
 * @file ContextualMemoryStore.hpp
 * @brief Bounded recency/relevance buffer of past generated content.
 */

#pragma once

#include <deque>
#include <string>
#include <vector>
#include "domain/Generation.hpp"

namespace dreadloom::application {

/**
 * @class ContextualMemoryStore
 * @brief Keeps the last kCapacity significant responses for prompt augmentation.
 *
 * Written only by the orchestrator worker.
 */
class ContextualMemoryStore {
public:
    static constexpr std::size_t kCapacity = 10;
    static constexpr float kHighScore = 0.7f;

    /** @brief Stores @p content if it is significant. Returns true when stored. */
    bool remember(const std::string& contextType, const std::string& content);

    /**
     * @brief Entries matching @p contextType or scoring high, most recent first.
     * @param maxEntries Upper bound on returned entries.
     */
    std::vector<domain::ContextualMemory> relevantFor(const std::string& contextType, std::size_t maxEntries);

    void clear() { m_entries.clear(); }
    std::size_t size() const { return m_entries.size(); }
    const std::deque<domain::ContextualMemory>& entries() const { return m_entries; }

    /** @brief Long responses or ones flagged with emphasis keywords. */
    static bool IsSignificant(const std::string& response);
    static float CalculateRelevance(const std::string& response);
    static float CalculateEmotionalImpact(const std::string& response);

private:
    std::deque<domain::ContextualMemory> m_entries;
};

} // namespace dreadloom::application
