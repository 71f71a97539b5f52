/**
 * @file Director.hpp
 * @brief Composition root tying player actions, pacing and content generation together.
 */

#pragma once

#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include "application/DirectorContext.hpp"
#include "domain/Generation.hpp"
#include "domain/TensionState.hpp"

namespace dreadloom::application {

/**
 * @class Director
 * @brief Per-session director. Profile and tension are guarded by one session mutex.
 *
 * Generated content is delivered on background tasks. After shutdown() late
 * results are discarded.
 */
class Director {
public:
    using ContentConsumer = std::function<void(domain::TensionSeverity severity, float tension,
                                               const domain::GenerationResult& result)>;
    using SeverityConsumer = std::function<void(domain::TensionSeverity severity, float tension)>;

    struct Snapshot {
        std::string profileSummary;
        float tensionValue = 0.0f;
    };

    static constexpr float kPostIntenseRelief = -0.3f;
    static constexpr float kSignificantShift = 0.2f;
    static constexpr float kHighTensionFearRise = 0.1f;

    explicit Director(DirectorContext context);
    ~Director();

    Director(const Director&) = delete;
    Director& operator=(const Director&) = delete;

    /** @brief Records a choice and feeds any paranoia rise into tension. */
    void onPlayerAction(const std::string& choiceType, const std::string& target);

    /** @brief Decays the profile and advances the tension director by @p deltaTime seconds. */
    void tick(float deltaTime);

    /**
     * @brief Requests a room description that must mention the archetype and theme (lower-case).
     */
    std::future<domain::GenerationResult> describeRoom(const std::string& roomArchetype,
                                                       int levelNumber,
                                                       const std::string& theme);

    /**
     * @brief Asks the backend for a trait analysis of recent behavior and applies it.
     * @return Status of the background task; failed if the reply was malformed or the call failed.
     */
    std::shared_ptr<TaskStatus> requestAnalysis();

    /** @brief Requests a still image of @p description, styled by the current tension. */
    std::future<domain::ImageResult> requestImage(const std::string& description);

    Snapshot snapshot() const;

    /** @brief Receives generated event content on a background thread. */
    void setContentConsumer(ContentConsumer consumer);

    /** @brief Called synchronously from tick() with the session lock held; must not call back into the Director. */
    void setSeverityConsumer(SeverityConsumer consumer);

    /** @brief Stops accepting results, drops queued requests and waits for delivery tasks. */
    void shutdown();

    const DirectorContext& context() const { return m_context; }

private:
    void onSeverity(domain::TensionSeverity severity, float tension);
    void deliverContent(domain::TensionSeverity severity, float tension,
                        std::shared_future<domain::GenerationResult> pending);
    void applyAnalysisReply(const std::string& reply);

    DirectorContext m_context;
    mutable std::mutex m_sessionMutex;

    std::mutex m_consumerMutex;
    ContentConsumer m_contentConsumer;
    SeverityConsumer m_severityConsumer;

    std::atomic<bool> m_accepting{true};
};

} // namespace dreadloom::application
