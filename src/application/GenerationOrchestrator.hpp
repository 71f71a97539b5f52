/**
 * @file GenerationOrchestrator.hpp
 * @brief Single-flight FIFO pipeline for all outbound generation requests.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "application/ContextualMemoryStore.hpp"
#include "application/TemperatureTable.hpp"
#include "domain/Generation.hpp"
#include "domain/GenerationBackend.hpp"

namespace dreadloom::application {

/**
 * @struct OrchestratorOptions
 * @brief Tunables for prompt enhancement and model routing.
 */
struct OrchestratorOptions {
    std::size_t maxRelevantMemories = 3;
    std::string defaultModel;                  ///< Empty lets the backend choose.
    std::map<std::string, std::string> models; ///< contextType -> model name.
};

/**
 * @class GenerationOrchestrator
 * @brief Caches, enhances, validates and serializes generation requests.
 *
 * One worker thread drains the queue in FIFO order, so at most one backend call
 * is in flight. The cache and contextual memory are written only by that worker.
 */
class GenerationOrchestrator {
public:
    using ProfileSummaryProvider = std::function<std::string()>;

    static constexpr int kMaxTokensCap = 2048;
    static constexpr float kRetryTemperatureBump = 0.1f;

    GenerationOrchestrator(std::shared_ptr<domain::GenerationBackend> backend,
                           TemperatureTable temperatures = TemperatureTable(),
                           OrchestratorOptions options = OrchestratorOptions());
    ~GenerationOrchestrator();

    GenerationOrchestrator(const GenerationOrchestrator&) = delete;
    GenerationOrchestrator& operator=(const GenerationOrchestrator&) = delete;

    /**
     * @brief Single entry point for text generation.
     * @param prompt Raw prompt; its hash is the cache key.
     * @param contextType Selects temperature, model and memory affinity.
     * @param requiredElements Case-sensitive substrings the result must contain.
     * @return Future resolved with the result, or with a GenerationError on backend failure.
     */
    std::future<domain::GenerationResult> generate(const std::string& prompt,
                                                   const std::string& contextType,
                                                   const std::vector<std::string>& requiredElements = {});

    /** @brief Queues an image generation behind pending text requests. */
    std::future<domain::ImageResult> generateImage(const std::string& prompt);

    /** @brief Supplies the profile summary appended to every prompt. */
    void setProfileSummaryProvider(ProfileSummaryProvider provider);

    /**
     * @brief Drops requests not yet dispatched. Their futures receive a GenerationError.
     * @return Number of dropped requests.
     */
    std::size_t clearQueue();

    void clearCache();
    void clearMemory();

    /** @brief Drains pending work and joins the worker. */
    void stop();

    std::size_t backendCalls() const { return m_backendCalls.load(); }
    std::size_t pendingRequests() const;
    std::size_t cacheSize() const;
    std::size_t memorySize() const;

    /** @brief Deterministic FNV-1a 64-bit hash of the prompt, as hex. */
    static std::string ComputeCacheKey(const std::string& prompt);

    /** @brief min(2048, 2 * prompt length). */
    static int CalculateMaxTokens(const std::string& prompt);

    /**
     * @brief Non-empty and containing every required element.
     * @param missing Receives the absent elements when not null.
     */
    static bool Validate(const std::string& response,
                         const std::vector<std::string>& requiredElements,
                         std::vector<std::string>* missing = nullptr);

private:
    struct Job {
        enum class Kind { Text, Image };
        Kind kind = Kind::Text;
        domain::GenerationRequest request;
        std::promise<domain::GenerationResult> textPromise;
        std::promise<domain::ImageResult> imagePromise;
    };

    void workerLoop();
    void processText(Job& job);
    void processImage(Job& job);
    std::optional<std::string> callBackend(const domain::GenerationRequest& request);
    std::string modelFor(const std::string& contextType) const;

    std::shared_ptr<domain::GenerationBackend> m_backend;
    TemperatureTable m_temperatures;
    OrchestratorOptions m_options;

    ContextualMemoryStore m_memory;
    std::map<std::string, std::string> m_cache;
    ProfileSummaryProvider m_profileSummary;

    std::deque<Job> m_queue;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::thread m_worker;
    bool m_running = true;
    std::atomic<std::size_t> m_backendCalls{0};
};

} // namespace dreadloom::application
