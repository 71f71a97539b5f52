/**
 * @file GenerationOrchestrator.cpp
 * @brief Implementation of the GenerationOrchestrator worker pipeline.
 */

#include "application/GenerationOrchestrator.hpp"
#include "application/PromptContext.hpp"
#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace dreadloom::application {

using domain::GenerationError;
using domain::GenerationRequest;
using domain::GenerationResult;
using domain::GenerationStatus;

namespace {

std::string JoinElements(const std::vector<std::string>& elements) {
    std::ostringstream ss;
    for (std::size_t i = 0; i < elements.size(); ++i) {
        if (i > 0) ss << ", ";
        ss << elements[i];
    }
    return ss.str();
}

} // namespace

GenerationOrchestrator::GenerationOrchestrator(std::shared_ptr<domain::GenerationBackend> backend,
                                               TemperatureTable temperatures,
                                               OrchestratorOptions options)
    : m_backend(std::move(backend)), m_temperatures(std::move(temperatures)), m_options(std::move(options)) {
    if (!m_backend) {
        throw std::invalid_argument("GenerationOrchestrator requires a backend");
    }
    m_worker = std::thread(&GenerationOrchestrator::workerLoop, this);
}

GenerationOrchestrator::~GenerationOrchestrator() {
    stop();
}

void GenerationOrchestrator::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) return;
        m_running = false;
    }
    m_cv.notify_all();

    if (m_worker.joinable()) {
        m_worker.join();
    }
}

std::future<GenerationResult> GenerationOrchestrator::generate(const std::string& prompt,
                                                               const std::string& contextType,
                                                               const std::vector<std::string>& requiredElements) {
    Job job;
    job.kind = Job::Kind::Text;
    job.request.prompt = prompt;
    job.request.contextType = contextType;
    job.request.requiredElements = requiredElements;
    job.request.temperature = m_temperatures.temperatureFor(contextType);
    job.request.maxTokens = CalculateMaxTokens(prompt);
    job.request.model = modelFor(contextType);
    job.request.cacheKey = ComputeCacheKey(prompt);

    auto future = job.textPromise.get_future();

    {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto cached = m_cache.find(job.request.cacheKey);
        if (cached != m_cache.end() && Validate(cached->second, requiredElements)) {
            GenerationResult result;
            result.text = cached->second;
            result.status = GenerationStatus::Success;
            result.valid = true;
            result.fromCache = true;
            job.textPromise.set_value(std::move(result));
            return future;
        }

        if (!m_running) {
            job.textPromise.set_exception(std::make_exception_ptr(
                GenerationError("Orchestrator stopped; request not accepted")));
            return future;
        }

        m_queue.push_back(std::move(job));
    }
    m_cv.notify_one();
    return future;
}

std::future<domain::ImageResult> GenerationOrchestrator::generateImage(const std::string& prompt) {
    Job job;
    job.kind = Job::Kind::Image;
    job.request.prompt = prompt;
    job.request.contextType = "image_generation";
    auto future = job.imagePromise.get_future();

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) {
            job.imagePromise.set_exception(std::make_exception_ptr(
                GenerationError("Orchestrator stopped; request not accepted")));
            return future;
        }
        m_queue.push_back(std::move(job));
    }
    m_cv.notify_one();
    return future;
}

void GenerationOrchestrator::workerLoop() {
    while (true) {
        Job job;

        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] {
                return !m_queue.empty() || !m_running;
            });

            if (!m_running && m_queue.empty()) {
                return;
            }

            if (m_queue.empty()) {
                continue;
            }

            job = std::move(m_queue.front());
            m_queue.pop_front();
        }

        // Process outside lock; one request at a time.
        if (job.kind == Job::Kind::Text) {
            processText(job);
        } else {
            processImage(job);
        }
    }
}

void GenerationOrchestrator::processText(Job& job) {
    const GenerationRequest& original = job.request;

    try {
        PromptContext context;
        context.basePrompt = original.prompt;

        ProfileSummaryProvider summaryProvider;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            context.memories = m_memory.relevantFor(original.contextType, m_options.maxRelevantMemories);
            summaryProvider = m_profileSummary;
        }
        if (summaryProvider) {
            context.profileSummary = summaryProvider();
        }

        GenerationRequest attempt = original;
        attempt.prompt = context.render();

        GenerationResult result;
        result.attempts = 1;
        std::optional<std::string> response = callBackend(attempt);
        std::vector<std::string> missing;

        bool valid = response && Validate(*response, original.requiredElements, &missing);
        if (!valid) {
            GenerationRequest retry = attempt;
            if (response) {
                retry.temperature = std::min(attempt.temperature + kRetryTemperatureBump, 1.0f);
                const std::string missingList = JoinElements(missing.empty() ? original.requiredElements : missing);
                if (!missingList.empty()) {
                    retry.prompt = "Previous attempt did not meet requirements. Please ensure the response includes: " +
                                   missingList + "\n\n" + attempt.prompt;
                }
                std::cerr << "[Orchestrator] Validation failed for " << original.contextType
                          << ", retrying once." << std::endl;
            } else {
                std::cerr << "[Orchestrator] Backend failure for " << original.contextType
                          << ", retrying once." << std::endl;
            }

            result.attempts = 2;
            missing.clear();
            response = callBackend(retry);
            if (!response) {
                throw GenerationError("Backend failed to respond for context '" + original.contextType + "'");
            }
            valid = Validate(*response, original.requiredElements, &missing);
        }

        if (!valid) {
            result.text = *response;
            result.status = GenerationStatus::ValidationFailed;
            result.valid = false;
            result.missingElements = missing;
            std::cerr << "[Orchestrator] Giving up on " << original.contextType
                      << "; missing: " << JoinElements(missing) << std::endl;
            job.textPromise.set_value(std::move(result));
            return;
        }

        result.text = *response;
        result.status = GenerationStatus::Success;
        result.valid = true;

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_cache[original.cacheKey] = result.text;
            m_memory.remember(original.contextType, result.text);
        }

        job.textPromise.set_value(std::move(result));
    } catch (const std::exception& e) {
        std::cerr << "[Orchestrator] Request failed: " << e.what() << std::endl;
        job.textPromise.set_exception(std::current_exception());
    }
}

void GenerationOrchestrator::processImage(Job& job) {
    try {
        std::optional<domain::ImageResult> image;
        for (int attempt = 0; attempt < 2 && !image; ++attempt) {
            m_backendCalls++;
            try {
                image = m_backend->generateImage(job.request.prompt);
            } catch (const std::exception& e) {
                std::cerr << "[Orchestrator] Image backend error: " << e.what() << std::endl;
            } catch (...) {
                std::cerr << "[Orchestrator] Image backend error: unknown exception" << std::endl;
            }
        }
        if (!image || image->bytes.empty()) {
            throw GenerationError("Image generation failed");
        }
        job.imagePromise.set_value(std::move(*image));
    } catch (const std::exception& e) {
        std::cerr << "[Orchestrator] Image request failed: " << e.what() << std::endl;
        job.imagePromise.set_exception(std::current_exception());
    }
}

std::optional<std::string> GenerationOrchestrator::callBackend(const GenerationRequest& request) {
    m_backendCalls++;
    try {
        return m_backend->complete(request);
    } catch (const std::exception& e) {
        std::cerr << "[Orchestrator] Backend error: " << e.what() << std::endl;
    } catch (...) {
        std::cerr << "[Orchestrator] Backend error: unknown exception" << std::endl;
    }
    return std::nullopt;
}

std::size_t GenerationOrchestrator::clearQueue() {
    std::deque<Job> dropped;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        dropped.swap(m_queue);
    }

    for (auto& job : dropped) {
        auto error = std::make_exception_ptr(GenerationError("Request cancelled before dispatch"));
        if (job.kind == Job::Kind::Text) {
            job.textPromise.set_exception(error);
        } else {
            job.imagePromise.set_exception(error);
        }
    }
    if (!dropped.empty()) {
        std::cout << "[Orchestrator] Dropped " << dropped.size() << " pending request(s)." << std::endl;
    }
    return dropped.size();
}

void GenerationOrchestrator::setProfileSummaryProvider(ProfileSummaryProvider provider) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_profileSummary = std::move(provider);
}

void GenerationOrchestrator::clearCache() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_cache.clear();
}

void GenerationOrchestrator::clearMemory() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_memory.clear();
}

std::size_t GenerationOrchestrator::pendingRequests() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
}

std::size_t GenerationOrchestrator::cacheSize() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_cache.size();
}

std::size_t GenerationOrchestrator::memorySize() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_memory.size();
}

std::string GenerationOrchestrator::modelFor(const std::string& contextType) const {
    auto it = m_options.models.find(contextType);
    return it != m_options.models.end() ? it->second : m_options.defaultModel;
}

std::string GenerationOrchestrator::ComputeCacheKey(const std::string& prompt) {
    std::uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : prompt) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    std::ostringstream ss;
    ss << std::hex << std::setw(16) << std::setfill('0') << hash;
    return ss.str();
}

int GenerationOrchestrator::CalculateMaxTokens(const std::string& prompt) {
    std::size_t doubled = prompt.size() * 2;
    return static_cast<int>(std::min<std::size_t>(kMaxTokensCap, doubled));
}

bool GenerationOrchestrator::Validate(const std::string& response,
                                      const std::vector<std::string>& requiredElements,
                                      std::vector<std::string>* missing) {
    if (response.empty()) {
        if (missing) *missing = requiredElements;
        return false;
    }

    bool valid = true;
    for (const auto& element : requiredElements) {
        if (response.find(element) == std::string::npos) {
            valid = false;
            if (missing) missing->push_back(element);
        }
    }
    return valid;
}

} // namespace dreadloom::application
